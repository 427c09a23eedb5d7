#pragma once

#include "core/types.hpp"
#include "policy/policy_types.hpp"
#include "security/injection_guard.hpp"

#include <memory>
#include <string>

namespace textshield {

/**
 * @brief Applies a Policy and reports violations
 *
 * Steps, in order:
 * 1. Truncate to max_length code points ("Content exceeds maximum length of N")
 * 2. Remove each forbidden pattern that matches ("Content contains forbidden pattern: P")
 * 3. Check required patterns on the result ("Content missing required pattern: P")
 * 4. auto_sanitize: prevent_xss, then clean_whitespace
 *
 * Violations are data; enforce() never throws for non-compliant content.
 */
class PolicyEnforcer {
public:
    explicit PolicyEnforcer(std::shared_ptr<const PatternLibrary> patterns);

    [[nodiscard]] PolicyResult enforce(const std::string& content, const Policy& policy) const;

private:
    InjectionGuard guard_;
};

} // namespace textshield
