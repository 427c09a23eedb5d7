#include "policy/policy_enforcer.hpp"
#include "encoding/encoders.hpp"
#include "core/unicode.hpp"

#include <format>

namespace textshield {

PolicyEnforcer::PolicyEnforcer(std::shared_ptr<const PatternLibrary> patterns)
    : guard_(std::move(patterns)) {}

PolicyResult PolicyEnforcer::enforce(const std::string& content, const Policy& policy) const {
    PolicyResult result;
    result.original_length = unicode::length(content);

    std::string current = content;

    // 1. Maximum length
    if (policy.max_length && result.original_length > *policy.max_length) {
        result.violations.push_back(
            std::format("Content exceeds maximum length of {}", *policy.max_length));
        current = unicode::truncate(current, *policy.max_length);
    }

    // 2. Forbidden patterns
    for (const auto& pattern : policy.forbidden_patterns) {
        if (!contains_match(current, *pattern.regex)) continue;
        result.violations.push_back(
            std::format("Content contains forbidden pattern: {}", pattern.source));
        current = remove_matches(current, *pattern.regex);
    }

    // 3. Required patterns
    for (const auto& pattern : policy.required_patterns) {
        if (!contains_match(current, *pattern.regex)) {
            result.violations.push_back(
                std::format("Content missing required pattern: {}", pattern.source));
        }
    }

    // 4. Automatic sanitization
    if (policy.auto_sanitize) {
        current = encoding::clean_whitespace(guard_.prevent_xss(current).output);
    }

    result.compliant = result.violations.empty();
    result.final_length = unicode::length(current);
    result.sanitized_content = std::move(current);
    return result;
}

} // namespace textshield
