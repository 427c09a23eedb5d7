#pragma once

#include <cstddef>
#include "patterns/pattern_library.hpp"

#include <optional>
#include <string>
#include <vector>

namespace textshield {

// ============================================================================
// Policy Types
// ============================================================================

/**
 * @brief A policy pattern with its source text kept for violation messages
 */
struct PolicyPattern {
    std::string source;
    Regex regex;
};

/**
 * @brief Declarative content policy
 *
 * Built from an inline JSON object or a [[policies]] TOML entry; every
 * pattern is compiled when the policy is built, so enforcement cannot fail.
 */
struct Policy {
    std::string name;                               // Empty for inline policies
    std::optional<size_t> max_length;               // In code points
    std::vector<PolicyPattern> forbidden_patterns;  // Removed, one violation each
    std::vector<PolicyPattern> required_patterns;   // Violation when absent
    bool auto_sanitize = false;                     // prevent_xss + clean_whitespace
};

} // namespace textshield
