#pragma once

#include "core/error.hpp"
#include "core/json.hpp"
#include "policy/policy_types.hpp"

#include <toml.hpp>

#include <string>
#include <vector>

namespace textshield {

/**
 * @brief Builds policies from TOML [[policies]] tables or inline JSON
 *
 * Validates:
 * - name present and unique (TOML only)
 * - max_length is a non-negative integer
 * - pattern lists hold strings that compile as RE2 patterns
 * - auto_sanitize is a boolean
 */
class PolicyLoader {
public:
    /**
     * @brief Load result
     */
    struct LoadResult {
        bool success;
        std::string error_message;
        std::vector<Policy> policies;

        static LoadResult ok(std::vector<Policy> policies_vec) {
            LoadResult result;
            result.success = true;
            result.policies = std::move(policies_vec);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Extract the [[policies]] array of an already parsed document
     *
     * A document without [[policies]] yields an empty list.
     */
    static LoadResult load_from_table(const toml::table& root);

    /**
     * @brief Build an inline policy from a request's "policy" object
     * @return REQUEST_ERROR result describing the first malformed field
     */
    [[nodiscard]] static Result<Policy> from_json(const JsonValue& value);

private:
    static bool compile_pattern(const std::string& source, std::vector<PolicyPattern>& out,
                                std::string& error_msg);
};

} // namespace textshield
