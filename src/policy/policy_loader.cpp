#include "policy/policy_loader.hpp"

#include <format>
#include <unordered_set>

using namespace std::string_literals;

namespace textshield {

// Config keys shared by the TOML and JSON readers
static constexpr std::string_view kPolicies          = "policies";
static constexpr std::string_view kName              = "name";
static constexpr std::string_view kMaxLength         = "max_length";
static constexpr std::string_view kForbiddenPatterns = "forbidden_patterns";
static constexpr std::string_view kRequiredPatterns  = "required_patterns";
static constexpr std::string_view kAutoSanitize      = "auto_sanitize";

// Largest integer a JSON number (double) holds exactly
static constexpr double kMaxSafeInteger = 9007199254740991.0;

// ============================================================================
// Public API - TOML
// ============================================================================

PolicyLoader::LoadResult PolicyLoader::load_from_table(const toml::table& root) {
    std::vector<Policy> policies;
    std::unordered_set<std::string> names;

    const auto policies_node = root[kPolicies];
    if (!policies_node) {
        return LoadResult::ok(std::move(policies));
    }
    const auto* policies_array = policies_node.as_array();
    if (!policies_array) {
        return LoadResult::error("'policies' must be an array of tables ([[policies]])");
    }

    for (const auto& elem : *policies_array) {
        const auto* node = elem.as_table();
        if (!node) {
            return LoadResult::error("'policies' must be an array of tables ([[policies]])");
        }
        const auto& tbl = *node;

        Policy policy;

        // Required: unique name
        policy.name = tbl[kName].value_or(""s);
        if (policy.name.empty()) {
            return LoadResult::error("Policy must have a name");
        }
        if (!names.insert(policy.name).second) {
            return LoadResult::error(std::format("Duplicate policy name '{}'", policy.name));
        }

        // Optional: max_length
        if (const auto max_node = tbl[kMaxLength]) {
            const auto max_length = max_node.value<int64_t>();
            if (!max_node.is_integer() || !max_length || *max_length < 0) {
                return LoadResult::error(std::format(
                    "Policy '{}': max_length must be a non-negative integer", policy.name));
            }
            policy.max_length = static_cast<size_t>(*max_length);
        }

        // Optional: pattern arrays
        for (const auto key : {kForbiddenPatterns, kRequiredPatterns}) {
            const auto patterns_node = tbl[key];
            if (!patterns_node) continue;
            const auto* arr = patterns_node.as_array();
            if (!arr) {
                return LoadResult::error(std::format(
                    "Policy '{}': {} must be an array of strings", policy.name, key));
            }
            auto& target = (key == kForbiddenPatterns) ? policy.forbidden_patterns
                                                       : policy.required_patterns;
            for (const auto& item : *arr) {
                const auto* s = item.as_string();
                if (!s) {
                    return LoadResult::error(std::format(
                        "Policy '{}': {} must be an array of strings", policy.name, key));
                }
                std::string error_msg;
                if (!compile_pattern(std::string(s->get()), target, error_msg)) {
                    return LoadResult::error(std::format("Policy '{}': {}", policy.name, error_msg));
                }
            }
        }

        // Optional: auto_sanitize
        if (const auto flag = tbl[kAutoSanitize]) {
            if (!flag.is_boolean()) {
                return LoadResult::error(std::format(
                    "Policy '{}': auto_sanitize must be a boolean", policy.name));
            }
            policy.auto_sanitize = flag.value_or(false);
        }

        policies.emplace_back(std::move(policy));
    }

    return LoadResult::ok(std::move(policies));
}

// ============================================================================
// Public API - Inline JSON policy
// ============================================================================

Result<Policy> PolicyLoader::from_json(const JsonValue& value) {
    if (!value.is_object()) {
        return Result<Policy>::error(ErrorCategory::REQUEST_ERROR,
            std::format("policy must be an object, got {}", value.kind_name()));
    }

    Policy policy;

    if (value.contains(kMaxLength)) {
        const JsonValue max_length = value[kMaxLength];
        if (!max_length.is_number_integer() || max_length.get<double>() < 0 ||
            max_length.get<double>() > kMaxSafeInteger) {
            return Result<Policy>::error(ErrorCategory::REQUEST_ERROR,
                "policy.max_length must be a non-negative integer");
        }
        policy.max_length = max_length.get<size_t>();
    }

    for (const auto key : {kForbiddenPatterns, kRequiredPatterns}) {
        if (!value.contains(key)) continue;
        const JsonValue list = value[key];
        if (!list.is_array()) {
            return Result<Policy>::error(ErrorCategory::REQUEST_ERROR,
                std::format("policy.{} must be an array of strings", key));
        }
        auto& target = (key == kForbiddenPatterns) ? policy.forbidden_patterns
                                                   : policy.required_patterns;
        for (const auto& item : list.elements()) {
            if (!item.is_string()) {
                return Result<Policy>::error(ErrorCategory::REQUEST_ERROR,
                    std::format("policy.{} must be an array of strings", key));
            }
            std::string error_msg;
            if (!compile_pattern(item.get<std::string>(), target, error_msg)) {
                return Result<Policy>::error(ErrorCategory::REQUEST_ERROR,
                    std::format("policy.{}: {}", key, error_msg));
            }
        }
    }

    if (value.contains(kAutoSanitize)) {
        const JsonValue flag = value[kAutoSanitize];
        if (!flag.is_boolean()) {
            return Result<Policy>::error(ErrorCategory::REQUEST_ERROR,
                "policy.auto_sanitize must be a boolean");
        }
        policy.auto_sanitize = flag.get<bool>();
    }

    return Result<Policy>::ok(std::move(policy));
}

// ============================================================================
// Private Helpers
// ============================================================================

bool PolicyLoader::compile_pattern(const std::string& source, std::vector<PolicyPattern>& out,
                                   std::string& error_msg) {
    Regex re = compile_regex(source);
    if (!re->ok()) {
        error_msg = std::format("Invalid pattern '{}': {}", source, re->error());
        return false;
    }
    out.push_back({source, std::move(re)});
    return true;
}

} // namespace textshield
