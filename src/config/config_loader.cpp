#include "config/config_loader.hpp"
#include "policy/policy_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace textshield {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = ConfigLoader::expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = ConfigLoader::expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

// Positive integer setting; absent keeps the default
size_t positive_size(const toml::table& section, std::string_view section_name,
                     std::string_view key, size_t fallback, std::vector<std::string>& errors) {
    const auto node = section[key];
    if (!node) return fallback;
    const auto value = node.value<int64_t>();
    if (!node.is_integer() || !value || *value <= 0) {
        errors.push_back(std::format("{}.{} must be a positive integer", section_name, key));
        return fallback;
    }
    return static_cast<size_t>(*value);
}

const toml::table& section_or_empty(const toml::table& root, std::string_view name) {
    static const toml::table kEmpty;
    const auto* tbl = root[name].as_table();
    return tbl ? *tbl : kEmpty;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

std::string ConfigLoader::expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

// ---- Section extractors ----------------------------------------------------

LimitsConfig ConfigLoader::extract_limits(const toml::table& root, std::vector<std::string>& errors) {
    LimitsConfig cfg;
    const auto& limits = section_or_empty(root, "limits");
    cfg.max_input_bytes = positive_size(limits, "limits", "max_input_bytes", cfg.max_input_bytes, errors);
    cfg.max_batch_items = positive_size(limits, "limits", "max_batch_items", cfg.max_batch_items, errors);
    return cfg;
}

SecurityConfig ConfigLoader::extract_security(const toml::table& root, std::vector<std::string>& errors) {
    SecurityConfig cfg;
    const auto& security = section_or_empty(root, "security");
    if (const auto mode_str = security["path_traversal_mode"].value<std::string>()) {
        const auto mode = parse_path_traversal_mode(*mode_str);
        if (mode) {
            cfg.path_traversal_mode = *mode;
        } else {
            errors.push_back(std::format(
                "security.path_traversal_mode must be 'reject' or 'rewrite', got '{}'", *mode_str));
        }
    }
    return cfg;
}

BatchConfig ConfigLoader::extract_batch(const toml::table& root, std::vector<std::string>& errors) {
    BatchConfig cfg;
    const auto& batch = section_or_empty(root, "batch");
    cfg.parallel_threshold = positive_size(batch, "batch", "parallel_threshold", cfg.parallel_threshold, errors);
    cfg.max_workers = positive_size(batch, "batch", "max_workers", cfg.max_workers, errors);
    return cfg;
}

ContentConfig ConfigLoader::extract_content(const toml::table& root) {
    ContentConfig cfg;
    const auto& content = section_or_empty(root, "content");
    if (content["profanity_words"].as_array()) {
        cfg.profanity_words = toml_string_array(content, "profanity_words");
    }
    if (content["default_allowed_tags"].as_array()) {
        cfg.default_allowed_tags = toml_string_array(content, "default_allowed_tags");
    }
    cfg.profanity_replacement = content["profanity_replacement"].value_or(cfg.profanity_replacement);
    cfg.mask_char = content["mask_char"].value_or(cfg.mask_char);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root, std::vector<std::string>& errors) {
    LoggingConfig cfg;
    const auto& logging = section_or_empty(root, "logging");
    if (const auto level_str = logging["level"].value<std::string>()) {
        const auto level = utils::log::parse_level(*level_str);
        if (level) {
            cfg.level = *level;
        } else {
            errors.push_back(std::format("logging.level: unknown level '{}'", *level_str));
        }
    }
    return cfg;
}

EngineConfig ConfigLoader::extract_all_sections(const toml::table& root, std::vector<std::string>& errors) {
    EngineConfig config;
    config.limits = extract_limits(root, errors);
    config.security = extract_security(root, errors);
    config.batch = extract_batch(root, errors);
    config.content = extract_content(root);
    config.logging = extract_logging(root, errors);

    auto policies = PolicyLoader::load_from_table(root);
    if (policies.success) {
        config.policies = std::move(policies.policies);
    } else {
        errors.push_back(std::move(policies.error_message));
    }
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(EngineConfig config,
                                                           std::vector<std::string> errors) {
    for (auto& err : validate_config(config)) {
        errors.push_back(std::move(err));
    }
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        utils::log::warn(std::format("Config file {} not found, using defaults", config_path));
        return LoadResult::ok(EngineConfig{});
    }

    try {
        const auto tbl = parse_toml_file(config_path);
        std::vector<std::string> errors;
        auto config = extract_all_sections(tbl, errors);
        return validate_and_return(std::move(config), std::move(errors));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        std::vector<std::string> errors;
        auto config = extract_all_sections(tbl, errors);
        return validate_and_return(std::move(config), std::move(errors));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const EngineConfig& config) {
    std::vector<std::string> errors;

    if (config.limits.max_input_bytes == 0) {
        errors.push_back("limits.max_input_bytes must be positive");
    }
    if (config.limits.max_batch_items == 0) {
        errors.push_back("limits.max_batch_items must be positive");
    }
    if (config.batch.max_workers == 0) {
        errors.push_back("batch.max_workers must be positive");
    }
    if (config.content.mask_char.empty()) {
        errors.push_back("content.mask_char must not be empty");
    }
    for (const auto& word : config.content.profanity_words) {
        if (word.empty()) {
            errors.push_back("content.profanity_words must not contain empty words");
            break;
        }
    }

    return errors;
}

} // namespace textshield
