#pragma once

#include "config/config_types.hpp"

#include <toml.hpp>

#include <string>
#include <vector>

namespace textshield {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads textshield.toml
 *
 * String values may reference environment variables as ${VAR}; unset
 * variables expand to an empty string. Unknown keys are ignored.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        EngineConfig config;

        static LoadResult ok(EngineConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
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
     * @brief Load complete config from TOML file
     * @param config_path Path to textshield.toml
     * @return LoadResult with parsed config or error. A missing file yields
     *         the defaults and a warning.
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Expand ${VAR_NAME} references with environment values
     * @throws std::runtime_error on an unclosed "${"
     */
    [[nodiscard]] static std::string expand_env_vars(const std::string& input);

    /**
     * @brief Check cross-field constraints
     * @return One message per problem; empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const EngineConfig& config);

private:
    static EngineConfig extract_all_sections(const toml::table& root, std::vector<std::string>& errors);
    static LimitsConfig extract_limits(const toml::table& root, std::vector<std::string>& errors);
    static SecurityConfig extract_security(const toml::table& root, std::vector<std::string>& errors);
    static BatchConfig extract_batch(const toml::table& root, std::vector<std::string>& errors);
    static ContentConfig extract_content(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root, std::vector<std::string>& errors);

    static LoadResult validate_and_return(EngineConfig config, std::vector<std::string> errors);
};

} // namespace textshield
