#pragma once

#include "config/config_types.hpp"
#include "core/json.hpp"
#include "core/types.hpp"
#include "engine/operation_registry.hpp"
#include "filter/content_filter.hpp"
#include "patterns/pattern_library.hpp"
#include "security/injection_guard.hpp"
#include "transform/html_sanitizer.hpp"
#include "validation/validators.hpp"

#include <memory>
#include <optional>
#include <string>

namespace textshield {

/**
 * @brief Stateless facade over every single-item operation
 *
 * Owns one instance of each component, all sharing the same immutable
 * PatternLibrary. run() is const and safe to call concurrently.
 */
class SanitizationProcessor {
public:
    struct Settings {
        std::vector<std::string> default_allowed_tags = {
            std::begin(HtmlSanitizer::kDefaultAllowedTags), std::end(HtmlSanitizer::kDefaultAllowedTags)};
        std::string profanity_replacement = "***";
        std::string mask_char = "*";
        PathTraversalMode path_traversal_mode = PathTraversalMode::REJECT;

        [[nodiscard]] static Settings from_config(const EngineConfig& config);
    };

    SanitizationProcessor(std::shared_ptr<const PatternLibrary> patterns, Settings settings);

    /**
     * @brief Run one single-item operation
     * @param content The operation's text input
     * @param params Request parameters, already type-checked against the
     *        operation's descriptor
     * @throws SanitizationError on handler failure,
     *         including for batch_sanitize and policy_enforce
     */
    [[nodiscard]] ItemPayload run(Operation op, const std::string& content,
                                  const JsonValue& params) const;

    /**
     * @brief Value checks that go beyond parameter types (unknown
     *        normalization form or traversal mode, empty mask_char)
     * @return Error message, or nullopt when the values are acceptable
     */
    [[nodiscard]] static std::optional<std::string> check_parameter_values(
        Operation op, const JsonValue& params);

    [[nodiscard]] const PatternLibrary& patterns() const { return *patterns_; }

private:
    [[nodiscard]] std::string mask_char(const JsonValue& params) const;

    std::shared_ptr<const PatternLibrary> patterns_;
    Settings settings_;

    Validators validators_;
    HtmlSanitizer html_;
    InjectionGuard guard_;
    ContentFilter filter_;
};

} // namespace textshield
