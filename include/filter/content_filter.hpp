#pragma once

#include "core/types.hpp"
#include "patterns/pattern_library.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace textshield {

/**
 * @brief Profanity, sensitive-data, comment and character filters
 */
class ContentFilter {
public:
    static constexpr std::string_view kSsnPlaceholder = "XXX-XX-XXXX";
    static constexpr std::string_view kCardPlaceholder = "XXXX-XXXX-XXXX-XXXX";
    static constexpr std::string_view kPhonePlaceholder = "XXX-XXX-XXXX";

    explicit ContentFilter(std::shared_ptr<const PatternLibrary> patterns);

    // Whole-word, case-insensitive; metadata["replacements"] is the match count
    [[nodiscard]] TransformResult filter_profanity(const std::string& text,
                                                   const std::string& replacement) const;

    // SSN, then card, then phone, each to a fixed placeholder
    [[nodiscard]] TransformResult filter_sensitive_data(const std::string& text) const;

    // Strips <!-- ... --> comments
    [[nodiscard]] TransformResult remove_metadata(const std::string& text) const;

    // Code-point filters; surviving characters keep their order
    [[nodiscard]] TransformResult whitelist_chars(const std::string& text,
                                                  const std::string& allowed_chars) const;
    [[nodiscard]] TransformResult blacklist_chars(const std::string& text,
                                                  const std::string& forbidden_chars) const;

private:
    std::shared_ptr<const PatternLibrary> patterns_;
};

} // namespace textshield
