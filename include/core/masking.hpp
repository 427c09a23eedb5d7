#pragma once

#include <re2/re2.h>

#include <string>
#include <string_view>

namespace textshield {

/**
 * @brief Data masking engine - partially obscures sensitive values
 *
 * Strategies keep the overall shape (length, separators) and a fixed number
 * of visible characters:
 * - EMAIL:  first and last character of the local part, domain intact
 * - PHONE:  first 3 and last 3 digits
 * - CARD:   first 4 and last 4 digits
 * - SSN:    every ddd-dd-dddd becomes ***-**-****
 * - CUSTOM: caller-supplied regex → replacement
 *
 * Below each strategy's minimum length the value is returned unchanged.
 * `mask` is emitted once per hidden character and may be multi-byte.
 */
class MaskingEngine {
public:
    static constexpr size_t kMinEmailLocalPart = 3;
    static constexpr size_t kMinPhoneDigits = 7;
    static constexpr size_t kMinCardDigits = 8;

    [[nodiscard]] static std::string mask_email(std::string_view email, std::string_view mask);

    [[nodiscard]] static std::string mask_phone(std::string_view phone, std::string_view mask);

    [[nodiscard]] static std::string mask_credit_card(std::string_view card, std::string_view mask);

    [[nodiscard]] static std::string mask_ssn(const std::string& text, std::string_view mask,
                                              const RE2& ssn_pattern);

    /**
     * @brief Regex replace over every match
     *
     * In the replacement $1..$99 insert capture groups, $& the whole match
     * and $$ a literal '$'. Any other text is copied as-is.
     * @throws SanitizationError if the pattern does not compile
     */
    [[nodiscard]] static std::string mask_custom(const std::string& content,
                                                 const std::string& pattern,
                                                 const std::string& replacement);

private:
    /**
     * @brief Mask every ASCII digit except the first keep_first and last
     *        keep_last; other characters pass through
     */
    static std::string mask_digits(std::string_view value, size_t keep_first,
                                   size_t keep_last, std::string_view mask);
};

} // namespace textshield
