#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace textshield::unicode {

enum class NormalizationForm { NFC, NFD, NFKC, NFKD };

/**
 * @brief Parse "NFC" / "NFD" / "NFKC" / "NFKD" (case-insensitive)
 */
[[nodiscard]] std::optional<NormalizationForm> parse_form(std::string_view name);

[[nodiscard]] const char* form_to_string(NormalizationForm form);

/**
 * @brief Normalize UTF-8 text with ICU
 *
 * Ill-formed UTF-8 sequences become U+FFFD before normalization.
 * @throws SanitizationError if ICU reports a failure
 */
[[nodiscard]] std::string normalize(std::string_view text, NormalizationForm form);

[[nodiscard]] bool is_valid_utf8(std::string_view text);

/**
 * @brief Number of code points (each ill-formed byte counts as one)
 */
[[nodiscard]] size_t length(std::string_view text);

/**
 * @brief Prefix holding at most max_code_points code points
 */
[[nodiscard]] std::string truncate(std::string_view text, size_t max_code_points);

/**
 * @brief Longest prefix of at most max_bytes that does not split a sequence
 */
[[nodiscard]] std::string truncate_bytes(std::string_view text, size_t max_bytes);

/**
 * @brief Decode the code point at offset, advancing offset past it
 * @return The code point, or a negative value for an ill-formed byte
 */
[[nodiscard]] int32_t next_code_point(std::string_view text, size_t& offset);

void append_code_point(std::string& out, int32_t cp);

// ICU character classes
[[nodiscard]] bool is_word_char(int32_t cp);     // letters, digits, underscore
[[nodiscard]] bool is_space(int32_t cp);

} // namespace textshield::unicode
