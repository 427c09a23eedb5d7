#pragma once

#include "core/unicode.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace textshield::encoding {

/**
 * @brief Percent-encode every byte outside the RFC 3986 unreserved set
 *        (A-Z a-z 0-9 - . _ ~), using uppercase hex
 */
[[nodiscard]] std::string url_encode(std::string_view text);

/**
 * @brief Decode %XX escapes; malformed escapes are kept verbatim and '+'
 *        is not treated as a space
 */
[[nodiscard]] std::string url_decode(std::string_view text);

[[nodiscard]] std::string base64_encode(std::string_view text);

/**
 * @brief Strict standard-alphabet decode
 * @return nullopt when the input is malformed or decodes to ill-formed UTF-8
 */
[[nodiscard]] std::optional<std::string> try_base64_decode(std::string_view text);

// Returns the input unchanged when try_base64_decode fails
[[nodiscard]] std::string base64_decode(std::string_view text);

[[nodiscard]] std::string normalize_unicode(std::string_view text, unicode::NormalizationForm form);

// Collapse every whitespace run to one ' ' and trim both ends. Idempotent.
[[nodiscard]] std::string clean_whitespace(std::string_view text);

// Keep word characters, whitespace and . , ! ? - ( ) [ ] { }
[[nodiscard]] std::string extract_safe_text(std::string_view text);

} // namespace textshield::encoding
