#include "core/unicode.hpp"
#include "core/error.hpp"

#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>

#include <algorithm>
#include <cctype>
#include <climits>
#include <format>

namespace textshield::unicode {

std::optional<NormalizationForm> parse_form(std::string_view name) {
    const std::string upper = [&] {
        std::string s(name);
        for (char& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        return s;
    }();
    if (upper == "NFC") return NormalizationForm::NFC;
    if (upper == "NFD") return NormalizationForm::NFD;
    if (upper == "NFKC") return NormalizationForm::NFKC;
    if (upper == "NFKD") return NormalizationForm::NFKD;
    return std::nullopt;
}

const char* form_to_string(NormalizationForm form) {
    switch (form) {
        case NormalizationForm::NFC: return "NFC";
        case NormalizationForm::NFD: return "NFD";
        case NormalizationForm::NFKC: return "NFKC";
        case NormalizationForm::NFKD: return "NFKD";
    }
    return "NFC";
}

std::string normalize(std::string_view text, NormalizationForm form) {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* normalizer = nullptr;
    switch (form) {
        case NormalizationForm::NFC:  normalizer = icu::Normalizer2::getNFCInstance(status); break;
        case NormalizationForm::NFD:  normalizer = icu::Normalizer2::getNFDInstance(status); break;
        case NormalizationForm::NFKC: normalizer = icu::Normalizer2::getNFKCInstance(status); break;
        case NormalizationForm::NFKD: normalizer = icu::Normalizer2::getNFKDInstance(status); break;
    }
    if (U_FAILURE(status) || normalizer == nullptr) {
        throw SanitizationError(std::format("ICU normalizer unavailable: {}", u_errorName(status)));
    }

    const auto source = icu::UnicodeString::fromUTF8(
        icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));
    const icu::UnicodeString normalized = normalizer->normalize(source, status);
    if (U_FAILURE(status)) {
        throw SanitizationError(std::format("Unicode normalization failed: {}", u_errorName(status)));
    }

    std::string out;
    normalized.toUTF8String(out);
    return out;
}

int32_t next_code_point(std::string_view text, size_t& offset) {
    const auto* bytes = reinterpret_cast<const uint8_t*>(text.data() + offset);
    const auto remaining = static_cast<int32_t>(
        std::min<size_t>(text.size() - offset, static_cast<size_t>(INT32_MAX)));
    int32_t i = 0;
    UChar32 cp = 0;
    U8_NEXT(bytes, i, remaining, cp);
    offset += static_cast<size_t>(i);
    return cp;
}

void append_code_point(std::string& out, int32_t cp) {
    uint8_t buf[U8_MAX_LENGTH];
    int32_t len = 0;
    UBool error = false;
    U8_APPEND(buf, len, U8_MAX_LENGTH, cp, error);
    if (error) return;
    out.append(reinterpret_cast<const char*>(buf), static_cast<size_t>(len));
}

bool is_valid_utf8(std::string_view text) {
    size_t offset = 0;
    while (offset < text.size()) {
        if (next_code_point(text, offset) < 0) return false;
    }
    return true;
}

size_t length(std::string_view text) {
    size_t count = 0;
    size_t offset = 0;
    while (offset < text.size()) {
        (void)next_code_point(text, offset);
        ++count;
    }
    return count;
}

std::string truncate(std::string_view text, size_t max_code_points) {
    size_t offset = 0;
    size_t count = 0;
    while (offset < text.size() && count < max_code_points) {
        (void)next_code_point(text, offset);
        ++count;
    }
    return std::string(text.substr(0, offset));
}

std::string truncate_bytes(std::string_view text, size_t max_bytes) {
    if (text.size() <= max_bytes) return std::string(text);
    size_t offset = 0;
    size_t keep = 0;
    while (offset < text.size()) {
        (void)next_code_point(text, offset);
        if (offset > max_bytes) break;
        keep = offset;
    }
    return std::string(text.substr(0, keep));
}

bool is_word_char(int32_t cp) {
    return cp == '_' || u_isalnum(cp);
}

bool is_space(int32_t cp) {
    return u_isUWhiteSpace(cp);
}

} // namespace textshield::unicode
