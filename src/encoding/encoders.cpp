#include "encoding/encoders.hpp"
#include "core/base64.hpp"

namespace textshield::encoding {

namespace {

int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + c - 'a';
    if (c >= 'A' && c <= 'F') return 10 + c - 'A';
    return -1;
}

bool is_unreserved(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '.' || c == '_' || c == '~';
}

constexpr std::string_view kSafePunctuation = ".,!?-()[]{}";

} // anonymous namespace

std::string url_encode(std::string_view text) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size() * 3);
    for (const char ch : text) {
        const auto c = static_cast<unsigned char>(ch);
        if (is_unreserved(c)) {
            out += ch;
        } else {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0F];
        }
    }
    return out;
}

std::string url_decode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            const int h = hex_val(text[i + 1]);
            const int l = hex_val(text[i + 2]);
            if (h >= 0 && l >= 0) {
                out += static_cast<char>((h << 4) | l);
                i += 2;
                continue;
            }
        }
        out += text[i];
    }
    return out;
}

std::string base64_encode(std::string_view text) {
    return base64::encode(text);
}

std::optional<std::string> try_base64_decode(std::string_view text) {
    const auto bytes = base64::decode(text);
    if (!bytes) return std::nullopt;

    std::string decoded(bytes->begin(), bytes->end());
    if (!unicode::is_valid_utf8(decoded)) return std::nullopt;
    return decoded;
}

std::string base64_decode(std::string_view text) {
    auto decoded = try_base64_decode(text);
    return decoded ? std::move(*decoded) : std::string(text);
}

std::string normalize_unicode(std::string_view text, unicode::NormalizationForm form) {
    return unicode::normalize(text, form);
}

std::string clean_whitespace(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;

    size_t offset = 0;
    while (offset < text.size()) {
        const size_t start = offset;
        const int32_t cp = unicode::next_code_point(text, offset);
        if (cp >= 0 && unicode::is_space(cp)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }
        out.append(text.substr(start, offset - start));
    }
    return out;
}

std::string extract_safe_text(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    size_t offset = 0;
    while (offset < text.size()) {
        const size_t start = offset;
        const int32_t cp = unicode::next_code_point(text, offset);
        if (cp < 0) continue;
        const bool keep = unicode::is_word_char(cp) || unicode::is_space(cp) ||
            (cp < 0x80 && kSafePunctuation.find(static_cast<char>(cp)) != std::string_view::npos);
        if (keep) out.append(text.substr(start, offset - start));
    }
    return out;
}

} // namespace textshield::encoding
