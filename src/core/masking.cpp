#include "core/masking.hpp"
#include "core/error.hpp"
#include "core/unicode.hpp"
#include "patterns/pattern_library.hpp"

#include <format>
#include <vector>

namespace textshield {

namespace {

size_t count_digits(std::string_view value) {
    size_t n = 0;
    for (const char c : value) {
        if (c >= '0' && c <= '9') ++n;
    }
    return n;
}

// Expand $n, $nn, $& and $$ against one match
std::string expand_replacement(std::string_view replacement,
                               const std::vector<std::string_view>& groups) {
    std::string out;
    out.reserve(replacement.size());
    for (size_t i = 0; i < replacement.size(); ++i) {
        const char c = replacement[i];
        if (c != '$' || i + 1 == replacement.size()) {
            out += c;
            continue;
        }

        const char next = replacement[i + 1];
        if (next == '$') {
            out += '$';
            ++i;
        } else if (next == '&') {
            out.append(groups[0]);
            ++i;
        } else if (next >= '0' && next <= '9') {
            size_t index = static_cast<size_t>(next - '0');
            size_t used = 1;
            if (i + 2 < replacement.size() && replacement[i + 2] >= '0' && replacement[i + 2] <= '9') {
                const size_t two = index * 10 + static_cast<size_t>(replacement[i + 2] - '0');
                if (two < groups.size()) {
                    index = two;
                    used = 2;
                }
            }
            if (index == 0 || index >= groups.size()) {
                out += c;
                continue;
            }
            out.append(groups[index]);
            i += used;
        } else {
            out += c;
        }
    }
    return out;
}

std::string repeat(std::string_view unit, size_t times) {
    std::string out;
    out.reserve(unit.size() * times);
    for (size_t i = 0; i < times; ++i) out.append(unit);
    return out;
}

} // anonymous namespace

std::string MaskingEngine::mask_digits(std::string_view value, size_t keep_first,
                                       size_t keep_last, std::string_view mask) {
    const size_t total = count_digits(value);

    std::string result;
    result.reserve(value.size() + total * mask.size());
    size_t seen = 0;
    for (const char c : value) {
        if (c < '0' || c > '9') {
            result += c;
            continue;
        }
        if (seen < keep_first || seen >= total - keep_last) {
            result += c;
        } else {
            result.append(mask);
        }
        ++seen;
    }
    return result;
}

std::string MaskingEngine::mask_email(std::string_view email, std::string_view mask) {
    const auto at = email.find('@');
    if (at == std::string_view::npos) return std::string(email);

    const std::string_view local = email.substr(0, at);
    const size_t local_len = unicode::length(local);
    if (local_len < kMinEmailLocalPart) return std::string(email);

    // Byte offsets of the first and last code points of the local part
    size_t first_end = 0;
    (void)unicode::next_code_point(local, first_end);
    size_t last_start = first_end;
    for (size_t offset = first_end, count = 1; offset < local.size(); ++count) {
        if (count == local_len - 1) last_start = offset;
        (void)unicode::next_code_point(local, offset);
    }

    std::string result;
    result.reserve(email.size() + local_len * mask.size());
    result.append(local.substr(0, first_end));
    result += repeat(mask, local_len - 2);
    result.append(local.substr(last_start));
    result.append(email.substr(at));
    return result;
}

std::string MaskingEngine::mask_phone(std::string_view phone, std::string_view mask) {
    if (count_digits(phone) < kMinPhoneDigits) return std::string(phone);
    return mask_digits(phone, 3, 3, mask);
}

std::string MaskingEngine::mask_credit_card(std::string_view card, std::string_view mask) {
    if (count_digits(card) < kMinCardDigits) return std::string(card);
    return mask_digits(card, 4, 4, mask);
}

std::string MaskingEngine::mask_ssn(const std::string& text, std::string_view mask,
                                    const RE2& ssn_pattern) {
    const std::string masked = std::format("{}-{}-{}",
        repeat(mask, 3), repeat(mask, 2), repeat(mask, 4));

    return replace_each(text, ssn_pattern, [&](const auto&) { return masked; });
}

std::string MaskingEngine::mask_custom(const std::string& content,
                                       const std::string& pattern,
                                       const std::string& replacement) {
    const Regex re = compile_regex(pattern);
    if (!re->ok()) {
        throw SanitizationError(std::format("Invalid mask pattern '{}': {}", pattern, re->error()));
    }
    return replace_each(content, *re, [&](const std::vector<std::string_view>& groups) {
        return expand_replacement(replacement, groups);
    });
}

} // namespace textshield
