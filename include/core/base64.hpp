#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace textshield::base64 {

inline std::string encode(const uint8_t* data, size_t len) {
    static const char kChars[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string result;
    result.reserve(4 * ((len + 2) / 3));

    for (size_t i = 0; i < len; i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < len) n |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < len) n |= static_cast<uint32_t>(data[i + 2]);

        result += kChars[(n >> 18) & 0x3F];
        result += kChars[(n >> 12) & 0x3F];
        result += (i + 1 < len) ? kChars[(n >> 6) & 0x3F] : '=';
        result += (i + 2 < len) ? kChars[n & 0x3F] : '=';
    }
    return result;
}

inline std::string encode(std::string_view text) {
    return encode(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

/**
 * @brief Strict decode of padded standard-alphabet Base64
 *
 * CR/LF are skipped. Any other character outside the alphabet, a length that
 * is not a multiple of 4, misplaced padding or non-zero trailing bits yield
 * std::nullopt.
 */
inline std::optional<std::vector<uint8_t>> decode(std::string_view encoded) {
    static const uint8_t kTable[128] = {
        64,64,64,64,64,64,64,64,64,64,64,64,64,64,64,64,
        64,64,64,64,64,64,64,64,64,64,64,64,64,64,64,64,
        64,64,64,64,64,64,64,64,64,64,64,62,64,64,64,63,
        52,53,54,55,56,57,58,59,60,61,64,64,64,64,64,64,
        64, 0, 1, 2, 3, 4, 5, 6, 7, 8, 9,10,11,12,13,14,
        15,16,17,18,19,20,21,22,23,24,25,64,64,64,64,64,
        64,26,27,28,29,30,31,32,33,34,35,36,37,38,39,40,
        41,42,43,44,45,46,47,48,49,50,51,64,64,64,64,64
    };

    std::string compact;
    compact.reserve(encoded.size());
    for (const char c : encoded) {
        if (c == '\n' || c == '\r') continue;
        compact += c;
    }
    if (compact.size() % 4 != 0) return std::nullopt;

    size_t padding = 0;
    if (!compact.empty() && compact.back() == '=') ++padding;
    if (compact.size() > 1 && compact[compact.size() - 2] == '=') ++padding;

    std::vector<uint8_t> result;
    result.reserve(3 * compact.size() / 4);

    uint32_t buf = 0;
    int bits = 0;
    const size_t data_len = compact.size() - padding;
    for (size_t i = 0; i < data_len; ++i) {
        const auto uc = static_cast<unsigned char>(compact[i]);
        if (uc >= 128) return std::nullopt;
        const uint8_t val = kTable[uc];
        if (val == 64) return std::nullopt;

        buf = (buf << 6) | val;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result.push_back(static_cast<uint8_t>((buf >> bits) & 0xFF));
        }
    }
    // Leftover bits must be zero padding, never data
    if (bits > 0 && (buf & ((1u << bits) - 1)) != 0) return std::nullopt;
    return result;
}

} // namespace textshield::base64
