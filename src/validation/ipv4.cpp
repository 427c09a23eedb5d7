#include "validation/ipv4.hpp"

#include <array>
#include <utility>

namespace textshield {

bool Ipv4::parse_ip(std::string_view ip, uint32_t& out) {
    uint32_t octets[4]{};
    size_t octet_idx = 0;
    uint32_t val = 0;
    size_t digits = 0;

    for (size_t i = 0; i <= ip.size(); ++i) {
        if (i == ip.size() || ip[i] == '.') {
            if (digits == 0 || val > 255 || octet_idx > 3) return false;
            octets[octet_idx++] = val;
            val = 0;
            digits = 0;
        } else if (ip[i] >= '0' && ip[i] <= '9') {
            // More than three digits can only overflow an octet
            if (++digits > 3) return false;
            val = val * 10 + static_cast<uint32_t>(ip[i] - '0');
        } else {
            return false;
        }
    }
    if (octet_idx != 4) return false;
    out = (octets[0] << 24) | (octets[1] << 16) | (octets[2] << 8) | octets[3];
    return true;
}

bool Ipv4::parse_cidr(std::string_view cidr, CidrRange& out) {
    const auto slash = cidr.find('/');
    if (slash == std::string_view::npos) {
        // No prefix → /32 (exact match)
        if (!parse_ip(cidr, out.network)) return false;
        out.mask = 0xFFFFFFFFu;
        return true;
    }

    if (!parse_ip(cidr.substr(0, slash), out.network)) return false;

    // Parse prefix length
    if (slash + 1 == cidr.size() || cidr.size() - slash > 3) return false;
    uint32_t prefix = 0;
    for (size_t i = slash + 1; i < cidr.size(); ++i) {
        if (cidr[i] < '0' || cidr[i] > '9') return false;
        prefix = prefix * 10 + static_cast<uint32_t>(cidr[i] - '0');
    }
    if (prefix > 32) return false;
    out.mask = (prefix == 0) ? 0u : ~((1u << (32 - prefix)) - 1);
    out.network &= out.mask;  // normalize
    return true;
}

bool Ipv4::ip_matches_cidr(uint32_t ip, const CidrRange& range) {
    return (ip & range.mask) == range.network;
}

const char* Ipv4::scope(uint32_t ip) {
    // First match wins
    static constexpr std::array<std::pair<CidrRange, const char*>, 7> kRanges = {{
        {{0x00000000u, 0xFFFFFFFFu}, "unspecified"},  // 0.0.0.0/32
        {{0x7F000000u, 0xFF000000u}, "loopback"},     // 127.0.0.0/8
        {{0x0A000000u, 0xFF000000u}, "private"},      // 10.0.0.0/8
        {{0xAC100000u, 0xFFF00000u}, "private"},      // 172.16.0.0/12
        {{0xC0A80000u, 0xFFFF0000u}, "private"},      // 192.168.0.0/16
        {{0xA9FE0000u, 0xFFFF0000u}, "link_local"},   // 169.254.0.0/16
        {{0xE0000000u, 0xF0000000u}, "multicast"},    // 224.0.0.0/4
    }};

    for (const auto& [range, name] : kRanges) {
        if (ip_matches_cidr(ip, range)) return name;
    }
    return "public";
}

} // namespace textshield
