#pragma once

#include <cstdint>
#include <string_view>

namespace textshield {

/**
 * @brief Dotted-quad IPv4 parsing and CIDR range checks
 */
class Ipv4 {
public:
    struct CidrRange {
        uint32_t network = 0;
        uint32_t mask = 0;
    };

    static bool parse_ip(std::string_view ip, uint32_t& out);
    static bool parse_cidr(std::string_view cidr, CidrRange& out);
    static bool ip_matches_cidr(uint32_t ip, const CidrRange& range);

    /**
     * @brief Address scope from the well-known IANA ranges
     * @return "unspecified", "loopback", "private", "link_local", "multicast" or "public"
     */
    [[nodiscard]] static const char* scope(uint32_t ip);
};

} // namespace textshield
