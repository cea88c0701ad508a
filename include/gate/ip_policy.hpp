/**
 * @file ip_policy.hpp
 * @brief Classification of resolved addresses for outbound fetches
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace MineSpec {

struct IpAddress {
    bool v6 = false;
    std::array<uint8_t, 16> bytes{}; // v4 uses the first four

    static std::optional<IpAddress> parse(std::string_view text);
    static IpAddress v4(uint8_t a, uint8_t b, uint8_t c, uint8_t d);

    /**
     * @brief Embedded IPv4 address of mapped, compatible, NAT64 and 6to4 forms
     */
    std::optional<IpAddress> embedded_v4() const;

    std::string to_string() const;

    bool operator==(const IpAddress& o) const { return v6 == o.v6 && bytes == o.bytes; }
};

enum class AddressClass {
    Public,
    Private,      // loopback, RFC1918, link-local, CGNAT, reserved, multicast
    CloudMetadata // instance metadata and platform endpoints
};

/**
 * @brief Metadata endpoints are checked before private ranges so that
 * 169.254.169.254 reports CloudMetadata rather than link-local.
 */
AddressClass classify_address(const IpAddress& address);

} // namespace MineSpec
