/**
 * @file ip_policy.cpp
 * @brief Blocked network tables
 */

#include <gate/ip_policy.hpp>
#include <arpa/inet.h>
#include <cstring>

namespace MineSpec {

namespace {

struct Network {
    bool v6;
    std::array<uint8_t, 16> prefix;
    int bits;
};

Network v4net(uint8_t a, uint8_t b, uint8_t c, uint8_t d, int bits) {
    Network n{false, {}, bits};
    n.prefix[0] = a;
    n.prefix[1] = b;
    n.prefix[2] = c;
    n.prefix[3] = d;
    return n;
}

Network v6net(const char* text, int bits) {
    Network n{true, {}, bits};
    inet_pton(AF_INET6, text, n.prefix.data());
    return n;
}

bool contains(const Network& net, const IpAddress& addr) {
    if (net.v6 != addr.v6) return false;
    int full = net.bits / 8;
    int rem = net.bits % 8;
    if (std::memcmp(net.prefix.data(), addr.bytes.data(), full) != 0) return false;
    if (rem == 0) return true;
    uint8_t mask = static_cast<uint8_t>(0xFF << (8 - rem));
    return (net.prefix[full] & mask) == (addr.bytes[full] & mask);
}

const std::array<Network, 15>& private_v4() {
    static const std::array<Network, 15> nets = {
        v4net(0, 0, 0, 0, 8),        // "this" network
        v4net(10, 0, 0, 0, 8),
        v4net(100, 64, 0, 0, 10),    // carrier-grade NAT
        v4net(127, 0, 0, 0, 8),
        v4net(169, 254, 0, 0, 16),
        v4net(172, 16, 0, 0, 12),
        v4net(192, 0, 0, 0, 24),
        v4net(192, 0, 2, 0, 24),
        v4net(192, 88, 99, 0, 24),
        v4net(192, 168, 0, 0, 16),
        v4net(198, 18, 0, 0, 15),    // benchmarking
        v4net(198, 51, 100, 0, 24),
        v4net(203, 0, 113, 0, 24),
        v4net(224, 0, 0, 0, 4),      // multicast
        v4net(240, 0, 0, 0, 4),      // reserved, broadcast
    };
    return nets;
}

const std::array<Network, 8>& private_v6() {
    static const std::array<Network, 8> nets = {
        v6net("::", 128),
        v6net("::1", 128),
        v6net("100::", 64),          // discard
        v6net("2001:db8::", 32),     // documentation
        v6net("fc00::", 7),          // unique local
        v6net("fe80::", 10),         // link-local
        v6net("fec0::", 10),         // site-local
        v6net("ff00::", 8),          // multicast
    };
    return nets;
}

const std::array<IpAddress, 5>& metadata_v4() {
    static const std::array<IpAddress, 5> addrs = {
        IpAddress::v4(169, 254, 169, 254), // AWS, GCP, Azure IMDS
        IpAddress::v4(169, 254, 170, 2),   // AWS ECS task metadata
        IpAddress::v4(169, 254, 169, 253), // AWS VPC DNS
        IpAddress::v4(100, 100, 100, 200), // Alibaba Cloud
        IpAddress::v4(168, 63, 129, 16),   // Azure wire server
    };
    return addrs;
}

const IpAddress& metadata_v6() {
    static const IpAddress addr = *IpAddress::parse("fd00:ec2::254"); // AWS IMDS over IPv6
    return addr;
}

AddressClass classify_plain(const IpAddress& a) {
    if (!a.v6) {
        for (const auto& m : metadata_v4()) {
            if (m == a) return AddressClass::CloudMetadata;
        }
        for (const auto& n : private_v4()) {
            if (contains(n, a)) return AddressClass::Private;
        }
        return AddressClass::Public;
    }

    if (a == metadata_v6()) return AddressClass::CloudMetadata;
    for (const auto& n : private_v6()) {
        if (contains(n, a)) return AddressClass::Private;
    }
    return AddressClass::Public;
}

} // namespace

std::optional<IpAddress> IpAddress::parse(std::string_view text) {
    std::string s(text);
    if (s.size() > 2 && s.front() == '[' && s.back() == ']') s = s.substr(1, s.size() - 2);

    IpAddress out;
    if (inet_pton(AF_INET, s.c_str(), out.bytes.data()) == 1) {
        out.v6 = false;
        return out;
    }
    if (inet_pton(AF_INET6, s.c_str(), out.bytes.data()) == 1) {
        out.v6 = true;
        return out;
    }
    return std::nullopt;
}

IpAddress IpAddress::v4(uint8_t a, uint8_t b, uint8_t c, uint8_t d) {
    IpAddress out;
    out.bytes[0] = a;
    out.bytes[1] = b;
    out.bytes[2] = c;
    out.bytes[3] = d;
    return out;
}

std::optional<IpAddress> IpAddress::embedded_v4() const {
    if (!v6) return std::nullopt;
    const auto& b = bytes;

    bool zero10 = true;
    for (int i = 0; i < 10; ++i) zero10 = zero10 && b[i] == 0;

    // ::ffff:a.b.c.d
    if (zero10 && b[10] == 0xFF && b[11] == 0xFF) return v4(b[12], b[13], b[14], b[15]);

    // ::a.b.c.d (deprecated compatible form), excluding :: and ::1
    if (zero10 && b[10] == 0 && b[11] == 0) {
        bool low_zero = b[12] == 0 && b[13] == 0 && b[14] == 0;
        if (!(low_zero && b[15] <= 1)) return v4(b[12], b[13], b[14], b[15]);
    }

    // 64:ff9b::a.b.c.d (NAT64)
    static const uint8_t nat64[12] = {0x00, 0x64, 0xff, 0x9b, 0, 0, 0, 0, 0, 0, 0, 0};
    if (std::memcmp(b.data(), nat64, 12) == 0) return v4(b[12], b[13], b[14], b[15]);

    // 2002:aabb:ccdd::/48 (6to4)
    if (b[0] == 0x20 && b[1] == 0x02) return v4(b[2], b[3], b[4], b[5]);

    return std::nullopt;
}

std::string IpAddress::to_string() const {
    char buf[INET6_ADDRSTRLEN] = {0};
    inet_ntop(v6 ? AF_INET6 : AF_INET, bytes.data(), buf, sizeof(buf));
    return buf;
}

AddressClass classify_address(const IpAddress& address) {
    if (auto inner = address.embedded_v4()) {
        AddressClass c = classify_plain(*inner);
        if (c != AddressClass::Public) return c;
    }
    return classify_plain(address);
}

} // namespace MineSpec
