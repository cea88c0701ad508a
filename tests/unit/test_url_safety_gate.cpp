/**
 * @file test_url_safety_gate.cpp
 * @brief Fail-closed URL checks with a fixed resolver and fake robots.txt source
 */

#include <gtest/gtest.h>
#include <gate/resolver.hpp>
#include <gate/robots_cache.hpp>
#include <gate/url_safety_gate.hpp>
#include <utils/time.hpp>
#include <map>
#include <memory>
#include <stdexcept>

using namespace MineSpec;

namespace {

class FakeRobotsSource : public RobotsSource {
public:
    std::map<std::string, std::string> bodies;
    int fetches = 0;

    std::optional<std::string> fetch_robots(const std::string& origin) override {
        ++fetches;
        auto it = bodies.find(origin);
        if (it == bodies.end()) return std::nullopt;
        return it->second;
    }
};

class UrlSafetyGateTest : public ::testing::Test {
protected:
    void SetUp() override {
        resolver = std::make_shared<StaticResolver>();
        resolver->set("www.cat.com", {IpAddress::v4(23, 45, 67, 89)});
        resolver->set("www.komatsu.com", {IpAddress::v4(104, 16, 1, 1)});
        resolver->set("loopback.example.com", {IpAddress::v4(127, 0, 0, 1)});
        resolver->set("rebind.example.com", {IpAddress::v4(23, 1, 1, 1), IpAddress::v4(10, 0, 0, 7)});
        resolver->set("imds.example.com", {IpAddress::v4(169, 254, 169, 254)});
        resolver->set("mapped.example.com", {*IpAddress::parse("::ffff:127.0.0.1")});

        robots = std::make_shared<FakeRobotsSource>();
        robots->bodies["https://www.komatsu.com"] = "User-agent: *\nDisallow: /internal/\n";
        cache = std::make_shared<RobotsCache>(clock, std::chrono::seconds(3600));
    }

    UrlSafetyGate make_gate(bool respect_robots = true) {
        GateSettings settings;
        settings.respect_robots = respect_robots;
        return UrlSafetyGate(settings, resolver, cache, robots);
    }

    ManualClock clock;
    std::shared_ptr<StaticResolver> resolver;
    std::shared_ptr<FakeRobotsSource> robots;
    std::shared_ptr<RobotsCache> cache;
};

void expect_deny(const GateVerdict& v, DenyReason reason) {
    EXPECT_FALSE(v.allowed);
    ASSERT_TRUE(v.reason.has_value());
    EXPECT_EQ(*v.reason, reason) << to_string(*v.reason) << ": " << v.detail;
}

} // namespace

TEST_F(UrlSafetyGateTest, AllowsPublicHost) {
    auto gate = make_gate();
    auto v = gate.is_safe("https://www.cat.com/en_US/products/797f.html");
    EXPECT_TRUE(v.allowed);
    EXPECT_FALSE(v.reason.has_value());
}

TEST_F(UrlSafetyGateTest, PrivateAndLoopbackLiterals) {
    auto gate = make_gate();
    expect_deny(gate.is_safe("http://127.0.0.1/"), DenyReason::PrivateIp);
    expect_deny(gate.is_safe("http://10.20.30.40:8080/admin"), DenyReason::PrivateIp);
    expect_deny(gate.is_safe("http://192.168.0.1/"), DenyReason::PrivateIp);
    expect_deny(gate.is_safe("http://[::1]/"), DenyReason::PrivateIp);
    expect_deny(gate.is_safe("http://[::ffff:127.0.0.1]/"), DenyReason::PrivateIp);
    expect_deny(gate.is_safe("http://[::ffff:10.0.0.1]/"), DenyReason::PrivateIp);
}

TEST_F(UrlSafetyGateTest, CloudMetadataEndpoints) {
    auto gate = make_gate();
    expect_deny(gate.is_safe("http://169.254.169.254/latest/meta-data/"), DenyReason::CloudMetadata);
    expect_deny(gate.is_safe("http://[::ffff:169.254.169.254]/"), DenyReason::CloudMetadata);
    expect_deny(gate.is_safe("http://metadata.google.internal/computeMetadata/v1/"), DenyReason::CloudMetadata);
    expect_deny(gate.is_safe("https://imds.example.com/"), DenyReason::CloudMetadata);
}

TEST_F(UrlSafetyGateTest, BlockedHostNamesSkipDns) {
    auto gate = make_gate();
    expect_deny(gate.is_safe("http://localhost:5432/"), DenyReason::PrivateIp);
    expect_deny(gate.is_safe("http://db.localhost/"), DenyReason::PrivateIp);
    expect_deny(gate.is_safe("http://LOCALHOST./"), DenyReason::PrivateIp);
    EXPECT_EQ(resolver->lookups(), 0u);
}

TEST_F(UrlSafetyGateTest, ResolvedAddressesAreChecked) {
    auto gate = make_gate();
    expect_deny(gate.is_safe("https://loopback.example.com/"), DenyReason::PrivateIp);
    expect_deny(gate.is_safe("https://mapped.example.com/"), DenyReason::PrivateIp);
    // Any private answer among several denies the URL.
    expect_deny(gate.is_safe("https://rebind.example.com/"), DenyReason::PrivateIp);
}

TEST_F(UrlSafetyGateTest, AddressVerdictIsRecomputedOnEveryCall) {
    auto gate = make_gate(false);
    resolver->set("moving.example.com", {IpAddress::v4(23, 9, 9, 9)});
    EXPECT_TRUE(gate.is_safe("https://moving.example.com/specs").allowed);
    size_t before = resolver->lookups();

    resolver->set("moving.example.com", {IpAddress::v4(127, 0, 0, 1)});
    expect_deny(gate.is_safe("https://moving.example.com/specs"), DenyReason::PrivateIp);

    resolver->set("moving.example.com", {IpAddress::v4(23, 9, 9, 9)});
    EXPECT_TRUE(gate.is_safe("https://moving.example.com/specs").allowed);
    EXPECT_EQ(resolver->lookups(), before + 2);
}

TEST_F(UrlSafetyGateTest, UnresolvedHostIsDenied) {
    auto gate = make_gate();
    expect_deny(gate.is_safe("https://no-such-host.invalid/"), DenyReason::DnsUnresolved);
    expect_deny(gate.is_safe("https://nx.example.org/brochure.pdf"), DenyReason::DnsUnresolved);
}

TEST_F(UrlSafetyGateTest, InvalidUrls) {
    auto gate = make_gate();
    expect_deny(gate.is_safe(""), DenyReason::InvalidUrl);
    expect_deny(gate.is_safe("gopher://www.cat.com/"), DenyReason::InvalidUrl);
    expect_deny(gate.is_safe("https://admin@www.cat.com/"), DenyReason::InvalidUrl);
    expect_deny(gate.is_safe("https://www.cat.com/" + std::string(5000, 'x')), DenyReason::InvalidUrl);
    EXPECT_TRUE(gate.is_safe("https://admin@www.cat.com/").is_security_deny());
}

TEST_F(UrlSafetyGateTest, RobotsDisallowAndOverride) {
    auto gate = make_gate();
    auto denied = gate.is_safe("https://www.komatsu.com/internal/specs");
    expect_deny(denied, DenyReason::RobotsDisallowed);
    EXPECT_FALSE(denied.is_security_deny());

    EXPECT_TRUE(gate.is_safe("https://www.komatsu.com/products/930e").allowed);
    EXPECT_EQ(robots->fetches, 1); // second call served from cache

    GatePolicy policy;
    policy.override_robots = true;
    EXPECT_TRUE(gate.is_safe("https://www.komatsu.com/internal/specs", policy).allowed);
}

TEST_F(UrlSafetyGateTest, RobotsRulesAreSharedPerHost) {
    auto gate = make_gate();
    EXPECT_TRUE(gate.is_safe("https://www.komatsu.com/products/930e").allowed);
    expect_deny(gate.is_safe("http://www.komatsu.com/internal/specs"), DenyReason::RobotsDisallowed);
    expect_deny(gate.is_safe("https://www.komatsu.com:443/internal/specs"), DenyReason::RobotsDisallowed);
    EXPECT_EQ(robots->fetches, 1);
    EXPECT_EQ(cache->size(), 1u);
}

TEST_F(UrlSafetyGateTest, RobotsOverrideNeverBypassesAddressPolicy) {
    auto gate = make_gate();
    GatePolicy policy;
    policy.override_robots = true;
    expect_deny(gate.is_safe("http://169.254.169.254/", policy), DenyReason::CloudMetadata);
}

TEST_F(UrlSafetyGateTest, MissingRobotsAllowsAndIsCached) {
    auto gate = make_gate();
    EXPECT_TRUE(gate.is_safe("https://www.cat.com/a").allowed);
    EXPECT_TRUE(gate.is_safe("https://www.cat.com/b").allowed);
    EXPECT_EQ(robots->fetches, 1);

    clock.advance(std::chrono::seconds(3600));
    EXPECT_TRUE(gate.is_safe("https://www.cat.com/c").allowed);
    EXPECT_EQ(robots->fetches, 2);
}

TEST_F(UrlSafetyGateTest, RobotsIgnoredWhenDisabled) {
    auto gate = make_gate(false);
    EXPECT_TRUE(gate.is_safe("https://www.komatsu.com/internal/specs").allowed);
    EXPECT_EQ(robots->fetches, 0);
}

TEST_F(UrlSafetyGateTest, SanitizeReturnsOnlySafeUrls) {
    auto gate = make_gate();
    EXPECT_EQ(gate.sanitize("  www.cat.com/en_US/797f.html "), std::optional<std::string>("https://www.cat.com/en_US/797f.html"));
    EXPECT_EQ(gate.sanitize("http://www.cat.com/a"), std::optional<std::string>("http://www.cat.com/a"));
    EXPECT_FALSE(gate.sanitize("").has_value());
    EXPECT_FALSE(gate.sanitize("   ").has_value());
    EXPECT_FALSE(gate.sanitize("loopback.example.com/admin").has_value());
    EXPECT_FALSE(gate.sanitize("169.254.169.254/latest/meta-data/").has_value());
    EXPECT_FALSE(gate.sanitize("https://www.komatsu.com/internal/specs").has_value());

    GatePolicy policy;
    policy.override_robots = true;
    EXPECT_TRUE(gate.sanitize("https://www.komatsu.com/internal/specs", policy).has_value());
}

TEST_F(UrlSafetyGateTest, NullResolverIsRejected) {
    EXPECT_THROW({ UrlSafetyGate gate(GateSettings{}, nullptr); }, std::invalid_argument);
}
