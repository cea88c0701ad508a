/**
 * @file test_robots_cache.cpp
 * @brief robots.txt rule parsing and the TTL cache
 */

#include <gtest/gtest.h>
#include <gate/robots_cache.hpp>
#include <utils/time.hpp>
#include <chrono>

using namespace MineSpec;

// =============================================================================
// Rules
// =============================================================================

TEST(RobotsRulesTest, WildcardGroup) {
    auto rules = RobotsRules::parse(
        "User-agent: *\n"
        "Disallow: /private/\n"
        "Disallow: /search\n", "MiningEquipResearch/1.0");

    EXPECT_TRUE(rules.allows("/products/797f"));
    EXPECT_FALSE(rules.allows("/private/specs.pdf"));
    EXPECT_FALSE(rules.allows("/search?q=797"));
    EXPECT_EQ(rules.rules().size(), 2u);
}

TEST(RobotsRulesTest, SpecificAgentGroupWins) {
    auto rules = RobotsRules::parse(
        "User-agent: *\n"
        "Disallow: /\n"
        "\n"
        "User-agent: MiningEquipResearch\n"
        "Disallow: /dealer-portal/\n", "MiningEquipResearch/1.0");

    EXPECT_TRUE(rules.allows("/products/"));
    EXPECT_FALSE(rules.allows("/dealer-portal/login"));
}

TEST(RobotsRulesTest, LongestMatchAndAllowWinsTies) {
    auto rules = RobotsRules::parse(
        "User-agent: *\n"
        "Disallow: /docs/\n"
        "Allow: /docs/brochures/\n"
        "Disallow: /same\n"
        "Allow: /same\n", "bot");

    EXPECT_FALSE(rules.allows("/docs/internal.pdf"));
    EXPECT_TRUE(rules.allows("/docs/brochures/797f.pdf"));
    EXPECT_TRUE(rules.allows("/same"));
}

TEST(RobotsRulesTest, WildcardsAndAnchors) {
    auto rules = RobotsRules::parse(
        "User-agent: *\n"
        "Disallow: /*.pdf$\n"
        "Disallow: /tmp*/cache\n", "bot");

    EXPECT_FALSE(rules.allows("/brochures/797f.pdf"));
    EXPECT_TRUE(rules.allows("/brochures/797f.pdf?download=1"));
    EXPECT_FALSE(rules.allows("/tmp123/cache/x"));
    EXPECT_TRUE(rules.allows("/tmp123/other"));
}

TEST(RobotsRulesTest, CommentsAndEmptyDisallow) {
    auto rules = RobotsRules::parse(
        "# crawl politely\n"
        "User-agent: * # everyone\n"
        "Disallow:\n"
        "Crawl-delay: 10\n"
        "Sitemap: https://www.cat.com/sitemap.xml\n", "bot");

    EXPECT_TRUE(rules.rules().empty());
    EXPECT_TRUE(rules.allows("/anything"));
}

TEST(RobotsRulesTest, AllowAll) {
    EXPECT_TRUE(RobotsRules::allow_all().allows("/"));
}

// =============================================================================
// Cache
// =============================================================================

TEST(RobotsCacheTest, EntriesExpireAfterTtl) {
    ManualClock clock;
    RobotsCache cache(clock, std::chrono::seconds(60));

    cache.put("www.cat.com", RobotsRules::parse("User-agent: *\nDisallow: /x\n", "bot"));
    ASSERT_TRUE(cache.get("www.cat.com").has_value());
    EXPECT_FALSE(cache.get("www.cat.com")->allows("/x"));
    EXPECT_FALSE(cache.get("www.komatsu.com").has_value());

    clock.advance(std::chrono::seconds(59));
    EXPECT_TRUE(cache.get("www.cat.com").has_value());

    clock.advance(std::chrono::seconds(1));
    EXPECT_FALSE(cache.get("www.cat.com").has_value());
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.expire(), 1u);
    EXPECT_EQ(cache.size(), 0u);
}

TEST(RobotsCacheTest, PutRefreshesExpiry) {
    ManualClock clock;
    RobotsCache cache(clock, std::chrono::seconds(10));

    cache.put("a.com", RobotsRules::allow_all());
    clock.advance(std::chrono::seconds(8));
    cache.put("a.com", RobotsRules::allow_all());
    clock.advance(std::chrono::seconds(8));

    EXPECT_TRUE(cache.get("a.com").has_value());
    EXPECT_EQ(cache.expire(), 0u);
}
