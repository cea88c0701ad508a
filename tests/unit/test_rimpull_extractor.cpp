/**
 * @file test_rimpull_extractor.cpp
 * @brief Rimpull table detection, gear parsing and monotonicity checks
 */

#include <gtest/gtest.h>
#include <extraction/rimpull_extractor.hpp>

using namespace MineSpec;

namespace {

const std::string URL = "https://www.komatsu.com/930e.pdf";

} // namespace

// =============================================================================
// Gear cells
// =============================================================================

TEST(RimpullExtractorTest, ParseGear) {
    EXPECT_EQ(RimpullExtractor::parse_gear("1"), 1);
    EXPECT_EQ(RimpullExtractor::parse_gear("1st"), 1);
    EXPECT_EQ(RimpullExtractor::parse_gear("F2"), 2);
    EXPECT_EQ(RimpullExtractor::parse_gear("Gear 3"), 3);
    EXPECT_EQ(RimpullExtractor::parse_gear("third"), 3);
    EXPECT_EQ(RimpullExtractor::parse_gear("Third gear"), 3);
    EXPECT_EQ(RimpullExtractor::parse_gear("Low"), 1);
    EXPECT_EQ(RimpullExtractor::parse_gear("R"), -1);
    EXPECT_EQ(RimpullExtractor::parse_gear("Reverse 2"), -2);
}

TEST(RimpullExtractorTest, ParseGearRejectsNoise) {
    EXPECT_FALSE(RimpullExtractor::parse_gear("").has_value());
    EXPECT_FALSE(RimpullExtractor::parse_gear("N").has_value());
    EXPECT_FALSE(RimpullExtractor::parse_gear("25").has_value());
    EXPECT_FALSE(RimpullExtractor::parse_gear("overdrive").has_value());
}

// =============================================================================
// Detection
// =============================================================================

TEST(RimpullExtractorTest, DetectsHeaderBelowTitleRow) {
    RimpullExtractor extractor(UnitTable::builtin());
    Table table = {
        {"Rimpull chart"},
        {"Gear", "Speed km/h", "Force kN"},
        {"1", "3.0", "900"},
    };

    auto layout = extractor.detect(table);
    ASSERT_TRUE(layout.has_value());
    EXPECT_EQ(layout->header_row, 1u);
    EXPECT_EQ(layout->gear_col, 0u);
    EXPECT_EQ(layout->speed_col, 1u);
    EXPECT_EQ(layout->force_col, 2u);
}

TEST(RimpullExtractorTest, OrdinarySpecTableIsNotRimpull) {
    RimpullExtractor extractor(UnitTable::builtin());
    Table table = {
        {"Model", "Operating weight"},
        {"930E", "500 000 kg"},
    };
    EXPECT_FALSE(extractor.detect(table).has_value());
    EXPECT_FALSE(extractor.extract(table, "Komatsu", "930E", URL).has_value());
}

// =============================================================================
// Extraction
// =============================================================================

TEST(RimpullExtractorTest, ConvertsImperialColumns) {
    RimpullExtractor extractor(UnitTable::builtin());
    Table table = {
        {"Gear", "Speed (mph)", "Rimpull (lbf)"},
        {"1st", "2.2", "247 300"},
    };

    auto curve = extractor.extract(table, "Komatsu", "930E", URL);
    ASSERT_TRUE(curve.has_value());
    ASSERT_EQ(curve->points.size(), 1u);
    EXPECT_NEAR(curve->points[0].speed_kph, 2.2 * 1.609344, 1e-9);
    EXPECT_NEAR(curve->points[0].force_kn, 247300 * 0.0044482216, 1e-6);
    EXPECT_EQ(curve->source_url, URL);
    EXPECT_EQ(curve->brand, "Komatsu");
}

TEST(RimpullExtractorTest, SkipsUnusableRows) {
    RimpullExtractor extractor(UnitTable::builtin());
    Table table = {
        {"Gear", "Speed (km/h)", "Rimpull (kN)"},
        {"1", "3.5", "1100"},
        {"2", "95", "400"},   // faster than any haul truck
        {"3", "-5", "800"},
        {"3", "12", "abc"},
        {"4", "n/a", "200"},
        {"5"},
    };

    auto curve = extractor.extract(table, "Komatsu", "930E", URL);
    ASSERT_TRUE(curve.has_value());
    ASSERT_EQ(curve->points.size(), 1u);
    EXPECT_EQ(curve->points[0].gear, 1);
}

TEST(RimpullExtractorTest, NoSurvivingRowsMeansNoCurve) {
    RimpullExtractor extractor(UnitTable::builtin());
    Table table = {
        {"Gear", "Speed (km/h)", "Rimpull (kN)"},
        {"1", "-", "-"},
    };
    EXPECT_FALSE(extractor.extract(table, "Komatsu", "930E", URL).has_value());
}

TEST(RimpullExtractorTest, RisingForceIsRecordedNotDropped) {
    RimpullExtractor extractor(UnitTable::builtin());
    Table table = {
        {"Gear", "Speed (km/h)", "Rimpull (kN)"},
        {"1", "5.0", "1000"},
        {"1", "3.0", "900"},
        {"2", "8.0", "600"},
    };

    auto curve = extractor.extract(table, "Komatsu", "930E", URL);
    ASSERT_TRUE(curve.has_value());
    ASSERT_EQ(curve->points.size(), 3u);
    EXPECT_DOUBLE_EQ(curve->points[0].speed_kph, 3.0);
    EXPECT_DOUBLE_EQ(curve->points[1].speed_kph, 5.0);
    ASSERT_EQ(curve->violations.size(), 1u);
    EXPECT_NE(curve->violations[0].find("gear 1"), std::string::npos);
    EXPECT_FALSE(curve->monotonic());
    EXPECT_DOUBLE_EQ(curve->max_force_kn(), 1000.0);
}

TEST(RimpullExtractorTest, OrderAndCheckToleratesRounding) {
    std::vector<RimpullPoint> points = {{1, 4.0, 1002.0}, {1, 2.0, 1000.0}};
    auto violations = RimpullExtractor::order_and_check(points);
    EXPECT_TRUE(violations.empty());
    EXPECT_DOUBLE_EQ(points[0].speed_kph, 2.0);
}
