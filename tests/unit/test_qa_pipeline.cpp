/**
 * @file test_qa_pipeline.cpp
 * @brief Sanity checks on reconciled records and rimpull curves
 */

#include <gtest/gtest.h>
#include <validation/qa_pipeline.hpp>

using namespace MineSpec;

namespace {

ValidatedSpec record(const std::string& parameter, SpecValue value, std::optional<std::string> unit,
                     SpecStatus status = SpecStatus::Validated) {
    ValidatedSpec s;
    s.brand = "Komatsu";
    s.model = "930E";
    s.parameter = parameter;
    s.value = std::move(value);
    s.unit = std::move(unit);
    s.confidence = 0.9;
    s.supporting_candidates = {"0a", "0b"};
    s.status = status;
    return s;
}

} // namespace

// =============================================================================
// Single records
// =============================================================================

TEST(QaPipelineTest, NegativePowerIsRejected) {
    QaPipeline qa(Settings::defaults());
    auto result = qa.check(record("engine_power_kw", -2610.0, "kW"));
    EXPECT_FALSE(result.accepted);
    EXPECT_EQ(result.spec.status, SpecStatus::Rejected);
    EXPECT_NE(result.reason.find("greater than 0"), std::string::npos);
    EXPECT_EQ(result.spec.reason, result.reason);
    EXPECT_DOUBLE_EQ(result.spec.confidence, 0.9);
}

TEST(QaPipelineTest, PlausibleValuePasses) {
    QaPipeline qa(Settings::defaults());
    auto result = qa.check(record("engine_power_kw", 2610.0, "kW"));
    EXPECT_TRUE(result.accepted);
    EXPECT_EQ(result.spec.status, SpecStatus::Validated);
    EXPECT_TRUE(result.reason.empty());
}

TEST(QaPipelineTest, SlackAroundBounds) {
    QaPipeline qa(Settings::defaults());
    // operating weight bounds are [10 000, 1 500 000] kg with a slack factor of 10
    EXPECT_TRUE(qa.check(record("operating_weight_kg", 5000.0, "kg")).accepted);

    auto low = qa.check(record("operating_weight_kg", 500.0, "kg"));
    EXPECT_FALSE(low.accepted);
    EXPECT_NE(low.reason.find("below lower bound"), std::string::npos);

    auto high = qa.check(record("operating_weight_kg", 1.6e8, "kg"));
    EXPECT_FALSE(high.accepted);
    EXPECT_NE(high.reason.find("above upper bound"), std::string::npos);
}

TEST(QaPipelineTest, FlaggedAndRejectedPassThrough) {
    QaPipeline qa(Settings::defaults());

    auto flagged = record("engine_power_kw", -1.0, "kW", SpecStatus::Flagged);
    flagged.reason = "unit not recognized";
    auto result = qa.check(flagged);
    EXPECT_TRUE(result.accepted);
    EXPECT_EQ(result.spec, flagged);

    auto rejected = record("engine_power_kw", 2610.0, "kW", SpecStatus::Rejected);
    rejected.reason = "earlier rejection";
    result = qa.check(rejected);
    EXPECT_FALSE(result.accepted);
    EXPECT_EQ(result.reason, "earlier rejection");
}

TEST(QaPipelineTest, PlaceholderTextIsRejected) {
    QaPipeline qa(Settings::defaults());
    EXPECT_FALSE(qa.check(record("engine_model", std::string("N/A"), std::nullopt)).accepted);
    EXPECT_FALSE(qa.check(record("engine_model", std::string("  "), std::nullopt)).accepted);
    EXPECT_TRUE(qa.check(record("engine_model", std::string("Cummins QSK60"), std::nullopt)).accepted);
}

// =============================================================================
// Per-model rules
// =============================================================================

TEST(QaPipelineTest, EmptyWeightMustStayBelowOperatingWeight) {
    QaPipeline qa(Settings::defaults());
    auto report = qa.check_all({
        record("operating_weight_kg", 250000.0, "kg"),
        record("empty_weight_kg", 300000.0, "kg"),
    });

    ASSERT_EQ(report.results.size(), 2u);
    EXPECT_TRUE(report.results[0].accepted);
    EXPECT_FALSE(report.results[1].accepted);
    EXPECT_NE(report.results[1].reason.find("not below operating weight"), std::string::npos);
}

TEST(QaPipelineTest, WeightOrderCanBeDisabled) {
    Settings settings = Settings::defaults();
    settings.qa.enforce_weight_order = false;
    QaPipeline qa(settings);
    auto report = qa.check_all({
        record("operating_weight_kg", 250000.0, "kg"),
        record("empty_weight_kg", 300000.0, "kg"),
    });
    EXPECT_TRUE(report.results[1].accepted);
}

TEST(QaPipelineTest, Completeness) {
    QaPipeline qa(Settings::defaults());
    auto report = qa.check_all({
        record("operating_weight_kg", 250000.0, "kg"),
        record("engine_power_kw", 2610.0, "kW", SpecStatus::Flagged),
    });

    // Core set shared by every class: weight, power, engine model, fuel tank
    EXPECT_DOUBLE_EQ(report.completeness, 0.25);
    EXPECT_EQ(report.missing,
              (std::vector<std::string>{"engine_power_kw", "engine_model", "fuel_tank_capacity_l"}));

    auto haulage = qa.check_all({record("operating_weight_kg", 250000.0, "kg")}, EquipmentClass::Haulage);
    EXPECT_NEAR(haulage.completeness, 1.0 / 9.0, 1e-12);
}

// =============================================================================
// Rimpull curves
// =============================================================================

TEST(QaPipelineTest, CurveChecks) {
    QaPipeline qa(Settings::defaults());

    RimpullCurve curve;
    curve.brand = "Komatsu";
    curve.model = "930E";
    curve.points = {{1, 3.0, 1100}};
    auto check = qa.check_curve(curve);
    EXPECT_FALSE(check.accepted);
    ASSERT_EQ(check.issues.size(), 1u);

    curve.points = {{1, 3.0, 1100}, {2, 8.0, 4000}};
    check = qa.check_curve(curve);
    EXPECT_FALSE(check.accepted);
    EXPECT_NE(check.issues[0].find("gear 2"), std::string::npos);

    curve.points = {{1, 3.0, 900}, {1, 5.0, 1000}};
    curve.violations = {"gear 1: force rises"};
    check = qa.check_curve(curve);
    EXPECT_TRUE(check.accepted);
    EXPECT_EQ(check.warnings, curve.violations);
}
