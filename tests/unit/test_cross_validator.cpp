/**
 * @file test_cross_validator.cpp
 * @brief Clustering, winner selection and status of reconciled specs
 */

#include <gtest/gtest.h>
#include <validation/cross_validator.hpp>
#include <algorithm>

using namespace MineSpec;

namespace {

ScoredCandidate weight(const std::string& id, double value, double confidence,
                       SourceTier tier = SourceTier::OemPrimary,
                       std::optional<std::string> unit = std::string("kg"),
                       const std::string& model = "794 AC") {
    ScoredCandidate s;
    s.candidate.id = id;
    s.candidate.brand = "Caterpillar";
    s.candidate.model = model;
    s.candidate.parameter = "operating_weight_kg";
    s.candidate.value = value;
    s.candidate.unit = std::move(unit);
    s.candidate.method = ExtractionMethod::TableCell;
    s.candidate.source_url = "https://www.cat.com/" + id;
    s.confidence = confidence;
    s.tier = tier;
    return s;
}

ScoredCandidate engine(const std::string& id, const std::string& value, double confidence) {
    ScoredCandidate s;
    s.candidate.id = id;
    s.candidate.brand = "Caterpillar";
    s.candidate.model = "794 AC";
    s.candidate.parameter = "engine_model";
    s.candidate.value = value;
    s.candidate.method = ExtractionMethod::Regex;
    s.confidence = confidence;
    s.tier = SourceTier::OemPrimary;
    return s;
}

const SpecKey KEY{"Caterpillar", "794 AC", "operating_weight_kg"};

} // namespace

// =============================================================================
// Numeric reconciliation
// =============================================================================

TEST(CrossValidatorTest, AgreeingSourcesOutweighOutlier) {
    CrossValidator validator(Settings::defaults());
    auto spec = validator.reconcile_group(KEY, {
        weight("aa01", 180000, 0.9),
        weight("aa02", 182000, 0.85, SourceTier::OemSecondary),
        weight("aa03", 95000, 0.3, SourceTier::ThirdParty),
    });
    ASSERT_TRUE(spec.has_value());

    EXPECT_EQ(spec->status, SpecStatus::Validated);
    EXPECT_TRUE(spec->reason.empty());
    EXPECT_NEAR(std::get<double>(spec->value), 180971.428571, 1e-6);
    EXPECT_EQ(spec->unit.value_or(""), "kg");
    EXPECT_DOUBLE_EQ(spec->confidence, 0.841);
    EXPECT_EQ(spec->supporting_candidates, (std::vector<std::string>{"aa01", "aa02"}));
    EXPECT_EQ(spec->conflicting_candidates, (std::vector<std::string>{"aa03"}));
}

TEST(CrossValidatorTest, FaintOutlierIsNotListedAsConflict) {
    CrossValidator validator(Settings::defaults());
    auto spec = validator.reconcile_group(KEY, {
        weight("aa01", 180000, 0.9),
        weight("aa02", 182000, 0.85, SourceTier::OemSecondary),
        weight("aa03", 95000, 0.15, SourceTier::ThirdParty),
    });
    ASSERT_TRUE(spec.has_value());

    EXPECT_EQ(spec->status, SpecStatus::Validated);
    EXPECT_TRUE(spec->reason.empty());
    EXPECT_NEAR(std::get<double>(spec->value), 180971.428571, 1e-6);
    EXPECT_EQ(spec->supporting_candidates, (std::vector<std::string>{"aa01", "aa02"}));
    EXPECT_TRUE(spec->conflicting_candidates.empty());
    // 0.985 agreement x 1.75 / 1.9 share
    EXPECT_DOUBLE_EQ(spec->confidence, 0.907);
}

TEST(CrossValidatorTest, StrongDisagreementIsFlagged) {
    CrossValidator validator(Settings::defaults());
    auto spec = validator.reconcile_group(KEY, {
        weight("bb01", 180000, 0.9),
        weight("bb02", 120000, 0.8, SourceTier::Dealer),
    });
    ASSERT_TRUE(spec.has_value());
    EXPECT_EQ(spec->status, SpecStatus::Flagged);
    EXPECT_NE(spec->reason.find("competing cluster"), std::string::npos);
    EXPECT_DOUBLE_EQ(std::get<double>(spec->value), 180000.0);
    EXPECT_EQ(spec->conflicting_candidates, (std::vector<std::string>{"bb02"}));
}

TEST(CrossValidatorTest, WeakEvidenceIsFlagged) {
    CrossValidator validator(Settings::defaults());
    auto spec = validator.reconcile_group(KEY, {weight("cc01", 180000, 0.5)});
    ASSERT_TRUE(spec.has_value());
    EXPECT_EQ(spec->status, SpecStatus::Flagged);
    EXPECT_NE(spec->reason.find("acceptance threshold"), std::string::npos);
}

TEST(CrossValidatorTest, MissingUnitIsFlagged) {
    CrossValidator validator(Settings::defaults());
    auto spec = validator.reconcile_group(KEY, {weight("dd01", 180000, 0.9, SourceTier::OemPrimary, std::nullopt)});
    ASSERT_TRUE(spec.has_value());
    EXPECT_EQ(spec->status, SpecStatus::Flagged);
    EXPECT_EQ(spec->reason, "unit not recognized");
    EXPECT_FALSE(spec->unit.has_value());
}

TEST(CrossValidatorTest, TierDiversityBreaksMassTie) {
    CrossValidator validator(Settings::defaults());
    auto spec = validator.reconcile_group(KEY, {
        weight("ee01", 100000, 0.45, SourceTier::OemPrimary),
        weight("ee02", 100500, 0.45, SourceTier::Dealer),
        weight("ee03", 200000, 0.9, SourceTier::OemPrimary),
    });
    ASSERT_TRUE(spec.has_value());
    EXPECT_DOUBLE_EQ(std::get<double>(spec->value), 100250.0);
    EXPECT_EQ(spec->supporting_candidates, (std::vector<std::string>{"ee01", "ee02"}));
    EXPECT_EQ(spec->status, SpecStatus::Flagged);
}

TEST(CrossValidatorTest, EmptyGroupYieldsNothing) {
    CrossValidator validator(Settings::defaults());
    EXPECT_FALSE(validator.reconcile_group(KEY, {}).has_value());
}

// =============================================================================
// Text reconciliation
// =============================================================================

TEST(CrossValidatorTest, TextClustersIgnoreCaseAndPunctuation) {
    CrossValidator validator(Settings::defaults());
    auto spec = validator.reconcile_group({"Caterpillar", "794 AC", "engine_model"}, {
        engine("ff01", "Cat C175-20", 0.9),
        engine("ff02", "CAT C175 20", 0.8),
        engine("ff03", "QSK60", 0.3),
    });
    ASSERT_TRUE(spec.has_value());
    EXPECT_EQ(std::get<std::string>(spec->value), "Cat C175-20");
    EXPECT_FALSE(spec->unit.has_value());
    EXPECT_EQ(spec->status, SpecStatus::Validated);
    EXPECT_EQ(spec->supporting_candidates.size(), 2u);
    EXPECT_EQ(spec->conflicting_candidates, (std::vector<std::string>{"ff03"}));
}

// =============================================================================
// Determinism
// =============================================================================

TEST(CrossValidatorTest, OrderAndDuplicatesDoNotMatter) {
    CrossValidator validator(Settings::defaults());
    std::vector<ScoredCandidate> input = {
        weight("gg01", 180000, 0.9),
        weight("gg02", 182000, 0.85),
        weight("gg03", 95000, 0.3),
    };
    auto forward = validator.reconcile(input);

    std::vector<ScoredCandidate> shuffled(input.rbegin(), input.rend());
    shuffled.push_back(input[1]);
    auto backward = validator.reconcile(shuffled);

    ASSERT_EQ(forward.size(), 1u);
    ASSERT_EQ(backward.size(), 1u);
    EXPECT_EQ(forward[0], backward[0]);
    EXPECT_EQ(validator.reconcile(input), forward);
}

TEST(CrossValidatorTest, ReconcileGroupsPerModel) {
    CrossValidator validator(Settings::defaults());
    auto specs = validator.reconcile({
        weight("hh01", 623690, 0.9, SourceTier::OemPrimary, std::string("kg"), "797F"),
        weight("hh02", 180000, 0.9, SourceTier::OemPrimary, std::string("kg"), "794 AC"),
    });
    ASSERT_EQ(specs.size(), 2u);
    EXPECT_EQ(specs[0].model, "794 AC");
    EXPECT_EQ(specs[1].model, "797F");
}

// =============================================================================
// Rimpull curves
// =============================================================================

TEST(CrossValidatorTest, CurveFromBestTierWins) {
    CrossValidator validator(Settings::defaults());

    RimpullCurve oem;
    oem.source_url = "https://www.cat.com/794ac.pdf";
    oem.tier = SourceTier::OemPrimary;
    oem.points = {{1, 3.0, 1100}, {2, 7.0, 600}};

    RimpullCurve press = oem;
    press.source_url = "https://www.mining.com/794ac";
    press.tier = SourceTier::ThirdParty;
    press.points.push_back({3, 12.0, 400});

    auto best = validator.reconcile_curves({press, oem});
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->source_url, oem.source_url);

    RimpullCurve fuller = oem;
    fuller.source_url = "https://www.cat.com/794ac-full.pdf";
    fuller.points.push_back({3, 12.0, 400});
    best = validator.reconcile_curves({oem, fuller});
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->source_url, fuller.source_url);

    EXPECT_FALSE(validator.reconcile_curves({}).has_value());
}

TEST(CrossValidatorTest, CurvesConsolidatePerGear) {
    CrossValidator validator(Settings::defaults());

    RimpullCurve oem;
    oem.source_url = "https://www.cat.com/794ac.pdf";
    oem.tier = SourceTier::OemPrimary;
    oem.points = {{1, 3.0, 1100}, {2, 7.0, 600}};

    RimpullCurve dealer;
    dealer.source_url = "https://www.dealer-example.com/used/794ac";
    dealer.tier = SourceTier::Dealer;
    dealer.points = {{1, 3.2, 1120}, {2, 7.0, 900}}; // gear 2 disagrees

    RimpullCurve press;
    press.source_url = "https://www.mining.com/794ac";
    press.tier = SourceTier::ThirdParty;
    press.points = {{2, 7.4, 610}, {3, 12.0, 400}};

    auto curve = validator.reconcile_curves({press, dealer, oem});
    ASSERT_TRUE(curve.has_value());
    EXPECT_EQ(curve->source_url, oem.source_url);
    EXPECT_EQ(curve->tier, SourceTier::OemPrimary);
    ASSERT_EQ(curve->points.size(), 3u);

    // gear 1: oem and dealer agree, weighted 1.0 and 0.7
    EXPECT_EQ(curve->points[0].gear, 1);
    EXPECT_NEAR(curve->points[0].speed_kph, 5.24 / 1.7, 1e-5);
    EXPECT_NEAR(curve->points[0].force_kn, 1884.0 / 1.7, 1e-5);

    // gear 2: oem and press outweigh the dealer's 900 kN
    EXPECT_EQ(curve->points[1].gear, 2);
    EXPECT_NEAR(curve->points[1].speed_kph, 11.07 / 1.55, 1e-5);
    EXPECT_NEAR(curve->points[1].force_kn, 935.5 / 1.55, 1e-5);

    // gear 3: single source
    EXPECT_EQ(curve->points[2], (RimpullPoint{3, 12.0, 400}));
    EXPECT_TRUE(curve->monotonic());

    auto reordered = validator.reconcile_curves({oem, press, dealer});
    ASSERT_TRUE(reordered.has_value());
    EXPECT_EQ(reordered->points, curve->points);
}

TEST(CrossValidatorTest, CurveToleranceFromSettings) {
    Settings settings = Settings::defaults();
    settings.reconciliation.curve_tolerance_pct = 1.0;
    CrossValidator validator(settings);

    RimpullCurve oem;
    oem.source_url = "https://www.cat.com/794ac.pdf";
    oem.tier = SourceTier::OemPrimary;
    oem.points = {{1, 3.0, 1100}};

    RimpullCurve press = oem;
    press.source_url = "https://www.mining.com/794ac";
    press.tier = SourceTier::ThirdParty;
    press.points = {{1, 3.2, 1120}};

    // 1120 is 1.8% above 1100: two clusters, the OEM one carries more weight
    auto curve = validator.reconcile_curves({press, oem});
    ASSERT_TRUE(curve.has_value());
    ASSERT_EQ(curve->points.size(), 1u);
    EXPECT_EQ(curve->points[0], (RimpullPoint{1, 3.0, 1100}));
}
