/**
 * @file test_confidence_scorer.cpp
 * @brief Source tiers and candidate confidence
 */

#include <gtest/gtest.h>
#include <scoring/confidence_scorer.hpp>
#include <scoring/source_classifier.hpp>

using namespace MineSpec;

namespace {

ExtractionCandidate numeric(const std::string& parameter, double value, std::optional<std::string> unit,
                            ExtractionMethod method = ExtractionMethod::TableCell) {
    ExtractionCandidate c;
    c.brand = "Caterpillar";
    c.model = "794 AC";
    c.parameter = parameter;
    c.value = value;
    c.unit = std::move(unit);
    c.method = method;
    c.source_url = "https://www.cat.com/794ac";
    return c;
}

} // namespace

// =============================================================================
// Source classification
// =============================================================================

TEST(SourceClassifierTest, OwnDomainIsPrimary) {
    SourceClassifier classifier;
    EXPECT_EQ(classifier.classify("https://www.cat.com/en_US/products/794ac.html", "Caterpillar"),
              SourceTier::OemPrimary);
    EXPECT_EQ(classifier.classify("https://s7d2.scene7.caterpillar.com/x.pdf", "Cat"),
              SourceTier::OemPrimary);
}

TEST(SourceClassifierTest, OtherOemIsSecondary) {
    SourceClassifier classifier;
    EXPECT_EQ(classifier.classify("https://www.komatsu.com/en/products/930e", "Caterpillar"),
              SourceTier::OemSecondary);
}

TEST(SourceClassifierTest, ThirdPartyAndDealer) {
    SourceClassifier classifier;
    EXPECT_EQ(classifier.classify("https://www.ritchiespecs.com/model/caterpillar-794-ac", "Caterpillar"),
              SourceTier::ThirdParty);
    EXPECT_EQ(classifier.classify("https://www.westernstates-equipment.com/used/794ac", "Caterpillar"),
              SourceTier::Dealer);
}

TEST(SourceClassifierTest, PdfOnUnknownHostIsSecondary) {
    SourceClassifier classifier;
    EXPECT_EQ(classifier.classify("https://files.example.org/brochures/794ac.pdf", "Caterpillar"),
              SourceTier::OemSecondary);
    EXPECT_EQ(classifier.classify("https://files.example.org/brochures/794ac", "Caterpillar"),
              SourceTier::Unknown);
}

TEST(SourceClassifierTest, UnparseableUrlIsUnknown) {
    SourceClassifier classifier;
    EXPECT_EQ(classifier.classify("not a url", "Caterpillar"), SourceTier::Unknown);
}

TEST(SourceClassifierTest, BrandKey) {
    EXPECT_EQ(SourceClassifier::brand_key("P&H"), "ph");
    EXPECT_EQ(SourceClassifier::brand_key("John Deere"), "johndeere");
}

// =============================================================================
// Scoring
// =============================================================================

TEST(ConfidenceScorerTest, BestCaseScoresOne) {
    ConfidenceScorer scorer(Settings::defaults());
    auto scored = scorer.score(numeric("operating_weight_kg", 623690, "kg"), SourceTier::OemPrimary);
    EXPECT_DOUBLE_EQ(scored.confidence, 1.0);
    EXPECT_EQ(scored.tier, SourceTier::OemPrimary);
    EXPECT_EQ(scored.candidate.parameter, "operating_weight_kg");
}

TEST(ConfidenceScorerTest, WeightsCombine) {
    ConfidenceScorer scorer(Settings::defaults());
    // 0.5 * 0.7 + 0.2 * 0.7 + 0.3 * 1.0
    auto scored = scorer.score(numeric("operating_weight_kg", 623690, "kg", ExtractionMethod::Regex),
                               SourceTier::Dealer);
    EXPECT_DOUBLE_EQ(scored.confidence, 0.79);
}

TEST(ConfidenceScorerTest, UnknownUnitLowersPlausibility) {
    ConfidenceScorer scorer(Settings::defaults());
    auto c = numeric("operating_weight_kg", 623690, std::nullopt);
    EXPECT_FALSE(scorer.in_range(c, EquipmentClass::Unspecified).has_value());
    EXPECT_DOUBLE_EQ(scorer.score(c, SourceTier::OemPrimary).confidence, 0.85);
}

TEST(ConfidenceScorerTest, OutOfRangeIsPenalized) {
    ConfidenceScorer scorer(Settings::defaults());
    auto c = numeric("operating_weight_kg", 100, "kg");
    auto range = scorer.in_range(c, EquipmentClass::Unspecified);
    ASSERT_TRUE(range.has_value());
    EXPECT_FALSE(*range);
    EXPECT_DOUBLE_EQ(scorer.score(c, SourceTier::OemPrimary).confidence, 0.25);
}

TEST(ConfidenceScorerTest, TextValuesSkipRangeCheck) {
    ConfidenceScorer scorer(Settings::defaults());
    ExtractionCandidate c = numeric("engine_model", 0, std::nullopt);
    c.value = std::string("Cat C175-20");
    EXPECT_FALSE(scorer.in_range(c, EquipmentClass::Haulage).has_value());
    EXPECT_DOUBLE_EQ(scorer.score(c, SourceTier::OemPrimary).confidence, 1.0);
}

TEST(ConfidenceScorerTest, CountsNeedNoUnit) {
    ConfidenceScorer scorer(Settings::defaults());
    auto c = numeric("cylinder_count", 16, std::nullopt);
    auto range = scorer.in_range(c, EquipmentClass::Unspecified);
    ASSERT_TRUE(range.has_value());
    EXPECT_TRUE(*range);
    EXPECT_DOUBLE_EQ(scorer.score(c, SourceTier::OemPrimary).confidence, 1.0);
}

TEST(ConfidenceScorerTest, ScoreIsDeterministic) {
    ConfidenceScorer scorer(Settings::defaults());
    auto c = numeric("engine_power_kw", 2610, "kW", ExtractionMethod::Regex);
    auto a = scorer.score(c, SourceTier::ThirdParty);
    auto b = scorer.score(c, SourceTier::ThirdParty);
    EXPECT_EQ(a.confidence, b.confidence);
    EXPECT_GE(a.confidence, 0.0);
    EXPECT_LE(a.confidence, 1.0);
}
