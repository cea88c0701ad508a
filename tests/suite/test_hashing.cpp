/**
 * @file test_hashing.cpp
 * @brief BLAKE3 digests and candidate identity
 */

#include <gtest/gtest.h>
#include <hashing/blake3_pipeline.hpp>
#include <core/types.hpp>
#include <stdexcept>
#include <string>
#include <vector>

using namespace MineSpec;

TEST(HashingTest, Determinism) {
    std::string data = "Caterpillar 794 AC operating weight";
    EXPECT_EQ(BLAKE3Pipeline::hash(data), BLAKE3Pipeline::hash(data));
}

TEST(HashingTest, CollisionResistance) {
    EXPECT_NE(BLAKE3Pipeline::hash("794 AC"), BLAKE3Pipeline::hash("794AC"));
}

TEST(HashingTest, FieldBoundariesMatter) {
    auto h1 = BLAKE3Pipeline::hash_fields({"ab", "c"});
    auto h2 = BLAKE3Pipeline::hash_fields({"a", "bc"});
    EXPECT_NE(h1, h2);
    EXPECT_EQ(h1, BLAKE3Pipeline::hash_fields({"ab", "c"}));
}

TEST(HashingTest, HexConversion) {
    auto hash = BLAKE3Pipeline::hash("hex_test");
    std::string hex = BLAKE3Pipeline::to_hex(hash);

    EXPECT_EQ(hex.length(), 32u); // 16 bytes * 2
    EXPECT_EQ(BLAKE3Pipeline::from_hex(hex), hash);
    EXPECT_THROW(BLAKE3Pipeline::from_hex("abc"), std::invalid_argument);
    EXPECT_THROW(BLAKE3Pipeline::from_hex(std::string(32, 'z')), std::invalid_argument);
}

TEST(HashingTest, CandidateIdDependsOnEveryField) {
    MatchedSpan span;
    span.offset = 10;
    span.length = 20;
    const std::string url = "https://www.cat.com/794ac";

    auto id = make_candidate_id(url, ExtractionMethod::Regex, "operating_weight_kg", span, "Operating weight 623 690 kg");
    EXPECT_EQ(id, make_candidate_id(url, ExtractionMethod::Regex, "operating_weight_kg", span, "Operating weight 623 690 kg"));

    EXPECT_NE(id, make_candidate_id(url + "?x", ExtractionMethod::Regex, "operating_weight_kg", span, "Operating weight 623 690 kg"));
    EXPECT_NE(id, make_candidate_id(url, ExtractionMethod::TableCell, "operating_weight_kg", span, "Operating weight 623 690 kg"));
    EXPECT_NE(id, make_candidate_id(url, ExtractionMethod::Regex, "empty_weight_kg", span, "Operating weight 623 690 kg"));

    MatchedSpan moved = span;
    moved.offset = 11;
    EXPECT_NE(id, make_candidate_id(url, ExtractionMethod::Regex, "operating_weight_kg", moved, "Operating weight 623 690 kg"));
}
