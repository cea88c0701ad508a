/**
 * @file confidence_scorer.hpp
 * @brief Deterministic trust score for one candidate
 */

#pragma once

#include <config/settings.hpp>
#include <core/types.hpp>

namespace MineSpec {

/**
 * @brief Confidence Scorer
 *
 *   base       = w_tier * tier_weight + w_method * method_weight + w_plaus * plausibility
 *   confidence = base, or base * out_of_range_factor when the value is outside
 *                the plausible range for the parameter and equipment class
 *
 * plausibility is 1 for a value in a canonical unit, unknown_unit_plausibility
 * when the unit could not be recognized. The result is clamped to [0, 1] and
 * rounded to three decimals so equal inputs give bit-identical output.
 */
class ConfidenceScorer {
public:
    explicit ConfidenceScorer(const Settings& settings);

    ScoredCandidate score(const ExtractionCandidate& candidate, SourceTier tier,
                          EquipmentClass cls = EquipmentClass::Unspecified) const;

    /**
     * @return nullopt when the range cannot be checked (text, unknown unit)
     */
    std::optional<bool> in_range(const ExtractionCandidate& candidate, EquipmentClass cls) const;

private:
    ScoringSettings scoring_;
    Settings settings_;
};

} // namespace MineSpec
