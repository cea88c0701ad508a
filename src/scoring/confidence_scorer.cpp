/**
 * @file confidence_scorer.cpp
 * @brief Confidence scoring
 */

#include <scoring/confidence_scorer.hpp>
#include <core/parameters.hpp>
#include <algorithm>
#include <cmath>

namespace MineSpec {

ConfidenceScorer::ConfidenceScorer(const Settings& settings)
    : scoring_(settings.scoring), settings_(settings) {}

std::optional<bool> ConfidenceScorer::in_range(const ExtractionCandidate& candidate, EquipmentClass cls) const {
    if (!candidate.is_numeric()) return std::nullopt;

    const ParameterSpec* spec = ParameterCatalog::builtin().find(candidate.parameter);
    if (!spec) return std::nullopt;
    if (spec->kind == ParameterKind::Numeric && !candidate.unit) return std::nullopt;

    return settings_.bounds_for(candidate.parameter, cls).contains(candidate.number());
}

ScoredCandidate ConfidenceScorer::score(const ExtractionCandidate& candidate, SourceTier tier,
                                        EquipmentClass cls) const {
    auto weight = [](const auto& table, auto key) {
        auto it = table.find(key);
        return it == table.end() ? 0.0 : it->second;
    };

    const ParameterSpec* spec = ParameterCatalog::builtin().find(candidate.parameter);
    bool unit_missing = candidate.is_numeric() && spec && spec->kind == ParameterKind::Numeric && !candidate.unit;

    double plausibility = unit_missing ? scoring_.unknown_unit_plausibility : 1.0;
    double base = scoring_.tier_signal * weight(scoring_.tier_weights, tier) +
                  scoring_.method_signal * weight(scoring_.method_weights, candidate.method) +
                  scoring_.plausibility_signal * plausibility;

    auto range = in_range(candidate, cls);
    if (range && !*range) base *= scoring_.out_of_range_factor;

    double confidence = std::round(std::clamp(base, 0.0, 1.0) * 1000.0) / 1000.0;
    return ScoredCandidate{candidate, confidence, tier};
}

} // namespace MineSpec
