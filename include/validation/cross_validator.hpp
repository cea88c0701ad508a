/**
 * @file cross_validator.hpp
 * @brief Confidence-weighted clustering of candidates into one record per key
 */

#pragma once

#include <config/settings.hpp>
#include <core/types.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace MineSpec {

/**
 * @brief Candidates whose values agree within the parameter tolerance
 */
struct CandidateCluster {
    std::vector<const ScoredCandidate*> members; // sorted by value, then id
    double mass = 0.0;                           // sum of member confidences
    std::set<SourceTier> tiers;
    std::string text_key;                        // text parameters only

    double min_value() const;
    double max_value() const;
};

/**
 * @brief Cross-Validator
 *
 * For each (brand, model, parameter):
 *  1. Numeric candidates are sorted by unit and value; a candidate joins the
 *     open cluster while (max - min) <= tol * (|max| + |min|). Text candidates
 *     cluster on their lowercase alphanumeric form.
 *  2. Highest mass wins. Equal mass: more distinct source tiers, then more
 *     candidates, then the smaller value (or key).
 *  3. Validated when the winner's mass and its best candidate exceed the
 *     acceptance threshold, every other cluster stays within
 *     disagreement_ratio of the winner's mass, no losing candidate exceeds the
 *     acceptance threshold, and a numeric winner carries a canonical unit.
 *     Otherwise flagged.
 *  4. Losing clusters above the visibility threshold are listed as conflicts.
 *
 * Input order does not matter; duplicate candidate ids are counted once.
 */
class CrossValidator {
public:
    explicit CrossValidator(const Settings& settings);

    /**
     * @brief One record per distinct key, ordered by key
     */
    std::vector<ValidatedSpec> reconcile(const std::vector<ScoredCandidate>& candidates) const;

    /**
     * @return nullopt for an empty group
     */
    std::optional<ValidatedSpec> reconcile_group(const SpecKey& key,
                                                 std::vector<ScoredCandidate> group) const;

    /**
     * @brief Clusters of one group, heaviest first after tie-breaks
     */
    std::vector<CandidateCluster> cluster(const std::string& parameter,
                                          const std::vector<ScoredCandidate>& group) const;

    /**
     * @brief Consolidate the curves extracted for a model, gear by gear
     *
     * Sources are ranked by tier weight, then most points, then fewest
     * violations, then source URL; the best one names the result. Within each
     * gear, sources whose peak force lies within curve_tolerance_pct of a
     * cluster mean agree. The cluster with the most tier weight wins and its
     * points are averaged by tier weight when every member has the same number
     * of points, otherwise the best-ranked member's points are used. Outlier
     * sources are logged. A gear only one source reports is taken as is.
     */
    std::optional<RimpullCurve> reconcile_curves(std::vector<RimpullCurve> curves) const;

private:
    Settings settings_;
};

} // namespace MineSpec
