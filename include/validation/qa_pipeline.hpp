/**
 * @file qa_pipeline.hpp
 * @brief Physical sanity checks applied to reconciled records before persistence
 */

#pragma once

#include <config/settings.hpp>
#include <core/types.hpp>
#include <string>
#include <vector>

namespace MineSpec {

/**
 * @brief Outcome of one check
 *
 * accepted is false only for rejected records. Flagged records pass through
 * with their status untouched.
 */
struct QaResult {
    bool accepted = true;
    ValidatedSpec spec;
    std::string reason;
};

struct QaReport {
    std::vector<QaResult> results;
    double completeness = 0.0;           // validated core parameters / core parameters
    std::vector<std::string> missing;    // core parameters without a validated record
};

struct CurveCheck {
    bool accepted = true;
    std::vector<std::string> issues;     // reasons for rejection
    std::vector<std::string> warnings;   // monotonicity violations
};

/**
 * @brief QA Pipeline
 *
 * A validated numeric record must be positive and lie inside
 * [min / slack_factor, max * slack_factor] of the parameter's plausibility
 * bounds for the equipment class. A validated text record must not be a
 * placeholder. Failing records become rejected whatever their confidence.
 */
class QaPipeline {
public:
    explicit QaPipeline(const Settings& settings);

    QaResult check(const ValidatedSpec& spec, EquipmentClass cls = EquipmentClass::Unspecified) const;

    /**
     * @brief Check every record of one model, then the cross-parameter rules
     *
     * empty_weight_kg must stay below operating_weight_kg when both are
     * validated; otherwise the empty weight record is rejected.
     */
    QaReport check_all(const std::vector<ValidatedSpec>& specs,
                       EquipmentClass cls = EquipmentClass::Unspecified) const;

    CurveCheck check_curve(const RimpullCurve& curve) const;

private:
    static QaResult reject(const ValidatedSpec& spec, const std::string& reason);

    Settings settings_;
};

} // namespace MineSpec
