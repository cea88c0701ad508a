/**
 * @file json_report.hpp
 * @brief JSON rendering of reconciled records, rimpull curves and run reports
 *
 * Consumed by report generators outside this project. Numeric values stay
 * numbers; text values stay strings; a missing unit is null.
 */

#pragma once

#include <core/types.hpp>
#include <pipeline/spec_pipeline.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace MineSpec {

nlohmann::json to_json(const ValidatedSpec& spec);
nlohmann::json to_json(const RimpullCurve& curve);
nlohmann::json to_json(const RunReport& report);

/**
 * @brief One model's published view: visible records plus the chosen curve
 */
nlohmann::json model_to_json(const std::string& brand, const std::string& model,
                             const std::vector<ValidatedSpec>& specs,
                             const std::optional<RimpullCurve>& curve);

} // namespace MineSpec
