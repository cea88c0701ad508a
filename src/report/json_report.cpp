/**
 * @file json_report.cpp
 * @brief JSON rendering of reconciled records and run reports
 */

#include <report/json_report.hpp>

namespace MineSpec {

namespace {

nlohmann::json value_json(const SpecValue& value) {
    if (const double* d = std::get_if<double>(&value)) return *d;
    return std::get<std::string>(value);
}

} // namespace

nlohmann::json to_json(const ValidatedSpec& spec) {
    nlohmann::json j;
    j["brand"] = spec.brand;
    j["model"] = spec.model;
    j["parameter"] = spec.parameter;
    j["value"] = value_json(spec.value);
    j["unit"] = spec.unit ? nlohmann::json(*spec.unit) : nlohmann::json(nullptr);
    j["confidence"] = spec.confidence;
    j["status"] = to_string(spec.status);
    j["supporting_candidates"] = spec.supporting_candidates;
    j["conflicting_candidates"] = spec.conflicting_candidates;
    if (!spec.reason.empty()) j["reason"] = spec.reason;
    return j;
}

nlohmann::json to_json(const RimpullCurve& curve) {
    nlohmann::json points = nlohmann::json::array();
    for (const auto& p : curve.points) {
        points.push_back({{"gear", p.gear}, {"speed_kph", p.speed_kph}, {"force_kn", p.force_kn}});
    }

    nlohmann::json j;
    j["brand"] = curve.brand;
    j["model"] = curve.model;
    j["source_url"] = curve.source_url;
    j["tier"] = to_string(curve.tier);
    j["points"] = std::move(points);
    j["max_force_kn"] = curve.points.empty() ? nlohmann::json(nullptr) : nlohmann::json(curve.max_force_kn());
    j["monotonic"] = curve.monotonic();
    j["violations"] = curve.violations;
    return j;
}

nlohmann::json to_json(const RunReport& report) {
    nlohmann::json denials = nlohmann::json::object();
    for (const auto& [reason, count] : report.denials) denials[to_string(reason)] = count;

    nlohmann::json j;
    j["models"] = report.models;
    j["documents"] = report.documents;
    j["fetch_failures"] = report.fetch_failures;
    j["denials"] = std::move(denials);
    j["candidates"] = report.candidates;
    j["validated"] = report.validated;
    j["flagged"] = report.flagged;
    j["rejected"] = report.rejected;
    j["curves"] = report.curves;
    j["failed"] = report.failed_keys;
    j["cancelled"] = report.cancelled_keys;
    return j;
}

nlohmann::json model_to_json(const std::string& brand, const std::string& model,
                             const std::vector<ValidatedSpec>& specs,
                             const std::optional<RimpullCurve>& curve) {
    nlohmann::json records = nlohmann::json::array();
    for (const auto& spec : specs) records.push_back(to_json(spec));

    nlohmann::json j;
    j["brand"] = brand;
    j["model"] = model;
    j["specs"] = std::move(records);
    j["rimpull"] = curve ? to_json(*curve) : nlohmann::json(nullptr);
    return j;
}

} // namespace MineSpec
