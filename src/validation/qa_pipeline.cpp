/**
 * @file qa_pipeline.cpp
 * @brief QA checks
 */

#include <validation/qa_pipeline.hpp>
#include <core/parameters.hpp>
#include <extraction/value_parser.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <set>
#include <sstream>

namespace MineSpec {

namespace {

constexpr double MIN_CURVE_FORCE_KN = 50.0;
constexpr double MAX_CURVE_FORCE_KN = 3000.0;

std::string fmt(double v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

std::string describe(const ValidatedSpec& spec) {
    std::string s = spec.brand + " " + spec.model + " " + spec.parameter + " = " + format_value(spec.value);
    if (spec.unit) s += " " + *spec.unit;
    return s;
}

} // namespace

QaPipeline::QaPipeline(const Settings& settings) : settings_(settings) {}

QaResult QaPipeline::reject(const ValidatedSpec& spec, const std::string& reason) {
    QaResult result;
    result.accepted = false;
    result.spec = spec;
    result.spec.status = SpecStatus::Rejected;
    result.spec.reason = reason;
    result.reason = reason;
    Logger::warn("QA rejected " + describe(spec) + ": " + reason);
    return result;
}

QaResult QaPipeline::check(const ValidatedSpec& spec, EquipmentClass cls) const {
    QaResult pass{true, spec, ""};

    if (spec.status == SpecStatus::Rejected) {
        pass.accepted = false;
        pass.reason = spec.reason;
        return pass;
    }
    if (spec.status == SpecStatus::Flagged) return pass;

    if (!std::holds_alternative<double>(spec.value)) {
        const auto& text = std::get<std::string>(spec.value);
        if (trim_copy(text).empty() || is_placeholder(text)) {
            return reject(spec, "placeholder value '" + text + "'");
        }
        return pass;
    }

    double value = std::get<double>(spec.value);
    if (!(value > 0.0)) {
        return reject(spec, "value " + fmt(value) + " must be greater than 0");
    }

    Bounds bounds = settings_.bounds_for(spec.parameter, cls);
    if (bounds.max > bounds.min) {
        double slack = settings_.qa.slack_factor;
        double lo = bounds.min / slack;
        double hi = bounds.max * slack;
        if (value < lo) {
            return reject(spec, "value " + fmt(value) + " below lower bound " + fmt(lo) +
                                    " (min " + fmt(bounds.min) + " / " + fmt(slack) + ")");
        }
        if (value > hi) {
            return reject(spec, "value " + fmt(value) + " above upper bound " + fmt(hi) +
                                    " (max " + fmt(bounds.max) + " x " + fmt(slack) + ")");
        }
    }
    return pass;
}

QaReport QaPipeline::check_all(const std::vector<ValidatedSpec>& specs, EquipmentClass cls) const {
    QaReport report;
    report.results.reserve(specs.size());
    for (const auto& spec : specs) report.results.push_back(check(spec, cls));

    auto find = [&](const std::string& parameter) -> QaResult* {
        for (auto& r : report.results) {
            if (r.spec.parameter == parameter) return &r;
        }
        return nullptr;
    };

    if (settings_.qa.enforce_weight_order) {
        QaResult* empty = find("empty_weight_kg");
        QaResult* operating = find("operating_weight_kg");
        if (empty && operating &&
            empty->spec.status == SpecStatus::Validated && operating->spec.status == SpecStatus::Validated) {
            double e = std::get<double>(empty->spec.value);
            double o = std::get<double>(operating->spec.value);
            if (e >= o) {
                *empty = reject(empty->spec, "empty weight " + fmt(e) + " kg not below operating weight " +
                                                 fmt(o) + " kg");
            }
        }
    }

    std::set<std::string> validated;
    for (const auto& r : report.results) {
        if (r.spec.status == SpecStatus::Validated) validated.insert(r.spec.parameter);
    }
    auto core = ParameterCatalog::builtin().core_parameters(cls);
    size_t present = 0;
    for (const auto& name : core) {
        if (validated.count(name)) {
            ++present;
        } else {
            report.missing.push_back(name);
        }
    }
    report.completeness = core.empty() ? 0.0 : static_cast<double>(present) / core.size();
    return report;
}

CurveCheck QaPipeline::check_curve(const RimpullCurve& curve) const {
    CurveCheck out;
    if (curve.points.size() < 2) {
        out.issues.push_back("curve has " + std::to_string(curve.points.size()) + " point(s), need at least 2");
    }
    for (const auto& p : curve.points) {
        if (p.force_kn < MIN_CURVE_FORCE_KN || p.force_kn > MAX_CURVE_FORCE_KN) {
            out.issues.push_back("gear " + std::to_string(p.gear) + " force " + fmt(p.force_kn) +
                                 " kN outside [" + fmt(MIN_CURVE_FORCE_KN) + ", " + fmt(MAX_CURVE_FORCE_KN) + "]");
        }
    }
    out.warnings = curve.violations;
    out.accepted = out.issues.empty();
    if (!out.accepted) {
        Logger::warn("QA rejected rimpull curve for " + curve.brand + " " + curve.model + ": " + out.issues.front());
    }
    return out;
}

} // namespace MineSpec
