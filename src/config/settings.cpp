/**
 * @file settings.cpp
 * @brief YAML loading and bound validation for Settings
 */

#include <config/settings.hpp>
#include <yaml-cpp/yaml.h>
#include <cmath>
#include <set>
#include <sstream>

namespace MineSpec {

namespace {

void require_map(const YAML::Node& node, const std::string& path) {
    if (node && !node.IsNull() && !node.IsMap()) {
        throw ConfigError("Type mismatch at '" + path + "' (expected map)");
    }
}

void reject_unknown_keys(const YAML::Node& node, const std::string& path,
                         const std::set<std::string>& allowed) {
    if (!node || !node.IsMap()) return;
    for (const auto& kv : node) {
        std::string key = kv.first.as<std::string>();
        if (!allowed.count(key)) {
            throw ConfigError("Unknown configuration key '" + (path.empty() ? key : path + "." + key) + "'");
        }
    }
}

template <typename T>
void read_scalar(const YAML::Node& node, const std::string& key, const std::string& path, T& out) {
    const YAML::Node value = node[key];
    if (!value) return;
    if (!value.IsScalar()) {
        throw ConfigError("Type mismatch at '" + path + "." + key + "' (expected scalar)");
    }
    try {
        out = value.as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid value at '" + path + "." + key + "': " + e.what());
    }
}

void check_range(double value, double lo, double hi, const std::string& path,
                 bool lo_open = false) {
    bool ok = std::isfinite(value) && (lo_open ? value > lo : value >= lo) && value <= hi;
    if (!ok) {
        std::ostringstream oss;
        oss << "'" << path << "' = " << value << " is outside " << (lo_open ? "(" : "[")
            << lo << ", " << hi << "]";
        throw ConfigError(oss.str());
    }
}

Bounds read_bounds(const YAML::Node& node, const std::string& path, Bounds current) {
    require_map(node, path);
    reject_unknown_keys(node, path, {"min", "max"});
    read_scalar(node, "min", path, current.min);
    read_scalar(node, "max", path, current.max);
    return current;
}

void apply(Settings& s, const YAML::Node& root) {
    if (!root || root.IsNull()) return;
    if (!root.IsMap()) {
        throw ConfigError("Configuration root must be a map");
    }
    reject_unknown_keys(root, "", {"reconciliation", "scoring", "parameters", "units", "qa",
                                   "gate", "extraction", "pipeline", "logging", "database"});

    if (const YAML::Node r = root["reconciliation"]) {
        require_map(r, "reconciliation");
        reject_unknown_keys(r, "reconciliation", {"acceptance_threshold", "disagreement_ratio",
                                                  "visibility_threshold", "default_tolerance_pct",
                                                  "curve_tolerance_pct"});
        read_scalar(r, "acceptance_threshold", "reconciliation", s.reconciliation.acceptance_threshold);
        read_scalar(r, "disagreement_ratio", "reconciliation", s.reconciliation.disagreement_ratio);
        read_scalar(r, "visibility_threshold", "reconciliation", s.reconciliation.visibility_threshold);
        read_scalar(r, "default_tolerance_pct", "reconciliation", s.reconciliation.default_tolerance_pct);
        read_scalar(r, "curve_tolerance_pct", "reconciliation", s.reconciliation.curve_tolerance_pct);
    }

    if (const YAML::Node sc = root["scoring"]) {
        require_map(sc, "scoring");
        reject_unknown_keys(sc, "scoring", {"tier_weights", "method_weights", "signal_weights",
                                            "out_of_range_factor", "unknown_unit_plausibility"});
        if (const YAML::Node tiers = sc["tier_weights"]) {
            require_map(tiers, "scoring.tier_weights");
            for (const auto& kv : tiers) {
                std::string name = kv.first.as<std::string>();
                auto tier = parse_source_tier(name);
                if (!tier) throw ConfigError("Unknown source tier 'scoring.tier_weights." + name + "'");
                read_scalar(tiers, name, "scoring.tier_weights", s.scoring.tier_weights[*tier]);
            }
        }
        if (const YAML::Node methods = sc["method_weights"]) {
            require_map(methods, "scoring.method_weights");
            for (const auto& kv : methods) {
                std::string name = kv.first.as<std::string>();
                auto method = parse_extraction_method(name);
                if (!method) throw ConfigError("Unknown extraction method 'scoring.method_weights." + name + "'");
                read_scalar(methods, name, "scoring.method_weights", s.scoring.method_weights[*method]);
            }
        }
        if (const YAML::Node sig = sc["signal_weights"]) {
            require_map(sig, "scoring.signal_weights");
            reject_unknown_keys(sig, "scoring.signal_weights", {"tier", "method", "plausibility"});
            read_scalar(sig, "tier", "scoring.signal_weights", s.scoring.tier_signal);
            read_scalar(sig, "method", "scoring.signal_weights", s.scoring.method_signal);
            read_scalar(sig, "plausibility", "scoring.signal_weights", s.scoring.plausibility_signal);
        }
        read_scalar(sc, "out_of_range_factor", "scoring", s.scoring.out_of_range_factor);
        read_scalar(sc, "unknown_unit_plausibility", "scoring", s.scoring.unknown_unit_plausibility);
    }

    if (const YAML::Node params = root["parameters"]) {
        require_map(params, "parameters");
        for (const auto& kv : params) {
            std::string name = kv.first.as<std::string>();
            auto it = s.parameters.find(name);
            if (it == s.parameters.end()) {
                throw ConfigError("Unknown parameter 'parameters." + name + "'");
            }
            const std::string path = "parameters." + name;
            const YAML::Node p = kv.second;
            require_map(p, path);
            reject_unknown_keys(p, path, {"min", "max", "tolerance_pct", "classes"});
            ParameterLimits& limits = it->second;
            read_scalar(p, "min", path, limits.bounds.min);
            read_scalar(p, "max", path, limits.bounds.max);
            read_scalar(p, "tolerance_pct", path, limits.tolerance_pct);
            if (const YAML::Node classes = p["classes"]) {
                require_map(classes, path + ".classes");
                for (const auto& ckv : classes) {
                    std::string cname = ckv.first.as<std::string>();
                    auto cls = parse_equipment_class(cname);
                    if (!cls || *cls == EquipmentClass::Unspecified) {
                        throw ConfigError("Unknown equipment class '" + path + ".classes." + cname + "'");
                    }
                    Bounds base = limits.class_bounds.count(*cls) ? limits.class_bounds[*cls] : limits.bounds;
                    limits.class_bounds[*cls] = read_bounds(ckv.second, path + ".classes." + cname, base);
                }
            }
        }
    }

    if (const YAML::Node units = root["units"]) {
        if (!units.IsSequence()) throw ConfigError("Type mismatch at 'units' (expected sequence)");
        for (size_t i = 0; i < units.size(); ++i) {
            const std::string path = "units[" + std::to_string(i) + "]";
            const YAML::Node u = units[i];
            require_map(u, path);
            reject_unknown_keys(u, path, {"token", "unit", "factor"});
            UnitConversion conv;
            read_scalar(u, "token", path, conv.token);
            read_scalar(u, "unit", path, conv.unit);
            read_scalar(u, "factor", path, conv.factor);
            try {
                s.units.set(conv);
            } catch (const std::invalid_argument& e) {
                throw ConfigError(path + ": " + e.what());
            }
        }
    }

    if (const YAML::Node qa = root["qa"]) {
        require_map(qa, "qa");
        reject_unknown_keys(qa, "qa", {"slack_factor", "enforce_weight_order"});
        read_scalar(qa, "slack_factor", "qa", s.qa.slack_factor);
        read_scalar(qa, "enforce_weight_order", "qa", s.qa.enforce_weight_order);
    }

    if (const YAML::Node g = root["gate"]) {
        require_map(g, "gate");
        reject_unknown_keys(g, "gate", {"respect_robots", "robots_ttl_seconds", "max_url_length", "user_agent"});
        read_scalar(g, "respect_robots", "gate", s.gate.respect_robots);
        read_scalar(g, "robots_ttl_seconds", "gate", s.gate.robots_ttl_seconds);
        read_scalar(g, "max_url_length", "gate", s.gate.max_url_length);
        read_scalar(g, "user_agent", "gate", s.gate.user_agent);
    }

    if (const YAML::Node e = root["extraction"]) {
        require_map(e, "extraction");
        reject_unknown_keys(e, "extraction", {"max_text_length", "max_hits_per_anchor"});
        read_scalar(e, "max_text_length", "extraction", s.extraction.max_text_length);
        read_scalar(e, "max_hits_per_anchor", "extraction", s.extraction.max_hits_per_anchor);
    }

    if (const YAML::Node p = root["pipeline"]) {
        require_map(p, "pipeline");
        reject_unknown_keys(p, "pipeline", {"workers", "per_domain_concurrency", "fetch_timeout_seconds",
                                            "max_retries", "backoff_base_ms", "backoff_cap_ms"});
        read_scalar(p, "workers", "pipeline", s.pipeline.workers);
        read_scalar(p, "per_domain_concurrency", "pipeline", s.pipeline.per_domain_concurrency);
        read_scalar(p, "fetch_timeout_seconds", "pipeline", s.pipeline.fetch_timeout_seconds);
        read_scalar(p, "max_retries", "pipeline", s.pipeline.max_retries);
        read_scalar(p, "backoff_base_ms", "pipeline", s.pipeline.backoff_base_ms);
        read_scalar(p, "backoff_cap_ms", "pipeline", s.pipeline.backoff_cap_ms);
    }

    if (const YAML::Node l = root["logging"]) {
        require_map(l, "logging");
        reject_unknown_keys(l, "logging", {"level"});
        read_scalar(l, "level", "logging", s.log_level);
    }

    if (const YAML::Node d = root["database"]) {
        require_map(d, "database");
        reject_unknown_keys(d, "database", {"conninfo"});
        read_scalar(d, "conninfo", "database", s.database_conninfo);
    }
}

} // namespace

Settings Settings::defaults() {
    Settings s;
    s.units = UnitTable::builtin();
    for (const auto& p : ParameterCatalog::builtin().all()) {
        ParameterLimits limits;
        limits.bounds = p.bounds;
        limits.tolerance_pct = p.tolerance_pct;
        s.parameters[p.name] = limits;
    }
    return s;
}

Settings Settings::load_string(const std::string& yaml) {
    Settings s = defaults();
    try {
        apply(s, YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("YAML error: ") + e.what());
    }
    s.validate();
    return s;
}

Settings Settings::load_file(const std::string& path) {
    Settings s = defaults();
    try {
        apply(s, YAML::LoadFile(path));
    } catch (const YAML::BadFile&) {
        throw ConfigError("Cannot read configuration file: " + path);
    } catch (const YAML::Exception& e) {
        throw ConfigError(path + ": " + e.what());
    }
    s.validate();
    return s;
}

void Settings::validate() const {
    const auto& r = reconciliation;
    check_range(r.acceptance_threshold, 0.0, 1.0, "reconciliation.acceptance_threshold", true);
    check_range(r.disagreement_ratio, 0.0, 1.0, "reconciliation.disagreement_ratio", true);
    check_range(r.visibility_threshold, 0.0, 1.0, "reconciliation.visibility_threshold");
    check_range(r.default_tolerance_pct, 0.0, 50.0, "reconciliation.default_tolerance_pct");
    check_range(r.curve_tolerance_pct, 0.0, 50.0, "reconciliation.curve_tolerance_pct");

    for (SourceTier t : {SourceTier::OemPrimary, SourceTier::OemSecondary, SourceTier::Dealer,
                         SourceTier::ThirdParty, SourceTier::Unknown}) {
        auto it = scoring.tier_weights.find(t);
        if (it == scoring.tier_weights.end()) {
            throw ConfigError("Missing 'scoring.tier_weights." + to_string(t) + "'");
        }
        check_range(it->second, 0.0, 1.0, "scoring.tier_weights." + to_string(t));
    }
    for (ExtractionMethod m : {ExtractionMethod::Regex, ExtractionMethod::TableCell,
                               ExtractionMethod::RimpullTable}) {
        auto it = scoring.method_weights.find(m);
        if (it == scoring.method_weights.end()) {
            throw ConfigError("Missing 'scoring.method_weights." + to_string(m) + "'");
        }
        check_range(it->second, 0.0, 1.0, "scoring.method_weights." + to_string(m));
    }
    check_range(scoring.tier_signal, 0.0, 1.0, "scoring.signal_weights.tier");
    check_range(scoring.method_signal, 0.0, 1.0, "scoring.signal_weights.method");
    check_range(scoring.plausibility_signal, 0.0, 1.0, "scoring.signal_weights.plausibility");
    double sum = scoring.tier_signal + scoring.method_signal + scoring.plausibility_signal;
    if (std::fabs(sum - 1.0) > 1e-6) {
        std::ostringstream oss;
        oss << "'scoring.signal_weights' must sum to 1 (got " << sum << ")";
        throw ConfigError(oss.str());
    }
    check_range(scoring.out_of_range_factor, 0.0, 1.0, "scoring.out_of_range_factor");
    check_range(scoring.unknown_unit_plausibility, 0.0, 1.0, "scoring.unknown_unit_plausibility");

    for (const auto& [name, limits] : parameters) {
        const std::string path = "parameters." + name;
        const ParameterSpec* spec = ParameterCatalog::builtin().find(name);
        if (spec && spec->is_text()) continue;
        if (!(limits.bounds.min < limits.bounds.max)) {
            throw ConfigError("'" + path + "' requires min < max");
        }
        check_range(limits.tolerance_pct, 0.0, 50.0, path + ".tolerance_pct");
        for (const auto& [cls, b] : limits.class_bounds) {
            if (!(b.min < b.max)) {
                throw ConfigError("'" + path + ".classes." + to_string(cls) + "' requires min < max");
            }
        }
    }

    check_range(qa.slack_factor, 1.0, 1000.0, "qa.slack_factor");

    check_range(gate.robots_ttl_seconds, 1, 86400, "gate.robots_ttl_seconds");
    check_range(static_cast<double>(gate.max_url_length), 64, 8192, "gate.max_url_length");
    if (gate.user_agent.empty()) {
        throw ConfigError("'gate.user_agent' must not be empty");
    }

    check_range(static_cast<double>(extraction.max_text_length), 1000, 5000000, "extraction.max_text_length");
    check_range(static_cast<double>(extraction.max_hits_per_anchor), 1, 1024, "extraction.max_hits_per_anchor");

    check_range(pipeline.workers, 1, 64, "pipeline.workers");
    check_range(pipeline.per_domain_concurrency, 1, 16, "pipeline.per_domain_concurrency");
    check_range(pipeline.fetch_timeout_seconds, 1, 300, "pipeline.fetch_timeout_seconds");
    check_range(pipeline.max_retries, 0, 10, "pipeline.max_retries");
    check_range(pipeline.backoff_base_ms, 1, 60000, "pipeline.backoff_base_ms");
    if (pipeline.backoff_cap_ms < pipeline.backoff_base_ms) {
        throw ConfigError("'pipeline.backoff_cap_ms' must be >= 'pipeline.backoff_base_ms'");
    }

    static const std::set<std::string> levels = {"debug", "info", "warning", "error"};
    if (!levels.count(log_level)) {
        throw ConfigError("'logging.level' must be one of debug, info, warning, error (got '" + log_level + "')");
    }
}

Bounds Settings::bounds_for(const std::string& parameter, EquipmentClass cls) const {
    auto it = parameters.find(parameter);
    if (it == parameters.end()) {
        const ParameterSpec* spec = ParameterCatalog::builtin().find(parameter);
        return spec ? spec->bounds : Bounds{};
    }
    auto c = it->second.class_bounds.find(cls);
    if (c != it->second.class_bounds.end()) return c->second;
    return it->second.bounds;
}

double Settings::tolerance_for(const std::string& parameter) const {
    auto it = parameters.find(parameter);
    if (it == parameters.end()) return reconciliation.default_tolerance_pct;
    return it->second.tolerance_pct;
}

} // namespace MineSpec
