/**
 * @file settings.hpp
 * @brief Externally supplied thresholds, weights, bounds and unit table
 */

#pragma once

#include <core/parameters.hpp>
#include <core/types.hpp>
#include <core/units.hpp>
#include <map>
#include <stdexcept>
#include <string>

namespace MineSpec {

/**
 * @brief Raised when a configuration value is missing, mistyped or out of bounds
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ReconciliationSettings {
    double acceptance_threshold = 0.6;
    double disagreement_ratio = 0.5;   // losing cluster mass relative to the winner
    double visibility_threshold = 0.2; // clusters below this mass are dropped from conflicts
    double default_tolerance_pct = 2.0;
    double curve_tolerance_pct = 10.0; // per-gear rimpull force agreement
};

struct ScoringSettings {
    std::map<SourceTier, double> tier_weights = {
        {SourceTier::OemPrimary, 1.0},
        {SourceTier::OemSecondary, 0.85},
        {SourceTier::Dealer, 0.7},
        {SourceTier::ThirdParty, 0.55},
        {SourceTier::Unknown, 0.4},
    };
    std::map<ExtractionMethod, double> method_weights = {
        {ExtractionMethod::Regex, 0.7},
        {ExtractionMethod::TableCell, 1.0},
        {ExtractionMethod::RimpullTable, 1.0},
    };
    double tier_signal = 0.5;
    double method_signal = 0.2;
    double plausibility_signal = 0.3;
    double out_of_range_factor = 0.25;
    double unknown_unit_plausibility = 0.5;
};

struct ParameterLimits {
    Bounds bounds;
    double tolerance_pct = 2.0;
    std::map<EquipmentClass, Bounds> class_bounds;
};

struct QaSettings {
    double slack_factor = 10.0;
    bool enforce_weight_order = true;
};

struct GateSettings {
    bool respect_robots = true;
    int robots_ttl_seconds = 3600;
    size_t max_url_length = 2048;
    std::string user_agent = "MiningEquipResearch/1.0";
};

struct ExtractionSettings {
    size_t max_text_length = 200000;
    size_t max_hits_per_anchor = 64;
};

struct PipelineSettings {
    int workers = 4;
    int per_domain_concurrency = 2;
    int fetch_timeout_seconds = 30;
    int max_retries = 3;
    int backoff_base_ms = 500;
    int backoff_cap_ms = 8000;
};

/**
 * @brief Complete runtime configuration
 *
 * defaults() seeds parameter limits from the built-in catalog and units from
 * the built-in table; YAML overrides any subset.
 */
class Settings {
public:
    ReconciliationSettings reconciliation;
    ScoringSettings scoring;
    std::map<std::string, ParameterLimits> parameters;
    UnitTable units;
    QaSettings qa;
    GateSettings gate;
    ExtractionSettings extraction;
    PipelineSettings pipeline;
    std::string log_level = "info";
    std::string database_conninfo; // empty: libpq environment variables

    static Settings defaults();

    /**
     * @throws ConfigError on unreadable files, YAML syntax errors and bound violations
     */
    static Settings load_file(const std::string& path);
    static Settings load_string(const std::string& yaml);

    /**
     * @throws ConfigError naming the first violated bound
     */
    void validate() const;

    /**
     * @brief Plausibility bounds, class override first
     */
    Bounds bounds_for(const std::string& parameter, EquipmentClass cls) const;

    double tolerance_for(const std::string& parameter) const;
};

} // namespace MineSpec
