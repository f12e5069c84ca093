#pragma once
// =============================================================================
// PolicyConfig.hpp - Every business threshold of the scoring pipeline
// =============================================================================
// Defaults are the agreed production values. Each one can be overridden from
// the INI file; fromConfig() validates the result and throws
// ConfigError naming the offending key.
//
// Thresholds are defined HERE ONLY. Components receive their sub-struct by
// value at construction and never re-declare a boundary.
// =============================================================================

#include <string>
#include <vector>

namespace vigil::config {

class ConfigLoader;

struct FeaturePolicy {
    double zscore_epsilon = 1e-6;
    double default_age_years = 33.0;
    double merchant_default_frequency = 1.0;   // unseen merchant = rare
    double category_default_frequency = 0.0;   // 0 = median of category table
    std::vector<std::string> high_risk_categories = {
        "grocery_pos", "shopping_net", "gas_transport"};
    std::string reference_time = "2020-01-01T00:00:00";   // missing timestamps only
};

struct AnomalyPolicy {
    double zscore_threshold = 3.0;
    double zscore_high = 5.0;
    int night_start_hour = 23;      // night window is [start, 24) U [0, end]
    int night_end_hour = 6;
    double distance_km = 80.0;
    double distance_high_km = 500.0;
    double benford_min_expected = 0.05;
};

struct EnsemblePolicy {
    double decision_threshold = 0.5;
    double high_agreement_spread = 0.10;
    double moderate_agreement_spread = 0.30;
};

struct RiskPolicy {
    double model_weight = 50.0;
    double points_high = 20.0;
    double points_medium = 10.0;
    double points_low = 5.0;
    double anomaly_cap = 40.0;
    double business_bonus = 10.0;
    double business_cap = 10.0;

    double large_amount = 10000.0;
    long new_customer_max_count = 1;
    long velocity_max_1h = 3;
    long velocity_max_24h = 15;

    double extreme_zscore = 1000.0;
    int override_score = 99;

    // Category bands: LOW <= low_max < MEDIUM <= medium_max < HIGH <= high_max < CRITICAL
    int low_max = 30;
    int medium_max = 60;
    int high_max = 85;
};

struct DecisionThresholds {
    int approve_below = 30;
    int block_above = 90;
};

struct PolicyConfig {
    FeaturePolicy features;
    AnomalyPolicy anomaly;
    EnsemblePolicy ensemble;
    RiskPolicy risk;
    DecisionThresholds decision;
    std::string manifest_path = "artifacts/model_registry.json";

    static PolicyConfig fromConfig(const ConfigLoader& cfg);
    void validate() const;
};

} // namespace vigil::config
