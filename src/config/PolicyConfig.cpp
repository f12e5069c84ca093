#include "vigil/config/PolicyConfig.hpp"
#include "vigil/config/ConfigLoader.hpp"
#include "vigil/core/Errors.hpp"
#include "vigil/core/Time.hpp"

#include <cmath>

namespace vigil::config {

namespace {

void require(bool ok, const char* key, const std::string& why) {
    if (!ok) throw ConfigError(std::string("policy ") + key + ": " + why);
}

} // namespace

PolicyConfig PolicyConfig::fromConfig(const ConfigLoader& cfg) {
    PolicyConfig p;

    FeaturePolicy& f = p.features;
    f.zscore_epsilon = cfg.getDouble("features", "zscore_epsilon", f.zscore_epsilon);
    f.default_age_years = cfg.getDouble("features", "default_age_years", f.default_age_years);
    f.merchant_default_frequency =
        cfg.getDouble("features", "merchant_default_frequency", f.merchant_default_frequency);
    f.category_default_frequency =
        cfg.getDouble("features", "category_default_frequency", f.category_default_frequency);
    f.high_risk_categories = cfg.getList("features", "high_risk_categories", f.high_risk_categories);
    f.reference_time = cfg.get("features", "reference_time", f.reference_time);

    AnomalyPolicy& a = p.anomaly;
    a.zscore_threshold = cfg.getDouble("anomaly", "zscore_threshold", a.zscore_threshold);
    a.zscore_high = cfg.getDouble("anomaly", "zscore_high", a.zscore_high);
    a.night_start_hour = cfg.getInt("anomaly", "night_start_hour", a.night_start_hour);
    a.night_end_hour = cfg.getInt("anomaly", "night_end_hour", a.night_end_hour);
    a.distance_km = cfg.getDouble("anomaly", "distance_km", a.distance_km);
    a.distance_high_km = cfg.getDouble("anomaly", "distance_high_km", a.distance_high_km);
    a.benford_min_expected = cfg.getDouble("anomaly", "benford_min_expected", a.benford_min_expected);

    EnsemblePolicy& e = p.ensemble;
    e.decision_threshold = cfg.getDouble("ensemble", "decision_threshold", e.decision_threshold);
    e.high_agreement_spread =
        cfg.getDouble("ensemble", "high_agreement_spread", e.high_agreement_spread);
    e.moderate_agreement_spread =
        cfg.getDouble("ensemble", "moderate_agreement_spread", e.moderate_agreement_spread);

    RiskPolicy& r = p.risk;
    r.model_weight = cfg.getDouble("risk", "model_weight", r.model_weight);
    r.points_high = cfg.getDouble("risk", "points_high", r.points_high);
    r.points_medium = cfg.getDouble("risk", "points_medium", r.points_medium);
    r.points_low = cfg.getDouble("risk", "points_low", r.points_low);
    r.anomaly_cap = cfg.getDouble("risk", "anomaly_cap", r.anomaly_cap);
    r.business_bonus = cfg.getDouble("risk", "business_bonus", r.business_bonus);
    r.business_cap = cfg.getDouble("risk", "business_cap", r.business_cap);
    r.large_amount = cfg.getDouble("risk", "large_amount", r.large_amount);
    r.new_customer_max_count =
        cfg.getInt("risk", "new_customer_max_count", static_cast<int>(r.new_customer_max_count));
    r.velocity_max_1h = cfg.getInt("risk", "velocity_max_1h", static_cast<int>(r.velocity_max_1h));
    r.velocity_max_24h =
        cfg.getInt("risk", "velocity_max_24h", static_cast<int>(r.velocity_max_24h));
    r.extreme_zscore = cfg.getDouble("risk", "extreme_zscore", r.extreme_zscore);
    r.override_score = cfg.getInt("risk", "override_score", r.override_score);
    r.low_max = cfg.getInt("risk", "low_max", r.low_max);
    r.medium_max = cfg.getInt("risk", "medium_max", r.medium_max);
    r.high_max = cfg.getInt("risk", "high_max", r.high_max);

    DecisionThresholds& d = p.decision;
    d.approve_below = cfg.getInt("decision", "approve_below", d.approve_below);
    d.block_above = cfg.getInt("decision", "block_above", d.block_above);

    p.manifest_path = cfg.get("artifacts", "manifest", p.manifest_path);

    p.validate();
    return p;
}

void PolicyConfig::validate() const {
    require(features.zscore_epsilon > 0.0 && std::isfinite(features.zscore_epsilon),
            "features.zscore_epsilon", "must be a small positive number");
    require(features.default_age_years > 0.0, "features.default_age_years", "must be positive");
    require(features.merchant_default_frequency >= 0.0, "features.merchant_default_frequency",
            "must be >= 0");
    require(features.category_default_frequency >= 0.0, "features.category_default_frequency",
            "must be >= 0");
    try {
        parseTimestamp(features.reference_time);
    } catch (const InvalidInputError& e) {
        throw ConfigError(std::string("policy features.reference_time: ") + e.what());
    }

    require(anomaly.zscore_threshold > 0.0, "anomaly.zscore_threshold", "must be positive");
    require(anomaly.zscore_high >= anomaly.zscore_threshold, "anomaly.zscore_high",
            "must be >= zscore_threshold");
    require(anomaly.night_start_hour >= 0 && anomaly.night_start_hour <= 23,
            "anomaly.night_start_hour", "must be 0..23");
    require(anomaly.night_end_hour >= 0 && anomaly.night_end_hour <= 23,
            "anomaly.night_end_hour", "must be 0..23");
    require(anomaly.distance_km >= 0.0, "anomaly.distance_km", "must be >= 0");
    require(anomaly.distance_high_km >= anomaly.distance_km, "anomaly.distance_high_km",
            "must be >= distance_km");
    require(anomaly.benford_min_expected > 0.0 && anomaly.benford_min_expected < 1.0,
            "anomaly.benford_min_expected", "must be in (0,1)");

    require(ensemble.decision_threshold > 0.0 && ensemble.decision_threshold < 1.0,
            "ensemble.decision_threshold", "must be in (0,1)");
    require(ensemble.high_agreement_spread >= 0.0 &&
                ensemble.moderate_agreement_spread >= ensemble.high_agreement_spread,
            "ensemble.moderate_agreement_spread", "must be >= high_agreement_spread >= 0");

    require(risk.model_weight >= 0.0 && risk.model_weight <= 100.0, "risk.model_weight",
            "must be in [0,100]");
    require(risk.points_high >= 0.0 && risk.points_medium >= 0.0 && risk.points_low >= 0.0,
            "risk.points_*", "must be >= 0");
    require(risk.anomaly_cap >= 0.0, "risk.anomaly_cap", "must be >= 0");
    require(risk.business_bonus >= 0.0, "risk.business_bonus", "must be >= 0");
    require(risk.business_cap >= 0.0, "risk.business_cap", "must be >= 0");
    require(risk.extreme_zscore > anomaly.zscore_high, "risk.extreme_zscore",
            "must exceed anomaly.zscore_high");
    require(risk.override_score >= 0 && risk.override_score <= 100, "risk.override_score",
            "must be in [0,100]");
    require(risk.low_max >= 0 && risk.low_max < risk.medium_max, "risk.low_max",
            "must be >= 0 and < medium_max");
    require(risk.medium_max < risk.high_max, "risk.medium_max", "must be < high_max");
    require(risk.high_max < 100, "risk.high_max", "must be < 100");

    require(decision.approve_below >= 0 && decision.approve_below <= decision.block_above,
            "decision.approve_below", "must be in [0, block_above]");
    require(decision.block_above <= 100, "decision.block_above", "must be <= 100");
}

} // namespace vigil::config
