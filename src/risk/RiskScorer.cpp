#include "vigil/risk/RiskScorer.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace vigil::risk {

std::vector<std::string> BusinessRules::active() const {
    std::vector<std::string> out;
    if (large_amount)       out.push_back("large_amount");
    if (high_risk_category) out.push_back("high_risk_category");
    if (new_customer)       out.push_back("new_customer");
    if (velocity_exceeded)  out.push_back("velocity_exceeded");
    return out;
}

BusinessRules BusinessRules::fromFeatures(const features::FeatureSet& f,
                                          const config::RiskPolicy& p) {
    BusinessRules r;
    r.large_amount = f.amount.amt > p.large_amount;
    r.high_risk_category = f.merchant.is_high_risk_cat;
    r.new_customer = !f.behavior.has_history ||
                     f.behavior.cust_tx_count <= static_cast<double>(p.new_customer_max_count);
    r.velocity_exceeded =
        (f.behavior.tx_count_1h && *f.behavior.tx_count_1h > p.velocity_max_1h) ||
        (f.behavior.tx_count_24h && *f.behavior.tx_count_24h > p.velocity_max_24h);
    return r;
}

RiskScorer::RiskScorer(config::RiskPolicy policy)
    : policy_(std::move(policy)) {}

RiskLevel RiskScorer::categorize(int total) const {
    if (total <= policy_.low_max) return RiskLevel::LOW;
    if (total <= policy_.medium_max) return RiskLevel::MEDIUM;
    if (total <= policy_.high_max) return RiskLevel::HIGH;
    return RiskLevel::CRITICAL;
}

bool RiskScorer::isExtremeDeviation(const anomaly::AnomalyReport& anomalies) const {
    return anomalies.amount_z_score &&
           std::fabs(*anomalies.amount_z_score) > policy_.extreme_zscore;
}

double RiskScorer::anomalyPoints(const anomaly::AnomalyReport& a) const {
    double pts = 0.0;
    for (const auto* rec : {&a.amount, &a.time, &a.location, &a.digit}) {
        if (!rec->is_anomaly) continue;
        switch (rec->severity) {
            case Severity::HIGH:   pts += policy_.points_high; break;
            case Severity::MEDIUM: pts += policy_.points_medium; break;
            case Severity::LOW:    pts += policy_.points_low; break;
            default: break;
        }
    }
    return std::min(pts, policy_.anomaly_cap);
}

RiskScore RiskScorer::score(const ml::EnsemblePrediction& prediction,
                            const anomaly::AnomalyReport& anomalies,
                            const BusinessRules& rules) const {
    RiskScore out;
    out.model_unavailable = !prediction.available;

    out.breakdown.anomalies = anomalyPoints(anomalies);
    if (anomalies.countAtLeastMedium() >= 2 || rules.any()) {
        out.breakdown.business = std::min(policy_.business_bonus, policy_.business_cap);
    }

    if (isExtremeDeviation(anomalies)) {
        // Model bypassed: its output on this input is meaningless.
        out.override_applied = true;
        out.override_zscore = *anomalies.amount_z_score;
        out.breakdown.model = 0.0;
        out.total = std::clamp(policy_.override_score, 0, 100);
        out.category = categorize(out.total);
        std::cerr << "[RISK] Extreme-deviation override: amount z-score "
                  << *anomalies.amount_z_score << " > " << policy_.extreme_zscore
                  << ", score pinned to " << out.total << "\n";
        return out;
    }

    if (prediction.available) {
        double p = std::isfinite(prediction.probability) ? prediction.probability : 0.0;
        out.breakdown.model = std::clamp(p * policy_.model_weight, 0.0, policy_.model_weight);
    }

    double raw = out.breakdown.model + out.breakdown.anomalies + out.breakdown.business;
    out.total = static_cast<int>(std::clamp(std::floor(raw), 0.0, 100.0));
    out.category = categorize(out.total);
    return out;
}

} // namespace vigil::risk
