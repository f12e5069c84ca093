#include "vigil/decision/DecisionPolicy.hpp"
#include "vigil/core/Errors.hpp"

#include <algorithm>
#include <cstdio>
#include <iostream>

namespace vigil::decision {

namespace {

std::string formatted(const char* f, double v) {
    char buf[512];
    std::snprintf(buf, sizeof(buf), f, v);
    return buf;
}

} // namespace

bool Decision::operator==(const Decision& o) const {
    return action == o.action && confidence == o.confidence && reasoning == o.reasoning &&
           key_factors == o.key_factors && recommended_actions == o.recommended_actions &&
           alert_level == o.alert_level && system_error == o.system_error;
}

DecisionPolicy::DecisionPolicy(config::DecisionThresholds thresholds)
    : thresholds_(thresholds) {}

std::vector<std::string> DecisionPolicy::recommendedActions(Action action) {
    switch (action) {
        case Action::BLOCK:
            return {"Block transaction immediately", "Send SMS verification to customer",
                    "Alert fraud investigation team", "Freeze card temporarily"};
        case Action::MANUAL_REVIEW:
            return {"Queue for manual review", "Contact customer via app",
                    "Flag in fraud dashboard"};
        case Action::APPROVE:
            return {"Approve transaction", "Log for later review"};
        default:
            return {};
    }
}

Decision DecisionPolicy::systemError(const std::string& kind, const std::string& detail) {
    Decision d;
    d.action = Action::MANUAL_REVIEW;
    d.confidence = 0;
    d.system_error = true;
    d.alert_level = RiskLevel::MEDIUM;
    d.key_factors.push_back("System Error: " + kind);
    d.reasoning = "Automated scoring failed (" + kind + "): " + detail +
                  ". Routed to manual review.";
    d.recommended_actions = recommendedActions(Action::MANUAL_REVIEW);
    return d;
}

std::vector<std::string> DecisionPolicy::keyFactors(const risk::RiskScore& score,
                                                    const anomaly::AnomalyReport& anomalies,
                                                    const ml::EnsemblePrediction& prediction) {
    std::vector<std::string> out;

    if (score.override_applied && score.override_zscore) {
        out.push_back(formatted("Extreme deviation: amount z-score %.0f", *score.override_zscore));
    } else if (anomalies.amount.is_anomaly && anomalies.amount_z_score) {
        out.push_back(formatted("Amount z-score: %.2f", *anomalies.amount_z_score));
    }
    if (anomalies.distance_km && *anomalies.distance_km > 1000.0) {
        out.push_back(formatted("Distance: %.0f km", *anomalies.distance_km));
    }

    for (const auto* rec : {&anomalies.amount, &anomalies.time, &anomalies.location, &anomalies.digit}) {
        if (!rec->is_anomaly) continue;
        out.push_back(std::string(anomaly::dimensionToStr(rec->dimension)) + " anomaly (" +
                      severityToStr(rec->severity) + "): " + rec->explanation);
    }

    if (prediction.available) {
        out.push_back(formatted("Model fraud probability: %.2f%%", prediction.probability * 100.0));
    } else {
        out.push_back("Model prediction unavailable: anomaly-only scoring");
    }
    for (const auto& f : prediction.failures) {
        out.push_back("Model excluded: " + f.model + " (" + f.reason + ")");
    }
    return out;
}

Decision DecisionPolicy::decideUnchecked(const risk::RiskScore& score,
                                         const anomaly::AnomalyReport& anomalies,
                                         const ml::EnsemblePrediction& prediction) const {
    if (score.total < 0 || score.total > 100) {
        throw VigilError("risk score " + std::to_string(score.total) + " outside [0, 100]");
    }

    Decision d;
    const bool high_anomaly = anomalies.hasSeverity(Severity::HIGH);

    if (score.total > thresholds_.block_above || score.override_applied) {
        d.action = Action::BLOCK;
        d.confidence = score.total;
        d.reasoning = "CRITICAL FRAUD RISK (score " + std::to_string(score.total) + "/100).";
        if (score.override_applied) d.reasoning += " Amount far outside the customer baseline; model bypassed.";
    } else if (score.total < thresholds_.approve_below && !high_anomaly) {
        d.action = Action::APPROVE;
        d.confidence = 100 - score.total;
        d.reasoning = "LOW RISK (score " + std::to_string(score.total) +
                      "/100). Transaction appears legitimate.";
    } else {
        d.action = Action::MANUAL_REVIEW;
        d.confidence = 50;
        d.reasoning = "SUSPICIOUS ACTIVITY (score " + std::to_string(score.total) + "/100).";
        if (high_anomaly) d.reasoning += " High-severity anomaly present.";
        d.reasoning += " Manual verification required.";
    }

    if (score.model_unavailable) d.confidence /= 2;
    d.confidence = std::clamp(d.confidence, 0, 100);

    d.key_factors = keyFactors(score, anomalies, prediction);
    d.recommended_actions = recommendedActions(d.action);
    d.alert_level = score.category;
    return d;
}

Decision DecisionPolicy::decide(const risk::RiskScore& score,
                                const anomaly::AnomalyReport& anomalies,
                                const ml::EnsemblePrediction& prediction) const noexcept {
    try {
        return decideUnchecked(score, anomalies, prediction);
    } catch (const VigilError& e) {
        std::cerr << "[DECISION] System error, routing to manual review: " << e.what() << "\n";
        return systemError(e.kind(), e.what());
    } catch (const std::exception& e) {
        std::cerr << "[DECISION] System error, routing to manual review: " << e.what() << "\n";
        return systemError("InternalError", e.what());
    }
}

} // namespace vigil::decision
