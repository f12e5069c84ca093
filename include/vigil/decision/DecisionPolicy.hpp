#pragma once
// =============================================================================
// DecisionPolicy.hpp - RiskScore + anomalies + prediction -> final action
// =============================================================================
// Stateless. Inputs fully determine the output.
//
//   BLOCK          score > block_above, or the extreme-deviation override fired
//   APPROVE        score < approve_below and no HIGH-severity anomaly
//   MANUAL_REVIEW  everything else
//
// decide() never throws. An internal failure downgrades to MANUAL_REVIEW
// with confidence 0 and a "System Error: <kind>" key factor.
// =============================================================================

#include "vigil/anomaly/AnomalyDetector.hpp"
#include "vigil/config/PolicyConfig.hpp"
#include "vigil/core/Types.hpp"
#include "vigil/ml/EnsemblePredictor.hpp"
#include "vigil/risk/RiskScorer.hpp"

#include <string>
#include <vector>

namespace vigil::decision {

struct Decision {
    Action action = Action::MANUAL_REVIEW;
    int confidence = 0;                 // 0..100
    std::string reasoning;
    std::vector<std::string> key_factors;
    std::vector<std::string> recommended_actions;
    RiskLevel alert_level = RiskLevel::LOW;
    bool system_error = false;

    bool operator==(const Decision& o) const;
};

class DecisionPolicy {
public:
    explicit DecisionPolicy(config::DecisionThresholds thresholds);

    Decision decide(const risk::RiskScore& score,
                    const anomaly::AnomalyReport& anomalies,
                    const ml::EnsemblePrediction& prediction) const noexcept;

    static Decision systemError(const std::string& kind, const std::string& detail);
    static std::vector<std::string> recommendedActions(Action action);

private:
    Decision decideUnchecked(const risk::RiskScore& score,
                             const anomaly::AnomalyReport& anomalies,
                             const ml::EnsemblePrediction& prediction) const;
    static std::vector<std::string> keyFactors(const risk::RiskScore& score,
                                               const anomaly::AnomalyReport& anomalies,
                                               const ml::EnsemblePrediction& prediction);

    config::DecisionThresholds thresholds_;
};

} // namespace vigil::decision
