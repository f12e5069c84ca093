#pragma once
// =============================================================================
// RiskScorer.hpp - Ensemble + anomalies + business rules -> 0..100 score
// =============================================================================
// SCORE
//   model      ensemble probability * model_weight, in [0, model_weight];
//              0 and model_unavailable set when prediction is unavailable
//   anomalies  high/medium/low points per triggered anomaly, capped
//   business   bonus when >= 2 anomalies are medium/high or any business
//              flag is set, capped
//   total      floor(model + anomalies + business), clamped to [0, 100]
//
// EXTREME-DEVIATION OVERRIDE
//   |amount z-score| > extreme_zscore means the input is far outside the
//   training distribution. The model is bypassed and the score is pinned to
//   override_score. override_applied is set on the result.
//
// CATEGORY
//   categorize() is the only place the LOW/MEDIUM/HIGH/CRITICAL bands live.
// =============================================================================

#include "vigil/anomaly/AnomalyDetector.hpp"
#include "vigil/config/PolicyConfig.hpp"
#include "vigil/core/Types.hpp"
#include "vigil/features/FeatureSet.hpp"
#include "vigil/ml/EnsemblePredictor.hpp"

#include <optional>
#include <string>
#include <vector>

namespace vigil::risk {

struct BusinessRules {
    bool large_amount = false;
    bool high_risk_category = false;
    bool new_customer = false;
    bool velocity_exceeded = false;

    bool any() const { return large_amount || high_risk_category || new_customer || velocity_exceeded; }
    std::vector<std::string> active() const;

    static BusinessRules fromFeatures(const features::FeatureSet& f, const config::RiskPolicy& p);
};

struct RiskBreakdown {
    double model = 0.0;
    double anomalies = 0.0;
    double business = 0.0;
};

struct RiskScore {
    int total = 0;
    RiskLevel category = RiskLevel::LOW;
    RiskBreakdown breakdown;
    bool model_unavailable = false;
    bool override_applied = false;
    std::optional<double> override_zscore;
};

class RiskScorer {
public:
    explicit RiskScorer(config::RiskPolicy policy);

    RiskScore score(const ml::EnsemblePrediction& prediction,
                    const anomaly::AnomalyReport& anomalies,
                    const BusinessRules& rules) const;

    RiskLevel categorize(int total) const;
    bool isExtremeDeviation(const anomaly::AnomalyReport& anomalies) const;

private:
    double anomalyPoints(const anomaly::AnomalyReport& anomalies) const;

    config::RiskPolicy policy_;
};

} // namespace vigil::risk
