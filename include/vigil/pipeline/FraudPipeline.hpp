#pragma once
// =============================================================================
// FraudPipeline.hpp - One transaction in, one auditable decision out
// =============================================================================
// raw tx -> FeatureEngineer -> { AnomalyDetector, EnsemblePredictor }
//        -> RiskScorer -> DecisionPolicy
//
// The pipeline owns no mutable state. Artifacts arrive as an immutable
// shared bundle, policy as a value; concurrent evaluate() calls on one
// instance are safe.
//
// evaluate() never throws and always carries a Decision:
//   OK        every stage succeeded
//   DEGRADED  some or all models failed; scored on what remained
//   REJECTED  InvalidInputError, routed to MANUAL_REVIEW with confidence 0
//   FAILED    any other error, same shape, naming the failure class
// run() is the throwing variant.
// =============================================================================

#include "vigil/anomaly/AnomalyDetector.hpp"
#include "vigil/artifacts/ArtifactBundle.hpp"
#include "vigil/config/PolicyConfig.hpp"
#include "vigil/core/Types.hpp"
#include "vigil/decision/DecisionPolicy.hpp"
#include "vigil/features/FeatureEngineer.hpp"
#include "vigil/ml/EnsemblePredictor.hpp"
#include "vigil/risk/RiskScorer.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace vigil::pipeline {

enum class PipelineStatus : uint8_t {
    OK       = 0,
    DEGRADED = 1,
    REJECTED = 2,
    FAILED   = 3
};

inline const char* pipelineStatusToStr(PipelineStatus s) {
    switch (s) {
        case PipelineStatus::OK:       return "OK";
        case PipelineStatus::DEGRADED: return "DEGRADED";
        case PipelineStatus::REJECTED: return "REJECTED";
        case PipelineStatus::FAILED:   return "FAILED";
        default: return "UNKNOWN";
    }
}

struct PipelineResult {
    std::string transaction_id;
    PipelineStatus status = PipelineStatus::OK;
    decision::Decision decision;

    // Present once the corresponding stage has run.
    std::optional<features::FeatureSet> features;
    std::optional<anomaly::AnomalyReport> anomalies;
    std::optional<ml::EnsemblePrediction> prediction;
    std::optional<risk::BusinessRules> business_rules;
    std::optional<risk::RiskScore> risk_score;

    std::string error_kind;
    std::string error_message;
};

class FraudPipeline {
public:
    FraudPipeline(std::shared_ptr<const artifacts::ArtifactBundle> bundle,
                  config::PolicyConfig policy);

    PipelineResult evaluate(const Transaction& tx,
                            const std::optional<CustomerHistory>& history) const noexcept;

    // Throws InvalidInputError / FeatureContractError. Prediction loss still
    // degrades to anomaly-only scoring.
    PipelineResult run(const Transaction& tx,
                       const std::optional<CustomerHistory>& history) const;

private:
    PipelineResult failure(const Transaction& tx, PipelineStatus status,
                           const std::string& kind, const std::string& what) const;

    std::shared_ptr<const artifacts::ArtifactBundle> bundle_;
    config::PolicyConfig policy_;

    features::FeatureEngineer engineer_;
    anomaly::AnomalyDetector detector_;
    ml::EnsemblePredictor ensemble_;
    risk::RiskScorer scorer_;
    decision::DecisionPolicy decider_;
};

} // namespace vigil::pipeline
