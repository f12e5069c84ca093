#include "vigil/pipeline/FraudPipeline.hpp"
#include "vigil/core/Errors.hpp"

#include <iostream>

namespace vigil::pipeline {

namespace {

std::shared_ptr<const artifacts::ArtifactBundle>
checked(std::shared_ptr<const artifacts::ArtifactBundle> b) {
    if (!b) throw ArtifactUnavailableError("pipeline constructed without artifacts");
    return b;
}

} // namespace

FraudPipeline::FraudPipeline(std::shared_ptr<const artifacts::ArtifactBundle> bundle,
                             config::PolicyConfig policy)
    : bundle_(checked(std::move(bundle)))
    , policy_(std::move(policy))
    , engineer_(policy_.features, bundle_->merchant_freq, bundle_->category_freq)
    , detector_(policy_.anomaly)
    , ensemble_(policy_.ensemble, bundle_->encoder, bundle_->models)
    , scorer_(policy_.risk)
    , decider_(policy_.decision) {
    policy_.validate();
}

PipelineResult FraudPipeline::run(const Transaction& tx,
                                  const std::optional<CustomerHistory>& history) const {
    PipelineResult r;
    r.transaction_id = tx.transaction_id;

    r.features = engineer_.engineer(tx, history);
    r.anomalies = detector_.detect(*r.features);

    try {
        r.prediction = ensemble_.predict(*r.features);
    } catch (const PredictionUnavailableError& e) {
        std::cerr << "[PIPELINE] " << tx.transaction_id
                  << " prediction unavailable, anomaly-only scoring: " << e.what() << "\n";
        r.prediction = ml::EnsemblePrediction::unavailable(e.failures());
    }

    r.business_rules = risk::BusinessRules::fromFeatures(*r.features, policy_.risk);
    r.risk_score = scorer_.score(*r.prediction, *r.anomalies, *r.business_rules);
    r.decision = decider_.decide(*r.risk_score, *r.anomalies, *r.prediction);

    if (r.decision.system_error) {
        r.status = PipelineStatus::FAILED;
        r.error_kind = "DecisionError";
        r.error_message = r.decision.reasoning;
    } else if (!r.prediction->available || !r.prediction->failures.empty()) {
        r.status = PipelineStatus::DEGRADED;
    }
    return r;
}

PipelineResult FraudPipeline::failure(const Transaction& tx, PipelineStatus status,
                                      const std::string& kind, const std::string& what) const {
    std::cerr << "[PIPELINE] " << tx.transaction_id << " " << pipelineStatusToStr(status)
              << " -> MANUAL_REVIEW (" << kind << "): " << what << "\n";
    PipelineResult r;
    r.transaction_id = tx.transaction_id;
    r.status = status;
    r.error_kind = kind;
    r.error_message = what;
    r.decision = decision::DecisionPolicy::systemError(kind, what);
    return r;
}

PipelineResult FraudPipeline::evaluate(const Transaction& tx,
                                       const std::optional<CustomerHistory>& history) const noexcept {
    try {
        return run(tx, history);
    } catch (const InvalidInputError& e) {
        return failure(tx, PipelineStatus::REJECTED, e.kind(), e.what());
    } catch (const VigilError& e) {
        return failure(tx, PipelineStatus::FAILED, e.kind(), e.what());
    } catch (const std::exception& e) {
        return failure(tx, PipelineStatus::FAILED, "InternalError", e.what());
    }
}

} // namespace vigil::pipeline
