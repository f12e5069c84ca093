#include "vigil/ml/EnsemblePredictor.hpp"
#include "vigil/core/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace vigil::ml {

EnsemblePrediction EnsemblePrediction::unavailable(std::vector<PartialModelFailure> failures) {
    EnsemblePrediction p;
    p.available = false;
    p.failures = std::move(failures);
    return p;
}

EnsemblePredictor::EnsemblePredictor(config::EnsemblePolicy policy,
                                     std::shared_ptr<const FeatureEncoder> encoder,
                                     std::vector<WeightedModel> models)
    : policy_(policy)
    , encoder_(std::move(encoder))
    , models_(std::move(models)) {
    if (!encoder_) throw ArtifactUnavailableError("ensemble has no encoder");
    if (models_.empty()) throw ArtifactUnavailableError("ensemble has no models");
    for (const auto& m : models_) {
        if (!m.model) throw ArtifactUnavailableError("ensemble has a null model");
        if (!(m.weight >= 0.0) || !std::isfinite(m.weight)) {
            throw ArtifactUnavailableError("model '" + m.model->name() + "' has invalid weight");
        }
    }
}

Consensus EnsemblePredictor::classify(double spread, size_t survivors) const {
    if (survivors <= 1) return Consensus::SINGLE_MODEL;
    if (spread <= policy_.high_agreement_spread) return Consensus::HIGH_AGREEMENT;
    if (spread <= policy_.moderate_agreement_spread) return Consensus::MODERATE_AGREEMENT;
    return Consensus::LOW_AGREEMENT;
}

EnsemblePrediction EnsemblePredictor::predict(const features::FeatureSet& features) const {
    encoder_->validateContract();

    EncodedRow row;
    try {
        row = encoder_->encode(features);
    } catch (const VigilError&) {
        throw;
    } catch (const std::exception& e) {
        throw FeatureContractError(std::string("encoder failed: ") + e.what());
    }

    EnsemblePrediction out;
    double weighted = 0.0;
    double total_weight = 0.0;

    for (const auto& wm : models_) {
        const std::string& name = wm.model->name();
        double p = 0.0;
        try {
            p = wm.model->predictProba(row);
        } catch (const std::exception& e) {
            std::cerr << "[ENSEMBLE] model " << name << " failed: " << e.what() << "\n";
            out.failures.push_back({name, e.what()});
            continue;
        }
        if (!std::isfinite(p) || p < 0.0 || p > 1.0) {
            std::cerr << "[ENSEMBLE] model " << name << " returned invalid probability " << p << "\n";
            out.failures.push_back({name, "probability outside [0, 1]"});
            continue;
        }

        out.models.push_back({name, p, p > policy_.decision_threshold, wm.weight});
        if (wm.weight > 0.0) {
            weighted += wm.weight * p;
            total_weight += wm.weight;
        }
    }

    if (out.models.empty()) {
        throw PredictionUnavailableError(
            "all " + std::to_string(models_.size()) + " ensemble models failed",
            std::move(out.failures));
    }
    if (total_weight <= 0.0) {
        // Zero-weight survivors cannot vote; report them alongside the failures.
        std::vector<PartialModelFailure> excluded = std::move(out.failures);
        for (const auto& m : out.models) excluded.push_back({m.model, "weight 0, cannot vote alone"});
        throw PredictionUnavailableError("no weighted model produced a prediction",
                                         std::move(excluded));
    }

    double lo = 1.0, hi = 0.0;
    for (const auto& m : out.models) {
        lo = std::min(lo, m.probability);
        hi = std::max(hi, m.probability);
    }

    out.available = true;
    out.probability = std::clamp(weighted / total_weight, 0.0, 1.0);
    out.is_fraud = out.probability > policy_.decision_threshold;
    out.spread = hi - lo;
    out.consensus = classify(out.spread, out.models.size());
    return out;
}

} // namespace vigil::ml
