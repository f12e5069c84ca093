#pragma once
// =============================================================================
// EnsemblePredictor.hpp - Weighted multi-model fraud probability
// =============================================================================
// Encodes once, runs every model, isolates per-model failures.
//
//   ensemble_probability = sum(w_i * p_i) / sum(w_i) over successful models
//                          with w_i > 0
//   is_fraud             = ensemble_probability > decision_threshold
//   consensus            = spread (max - min) of successful probabilities
//
// One model failing is recorded as a PartialModelFailure and the rest still
// vote. If nothing survives, predict() throws PredictionUnavailableError
// carrying every model's failure.
// =============================================================================

#include "vigil/config/PolicyConfig.hpp"
#include "vigil/core/Errors.hpp"
#include "vigil/ml/Classifier.hpp"
#include "vigil/ml/FeatureEncoder.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace vigil::ml {

enum class Consensus : uint8_t {
    SINGLE_MODEL       = 0,
    HIGH_AGREEMENT     = 1,
    MODERATE_AGREEMENT = 2,
    LOW_AGREEMENT      = 3
};

inline const char* consensusToStr(Consensus c) {
    switch (c) {
        case Consensus::SINGLE_MODEL:       return "SINGLE_MODEL";
        case Consensus::HIGH_AGREEMENT:     return "HIGH_AGREEMENT";
        case Consensus::MODERATE_AGREEMENT: return "MODERATE_AGREEMENT";
        case Consensus::LOW_AGREEMENT:      return "LOW_AGREEMENT";
        default: return "UNKNOWN";
    }
}

struct WeightedModel {
    std::shared_ptr<const Classifier> model;
    double weight = 1.0;
};

using vigil::PartialModelFailure;

struct ModelPrediction {
    std::string model;
    double probability = 0.0;
    bool is_fraud = false;
    double weight = 0.0;
};

struct EnsemblePrediction {
    bool available = false;
    double probability = 0.0;
    bool is_fraud = false;
    Consensus consensus = Consensus::SINGLE_MODEL;
    double spread = 0.0;
    std::vector<ModelPrediction> models;
    std::vector<PartialModelFailure> failures;

    // Placeholder carried downstream when prediction could not be produced.
    static EnsemblePrediction unavailable(std::vector<PartialModelFailure> failures = {});
};

class EnsemblePredictor {
public:
    EnsemblePredictor(config::EnsemblePolicy policy,
                      std::shared_ptr<const FeatureEncoder> encoder,
                      std::vector<WeightedModel> models);

    // Throws FeatureContractError when the features do not satisfy the
    // encoder, PredictionUnavailableError when every model fails.
    EnsemblePrediction predict(const features::FeatureSet& features) const;

private:
    Consensus classify(double spread, size_t survivors) const;

    config::EnsemblePolicy policy_;
    std::shared_ptr<const FeatureEncoder> encoder_;
    std::vector<WeightedModel> models_;
};

} // namespace vigil::ml
