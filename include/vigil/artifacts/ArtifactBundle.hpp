#pragma once
// =============================================================================
// ArtifactBundle.hpp - Immutable set of trained artifacts
// =============================================================================
// Encoder, weighted models and frequency tables, loaded once at startup and
// shared read-only by every request. Nothing here is mutated after load.
//
// ArtifactLoader reads a model registry manifest:
//   {
//     "encoder":        "encoder.json",
//     "merchant_freq":  "merchant_freq_map.json",
//     "category_freq":  "category_freq_map.json",
//     "best_model":     "xgboost",
//     "models": [ {"name", "type", "path", "weight", "validation_auc"}, ... ]
//   }
// Relative paths resolve against the manifest's directory.
//
// ArtifactCache gives load-once semantics: concurrent first callers trigger
// exactly one disk load and all observe its outcome.
// =============================================================================

#include "vigil/features/FrequencyTable.hpp"
#include "vigil/ml/EnsemblePredictor.hpp"
#include "vigil/ml/FeatureEncoder.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vigil::artifacts {

struct ModelInfo {
    std::string name;
    std::string type;
    std::string path;
    double weight = 0.0;
    std::optional<double> validation_auc;
};

struct ArtifactBundle {
    std::shared_ptr<const ml::FeatureEncoder> encoder;
    std::vector<ml::WeightedModel> models;
    std::vector<ModelInfo> model_info;
    std::shared_ptr<const features::FrequencyTable> merchant_freq;
    std::shared_ptr<const features::FrequencyTable> category_freq;
    std::string best_model;
    std::string origin;     // manifest path, or "<memory>"
};

class ArtifactLoader {
public:
    // Throws ArtifactUnavailableError naming the file that failed.
    static std::shared_ptr<const ArtifactBundle> load(const std::string& manifest_path);
};

class ArtifactCache {
public:
    explicit ArtifactCache(std::string manifest_path);

    // First call loads; later calls return the same bundle or rethrow the
    // same failure. A failed load is not retried.
    std::shared_ptr<const ArtifactBundle> get();

    // Safe to call from any thread, including during a first get().
    bool loaded() const;
    int loadAttempts() const;

private:
    std::string manifest_path_;
    std::once_flag once_;
    std::shared_ptr<const ArtifactBundle> bundle_;
    std::string error_;
    std::atomic<bool> loaded_{false};
    std::atomic<int> attempts_{0};
};

} // namespace vigil::artifacts
