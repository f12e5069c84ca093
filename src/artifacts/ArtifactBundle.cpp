#include "vigil/artifacts/ArtifactBundle.hpp"
#include "vigil/core/Errors.hpp"

#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

namespace vigil::artifacts {

using json = nlohmann::json;

namespace {

std::string dirOf(const std::string& path) {
    auto slash = path.find_last_of('/');
    return slash == std::string::npos ? std::string() : path.substr(0, slash + 1);
}

std::string resolve(const std::string& base_dir, const std::string& path) {
    if (path.empty() || path[0] == '/') return path;
    return base_dir + path;
}

json readJson(const std::string& path, const char* what) {
    std::ifstream in(path);
    if (!in) throw ArtifactUnavailableError(std::string(what) + " not found: " + path);
    try {
        return json::parse(in);
    } catch (const json::exception& e) {
        throw ArtifactUnavailableError(std::string(what) + " " + path + " is malformed: " + e.what());
    }
}

} // namespace

std::shared_ptr<const ArtifactBundle> ArtifactLoader::load(const std::string& manifest_path) {
    const json manifest = readJson(manifest_path, "model registry");
    const std::string base = dirOf(manifest_path);

    auto bundle = std::make_shared<ArtifactBundle>();
    bundle->origin = manifest_path;

    try {
        auto encoder = ml::StandardTargetEncoder::fromFile(
            resolve(base, manifest.at("encoder").get<std::string>()));
        encoder->validateContract();
        bundle->encoder = std::shared_ptr<const ml::FeatureEncoder>(std::move(encoder));

        bundle->merchant_freq = std::make_shared<const features::FrequencyTable>(
            features::FrequencyTable::fromFile(
                resolve(base, manifest.at("merchant_freq").get<std::string>())));
        bundle->category_freq = std::make_shared<const features::FrequencyTable>(
            features::FrequencyTable::fromFile(
                resolve(base, manifest.at("category_freq").get<std::string>())));

        bundle->best_model = manifest.value("best_model", std::string());

        for (const auto& jm : manifest.at("models")) {
            ModelInfo info;
            info.name = jm.at("name").get<std::string>();
            info.type = jm.value("type", std::string());
            info.path = resolve(base, jm.at("path").get<std::string>());
            info.weight = jm.value("weight", 1.0);
            if (jm.contains("validation_auc") && jm["validation_auc"].is_number()) {
                info.validation_auc = jm["validation_auc"].get<double>();
            }
            if (!(info.weight >= 0.0)) {
                throw ArtifactUnavailableError("model '" + info.name + "' has negative weight");
            }

            json body = readJson(info.path, "model");
            if (!info.type.empty() && body.value("type", std::string()) != info.type) {
                throw ArtifactUnavailableError("model '" + info.name + "' registered as " +
                                               info.type + " but file declares " +
                                               body.value("type", std::string("<none>")));
            }
            std::shared_ptr<const ml::Classifier> model =
                ml::makeClassifier(info.name, body, *bundle->encoder);
            bundle->models.push_back({model, info.weight});
            bundle->model_info.push_back(std::move(info));
        }
    } catch (const json::exception& e) {
        throw ArtifactUnavailableError("model registry " + manifest_path + ": " + e.what());
    }

    if (bundle->models.empty()) {
        throw ArtifactUnavailableError("model registry " + manifest_path + " lists no models");
    }
    double total_weight = 0.0;
    for (const auto& m : bundle->models) total_weight += m.weight;
    if (total_weight <= 0.0) {
        throw ArtifactUnavailableError("model registry " + manifest_path +
                                       ": every model has weight 0");
    }

    std::cerr << "[ARTIFACTS] Loaded " << bundle->models.size() << " models, "
              << bundle->encoder->width() << " encoder columns, "
              << bundle->merchant_freq->size() << " merchants, "
              << bundle->category_freq->size() << " categories from " << manifest_path << "\n";

    return bundle;
}

// ─────────────────────────────────────────────────────────────────────────────
// Cache
// ─────────────────────────────────────────────────────────────────────────────

ArtifactCache::ArtifactCache(std::string manifest_path)
    : manifest_path_(std::move(manifest_path)) {}

std::shared_ptr<const ArtifactBundle> ArtifactCache::get() {
    std::call_once(once_, [this]() {
        ++attempts_;
        try {
            bundle_ = ArtifactLoader::load(manifest_path_);
            loaded_.store(true);
        } catch (const std::exception& e) {
            error_ = e.what();
            std::cerr << "[ARTIFACTS] Load failed: " << error_ << "\n";
        }
    });
    if (!bundle_) throw ArtifactUnavailableError(error_);
    return bundle_;
}

bool ArtifactCache::loaded() const {
    return loaded_.load();
}

int ArtifactCache::loadAttempts() const {
    return attempts_.load();
}

} // namespace vigil::artifacts
