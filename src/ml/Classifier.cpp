#include "vigil/ml/Classifier.hpp"
#include "vigil/core/Errors.hpp"

#include <cmath>

#include <nlohmann/json.hpp>

namespace vigil::ml {

using json = nlohmann::json;

double sigmoid(double z) {
    if (z >= 0.0) return 1.0 / (1.0 + std::exp(-z));
    double e = std::exp(z);
    return e / (1.0 + e);
}

// ─────────────────────────────────────────────────────────────────────────────
// Logistic
// ─────────────────────────────────────────────────────────────────────────────

LogisticClassifier::LogisticClassifier(std::string name, double bias, std::vector<double> weights)
    : name_(std::move(name))
    , bias_(bias)
    , weights_(std::move(weights)) {}

std::unique_ptr<LogisticClassifier> LogisticClassifier::fromJson(const std::string& name,
                                                                 const json& j,
                                                                 const FeatureEncoder& encoder) {
    try {
        std::vector<double> weights(encoder.width(), 0.0);
        double bias = j.value("bias", 0.0);
        for (auto it = j.at("coefficients").begin(); it != j.at("coefficients").end(); ++it) {
            int idx = encoder.indexOf(it.key());
            if (idx < 0) {
                throw ArtifactUnavailableError("model '" + name + "': coefficient for unknown column '" +
                                               it.key() + "'");
            }
            weights[static_cast<size_t>(idx)] = it.value().get<double>();
        }
        return std::make_unique<LogisticClassifier>(name, bias, std::move(weights));
    } catch (const json::exception& e) {
        throw ArtifactUnavailableError("model '" + name + "': " + e.what());
    }
}

double LogisticClassifier::predictProba(const EncodedRow& row) const {
    if (row.size() != weights_.size()) {
        throw FeatureContractError("model '" + name_ + "' expects " +
                                   std::to_string(weights_.size()) + " inputs, got " +
                                   std::to_string(row.size()));
    }
    double z = bias_;
    for (size_t i = 0; i < row.size(); ++i) z += weights_[i] * row[i];
    return sigmoid(z);
}

// ─────────────────────────────────────────────────────────────────────────────
// Tree ensemble
// ─────────────────────────────────────────────────────────────────────────────

TreeEnsembleClassifier::TreeEnsembleClassifier(std::string name, double base_score,
                                               std::vector<Tree> trees, size_t input_width)
    : name_(std::move(name))
    , base_score_(base_score)
    , trees_(std::move(trees))
    , input_width_(input_width) {}

std::unique_ptr<TreeEnsembleClassifier> TreeEnsembleClassifier::fromJson(
    const std::string& name, const json& j, const FeatureEncoder& encoder) {
    auto fail = [&](const std::string& why) {
        return ArtifactUnavailableError("model '" + name + "': " + why);
    };

    try {
        std::vector<Tree> trees;
        const size_t width = encoder.width();

        for (const auto& jt : j.at("trees")) {
            Tree tree;
            for (const auto& jn : jt.at("nodes")) {
                TreeNode n;
                n.left = jn.value("left", -1);
                n.right = jn.value("right", -1);
                n.value = jn.value("value", 0.0);
                if (!n.leaf()) {
                    n.feature = jn.at("feature").get<int>();
                    n.threshold = jn.at("threshold").get<double>();
                }
                tree.nodes.push_back(n);
            }
            if (tree.nodes.empty()) throw fail("empty tree");

            // Children must point forward inside the tree so traversal terminates.
            const int count = static_cast<int>(tree.nodes.size());
            for (int i = 0; i < count; ++i) {
                const TreeNode& n = tree.nodes[static_cast<size_t>(i)];
                if (n.leaf()) continue;
                if (n.left <= i || n.right <= i || n.left >= count || n.right >= count) {
                    throw fail("node " + std::to_string(i) + " has invalid children");
                }
                if (n.feature < 0 || static_cast<size_t>(n.feature) >= width) {
                    throw fail("node " + std::to_string(i) + " splits on feature " +
                               std::to_string(n.feature) + " outside encoder width " +
                               std::to_string(width));
                }
            }
            trees.push_back(std::move(tree));
        }
        if (trees.empty()) throw fail("no trees");

        return std::make_unique<TreeEnsembleClassifier>(name, j.value("base_score", 0.0),
                                                        std::move(trees), width);
    } catch (const json::exception& e) {
        throw fail(e.what());
    }
}

double TreeEnsembleClassifier::margin(const Tree& t, const EncodedRow& row) const {
    size_t i = 0;
    while (!t.nodes[i].leaf()) {
        const TreeNode& nd = t.nodes[i];
        i = static_cast<size_t>(row[static_cast<size_t>(nd.feature)] <= nd.threshold ? nd.left
                                                                                     : nd.right);
    }
    return t.nodes[i].value;
}

double TreeEnsembleClassifier::predictProba(const EncodedRow& row) const {
    if (row.size() != input_width_) {
        throw FeatureContractError("model '" + name_ + "' expects " +
                                   std::to_string(input_width_) + " inputs, got " +
                                   std::to_string(row.size()));
    }
    double z = base_score_;
    for (const auto& t : trees_) z += margin(t, row);
    return sigmoid(z);
}

std::unique_ptr<Classifier> makeClassifier(const std::string& name, const json& j,
                                           const FeatureEncoder& encoder) {
    std::string type = j.value("type", std::string());
    if (type == "logistic") return LogisticClassifier::fromJson(name, j, encoder);
    if (type == "tree_ensemble") return TreeEnsembleClassifier::fromJson(name, j, encoder);
    throw ArtifactUnavailableError("model '" + name + "': unknown type '" + type + "'");
}

} // namespace vigil::ml
