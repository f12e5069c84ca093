#pragma once
// =============================================================================
// Classifier.hpp - Opaque fraud classifier capability
// =============================================================================
// One trained model: encoded row in, P(fraud) out. Implementations are
// immutable after load and safe to call concurrently. A failure is reported
// by throwing; the ensemble isolates it.
// =============================================================================

#include "vigil/ml/FeatureEncoder.hpp"

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace vigil::ml {

class Classifier {
public:
    virtual ~Classifier() = default;

    virtual const std::string& name() const = 0;
    virtual double predictProba(const EncodedRow& row) const = 0;
};

double sigmoid(double z);

// -----------------------------------------------------------------------------
// LogisticClassifier - P = sigmoid(bias + sum(w_i * x_i))
// -----------------------------------------------------------------------------
class LogisticClassifier : public Classifier {
public:
    LogisticClassifier(std::string name, double bias, std::vector<double> weights);

    // Coefficients are keyed by encoder column name and resolved here.
    static std::unique_ptr<LogisticClassifier> fromJson(const std::string& name,
                                                        const nlohmann::json& j,
                                                        const FeatureEncoder& encoder);

    const std::string& name() const override { return name_; }
    double predictProba(const EncodedRow& row) const override;

private:
    std::string name_;
    double bias_;
    std::vector<double> weights_;
};

// -----------------------------------------------------------------------------
// TreeEnsembleClassifier - boosted trees, leaf margins summed then sigmoid
// -----------------------------------------------------------------------------
struct TreeNode {
    int feature = -1;
    double threshold = 0.0;
    int left = -1;
    int right = -1;
    double value = 0.0;     // leaf margin
    bool leaf() const { return left < 0 && right < 0; }
};

struct Tree {
    std::vector<TreeNode> nodes;
};

class TreeEnsembleClassifier : public Classifier {
public:
    TreeEnsembleClassifier(std::string name, double base_score, std::vector<Tree> trees,
                           size_t input_width);

    static std::unique_ptr<TreeEnsembleClassifier> fromJson(const std::string& name,
                                                            const nlohmann::json& j,
                                                            const FeatureEncoder& encoder);

    const std::string& name() const override { return name_; }
    double predictProba(const EncodedRow& row) const override;

    size_t treeCount() const { return trees_.size(); }

private:
    double margin(const Tree& t, const EncodedRow& row) const;

    std::string name_;
    double base_score_;
    std::vector<Tree> trees_;
    size_t input_width_;
};

// Build a classifier from its registry entry type ("logistic" / "tree_ensemble").
std::unique_ptr<Classifier> makeClassifier(const std::string& name, const nlohmann::json& j,
                                           const FeatureEncoder& encoder);

} // namespace vigil::ml
