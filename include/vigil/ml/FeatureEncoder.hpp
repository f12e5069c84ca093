#pragma once
// =============================================================================
// FeatureEncoder.hpp - Engineered features -> numeric model input
// =============================================================================
// The encoder declares the columns it was fitted on (name + kind, in order).
// Before encoding, validateContract() checks every declared column exists in
// the feature catalogue with the same kind; any mismatch is a
// FeatureContractError, never an opaque encoder failure.
// =============================================================================

#include "vigil/features/FeatureSet.hpp"

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace vigil::ml {

using EncodedRow = std::vector<double>;

struct EncoderColumn {
    std::string name;
    features::ColumnKind kind = features::ColumnKind::NUMERIC;
};

class FeatureEncoder {
public:
    virtual ~FeatureEncoder() = default;

    virtual const std::vector<EncoderColumn>& columns() const = 0;
    virtual EncodedRow encode(const features::FeatureSet& features) const = 0;

    size_t width() const { return columns().size(); }
    // Index of an output column, or -1.
    int indexOf(const std::string& name) const;

    // Throws FeatureContractError on the first missing or mistyped column.
    void validateContract() const;
};

// -----------------------------------------------------------------------------
// StandardTargetEncoder - numeric: (x - mean) / scale, categorical: target
// encoding with a fallback for unseen values. Output order is the numeric
// block followed by the categorical block.
// -----------------------------------------------------------------------------
class StandardTargetEncoder : public FeatureEncoder {
public:
    struct NumericColumn {
        std::string name;
        double mean = 0.0;
        double scale = 1.0;
    };
    struct CategoricalColumn {
        std::string name;
        double fallback = 0.0;
        std::vector<std::pair<std::string, double>> mapping;
    };

    StandardTargetEncoder(std::vector<NumericColumn> numeric,
                          std::vector<CategoricalColumn> categorical);

    // Throws ArtifactUnavailableError on malformed input.
    static std::unique_ptr<StandardTargetEncoder> fromJson(const nlohmann::json& j,
                                                           const std::string& origin);
    static std::unique_ptr<StandardTargetEncoder> fromFile(const std::string& path);

    const std::vector<EncoderColumn>& columns() const override { return columns_; }
    EncodedRow encode(const features::FeatureSet& features) const override;

private:
    double encodeCategory(const CategoricalColumn& col, const std::string& value) const;

    std::vector<NumericColumn> numeric_;
    std::vector<CategoricalColumn> categorical_;
    std::vector<EncoderColumn> columns_;
};

} // namespace vigil::ml
