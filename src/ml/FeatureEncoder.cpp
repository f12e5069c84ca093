#include "vigil/ml/FeatureEncoder.hpp"
#include "vigil/core/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>

#include <nlohmann/json.hpp>

namespace vigil::ml {

using json = nlohmann::json;
using features::ColumnKind;

int FeatureEncoder::indexOf(const std::string& name) const {
    const auto& cols = columns();
    for (size_t i = 0; i < cols.size(); ++i) {
        if (cols[i].name == name) return static_cast<int>(i);
    }
    return -1;
}

void FeatureEncoder::validateContract() const {
    for (const auto& col : columns()) {
        const features::ColumnSpec* spec = features::findColumn(col.name);
        if (!spec) {
            throw FeatureContractError("encoder column '" + col.name +
                                       "' is not produced by feature engineering");
        }
        if (spec->kind != col.kind) {
            throw FeatureContractError("encoder column '" + col.name + "' expects " +
                                       features::columnKindToStr(col.kind) + " but features are " +
                                       features::columnKindToStr(spec->kind));
        }
    }
}

StandardTargetEncoder::StandardTargetEncoder(std::vector<NumericColumn> numeric,
                                             std::vector<CategoricalColumn> categorical)
    : numeric_(std::move(numeric))
    , categorical_(std::move(categorical)) {
    columns_.reserve(numeric_.size() + categorical_.size());
    for (auto& c : numeric_) {
        if (c.scale == 0.0) c.scale = 1.0;   // constant column at fit time
        columns_.push_back({c.name, ColumnKind::NUMERIC});
    }
    for (auto& c : categorical_) {
        std::sort(c.mapping.begin(), c.mapping.end());
        columns_.push_back({c.name, ColumnKind::CATEGORICAL});
    }
}

std::unique_ptr<StandardTargetEncoder> StandardTargetEncoder::fromJson(const json& j,
                                                                       const std::string& origin) {
    auto fail = [&](const std::string& why) {
        return ArtifactUnavailableError("encoder " + origin + ": " + why);
    };

    try {
        if (!j.is_object() || !j.contains("numeric") || !j.contains("categorical")) {
            throw fail("expected object with 'numeric' and 'categorical' arrays");
        }

        std::vector<NumericColumn> numeric;
        for (const auto& c : j.at("numeric")) {
            NumericColumn col;
            col.name = c.at("name").get<std::string>();
            col.mean = c.at("mean").get<double>();
            col.scale = c.at("scale").get<double>();
            if (!std::isfinite(col.mean) || !std::isfinite(col.scale)) {
                throw fail("non-finite statistics for '" + col.name + "'");
            }
            numeric.push_back(std::move(col));
        }

        std::vector<CategoricalColumn> categorical;
        for (const auto& c : j.at("categorical")) {
            CategoricalColumn col;
            col.name = c.at("name").get<std::string>();
            col.fallback = c.at("default").get<double>();
            if (c.contains("mapping")) {
                for (auto it = c.at("mapping").begin(); it != c.at("mapping").end(); ++it) {
                    col.mapping.emplace_back(it.key(), it.value().get<double>());
                }
            }
            categorical.push_back(std::move(col));
        }

        if (numeric.empty() && categorical.empty()) throw fail("no columns");
        return std::make_unique<StandardTargetEncoder>(std::move(numeric), std::move(categorical));
    } catch (const json::exception& e) {
        throw fail(e.what());
    }
}

std::unique_ptr<StandardTargetEncoder> StandardTargetEncoder::fromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ArtifactUnavailableError("encoder not found: " + path);
    }
    json j;
    try {
        j = json::parse(in);
    } catch (const json::exception& e) {
        throw ArtifactUnavailableError("encoder " + path + ": " + e.what());
    }
    return fromJson(j, path);
}

double StandardTargetEncoder::encodeCategory(const CategoricalColumn& col,
                                             const std::string& value) const {
    auto it = std::lower_bound(col.mapping.begin(), col.mapping.end(), value,
                               [](const std::pair<std::string, double>& e, const std::string& v) {
                                   return e.first < v;
                               });
    if (it != col.mapping.end() && it->first == value) return it->second;
    return col.fallback;
}

EncodedRow StandardTargetEncoder::encode(const features::FeatureSet& features) const {
    EncodedRow row;
    row.reserve(columns_.size());

    for (const auto& col : numeric_) {
        auto v = features.column(col.name);
        if (!v) throw FeatureContractError("missing feature column '" + col.name + "'");
        if (v->kind != ColumnKind::NUMERIC) {
            throw FeatureContractError("feature column '" + col.name + "' is not numeric");
        }
        row.push_back((v->number - col.mean) / col.scale);
    }
    for (const auto& col : categorical_) {
        auto v = features.column(col.name);
        if (!v) throw FeatureContractError("missing feature column '" + col.name + "'");
        if (v->kind != ColumnKind::CATEGORICAL) {
            throw FeatureContractError("feature column '" + col.name + "' is not categorical");
        }
        row.push_back(encodeCategory(col, v->text));
    }
    return row;
}

} // namespace vigil::ml
