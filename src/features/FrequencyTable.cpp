#include "vigil/features/FrequencyTable.hpp"
#include "vigil/core/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <vector>

#include <nlohmann/json.hpp>

namespace vigil::features {

using json = nlohmann::json;

FrequencyTable::FrequencyTable(std::unordered_map<std::string, double> counts)
    : counts_(std::move(counts)) {
    if (counts_.empty()) return;

    std::vector<double> values;
    values.reserve(counts_.size());
    for (const auto& kv : counts_) values.push_back(kv.second);
    std::sort(values.begin(), values.end());

    size_t n = values.size();
    median_ = (n % 2 == 1) ? values[n / 2] : 0.5 * (values[n / 2 - 1] + values[n / 2]);
}

FrequencyTable FrequencyTable::fromJson(const json& j, const std::string& origin) {
    if (!j.is_object()) {
        throw ArtifactUnavailableError("frequency table " + origin + ": expected a JSON object");
    }
    std::unordered_map<std::string, double> counts;
    counts.reserve(j.size());
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_number()) {
            throw ArtifactUnavailableError("frequency table " + origin + ": count for '" +
                                           it.key() + "' is not a number");
        }
        double v = it.value().get<double>();
        if (!std::isfinite(v) || v < 0.0) {
            throw ArtifactUnavailableError("frequency table " + origin + ": invalid count for '" +
                                           it.key() + "'");
        }
        counts.emplace(it.key(), v);
    }
    return FrequencyTable(std::move(counts));
}

FrequencyTable FrequencyTable::fromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ArtifactUnavailableError("frequency table not found: " + path);
    }
    json j;
    try {
        j = json::parse(in);
    } catch (const json::exception& e) {
        throw ArtifactUnavailableError("frequency table " + path + ": " + e.what());
    }
    return fromJson(j, path);
}

std::optional<double> FrequencyTable::lookup(const std::string& key) const {
    auto it = counts_.find(key);
    if (it == counts_.end()) return std::nullopt;
    return it->second;
}

} // namespace vigil::features
