#pragma once
// =============================================================================
// FrequencyTable.hpp - Static name -> historical count lookup
// =============================================================================
// Built offline from historical transactions and shipped as a JSON object
// { "<name>": <count>, ... }. Immutable after construction; concurrent reads
// need no locking.
// =============================================================================

#include <optional>
#include <string>
#include <unordered_map>

#include <nlohmann/json_fwd.hpp>

namespace vigil::features {

class FrequencyTable {
public:
    FrequencyTable() = default;
    explicit FrequencyTable(std::unordered_map<std::string, double> counts);

    // Throws ArtifactUnavailableError on unreadable or malformed input.
    static FrequencyTable fromJson(const nlohmann::json& j, const std::string& origin);
    static FrequencyTable fromFile(const std::string& path);

    std::optional<double> lookup(const std::string& key) const;

    double median() const { return median_; }
    size_t size() const { return counts_.size(); }
    bool empty() const { return counts_.empty(); }

private:
    std::unordered_map<std::string, double> counts_;
    double median_ = 0.0;
};

} // namespace vigil::features
