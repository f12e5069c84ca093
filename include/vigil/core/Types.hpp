#pragma once
// =============================================================================
// Types.hpp - Vigil shared enums and raw request records
// =============================================================================
// Raw inputs arrive per request and are never mutated after construction.
// Optional fields are std::optional; FeatureEngineer fills the documented
// defaults, nothing downstream sees an empty value.
// =============================================================================

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vigil {

enum class Severity : uint8_t {
    NONE   = 0,
    LOW    = 1,
    MEDIUM = 2,
    HIGH   = 3
};

inline const char* severityToStr(Severity s) {
    switch (s) {
        case Severity::NONE:   return "none";
        case Severity::LOW:    return "low";
        case Severity::MEDIUM: return "medium";
        case Severity::HIGH:   return "high";
        default: return "unknown";
    }
}

// Shared by the anomaly overall band and the risk score category.
enum class RiskLevel : uint8_t {
    LOW      = 0,
    MEDIUM   = 1,
    HIGH     = 2,
    CRITICAL = 3
};

inline const char* riskLevelToStr(RiskLevel r) {
    switch (r) {
        case RiskLevel::LOW:      return "LOW";
        case RiskLevel::MEDIUM:   return "MEDIUM";
        case RiskLevel::HIGH:     return "HIGH";
        case RiskLevel::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

enum class Action : uint8_t {
    APPROVE       = 0,
    BLOCK         = 1,
    MANUAL_REVIEW = 2
};

inline const char* actionToStr(Action a) {
    switch (a) {
        case Action::APPROVE:       return "APPROVE";
        case Action::BLOCK:         return "BLOCK";
        case Action::MANUAL_REVIEW: return "MANUAL_REVIEW";
        default: return "UNKNOWN";
    }
}

struct GeoPoint {
    double lat = 0.0;
    double lon = 0.0;
};

struct Transaction {
    std::string transaction_id;
    std::string customer_id;

    double amount = 0.0;
    std::optional<std::string> timestamp;   // naive ISO-8601
    std::string merchant;
    std::string category;

    std::optional<GeoPoint> customer_location;
    std::optional<GeoPoint> merchant_location;
    std::optional<double> distance_from_home_km;

    std::optional<std::string> dob;         // YYYY-MM-DD
    std::optional<std::string> gender;
    std::optional<std::string> state;
    std::optional<std::string> city;
    std::optional<std::string> zip;
    std::optional<std::string> job;
    std::optional<double> city_pop;
};

struct CustomerHistory {
    double avg_amount = 0.0;
    double std_amount = 0.0;
    int64_t transaction_count = 0;
    std::vector<int> usual_hours;
    std::optional<double> days_since_last_tx;
    std::optional<int64_t> transaction_count_1h;
    std::optional<int64_t> transaction_count_24h;
};

} // namespace vigil
