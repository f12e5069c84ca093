#pragma once
// =============================================================================
// AnomalyDetector.hpp - Statistical anomaly flags, independent of the model
// =============================================================================
// Dimensions:
//   amount    |z| > zscore_threshold (high above zscore_high)
//   time      night window and/or outside the customer's usual hours
//   location  distance above distance_km (high above distance_high_km)
//   digit     Benford expected probability of the leading digit below
//             benford_min_expected; auxiliary, always LOW severity
//
// Overall band uses the three primary dimensions only:
//   CRITICAL  all three fire
//   HIGH      two fire, or one fires at HIGH severity
//   MEDIUM    exactly one fires below HIGH
//   LOW       none
// A dimension whose inputs are absent is reported as not anomalous.
// =============================================================================

#include "vigil/config/PolicyConfig.hpp"
#include "vigil/core/Types.hpp"
#include "vigil/features/FeatureSet.hpp"

#include <optional>
#include <string>

namespace vigil::anomaly {

enum class Dimension : uint8_t {
    AMOUNT   = 0,
    TIME     = 1,
    LOCATION = 2,
    DIGIT    = 3
};

inline const char* dimensionToStr(Dimension d) {
    switch (d) {
        case Dimension::AMOUNT:   return "amount";
        case Dimension::TIME:     return "time";
        case Dimension::LOCATION: return "location";
        case Dimension::DIGIT:    return "digit_pattern";
        default: return "unknown";
    }
}

struct AnomalyRecord {
    Dimension dimension = Dimension::AMOUNT;
    bool is_anomaly = false;
    Severity severity = Severity::NONE;
    bool evaluated = false;         // false when the inputs were absent
    std::string explanation;
};

struct AnomalyReport {
    AnomalyRecord amount{Dimension::AMOUNT};
    AnomalyRecord time{Dimension::TIME};
    AnomalyRecord location{Dimension::LOCATION};
    AnomalyRecord digit{Dimension::DIGIT};

    // Raw measurements kept for scoring and audit
    std::optional<double> amount_z_score;
    std::optional<double> distance_km;
    std::optional<int> hour;

    RiskLevel overall = RiskLevel::LOW;
    int primary_count = 0;      // amount/time/location flags
    int total_flags = 0;        // including the digit pattern

    bool hasSeverity(Severity s) const;
    // Triggered anomalies at MEDIUM or HIGH severity.
    int countAtLeastMedium() const;
};

// Inputs the detector actually reads. Any field may be absent.
struct AnomalySignals {
    std::optional<double> amount_z_score;
    std::optional<int> hour;
    std::optional<bool> is_unusual_hour;
    std::optional<double> distance_km;
    std::optional<int> first_digit;
    std::optional<double> benford_expected;

    static AnomalySignals fromFeatures(const features::FeatureSet& f);
};

class AnomalyDetector {
public:
    explicit AnomalyDetector(config::AnomalyPolicy policy);

    AnomalyReport detect(const features::FeatureSet& features) const;
    AnomalyReport detect(const AnomalySignals& signals) const;

    bool isNightHour(int hour) const;

private:
    AnomalyRecord checkAmount(const AnomalySignals& s) const;
    AnomalyRecord checkTime(const AnomalySignals& s) const;
    AnomalyRecord checkLocation(const AnomalySignals& s) const;
    AnomalyRecord checkDigit(const AnomalySignals& s) const;
    static void aggregate(AnomalyReport& report);

    config::AnomalyPolicy policy_;
};

} // namespace vigil::anomaly
