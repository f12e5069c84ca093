#include "vigil/anomaly/AnomalyDetector.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace vigil::anomaly {

bool AnomalyReport::hasSeverity(Severity s) const {
    for (const AnomalyRecord* r : {&amount, &time, &location, &digit}) {
        if (r->is_anomaly && r->severity == s) return true;
    }
    return false;
}

int AnomalyReport::countAtLeastMedium() const {
    int n = 0;
    for (const AnomalyRecord* r : {&amount, &time, &location, &digit}) {
        if (r->is_anomaly && (r->severity == Severity::MEDIUM || r->severity == Severity::HIGH)) ++n;
    }
    return n;
}

AnomalySignals AnomalySignals::fromFeatures(const features::FeatureSet& f) {
    AnomalySignals s;
    s.amount_z_score = f.behavior.amt_z_score;
    s.hour = f.temporal.hour;
    s.is_unusual_hour = f.temporal.is_unusual_hour;
    s.distance_km = f.geo.distance_km;
    s.first_digit = f.amount.first_digit;
    s.benford_expected = f.amount.benford_expected;
    return s;
}

AnomalyDetector::AnomalyDetector(config::AnomalyPolicy policy)
    : policy_(policy) {}

bool AnomalyDetector::isNightHour(int hour) const {
    if (policy_.night_start_hour > policy_.night_end_hour) {
        return hour >= policy_.night_start_hour || hour <= policy_.night_end_hour;
    }
    return hour >= policy_.night_start_hour && hour <= policy_.night_end_hour;
}

AnomalyReport AnomalyDetector::detect(const features::FeatureSet& features) const {
    return detect(AnomalySignals::fromFeatures(features));
}

AnomalyReport AnomalyDetector::detect(const AnomalySignals& signals) const {
    AnomalyReport report;
    report.amount_z_score = signals.amount_z_score;
    report.distance_km = signals.distance_km;
    report.hour = signals.hour;

    report.amount = checkAmount(signals);
    report.time = checkTime(signals);
    report.location = checkLocation(signals);
    report.digit = checkDigit(signals);

    aggregate(report);
    return report;
}

AnomalyRecord AnomalyDetector::checkAmount(const AnomalySignals& s) const {
    AnomalyRecord r;
    r.dimension = Dimension::AMOUNT;
    if (!s.amount_z_score || std::isnan(*s.amount_z_score)) {
        r.explanation = "No amount baseline available";
        return r;
    }
    r.evaluated = true;

    double z = *s.amount_z_score;
    double az = std::fabs(z);
    r.is_anomaly = az > policy_.zscore_threshold;
    if (r.is_anomaly) {
        r.severity = az > policy_.zscore_high ? Severity::HIGH : Severity::MEDIUM;
    }

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << z
       << " standard deviations from customer baseline";
    r.explanation = ss.str();
    return r;
}

AnomalyRecord AnomalyDetector::checkTime(const AnomalySignals& s) const {
    AnomalyRecord r;
    r.dimension = Dimension::TIME;
    if (!s.hour) {
        r.explanation = "No transaction hour available";
        return r;
    }
    r.evaluated = true;

    bool night = isNightHour(*s.hour);
    bool unusual = s.is_unusual_hour.value_or(false);
    r.is_anomaly = night || unusual;

    if (night && unusual) {
        r.severity = Severity::HIGH;
    } else if (night) {
        r.severity = Severity::MEDIUM;
    } else if (unusual) {
        r.severity = Severity::LOW;
    }

    std::ostringstream ss;
    ss << "Transaction at " << std::setw(2) << std::setfill('0') << *s.hour << ":00 ("
       << (night ? "night" : "day") << "). "
       << (unusual ? "Outside customer's usual hours." : "Normal timing for customer.");
    r.explanation = ss.str();
    return r;
}

AnomalyRecord AnomalyDetector::checkLocation(const AnomalySignals& s) const {
    AnomalyRecord r;
    r.dimension = Dimension::LOCATION;
    if (!s.distance_km || std::isnan(*s.distance_km)) {
        r.explanation = "No distance available";
        return r;
    }
    r.evaluated = true;

    double d = *s.distance_km;
    r.is_anomaly = d > policy_.distance_km;
    if (r.is_anomaly) {
        r.severity = d > policy_.distance_high_km ? Severity::HIGH : Severity::MEDIUM;
    }

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << "Transaction location is " << d << "km from home"
       << (r.is_anomaly ? "" : ", consistent with home address");
    r.explanation = ss.str();
    return r;
}

AnomalyRecord AnomalyDetector::checkDigit(const AnomalySignals& s) const {
    AnomalyRecord r;
    r.dimension = Dimension::DIGIT;
    if (!s.benford_expected) {
        r.explanation = "No leading digit available";
        return r;
    }
    r.evaluated = true;

    double p = *s.benford_expected;
    r.is_anomaly = p < policy_.benford_min_expected;
    if (r.is_anomaly) r.severity = Severity::LOW;

    std::ostringstream ss;
    ss << "Leading digit " << s.first_digit.value_or(0) << " has Benford probability "
       << std::fixed << std::setprecision(1) << (p * 100.0) << "%";
    r.explanation = ss.str();
    return r;
}

void AnomalyDetector::aggregate(AnomalyReport& report) {
    int primary = 0;
    bool any_high = false;
    for (const AnomalyRecord* r : {&report.amount, &report.time, &report.location}) {
        if (!r->is_anomaly) continue;
        ++primary;
        if (r->severity == Severity::HIGH) any_high = true;
    }

    report.primary_count = primary;
    report.total_flags = primary + (report.digit.is_anomaly ? 1 : 0);

    if (primary >= 3) {
        report.overall = RiskLevel::CRITICAL;
    } else if (primary == 2 || (primary == 1 && any_high)) {
        report.overall = RiskLevel::HIGH;
    } else if (primary == 1) {
        report.overall = RiskLevel::MEDIUM;
    } else {
        report.overall = RiskLevel::LOW;
    }
}

} // namespace vigil::anomaly
