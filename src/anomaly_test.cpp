// =============================================================================
// src/anomaly_test.cpp - AnomalyDetector tests
// =============================================================================

#include "test_harness.hpp"
#include "vigil/anomaly/AnomalyDetector.hpp"

using namespace vigil;
using namespace vigil::anomaly;

class AnomalyTest : public test::TestHarness {
public:
    AnomalyTest() : TestHarness("anomaly"), detector_(config::AnomalyPolicy{}) {}

    void run_all_tests() {
        test_amount();
        test_time();
        test_location();
        test_digit();
        test_aggregation();
        test_partial_signals();
        test_custom_night_window();
    }

private:
    AnomalyDetector detector_;

    static AnomalySignals quiet() {
        AnomalySignals s;
        s.amount_z_score = 0.0;
        s.hour = 14;
        s.is_unusual_hour = false;
        s.distance_km = 5.0;
        s.first_digit = 1;
        s.benford_expected = 0.301;
        return s;
    }

    void test_amount() {
        section("Amount dimension");
        AnomalySignals s = quiet();
        s.amount_z_score = 3.0;
        check(!detector_.detect(s).amount.is_anomaly, "|z| = 3 does not fire");

        s.amount_z_score = 4.0;
        AnomalyReport r = detector_.detect(s);
        check(r.amount.is_anomaly && r.amount.severity == Severity::MEDIUM, "|z| = 4 is medium");
        check(r.amount.explanation.find("4.00 standard deviations") != std::string::npos,
              "explanation carries z-score", r.amount.explanation);

        s.amount_z_score = -7.5;
        r = detector_.detect(s);
        check(r.amount.is_anomaly && r.amount.severity == Severity::HIGH, "z = -7.5 is high");
    }

    void test_time() {
        section("Time dimension");
        AnomalySignals s = quiet();
        check(!detector_.detect(s).time.is_anomaly, "14:00 usual is normal");

        s.hour = 23;
        AnomalyReport r = detector_.detect(s);
        check(r.time.is_anomaly && r.time.severity == Severity::MEDIUM, "23:00 night is medium");

        s.hour = 6;
        check(detector_.detect(s).time.is_anomaly, "06:00 is inside the night window");
        s.hour = 7;
        check(!detector_.detect(s).time.is_anomaly, "07:00 is outside the night window");

        s.hour = 14;
        s.is_unusual_hour = true;
        r = detector_.detect(s);
        check(r.time.is_anomaly && r.time.severity == Severity::LOW, "unusual hour alone is low");

        s.hour = 2;
        r = detector_.detect(s);
        check(r.time.is_anomaly && r.time.severity == Severity::HIGH, "night and unusual is high");
    }

    void test_location() {
        section("Location dimension");
        AnomalySignals s = quiet();
        s.distance_km = 80.0;
        check(!detector_.detect(s).location.is_anomaly, "80 km does not fire");
        s.distance_km = 120.0;
        AnomalyReport r = detector_.detect(s);
        check(r.location.is_anomaly && r.location.severity == Severity::MEDIUM, "120 km is medium");
        s.distance_km = 5000.0;
        r = detector_.detect(s);
        check(r.location.is_anomaly && r.location.severity == Severity::HIGH, "5000 km is high");
    }

    void test_digit() {
        section("Digit pattern");
        AnomalySignals s = quiet();
        s.first_digit = 9;
        s.benford_expected = 0.0458;
        AnomalyReport r = detector_.detect(s);
        check(r.digit.is_anomaly && r.digit.severity == Severity::LOW, "leading 9 is a low flag");
        checkEq(r.primary_count, 0, "digit flag not a primary dimension");
        checkEq(r.total_flags, 1, "digit flag counted in total");
        check(r.overall == RiskLevel::LOW, "digit alone leaves band LOW");
    }

    void test_aggregation() {
        section("Aggregation");
        check(detector_.detect(quiet()).overall == RiskLevel::LOW, "nothing fires -> LOW");

        AnomalySignals one = quiet();
        one.distance_km = 120.0;
        check(detector_.detect(one).overall == RiskLevel::MEDIUM, "one medium -> MEDIUM");

        AnomalySignals oneHigh = quiet();
        oneHigh.amount_z_score = 9.0;
        check(detector_.detect(oneHigh).overall == RiskLevel::HIGH, "one high -> HIGH");

        AnomalySignals two = quiet();
        two.distance_km = 120.0;
        two.hour = 23;
        AnomalyReport r2 = detector_.detect(two);
        check(r2.overall == RiskLevel::HIGH, "two fire -> HIGH");
        checkEq(r2.countAtLeastMedium(), 2, "two at medium or above");

        AnomalySignals three = quiet();
        three.amount_z_score = 4.0;
        three.distance_km = 120.0;
        three.hour = 1;
        AnomalyReport r3 = detector_.detect(three);
        check(r3.overall == RiskLevel::CRITICAL, "three fire -> CRITICAL");
        checkEq(r3.primary_count, 3, "three primary flags");
        check(r3.hasSeverity(Severity::MEDIUM) && !r3.hasSeverity(Severity::HIGH), "severity query");
    }

    void test_partial_signals() {
        section("Partial signals");
        AnomalySignals s;   // everything absent
        AnomalyReport r = detector_.detect(s);
        check(!r.amount.evaluated && !r.amount.is_anomaly, "absent z-score not anomalous");
        check(!r.time.evaluated && !r.location.evaluated && !r.digit.evaluated,
              "absent dimensions not evaluated");
        check(r.overall == RiskLevel::LOW, "empty signals -> LOW");

        AnomalySignals partial;
        partial.distance_km = 900.0;
        AnomalyReport p = detector_.detect(partial);
        check(p.location.is_anomaly && p.overall == RiskLevel::HIGH,
              "present dimension still scored");
    }

    void test_custom_night_window() {
        section("Configured night window");
        config::AnomalyPolicy pol;
        pol.night_start_hour = 0;
        pol.night_end_hour = 5;
        AnomalyDetector d(pol);
        check(d.isNightHour(0) && d.isNightHour(5), "non-wrapping window inclusive");
        check(!d.isNightHour(23) && !d.isNightHour(6), "outside non-wrapping window");
        check(detector_.isNightHour(23) && detector_.isNightHour(3) && !detector_.isNightHour(12),
              "default window wraps midnight");
    }
};

int main() {
    AnomalyTest t;
    t.run_all_tests();
    return t.finish();
}
