// =============================================================================
// src/features_test.cpp - Feature engineering tests
// =============================================================================

#include <cmath>
#include <limits>
#include <memory>

#include "test_harness.hpp"
#include "vigil/core/Errors.hpp"
#include "vigil/core/Time.hpp"
#include "vigil/features/FeatureEngineer.hpp"

using namespace vigil;
using namespace vigil::features;

class FeatureTest : public test::TestHarness {
public:
    FeatureTest()
        : TestHarness("features")
        , engineer_(config::FeaturePolicy{},
                    std::make_shared<const FrequencyTable>(FrequencyTable(
                        std::unordered_map<std::string, double>{{"Kilback LLC", 4403.0},
                                                                {"Haley Group", 1577.0}})),
                    std::make_shared<const FrequencyTable>(FrequencyTable(
                        std::unordered_map<std::string, double>{
                            {"grocery_pos", 30.0}, {"food_dining", 20.0}, {"travel", 10.0}}))) {}

    void run_all_tests() {
        test_primitives();
        test_timestamps();
        test_temporal();
        test_demographic();
        test_geo();
        test_amount();
        test_merchant();
        test_behavior();
        test_invalid_input();
        test_catalog();
        test_determinism();
    }

private:
    FeatureEngineer engineer_;

    static Transaction baseTx() {
        Transaction tx;
        tx.transaction_id = "tx-1";
        tx.amount = 100.0;
        tx.timestamp = "2020-06-17T14:05:00";
        tx.merchant = "fraud_Kilback LLC";
        tx.category = "food_dining";
        return tx;
    }

    static CustomerHistory baseHistory() {
        CustomerHistory h;
        h.avg_amount = 100.0;
        h.std_amount = 20.0;
        h.transaction_count = 50;
        h.usual_hours = {9, 10, 11, 12, 13, 14, 15, 16, 17};
        h.days_since_last_tx = 1.5;
        return h;
    }

    void test_primitives() {
        section("Primitives");
        checkNear(haversineKm(40.7128, -74.0060, 34.0522, -118.2437), 3935.7, 5.0,
                  "haversine NYC -> LA");
        checkNear(haversineKm(10.0, 10.0, 10.0, 10.0), 0.0, 1e-9, "haversine same point");
        checkEq(firstSignificantDigit(0.0042), 4, "first digit of 0.0042");
        checkEq(firstSignificantDigit(987.5), 9, "first digit of 987.5");
        checkEq(firstSignificantDigit(100.0), 1, "first digit of 100");
        checkNear(benfordExpected(1), std::log10(2.0), 1e-12, "Benford P(1)");
        checkNear(benfordExpected(9), std::log10(10.0 / 9.0), 1e-12, "Benford P(9)");
        checkEq(FeatureEngineer::normalizeMerchant("fraud_Kilback LLC"), std::string("Kilback LLC"),
                "fraud_ prefix stripped");
        checkEq(FeatureEngineer::normalizeMerchant("Kilback LLC"), std::string("Kilback LLC"),
                "plain merchant untouched");
    }

    void test_timestamps() {
        section("Timestamp parsing");
        CivilTime t = parseTimestamp("2020-06-21T02:30:15");
        check(t.year == 2020 && t.month == 6 && t.day == 21 && t.hour == 2 && t.minute == 30 &&
                  t.second == 15,
              "ISO timestamp fields");
        checkEq(parseTimestamp("2020-06-21 02:30").hour, 2, "space separator, no seconds");
        checkEq(parseTimestamp("2020-06-21T23:59:59.123Z").hour, 23, "fraction and Z accepted");
        checkEq(parseTimestamp("2020-06-21T10:00:00+05:30").hour, 10, "offset dropped, naive hour kept");
        checkEq(parseTimestamp("2020-06-21").hour, 0, "date-only is midnight");
        checkEq(parseDate("2020-01-01").dayOfWeek(), 2, "2020-01-01 was a Wednesday");

        checkThrows<InvalidInputError>([] { parseTimestamp("21/06/2020"); }, "wrong layout rejected");
        checkThrows<InvalidInputError>([] { parseTimestamp("2020-02-30T00:00"); }, "Feb 30 rejected");
        checkThrows<InvalidInputError>([] { parseTimestamp("2020-06-21T24:00"); }, "hour 24 rejected");
        checkThrows<InvalidInputError>([] { parseTimestamp("2020-06-21T10:00junk"); },
                                       "trailing junk rejected");
    }

    void test_temporal() {
        section("Temporal features");
        Transaction tx = baseTx();
        tx.timestamp = "2020-06-21T02:30:00";   // Sunday
        FeatureSet f = engineer_.engineer(tx, baseHistory());

        checkEq(f.temporal.hour, 2, "hour");
        checkEq(f.temporal.day_of_week, 6, "Sunday is 6");
        check(f.temporal.is_weekend, "weekend flag");
        check(f.temporal.is_night, "02:00 is night");
        check(f.temporal.is_fraud_peak_hour, "02:00 is fraud peak");
        checkNear(f.temporal.hour_risk_score, 0.25, 0.0, "early-hours risk score");
        check(f.temporal.time_of_day == TimeOfDay::NIGHT, "time of day night");
        check(f.temporal.is_unusual_hour, "02:00 outside usual hours");
        checkNear(f.temporal.hour_sin, 0.5, 1e-12, "hour_sin period 24");
        checkNear(f.interaction.amt_x_night, 100.0, 0.0, "amt_x_night carries amount at night");

        FeatureSet d = engineer_.engineer(baseTx(), baseHistory());   // Wednesday 14:05
        checkEq(d.temporal.day_of_week, 2, "Wednesday is 2");
        check(!d.temporal.is_weekend && !d.temporal.is_night, "weekday daytime");
        check(d.temporal.is_business_hours, "14:00 is business hours");
        checkNear(d.temporal.hour_risk_score, 0.01, 0.0, "daytime risk score");
        check(d.temporal.time_of_day == TimeOfDay::AFTERNOON, "afternoon");
        check(!d.temporal.is_unusual_hour, "14:00 is a usual hour");

        Transaction late = baseTx();
        late.timestamp = "2020-06-17T22:10:00";
        FeatureSet l = engineer_.engineer(late, std::nullopt);
        checkNear(l.temporal.hour_risk_score, 0.26, 0.0, "late-evening risk score");
        check(l.temporal.is_fraud_peak_hour && !l.temporal.is_night, "22:00 peak but not night");
        check(!l.temporal.is_unusual_hour, "no usual hours -> not unusual");

        Transaction none = baseTx();
        none.timestamp.reset();
        FeatureSet r = engineer_.engineer(none, std::nullopt);
        check(r.temporal.year == 2020 && r.temporal.month == 1 && r.temporal.day_of_month == 1 &&
                  r.temporal.hour == 0,
              "missing timestamp uses reference time");
    }

    void test_demographic() {
        section("Demographic features");
        Transaction tx = baseTx();
        tx.timestamp = "2020-06-21T02:30:00";
        tx.dob = "1990-06-21";
        tx.gender = "M";
        tx.state = "NY";
        tx.job = "Naval architect";
        tx.city_pop = 2500.0;
        FeatureSet f = engineer_.engineer(tx, std::nullopt);

        checkNear(f.demographic.age, 10958.0 / 365.25, 1e-9, "age from whole days / 365.25");
        check(f.demographic.age_group == AgeGroup::AGE_25_35, "age group 25-35");
        checkEq(f.demographic.gender, std::string("M"), "gender copied");
        checkNear(f.demographic.city_pop, 2500.0, 0.0, "city_pop copied");

        FeatureSet d = engineer_.engineer(baseTx(), std::nullopt);
        checkNear(d.demographic.age, 33.0, 0.0, "default age");
        checkEq(d.demographic.gender, std::string("F"), "default gender");
        checkEq(d.demographic.state, std::string("unknown"), "default state");
        checkEq(d.demographic.job, std::string("unknown"), "default job");
        checkNear(d.demographic.city_pop, 0.0, 0.0, "default city_pop");

        Transaction old = baseTx();
        old.dob = "1930-01-01";
        check(engineer_.engineer(old, std::nullopt).demographic.age_group == AgeGroup::OVER_65,
              "open-ended 65+ bin");

        Transaction young = baseTx();
        young.timestamp = "2020-06-17T14:05:00";
        young.dob = "1995-06-18";   // 9131 days, just under 25 years
        check(engineer_.engineer(young, std::nullopt).demographic.age_group == AgeGroup::UNDER_25,
              "just under 25 is <25");
    }

    void test_geo() {
        section("Geo features");
        Transaction tx = baseTx();
        tx.customer_location = GeoPoint{40.7128, -74.0060};
        tx.merchant_location = GeoPoint{34.0522, -118.2437};
        FeatureSet f = engineer_.engineer(tx, std::nullopt);
        checkNear(f.geo.distance_km, 3935.7, 5.0, "haversine distance when not reported");
        check(f.geo.distance_cat == DistanceBucket::VERY_FAR, "very_far bucket");
        check(f.geo.is_long_distance && f.geo.is_distant_tx, "long distance flags");

        tx.distance_from_home_km = 42.0;
        FeatureSet r = engineer_.engineer(tx, std::nullopt);
        checkNear(r.geo.distance_km, 42.0, 0.0, "reported distance used verbatim");
        check(r.geo.distance_reported, "reported flag set");
        check(r.geo.distance_cat == DistanceBucket::MEDIUM, "medium bucket");

        Transaction home = baseTx();
        home.customer_location = GeoPoint{41.0, -75.0};
        FeatureSet h = engineer_.engineer(home, std::nullopt);
        checkNear(h.geo.distance_km, 0.0, 0.0, "no merchant location -> distance 0");
        checkNear(h.geo.merch_lat, 41.0, 0.0, "merchant lat defaults to customer lat");

        Transaction edge = baseTx();
        edge.distance_from_home_km = 5.0;
        check(engineer_.engineer(edge, std::nullopt).geo.distance_cat == DistanceBucket::VERY_CLOSE,
              "5 km is very_close (right-inclusive)");
        edge.distance_from_home_km = 500.0;
        check(engineer_.engineer(edge, std::nullopt).geo.distance_cat == DistanceBucket::FAR,
              "500 km is far (right-inclusive)");

        Transaction bad = baseTx();
        bad.customer_location = GeoPoint{95.0, 0.0};
        checkThrows<InvalidInputError>([&] { engineer_.engineer(bad, std::nullopt); },
                                       "latitude out of range rejected");
    }

    void test_amount() {
        section("Amount features");
        FeatureSet f = engineer_.engineer(baseTx(), std::nullopt);
        checkNear(f.amount.log_amt, std::log1p(100.0), 1e-12, "log1p amount");
        checkNear(f.amount.sqrt_amt, 10.0, 1e-12, "sqrt amount");
        check(f.amount.is_round_amt && f.amount.is_exact_dollar, "100 is round and exact");
        check(f.amount.amt_tier == AmountTier::MEDIUM, "100 is medium tier (right-inclusive)");
        checkEq(f.amount.first_digit, 1, "first digit");

        Transaction tx = baseTx();
        tx.amount = 25.0;
        checkNear(engineer_.engineer(tx, std::nullopt).amount.amt_rounded, 20.0, 0.0,
                  "25 rounds half-to-even to 20");
        tx.amount = 35.0;
        checkNear(engineer_.engineer(tx, std::nullopt).amount.amt_rounded, 40.0, 0.0,
                  "35 rounds half-to-even to 40");
        tx.amount = 12.5;
        FeatureSet c = engineer_.engineer(tx, std::nullopt);
        check(!c.amount.is_round_amt && !c.amount.is_exact_dollar, "12.50 neither round nor exact");
        tx.amount = 500000.0;
        FeatureSet big = engineer_.engineer(tx, std::nullopt);
        check(big.amount.amt_tier == AmountTier::VERY_LARGE, "open-ended very_large tier");
        checkNear(big.amount.amt, 500000.0, 0.0, "amount never clipped");
        tx.amount = 900.0;
        check(engineer_.engineer(tx, std::nullopt).amount.is_high_risk_amt,
              "log amount in [6,8] is high risk");
    }

    void test_merchant() {
        section("Merchant / category features");
        FeatureSet f = engineer_.engineer(baseTx(), std::nullopt);
        checkNear(f.merchant.merch_freq, 4403.0, 0.0, "merchant found after prefix strip");
        check(f.merchant.merchant_known, "merchant known");
        checkNear(f.merchant.cat_freq, 20.0, 0.0, "category frequency");
        check(!f.merchant.is_high_risk_cat, "food_dining not high risk");

        Transaction tx = baseTx();
        tx.merchant = "Nowhere Inc";
        tx.category = "space_travel";
        FeatureSet u = engineer_.engineer(tx, std::nullopt);
        checkNear(u.merchant.merch_freq, 1.0, 0.0, "unseen merchant is rare");
        checkNear(u.merchant.cat_freq, 20.0, 0.0, "unseen category uses table median");
        check(!u.merchant.category_known, "category unknown");

        tx.category = "grocery_pos";
        check(engineer_.engineer(tx, std::nullopt).merchant.is_high_risk_cat,
              "grocery_pos is high risk");

        tx.category.clear();
        checkEq(engineer_.engineer(tx, std::nullopt).merchant.category, std::string("unknown"),
                "missing category defaults to unknown");
    }

    void test_behavior() {
        section("Behavioral features");
        FeatureSet n = engineer_.engineer(baseTx(), std::nullopt);
        check(!n.behavior.has_history, "no history");
        checkNear(n.behavior.cust_tx_count, 1.0, 0.0, "neutral count 1");
        checkNear(n.behavior.amt_z_score, 0.0, 0.0, "neutral z-score 0");
        checkNear(n.behavior.cust_avg_amt, 100.0, 0.0, "avg = amount");
        checkNear(n.behavior.cust_std_amt, 100.0, 0.0, "std = amount");
        checkNear(n.behavior.days_since_last_tx, 999.0, 0.0, "days since last 999");

        Transaction tx = baseTx();
        tx.amount = 160.0;
        FeatureSet h = engineer_.engineer(tx, baseHistory());
        checkNear(h.behavior.amt_z_score, 60.0 / (20.0 + 1e-6), 1e-12, "z-score with epsilon");
        checkNear(h.behavior.days_since_last_tx, 1.5, 0.0, "days since last copied");

        CustomerHistory flat = baseHistory();
        flat.std_amount = 0.0;
        tx.amount = 150.0;
        double z = engineer_.engineer(tx, flat).behavior.amt_z_score;
        check(std::isfinite(z) && z > 1e6, "zero variance gives large finite z-score");

        CustomerHistory empty = baseHistory();
        empty.transaction_count = 0;
        tx.timestamp = "2020-06-17T03:00:00";
        FeatureSet e = engineer_.engineer(tx, empty);
        check(!e.behavior.has_history && e.behavior.amt_z_score == 0.0,
              "count 0 history treated as absent");
        check(e.temporal.is_unusual_hour, "usual hours still applied for count 0");

        CustomerHistory velocity = baseHistory();
        velocity.transaction_count_1h = 5;
        FeatureSet v = engineer_.engineer(baseTx(), velocity);
        check(v.behavior.tx_count_1h && *v.behavior.tx_count_1h == 5, "velocity count carried");
    }

    void test_invalid_input() {
        section("Invalid input");
        Transaction tx = baseTx();
        tx.amount = 0.0;
        checkThrows<InvalidInputError>([&] { engineer_.engineer(tx, std::nullopt); }, "zero amount");
        tx.amount = -5.0;
        checkThrows<InvalidInputError>([&] { engineer_.engineer(tx, std::nullopt); }, "negative amount");
        tx.amount = std::numeric_limits<double>::quiet_NaN();
        checkThrows<InvalidInputError>([&] { engineer_.engineer(tx, std::nullopt); }, "NaN amount");

        Transaction ts = baseTx();
        ts.timestamp = "not a time";
        checkThrows<InvalidInputError>([&] { engineer_.engineer(ts, std::nullopt); },
                                       "unparseable timestamp");

        Transaction dob = baseTx();
        dob.dob = "2030-01-01";
        checkThrows<InvalidInputError>([&] { engineer_.engineer(dob, std::nullopt); },
                                       "dob after transaction");

        CustomerHistory neg = baseHistory();
        neg.std_amount = -1.0;
        checkThrows<InvalidInputError>([&] { engineer_.engineer(baseTx(), neg); }, "negative std");
        CustomerHistory hours = baseHistory();
        hours.usual_hours = {10, 24};
        checkThrows<InvalidInputError>([&] { engineer_.engineer(baseTx(), hours); },
                                       "usual hour out of range");
    }

    void test_catalog() {
        section("Column catalogue");
        const auto& cat = featureCatalog();
        int numeric = 0, categorical = 0, auxiliary = 0;
        for (const auto& c : cat) {
            if (!c.encoder_input) ++auxiliary;
            else if (c.kind == ColumnKind::NUMERIC) ++numeric;
            else ++categorical;
        }
        checkEq(numeric, 49, "49 numeric encoder columns");
        checkEq(categorical, 8, "8 categorical encoder columns");
        checkEq(auxiliary, 4, "4 auxiliary columns");

        FeatureSet f = engineer_.engineer(baseTx(), baseHistory());
        bool all = true;
        for (const auto& c : cat) {
            auto v = f.column(c.name);
            if (!v || v->kind != c.kind) all = false;
        }
        check(all, "every catalogued column resolves with its kind");
        check(!f.column("no_such_feature"), "unknown column is absent");
        checkEq(f.column("amt_tier")->text, std::string("medium"), "categorical text value");
        checkEq(f.column("age_group")->text, std::string("25-35"), "age group label");
        check(findColumn("amt") != nullptr && findColumn("nope") == nullptr, "findColumn");
    }

    void test_determinism() {
        section("Determinism");
        Transaction tx = baseTx();
        tx.dob = "1980-03-04";
        tx.customer_location = GeoPoint{40.0, -75.0};
        tx.merchant_location = GeoPoint{40.5, -74.2};
        FeatureSet a = engineer_.engineer(tx, baseHistory());
        FeatureSet b = engineer_.engineer(tx, baseHistory());
        check(bitwiseEqual(a, b), "same input yields bit-identical features");

        Transaction other = tx;
        other.amount = 100.01;
        check(!bitwiseEqual(a, engineer_.engineer(other, baseHistory())),
              "different input detected");
    }
};

int main() {
    FeatureTest t;
    t.run_all_tests();
    return t.finish();
}
