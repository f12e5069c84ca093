#pragma once
// =============================================================================
// FeatureSet.hpp - Engineered features for one transaction
// =============================================================================
// Every feature the encoder may request is a typed member here; there is no
// string-keyed bag. The column catalogue below binds each member to the
// exact column name and kind the trained encoder was fitted on.
//
// Column order (numeric block, then categorical block) matches the training
// ColumnTransformer. Auxiliary columns follow; the encoder never asks for
// them but the anomaly detector and business rules do.
// =============================================================================

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vigil::features {

enum class ColumnKind : uint8_t {
    NUMERIC     = 0,
    CATEGORICAL = 1
};

inline const char* columnKindToStr(ColumnKind k) {
    return k == ColumnKind::NUMERIC ? "numeric" : "categorical";
}

enum class TimeOfDay : uint8_t { MORNING, AFTERNOON, EVENING, NIGHT };
enum class AgeGroup : uint8_t { UNDER_25, AGE_25_35, AGE_35_50, AGE_50_65, OVER_65 };
enum class DistanceBucket : uint8_t { VERY_CLOSE, CLOSE, MEDIUM, FAR, VERY_FAR };
enum class AmountTier : uint8_t { MICRO, SMALL, MEDIUM, LARGE, VERY_LARGE };

const char* timeOfDayToStr(TimeOfDay t);
const char* ageGroupToStr(AgeGroup g);
const char* distanceBucketToStr(DistanceBucket d);
const char* amountTierToStr(AmountTier a);

struct TemporalFeatures {
    int hour = 0;
    int day_of_week = 0;        // Monday = 0
    int day_of_month = 1;
    int month = 1;
    int year = 1970;

    bool is_weekend = false;
    bool is_night = false;
    bool is_business_hours = false;
    bool is_fraud_peak_hour = false;
    bool is_unusual_hour = false;   // outside the customer's usual hours

    double hour_sin = 0.0, hour_cos = 1.0;
    double day_of_week_sin = 0.0, day_of_week_cos = 1.0;
    double month_sin = 0.0, month_cos = 1.0;
    double day_of_month_sin = 0.0, day_of_month_cos = 1.0;

    double hour_risk_score = 0.01;
    TimeOfDay time_of_day = TimeOfDay::NIGHT;
};

struct DemographicFeatures {
    double age = 0.0;
    AgeGroup age_group = AgeGroup::UNDER_25;
    std::string gender;
    std::string state;
    std::string job;
    double city_pop = 0.0;
};

struct GeoFeatures {
    double lat = 0.0;
    double lon = 0.0;
    double merch_lat = 0.0;
    double merch_lon = 0.0;
    double distance_km = 0.0;
    bool distance_reported = false;   // taken verbatim from the transaction
    DistanceBucket distance_cat = DistanceBucket::VERY_CLOSE;
    bool is_long_distance = false;
    bool is_distant_tx = false;
};

struct AmountFeatures {
    double amt = 0.0;
    double log_amt = 0.0;
    double sqrt_amt = 0.0;
    double amt_rounded = 0.0;
    AmountTier amt_tier = AmountTier::MICRO;
    bool is_round_amt = false;
    bool is_exact_dollar = false;
    bool is_high_risk_amt = false;

    int first_digit = 1;
    double benford_expected = 0.0;
    double benford_log_prob = 0.0;
};

struct MerchantFeatures {
    std::string merchant;
    std::string category;
    double merch_freq = 1.0;
    double cat_freq = 1.0;
    bool merchant_known = false;
    bool category_known = false;
    bool is_high_risk_cat = false;
};

struct BehaviorFeatures {
    bool has_history = false;
    double cust_tx_count = 1.0;
    double days_since_last_tx = 999.0;
    double cust_avg_amt = 0.0;
    double cust_std_amt = 0.0;
    double amt_z_score = 0.0;
    std::optional<int64_t> tx_count_1h;
    std::optional<int64_t> tx_count_24h;
};

struct InteractionFeatures {
    double amt_x_dist = 0.0;
    double amt_x_night = 0.0;
    double dist_x_weekend = 0.0;
    double age_x_amt = 0.0;
};

struct FeatureValue {
    ColumnKind kind = ColumnKind::NUMERIC;
    double number = 0.0;
    std::string text;
};

struct FeatureSet {
    std::string transaction_id;

    TemporalFeatures temporal;
    DemographicFeatures demographic;
    GeoFeatures geo;
    AmountFeatures amount;
    MerchantFeatures merchant;
    BehaviorFeatures behavior;
    InteractionFeatures interaction;

    // Returns nullopt for a name outside the catalogue.
    std::optional<FeatureValue> column(const std::string& name) const;
};

struct ColumnSpec {
    const char* name;
    ColumnKind kind;
    bool encoder_input;     // false for auxiliary columns
    double (*numeric)(const FeatureSet&);
    std::string (*categorical)(const FeatureSet&);
};

// Full catalogue in encoder order. Built once, immutable.
const std::vector<ColumnSpec>& featureCatalog();
const ColumnSpec* findColumn(const std::string& name);

// Bitwise comparison of every catalogued column. Used to check that feature
// derivation is deterministic.
bool bitwiseEqual(const FeatureSet& a, const FeatureSet& b);

} // namespace vigil::features
