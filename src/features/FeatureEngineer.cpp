#include "vigil/features/FeatureEngineer.hpp"
#include "vigil/core/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>

namespace vigil::features {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kEarthRadiusKm = 6371.0;
constexpr const char* kMerchantPrefix = "fraud_";

void cyclical(double value, double period, double& s, double& c) {
    s = std::sin(2.0 * kPi * value / period);
    c = std::cos(2.0 * kPi * value / period);
}

std::string orDefault(const std::optional<std::string>& v, const char* fallback) {
    if (!v || v->empty()) return fallback;
    return *v;
}

void requireFinite(double v, const char* field) {
    if (!std::isfinite(v)) {
        throw InvalidInputError(std::string(field) + " is not a finite number");
    }
}

void requireCoordinate(const GeoPoint& p, const char* field) {
    requireFinite(p.lat, field);
    requireFinite(p.lon, field);
    if (p.lat < -90.0 || p.lat > 90.0 || p.lon < -180.0 || p.lon > 180.0) {
        throw InvalidInputError(std::string(field) + " outside valid lat/long range");
    }
}

// Training-time hour contract (fixed by the fitted encoder, not policy).
bool isNightHour(int h) { return h >= 23 || h <= 6; }
bool isPeakFraudHour(int h) { return h >= 22 || h <= 3; }

double hourRiskScore(int h) {
    if (h <= 3) return 0.25;
    if (h >= 22) return 0.26;
    return 0.01;
}

TimeOfDay timeOfDay(int h) {
    if (h >= 6 && h < 12) return TimeOfDay::MORNING;
    if (h >= 12 && h < 18) return TimeOfDay::AFTERNOON;
    if (h >= 18) return TimeOfDay::EVENING;
    return TimeOfDay::NIGHT;
}

// Right-inclusive bins; the top bin is open-ended.
AgeGroup ageGroup(double age) {
    if (age <= 25.0) return AgeGroup::UNDER_25;
    if (age <= 35.0) return AgeGroup::AGE_25_35;
    if (age <= 50.0) return AgeGroup::AGE_35_50;
    if (age <= 65.0) return AgeGroup::AGE_50_65;
    return AgeGroup::OVER_65;
}

DistanceBucket distanceBucket(double km) {
    if (km <= 5.0) return DistanceBucket::VERY_CLOSE;
    if (km <= 25.0) return DistanceBucket::CLOSE;
    if (km <= 100.0) return DistanceBucket::MEDIUM;
    if (km <= 500.0) return DistanceBucket::FAR;
    return DistanceBucket::VERY_FAR;
}

AmountTier amountTier(double amt) {
    if (amt <= 10.0) return AmountTier::MICRO;
    if (amt <= 50.0) return AmountTier::SMALL;
    if (amt <= 100.0) return AmountTier::MEDIUM;
    if (amt <= 500.0) return AmountTier::LARGE;
    return AmountTier::VERY_LARGE;
}

} // namespace

double haversineKm(double lat1, double lon1, double lat2, double lon2) {
    const double rad = kPi / 180.0;
    double phi1 = lat1 * rad;
    double phi2 = lat2 * rad;
    double dphi = (lat2 - lat1) * rad;
    double dlambda = (lon2 - lon1) * rad;
    double a = std::sin(dphi / 2) * std::sin(dphi / 2) +
               std::cos(phi1) * std::cos(phi2) * std::sin(dlambda / 2) * std::sin(dlambda / 2);
    return 2.0 * kEarthRadiusKm * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
}

int firstSignificantDigit(double amount) {
    if (!(amount > 0.0) || !std::isfinite(amount)) return 1;
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.14e", amount);
    int d = buf[0] - '0';
    return (d >= 1 && d <= 9) ? d : 1;
}

double benfordExpected(int digit) {
    if (digit < 1 || digit > 9) digit = 1;
    return std::log10(1.0 + 1.0 / static_cast<double>(digit));
}

std::string FeatureEngineer::normalizeMerchant(const std::string& merchant) {
    const std::string prefix(kMerchantPrefix);
    if (merchant.compare(0, prefix.size(), prefix) == 0) {
        return merchant.substr(prefix.size());
    }
    return merchant;
}

FeatureEngineer::FeatureEngineer(config::FeaturePolicy policy,
                                 std::shared_ptr<const FrequencyTable> merchant_freq,
                                 std::shared_ptr<const FrequencyTable> category_freq)
    : policy_(std::move(policy))
    , merchant_freq_(std::move(merchant_freq))
    , category_freq_(std::move(category_freq))
    , high_risk_categories_(policy_.high_risk_categories.begin(),
                            policy_.high_risk_categories.end())
    , reference_time_(parseTimestamp(policy_.reference_time)) {
    if (policy_.category_default_frequency > 0.0) {
        category_default_ = policy_.category_default_frequency;
    } else if (category_freq_ && !category_freq_->empty()) {
        category_default_ = category_freq_->median();
    } else {
        category_default_ = 1.0;
    }
}

FeatureSet FeatureEngineer::engineer(const Transaction& tx,
                                     const std::optional<CustomerHistory>& history) const {
    requireFinite(tx.amount, "amount");
    if (tx.amount <= 0.0) {
        throw InvalidInputError("amount must be positive, got " + std::to_string(tx.amount));
    }

    CivilTime when = tx.timestamp ? parseTimestamp(*tx.timestamp) : reference_time_;

    // count == 0 carries no baseline: same as no history at all
    std::optional<CustomerHistory> baseline;
    if (history) {
        if (history->transaction_count < 0) {
            throw InvalidInputError("customer history transaction_count is negative");
        }
        for (int h : history->usual_hours) {
            if (h < 0 || h > 23) {
                throw InvalidInputError("usual_hours entry out of range: " + std::to_string(h));
            }
        }
        if (history->transaction_count > 0) baseline = history;
    }

    FeatureSet out;
    out.transaction_id = tx.transaction_id;

    deriveTemporal(when, history, out);
    deriveDemographic(tx, when, out);
    deriveGeo(tx, out);
    deriveAmount(tx.amount, out);
    deriveMerchant(tx, out);
    deriveBehavior(tx.amount, baseline, out);
    deriveInteractions(out);
    return out;
}

void FeatureEngineer::deriveTemporal(const CivilTime& t,
                                     const std::optional<CustomerHistory>& history,
                                     FeatureSet& out) const {
    TemporalFeatures& f = out.temporal;
    f.hour = t.hour;
    f.day_of_week = t.dayOfWeek();
    f.day_of_month = t.day;
    f.month = t.month;
    f.year = t.year;

    f.is_weekend = f.day_of_week >= 5;
    f.is_night = isNightHour(f.hour);
    f.is_business_hours = f.hour >= 9 && f.hour <= 17;
    f.is_fraud_peak_hour = isPeakFraudHour(f.hour);
    f.hour_risk_score = hourRiskScore(f.hour);
    f.time_of_day = timeOfDay(f.hour);

    if (history && !history->usual_hours.empty()) {
        const auto& hours = history->usual_hours;
        f.is_unusual_hour = std::find(hours.begin(), hours.end(), f.hour) == hours.end();
    }

    cyclical(f.hour, 24.0, f.hour_sin, f.hour_cos);
    cyclical(f.day_of_week, 7.0, f.day_of_week_sin, f.day_of_week_cos);
    cyclical(f.month, 12.0, f.month_sin, f.month_cos);
    cyclical(f.day_of_month, 31.0, f.day_of_month_sin, f.day_of_month_cos);
}

void FeatureEngineer::deriveDemographic(const Transaction& tx, const CivilTime& t,
                                        FeatureSet& out) const {
    DemographicFeatures& f = out.demographic;

    if (tx.dob && !tx.dob->empty()) {
        CivilTime dob = parseDate(*tx.dob);
        int64_t days = wholeDaysBetween(dob, t);
        if (days < 0) {
            throw InvalidInputError("date of birth " + *tx.dob + " is after the transaction time");
        }
        f.age = static_cast<double>(days) / 365.25;
    } else {
        f.age = policy_.default_age_years;
    }
    f.age_group = ageGroup(f.age);

    f.gender = orDefault(tx.gender, DEFAULT_GENDER);
    f.state = orDefault(tx.state, DEFAULT_STATE);
    f.job = orDefault(tx.job, DEFAULT_JOB);

    if (tx.city_pop) {
        requireFinite(*tx.city_pop, "city_pop");
        if (*tx.city_pop < 0.0) throw InvalidInputError("city_pop is negative");
        f.city_pop = *tx.city_pop;
    } else {
        f.city_pop = 0.0;
    }
}

void FeatureEngineer::deriveGeo(const Transaction& tx, FeatureSet& out) const {
    GeoFeatures& f = out.geo;

    if (tx.customer_location) {
        requireCoordinate(*tx.customer_location, "customer location");
        f.lat = tx.customer_location->lat;
        f.lon = tx.customer_location->lon;
    }
    if (tx.merchant_location) {
        requireCoordinate(*tx.merchant_location, "merchant location");
        f.merch_lat = tx.merchant_location->lat;
        f.merch_lon = tx.merchant_location->lon;
    } else {
        f.merch_lat = f.lat;
        f.merch_lon = f.lon;
    }

    if (tx.distance_from_home_km) {
        // Reported distance is authoritative and used verbatim.
        requireFinite(*tx.distance_from_home_km, "distance_from_home");
        if (*tx.distance_from_home_km < 0.0) {
            throw InvalidInputError("distance_from_home is negative");
        }
        f.distance_km = *tx.distance_from_home_km;
        f.distance_reported = true;
    } else if (tx.customer_location && tx.merchant_location) {
        f.distance_km = haversineKm(f.lat, f.lon, f.merch_lat, f.merch_lon);
    } else {
        f.distance_km = 0.0;
    }

    f.distance_cat = distanceBucket(f.distance_km);
    f.is_long_distance = f.distance_km > 100.0;
    f.is_distant_tx = f.distance_km > 80.0;
}

void FeatureEngineer::deriveAmount(double amount, FeatureSet& out) const {
    AmountFeatures& f = out.amount;
    f.amt = amount;
    f.log_amt = std::log1p(amount);
    f.sqrt_amt = std::sqrt(amount);
    f.amt_rounded = std::nearbyint(amount / 10.0) * 10.0;
    f.amt_tier = amountTier(amount);
    f.is_round_amt = std::fmod(amount, 10.0) == 0.0;
    f.is_exact_dollar = amount == std::floor(amount);
    f.is_high_risk_amt = f.log_amt >= 6.0 && f.log_amt <= 8.0;

    f.first_digit = firstSignificantDigit(amount);
    f.benford_expected = benfordExpected(f.first_digit);
    f.benford_log_prob = std::log(f.benford_expected);
}

void FeatureEngineer::deriveMerchant(const Transaction& tx, FeatureSet& out) const {
    MerchantFeatures& f = out.merchant;
    f.merchant = tx.merchant;
    f.category = tx.category.empty() ? std::string(DEFAULT_CATEGORY) : tx.category;

    std::optional<double> mf;
    if (merchant_freq_ && !tx.merchant.empty()) {
        mf = merchant_freq_->lookup(normalizeMerchant(tx.merchant));
    }
    f.merchant_known = mf.has_value();
    f.merch_freq = mf.value_or(policy_.merchant_default_frequency);

    std::optional<double> cf;
    if (category_freq_) cf = category_freq_->lookup(f.category);
    f.category_known = cf.has_value();
    f.cat_freq = cf.value_or(category_default_);

    f.is_high_risk_cat = high_risk_categories_.count(f.category) > 0;
}

void FeatureEngineer::deriveBehavior(double amount, const std::optional<CustomerHistory>& history,
                                     FeatureSet& out) const {
    BehaviorFeatures& f = out.behavior;

    if (!history) {
        // Neutral new-customer baseline
        f.has_history = false;
        f.cust_tx_count = 1.0;
        f.cust_avg_amt = amount;
        f.cust_std_amt = amount;
        f.days_since_last_tx = DEFAULT_DAYS_SINCE_LAST_TX;
        f.amt_z_score = 0.0;
        return;
    }

    requireFinite(history->avg_amount, "customer history avg_amount");
    requireFinite(history->std_amount, "customer history std_amount");
    if (history->avg_amount < 0.0) throw InvalidInputError("customer history avg_amount is negative");
    if (history->std_amount < 0.0) throw InvalidInputError("customer history std_amount is negative");

    f.has_history = true;
    f.cust_tx_count = static_cast<double>(history->transaction_count);
    f.cust_avg_amt = history->avg_amount;
    f.cust_std_amt = history->std_amount;
    f.days_since_last_tx = history->days_since_last_tx.value_or(DEFAULT_DAYS_SINCE_LAST_TX);
    f.tx_count_1h = history->transaction_count_1h;
    f.tx_count_24h = history->transaction_count_24h;

    double z = (amount - f.cust_avg_amt) / (f.cust_std_amt + policy_.zscore_epsilon);
    if (!std::isfinite(z)) {
        z = std::copysign(std::numeric_limits<double>::max(), amount - f.cust_avg_amt);
    }
    f.amt_z_score = z;
}

void FeatureEngineer::deriveInteractions(FeatureSet& out) {
    InteractionFeatures& f = out.interaction;
    const double amt = out.amount.amt;
    f.amt_x_dist = amt * out.geo.distance_km;
    f.amt_x_night = out.temporal.is_night ? amt : 0.0;
    f.dist_x_weekend = out.temporal.is_weekend ? out.geo.distance_km : 0.0;
    f.age_x_amt = out.demographic.age * amt;
}

} // namespace vigil::features
