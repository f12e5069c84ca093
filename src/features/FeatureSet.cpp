#include "vigil/features/FeatureSet.hpp"

#include <cstring>
#include <unordered_map>

namespace vigil::features {

const char* timeOfDayToStr(TimeOfDay t) {
    switch (t) {
        case TimeOfDay::MORNING:   return "morning";
        case TimeOfDay::AFTERNOON: return "afternoon";
        case TimeOfDay::EVENING:   return "evening";
        case TimeOfDay::NIGHT:     return "night";
        default: return "unknown";
    }
}

const char* ageGroupToStr(AgeGroup g) {
    switch (g) {
        case AgeGroup::UNDER_25:  return "<25";
        case AgeGroup::AGE_25_35: return "25-35";
        case AgeGroup::AGE_35_50: return "35-50";
        case AgeGroup::AGE_50_65: return "50-65";
        case AgeGroup::OVER_65:   return "65+";
        default: return "unknown";
    }
}

const char* distanceBucketToStr(DistanceBucket d) {
    switch (d) {
        case DistanceBucket::VERY_CLOSE: return "very_close";
        case DistanceBucket::CLOSE:      return "close";
        case DistanceBucket::MEDIUM:     return "medium";
        case DistanceBucket::FAR:        return "far";
        case DistanceBucket::VERY_FAR:   return "very_far";
        default: return "unknown";
    }
}

const char* amountTierToStr(AmountTier a) {
    switch (a) {
        case AmountTier::MICRO:      return "micro";
        case AmountTier::SMALL:      return "small";
        case AmountTier::MEDIUM:     return "medium";
        case AmountTier::LARGE:      return "large";
        case AmountTier::VERY_LARGE: return "very_large";
        default: return "unknown";
    }
}

#define VIGIL_NUM(col, expr) \
    { col, ColumnKind::NUMERIC, true, \
      [](const FeatureSet& f) -> double { return static_cast<double>(expr); }, nullptr }
#define VIGIL_CAT(col, expr) \
    { col, ColumnKind::CATEGORICAL, true, nullptr, \
      [](const FeatureSet& f) -> std::string { return std::string(expr); } }
#define VIGIL_AUX(col, expr) \
    { col, ColumnKind::NUMERIC, false, \
      [](const FeatureSet& f) -> double { return static_cast<double>(expr); }, nullptr }

const std::vector<ColumnSpec>& featureCatalog() {
    static const std::vector<ColumnSpec> catalog = {
        // ── numeric block ──
        VIGIL_NUM("amt", f.amount.amt),
        VIGIL_NUM("lat", f.geo.lat),
        VIGIL_NUM("long", f.geo.lon),
        VIGIL_NUM("city_pop", f.demographic.city_pop),
        VIGIL_NUM("merch_lat", f.geo.merch_lat),
        VIGIL_NUM("merch_long", f.geo.merch_lon),
        VIGIL_NUM("hour", f.temporal.hour),
        VIGIL_NUM("day_of_week", f.temporal.day_of_week),
        VIGIL_NUM("day_of_month", f.temporal.day_of_month),
        VIGIL_NUM("month", f.temporal.month),
        VIGIL_NUM("year", f.temporal.year),
        VIGIL_NUM("is_weekend", f.temporal.is_weekend),
        VIGIL_NUM("is_night", f.temporal.is_night),
        VIGIL_NUM("is_business_hours", f.temporal.is_business_hours),
        VIGIL_NUM("hour_sin", f.temporal.hour_sin),
        VIGIL_NUM("hour_cos", f.temporal.hour_cos),
        VIGIL_NUM("day_of_week_sin", f.temporal.day_of_week_sin),
        VIGIL_NUM("day_of_week_cos", f.temporal.day_of_week_cos),
        VIGIL_NUM("month_sin", f.temporal.month_sin),
        VIGIL_NUM("month_cos", f.temporal.month_cos),
        VIGIL_NUM("day_of_month_sin", f.temporal.day_of_month_sin),
        VIGIL_NUM("day_of_month_cos", f.temporal.day_of_month_cos),
        VIGIL_NUM("age", f.demographic.age),
        VIGIL_NUM("distance_km", f.geo.distance_km),
        VIGIL_NUM("is_long_distance", f.geo.is_long_distance),
        VIGIL_NUM("log_amt", f.amount.log_amt),
        VIGIL_NUM("sqrt_amt", f.amount.sqrt_amt),
        VIGIL_NUM("amt_rounded", f.amount.amt_rounded),
        VIGIL_NUM("is_round_amt", f.amount.is_round_amt),
        VIGIL_NUM("is_exact_dollar", f.amount.is_exact_dollar),
        VIGIL_NUM("merch_freq", f.merchant.merch_freq),
        VIGIL_NUM("cat_freq", f.merchant.cat_freq),
        VIGIL_NUM("is_high_risk_cat", f.merchant.is_high_risk_cat),
        VIGIL_NUM("first_digit", f.amount.first_digit),
        VIGIL_NUM("benford_expected", f.amount.benford_expected),
        VIGIL_NUM("benford_log_prob", f.amount.benford_log_prob),
        VIGIL_NUM("is_fraud_peak_hour", f.temporal.is_fraud_peak_hour),
        VIGIL_NUM("hour_risk_score", f.temporal.hour_risk_score),
        VIGIL_NUM("is_high_risk_amt", f.amount.is_high_risk_amt),
        VIGIL_NUM("is_distant_tx", f.geo.is_distant_tx),
        VIGIL_NUM("cust_tx_count", f.behavior.cust_tx_count),
        VIGIL_NUM("days_since_last_tx", f.behavior.days_since_last_tx),
        VIGIL_NUM("cust_avg_amt", f.behavior.cust_avg_amt),
        VIGIL_NUM("cust_std_amt", f.behavior.cust_std_amt),
        VIGIL_NUM("amt_z_score", f.behavior.amt_z_score),
        VIGIL_NUM("amt_x_dist", f.interaction.amt_x_dist),
        VIGIL_NUM("amt_x_night", f.interaction.amt_x_night),
        VIGIL_NUM("dist_x_weekend", f.interaction.dist_x_weekend),
        VIGIL_NUM("age_x_amt", f.interaction.age_x_amt),

        // ── categorical block ──
        VIGIL_CAT("category", f.merchant.category),
        VIGIL_CAT("gender", f.demographic.gender),
        VIGIL_CAT("state", f.demographic.state),
        VIGIL_CAT("job", f.demographic.job),
        VIGIL_CAT("time_of_day", timeOfDayToStr(f.temporal.time_of_day)),
        VIGIL_CAT("age_group", ageGroupToStr(f.demographic.age_group)),
        VIGIL_CAT("distance_cat", distanceBucketToStr(f.geo.distance_cat)),
        VIGIL_CAT("amt_tier", amountTierToStr(f.amount.amt_tier)),

        // ── auxiliary ──
        VIGIL_AUX("is_unusual_hour", f.temporal.is_unusual_hour),
        VIGIL_AUX("has_history", f.behavior.has_history),
        VIGIL_AUX("tx_count_1h", f.behavior.tx_count_1h.value_or(0)),
        VIGIL_AUX("tx_count_24h", f.behavior.tx_count_24h.value_or(0)),
    };
    return catalog;
}

#undef VIGIL_NUM
#undef VIGIL_CAT
#undef VIGIL_AUX

const ColumnSpec* findColumn(const std::string& name) {
    static const std::unordered_map<std::string, const ColumnSpec*> index = [] {
        std::unordered_map<std::string, const ColumnSpec*> m;
        for (const auto& spec : featureCatalog()) m.emplace(spec.name, &spec);
        return m;
    }();
    auto it = index.find(name);
    return it == index.end() ? nullptr : it->second;
}

std::optional<FeatureValue> FeatureSet::column(const std::string& name) const {
    const ColumnSpec* spec = findColumn(name);
    if (!spec) return std::nullopt;

    FeatureValue v;
    v.kind = spec->kind;
    if (spec->kind == ColumnKind::NUMERIC) {
        v.number = spec->numeric(*this);
    } else {
        v.text = spec->categorical(*this);
    }
    return v;
}

bool bitwiseEqual(const FeatureSet& a, const FeatureSet& b) {
    if (a.transaction_id != b.transaction_id) return false;
    for (const auto& spec : featureCatalog()) {
        if (spec.kind == ColumnKind::NUMERIC) {
            double x = spec.numeric(a);
            double y = spec.numeric(b);
            if (std::memcmp(&x, &y, sizeof(double)) != 0) return false;
        } else if (spec.categorical(a) != spec.categorical(b)) {
            return false;
        }
    }
    return true;
}

} // namespace vigil::features
