#include "vigil/pipeline/DecisionRecord.hpp"
#include "vigil/core/Errors.hpp"

#include <cstdint>
#include <limits>

namespace vigil::pipeline {

using json = nlohmann::json;

namespace {

const json* field(const json& j, std::initializer_list<const char*> names) {
    for (const char* n : names) {
        auto it = j.find(n);
        if (it != j.end() && !it->is_null()) return &*it;
    }
    return nullptr;
}

template <typename T>
std::optional<T> opt(const json& j, std::initializer_list<const char*> names) {
    const json* v = field(j, names);
    if (!v) return std::nullopt;
    try {
        return v->get<T>();
    } catch (const json::exception& e) {
        throw InvalidInputError(std::string("field '") + *names.begin() + "': " + e.what());
    }
}

template <typename T>
T req(const json& j, std::initializer_list<const char*> names) {
    auto v = opt<T>(j, names);
    if (!v) throw InvalidInputError(std::string("missing required field '") + *names.begin() + "'");
    return *v;
}

// Postal codes and the like arrive as either strings or numbers.
std::optional<std::string> optText(const json& j, std::initializer_list<const char*> names) {
    const json* v = field(j, names);
    if (!v) return std::nullopt;
    if (v->is_string()) return v->get<std::string>();
    if (v->is_number_integer()) return v->dump();
    throw InvalidInputError(std::string("field '") + *names.begin() + "' must be a string");
}

// Counts must be JSON integers; floats such as 1e30 would not fit.
std::optional<int64_t> optCount(const json& j, std::initializer_list<const char*> names) {
    const json* v = field(j, names);
    if (!v) return std::nullopt;
    if (v->is_number_unsigned() &&
        v->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        throw InvalidInputError(std::string("field '") + *names.begin() + "' is out of range");
    }
    if (!v->is_number_integer()) {
        throw InvalidInputError(std::string("field '") + *names.begin() + "' must be an integer");
    }
    return v->get<int64_t>();
}

std::optional<GeoPoint> optPoint(const json& j, const char* lat, const char* lon) {
    auto la = opt<double>(j, {lat});
    auto lo = opt<double>(j, {lon});
    if (!la && !lo) return std::nullopt;
    if (!la || !lo) {
        throw InvalidInputError(std::string("'") + lat + "' and '" + lon + "' must be given together");
    }
    return GeoPoint{*la, *lo};
}

json optionalNumber(const std::optional<double>& v) {
    return v ? json(*v) : json(nullptr);
}

json recordJson(const anomaly::AnomalyRecord& r) {
    return {{"is_anomaly", r.is_anomaly},
            {"severity", severityToStr(r.severity)},
            {"evaluated", r.evaluated},
            {"explanation", r.explanation}};
}

} // namespace

Transaction transactionFromJson(const json& j) {
    if (!j.is_object()) throw InvalidInputError("transaction must be a JSON object");

    Transaction tx;
    tx.transaction_id = optText(j, {"transaction_id", "trans_num"}).value_or("");
    tx.customer_id = optText(j, {"customer_id", "cc_num"}).value_or("");
    tx.amount = req<double>(j, {"amount", "amt"});
    tx.timestamp = opt<std::string>(j, {"timestamp", "trans_date_trans_time"});
    tx.merchant = opt<std::string>(j, {"merchant"}).value_or("");
    tx.category = opt<std::string>(j, {"category"}).value_or("");

    tx.customer_location = optPoint(j, "lat", "long");
    tx.merchant_location = optPoint(j, "merch_lat", "merch_long");
    tx.distance_from_home_km = opt<double>(j, {"distance_from_home", "distance_from_home_km"});

    tx.dob = opt<std::string>(j, {"dob"});
    tx.gender = opt<std::string>(j, {"gender"});
    tx.state = opt<std::string>(j, {"state"});
    tx.city = opt<std::string>(j, {"city"});
    tx.zip = optText(j, {"zip"});
    tx.job = opt<std::string>(j, {"job"});
    tx.city_pop = opt<double>(j, {"city_pop"});
    return tx;
}

CustomerHistory historyFromJson(const json& j) {
    if (!j.is_object()) throw InvalidInputError("customer_history must be a JSON object");

    CustomerHistory h;
    h.avg_amount = req<double>(j, {"avg_amount", "cust_avg_amt"});
    h.std_amount = opt<double>(j, {"std_amount", "cust_std_amt"}).value_or(0.0);
    auto count = optCount(j, {"transaction_count", "cust_tx_count"});
    if (!count) throw InvalidInputError("missing required field 'transaction_count'");
    h.transaction_count = *count;
    h.usual_hours = opt<std::vector<int>>(j, {"usual_hours"}).value_or(std::vector<int>{});
    h.days_since_last_tx = opt<double>(j, {"days_since_last_tx"});
    h.transaction_count_1h = optCount(j, {"transaction_count_1h"});
    h.transaction_count_24h = optCount(j, {"transaction_count_24h"});
    return h;
}

ScoringRequest requestFromJson(const json& j) {
    if (!j.is_object()) throw InvalidInputError("request must be a JSON object");
    ScoringRequest r;
    // A bare transaction object is accepted as well.
    const json& tx = j.contains("transaction") ? j.at("transaction") : j;
    r.transaction = transactionFromJson(tx);
    if (const json* h = field(j, {"customer_history"})) r.history = historyFromJson(*h);
    return r;
}

// ─────────────────────────────────────────────────────────────────────────────
// Encoding
// ─────────────────────────────────────────────────────────────────────────────

json toJson(const decision::Decision& d) {
    return {{"action", actionToStr(d.action)},
            {"confidence", d.confidence},
            {"reasoning", d.reasoning},
            {"key_factors", d.key_factors},
            {"recommended_actions", d.recommended_actions},
            {"alert_level", riskLevelToStr(d.alert_level)},
            {"system_error", d.system_error}};
}

json toJson(const anomaly::AnomalyReport& a) {
    return {{"amount", recordJson(a.amount)},
            {"time", recordJson(a.time)},
            {"location", recordJson(a.location)},
            {"digit_pattern", recordJson(a.digit)},
            {"amount_z_score", optionalNumber(a.amount_z_score)},
            {"distance_km", optionalNumber(a.distance_km)},
            {"hour", a.hour ? json(*a.hour) : json(nullptr)},
            {"overall_risk", riskLevelToStr(a.overall)},
            {"primary_flags", a.primary_count},
            {"total_flags", a.total_flags}};
}

json toJson(const ml::EnsemblePrediction& p) {
    json models = json::array();
    for (const auto& m : p.models) {
        models.push_back({{"model", m.model},
                          {"probability", m.probability},
                          {"is_fraud", m.is_fraud},
                          {"weight", m.weight}});
    }
    json failures = json::array();
    for (const auto& f : p.failures) failures.push_back({{"model", f.model}, {"reason", f.reason}});

    return {{"available", p.available},
            {"fraud_probability", p.available ? json(p.probability) : json(nullptr)},
            {"is_fraud", p.is_fraud},
            {"consensus", ml::consensusToStr(p.consensus)},
            {"spread", p.spread},
            {"models", models},
            {"failures", failures}};
}

json toJson(const risk::RiskScore& s) {
    json j = {{"total", s.total},
              {"category", riskLevelToStr(s.category)},
              {"breakdown",
               {{"model", s.breakdown.model},
                {"anomalies", s.breakdown.anomalies},
                {"business", s.breakdown.business}}},
              {"model_unavailable", s.model_unavailable},
              {"override_applied", s.override_applied}};
    if (s.override_zscore) j["override_zscore"] = *s.override_zscore;
    return j;
}

json toJson(const PipelineResult& r) {
    json j = {{"transaction_id", r.transaction_id},
              {"status", pipelineStatusToStr(r.status)},
              {"decision", toJson(r.decision)}};
    if (r.risk_score) j["risk_score"] = toJson(*r.risk_score);
    if (r.anomalies) j["anomalies"] = toJson(*r.anomalies);
    if (r.prediction) j["prediction"] = toJson(*r.prediction);
    if (r.business_rules) j["business_rules"] = r.business_rules->active();
    if (!r.error_kind.empty()) {
        j["error"] = {{"kind", r.error_kind}, {"message", r.error_message}};
    }
    return j;
}

} // namespace vigil::pipeline
