#pragma once
// =============================================================================
// DecisionRecord.hpp - JSON request decoding and audit record encoding
// =============================================================================
// Request:  { "transaction": {...}, "customer_history": {...} }   (history optional)
// Record:   transaction id, status, decision, risk score + breakdown,
//           anomaly report, ensemble prediction with per-model results and
//           failures, business rules, error kind/message when present.
// =============================================================================

#include "vigil/core/Types.hpp"
#include "vigil/pipeline/FraudPipeline.hpp"

#include <optional>

#include <nlohmann/json.hpp>

namespace vigil::pipeline {

struct ScoringRequest {
    Transaction transaction;
    std::optional<CustomerHistory> history;
};

// Throws InvalidInputError on missing required fields or wrong JSON types.
Transaction transactionFromJson(const nlohmann::json& j);
CustomerHistory historyFromJson(const nlohmann::json& j);
ScoringRequest requestFromJson(const nlohmann::json& j);

nlohmann::json toJson(const decision::Decision& d);
nlohmann::json toJson(const anomaly::AnomalyReport& a);
nlohmann::json toJson(const ml::EnsemblePrediction& p);
nlohmann::json toJson(const risk::RiskScore& s);
nlohmann::json toJson(const PipelineResult& r);

} // namespace vigil::pipeline
