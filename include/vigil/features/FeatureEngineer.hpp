#pragma once
// =============================================================================
// FeatureEngineer.hpp - Raw transaction + history -> FeatureSet
// =============================================================================
// Pure function of its inputs and the injected, immutable frequency tables.
// No wall clock: a transaction without a timestamp is placed at the
// configured reference time.
//
// Failure policy:
//   - unparseable timestamp / dob, non-positive amount,
//     malformed history statistics              -> InvalidInputError
//   - missing optional fields                   -> documented defaults
//   - zero-variance history                     -> epsilon in the denominator
// Amounts and distances are never clipped.
// =============================================================================

#include "vigil/config/PolicyConfig.hpp"
#include "vigil/core/Time.hpp"
#include "vigil/core/Types.hpp"
#include "vigil/features/FeatureSet.hpp"
#include "vigil/features/FrequencyTable.hpp"

#include <memory>
#include <optional>
#include <string>
#include <unordered_set>

namespace vigil::features {

// Great-circle distance in km (R = 6371 km).
double haversineKm(double lat1, double lon1, double lat2, double lon2);

// First significant digit of a positive amount (1..9).
int firstSignificantDigit(double amount);

// Benford expected probability log10(1 + 1/d).
double benfordExpected(int digit);

class FeatureEngineer {
public:
    static constexpr const char* DEFAULT_CATEGORY = "unknown";
    static constexpr const char* DEFAULT_GENDER = "F";
    static constexpr const char* DEFAULT_STATE = "unknown";
    static constexpr const char* DEFAULT_JOB = "unknown";
    static constexpr double DEFAULT_DAYS_SINCE_LAST_TX = 999.0;

    FeatureEngineer(config::FeaturePolicy policy,
                    std::shared_ptr<const FrequencyTable> merchant_freq,
                    std::shared_ptr<const FrequencyTable> category_freq);

    FeatureSet engineer(const Transaction& tx,
                        const std::optional<CustomerHistory>& history) const;

    // Frequency-table key for a merchant name (offline export strips "fraud_").
    static std::string normalizeMerchant(const std::string& merchant);

private:
    void deriveTemporal(const CivilTime& t, const std::optional<CustomerHistory>& history,
                        FeatureSet& out) const;
    void deriveDemographic(const Transaction& tx, const CivilTime& t, FeatureSet& out) const;
    void deriveGeo(const Transaction& tx, FeatureSet& out) const;
    void deriveAmount(double amount, FeatureSet& out) const;
    void deriveMerchant(const Transaction& tx, FeatureSet& out) const;
    void deriveBehavior(double amount, const std::optional<CustomerHistory>& history,
                        FeatureSet& out) const;
    static void deriveInteractions(FeatureSet& out);

    config::FeaturePolicy policy_;
    std::shared_ptr<const FrequencyTable> merchant_freq_;
    std::shared_ptr<const FrequencyTable> category_freq_;
    std::unordered_set<std::string> high_risk_categories_;
    CivilTime reference_time_;
    double category_default_ = 1.0;
};

} // namespace vigil::features
