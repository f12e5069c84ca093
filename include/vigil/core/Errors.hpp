#pragma once
// =============================================================================
// Errors.hpp - Vigil error taxonomy
// =============================================================================
// InvalidInputError          raw field unparseable / out of range, reject tx
// ConfigError                policy file unreadable or a value malformed,
//                            fatal at startup
// ArtifactUnavailableError   encoder / model / frequency table failed to load
// FeatureContractError       engineered features do not match encoder/model
// PredictionUnavailableError every ensemble member failed
//
// A single failing ensemble member is NOT an exception: it is recorded as a
// PartialModelFailure on the EnsemblePrediction. PredictionUnavailableError
// carries the full list so the audit record still names every model.
// =============================================================================

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace vigil {

struct PartialModelFailure {
    std::string model;
    std::string reason;
};

class VigilError : public std::runtime_error {
public:
    explicit VigilError(const std::string& what) : std::runtime_error(what) {}
    virtual const char* kind() const noexcept { return "VigilError"; }
};

class InvalidInputError : public VigilError {
public:
    explicit InvalidInputError(const std::string& what) : VigilError(what) {}
    const char* kind() const noexcept override { return "InvalidInputError"; }
};

class ConfigError : public VigilError {
public:
    explicit ConfigError(const std::string& what) : VigilError(what) {}
    const char* kind() const noexcept override { return "ConfigError"; }
};

class ArtifactUnavailableError : public VigilError {
public:
    explicit ArtifactUnavailableError(const std::string& what) : VigilError(what) {}
    const char* kind() const noexcept override { return "ArtifactUnavailableError"; }
};

class FeatureContractError : public VigilError {
public:
    explicit FeatureContractError(const std::string& what) : VigilError(what) {}
    const char* kind() const noexcept override { return "FeatureContractError"; }
};

class PredictionUnavailableError : public VigilError {
public:
    PredictionUnavailableError(const std::string& what,
                               std::vector<PartialModelFailure> failures = {})
        : VigilError(what)
        , failures_(std::move(failures)) {}
    const char* kind() const noexcept override { return "PredictionUnavailableError"; }

    const std::vector<PartialModelFailure>& failures() const noexcept { return failures_; }

private:
    std::vector<PartialModelFailure> failures_;
};

} // namespace vigil
