// =============================================================================
// src/main.cpp - vigil_score: score one transaction from the command line
// =============================================================================
// Usage: vigil_score [config.ini] [request.json]
//   config.ini    policy overrides and artifact manifest path (optional)
//   request.json  { "transaction": {...}, "customer_history": {...} }
//                 read from stdin when omitted or "-"
//
// Exit codes: 0 decision emitted (including degraded / system-error
// decisions), 1 unreadable request, 2 startup failure (config or artifacts).
// =============================================================================

#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "vigil/artifacts/ArtifactBundle.hpp"
#include "vigil/config/ConfigLoader.hpp"
#include "vigil/config/PolicyConfig.hpp"
#include "vigil/core/Errors.hpp"
#include "vigil/decision/DecisionPolicy.hpp"
#include "vigil/pipeline/DecisionRecord.hpp"
#include "vigil/pipeline/FraudPipeline.hpp"

using namespace vigil;

namespace {

constexpr int EXIT_DECISION = 0;
constexpr int EXIT_BAD_REQUEST = 1;
constexpr int EXIT_STARTUP = 2;

std::unique_ptr<pipeline::FraudPipeline> startup(const std::string& config_path) {
    config::ConfigLoader cfg;
    if (!config_path.empty() && !cfg.load(config_path)) {
        throw ConfigError("cannot read config " + config_path);
    }
    cfg.dump(std::cerr);
    config::PolicyConfig policy = config::PolicyConfig::fromConfig(cfg);

    auto bundle = artifacts::ArtifactLoader::load(policy.manifest_path);
    return std::make_unique<pipeline::FraudPipeline>(std::move(bundle), std::move(policy));
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path = argc > 1 ? argv[1] : "";
    std::string request_path = argc > 2 ? argv[2] : "-";

    std::unique_ptr<pipeline::FraudPipeline> fraud;
    try {
        fraud = startup(config_path);
    } catch (const VigilError& e) {
        std::cerr << "[VIGIL] Startup failed (" << e.kind() << "): " << e.what() << "\n";
        return EXIT_STARTUP;
    } catch (const std::exception& e) {
        std::cerr << "[VIGIL] Startup failed: " << e.what() << "\n";
        return EXIT_STARTUP;
    }

    nlohmann::json body;
    try {
        if (request_path == "-") {
            body = nlohmann::json::parse(std::cin);
        } else {
            std::ifstream in(request_path);
            if (!in) {
                std::cerr << "[VIGIL] Cannot open request " << request_path << "\n";
                return EXIT_BAD_REQUEST;
            }
            body = nlohmann::json::parse(in);
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[VIGIL] Request is not valid JSON: " << e.what() << "\n";
        return EXIT_BAD_REQUEST;
    }

    pipeline::PipelineResult result;
    try {
        pipeline::ScoringRequest req = pipeline::requestFromJson(body);
        result = fraud->evaluate(req.transaction, req.history);
    } catch (const InvalidInputError& e) {
        // Malformed request fields still get a reviewable decision.
        std::cerr << "[VIGIL] Rejected request: " << e.what() << "\n";
        result.status = pipeline::PipelineStatus::REJECTED;
        result.error_kind = e.kind();
        result.error_message = e.what();
        result.decision = decision::DecisionPolicy::systemError(e.kind(), e.what());
    }

    std::cout << pipeline::toJson(result).dump(2) << "\n";
    std::cerr << "[VIGIL] " << result.transaction_id << " -> "
              << actionToStr(result.decision.action) << " ("
              << pipeline::pipelineStatusToStr(result.status) << ")\n";
    return EXIT_DECISION;
}
