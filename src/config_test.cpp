// =============================================================================
// src/config_test.cpp - ConfigLoader / PolicyConfig tests
// =============================================================================

#include <sstream>

#include "test_harness.hpp"
#include "vigil/config/ConfigLoader.hpp"
#include "vigil/config/PolicyConfig.hpp"
#include "vigil/core/Errors.hpp"

using namespace vigil;
using namespace vigil::config;

class ConfigTest : public test::TestHarness {
public:
    ConfigTest() : TestHarness("config") {}

    void run_all_tests() {
        test_ini_parsing();
        test_typed_getters();
        test_set_and_dump();
        test_policy_defaults();
        test_policy_overrides();
        test_policy_validation();
        test_shipped_config();
    }

private:
    static ConfigLoader fromText(const std::string& text) {
        ConfigLoader cfg;
        std::istringstream in(text);
        cfg.parse(in);
        return cfg;
    }

    void test_ini_parsing() {
        section("INI parsing");
        ConfigLoader cfg = fromText(
            "# comment\n"
            "; also a comment\n"
            "[risk]\n"
            "  model_weight = 45  \n"
            "\n"
            "[features]\n"
            "high_risk_categories = a, b ,c\n");

        check(cfg.has("risk", "model_weight"), "section.key stored");
        checkEq(cfg.get("risk", "model_weight"), std::string("45"), "value trimmed");
        check(!cfg.has("risk", "missing"), "absent key reported absent");
        checkEq(cfg.size(), size_t(2), "comments and blanks skipped");

        auto list = cfg.getList("features", "high_risk_categories");
        check(list.size() == 3 && list[0] == "a" && list[1] == "b" && list[2] == "c",
              "comma list split and trimmed");

        checkThrows<ConfigError>([] { fromText("[broken\nkey = 1\n"); },
                                 "unterminated section rejected");
    }

    void test_typed_getters() {
        section("Typed getters");
        ConfigLoader cfg = fromText("[a]\nint = 7\ndbl = 0.25\nflag = yes\nbad = seven\n");

        checkEq(cfg.getInt("a", "int", 0), 7, "getInt");
        checkNear(cfg.getDouble("a", "dbl", 0.0), 0.25, 1e-12, "getDouble");
        check(cfg.getBool("a", "flag", false), "getBool accepts yes");
        checkEq(cfg.getInt("a", "absent", 42), 42, "default used only when absent");

        checkThrows<ConfigError>([&] { cfg.getInt("a", "bad", 3); },
                                 "malformed int throws instead of defaulting");
        checkThrows<ConfigError>([&] { cfg.getDouble("a", "bad", 3.0); },
                                 "malformed double throws instead of defaulting");
        checkEq(std::string(ConfigError("x").kind()), std::string("ConfigError"),
                "config faults are not transaction rejections");
    }

    void test_set_and_dump() {
        section("Set and dump");
        ConfigLoader cfg = fromText("[risk]\nmodel_weight = 45\n[decision]\nblock_above = 88\n");
        cfg.set("risk", "model_weight", "40");
        cfg.set("anomaly", "distance_km", "120");
        checkEq(cfg.getInt("risk", "model_weight", 0), 40, "set overrides parsed value");
        checkNear(cfg.getDouble("anomaly", "distance_km", 0.0), 120.0, 0.0, "set adds new key");

        std::ostringstream out;
        cfg.dump(out);
        const std::string text = out.str();
        check(text.find("[CONFIG] Loaded from: <memory>") == 0, "dump names the source", text);
        size_t anomaly = text.find("anomaly.distance_km = 120");
        size_t decision = text.find("decision.block_above = 88");
        size_t risk = text.find("risk.model_weight = 40");
        check(anomaly != std::string::npos && decision != std::string::npos &&
                  risk != std::string::npos && anomaly < decision && decision < risk,
              "dump lists every key sorted", text);
    }

    void test_policy_defaults() {
        section("Policy defaults");
        PolicyConfig p = PolicyConfig::fromConfig(ConfigLoader());

        checkEq(p.decision.approve_below, 30, "approve below 30");
        checkEq(p.decision.block_above, 90, "block above 90");
        checkNear(p.risk.model_weight, 50.0, 0.0, "model weight 50");
        checkNear(p.risk.anomaly_cap, 40.0, 0.0, "anomaly cap 40");
        checkNear(p.risk.extreme_zscore, 1000.0, 0.0, "extreme z-score 1000");
        checkEq(p.risk.low_max, 30, "LOW <= 30");
        checkEq(p.risk.medium_max, 60, "MEDIUM <= 60");
        checkEq(p.risk.high_max, 85, "HIGH <= 85");
        checkNear(p.ensemble.decision_threshold, 0.5, 0.0, "binary threshold 0.5");
        checkEq(p.features.high_risk_categories.size(), size_t(3), "three high-risk categories");
    }

    void test_policy_overrides() {
        section("Policy overrides");
        ConfigLoader cfg = fromText(
            "[decision]\nblock_above = 85\n"
            "[anomaly]\ndistance_km = 120\n"
            "[artifacts]\nmanifest = /tmp/other.json\n");
        PolicyConfig p = PolicyConfig::fromConfig(cfg);

        checkEq(p.decision.block_above, 85, "block threshold overridden");
        checkNear(p.anomaly.distance_km, 120.0, 0.0, "distance threshold overridden");
        checkEq(p.manifest_path, std::string("/tmp/other.json"), "manifest path overridden");
        checkEq(p.decision.approve_below, 30, "untouched keys keep defaults");
    }

    void test_policy_validation() {
        section("Policy validation");
        checkThrows<ConfigError>(
            [] { PolicyConfig::fromConfig(fromText("[risk]\nlow_max = 70\n")); },
            "low_max >= medium_max rejected");
        checkThrows<ConfigError>(
            [] { PolicyConfig::fromConfig(fromText("[ensemble]\ndecision_threshold = 1.5\n")); },
            "threshold outside (0,1) rejected");
        checkThrows<ConfigError>(
            [] { PolicyConfig::fromConfig(fromText("[risk]\nanomaly_cap = -1\n")); },
            "negative cap rejected");
        checkThrows<ConfigError>(
            [] { PolicyConfig::fromConfig(fromText("[decision]\napprove_below = 95\n")); },
            "approve above block rejected");
        checkThrows<ConfigError>(
            [] { PolicyConfig::fromConfig(fromText("[features]\nreference_time = yesterday\n")); },
            "unparseable reference time rejected");

        try {
            PolicyConfig::fromConfig(fromText("[risk]\nlow_max = 70\n"));
            test_fail("error names the key", "no exception");
        } catch (const ConfigError& e) {
            check(std::string(e.what()).find("risk.low_max") != std::string::npos,
                  "error names the key", e.what());
        }
    }

    void test_shipped_config() {
        section("Shipped config");
        ConfigLoader cfg;
        bool ok = cfg.load(std::string(VIGIL_SOURCE_DIR) + "/config/vigil.ini");
        check(ok, "config/vigil.ini loads");
        if (!ok) return;
        check(cfg.getConfigPath().find("config/vigil.ini") != std::string::npos,
              "source path remembered");

        PolicyConfig p = PolicyConfig::fromConfig(cfg);
        PolicyConfig d;
        check(p.decision.block_above == d.decision.block_above &&
                  p.risk.high_max == d.risk.high_max &&
                  p.anomaly.night_start_hour == d.anomaly.night_start_hour &&
                  p.features.high_risk_categories == d.features.high_risk_categories,
              "shipped values match built-in defaults");
        check(!cfg.load("/nonexistent/vigil.ini"), "missing file returns false");
    }
};

int main() {
    ConfigTest t;
    t.run_all_tests();
    return t.finish();
}
