#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>

using namespace anonymizer;

TEST_CASE("Config: empty document yields defaults", "[config]") {
    const auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);
    CHECK(result.config.overrides.empty());
    CHECK(result.config.allowlist.empty());
    CHECK(result.config.default_strategy.reversible == "pseudonym");
    CHECK(result.config.default_strategy.irreversible == "hash");
    CHECK(result.config.safeguard.enabled);
    CHECK(result.config.safeguard.sensitive_attribute == "Medical Condition");
    CHECK(result.config.safeguard.min_diversity == 3);
    CHECK(result.config.safeguard.quasi_identifiers.size() == 4);
}

TEST_CASE("Config: full document", "[config]") {
    const std::string toml = R"(
allowlist = ["Notes", "Gender"]

[default_strategy]
reversible = "tokenize"
irreversible = "hash"

[[overrides]]
column = "Email"
detector_hint = "email"
technique = "mask"
params = { show_last = 4, mask_char = "#", strict = true, ratio = 0.5 }

[[overrides]]
column = "Code"
technique = "tokenize"

[safeguard]
enabled = false
sensitive_attribute = "Diagnosis"
quasi_identifiers = ["Zip"]
min_diversity = 2
suppression_label = "Hidden"
)";

    const auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.allowlist == std::vector<std::string>{"Notes", "Gender"});
    CHECK(cfg.default_strategy.reversible == "tokenize");

    REQUIRE(cfg.overrides.size() == 2);
    CHECK(cfg.overrides[0].column == "Email");
    CHECK(cfg.overrides[0].detector_hint == "email");
    CHECK(cfg.overrides[0].technique == "mask");
    CHECK(cfg.overrides[0].params.get_int("show_last") == 4);
    CHECK(cfg.overrides[0].params.get_string("mask_char") == "#");
    CHECK(cfg.overrides[0].params.get_double("ratio") == 0.5);
    CHECK(cfg.overrides[0].params.get_string("strict") == "true");
    CHECK(cfg.overrides[1].detector_hint == "custom");
    CHECK(cfg.overrides[1].params.empty());

    CHECK_FALSE(cfg.safeguard.enabled);
    CHECK(cfg.safeguard.sensitive_attribute == "Diagnosis");
    CHECK(cfg.safeguard.quasi_identifiers == std::vector<std::string>{"Zip"});
    CHECK(cfg.safeguard.min_diversity == 2);
    CHECK(cfg.safeguard.suppression_label == "Hidden");
}

TEST_CASE("Config: unknown technique names fail the load", "[config]") {
    const auto bad_override = ConfigLoader::load_from_string(R"(
[[overrides]]
column = "Email"
technique = "encrypt"
)");
    CHECK_FALSE(bad_override.success);
    CHECK(bad_override.error_message.find("Unsupported technique: encrypt") != std::string::npos);

    const auto bad_default = ConfigLoader::load_from_string(R"(
[default_strategy]
irreversible = "rot13"
)");
    CHECK_FALSE(bad_default.success);
}

TEST_CASE("Config: override without column or technique fails", "[config]") {
    CHECK_FALSE(ConfigLoader::load_from_string(R"(
[[overrides]]
technique = "mask"
)").success);

    CHECK_FALSE(ConfigLoader::load_from_string(R"(
[[overrides]]
column = "Email"
)").success);
}

TEST_CASE("Config: non-positive min_diversity fails", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[safeguard]
min_diversity = 0
)");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("min_diversity") != std::string::npos);
}

TEST_CASE("Config: malformed TOML is reported", "[config]") {
    const auto result = ConfigLoader::load_from_string("allowlist = [\"unterminated\"");
    CHECK_FALSE(result.success);
    CHECK_FALSE(result.error_message.empty());
}

TEST_CASE("Config: missing file is reported", "[config]") {
    const auto result = ConfigLoader::load_from_file("/nonexistent/anonymizer_config.toml");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Cannot open") != std::string::npos);
}

TEST_CASE("Config: env vars are expanded in strings", "[config][env]") {
    ::setenv("ANON_TEST_SALT", "pepper", 1);
    ::unsetenv("ANON_TEST_UNSET_VAR");

    const auto result = ConfigLoader::load_from_string(R"(
allowlist = ["${ANON_TEST_UNSET_VAR}Notes"]

[[overrides]]
column = "Code"
technique = "hash"
params = { salt = "${ANON_TEST_SALT}" }
)");
    REQUIRE(result.success);
    CHECK(result.config.allowlist[0] == "Notes");
    CHECK(result.config.overrides[0].params.get_string("salt") == "pepper");

    ::unsetenv("ANON_TEST_SALT");
}

TEST_CASE("Config: unclosed env reference fails the load", "[config][env]") {
    const auto result = ConfigLoader::load_from_string(R"(
allowlist = ["${BROKEN"]
)");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Unclosed") != std::string::npos);
}

TEST_CASE("Config: to_toml output loads back", "[config]") {
    ToolConfig config;
    config.allowlist = {"Notes"};
    OverrideRule rule;
    rule.column = "Name";
    rule.detector_hint = "name";
    rule.technique = "pseudonym";
    rule.params = ParamMap{{"seed", int64_t{1234}}, {"mode", std::string("name")}};
    config.overrides.push_back(rule);
    config.safeguard.min_diversity = 4;

    const auto text = ConfigLoader::to_toml(config);
    const auto reloaded = ConfigLoader::load_from_string(text);
    REQUIRE(reloaded.success);

    CHECK(reloaded.config.allowlist == config.allowlist);
    REQUIRE(reloaded.config.overrides.size() == 1);
    CHECK(reloaded.config.overrides[0].column == "Name");
    CHECK(reloaded.config.overrides[0].detector_hint == "name");
    CHECK(reloaded.config.overrides[0].params == rule.params);
    CHECK(reloaded.config.safeguard.min_diversity == 4);
}
