#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "ethos/config/config.hpp"

#include <filesystem>

void register_config_tests(std::vector<ethos::tests::TestCase> &tests) {
  using ethos::tests::require;
  namespace cfg = ethos::config;

  tests.push_back({"config_defaults_match_documented_values", [] {
                     const auto config = cfg::default_config();
                     require(config.require_uncertainty, "uncertainty required by default");
                     require(config.threshold("overall_deny", 0.0) == 0.8, "overall_deny");
                     require(config.threshold("overall_escalate", 0.0) == 0.6, "overall_escalate");
                     require(config.principles.size() == 3, "three principles");
                     require(config.principles[0].name == "Evidence-based claims", "first principle");
                     require(config.escalation.size() == 1 &&
                                 config.escalation[0].action == "require_human_approval",
                             "escalation rule");
                     require(config.tool_policies.size() == 3, "three tool policies");
                     require(!config.tool_policies[2].allow &&
                                 config.tool_policies[2].tool_name == "delete_files",
                             "delete_files is denied");
                     require(config.keys.private_key == "sig.key", "private key path");
                   }});

  tests.push_back({"config_missing_file_yields_defaults", [] {
                     ethos::testing::TempWorkspace workspace;
                     const ethos::testing::EnvGuard backend("ETHOS_OBSERVABILITY", std::nullopt);
                     auto loaded = cfg::load_config(workspace.path() / "absent.toml");
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().tool_policies.size() == 3, "defaults expected");
                   }});

  tests.push_back({"config_render_parse_roundtrip", [] {
                     auto config = cfg::default_config();
                     config.require_uncertainty = false;
                     config.risk_thresholds["overall_deny"] = 0.65;
                     config.keys.private_key = "keys/a \"quoted\" key";
                     auto parsed = cfg::parse_config(cfg::render_config(config));
                     require(parsed.ok(), parsed.error());
                     const auto &value = parsed.value();
                     require(!value.require_uncertainty, "require_uncertainty");
                     require(value.threshold("overall_deny", 0.0) == 0.65, "overall_deny");
                     require(value.keys.private_key == "keys/a \"quoted\" key", value.keys.private_key);
                     require(value.principles.size() == 3, "principles");
                     require(value.principles[1].description ==
                                 "Detect and prevent sensitive data leakage.",
                             value.principles[1].description);
                     require(value.escalation.size() == 1 &&
                                 value.escalation[0].name == "high_overall_risk",
                             "escalation");
                     bool delete_denied = false;
                     for (const auto &policy : value.tool_policies) {
                       if (policy.tool_name == "delete_files") {
                         delete_denied = !policy.allow && policy.conditions == "always";
                       }
                     }
                     require(delete_denied, "delete_files policy lost");
                   }});

  tests.push_back({"config_invalid_threshold_value_is_config_error", [] {
                     auto parsed = cfg::parse_config("[risk_thresholds]\noverall_deny = \"high\"\n");
                     require(!parsed.ok(), "string threshold should fail");
                     require(parsed.kind() == ethos::common::ErrorKind::Config, "config error");
                   }});

  tests.push_back({"config_validation_rejects_out_of_range_threshold", [] {
                     auto config = cfg::default_config();
                     config.risk_thresholds["overall_deny"] = 1.5;
                     auto validated = cfg::validate_config(config);
                     require(!validated.ok(), "1.5 is out of range");
                   }});

  tests.push_back({"config_validation_warns_when_escalate_above_deny", [] {
                     auto config = cfg::default_config();
                     config.risk_thresholds["overall_escalate"] = 0.9;
                     auto validated = cfg::validate_config(config);
                     require(validated.ok(), validated.error());
                     require(!validated.value().empty(), "expected a warning");
                   }});

  tests.push_back({"config_validation_rejects_unknown_backend", [] {
                     auto config = cfg::default_config();
                     config.observability.backend = "prometheus";
                     require(!cfg::validate_config(config).ok(), "unknown backend");
                     config.observability.backend = "log, none";
                     require(cfg::validate_config(config).ok(), "comma list is valid");
                   }});

  tests.push_back({"config_env_overrides_backend", [] {
                     const ethos::testing::EnvGuard backend("ETHOS_OBSERVABILITY", "none");
                     auto config = cfg::default_config();
                     cfg::apply_env_overrides(config);
                     require(config.observability.backend == "none", config.observability.backend);
                   }});

  tests.push_back({"config_path_prefers_override_then_env", [] {
                     ethos::testing::TempWorkspace workspace;
                     const ethos::testing::ConfigOverrideGuard guard;
                     {
                       const ethos::testing::EnvGuard env("ETHOS_CONFIG_PATH",
                                                          (workspace.path() / "env.toml").string());
                       require(cfg::config_path() == workspace.path() / "env.toml",
                               cfg::config_path().string());
                       cfg::set_config_path_override(workspace.path());
                       require(cfg::config_path() == workspace.path() / "ethos.toml",
                               cfg::config_path().string());
                     }
                     cfg::clear_config_path_override();
                     const ethos::testing::EnvGuard env("ETHOS_CONFIG_PATH", std::nullopt);
                     require(cfg::config_path() == std::filesystem::path("ethos.toml"),
                             cfg::config_path().string());
                   }});

  tests.push_back({"config_write_default_refuses_existing_file", [] {
                     ethos::testing::TempWorkspace workspace;
                     const auto path = workspace.path() / "ethos.toml";
                     auto first = cfg::write_default_config(path);
                     require(first.ok(), first.error());
                     auto second = cfg::write_default_config(path);
                     require(!second.ok(), "existing config must not be replaced");
                     auto loaded = cfg::load_config(path);
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().threshold("overall_deny", 0.0) == 0.8, "reloaded");
                   }});
}
