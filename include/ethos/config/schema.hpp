#pragma once

#include <map>
#include <string>
#include <vector>

namespace ethos::config {

struct Principle {
  std::string name;
  std::string description;
};

/// Every rule fires once overall_risk_score reaches
/// risk_thresholds.overall_escalate. `when` is descriptive text carried
/// through the config file and is not evaluated.
struct EscalationRule {
  std::string name;
  std::string when;
  std::string action = "require_human_approval";
};

struct ToolPolicyRule {
  std::string tool_name;
  bool allow = true;
  /// Descriptive, like EscalationRule::when; `allow` alone decides.
  std::string conditions;
};

struct KeysConfig {
  std::string private_key = "sig.key";
  std::string public_key = "sig.pub";
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  std::vector<Principle> principles;
  bool require_uncertainty = true;
  std::map<std::string, double> risk_thresholds = {
      {"overall_deny", 0.8},     {"overall_escalate", 0.6}, {"overconfidence", 0.5},
      {"sensitive_data", 0.5},   {"manipulation", 0.5},
  };
  std::vector<EscalationRule> escalation;
  std::vector<ToolPolicyRule> tool_policies;
  KeysConfig keys;
  ObservabilityConfig observability;

  [[nodiscard]] double threshold(const std::string &name, double fallback) const {
    const auto it = risk_thresholds.find(name);
    return it == risk_thresholds.end() ? fallback : it->second;
  }
};

} // namespace ethos::config
