#pragma once

#include "ethos/checks/checks.hpp"
#include "ethos/common/json.hpp"
#include "ethos/config/schema.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ethos::checks {

constexpr const char *DECISION_ALLOW = "allow";
constexpr const char *DECISION_DENY = "deny";

struct ToolDecision {
  std::string tool_name;
  std::string decision;
  std::string reason;
};

struct Escalation {
  std::string name;
  std::string action;
};

struct RiskSummary {
  /// Mean of the check scores, rounded to 4 decimal places.
  double overall_risk_score = 0.0;
  /// Checks that scored above zero, in scorer order.
  std::vector<CheckResult> violations;
  std::vector<ToolDecision> tool_decisions;
  std::vector<Escalation> escalations;
};

struct DecisionOptions {
  double threshold = 0.8;
  double escalate_threshold = 0.6;
  std::optional<std::string> tool_name;
  std::vector<config::ToolPolicyRule> tool_policies;
  std::vector<config::EscalationRule> escalation_rules;
};

/// Thresholds, tool policies and escalation rules taken from `config`.
[[nodiscard]] DecisionOptions decision_options_from_config(const config::Config &config);

[[nodiscard]] RiskSummary build_summary(const std::vector<CheckResult> &checks,
                                        const DecisionOptions &options);

/// Decision for one tool; `overall` is the unrounded mean score.
[[nodiscard]] ToolDecision decide_tool(const std::string &tool_name, double overall,
                                       const DecisionOptions &options);

[[nodiscard]] common::JsonValue summary_to_json(const RiskSummary &summary);

} // namespace ethos::checks
