#include "ethos/checks/decision.hpp"

#include "ethos/config/config.hpp"

#include <cmath>
#include <cstdio>

namespace ethos::checks {

namespace {

double mean_score(const std::vector<CheckResult> &checks) {
  if (checks.empty()) {
    return 0.0;
  }
  double total = 0.0;
  for (const auto &check : checks) {
    total += check.score;
  }
  return total / static_cast<double>(checks.size());
}

double round_to(const double value, const int places) {
  const double scale = std::pow(10.0, places);
  return std::round(value * scale) / scale;
}

std::string format_reason(const double overall, const double threshold) {
  char buffer[96];
  std::snprintf(buffer, sizeof(buffer), "overall_risk_score=%.2f threshold=%.2f", overall,
                threshold);
  return buffer;
}

const config::ToolPolicyRule *find_policy(const std::string &tool_name,
                                          const std::vector<config::ToolPolicyRule> &policies) {
  for (const auto &policy : policies) {
    if (policy.tool_name == tool_name) {
      return &policy;
    }
  }
  return nullptr;
}

} // namespace

DecisionOptions decision_options_from_config(const config::Config &config) {
  DecisionOptions options;
  options.threshold = config.threshold("overall_deny", config::DEFAULT_DENY_THRESHOLD);
  options.escalate_threshold =
      config.threshold("overall_escalate", config::DEFAULT_ESCALATE_THRESHOLD);
  options.tool_policies = config.tool_policies;
  options.escalation_rules = config.escalation;
  return options;
}

ToolDecision decide_tool(const std::string &tool_name, const double overall,
                         const DecisionOptions &options) {
  if (const auto *policy = find_policy(tool_name, options.tool_policies);
      policy != nullptr && !policy->allow) {
    return {.tool_name = tool_name,
            .decision = DECISION_DENY,
            .reason = "tool policy denies " + tool_name};
  }
  return {.tool_name = tool_name,
          .decision = overall >= options.threshold ? DECISION_DENY : DECISION_ALLOW,
          .reason = format_reason(overall, options.threshold)};
}

RiskSummary build_summary(const std::vector<CheckResult> &checks, const DecisionOptions &options) {
  const double overall = mean_score(checks);

  RiskSummary summary;
  summary.overall_risk_score = round_to(overall, 4);
  for (const auto &check : checks) {
    if (check.score > 0.0) {
      summary.violations.push_back(check);
    }
  }

  if (options.tool_name.has_value() && !options.tool_name->empty()) {
    summary.tool_decisions.push_back(decide_tool(*options.tool_name, overall, options));
  }

  if (overall >= options.escalate_threshold) {
    for (const auto &rule : options.escalation_rules) {
      summary.escalations.push_back({.name = rule.name, .action = rule.action});
    }
  }
  return summary;
}

common::JsonValue summary_to_json(const RiskSummary &summary) {
  common::JsonArray violations;
  for (const auto &check : summary.violations) {
    violations.emplace_back(common::JsonObject{
        {"name", check.name},
        {"score", check.score},
        {"explanation", check.explanation},
    });
  }

  common::JsonArray decisions;
  for (const auto &decision : summary.tool_decisions) {
    decisions.emplace_back(common::JsonObject{
        {"tool_name", decision.tool_name},
        {"decision", decision.decision},
        {"reason", decision.reason},
    });
  }

  common::JsonArray escalations;
  for (const auto &escalation : summary.escalations) {
    escalations.emplace_back(common::JsonObject{
        {"name", escalation.name},
        {"action", escalation.action},
    });
  }

  return common::JsonObject{
      {"overall_risk_score", summary.overall_risk_score},
      {"violations", std::move(violations)},
      {"tool_decisions", std::move(decisions)},
      {"escalations", std::move(escalations)},
  };
}

} // namespace ethos::checks
