#include "ethos/config/config.hpp"

#include "ethos/common/fs.hpp"
#include "ethos/common/toml.hpp"

#include <algorithm>
#include <cstdlib>
#include <sstream>

namespace ethos::config {

namespace {

constexpr const char *CONFIG_FILENAME = "ethos.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("ETHOS_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

std::string double_to_toml(const double value) {
  std::ostringstream out;
  out << value;
  std::string text = out.str();
  if (text.find_first_of(".eE") == std::string::npos) {
    text += ".0";
  }
  return text;
}

common::Result<Config> config_error(std::string message) {
  return common::Result<Config>::failure(common::ErrorKind::Config, std::move(message));
}

} // namespace

std::filesystem::path config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec)) {
      return *override_path / CONFIG_FILENAME;
    }
    return *override_path;
  }
  return std::filesystem::path(CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

Config default_config() {
  Config config;
  config.principles = {
      {.name = "Evidence-based claims",
       .description = "Avoid certainty when evidence or citations are absent."},
      {.name = "Privacy preservation",
       .description = "Detect and prevent sensitive data leakage."},
      {.name = "Non-manipulation", .description = "Disallow coercive or manipulative language."},
  };
  config.escalation = {
      {.name = "high_overall_risk",
       .when = "overall_risk_score >= overall_escalate",
       .action = "require_human_approval"},
  };
  config.tool_policies = {
      {.tool_name = "shell", .allow = true, .conditions = "overall_risk_score < overall_deny"},
      {.tool_name = "web_search", .allow = true,
       .conditions = "overall_risk_score < overall_deny"},
      {.tool_name = "delete_files", .allow = false, .conditions = "always"},
  };
  return config;
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed);
  }
  const auto &doc = parsed.value();

  Config config;

  if (doc.has("require_uncertainty")) {
    const auto value = doc.find_bool("require_uncertainty");
    if (!value.has_value()) {
      return config_error("require_uncertainty must be true or false");
    }
    config.require_uncertainty = *value;
  }

  for (const auto &name : doc.child_names("risk_thresholds")) {
    const auto value = doc.find_double("risk_thresholds." + name);
    if (!value.has_value()) {
      return config_error("risk_thresholds." + name + " must be a number");
    }
    config.risk_thresholds[name] = *value;
  }

  for (const auto &slug : doc.child_names("principles")) {
    const std::string base = "principles." + slug + ".";
    config.principles.push_back({.name = doc.get_string(base + "name", slug),
                                 .description = doc.get_string(base + "description")});
  }

  for (const auto &slug : doc.child_names("escalation")) {
    const std::string base = "escalation." + slug + ".";
    EscalationRule rule;
    rule.name = slug;
    rule.when = doc.get_string(base + "when");
    rule.action = doc.get_string(base + "action", rule.action);
    config.escalation.push_back(std::move(rule));
  }

  for (const auto &tool : doc.child_names("tool_policies")) {
    const std::string base = "tool_policies." + tool + ".";
    ToolPolicyRule rule;
    rule.tool_name = tool;
    if (doc.has(base + "allow")) {
      const auto allow = doc.find_bool(base + "allow");
      if (!allow.has_value()) {
        return config_error(base + "allow must be true or false");
      }
      rule.allow = *allow;
    }
    rule.conditions = doc.get_string(base + "conditions");
    config.tool_policies.push_back(std::move(rule));
  }

  config.keys.private_key = doc.get_string("keys.private_key", config.keys.private_key);
  config.keys.public_key = doc.get_string("keys.public_key", config.keys.public_key);
  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config = default_config();
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure(content);
  }
  auto parsed = parse_config(content.value());
  if (!parsed.ok()) {
    return config_error(path.string() + ": " + parsed.error());
  }
  apply_env_overrides(parsed.value());
  return parsed;
}

common::Result<Config> load_config() { return load_config(config_path()); }

std::string render_config(const Config &config) {
  std::ostringstream file;
  file << "require_uncertainty = " << bool_to_toml(config.require_uncertainty) << "\n";

  file << "\n[risk_thresholds]\n";
  for (const auto &[name, value] : config.risk_thresholds) {
    file << name << " = " << double_to_toml(value) << "\n";
  }

  file << "\n[keys]\n";
  file << "private_key = " << common::quote_toml_string(config.keys.private_key) << "\n";
  file << "public_key = " << common::quote_toml_string(config.keys.public_key) << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  std::size_t index = 0;
  for (const auto &principle : config.principles) {
    file << "\n[principles.p" << ++index << "]\n";
    file << "name = " << common::quote_toml_string(principle.name) << "\n";
    file << "description = " << common::quote_toml_string(principle.description) << "\n";
  }

  for (const auto &rule : config.escalation) {
    file << "\n[escalation." << rule.name << "]\n";
    file << "when = " << common::quote_toml_string(rule.when) << "\n";
    file << "action = " << common::quote_toml_string(rule.action) << "\n";
  }

  for (const auto &policy : config.tool_policies) {
    file << "\n[tool_policies." << policy.tool_name << "]\n";
    file << "allow = " << bool_to_toml(policy.allow) << "\n";
    file << "conditions = " << common::quote_toml_string(policy.conditions) << "\n";
  }

  return file.str();
}

common::Status write_config(const Config &config, const std::filesystem::path &path,
                            const common::WriteOptions &options) {
  return common::write_file_atomic(path, render_config(config), options);
}

common::Status write_default_config(const std::filesystem::path &path) {
  return write_config(default_config(), path, {.overwrite = false});
}

common::Result<std::vector<std::string>> observability_backends(const Config &config) {
  std::vector<std::string> backends;
  std::stringstream list(common::to_lower(config.observability.backend));
  std::string part;
  while (std::getline(list, part, ',')) {
    const std::string backend = common::trim(part);
    if (backend.empty() || backend == BACKEND_NONE || backend == "noop") {
      continue;
    }
    if (backend != BACKEND_LOG) {
      return common::Result<std::vector<std::string>>::failure(
          common::ErrorKind::Config,
          "Invalid observability.backend '" + backend + "' in: " + config.observability.backend);
    }
    if (std::find(backends.begin(), backends.end(), backend) == backends.end()) {
      backends.push_back(backend);
    }
  }
  return common::Result<std::vector<std::string>>::success(std::move(backends));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  for (const auto &[name, value] : config.risk_thresholds) {
    if (value < 0.0 || value > 1.0) {
      return common::Result<std::vector<std::string>>::failure(
          common::ErrorKind::Config, "risk_thresholds." + name + " must be between 0.0 and 1.0");
    }
  }

  if (!config.risk_thresholds.contains("overall_deny")) {
    warnings.push_back("risk_thresholds.overall_deny is not set; using 0.8");
  }
  if (config.threshold("overall_escalate", DEFAULT_ESCALATE_THRESHOLD) >
      config.threshold("overall_deny", DEFAULT_DENY_THRESHOLD)) {
    warnings.push_back("risk_thresholds.overall_escalate is above overall_deny");
  }

  if (const auto backends = observability_backends(config); !backends.ok()) {
    return common::Result<std::vector<std::string>>::failure(backends);
  }

  if (common::trim(config.keys.private_key).empty() ||
      common::trim(config.keys.public_key).empty()) {
    return common::Result<std::vector<std::string>>::failure(
        common::ErrorKind::Config, "keys.private_key and keys.public_key must be set");
  }

  for (const auto &policy : config.tool_policies) {
    if (policy.allow && common::to_lower(common::trim(policy.conditions)) == "always") {
      warnings.push_back("tool_policies." + policy.tool_name +
                         " allows with condition 'always'; the condition has no effect");
    }
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

void apply_env_overrides(Config &config) {
  if (const char *backend = std::getenv("ETHOS_OBSERVABILITY"); backend != nullptr && *backend) {
    config.observability.backend = backend;
  }
}

} // namespace ethos::config
