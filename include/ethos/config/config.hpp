#pragma once

#include "ethos/common/fs.hpp"
#include "ethos/common/result.hpp"
#include "ethos/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ethos::config {

constexpr double DEFAULT_DENY_THRESHOLD = 0.8;
constexpr double DEFAULT_ESCALATE_THRESHOLD = 0.6;

constexpr const char *BACKEND_LOG = "log";
constexpr const char *BACKEND_NONE = "none";

/// `--config` override, then ETHOS_CONFIG_PATH, then ./ethos.toml.
[[nodiscard]] std::filesystem::path config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Principles, escalation rules and tool policies written by `ethos init`.
[[nodiscard]] Config default_config();

[[nodiscard]] common::Result<Config> parse_config(const std::string &content);
/// A missing file yields default_config(); an unreadable or invalid one fails.
[[nodiscard]] common::Result<Config> load_config(const std::filesystem::path &path);
[[nodiscard]] common::Result<Config> load_config();

[[nodiscard]] std::string render_config(const Config &config);
[[nodiscard]] common::Status write_config(const Config &config, const std::filesystem::path &path,
                                          const common::WriteOptions &options = {});
/// Writes default_config() to `path`, refusing to replace an existing file.
[[nodiscard]] common::Status write_default_config(const std::filesystem::path &path);

/// Sinks named by `observability.backend`, a comma list of `log` and
/// `none`/`noop`. Lowercased, de-duplicated, in order; `none` contributes no
/// sink. Unknown names fail with ErrorKind::Config.
[[nodiscard]] common::Result<std::vector<std::string>>
observability_backends(const Config &config);

/// Hard errors fail the result; soft problems come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace ethos::config
