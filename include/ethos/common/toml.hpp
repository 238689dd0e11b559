#pragma once

#include "ethos/common/result.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ethos::common {

/// Flat view of a TOML subset: `[section.sub]` headers and `key = value`
/// lines, stored under dotted keys ("section.sub.key").
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  /// nullopt when the key is absent or the value is not a boolean.
  [[nodiscard]] std::optional<bool> find_bool(const std::string &key) const;
  /// nullopt when the key is absent or the value is not a number.
  [[nodiscard]] std::optional<double> find_double(const std::string &key) const;

  /// Sorted, de-duplicated names of the direct children of `prefix`. For
  /// `tool_policies` this yields every `<name>` in `tool_policies.<name>.*`.
  [[nodiscard]] std::vector<std::string> child_names(const std::string &prefix) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace ethos::common
