#pragma once

#include "ethos/common/result.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace ethos::common {

class JsonValue;

using JsonArray = std::vector<JsonValue>;
/// Keys are kept in byte order, which is also UTF-8 code point order.
using JsonObject = std::map<std::string, JsonValue>;

/// A parsed JSON document. Integers and non-integral numbers are kept apart
/// so that integers round-trip exactly.
class JsonValue {
public:
  using Storage =
      std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, JsonArray, JsonObject>;

  JsonValue() : storage_(nullptr) {}
  JsonValue(std::nullptr_t) : storage_(nullptr) {}
  JsonValue(bool value) : storage_(value) {}
  JsonValue(int value) : storage_(static_cast<std::int64_t>(value)) {}
  JsonValue(std::int64_t value) : storage_(value) {}
  JsonValue(double value) : storage_(value) {}
  JsonValue(const char *value) : storage_(std::string(value)) {}
  JsonValue(std::string value) : storage_(std::move(value)) {}
  JsonValue(JsonArray value) : storage_(std::move(value)) {}
  JsonValue(JsonObject value) : storage_(std::move(value)) {}

  [[nodiscard]] bool is_null() const { return std::holds_alternative<std::nullptr_t>(storage_); }
  [[nodiscard]] bool is_bool() const { return std::holds_alternative<bool>(storage_); }
  [[nodiscard]] bool is_int() const { return std::holds_alternative<std::int64_t>(storage_); }
  [[nodiscard]] bool is_double() const { return std::holds_alternative<double>(storage_); }
  [[nodiscard]] bool is_number() const { return is_int() || is_double(); }
  [[nodiscard]] bool is_string() const { return std::holds_alternative<std::string>(storage_); }
  [[nodiscard]] bool is_array() const { return std::holds_alternative<JsonArray>(storage_); }
  [[nodiscard]] bool is_object() const { return std::holds_alternative<JsonObject>(storage_); }

  [[nodiscard]] bool as_bool() const { return std::get<bool>(storage_); }
  [[nodiscard]] std::int64_t as_int() const { return std::get<std::int64_t>(storage_); }
  [[nodiscard]] double as_number() const;
  [[nodiscard]] const std::string &as_string() const { return std::get<std::string>(storage_); }
  [[nodiscard]] const JsonArray &as_array() const { return std::get<JsonArray>(storage_); }
  [[nodiscard]] JsonArray &as_array() { return std::get<JsonArray>(storage_); }
  [[nodiscard]] const JsonObject &as_object() const { return std::get<JsonObject>(storage_); }
  [[nodiscard]] JsonObject &as_object() { return std::get<JsonObject>(storage_); }

  /// Object member lookup; nullptr when this is not an object or the key is absent.
  [[nodiscard]] const JsonValue *find(const std::string &key) const;

  [[nodiscard]] const Storage &storage() const { return storage_; }

  friend bool operator==(const JsonValue &lhs, const JsonValue &rhs) {
    return lhs.storage_ == rhs.storage_;
  }

private:
  Storage storage_;
};

/// Strict RFC 8259 parser. Rejects duplicate keys, NaN/Infinity, unpaired
/// surrogate escapes, integers outside the int64 range and trailing content.
[[nodiscard]] Result<JsonValue> parse_json(const std::string &text);

/// Compact serialization (no whitespace, keys in map order).
[[nodiscard]] std::string dump_json(const JsonValue &value);

/// Indented serialization for stored artifacts.
[[nodiscard]] std::string dump_json_pretty(const JsonValue &value, int indent = 2);

/// Escape a string for embedding inside a JSON string literal. Non-ASCII
/// UTF-8 passes through unchanged.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Shortest round-trip text for a double, laid out like Python's float repr.
[[nodiscard]] std::string format_json_double(double value);

} // namespace ethos::common
