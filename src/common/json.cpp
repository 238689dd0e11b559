#include "ethos/common/json.hpp"

#include <charconv>
#include <cmath>
#include <cstdio>
#include <optional>
#include <sstream>
#include <system_error>
#include <type_traits>

namespace ethos::common {

namespace {

constexpr std::size_t MAX_DEPTH = 512;

void append_utf8(std::string &out, const std::uint32_t cp) {
  if (cp < 0x80U) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800U) {
    out.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else if (cp < 0x10000U) {
    out.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else {
    out.push_back(static_cast<char>(0xF0U | (cp >> 18U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  }
}

// Length of the well-formed UTF-8 sequence starting at `pos`, or 0.
std::size_t utf8_sequence_length(const std::string &s, const std::size_t pos) {
  const auto lead = static_cast<unsigned char>(s[pos]);
  std::size_t extra = 0;
  std::uint32_t cp = 0;
  std::uint32_t min_cp = 0;
  if ((lead & 0xE0U) == 0xC0U) {
    extra = 1;
    cp = lead & 0x1FU;
    min_cp = 0x80U;
  } else if ((lead & 0xF0U) == 0xE0U) {
    extra = 2;
    cp = lead & 0x0FU;
    min_cp = 0x800U;
  } else if ((lead & 0xF8U) == 0xF0U) {
    extra = 3;
    cp = lead & 0x07U;
    min_cp = 0x10000U;
  } else {
    return 0;
  }
  if (pos + extra >= s.size()) {
    return 0;
  }
  for (std::size_t i = 1; i <= extra; ++i) {
    const auto cont = static_cast<unsigned char>(s[pos + i]);
    if ((cont & 0xC0U) != 0x80U) {
      return 0;
    }
    cp = (cp << 6U) | (cont & 0x3FU);
  }
  if (cp < min_cp || cp > 0x10FFFFU || (cp >= 0xD800U && cp <= 0xDFFFU)) {
    return 0;
  }
  return extra + 1;
}

struct Parser {
  const std::string &s;
  std::size_t i = 0;
  std::optional<std::string> err;

  void fail(const std::string &message) {
    if (!err) {
      err = message + " at offset " + std::to_string(i);
    }
  }

  void ws() {
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t' || s[i] == '\n' || s[i] == '\r')) {
      ++i;
    }
  }

  bool eat(const char c) {
    ws();
    if (i < s.size() && s[i] == c) {
      ++i;
      return true;
    }
    return false;
  }

  std::optional<std::uint32_t> parse_hex4() {
    if (i + 4 > s.size()) {
      fail("truncated \\u escape");
      return std::nullopt;
    }
    std::uint32_t value = 0;
    for (std::size_t k = 0; k < 4; ++k) {
      const char c = s[i + k];
      value <<= 4U;
      if (c >= '0' && c <= '9') {
        value |= static_cast<std::uint32_t>(c - '0');
      } else if (c >= 'a' && c <= 'f') {
        value |= static_cast<std::uint32_t>(c - 'a' + 10);
      } else if (c >= 'A' && c <= 'F') {
        value |= static_cast<std::uint32_t>(c - 'A' + 10);
      } else {
        fail("invalid \\u escape");
        return std::nullopt;
      }
    }
    i += 4;
    return value;
  }

  std::string parse_string() {
    std::string out;
    if (!eat('"')) {
      fail("expected string");
      return out;
    }
    while (i < s.size()) {
      const auto c = static_cast<unsigned char>(s[i]);
      if (c == '"') {
        ++i;
        return out;
      }
      if (c < 0x20U) {
        fail("unescaped control character in string");
        return out;
      }
      if (c == '\\') {
        ++i;
        if (i >= s.size()) {
          break;
        }
        const char n = s[i++];
        switch (n) {
        case '"':
          out.push_back('"');
          break;
        case '\\':
          out.push_back('\\');
          break;
        case '/':
          out.push_back('/');
          break;
        case 'b':
          out.push_back('\b');
          break;
        case 'f':
          out.push_back('\f');
          break;
        case 'n':
          out.push_back('\n');
          break;
        case 'r':
          out.push_back('\r');
          break;
        case 't':
          out.push_back('\t');
          break;
        case 'u': {
          auto cp = parse_hex4();
          if (!cp) {
            return out;
          }
          if (*cp >= 0xD800U && *cp <= 0xDBFFU) {
            if (i + 1 >= s.size() || s[i] != '\\' || s[i + 1] != 'u') {
              fail("unpaired surrogate escape");
              return out;
            }
            i += 2;
            auto low = parse_hex4();
            if (!low) {
              return out;
            }
            if (*low < 0xDC00U || *low > 0xDFFFU) {
              fail("unpaired surrogate escape");
              return out;
            }
            *cp = 0x10000U + ((*cp - 0xD800U) << 10U) + (*low - 0xDC00U);
          } else if (*cp >= 0xDC00U && *cp <= 0xDFFFU) {
            fail("unpaired surrogate escape");
            return out;
          }
          append_utf8(out, *cp);
          break;
        }
        default:
          fail("invalid escape sequence");
          return out;
        }
        continue;
      }
      if (c >= 0x80U) {
        const std::size_t len = utf8_sequence_length(s, i);
        if (len == 0) {
          fail("invalid UTF-8 in string");
          return out;
        }
        out.append(s, i, len);
        i += len;
        continue;
      }
      out.push_back(static_cast<char>(c));
      ++i;
    }
    fail("unterminated string");
    return out;
  }

  JsonValue parse_number() {
    const std::size_t start = i;
    if (s[i] == '-') {
      ++i;
    }
    if (i >= s.size() || s[i] < '0' || s[i] > '9') {
      fail("invalid number");
      return {};
    }
    if (s[i] == '0') {
      ++i;
    } else {
      while (i < s.size() && s[i] >= '0' && s[i] <= '9') {
        ++i;
      }
    }
    bool integral = true;
    if (i < s.size() && s[i] == '.') {
      integral = false;
      ++i;
      if (i >= s.size() || s[i] < '0' || s[i] > '9') {
        fail("invalid fraction");
        return {};
      }
      while (i < s.size() && s[i] >= '0' && s[i] <= '9') {
        ++i;
      }
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
      integral = false;
      ++i;
      if (i < s.size() && (s[i] == '+' || s[i] == '-')) {
        ++i;
      }
      if (i >= s.size() || s[i] < '0' || s[i] > '9') {
        fail("invalid exponent");
        return {};
      }
      while (i < s.size() && s[i] >= '0' && s[i] <= '9') {
        ++i;
      }
    }

    const char *first = s.data() + start;
    const char *last = s.data() + i;
    if (integral) {
      std::int64_t value = 0;
      auto [ptr, ec] = std::from_chars(first, last, value);
      if (ec != std::errc() || ptr != last) {
        fail("integer out of range");
        return {};
      }
      return JsonValue(value);
    }
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || !std::isfinite(value)) {
      fail("number out of range");
      return {};
    }
    return JsonValue(value);
  }

  JsonValue parse_value(const std::size_t depth) {
    if (depth > MAX_DEPTH) {
      fail("nesting too deep");
      return {};
    }
    ws();
    if (i >= s.size()) {
      fail("unexpected end of input");
      return {};
    }
    const char c = s[i];
    if (c == '{') {
      return parse_object(depth);
    }
    if (c == '[') {
      return parse_array(depth);
    }
    if (c == '"') {
      return JsonValue(parse_string());
    }
    if (s.compare(i, 4, "true") == 0) {
      i += 4;
      return JsonValue(true);
    }
    if (s.compare(i, 5, "false") == 0) {
      i += 5;
      return JsonValue(false);
    }
    if (s.compare(i, 4, "null") == 0) {
      i += 4;
      return JsonValue(nullptr);
    }
    if (c == '-' || (c >= '0' && c <= '9')) {
      return parse_number();
    }
    fail("unexpected token");
    return {};
  }

  JsonValue parse_object(const std::size_t depth) {
    JsonObject out;
    eat('{');
    if (eat('}')) {
      return JsonValue(std::move(out));
    }
    while (!err) {
      ws();
      std::string key = parse_string();
      if (err) {
        break;
      }
      if (out.contains(key)) {
        fail("duplicate key \"" + key + "\"");
        break;
      }
      if (!eat(':')) {
        fail("expected ':'");
        break;
      }
      JsonValue value = parse_value(depth + 1);
      if (err) {
        break;
      }
      out.emplace(std::move(key), std::move(value));
      if (eat('}')) {
        break;
      }
      if (!eat(',')) {
        fail("expected ',' or '}'");
        break;
      }
    }
    return JsonValue(std::move(out));
  }

  JsonValue parse_array(const std::size_t depth) {
    JsonArray out;
    eat('[');
    if (eat(']')) {
      return JsonValue(std::move(out));
    }
    while (!err) {
      out.push_back(parse_value(depth + 1));
      if (err) {
        break;
      }
      if (eat(']')) {
        break;
      }
      if (!eat(',')) {
        fail("expected ',' or ']'");
        break;
      }
    }
    return JsonValue(std::move(out));
  }
};

void write_value(std::string &out, const JsonValue &value, const int indent, const int level);

void write_newline(std::string &out, const int indent, const int level) {
  out.push_back('\n');
  out.append(static_cast<std::size_t>(indent * level), ' ');
}

void write_value(std::string &out, const JsonValue &value, const int indent, const int level) {
  const bool pretty = indent > 0;
  std::visit(
      [&](const auto &v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
          out += v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          out += std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
          out += format_json_double(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
          out.push_back('"');
          out += json_escape(v);
          out.push_back('"');
        } else if constexpr (std::is_same_v<T, JsonArray>) {
          if (v.empty()) {
            out += "[]";
            return;
          }
          out.push_back('[');
          bool first = true;
          for (const auto &item : v) {
            if (!first) {
              out.push_back(',');
            }
            first = false;
            if (pretty) {
              write_newline(out, indent, level + 1);
            }
            write_value(out, item, indent, level + 1);
          }
          if (pretty) {
            write_newline(out, indent, level);
          }
          out.push_back(']');
        } else if constexpr (std::is_same_v<T, JsonObject>) {
          if (v.empty()) {
            out += "{}";
            return;
          }
          out.push_back('{');
          bool first = true;
          for (const auto &[key, item] : v) {
            if (!first) {
              out.push_back(',');
            }
            first = false;
            if (pretty) {
              write_newline(out, indent, level + 1);
            }
            out.push_back('"');
            out += json_escape(key);
            out += pretty ? "\": " : "\":";
            write_value(out, item, indent, level + 1);
          }
          if (pretty) {
            write_newline(out, indent, level);
          }
          out.push_back('}');
        }
      },
      value.storage());
}

} // namespace

double JsonValue::as_number() const {
  if (is_int()) {
    return static_cast<double>(as_int());
  }
  return std::get<double>(storage_);
}

const JsonValue *JsonValue::find(const std::string &key) const {
  if (!is_object()) {
    return nullptr;
  }
  const auto &object = as_object();
  const auto it = object.find(key);
  return it == object.end() ? nullptr : &it->second;
}

Result<JsonValue> parse_json(const std::string &text) {
  Parser parser{text};
  JsonValue value = parser.parse_value(0);
  if (!parser.err) {
    parser.ws();
    if (parser.i != text.size()) {
      parser.fail("trailing content");
    }
  }
  if (parser.err) {
    return Result<JsonValue>::failure(ErrorKind::Input, "invalid JSON: " + *parser.err);
  }
  return Result<JsonValue>::success(std::move(value));
}

std::string dump_json(const JsonValue &value) {
  std::string out;
  write_value(out, value, 0, 0);
  return out;
}

std::string dump_json_pretty(const JsonValue &value, const int indent) {
  std::string out;
  write_value(out, value, indent, 0);
  return out;
}

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20U) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(ch));
        escaped += buf;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string format_json_double(const double value) {
  if (!std::isfinite(value)) {
    return "null";
  }

  // Shortest round-trip digits in scientific form, e.g. "-1.2345e+07".
  char buf[64];
  const auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::scientific);
  if (ec != std::errc()) {
    return "null";
  }
  const std::string sci(buf, end);
  const auto e_pos = sci.find('e');
  std::string mantissa = sci.substr(0, e_pos);
  const int exponent = std::stoi(sci.substr(e_pos + 1));

  std::string sign;
  if (!mantissa.empty() && mantissa.front() == '-') {
    sign = "-";
    mantissa.erase(0, 1);
  }
  std::string digits;
  for (const char c : mantissa) {
    if (c != '.') {
      digits.push_back(c);
    }
  }

  if (exponent < -4 || exponent >= 16) {
    std::string out = sign;
    out.push_back(digits.front());
    if (digits.size() > 1) {
      out.push_back('.');
      out.append(digits, 1, std::string::npos);
    }
    char exp_buf[16];
    std::snprintf(exp_buf, sizeof(exp_buf), "e%c%02d", exponent < 0 ? '-' : '+',
                  exponent < 0 ? -exponent : exponent);
    out += exp_buf;
    return out;
  }

  std::string out = sign;
  if (exponent < 0) {
    out += "0.";
    out.append(static_cast<std::size_t>(-exponent - 1), '0');
    out += digits;
    return out;
  }
  const auto int_len = static_cast<std::size_t>(exponent) + 1;
  if (digits.size() <= int_len) {
    out += digits;
    out.append(int_len - digits.size(), '0');
    out += ".0";
  } else {
    out.append(digits, 0, int_len);
    out.push_back('.');
    out.append(digits, int_len, std::string::npos);
  }
  return out;
}

} // namespace ethos::common
