#include "sortie/jsonlite.hpp"

// DETERMINISM:
//   - Object iteration is key-sorted (std::map), so to_json() output is stable.
//   - format_double() uses snprintf("%.6f"), which is locale-independent for
//     digits in the C locale, then trims trailing zeros.
//   - std::strtod is used for input only; output never round-trips through it.

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace sortie::jsonlite {

namespace {

constexpr std::size_t kMaxDepth = 128;

struct Parser {
  const std::string& s;
  std::size_t i{0};
  std::size_t depth{0};
  std::optional<JsonError> err;

  void fail(const char* code, std::string message) {
    if (!err) err = JsonError{code, std::move(message)};
  }

  void ws() { while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i; }
  bool eat(char c) { ws(); if (i < s.size() && s[i] == c) { ++i; return true; } return false; }

  static void append_utf8(std::string& o, unsigned cp) {
    if (cp < 0x80) {
      o += static_cast<char>(cp);
    } else if (cp < 0x800) {
      o += static_cast<char>(0xC0 | (cp >> 6));
      o += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
      o += static_cast<char>(0xE0 | (cp >> 12));
      o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      o += static_cast<char>(0x80 | (cp & 0x3F));
    }
  }

  std::string parse_string() {
    if (!eat('"')) { fail("json_parse_error", "expected string"); return {}; }
    std::string o;
    while (i < s.size()) {
      char c = s[i++];
      if (c == '"') return o;
      if (c != '\\') { o += c; continue; }
      if (i >= s.size()) break;
      char n = s[i++];
      switch (n) {
        case 'n': o += '\n'; break;
        case 't': o += '\t'; break;
        case 'r': o += '\r'; break;
        case 'b': o += '\b'; break;
        case 'f': o += '\f'; break;
        case 'u': {
          if (i + 4 > s.size()) { fail("json_parse_error", "truncated \\u escape"); return {}; }
          unsigned cp = 0;
          for (int k = 0; k < 4; ++k) {
            char h = s[i++];
            cp <<= 4;
            if (h >= '0' && h <= '9') cp |= static_cast<unsigned>(h - '0');
            else if (h >= 'a' && h <= 'f') cp |= static_cast<unsigned>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') cp |= static_cast<unsigned>(h - 'A' + 10);
            else { fail("json_parse_error", "invalid \\u escape"); return {}; }
          }
          append_utf8(o, cp);
          break;
        }
        default: o += n; break;
      }
    }
    fail("json_parse_error", "unterminated string");
    return {};
  }

  bool parse_number(Value& out) {
    ws();
    std::size_t start = i;
    if (s.compare(i, 3, "NaN") == 0 || s.compare(i, 8, "Infinity") == 0 ||
        s.compare(i, 9, "-Infinity") == 0) {
      fail("json_parse_error", "NaN/Infinity unsupported");
      return false;
    }
    bool negative = false;
    if (i < s.size() && s[i] == '-') { negative = true; ++i; }
    if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;

    bool is_float = false;
    if (i < s.size() && s[i] == '.') {
      is_float = true;
      ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        fail("json_parse_error", "invalid number format");
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
      is_float = true;
      ++i;
      if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        fail("json_parse_error", "invalid exponent");
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }

    const std::string num = s.substr(start, i - start);
    if (is_float || negative) {
      char* end = nullptr;
      double d = std::strtod(num.c_str(), &end);
      if (end == num.c_str() || !std::isfinite(d)) {
        fail("json_parse_error", "invalid floating point");
        return false;
      }
      out = Value{d};
      return true;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long u = std::strtoull(num.c_str(), &end, 10);
    if (errno == ERANGE) {
      out = Value{std::strtod(num.c_str(), nullptr)};
      return true;
    }
    out = Value{static_cast<std::uint64_t>(u)};
    return true;
  }

  Value parse_value() {
    ws();
    if (i >= s.size()) { fail("json_parse_error", "unexpected eof"); return {}; }
    if (s[i] == '{' || s[i] == '[') {
      if (++depth > kMaxDepth) { fail("json_parse_error", "nesting too deep"); return {}; }
      Value v = s[i] == '{' ? Value{parse_object()} : Value{parse_array()};
      --depth;
      return v;
    }
    if (s[i] == '"') return Value{parse_string()};
    if (s.compare(i, 4, "true") == 0) { i += 4; return Value{true}; }
    if (s.compare(i, 5, "false") == 0) { i += 5; return Value{false}; }
    if (s.compare(i, 4, "null") == 0) { i += 4; return Value{nullptr}; }
    Value num;
    if (parse_number(num)) return num;
    fail("json_parse_error", "unexpected token at offset " + std::to_string(i));
    return {};
  }

  Object parse_object() {
    Object out;
    eat('{');
    if (eat('}')) return out;
    while (!err) {
      auto k = parse_string();
      if (err) break;
      if (out.contains(k)) { fail("json_duplicate_key", "duplicate key: " + k); break; }
      if (!eat(':')) { fail("json_parse_error", "expected :"); break; }
      out[k] = parse_value();
      if (err) break;
      if (eat('}')) break;
      if (!eat(',')) { fail("json_parse_error", "expected ,"); break; }
    }
    return out;
  }

  Array parse_array() {
    Array out;
    eat('[');
    if (eat(']')) return out;
    while (!err) {
      out.push_back(parse_value());
      if (err) break;
      if (eat(']')) break;
      if (!eat(',')) { fail("json_parse_error", "expected ,"); break; }
    }
    return out;
  }
};

}  // namespace

std::string escape(const std::string& s) {
  bool needs_escape = false;
  for (unsigned char c : s) {
    if (c == '"' || c == '\\' || c < 0x20) { needs_escape = true; break; }
  }
  if (!needs_escape) return s;

  std::string o;
  o.reserve(s.size() + s.size() / 4 + 4);
  for (char c : s) {
    switch (c) {
      case '"':  o += "\\\""; break;
      case '\\': o += "\\\\"; break;
      case '\b': o += "\\b"; break;
      case '\f': o += "\\f"; break;
      case '\n': o += "\\n"; break;
      case '\r': o += "\\r"; break;
      case '\t': o += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          o += buf;
        } else {
          o += c;
        }
    }
  }
  return o;
}

std::string format_double(double d) {
  char buf[64];
  int n = std::snprintf(buf, sizeof(buf), "%.6f", d);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "0.0";
  std::string out(buf, static_cast<std::size_t>(n));
  while (!out.empty() && out.back() == '0') out.pop_back();
  if (!out.empty() && out.back() == '.') out.push_back('0');
  return out;
}

std::string to_json(const Value& v) {
  if (std::holds_alternative<std::nullptr_t>(v.v)) return "null";
  if (std::holds_alternative<bool>(v.v)) return std::get<bool>(v.v) ? "true" : "false";
  if (std::holds_alternative<std::string>(v.v)) return "\"" + escape(std::get<std::string>(v.v)) + "\"";
  if (std::holds_alternative<std::uint64_t>(v.v)) return std::to_string(std::get<std::uint64_t>(v.v));
  if (std::holds_alternative<double>(v.v)) {
    double d = std::get<double>(v.v);
    return std::isfinite(d) ? format_double(d) : "null";
  }
  std::ostringstream oss;
  bool first = true;
  if (std::holds_alternative<Object>(v.v)) {
    oss << "{";
    for (const auto& [k, vv] : std::get<Object>(v.v)) {
      if (!first) oss << ",";
      first = false;
      oss << "\"" << escape(k) << "\":" << to_json(vv);
    }
    oss << "}";
    return oss.str();
  }
  oss << "[";
  for (const auto& vv : std::get<Array>(v.v)) {
    if (!first) oss << ",";
    first = false;
    oss << to_json(vv);
  }
  oss << "]";
  return oss.str();
}

std::optional<Value> parse_value(const std::string& text, std::optional<JsonError>* error) {
  Parser p{text};
  Value v = p.parse_value();
  p.ws();
  if (!p.err && p.i != text.size()) p.fail("json_parse_error", "trailing data");
  if (error) *error = p.err;
  if (p.err) return std::nullopt;
  return v;
}

Object parse(const std::string& text, std::optional<JsonError>* error) {
  std::optional<JsonError> local;
  auto v = parse_value(text, &local);
  if (!local && v && !v->is_object()) local = JsonError{"json_type_error", "expected object"};
  if (error) *error = local;
  if (local) return {};
  return std::get<Object>(v->v);
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<std::string>(it->second.v)) return def;
  return std::get<std::string>(it->second.v);
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<bool>(it->second.v)) return def;
  return std::get<bool>(it->second.v);
}

unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<std::uint64_t>(it->second.v)) return def;
  return std::get<std::uint64_t>(it->second.v);
}

double get_double(const Object& obj, const std::string& key, double def) {
  auto d = get_optional_double(obj, key);
  return d ? *d : def;
}

std::optional<double> get_optional_double(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end()) return std::nullopt;
  if (std::holds_alternative<double>(it->second.v)) return std::get<double>(it->second.v);
  if (std::holds_alternative<std::uint64_t>(it->second.v)) {
    return static_cast<double>(std::get<std::uint64_t>(it->second.v));
  }
  return std::nullopt;
}

std::vector<std::string> get_string_array(const Object& obj, const std::string& key) {
  std::vector<std::string> out;
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<Array>(it->second.v)) return out;
  for (const auto& item : std::get<Array>(it->second.v)) {
    if (std::holds_alternative<std::string>(item.v)) out.push_back(std::get<std::string>(item.v));
  }
  return out;
}

Object get_object(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<Object>(it->second.v)) return {};
  return std::get<Object>(it->second.v);
}

Array get_array(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<Array>(it->second.v)) return {};
  return std::get<Array>(it->second.v);
}

}  // namespace sortie::jsonlite
