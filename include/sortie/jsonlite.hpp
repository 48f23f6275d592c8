#pragma once

// sortie/jsonlite.hpp: Minimal strict JSON value, parser and serializer.
//
// DESIGN:
//   Object is a std::map, so serialization is always key-sorted and stable.
//   Doubles are written with format_double() (fixed %.6f, trailing zeros
//   trimmed). Non-finite doubles serialize as null; the parser rejects
//   NaN/Infinity literals.
//
// INVARIANT: parse() never throws. Errors are reported through JsonError.

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sortie::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v{nullptr};

  Value() = default;
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(std::uint64_t u) : v(u) {}
  Value(int i) {
    if (i < 0) v = static_cast<double>(i);
    else v = static_cast<std::uint64_t>(i);
  }
  Value(double d) : v(d) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(Object o) : v(std::move(o)) {}
  Value(Array a) : v(std::move(a)) {}

  bool is_null() const { return std::holds_alternative<std::nullptr_t>(v); }
  bool is_object() const { return std::holds_alternative<Object>(v); }
  bool is_array() const { return std::holds_alternative<Array>(v); }
  bool is_string() const { return std::holds_alternative<std::string>(v); }
};

struct JsonError {
  std::string code;
  std::string message;
};

// Parse any JSON value. Trailing data and duplicate keys are errors.
std::optional<Value> parse_value(const std::string& text, std::optional<JsonError>* error);
// Parse a JSON document that must be an object. Returns {} on error.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::string to_json(const Value& v);
std::string format_double(double d);
std::string escape(const std::string& s);

// Typed extractors. A missing key or a type mismatch yields the default.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::optional<double> get_optional_double(const Object& obj, const std::string& key);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
Object get_object(const Object& obj, const std::string& key);
Array get_array(const Object& obj, const std::string& key);

}  // namespace sortie::jsonlite
