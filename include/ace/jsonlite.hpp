#pragma once

// ace/jsonlite.hpp - Minimal strict JSON value model, parser and writer.
//
// DETERMINISM GUARANTEES:
//   - Object is a std::map, so every serialization has sorted keys.
//   - Doubles are written with format_double() (fixed 6 decimals, trailing
//     zeros trimmed). No locale dependency on output.
//   - Strings are byte strings. Bytes >= 0x80 pass through unchanged, control
//     characters are written as \u00XX and read back to the same byte, so any
//     file pre-image survives a write/read cycle exactly.
//
// SERIALIZATION TRAIT:
//   Persisted data types implement `jsonlite::Value to_value() const` and a
//   static `from_value(const jsonlite::Value&)`. Writers never inspect types
//   at runtime; they call the trait.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ace::jsonlite {

struct JsonError {
  std::string code;     // json_parse_error | json_duplicate_key
  std::string message;
};

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v;

  Value() : v(nullptr) {}
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(std::uint64_t n) : v(n) {}
  Value(double d) : v(d) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(Object o) : v(std::move(o)) {}
  Value(Array a) : v(std::move(a)) {}

  template <typename T>
  bool is() const { return std::holds_alternative<T>(v); }

  const Object* as_object() const { return std::get_if<Object>(&v); }
  const Array* as_array() const { return std::get_if<Array>(&v); }
  const std::string* as_string() const { return std::get_if<std::string>(&v); }
};

// Parse any JSON value. On failure *error is set and a null Value returned.
Value parse_value(const std::string& text, std::optional<JsonError>* error);

// Parse a JSON document whose top level must be an object.
Object parse(const std::string& text, std::optional<JsonError>* error);

// Compact form, no whitespace: {"a":1,"b":[true]}
std::string to_json(const Value& v);

// Indented form with ": " key separator and a newline per member,
// matching the layout of the on-disk state files.
std::string to_json_pretty(const Value& v, int indent = 2);

std::string format_double(double d);

// Type-safe extractors. Missing key or wrong type yields the default.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::vector<std::uint64_t> get_u64_array(const Object& obj, const std::string& key);
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key);
const Object* get_object(const Object& obj, const std::string& key);
const Array* get_array(const Object& obj, const std::string& key);

Array to_array(const std::vector<std::string>& items);

}  // namespace ace::jsonlite
