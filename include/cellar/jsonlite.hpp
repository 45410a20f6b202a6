#pragma once

// cellar/jsonlite.hpp — Minimal strict JSON reader/writer for persisted records
// (config.json, client_view.json, CLI output).
//
// Objects are std::map, so to_json() always emits keys in sorted order. Two
// records with equal content serialize to identical bytes.

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace cellar::jsonlite {

struct Value;
using Array = std::vector<Value>;
using Object = std::map<std::string, Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Array, Object> v;

  Value() : v(nullptr) {}
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(std::uint64_t u) : v(u) {}
  Value(double d) : v(d) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(Array a) : v(std::move(a)) {}
  Value(Object o) : v(std::move(o)) {}
};

struct JsonError {
  std::string code;     // json_parse_error | json_duplicate_key
  std::string message;
};

// Parse a JSON document whose top level is an object. On failure returns an
// empty object and sets *error (if provided).
Object parse(const std::string& text, std::optional<JsonError>* error = nullptr);

std::string to_json(const Value& v);
std::string escape(const std::string& s);
std::string format_double(double d);

// Type-safe extractors; return def when the key is absent or has another type.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key);

}  // namespace cellar::jsonlite
