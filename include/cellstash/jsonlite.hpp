#pragma once

// cellstash/jsonlite.hpp — Minimal strict JSON codec for stash records.
//
// DETERMINISM GUARANTEES:
//   - Objects are std::map, so serialize() always emits keys in sorted order.
//     serialize(parse(x)) is the canonical form of x.
//   - Integers are carried as uint64_t and never pass through double.
//   - Duplicate keys are rejected (json_duplicate_key); a record with two
//     values for one key has no canonical form.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace cellstash::jsonlite {

struct JsonError {
  std::string code;
  std::string message;
};

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v;
};

std::optional<JsonError> validate_strict(const std::string& text);

// Parse a top-level object. Returns {} and sets *error on failure.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::string serialize(const Value& v);
std::string serialize(const Object& obj);
std::string escape(const std::string& s);

// Type-safe extractors. A present key of the wrong type yields the default.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
const Array* get_array(const Object& obj, const std::string& key);
const Object* get_object(const Object& obj, const std::string& key);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);

inline const Object* as_object(const Value& v) { return std::get_if<Object>(&v.v); }
inline const std::string* as_string(const Value& v) { return std::get_if<std::string>(&v.v); }

}  // namespace cellstash::jsonlite
