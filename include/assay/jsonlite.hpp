#pragma once

// assay/jsonlite.hpp — Minimal JSON value model used for profiles, run
// metadata, ledger events, list cursors and CLI output.
//
// DESIGN:
//   - Object is a std::map, so serialisation always emits keys in sorted
//     order. meta.json, result.json and ledger lines are byte-stable for the
//     same content.
//   - Non-negative integers are held as uint64 to keep millisecond timestamps
//     and byte counts exact. Negative integers and fractions are doubles.
//   - Duplicate object keys are a parse error (json_duplicate_key).

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace assay::jsonlite {

struct JsonError {
  std::string code;
  std::string message;
};

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::string, std::uint64_t, double, Object, Array> v{nullptr};
};

// Parse any JSON document. On failure returns null and sets *error.
Value parse_value(const std::string& text, std::optional<JsonError>* error);

// Parse a JSON document whose root must be an object. A non-object root
// yields an empty Object and a json_parse_error.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::optional<JsonError> validate_strict(const std::string& text);

std::string to_json(const Value& v);
std::string to_json(const Object& obj);
std::string escape(const std::string& s);

// Convenience constructors for building documents.
Value str_or_null(const std::string& s);
Value string_array(const std::vector<std::string>& items);
// Signed integers: non-negative values are stored as uint64, negatives as double.
Value int_value(long long n);

// Type-safe extractors. A missing key or a type mismatch returns `def`.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
long long get_int(const Object& obj, const std::string& key, long long def = 0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key);
const Object* get_object(const Object& obj, const std::string& key);
const Array* get_array(const Object& obj, const std::string& key);
bool has_key(const Object& obj, const std::string& key);
bool is_null(const Object& obj, const std::string& key);

}  // namespace assay::jsonlite
