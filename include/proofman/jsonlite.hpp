#pragma once

// proofman/jsonlite.hpp - Minimal strict JSON reader/writer.
//
// Used for configuration documents, CLI replay scripts and every JSON line the
// ledger writes (events, audit records, snapshots).
//
// STRICTNESS:
//   - Duplicate object keys are an error (json_duplicate_key), never "last wins".
//   - NaN/Infinity are rejected. Trailing data after the top-level value is an error.
//   - Non-negative integers are kept as uint64 so token amounts never pass
//     through a double.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace proofman::jsonlite {

struct JsonError {
  std::string code;     // "json_parse_error" | "json_duplicate_key"
  std::string message;
};

struct Value;
using Object = std::map<std::string, Value>;
using Array  = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v{nullptr};
};

// Returns nullopt if `text` is a single valid JSON value.
std::optional<JsonError> validate_strict(const std::string& text);

// Parse a top-level object. On error returns {} and sets *error.
Object parse(const std::string& text, std::optional<JsonError>* error);

// Typed accessors. Missing keys and type mismatches yield `def`.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
std::uint64_t get_u64(const Object& obj, const std::string& key, std::uint64_t def = 0);
bool has_key(const Object& obj, const std::string& key);

// Strict accessor: an absent key leaves *out untouched and returns true; a key
// present with any type other than a non-negative integer returns false.
bool read_u64(const Object& obj, const std::string& key, std::uint64_t* out);

// Escape a string for embedding between double quotes.
std::string escape(const std::string& s);

// Serialize a value (objects with sorted keys).
std::string to_json(const Value& v);

}  // namespace proofman::jsonlite
