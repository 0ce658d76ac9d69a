#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace aurora::json {

struct Value;
using Array = std::vector<Value>;
// Ordered so stringify() output is stable and diff-friendly.
using Object = std::map<std::string, Value>;

// Minimal JSON value type (null, bool, number, string, array, object).
struct Value : std::variant<std::nullptr_t, bool, double, std::string, Array, Object> {
  using variant::variant;

  bool is_null() const;
  bool is_bool() const;
  bool is_number() const;
  bool is_string() const;
  bool is_array() const;
  bool is_object() const;

  const bool* as_bool() const;
  const double* as_number() const;
  const std::string* as_string() const;
  const Array* as_array() const;
  const Object* as_object() const;

  // Returns nullptr when this is not an object or the key is absent.
  const Value* find(const std::string& key) const;

  // Throws std::runtime_error if not present / wrong type.
  const Value& at(const std::string& key) const;
  const Value& at(std::size_t index) const;

  bool bool_value(bool def = false) const;
  double number_value(double def = 0.0) const;
  std::string string_value(const std::string& def = "") const;

  const Object& object() const;
  const Array& array() const;
};

// Parse a JSON document. Throws std::runtime_error with line/column and a
// caret snippet on malformed input.
Value parse(const std::string& text);

// Convert a JSON value to text. indent <= 0 produces a single line.
std::string stringify(const Value& v, int indent = 2);

} // namespace aurora::json
