#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "relay/core/compat.h"

namespace relay {
namespace json {

// Forward declaration of implementation
class JsonValueImpl;

// JSON types enum
enum class JsonType { Null, Boolean, Integer, Float, String, Array, Object };

// JSON exception
class JsonException : public std::runtime_error {
 public:
  explicit JsonException(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Closed JSON sum type used for every message crossing the relay
 *
 * Value semantics: copies are deep, children are returned by value and
 * written back with set()/setAt(). Integer and string scalars keep their
 * literal type through parse() and toString(), so "1" and 1 never compare
 * equal. Object keys are kept sorted, which makes toString() a stable
 * content representation.
 */
class JsonValue {
 public:
  // Constructors
  JsonValue();  // Creates null
  JsonValue(std::nullptr_t);
  JsonValue(bool value);
  JsonValue(int value);
  JsonValue(int64_t value);
  JsonValue(uint64_t value);
  JsonValue(double value);
  JsonValue(const std::string& value);
  JsonValue(const char* value);

  JsonValue(const JsonValue& other);
  JsonValue(JsonValue&& other) noexcept;
  JsonValue& operator=(const JsonValue& other);
  JsonValue& operator=(JsonValue&& other) noexcept;
  ~JsonValue();

  // Type checking
  JsonType type() const;
  bool isNull() const;
  bool isBoolean() const;
  bool isInteger() const;
  bool isFloat() const;
  bool isNumber() const;  // Integer or Float
  bool isString() const;
  bool isArray() const;
  bool isObject() const;
  bool empty() const;

  // Value getters (throw if wrong type)
  bool getBool() const;
  int getInt() const;
  int64_t getInt64() const;
  double getFloat() const;
  std::string getString() const;

  // Safe value getters with defaults
  bool getBool(bool defaultValue) const;
  int getInt(int defaultValue) const;
  int64_t getInt64(int64_t defaultValue) const;
  double getFloat(double defaultValue) const;
  std::string getString(const std::string& defaultValue) const;

  // Array operations
  size_t size() const;  // Array or object size
  JsonValue at(size_t index) const;
  void setAt(size_t index, const JsonValue& value);
  void push_back(const JsonValue& value);

  // Object operations
  bool contains(const std::string& key) const;
  JsonValue at(const std::string& key) const;  // throws if missing
  optional<JsonValue> find(const std::string& key) const;
  void set(const std::string& key, const JsonValue& value);
  void erase(const std::string& key);
  std::vector<std::string> keys() const;

  // Conversion
  std::string toString(bool pretty = false) const;

  bool operator==(const JsonValue& other) const;
  bool operator!=(const JsonValue& other) const { return !(*this == other); }

  // Static factory methods
  static JsonValue null();
  static JsonValue array();
  static JsonValue object();
  static JsonValue parse(const std::string& json_str);

 private:
  friend class JsonValueImpl;

  JsonValueImpl& mutableImpl();

  std::unique_ptr<JsonValueImpl> impl_;
};

// Convenience builders
class JsonObjectBuilder {
 public:
  JsonObjectBuilder() : value_(JsonValue::object()) {}

  JsonObjectBuilder& add(const std::string& key, const JsonValue& val) {
    value_.set(key, val);
    return *this;
  }

  JsonObjectBuilder& addNull(const std::string& key) {
    value_.set(key, JsonValue::null());
    return *this;
  }

  JsonValue build() const { return value_; }

 private:
  JsonValue value_;
};

class JsonArrayBuilder {
 public:
  JsonArrayBuilder() : value_(JsonValue::array()) {}

  JsonArrayBuilder& add(const JsonValue& val) {
    value_.push_back(val);
    return *this;
  }

  JsonValue build() const { return value_; }

 private:
  JsonValue value_;
};

}  // namespace json
}  // namespace relay
