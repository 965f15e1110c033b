#include "relay/json/json_bridge.h"

#include <nlohmann/json.hpp>

namespace relay {
namespace json {

// Implementation class that wraps nlohmann::json
class JsonValueImpl {
 public:
  nlohmann::json json_;

  JsonValueImpl() : json_(nullptr) {}
  explicit JsonValueImpl(const nlohmann::json& j) : json_(j) {}
  explicit JsonValueImpl(nlohmann::json&& j) : json_(std::move(j)) {}

  static JsonValue wrap(const nlohmann::json& j) {
    JsonValue val;
    val.impl_->json_ = j;
    return val;
  }
};

namespace {

// A moved-from JsonValue has no impl and reads as null.
const nlohmann::json& nullJson() {
  static const nlohmann::json null_json(nullptr);
  return null_json;
}

inline const nlohmann::json& access_json_const(
    const std::unique_ptr<JsonValueImpl>& impl) {
  return impl ? impl->json_ : nullJson();
}

}  // namespace

JsonValue::JsonValue() : impl_(std::make_unique<JsonValueImpl>()) {}

JsonValue::JsonValue(std::nullptr_t)
    : impl_(std::make_unique<JsonValueImpl>()) {}

JsonValue::JsonValue(bool value)
    : impl_(std::make_unique<JsonValueImpl>(nlohmann::json(value))) {}

JsonValue::JsonValue(int value)
    : impl_(std::make_unique<JsonValueImpl>(nlohmann::json(value))) {}

JsonValue::JsonValue(int64_t value)
    : impl_(std::make_unique<JsonValueImpl>(nlohmann::json(value))) {}

JsonValue::JsonValue(uint64_t value)
    : impl_(std::make_unique<JsonValueImpl>(nlohmann::json(value))) {}

JsonValue::JsonValue(double value)
    : impl_(std::make_unique<JsonValueImpl>(nlohmann::json(value))) {}

JsonValue::JsonValue(const std::string& value)
    : impl_(std::make_unique<JsonValueImpl>(nlohmann::json(value))) {}

JsonValue::JsonValue(const char* value)
    : impl_(std::make_unique<JsonValueImpl>(
          nlohmann::json(std::string(value ? value : "")))) {}

JsonValue::JsonValue(const JsonValue& other)
    : impl_(std::make_unique<JsonValueImpl>(access_json_const(other.impl_))) {}

JsonValue::JsonValue(JsonValue&& other) noexcept = default;

JsonValue& JsonValue::operator=(const JsonValue& other) {
  if (this != &other) {
    mutableImpl().json_ = access_json_const(other.impl_);
  }
  return *this;
}

JsonValue& JsonValue::operator=(JsonValue&& other) noexcept = default;

JsonValue::~JsonValue() = default;

JsonValueImpl& JsonValue::mutableImpl() {
  if (!impl_) {
    impl_ = std::make_unique<JsonValueImpl>();
  }
  return *impl_;
}

JsonType JsonValue::type() const {
  const auto& j = access_json_const(impl_);
  if (j.is_boolean())
    return JsonType::Boolean;
  if (j.is_number_integer())
    return JsonType::Integer;
  if (j.is_number_float())
    return JsonType::Float;
  if (j.is_string())
    return JsonType::String;
  if (j.is_array())
    return JsonType::Array;
  if (j.is_object())
    return JsonType::Object;
  return JsonType::Null;
}

bool JsonValue::isNull() const { return access_json_const(impl_).is_null(); }
bool JsonValue::isBoolean() const {
  return access_json_const(impl_).is_boolean();
}
bool JsonValue::isInteger() const {
  return access_json_const(impl_).is_number_integer();
}
bool JsonValue::isFloat() const {
  return access_json_const(impl_).is_number_float();
}
bool JsonValue::isNumber() const {
  return access_json_const(impl_).is_number();
}
bool JsonValue::isString() const {
  return access_json_const(impl_).is_string();
}
bool JsonValue::isArray() const { return access_json_const(impl_).is_array(); }
bool JsonValue::isObject() const {
  return access_json_const(impl_).is_object();
}

bool JsonValue::empty() const {
  const auto& j = access_json_const(impl_);
  if (j.is_null())
    return true;
  if (j.is_string())
    return j.get_ref<const std::string&>().empty();
  if (j.is_array() || j.is_object())
    return j.empty();
  // Numbers and booleans are not considered empty
  return false;
}

// Value getters
bool JsonValue::getBool() const {
  if (!isBoolean()) {
    throw JsonException("Value is not a boolean");
  }
  return access_json_const(impl_).get<bool>();
}

int JsonValue::getInt() const {
  if (!isNumber()) {
    throw JsonException("Value is not a number");
  }
  return access_json_const(impl_).get<int>();
}

int64_t JsonValue::getInt64() const {
  if (!isNumber()) {
    throw JsonException("Value is not a number");
  }
  return access_json_const(impl_).get<int64_t>();
}

double JsonValue::getFloat() const {
  if (!isNumber()) {
    throw JsonException("Value is not a number");
  }
  return access_json_const(impl_).get<double>();
}

std::string JsonValue::getString() const {
  if (!isString()) {
    throw JsonException("Value is not a string");
  }
  return access_json_const(impl_).get<std::string>();
}

// Safe getters with defaults
bool JsonValue::getBool(bool defaultValue) const {
  return isBoolean() ? access_json_const(impl_).get<bool>() : defaultValue;
}

int JsonValue::getInt(int defaultValue) const {
  return isNumber() ? access_json_const(impl_).get<int>() : defaultValue;
}

int64_t JsonValue::getInt64(int64_t defaultValue) const {
  return isNumber() ? access_json_const(impl_).get<int64_t>() : defaultValue;
}

double JsonValue::getFloat(double defaultValue) const {
  return isNumber() ? access_json_const(impl_).get<double>() : defaultValue;
}

std::string JsonValue::getString(const std::string& defaultValue) const {
  return isString() ? access_json_const(impl_).get<std::string>()
                    : defaultValue;
}

// Array operations
size_t JsonValue::size() const {
  if (!isArray() && !isObject()) {
    throw JsonException("Value is not an array or object");
  }
  return access_json_const(impl_).size();
}

JsonValue JsonValue::at(size_t index) const {
  if (!isArray()) {
    throw JsonException("Value is not an array");
  }
  const auto& j = access_json_const(impl_);
  if (index >= j.size()) {
    throw JsonException("Index out of range: " + std::to_string(index));
  }
  return JsonValueImpl::wrap(j[index]);
}

void JsonValue::setAt(size_t index, const JsonValue& value) {
  if (!isArray()) {
    throw JsonException("Value is not an array");
  }
  auto& j = mutableImpl().json_;
  if (index >= j.size()) {
    throw JsonException("Index out of range: " + std::to_string(index));
  }
  j[index] = access_json_const(value.impl_);
}

void JsonValue::push_back(const JsonValue& value) {
  if (isNull()) {
    mutableImpl().json_ = nlohmann::json::array();
  }
  if (!isArray()) {
    throw JsonException("Value is not an array");
  }
  mutableImpl().json_.push_back(access_json_const(value.impl_));
}

// Object operations
bool JsonValue::contains(const std::string& key) const {
  if (!isObject()) {
    return false;
  }
  return access_json_const(impl_).contains(key);
}

JsonValue JsonValue::at(const std::string& key) const {
  if (!isObject()) {
    throw JsonException("Value is not an object");
  }
  const auto& j = access_json_const(impl_);
  auto it = j.find(key);
  if (it == j.end()) {
    throw JsonException("Key not found: " + key);
  }
  return JsonValueImpl::wrap(*it);
}

optional<JsonValue> JsonValue::find(const std::string& key) const {
  if (!isObject()) {
    return nullopt;
  }
  const auto& j = access_json_const(impl_);
  auto it = j.find(key);
  if (it == j.end()) {
    return nullopt;
  }
  return JsonValueImpl::wrap(*it);
}

void JsonValue::set(const std::string& key, const JsonValue& value) {
  if (isNull()) {
    // Convert to object if null
    mutableImpl().json_ = nlohmann::json::object();
  }
  if (!isObject()) {
    throw JsonException("Value is not an object");
  }
  mutableImpl().json_[key] = access_json_const(value.impl_);
}

void JsonValue::erase(const std::string& key) {
  if (!isObject()) {
    throw JsonException("Value is not an object");
  }
  mutableImpl().json_.erase(key);
}

std::vector<std::string> JsonValue::keys() const {
  if (!isObject()) {
    throw JsonException("Value is not an object");
  }
  std::vector<std::string> result;
  for (const auto& kv : access_json_const(impl_).items()) {
    result.push_back(kv.key());
  }
  return result;
}

// Conversion
std::string JsonValue::toString(bool pretty) const {
  const auto& j = access_json_const(impl_);
  // Invalid UTF-8 coming from the child is replaced rather than thrown on
  if (pretty) {
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
  }
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool JsonValue::operator==(const JsonValue& other) const {
  const auto& a = access_json_const(impl_);
  const auto& b = access_json_const(other.impl_);
  // nlohmann treats 1 and 1.0 as equal; ids must not
  if (a.is_number() && b.is_number() &&
      a.is_number_float() != b.is_number_float()) {
    return false;
  }
  return a == b;
}

// Static factory methods
JsonValue JsonValue::null() { return JsonValue(nullptr); }

JsonValue JsonValue::array() {
  JsonValue val;
  val.impl_->json_ = nlohmann::json::array();
  return val;
}

JsonValue JsonValue::object() {
  JsonValue val;
  val.impl_->json_ = nlohmann::json::object();
  return val;
}

JsonValue JsonValue::parse(const std::string& json_str) {
  try {
    JsonValue val;
    val.impl_->json_ = nlohmann::json::parse(json_str);
    return val;
  } catch (const nlohmann::json::parse_error& e) {
    throw JsonException("Parse error: " + std::string(e.what()));
  }
}

}  // namespace json
}  // namespace relay
