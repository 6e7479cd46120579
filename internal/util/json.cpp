#include "json.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace usbforge::util {

google::protobuf::Value& JsonObject::Field(std::string_view key) {
  return (*fields_.mutable_fields())[std::string(key)];
}

JsonObject& JsonObject::SetString(std::string_view key, std::string_view value) {
  Field(key).set_string_value(std::string(value));
  return *this;
}

JsonObject& JsonObject::SetInt(std::string_view key, std::int64_t value) {
  // Struct numbers are doubles; integers up to 2^53 print without a fraction.
  Field(key).set_number_value(static_cast<double>(value));
  return *this;
}

JsonObject& JsonObject::SetNumber(std::string_view key, double value) {
  Field(key).set_number_value(value);
  return *this;
}

JsonObject& JsonObject::SetBool(std::string_view key, bool value) {
  Field(key).set_bool_value(value);
  return *this;
}

std::string JsonObject::ToJson() const {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(fields_, &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize details: " + std::string(status.message()));
  }
  return json;
}

bool IsJsonObject(const std::string& text) {
  google::protobuf::Struct parsed;
  return google::protobuf::util::JsonStringToMessage(text, &parsed).ok();
}

} // namespace usbforge::util
