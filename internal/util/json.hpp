#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <google/protobuf/struct.pb.h>

namespace usbforge::util {

/*
  Structured "details" blob for job log entries.

  Built on google.protobuf.Struct so serialization goes through the
  protobuf JSON printer instead of hand-written escaping.
*/
class JsonObject {
 public:
  JsonObject& SetString(std::string_view key, std::string_view value);
  JsonObject& SetInt(std::string_view key, std::int64_t value);
  JsonObject& SetNumber(std::string_view key, double value);
  JsonObject& SetBool(std::string_view key, bool value);

  bool Empty() const {
    return fields_.fields().empty();
  }

  std::string ToJson() const;

 private:
  google::protobuf::Value& Field(std::string_view key);

  google::protobuf::Struct fields_;
};

// True when text parses as a JSON object.
bool IsJsonObject(const std::string& text);

} // namespace usbforge::util
