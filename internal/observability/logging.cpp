#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace usbforge::observability {
namespace {

spdlog::level::level_enum ResolveLevel(const usbforge::runtime::config::RuntimeConfig& config, bool* env_rejected) {
  *env_rejected = false;
  if (const char* level = std::getenv("USBFORGE_LOG_LEVEL")) {
    // from_str maps unknown names to "off"
    const auto parsed = spdlog::level::from_str(level);
    if (parsed != spdlog::level::off || std::string_view(level) == "off") {
      return parsed;
    }
    *env_rejected = true;
  }

  if (!config.logging().level().empty()) {
    return spdlog::level::from_str(config.logging().level());
  }

  return spdlog::level::info;
}

std::string ResolvePattern(const usbforge::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("USBFORGE_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

bool NeedsQuoting(const std::string& value) {
  return value.empty() || value.find_first_of(" \t\"=") != std::string::npos;
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=';
    if (NeedsQuoting(field.value)) {
      out << std::quoted(field.value);
    } else {
      out << field.value;
    }
  }
  return out.str();
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const usbforge::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get("usbforge");
  if (!logger) {
    logger = spdlog::stdout_color_mt("usbforge");
  }
  bool env_rejected = false;
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(ResolveLevel(config, &env_rejected));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  if (env_rejected) {
    spdlog::warn("ignoring unknown USBFORGE_LOG_LEVEL={}", std::getenv("USBFORGE_LOG_LEVEL"));
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = SerializeFields(fields);

  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

} // namespace usbforge::observability
