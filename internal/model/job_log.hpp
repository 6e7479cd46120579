#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace usbforge::model {

enum class LogLevel : std::uint8_t {
  kDebug   = 0,
  kInfo    = 1,
  kWarning = 2,
  kError   = 3,
};

inline std::string_view ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarning:
      return "warning";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

inline std::optional<LogLevel> ParseLogLevel(std::string_view text) {
  if (text == "debug") return LogLevel::kDebug;
  if (text == "info") return LogLevel::kInfo;
  if (text == "warning" || text == "warn") return LogLevel::kWarning;
  if (text == "error") return LogLevel::kError;
  return std::nullopt;
}

namespace log_category {
inline constexpr std::string_view kValidation = "validation";
inline constexpr std::string_view kCopy       = "copy";
inline constexpr std::string_view kVerify     = "verify";
inline constexpr std::string_view kLease      = "lease";
inline constexpr std::string_view kSystem     = "system";
inline constexpr std::string_view kProgress   = "progress";
} // namespace log_category

/*
  Append-only audit row. Never updated; removed only by retention.
*/
struct JobLogEntry {
  int64_t     id     = 0;
  int64_t     job_id = 0;
  LogLevel    level  = LogLevel::kInfo;
  std::string category;
  std::string message;

  std::string details;  // JSON text, empty = none

  std::optional<std::string> file_path;
  std::optional<int64_t>     file_size;
  std::optional<std::string> error_code;
  std::optional<std::string> correlation_id;

  uint64_t created_at_ms = 0;
};

} // namespace usbforge::model
