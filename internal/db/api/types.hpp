#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/job.hpp"
#include "internal/model/job_log.hpp"

namespace usbforge::db {

inline constexpr std::size_t kDefaultListLimit = 50;
inline constexpr std::size_t kMaxListLimit     = 200;

struct JobFilter {
  std::vector<model::JobStatus> statuses;  // empty = any
  std::optional<std::string>    order_ref;
  std::optional<std::string>    assigned_device_id;
  uint64_t                      created_from_ms = 0;  // inclusive, 0 = open
  uint64_t                      created_to_ms   = 0;  // inclusive, 0 = open
};

struct LogFilter {
  std::optional<int64_t>         job_id;
  std::optional<model::LogLevel> level;
  std::optional<std::string>     category;
  std::optional<std::string>     error_code;
  std::optional<std::string>     correlation_id;
  uint64_t                       created_from_ms = 0;
  uint64_t                       created_to_ms   = 0;

  // default is newest first
  bool oldest_first = false;
};

struct StatusCount {
  model::JobStatus status = model::JobStatus::kPending;
  uint64_t         count  = 0;
};

} // namespace usbforge::db
