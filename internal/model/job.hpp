#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/job_status.hpp"

namespace usbforge::model {

/*
  Persistent job row.

  IMPORTANT:
  - status/progress/lease fields are only written by the lease manager
    (and the owning worker through it).
  - A lease is active iff locked_by is non-empty AND locked_until_ms is
    in the future.
  - attempts only grows, once per lease acquisition.
  - Timestamps are epoch ms, 0 = unset.
*/
struct Job {
  int64_t     id = 0;
  std::string job_token;
  std::string order_ref;

  std::string                capacity;
  std::string                preferences;  // opaque JSON
  std::optional<std::string> content_plan_ref;
  std::string                volume_label;
  std::optional<std::string> assigned_device_id;

  JobStatus   status   = JobStatus::kPending;
  int32_t     progress = 0;
  std::string fail_reason;

  uint64_t created_at_ms  = 0;
  uint64_t updated_at_ms  = 0;
  uint64_t started_at_ms  = 0;
  uint64_t finished_at_ms = 0;

  std::string locked_by;
  uint64_t    locked_until_ms = 0;
  uint32_t    attempts        = 0;
  std::string last_error;

  bool HasActiveLease(uint64_t now_ms) const {
    return !locked_by.empty() && locked_until_ms > now_ms;
  }
};

} // namespace usbforge::model
