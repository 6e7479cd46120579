#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/job.hpp"
#include "internal/util/time.hpp"

namespace usbforge::db {
class Repository;
}

namespace usbforge::joblog {
class LogSink;
}

namespace usbforge::lease {

inline constexpr uint32_t kDefaultMaxAttempts = 3;

inline constexpr const char* kLeaseExpiredError = "Lease expired - worker crashed or timed out";

struct LeasePolicy {
  uint32_t max_attempts = kDefaultMaxAttempts;
};

/*
  Time-bounded exclusive ownership of jobs, stored on the job row.

  Every operation is one repository transaction, so the select and the
  ownership write are atomic across threads and processes.

  Ownership failures are reported as false / nullopt, never thrown.
  Storage failures propagate as util::StorageError (the store is left
  unchanged).
*/
class LeaseManager {
 public:
  LeaseManager(std::shared_ptr<db::Repository> repository,
               std::shared_ptr<joblog::LogSink> log_sink,
               LeasePolicy                      policy = {},
               util::ClockFn                    clock  = util::Now);

  // Oldest eligible job, now owned by worker_id in status processing.
  std::optional<model::Job> Acquire(const std::string& worker_id, std::chrono::milliseconds lease_duration);

  // locked_until = now + additional, if worker_id holds an unexpired lease.
  bool Extend(int64_t job_id, const std::string& worker_id, std::chrono::milliseconds additional);

  /*
    Clears the lease and moves the job to final_status (done, failed or retry).

    - done/failed need an unexpired lease held by worker_id
    - retry only needs locked_by == worker_id
    - retry at the attempt ceiling becomes failed
  */
  bool Release(int64_t job_id, const std::string& worker_id, model::JobStatus final_status, const std::string& error = {});

  // Reclaims in-flight jobs with an expired lease. Returns how many.
  std::size_t ResetExpired();

  // Owner-checked progress (clamped to 0..100) and optional phase change.
  bool UpdateProgress(int64_t job_id, const std::string& worker_id, int32_t progress,
                      std::optional<model::JobStatus> phase = std::nullopt);

  std::vector<model::Job> ActiveLeases();
  std::vector<model::Job> ExpiredLeases();

  uint32_t MaxAttempts() const {
    return policy_.max_attempts;
  }

 private:
  uint64_t NowMs() const;

  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<joblog::LogSink> log_sink_;
  LeasePolicy                      policy_;
  util::ClockFn                    clock_;
};

} // namespace usbforge::lease
