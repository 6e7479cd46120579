#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/types.hpp"
#include "internal/model/job_log.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

namespace usbforge::db {
class Repository;
}

namespace usbforge::joblog {

inline constexpr std::size_t kJobLogLimit         = 100;
inline constexpr std::size_t kCorrelationLogLimit = 1000;
inline constexpr std::size_t kSummaryScanLimit    = 100000;

struct ErrorSummary {
  uint64_t                        total_errors = 0;
  std::map<std::string, uint64_t> by_category;
  std::map<std::string, uint64_t> by_error_code;
};

/*
  Durable per-job audit trail.

  Writers never fail because of the sink: Append() reports storage
  problems through the process log and returns false. Batch append and
  the query side throw util::StorageError like any repository caller.
*/
class LogSink {
 public:
  explicit LogSink(std::shared_ptr<db::Repository> repository, util::ClockFn clock = util::Now);

  bool Append(model::JobLogEntry entry);

  bool Append(int64_t job_id, model::LogLevel level, std::string_view category, std::string message,
              const util::JsonObject& details = {});

  bool Info(int64_t job_id, std::string_view category, std::string message, const util::JsonObject& details = {}) {
    return Append(job_id, model::LogLevel::kInfo, category, std::move(message), details);
  }

  bool Warn(int64_t job_id, std::string_view category, std::string message, const util::JsonObject& details = {}) {
    return Append(job_id, model::LogLevel::kWarning, category, std::move(message), details);
  }

  // Throwing variant for callers that need the stored row (id, timestamp).
  model::JobLogEntry Write(model::JobLogEntry entry);

  // One transaction for the whole batch. Returns the stored entries.
  std::vector<model::JobLogEntry> AppendBatch(std::vector<model::JobLogEntry> entries);

  // Newest first.
  std::vector<model::JobLogEntry> ForJob(int64_t job_id, std::size_t limit = kJobLogLimit);

  // Oldest first, across jobs.
  std::vector<model::JobLogEntry> ForCorrelationId(const std::string& correlation_id,
                                                   std::size_t        limit = kCorrelationLogLimit);

  std::vector<model::JobLogEntry> Query(const db::LogFilter& filter, std::size_t limit);

  // Error-level entries matching filter (its level is ignored).
  ErrorSummary Summarize(db::LogFilter filter);

  uint64_t DeleteOlderThan(uint64_t cutoff_ms);

 private:
  void Stamp(model::JobLogEntry& entry) const;

  std::shared_ptr<db::Repository> repository_;
  util::ClockFn                   clock_;
};

} // namespace usbforge::joblog
