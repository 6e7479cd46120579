#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/model/job.hpp"
#include "internal/model/job_log.hpp"

namespace usbforge::db {

/*
  Repository abstraction over the job store and the job log.

  CRITICAL GUARANTEES:

  - All reads/writes happen inside a Transaction
  - Reads inside a transaction see its writes
  - LockJob / NextAcquirableJob / ListExpiredLeases return rows that no
    other transaction can modify until this one finishes
  - Status is exposed as model::JobStatus only; the legacy coarse
    status column is written alongside and never returned

  The DB is the source of truth for job state and lease ownership.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Jobs
  // ---------------------------------------------------------------------

  // Assigns job.id.
  virtual Result InsertJob(Transaction&, model::Job& job) = 0;

  virtual std::optional<model::Job> GetJob(Transaction&, int64_t id) = 0;

  // Same as GetJob but takes a row lock for read-modify-write.
  virtual std::optional<model::Job> LockJob(Transaction&, int64_t id) = 0;

  virtual std::optional<model::Job> GetLatestJobForOrder(Transaction&, const std::string& order_ref) = 0;

  // Newest first.
  virtual std::vector<model::Job> ListJobs(Transaction&, const JobFilter& filter, std::size_t limit) = 0;

  virtual Result UpdateJob(Transaction&, const model::Job& job) = 0;

  // Also removes the job's log entries.
  virtual Result DeleteJob(Transaction&, int64_t id) = 0;

  virtual std::vector<StatusCount> CountJobsByStatus(Transaction&) = 0;

  // Terminal jobs finished before cutoff.
  virtual std::vector<int64_t> ListFinishedJobIds(Transaction&, uint64_t finished_before_ms) = 0;

  // ---------------------------------------------------------------------
  // Leasing
  // ---------------------------------------------------------------------

  // Oldest (created_at, id) job in pending|retry whose lease is absent or
  // expired and whose attempts < max_attempts. Row is locked.
  virtual std::optional<model::Job> NextAcquirableJob(Transaction&, uint64_t now_ms, uint32_t max_attempts) = 0;

  // In-flight jobs whose locked_until has passed. Rows are locked.
  virtual std::vector<model::Job> ListExpiredLeases(Transaction&, uint64_t now_ms) = 0;

  // Jobs holding an unexpired lease, soonest expiry first.
  virtual std::vector<model::Job> ListActiveLeases(Transaction&, uint64_t now_ms) = 0;

  // ---------------------------------------------------------------------
  // Job log
  // ---------------------------------------------------------------------

  // Assigns entry.id. NotFound if the job does not exist.
  virtual Result InsertLog(Transaction&, model::JobLogEntry& entry) = 0;

  virtual std::vector<model::JobLogEntry> ListLogs(Transaction&, const LogFilter& filter, std::size_t limit) = 0;

  virtual Result DeleteLogsOlderThan(Transaction&, uint64_t cutoff_ms) = 0;
};

} // namespace usbforge::db
