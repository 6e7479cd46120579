#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace usbforge::db::memory {

class MemoryTransaction;

/*
  In-process backend. Used by tests and by single-worker deployments
  that do not need durability.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                    InsertJob(Transaction&, model::Job& job) override;
  std::optional<model::Job> GetJob(Transaction&, int64_t id) override;
  std::optional<model::Job> LockJob(Transaction&, int64_t id) override;
  std::optional<model::Job> GetLatestJobForOrder(Transaction&, const std::string& order_ref) override;
  std::vector<model::Job>   ListJobs(Transaction&, const JobFilter& filter, std::size_t limit) override;
  Result                    UpdateJob(Transaction&, const model::Job& job) override;
  Result                    DeleteJob(Transaction&, int64_t id) override;
  std::vector<StatusCount>  CountJobsByStatus(Transaction&) override;
  std::vector<int64_t>      ListFinishedJobIds(Transaction&, uint64_t finished_before_ms) override;

  std::optional<model::Job> NextAcquirableJob(Transaction&, uint64_t now_ms, uint32_t max_attempts) override;
  std::vector<model::Job>   ListExpiredLeases(Transaction&, uint64_t now_ms) override;
  std::vector<model::Job>   ListActiveLeases(Transaction&, uint64_t now_ms) override;

  Result                          InsertLog(Transaction&, model::JobLogEntry& entry) override;
  std::vector<model::JobLogEntry> ListLogs(Transaction&, const LogFilter& filter, std::size_t limit) override;
  Result                          DeleteLogsOlderThan(Transaction&, uint64_t cutoff_ms) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<int64_t, model::Job>   jobs;  // ordered by id
    std::vector<model::JobLogEntry> logs;  // ordered by id
    int64_t                         next_job_id = 1;
    int64_t                         next_log_id = 1;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace usbforge::db::memory
