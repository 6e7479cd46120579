#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace usbforge::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
