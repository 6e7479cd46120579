#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace usbforge::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  static SqliteTransaction& TX(Transaction&);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

}
