#include "pg_repository.hpp"

#include <map>
#include <type_traits>
#include <variant>

#include "internal/db/sql/sql_filters.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/db/sql/sql_rows.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace usbforge::db::postgres {

namespace {

pqxx::params ToPg(const sql::Params& params) {
  pqxx::params out;
  for (const auto& p : params) {
    std::visit(
        [&](const auto& v) {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out.append();
          } else if constexpr (std::is_same_v<T, uint64_t>) {
            // BIGINT columns
            out.append(static_cast<int64_t>(v));
          } else {
            out.append(v);
          }
        },
        p);
  }
  return out;
}

// Read-side failures become exceptions; conflicts stay retryable.
template <typename Fn>
auto Guard(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const pqxx::serialization_failure& e) {
    throw util::TransactionConflict(e.what());
  } catch (const pqxx::deadlock_detected& e) {
    throw util::TransactionConflict(e.what());
  } catch (const pqxx::failure& e) {
    throw util::StorageError(e.what());
  }
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? std::string() : std::string(f.c_str());
}

std::optional<std::string> OptText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

uint64_t Millis(const pqxx::field& f) {
  return f.is_null() ? 0 : static_cast<uint64_t>(f.as<int64_t>());
}

model::Job ReadJob(const pqxx::row& row) {
  model::Job job;
  job.id                 = row[0].as<int64_t>();
  job.job_token          = Text(row[1]);
  job.order_ref          = Text(row[2]);
  job.capacity           = Text(row[3]);
  job.preferences        = Text(row[4]);
  job.content_plan_ref   = OptText(row[5]);
  job.volume_label       = Text(row[6]);
  job.assigned_device_id = OptText(row[7]);
  job.status             = sql::DecodeJobStatus(Text(row[9]), Text(row[8]));
  job.progress           = row[10].as<int32_t>();
  job.fail_reason        = Text(row[11]);
  job.created_at_ms      = Millis(row[12]);
  job.updated_at_ms      = Millis(row[13]);
  job.started_at_ms      = Millis(row[14]);
  job.finished_at_ms     = Millis(row[15]);
  job.locked_by          = Text(row[16]);
  job.locked_until_ms    = Millis(row[17]);
  job.attempts           = static_cast<uint32_t>(row[18].as<int64_t>());
  job.last_error         = Text(row[19]);
  return job;
}

model::JobLogEntry ReadLog(const pqxx::row& row) {
  model::JobLogEntry e;
  e.id       = row[0].as<int64_t>();
  e.job_id   = row[1].as<int64_t>();
  e.level    = sql::DecodeLogLevel(Text(row[2]));
  e.category = Text(row[3]);
  e.message  = Text(row[4]);
  e.details  = Text(row[5]);
  e.file_path = OptText(row[6]);
  if (!row[7].is_null()) e.file_size = row[7].as<int64_t>();
  e.error_code     = OptText(row[8]);
  e.correlation_id = OptText(row[9]);
  e.created_at_ms  = Millis(row[10]);
  return e;
}

std::vector<model::Job> ReadJobs(const pqxx::result& res) {
  std::vector<model::Job> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadJob(row));
  return out;
}

std::optional<model::Job> FirstJob(const pqxx::result& res) {
  if (res.empty()) return std::nullopt;
  return ReadJob(res[0]);
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::foreign_key_violation*>(&e)) return Result::Err(ErrorCode::NotFound, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return Result::Err(ErrorCode::Conflict, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result PgRepository::InsertJob(Transaction& t, model::Job& job) {
  if (job.created_at_ms == 0) job.created_at_ms = util::NowMs();
  if (job.updated_at_ms == 0) job.updated_at_ms = job.created_at_ms;

  try {
    auto res = TX(t).Work().exec_prepared("insert_job", ToPg(sql::InsertJobParams(job)));
    job.id   = res[0][0].as<int64_t>();
    return Result::Ok(1);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::Job> PgRepository::GetJob(Transaction& t, int64_t id) {
  return Guard([&] { return FirstJob(TX(t).Work().exec_prepared("select_job", id)); });
}

std::optional<model::Job> PgRepository::LockJob(Transaction& t, int64_t id) {
  return Guard([&] { return FirstJob(TX(t).Work().exec_prepared("lock_job", id)); });
}

std::optional<model::Job> PgRepository::GetLatestJobForOrder(Transaction& t, const std::string& order_ref) {
  return Guard([&] { return FirstJob(TX(t).Work().exec_prepared("select_latest_job_for_order", order_ref)); });
}

std::vector<model::Job> PgRepository::ListJobs(Transaction& t, const JobFilter& filter, std::size_t limit) {
  auto clause = sql::JobListClause(filter, limit);
  auto query  = sql::ToPostgres(sql::SELECT_JOBS + clause.sql);
  return Guard([&] { return ReadJobs(TX(t).Work().exec_params(query, ToPg(clause.params))); });
}

Result PgRepository::UpdateJob(Transaction& t, const model::Job& job) {
  try {
    auto res = TX(t).Work().exec_prepared("update_job", ToPg(sql::UpdateJobParams(job)));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteJob(Transaction& t, int64_t id) {
  try {
    // log rows go with the job through ON DELETE CASCADE
    auto res = TX(t).Work().exec_prepared("delete_job", id);
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<StatusCount> PgRepository::CountJobsByStatus(Transaction& t) {
  auto res = Guard([&] { return TX(t).Work().exec_prepared("count_jobs_by_status"); });

  std::map<model::JobStatus, uint64_t> counts;
  for (const auto& row : res) {
    counts[sql::DecodeJobStatus(Text(row[0]), Text(row[1]))] += row[2].as<uint64_t>();
  }

  std::vector<StatusCount> out;
  for (const auto& [status, count] : counts) out.push_back(StatusCount{status, count});
  return out;
}

std::vector<int64_t> PgRepository::ListFinishedJobIds(Transaction& t, uint64_t finished_before_ms) {
  auto res = Guard([&] {
    return TX(t).Work().exec_prepared("select_finished_job_ids", static_cast<int64_t>(finished_before_ms));
  });

  std::vector<int64_t> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(row[0].as<int64_t>());
  return out;
}

// ------------------------------------------------------------------
// Leasing
// ------------------------------------------------------------------

std::optional<model::Job> PgRepository::NextAcquirableJob(Transaction& t, uint64_t now_ms, uint32_t max_attempts) {
  return Guard([&] {
    return FirstJob(TX(t).Work().exec_prepared("select_next_acquirable", static_cast<int64_t>(now_ms),
                                               static_cast<int64_t>(max_attempts)));
  });
}

std::vector<model::Job> PgRepository::ListExpiredLeases(Transaction& t, uint64_t now_ms) {
  return Guard([&] { return ReadJobs(TX(t).Work().exec_prepared("select_expired_leases", static_cast<int64_t>(now_ms))); });
}

std::vector<model::Job> PgRepository::ListActiveLeases(Transaction& t, uint64_t now_ms) {
  return Guard([&] { return ReadJobs(TX(t).Work().exec_prepared("select_active_leases", static_cast<int64_t>(now_ms))); });
}

// ------------------------------------------------------------------
// Job log
// ------------------------------------------------------------------

Result PgRepository::InsertLog(Transaction& t, model::JobLogEntry& entry) {
  if (entry.created_at_ms == 0) entry.created_at_ms = util::NowMs();

  try {
    auto& work = TX(t).Work();
    if (work.exec_prepared("job_exists", entry.job_id).empty()) {
      return Result::Err(ErrorCode::NotFound, "job " + std::to_string(entry.job_id));
    }
    auto res = work.exec_prepared("insert_log", ToPg(sql::InsertLogParams(entry)));
    entry.id = res[0][0].as<int64_t>();
    return Result::Ok(1);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::JobLogEntry> PgRepository::ListLogs(Transaction& t, const LogFilter& filter, std::size_t limit) {
  auto clause = sql::LogListClause(filter, limit);
  auto query  = sql::ToPostgres(sql::SELECT_LOGS + clause.sql);
  auto res    = Guard([&] { return TX(t).Work().exec_params(query, ToPg(clause.params)); });

  std::vector<model::JobLogEntry> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadLog(row));
  return out;
}

Result PgRepository::DeleteLogsOlderThan(Transaction& t, uint64_t cutoff_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_logs_older_than", static_cast<int64_t>(cutoff_ms));
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace usbforge::db::postgres
