#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <map>
#include <type_traits>
#include <variant>

#include "internal/db/sql/sql_filters.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/db/sql/sql_rows.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace usbforge::db::sqlite {

namespace {

// Finalizes on scope exit.
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
      throw util::StorageError(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
  }
  ~Statement() {
    sqlite3_finalize(stmt_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  void Bind(const sql::Params& params) {
    int idx = 1;
    for (const auto& p : params) {
      std::visit(
          [&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
              sqlite3_bind_null(stmt_, idx);
            } else if constexpr (std::is_same_v<T, std::string>) {
              sqlite3_bind_text(stmt_, idx, v.c_str(), -1, SQLITE_TRANSIENT);
            } else {
              sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(v));
            }
          },
          p);
      ++idx;
    }
  }

  // true on SQLITE_ROW, false on SQLITE_DONE
  bool Step() {
    rc_ = sqlite3_step(stmt_);
    if (rc_ == SQLITE_ROW) return true;
    if (rc_ == SQLITE_DONE) return false;
    throw util::StorageError(std::string("sqlite step: ") + sqlite3_errmsg(db_));
  }

  // Runs a write; returns the rc instead of throwing.
  int Run() {
    rc_ = sqlite3_step(stmt_);
    while (rc_ == SQLITE_ROW) rc_ = sqlite3_step(stmt_);
    return rc_;
  }

  sqlite3_stmt* get() const {
    return stmt_;
  }

 private:
  sqlite3*      db_;
  sqlite3_stmt* stmt_ = nullptr;
  int           rc_   = SQLITE_OK;
};

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

model::Job ReadJob(sqlite3_stmt* st) {
  model::Job job;
  job.id                 = sqlite3_column_int64(st, 0);
  job.job_token          = ColText(st, 1);
  job.order_ref          = ColText(st, 2);
  job.capacity           = ColText(st, 3);
  job.preferences        = ColText(st, 4);
  job.content_plan_ref   = ColOptText(st, 5);
  job.volume_label       = ColText(st, 6);
  job.assigned_device_id = ColOptText(st, 7);
  job.status             = sql::DecodeJobStatus(ColText(st, 9), ColText(st, 8));
  job.progress           = sqlite3_column_int(st, 10);
  job.fail_reason        = ColText(st, 11);
  job.created_at_ms      = ColU64(st, 12);
  job.updated_at_ms      = ColU64(st, 13);
  job.started_at_ms      = ColU64(st, 14);
  job.finished_at_ms     = ColU64(st, 15);
  job.locked_by          = ColText(st, 16);
  job.locked_until_ms    = ColU64(st, 17);
  job.attempts           = static_cast<uint32_t>(sqlite3_column_int(st, 18));
  job.last_error         = ColText(st, 19);
  return job;
}

model::JobLogEntry ReadLog(sqlite3_stmt* st) {
  model::JobLogEntry e;
  e.id             = sqlite3_column_int64(st, 0);
  e.job_id         = sqlite3_column_int64(st, 1);
  e.level          = sql::DecodeLogLevel(ColText(st, 2));
  e.category       = ColText(st, 3);
  e.message        = ColText(st, 4);
  e.details        = ColText(st, 5);
  e.file_path      = ColOptText(st, 6);
  if (sqlite3_column_type(st, 7) != SQLITE_NULL) e.file_size = sqlite3_column_int64(st, 7);
  e.error_code     = ColOptText(st, 8);
  e.correlation_id = ColOptText(st, 9);
  e.created_at_ms  = ColU64(st, 10);
  return e;
}

std::vector<model::Job> QueryJobs(sqlite3* db, const std::string& sql, const sql::Params& params) {
  Statement st(db, sql);
  st.Bind(params);
  std::vector<model::Job> out;
  while (st.Step()) out.push_back(ReadJob(st.get()));
  return out;
}

std::optional<model::Job> QueryJob(sqlite3* db, const std::string& sql, const sql::Params& params) {
  Statement st(db, sql);
  st.Bind(params);
  if (!st.Step()) return std::nullopt;
  return ReadJob(st.get());
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok(static_cast<uint64_t>(sqlite3_changes(db)));

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_UNIQUE)
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result SqliteRepository::InsertJob(Transaction& t, model::Job& job) {
  auto* db = TX(t).Handle();

  if (job.created_at_ms == 0) job.created_at_ms = util::NowMs();
  if (job.updated_at_ms == 0) job.updated_at_ms = job.created_at_ms;

  Statement st(db, sql::INSERT_JOB);
  st.Bind(sql::InsertJobParams(job));

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) return Translate(db, rc);

  job.id = sqlite3_column_int64(st.get(), 0);
  return Result::Ok(1);
}

std::optional<model::Job> SqliteRepository::GetJob(Transaction& t, int64_t id) {
  return QueryJob(TX(t).Handle(), std::string(sql::SELECT_JOB) + ";", {id});
}

std::optional<model::Job> SqliteRepository::LockJob(Transaction& t, int64_t id) {
  // BEGIN IMMEDIATE already holds the database write lock
  return GetJob(t, id);
}

std::optional<model::Job> SqliteRepository::GetLatestJobForOrder(Transaction& t, const std::string& order_ref) {
  return QueryJob(TX(t).Handle(), sql::SELECT_LATEST_JOB_FOR_ORDER, {order_ref});
}

std::vector<model::Job> SqliteRepository::ListJobs(Transaction& t, const JobFilter& filter, std::size_t limit) {
  auto clause = sql::JobListClause(filter, limit);
  return QueryJobs(TX(t).Handle(), sql::SELECT_JOBS + clause.sql, clause.params);
}

Result SqliteRepository::UpdateJob(Transaction& t, const model::Job& job) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::UPDATE_JOB);
  st.Bind(sql::UpdateJobParams(job));

  auto result = Translate(db, st.Run());
  if (result && result.affected_rows == 0) return Result::Err(ErrorCode::NotFound);
  return result;
}

Result SqliteRepository::DeleteJob(Transaction& t, int64_t id) {
  auto* db = TX(t).Handle();

  // log rows go with the job through ON DELETE CASCADE
  Statement st(db, sql::DELETE_JOB);
  st.Bind({id});
  return Translate(db, st.Run());
}

std::vector<StatusCount> SqliteRepository::CountJobsByStatus(Transaction& t) {
  Statement st(TX(t).Handle(), sql::COUNT_JOBS_BY_STATUS);

  std::map<model::JobStatus, uint64_t> counts;
  while (st.Step()) {
    auto status = sql::DecodeJobStatus(ColText(st.get(), 0), ColText(st.get(), 1));
    counts[status] += ColU64(st.get(), 2);
  }

  std::vector<StatusCount> out;
  for (const auto& [status, count] : counts) out.push_back(StatusCount{status, count});
  return out;
}

std::vector<int64_t> SqliteRepository::ListFinishedJobIds(Transaction& t, uint64_t finished_before_ms) {
  Statement st(TX(t).Handle(), sql::SELECT_FINISHED_JOB_IDS);
  st.Bind({finished_before_ms});

  std::vector<int64_t> out;
  while (st.Step()) out.push_back(sqlite3_column_int64(st.get(), 0));
  return out;
}

// ------------------------------------------------------------------
// Leasing
// ------------------------------------------------------------------

std::optional<model::Job> SqliteRepository::NextAcquirableJob(Transaction& t, uint64_t now_ms, uint32_t max_attempts) {
  return QueryJob(TX(t).Handle(), std::string(sql::SELECT_NEXT_ACQUIRABLE) + ";",
                  {now_ms, static_cast<int64_t>(max_attempts)});
}

std::vector<model::Job> SqliteRepository::ListExpiredLeases(Transaction& t, uint64_t now_ms) {
  return QueryJobs(TX(t).Handle(), std::string(sql::SELECT_EXPIRED_LEASES) + ";", {now_ms});
}

std::vector<model::Job> SqliteRepository::ListActiveLeases(Transaction& t, uint64_t now_ms) {
  return QueryJobs(TX(t).Handle(), sql::SELECT_ACTIVE_LEASES, {now_ms});
}

// ------------------------------------------------------------------
// Job log
// ------------------------------------------------------------------

Result SqliteRepository::InsertLog(Transaction& t, model::JobLogEntry& entry) {
  auto* db = TX(t).Handle();

  {
    Statement exists(db, "SELECT 1 FROM processing_jobs WHERE id=?;");
    exists.Bind({entry.job_id});
    if (!exists.Step()) return Result::Err(ErrorCode::NotFound, "job " + std::to_string(entry.job_id));
  }

  if (entry.created_at_ms == 0) entry.created_at_ms = util::NowMs();

  Statement st(db, sql::INSERT_LOG);
  st.Bind(sql::InsertLogParams(entry));

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) return Translate(db, rc);

  entry.id = sqlite3_column_int64(st.get(), 0);
  return Result::Ok(1);
}

std::vector<model::JobLogEntry> SqliteRepository::ListLogs(Transaction& t, const LogFilter& filter, std::size_t limit) {
  auto clause = sql::LogListClause(filter, limit);

  Statement st(TX(t).Handle(), sql::SELECT_LOGS + clause.sql);
  st.Bind(clause.params);

  std::vector<model::JobLogEntry> out;
  while (st.Step()) out.push_back(ReadLog(st.get()));
  return out;
}

Result SqliteRepository::DeleteLogsOlderThan(Transaction& t, uint64_t cutoff_ms) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::DELETE_LOGS_OLDER_THAN);
  st.Bind({cutoff_ms});
  return Translate(db, st.Run());
}

} // namespace usbforge::db::sqlite
