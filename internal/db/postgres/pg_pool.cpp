#include "pg_pool.hpp"

#include "internal/db/sql/sql_filters.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace usbforge::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (const std::exception& e) {
          {
            std::lock_guard rollback_lock(mutex_);
            --live_connections_;
          }
          cv_.notify_one();
          throw util::StorageError(std::string("postgres connect: ") + e.what());
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_job", sql::ToPostgres(sql::INSERT_JOB));
  conn.prepare("select_job", sql::ToPostgres(sql::SELECT_JOB));
  conn.prepare("lock_job", sql::ToPostgres(std::string(sql::SELECT_JOB) + " FOR UPDATE"));
  conn.prepare("select_latest_job_for_order", sql::ToPostgres(sql::SELECT_LATEST_JOB_FOR_ORDER));
  conn.prepare("update_job", sql::ToPostgres(sql::UPDATE_JOB));
  conn.prepare("delete_job", sql::ToPostgres(sql::DELETE_JOB));
  conn.prepare("job_exists", "SELECT 1 FROM processing_jobs WHERE id=$1");
  conn.prepare("count_jobs_by_status", sql::COUNT_JOBS_BY_STATUS);
  conn.prepare("select_finished_job_ids", sql::ToPostgres(sql::SELECT_FINISHED_JOB_IDS));

  // concurrent pollers skip rows another worker is claiming
  conn.prepare("select_next_acquirable", sql::ToPostgres(std::string(sql::SELECT_NEXT_ACQUIRABLE) + " FOR UPDATE SKIP LOCKED"));
  conn.prepare("select_expired_leases", sql::ToPostgres(std::string(sql::SELECT_EXPIRED_LEASES) + " FOR UPDATE SKIP LOCKED"));
  conn.prepare("select_active_leases", sql::ToPostgres(sql::SELECT_ACTIVE_LEASES));

  conn.prepare("insert_log", sql::ToPostgres(sql::INSERT_LOG));
  conn.prepare("delete_logs_older_than", sql::ToPostgres(sql::DELETE_LOGS_OLDER_THAN));
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

PgMigrationExecutor::PgMigrationExecutor(const std::string& conninfo) {
  try {
    conn_ = std::make_unique<pqxx::connection>(conninfo);
  } catch (const std::exception& e) {
    throw util::StorageError(std::string("postgres connect: ") + e.what());
  }
}

void PgMigrationExecutor::ExecuteSQL(const std::string& sql) {
  try {
    pqxx::work tx(*conn_);
    tx.exec(sql);
    tx.commit();
  } catch (const pqxx::sql_error& e) {
    throw util::StorageError(std::string("postgres migration: ") + e.what());
  }
}

} // namespace usbforge::db::postgres
