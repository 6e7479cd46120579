#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

#if USBFORGE_DB_SQLITE
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/joblog/log_sink.hpp"
#include "internal/lease/lease_manager.hpp"
#endif

#if USBFORGE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#endif

namespace {

using usbforge::db::ErrorCode;
using usbforge::db::JobFilter;
using usbforge::db::LogFilter;
using usbforge::db::Repository;
using usbforge::db::memory::MemoryRepository;
using usbforge::model::Job;
using usbforge::model::JobLogEntry;
using usbforge::model::JobStatus;
using usbforge::model::LogLevel;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;  // empty store
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;          // reopen, keep data
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

Job MakeJob(const std::string& order_ref, uint64_t created_at_ms, JobStatus status = JobStatus::kPending) {
  Job job;
  job.job_token     = "job-" + order_ref + "-" + std::to_string(created_at_ms);
  job.order_ref     = order_ref;
  job.capacity      = "64GB";
  job.preferences   = R"({"genre":"rock"})";
  job.volume_label  = "MUSIC";
  job.status        = status;
  job.created_at_ms = created_at_ms;
  job.updated_at_ms = created_at_ms;
  return job;
}

JobLogEntry MakeLog(int64_t job_id, LogLevel level, const std::string& category, const std::string& message,
                    uint64_t created_at_ms) {
  JobLogEntry entry;
  entry.job_id        = job_id;
  entry.level         = level;
  entry.category      = category;
  entry.message       = message;
  entry.created_at_ms = created_at_ms;
  return entry;
}

int64_t Insert(Repository& repo, Job job) {
  auto tx = repo.Begin();
  assert(repo.InsertJob(*tx, job));
  assert(job.id > 0);
  tx->Commit();
  return job.id;
}

uint64_t CountOf(Repository& repo, JobStatus status) {
  auto     tx    = repo.Begin();
  uint64_t count = 0;
  for (const auto& row : repo.CountJobsByStatus(*tx)) {
    if (row.status == status) count = row.count;
  }
  tx->Commit();
  return count;
}

bool Contains(const std::vector<Job>& jobs, int64_t id) {
  return std::any_of(jobs.begin(), jobs.end(), [id](const Job& j) { return j.id == id; });
}

// Runs first, on an empty store.
void VerifyAcquireOrder(Repository& repo) {
  const uint64_t now = NowMs();

  auto exhausted     = MakeJob("acquire-exhausted", now - 50'000, JobStatus::kRetry);
  exhausted.attempts = 3;
  Insert(repo, exhausted);

  auto held            = MakeJob("acquire-held", now - 40'000, JobStatus::kRetry);
  held.locked_by       = "worker-held";
  held.locked_until_ms = now + 60'000;
  held.attempts        = 1;
  Insert(repo, held);

  const auto oldest = Insert(repo, MakeJob("acquire-a", now - 30'000));
  const auto middle = Insert(repo, MakeJob("acquire-b", now - 20'000));

  auto stale            = MakeJob("acquire-stale", now - 10'000, JobStatus::kRetry);
  stale.locked_by       = "worker-gone";
  stale.locked_until_ms = now - 1'000;
  stale.attempts        = 1;
  const auto stale_id   = Insert(repo, stale);

  std::vector<int64_t> order;
  for (int i = 0; i < 3; ++i) {
    auto tx   = repo.Begin();
    auto next = repo.NextAcquirableJob(*tx, now, 3);
    assert(next.has_value());
    order.push_back(next->id);

    next->status          = JobStatus::kProcessing;
    next->locked_by       = "worker-1";
    next->locked_until_ms = now + 60'000;
    next->attempts += 1;
    next->started_at_ms = now;
    assert(repo.UpdateJob(*tx, *next));
    tx->Commit();
  }
  assert((order == std::vector<int64_t>{oldest, middle, stale_id}));

  {
    auto tx = repo.Begin();
    assert(!repo.NextAcquirableJob(*tx, now, 3).has_value());
    // a higher ceiling makes the exhausted job eligible again
    auto again = repo.NextAcquirableJob(*tx, now, 4);
    assert(again.has_value() && again->order_ref == "acquire-exhausted");
    tx->Rollback();
  }

  auto tx         = repo.Begin();
  auto reacquired = repo.GetJob(*tx, stale_id);
  assert(reacquired.has_value());
  assert(reacquired->status == JobStatus::kProcessing);
  assert(reacquired->attempts == 2);
  assert(reacquired->locked_by == "worker-1");
  tx->Commit();
}

void VerifyJobLifecycle(Repository& repo, const std::string& prefix) {
  const uint64_t now      = NowMs();
  const auto     order    = prefix + "-order";
  auto           first    = MakeJob(order, now);
  first.content_plan_ref  = "plans/" + order + ".yaml";
  first.assigned_device_id = "dev-7";
  const auto first_id     = Insert(repo, first);
  const auto second_id    = Insert(repo, MakeJob(order, now + 5));

  {
    auto tx  = repo.Begin();
    auto job = repo.GetJob(*tx, first_id);
    assert(job.has_value());
    assert(job->order_ref == order);
    assert(job->capacity == "64GB");
    assert(job->preferences == R"({"genre":"rock"})");
    assert(job->content_plan_ref == "plans/" + order + ".yaml");
    assert(job->assigned_device_id == "dev-7");
    assert(job->status == JobStatus::kPending);
    assert(job->locked_by.empty());
    assert(job->locked_until_ms == 0);
    assert(job->created_at_ms == now);

    auto latest = repo.GetLatestJobForOrder(*tx, order);
    assert(latest.has_value() && latest->id == second_id);
    assert(!repo.GetLatestJobForOrder(*tx, prefix + "-none").has_value());
    assert(!repo.GetJob(*tx, 987654321).has_value());
    tx->Commit();
  }

  {
    auto tx  = repo.Begin();
    auto job = repo.LockJob(*tx, first_id);
    assert(job.has_value());
    job->status          = JobStatus::kWriting;
    job->progress        = 40;
    job->locked_by       = "worker-9";
    job->locked_until_ms = now + 30'000;
    job->attempts        = 1;
    job->last_error      = "previous failure";
    job->started_at_ms   = now + 1;
    job->updated_at_ms   = now + 2;
    assert(repo.UpdateJob(*tx, *job));
    tx->Commit();
  }

  {
    auto tx  = repo.Begin();
    auto job = repo.GetJob(*tx, first_id);
    assert(job->status == JobStatus::kWriting);
    assert(job->progress == 40);
    assert(job->locked_by == "worker-9");
    assert(job->locked_until_ms == now + 30'000);
    assert(job->last_error == "previous failure");
    assert(job->started_at_ms == now + 1);

    JobFilter by_order;
    by_order.order_ref = order;
    auto listed        = repo.ListJobs(*tx, by_order, 10);
    assert(listed.size() == 2);
    assert(listed[0].id == second_id);

    JobFilter by_status;
    by_status.order_ref = order;
    by_status.statuses  = {JobStatus::kWriting, JobStatus::kVerifying};
    listed              = repo.ListJobs(*tx, by_status, 10);
    assert(listed.size() == 1 && listed[0].id == first_id);

    JobFilter by_device;
    by_device.assigned_device_id = "dev-7";
    assert(Contains(repo.ListJobs(*tx, by_device, 10), first_id));

    JobFilter by_time;
    by_time.order_ref       = order;
    by_time.created_from_ms = now + 1;
    listed                  = repo.ListJobs(*tx, by_time, 10);
    assert(listed.size() == 1 && listed[0].id == second_id);

    assert(repo.ListJobs(*tx, by_order, 1).size() == 1);
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(repo.DeleteJob(*tx, second_id).affected_rows == 1);
    assert(repo.DeleteJob(*tx, second_id).affected_rows == 0);
    tx->Commit();
  }

  auto tx = repo.Begin();
  assert(!repo.GetJob(*tx, second_id).has_value());
  tx->Commit();
}

void VerifyLeaseQueries(Repository& repo, const std::string& prefix) {
  const uint64_t now = NowMs();

  auto active            = MakeJob(prefix + "-active", now, JobStatus::kVerifying);
  active.locked_by       = "worker-a";
  active.locked_until_ms = now + 60'000;
  const auto active_id   = Insert(repo, active);

  auto expired            = MakeJob(prefix + "-expired", now, JobStatus::kProcessing);
  expired.locked_by       = "worker-b";
  expired.locked_until_ms = now - 1;
  const auto expired_id   = Insert(repo, expired);

  auto finished            = MakeJob(prefix + "-finished", now, JobStatus::kDone);
  finished.finished_at_ms  = now;
  const auto finished_id   = Insert(repo, finished);

  auto tx = repo.Begin();

  auto expired_rows = repo.ListExpiredLeases(*tx, now);
  assert(Contains(expired_rows, expired_id));
  assert(!Contains(expired_rows, active_id));
  assert(!Contains(expired_rows, finished_id));

  auto active_rows = repo.ListActiveLeases(*tx, now);
  assert(Contains(active_rows, active_id));
  assert(!Contains(active_rows, expired_id));
  for (std::size_t i = 1; i < active_rows.size(); ++i) {
    assert(active_rows[i - 1].locked_until_ms <= active_rows[i].locked_until_ms);
  }

  // once its lease runs out the active job is reported as expired
  assert(Contains(repo.ListExpiredLeases(*tx, now + 60'000), active_id));
  tx->Commit();
}

void VerifyJobLog(Repository& repo, const std::string& prefix) {
  const uint64_t now   = NowMs();
  const auto     job_a = Insert(repo, MakeJob(prefix + "-log-a", now));
  const auto     job_b = Insert(repo, MakeJob(prefix + "-log-b", now));
  const auto     corr  = prefix + "-corr";

  {
    auto tx = repo.Begin();

    auto e1           = MakeLog(job_a, LogLevel::kInfo, "copy", "copied 1", now + 1);
    e1.correlation_id = corr;
    e1.file_path      = "/music/one.flac";
    e1.file_size      = 12345;
    auto e2           = MakeLog(job_a, LogLevel::kError, "verify", "size mismatch", now + 2);
    e2.error_code     = "SIZE_MISMATCH";
    e2.details        = R"({"expected":10,"actual":9})";
    auto e3           = MakeLog(job_b, LogLevel::kWarning, "copy", "slow write", now + 3);
    e3.correlation_id = corr;
    auto ancient      = MakeLog(job_b, LogLevel::kDebug, "system", "old entry", 1'000);

    for (auto* e : {&e1, &e2, &e3, &ancient}) {
      assert(repo.InsertLog(*tx, *e));
      assert(e->id > 0);
    }
    assert(e1.id < e2.id && e2.id < e3.id);

    auto orphan = MakeLog(987654321, LogLevel::kInfo, "copy", "nobody", now);
    assert(repo.InsertLog(*tx, orphan).code == ErrorCode::NotFound);
    tx->Commit();
  }

  {
    auto tx = repo.Begin();

    LogFilter for_a;
    for_a.job_id = job_a;
    auto rows    = repo.ListLogs(*tx, for_a, 10);
    assert(rows.size() == 2);
    assert(rows[0].message == "size mismatch");
    assert(rows[0].error_code == "SIZE_MISMATCH");
    assert(rows[0].details == R"({"expected":10,"actual":9})");
    assert(rows[1].file_path == "/music/one.flac");
    assert(rows[1].file_size == 12345);
    assert(!rows[1].error_code.has_value());

    LogFilter errors;
    errors.job_id = job_a;
    errors.level  = LogLevel::kError;
    assert(repo.ListLogs(*tx, errors, 10).size() == 1);

    LogFilter by_category;
    by_category.job_id   = job_b;
    by_category.category = "copy";
    assert(repo.ListLogs(*tx, by_category, 10).size() == 1);

    LogFilter by_code;
    by_code.error_code = "SIZE_MISMATCH";
    by_code.job_id     = job_a;
    assert(repo.ListLogs(*tx, by_code, 10).size() == 1);

    LogFilter chain;
    chain.correlation_id = corr;
    chain.oldest_first   = true;
    rows                 = repo.ListLogs(*tx, chain, 10);
    assert(rows.size() == 2);
    assert(rows[0].job_id == job_a && rows[1].job_id == job_b);

    LogFilter window;
    window.job_id          = job_b;
    window.created_from_ms = now;
    window.created_to_ms   = now + 10;
    assert(repo.ListLogs(*tx, window, 10).size() == 1);

    assert(repo.ListLogs(*tx, for_a, 1).size() == 1);
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(repo.DeleteLogsOlderThan(*tx, 2'000).affected_rows == 1);
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(repo.DeleteJob(*tx, job_a));
    tx->Commit();
  }

  auto      tx = repo.Begin();
  LogFilter for_a;
  for_a.job_id = job_a;
  assert(repo.ListLogs(*tx, for_a, 10).empty());
  LogFilter for_b;
  for_b.job_id = job_b;
  assert(repo.ListLogs(*tx, for_b, 10).size() == 1);
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  const auto order = prefix + "-rollback";
  {
    auto tx  = repo.Begin();
    auto job = MakeJob(order, NowMs());
    assert(repo.InsertJob(*tx, job));
    tx->Rollback();
  }
  {
    // dropped without commit
    auto tx  = repo.Begin();
    auto job = MakeJob(order, NowMs());
    assert(repo.InsertJob(*tx, job));
  }

  auto tx = repo.Begin();
  assert(!repo.GetLatestJobForOrder(*tx, order).has_value());
  tx->Commit();
}

void VerifyCountsAndRetention(Repository& repo, const std::string& prefix) {
  const uint64_t now          = NowMs();
  const uint64_t failed_before = CountOf(repo, JobStatus::kFailed);
  const uint64_t pending_before = CountOf(repo, JobStatus::kPending);

  auto old_failed           = MakeJob(prefix + "-old", now - 100'000, JobStatus::kFailed);
  old_failed.finished_at_ms = now - 90'000;
  old_failed.fail_reason    = "disk full";
  const auto old_id         = Insert(repo, old_failed);

  auto recent_failed           = MakeJob(prefix + "-recent", now, JobStatus::kFailed);
  recent_failed.finished_at_ms = now;
  const auto recent_id         = Insert(repo, recent_failed);

  const auto queued_id = Insert(repo, MakeJob(prefix + "-queued", now - 100'000));

  assert(CountOf(repo, JobStatus::kFailed) == failed_before + 2);
  assert(CountOf(repo, JobStatus::kPending) == pending_before + 1);

  auto tx  = repo.Begin();
  auto ids = repo.ListFinishedJobIds(*tx, now - 10'000);
  assert(std::find(ids.begin(), ids.end(), old_id) != ids.end());
  assert(std::find(ids.begin(), ids.end(), recent_id) == ids.end());
  assert(std::find(ids.begin(), ids.end(), queued_id) == ids.end());
  assert(repo.GetJob(*tx, old_id)->fail_reason == "disk full");
  tx->Commit();
}

void VerifyConcurrentUpdates(Repository& repo, const std::string& prefix, bool supports_parallel_transactions) {
  // sqlite serializes transactions per connection; a second Begin on this
  // thread would wait on itself
  if (!supports_parallel_transactions) return;

  const auto id = Insert(repo, MakeJob(prefix + "-concurrency", NowMs()));

  auto tx1 = repo.Begin();
  auto tx2 = repo.Begin();

  auto r1 = repo.GetJob(*tx1, id);
  auto r2 = repo.GetJob(*tx2, id);
  assert(r1.has_value() && r2.has_value());

  r1->progress = 10;
  r2->progress = 20;

  assert(repo.UpdateJob(*tx1, *r1));
  tx1->Commit();

  // optimistic stores reject the stale writer, locking stores apply it last
  bool second_applied = true;
  try {
    assert(repo.UpdateJob(*tx2, *r2));
    tx2->Commit();
  } catch (const usbforge::util::TransactionConflict&) {
    second_applied = false;
  }

  auto verify_tx = repo.Begin();
  auto final     = repo.GetJob(*verify_tx, id);
  assert(final.has_value());
  assert(final->progress == (second_applied ? 20 : 10));
  verify_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, std::shared_ptr<Repository> repo, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  const uint64_t now = NowMs();
  auto           job = MakeJob(prefix + "-durable", now, JobStatus::kVerifying);
  job.locked_by       = "worker-d";
  job.locked_until_ms = now + 10'000;
  job.progress        = 80;
  job.attempts        = 2;
  const auto id       = Insert(*repo, job);
  {
    auto tx    = repo->Begin();
    auto entry = MakeLog(id, LogLevel::kInfo, "progress", "80% complete", now);
    assert(repo->InsertLog(*tx, entry));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx       = repo->Begin();
  auto reopened = repo->GetJob(*tx, id);
  assert(reopened.has_value());
  assert(reopened->status == JobStatus::kVerifying);
  assert(reopened->progress == 80);
  assert(reopened->attempts == 2);
  assert(reopened->locked_by == "worker-d");
  assert(reopened->locked_until_ms == now + 10'000);

  LogFilter filter;
  filter.job_id = id;
  auto logs     = repo->ListLogs(*tx, filter, 10);
  assert(logs.size() == 1 && logs[0].message == "80% complete");
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if USBFORGE_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("usbforge_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto open_repo = [db_path]() {
    auto db = std::make_shared<usbforge::db::sqlite::SqliteDB>(db_path);
    usbforge::db::sql::RunMigrations(*db, usbforge::db::sql::SqliteSchema());
    return std::make_shared<usbforge::db::sqlite::SqliteRepository>(std::move(db));
  };
  auto cleanup = [db_path]() {
    for (const auto* suffix : {"", "-wal", "-shm"}) std::filesystem::remove(db_path + suffix);
  };

  return BackendFactory{
      .name = "sqlite",
      .make_repository =
          [open_repo, cleanup]() {
            cleanup();
            return open_repo();
          },
      .supports_restart = []() { return true; },
      .restart =
          [open_repo](std::shared_ptr<Repository>& repo) {
            repo.reset();
            repo = open_repo();
          },
      .cleanup                        = cleanup,
      .supports_parallel_transactions = false,
  };
}
#endif

#if USBFORGE_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("USBFORGE_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("USBFORGE_TEST_POSTGRES_URI is not set");
  }

  auto conninfo = std::string(uri);
  auto wipe     = [conninfo]() {
    usbforge::db::postgres::PgMigrationExecutor exec(conninfo);
    usbforge::db::sql::RunMigrations(exec, usbforge::db::sql::PostgresSchema());
    exec.ExecuteSQL("DELETE FROM processing_job_logs;");
    exec.ExecuteSQL("DELETE FROM processing_jobs;");
  };
  auto open_repo = [conninfo]() {
    return std::make_shared<usbforge::db::postgres::PgRepository>(std::make_shared<usbforge::db::postgres::PgPool>(conninfo));
  };

  return BackendFactory{
      .name = "postgres",
      .make_repository =
          [wipe, open_repo]() {
            wipe();
            return open_repo();
          },
      .supports_restart = []() { return true; },
      .restart =
          [open_repo](std::shared_ptr<Repository>& repo) {
            repo.reset();
            repo = open_repo();
          },
      .cleanup                        = wipe,
      .supports_parallel_transactions = true,
  };
}
#endif

#if USBFORGE_DB_SQLITE
// Separate connections to one file stand in for separate worker processes.
void VerifySqliteConnectionsNeverShareJobs() {
  using namespace std::chrono_literals;
  constexpr int kConnections = 4;
  constexpr int kJobs        = 60;

  const auto db_path =
      (std::filesystem::temp_directory_path() / ("usbforge_integration_sqlite_multi_" + std::to_string(NowMs()) + ".db")).string();
  auto remove_files = [&]() {
    for (const auto* suffix : {"", "-wal", "-shm"}) std::filesystem::remove(db_path + suffix);
  };
  remove_files();

  std::vector<std::shared_ptr<usbforge::lease::LeaseManager>> managers;
  std::shared_ptr<Repository>                                 seed;
  for (int i = 0; i < kConnections; ++i) {
    auto db = std::make_shared<usbforge::db::sqlite::SqliteDB>(db_path);
    usbforge::db::sql::RunMigrations(*db, usbforge::db::sql::SqliteSchema());
    auto repo = std::make_shared<usbforge::db::sqlite::SqliteRepository>(std::move(db));
    if (!seed) seed = repo;
    managers.push_back(std::make_shared<usbforge::lease::LeaseManager>(repo, std::make_shared<usbforge::joblog::LogSink>(repo)));
  }

  const uint64_t now = NowMs();
  for (int i = 0; i < kJobs; ++i) {
    Insert(*seed, MakeJob("multi-" + std::to_string(i), now - kJobs + i));
  }

  std::mutex               mutex;
  std::map<int64_t, int>   grants;
  std::vector<std::thread>   threads;
  for (int i = 0; i < kConnections; ++i) {
    threads.emplace_back([&, i]() {
      const auto worker_id = "worker-" + std::to_string(i);
      for (;;) {
        std::optional<Job> job;
        try {
          job = managers[i]->Acquire(worker_id, 60s);
        } catch (const usbforge::util::StorageError&) {
          std::this_thread::sleep_for(5ms);
          continue;
        }
        if (!job) return;
        std::lock_guard lock(mutex);
        grants[job->id]++;
      }
    });
  }
  for (auto& thread : threads) thread.join();

  assert(grants.size() == static_cast<std::size_t>(kJobs));
  for (const auto& [id, count] : grants) {
    assert(count == 1);
  }
  assert(CountOf(*seed, JobStatus::kProcessing) == static_cast<uint64_t>(kJobs));

  managers.clear();
  seed.reset();
  remove_files();
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  VerifyAcquireOrder(*repo);
  VerifyJobLifecycle(*repo, backend.name);
  VerifyLeaseQueries(*repo, backend.name);
  VerifyJobLog(*repo, backend.name);
  VerifyRollbackBehavior(*repo, backend.name);
  VerifyCountsAndRetention(*repo, backend.name);
  VerifyConcurrentUpdates(*repo, backend.name, backend.supports_parallel_transactions);
  VerifyRestartDurability(backend, std::move(repo), backend.name);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if USBFORGE_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if USBFORGE_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

#if USBFORGE_DB_SQLITE
  VerifySqliteConnectionsNeverShareJobs();
#endif

  std::cout << "usbforge_integration_repository_parity: pass\n";
  return 0;
}
