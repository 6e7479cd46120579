#include "factory.hpp"

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/execution/content_plan.hpp"
#include "internal/execution/execution_engine.hpp"
#include "internal/joblog/log_sink.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/job_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#if USBFORGE_WITH_GRPC
#include "internal/grpc/job_server.hpp"
#endif
#if USBFORGE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if USBFORGE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace usbforge::factory {

using usbforge::runtime::config::RuntimeConfig;

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if USBFORGE_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sql::RunMigrations(*sqlite_db, db::sql::SqliteSchema());
    USBFORGE_LOG_INFO("job store opened", {observability::StringField("backend", "sqlite"),
                                           observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw util::InvalidArgument("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if USBFORGE_DB_POSTGRES
    {
      db::postgres::PgMigrationExecutor migrations(database.postgres().connection_uri());
      db::sql::RunMigrations(migrations, db::sql::PostgresSchema());
    }
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), database.postgres().pool_size());
    USBFORGE_LOG_INFO("job store opened", {observability::StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw util::InvalidArgument("postgres backend requested but not enabled at build time");
#endif
  }

  USBFORGE_LOG_WARN("job store is in-memory; jobs are lost on exit");
  return std::make_shared<db::memory::MemoryRepository>();
}

worker::WorkerOptions WorkerOptionsFrom(const RuntimeConfig& config) {
  const auto& w = config.worker();

  worker::WorkerOptions options;
  options.worker_id                   = w.worker_id().empty() ? worker::DefaultWorkerId() : w.worker_id();
  options.lease_duration              = util::ToMillis(w.lease_duration());
  options.poll_interval               = util::ToMillis(w.poll_interval());
  options.max_concurrent_jobs         = w.max_concurrent_jobs();
  options.extension_threshold_percent = w.extension_threshold_percent();
  options.shutdown_grace              = util::ToMillis(w.shutdown_grace());
  options.reaper_interval             = util::ToMillis(w.reaper_interval());
  options.abort_on_lease_loss         = w.abort_on_lease_loss();
  return options;
}

lease::LeasePolicy LeasePolicyFrom(const RuntimeConfig& config) {
  lease::LeasePolicy policy;
  policy.max_attempts = config.worker().max_attempts();
  return policy;
}

execution::PipelineOptions PipelineOptionsFrom(const RuntimeConfig& config) {
  const auto& exec = config.execution();

  execution::PipelineOptions options;
  options.verification.strategy = exec.verification().strategy() == usbforge::runtime::config::VERIFICATION_STRATEGY_FULL
                                      ? execution::VerificationStrategy::kFull
                                      : execution::VerificationStrategy::kSampling;
  options.verification.sample_percentage = exec.verification().sample_percentage();
  options.verification.min_sample_size   = exec.verification().min_sample_size();
  options.allow_partial_validation       = exec.allow_partial_validation();
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Job store + audit trail
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.log_sink   = std::make_shared<joblog::LogSink>(app.repository);
  app.leases     = std::make_shared<lease::LeaseManager>(app.repository, app.log_sink, LeasePolicyFrom(config));

  // ------------------------------------------------------------------
  // Execution
  // ------------------------------------------------------------------
  const auto& exec     = config.execution();
  auto        resolver = std::make_shared<execution::ManifestPlanResolver>(exec.manifest_dir(), exec.destination_root());
  auto        engine   = std::make_shared<execution::ExecutionEngine>(app.log_sink);
  auto        executor = std::make_shared<execution::PipelineExecutor>(resolver, engine, app.log_sink, PipelineOptionsFrom(config));

  app.worker = std::make_shared<worker::Worker>(app.leases, executor, app.log_sink, WorkerOptionsFrom(config));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository = app.repository;
  ctx.log_sink   = app.log_sink;

  app.job_service = std::make_shared<service::JobService>(ctx);

#if USBFORGE_WITH_GRPC
  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::JobServer>(app.job_service));
#endif

  return app;
}

} // namespace usbforge::factory
