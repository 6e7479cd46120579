#include "internal/db/sql/migrations.hpp"

namespace usbforge::db::sql {

namespace {

// Rows written before job_status existed only carry the coarse status.
constexpr const char* kBackfillJobStatus =
    "UPDATE processing_jobs SET job_status = CASE status"
    " WHEN 'queued' THEN 'pending'"
    " WHEN 'processing' THEN 'processing'"
    " WHEN 'completed' THEN 'done'"
    " ELSE 'failed' END"
    " WHERE job_status IS NULL;";

constexpr const char* kJobIndexes[] = {
    "CREATE INDEX IF NOT EXISTS idx_processing_jobs_acquire ON processing_jobs(job_status, locked_until_ms, created_at_ms);",
    "CREATE INDEX IF NOT EXISTS idx_processing_jobs_order ON processing_jobs(order_ref, created_at_ms);",
    "CREATE INDEX IF NOT EXISTS idx_processing_jobs_locked_by ON processing_jobs(locked_by);",
    "CREATE INDEX IF NOT EXISTS idx_processing_job_logs_job ON processing_job_logs(job_id, created_at_ms);",
    "CREATE INDEX IF NOT EXISTS idx_processing_job_logs_correlation ON processing_job_logs(correlation_id);",
    "CREATE INDEX IF NOT EXISTS idx_processing_job_logs_level ON processing_job_logs(level, created_at_ms);",
};

std::vector<std::string> WithIndexes(std::vector<std::string> statements) {
  statements.emplace_back(kBackfillJobStatus);
  for (const char* sql : kJobIndexes) {
    statements.emplace_back(sql);
  }
  return statements;
}

} // namespace

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = WithIndexes({
      "CREATE TABLE IF NOT EXISTS processing_jobs ("
      "id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " job_token TEXT NOT NULL UNIQUE,"
      " order_ref TEXT NOT NULL,"
      " capacity TEXT NOT NULL,"
      " preferences TEXT NOT NULL DEFAULT '{}',"
      " content_plan_ref TEXT,"
      " volume_label TEXT NOT NULL DEFAULT '',"
      " assigned_device_id TEXT,"
      " status TEXT NOT NULL DEFAULT 'queued',"
      " job_status TEXT,"
      " progress INTEGER NOT NULL DEFAULT 0,"
      " fail_reason TEXT,"
      " created_at_ms INTEGER NOT NULL,"
      " updated_at_ms INTEGER NOT NULL,"
      " started_at_ms INTEGER,"
      " finished_at_ms INTEGER,"
      " locked_by TEXT,"
      " locked_until_ms INTEGER,"
      " attempts INTEGER NOT NULL DEFAULT 0,"
      " last_error TEXT);",

      "CREATE TABLE IF NOT EXISTS processing_job_logs ("
      "id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " job_id INTEGER NOT NULL REFERENCES processing_jobs(id) ON DELETE CASCADE,"
      " level TEXT NOT NULL,"
      " category TEXT NOT NULL,"
      " message TEXT NOT NULL,"
      " details TEXT,"
      " file_path TEXT,"
      " file_size INTEGER,"
      " error_code TEXT,"
      " correlation_id TEXT,"
      " created_at_ms INTEGER NOT NULL);",

      "CREATE TABLE IF NOT EXISTS usbforge_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
      "INSERT OR IGNORE INTO usbforge_schema_migrations(version, applied_at_ms) VALUES(1, CAST(strftime('%s','now') AS INTEGER) * 1000);",
  });
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = WithIndexes({
      "CREATE TABLE IF NOT EXISTS processing_jobs ("
      "id BIGSERIAL PRIMARY KEY,"
      " job_token TEXT NOT NULL UNIQUE,"
      " order_ref TEXT NOT NULL,"
      " capacity TEXT NOT NULL,"
      " preferences TEXT NOT NULL DEFAULT '{}',"
      " content_plan_ref TEXT,"
      " volume_label TEXT NOT NULL DEFAULT '',"
      " assigned_device_id TEXT,"
      " status TEXT NOT NULL DEFAULT 'queued',"
      " job_status TEXT,"
      " progress INTEGER NOT NULL DEFAULT 0,"
      " fail_reason TEXT,"
      " created_at_ms BIGINT NOT NULL,"
      " updated_at_ms BIGINT NOT NULL,"
      " started_at_ms BIGINT,"
      " finished_at_ms BIGINT,"
      " locked_by TEXT,"
      " locked_until_ms BIGINT,"
      " attempts INTEGER NOT NULL DEFAULT 0,"
      " last_error TEXT);",

      "CREATE TABLE IF NOT EXISTS processing_job_logs ("
      "id BIGSERIAL PRIMARY KEY,"
      " job_id BIGINT NOT NULL REFERENCES processing_jobs(id) ON DELETE CASCADE,"
      " level TEXT NOT NULL,"
      " category TEXT NOT NULL,"
      " message TEXT NOT NULL,"
      " details TEXT,"
      " file_path TEXT,"
      " file_size BIGINT,"
      " error_code TEXT,"
      " correlation_id TEXT,"
      " created_at_ms BIGINT NOT NULL);",

      "CREATE TABLE IF NOT EXISTS usbforge_schema_migrations (version INTEGER PRIMARY KEY, applied_at TIMESTAMPTZ DEFAULT NOW());",
      "INSERT INTO usbforge_schema_migrations(version) VALUES(1) ON CONFLICT DO NOTHING;",
  });
  return kSchema;
}

} // namespace usbforge::db::sql
