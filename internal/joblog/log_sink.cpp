#include "internal/joblog/log_sink.hpp"

#include <exception>

#include "internal/db/api/repository.hpp"
#include "internal/db/api/run_in_transaction.hpp"
#include "internal/observability/logging.hpp"

namespace usbforge::joblog {

LogSink::LogSink(std::shared_ptr<db::Repository> repository, util::ClockFn clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

void LogSink::Stamp(model::JobLogEntry& entry) const {
  if (entry.created_at_ms == 0) entry.created_at_ms = util::ToUnixMillis(clock_());
}

bool LogSink::Append(model::JobLogEntry entry) {
  Stamp(entry);
  try {
    auto result = db::RunInTransaction(*repository_, [&](db::Transaction& tx) { return repository_->InsertLog(tx, entry); });
    if (!result) {
      USBFORGE_LOG_WARN("job log append rejected", {observability::IntField("job_id", entry.job_id),
                                                     observability::StringField("error", db::ToString(result.code)),
                                                     observability::StringField("message", entry.message)});
      return false;
    }
    return true;
  } catch (const std::exception& e) {
    USBFORGE_LOG_WARN("job log append failed", {observability::IntField("job_id", entry.job_id),
                                                 observability::StringField("error", e.what()),
                                                 observability::StringField("message", entry.message)});
    return false;
  }
}

bool LogSink::Append(int64_t job_id, model::LogLevel level, std::string_view category, std::string message,
                     const util::JsonObject& details) {
  model::JobLogEntry entry;
  entry.job_id   = job_id;
  entry.level    = level;
  entry.category = std::string(category);
  entry.message  = std::move(message);
  if (!details.Empty()) entry.details = details.ToJson();
  return Append(std::move(entry));
}

model::JobLogEntry LogSink::Write(model::JobLogEntry entry) {
  Stamp(entry);
  db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    db::ThrowIfError(repository_->InsertLog(tx, entry), "append job log");
  });
  return entry;
}

std::vector<model::JobLogEntry> LogSink::AppendBatch(std::vector<model::JobLogEntry> entries) {
  if (entries.empty()) return entries;

  for (auto& entry : entries) Stamp(entry);

  db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    for (auto& entry : entries) {
      db::ThrowIfError(repository_->InsertLog(tx, entry), "append job log batch");
    }
  });
  return entries;
}

std::vector<model::JobLogEntry> LogSink::ForJob(int64_t job_id, std::size_t limit) {
  db::LogFilter filter;
  filter.job_id = job_id;
  return Query(filter, limit);
}

std::vector<model::JobLogEntry> LogSink::ForCorrelationId(const std::string& correlation_id, std::size_t limit) {
  db::LogFilter filter;
  filter.correlation_id = correlation_id;
  filter.oldest_first   = true;
  return Query(filter, limit);
}

std::vector<model::JobLogEntry> LogSink::Query(const db::LogFilter& filter, std::size_t limit) {
  return db::RunInTransaction(*repository_, [&](db::Transaction& tx) { return repository_->ListLogs(tx, filter, limit); });
}

ErrorSummary LogSink::Summarize(db::LogFilter filter) {
  filter.level = model::LogLevel::kError;

  ErrorSummary summary;
  for (const auto& entry : Query(filter, kSummaryScanLimit)) {
    summary.total_errors++;
    summary.by_category[entry.category]++;
    if (entry.error_code) summary.by_error_code[*entry.error_code]++;
  }
  return summary;
}

uint64_t LogSink::DeleteOlderThan(uint64_t cutoff_ms) {
  auto result = db::RunInTransaction(*repository_, [&](db::Transaction& tx) { return repository_->DeleteLogsOlderThan(tx, cutoff_ms); });
  db::ThrowIfError(result, "delete job logs");
  return result.affected_rows;
}

} // namespace usbforge::joblog
