#include "internal/db/sql/sql_rows.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace usbforge::db::sql {

namespace {

std::string StatusText(model::JobStatus status) {
  return std::string(model::ToString(status));
}

std::string StorageText(model::JobStatus status) {
  return std::string(model::ToString(model::ToStorageStatus(status)));
}

} // namespace

Params InsertJobParams(const model::Job& job) {
  return {
      job.job_token,
      job.order_ref,
      job.capacity,
      job.preferences,
      Nullable(job.content_plan_ref),
      job.volume_label,
      Nullable(job.assigned_device_id),
      StorageText(job.status),
      StatusText(job.status),
      job.progress,
      NullableText(job.fail_reason),
      job.created_at_ms,
      job.updated_at_ms,
      NullableMillis(job.started_at_ms),
      NullableMillis(job.finished_at_ms),
      NullableText(job.locked_by),
      NullableMillis(job.locked_until_ms),
      static_cast<int64_t>(job.attempts),
      NullableText(job.last_error),
  };
}

Params UpdateJobParams(const model::Job& job) {
  return {
      job.capacity,
      job.preferences,
      Nullable(job.content_plan_ref),
      job.volume_label,
      Nullable(job.assigned_device_id),
      StorageText(job.status),
      StatusText(job.status),
      job.progress,
      NullableText(job.fail_reason),
      job.updated_at_ms,
      NullableMillis(job.started_at_ms),
      NullableMillis(job.finished_at_ms),
      NullableText(job.locked_by),
      NullableMillis(job.locked_until_ms),
      static_cast<int64_t>(job.attempts),
      NullableText(job.last_error),
      job.id,
  };
}

Params InsertLogParams(const model::JobLogEntry& entry) {
  return {
      entry.job_id,
      std::string(model::ToString(entry.level)),
      entry.category,
      entry.message,
      NullableText(entry.details),
      Nullable(entry.file_path),
      Nullable(entry.file_size),
      Nullable(entry.error_code),
      Nullable(entry.correlation_id),
      entry.created_at_ms,
  };
}

model::JobStatus DecodeJobStatus(std::string_view job_status, std::string_view storage_status) {
  if (auto status = model::ParseJobStatus(job_status)) {
    return *status;
  }
  if (auto coarse = model::ParseStorageStatus(storage_status)) {
    return model::FromStorageStatus(*coarse);
  }
  throw util::StorageError("unknown job status '" + std::string(job_status) + "'/'" + std::string(storage_status) + "'");
}

model::LogLevel DecodeLogLevel(std::string_view level) {
  if (auto parsed = model::ParseLogLevel(level)) {
    return *parsed;
  }
  throw util::StorageError("unknown log level '" + std::string(level) + "'");
}

} // namespace usbforge::db::sql
