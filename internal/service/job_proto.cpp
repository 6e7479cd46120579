#include "job_proto.hpp"

#include <google/protobuf/util/time_util.h>

namespace usbforge::service {

using google::protobuf::util::TimeUtil;
namespace v1 = usbforge::v1;

namespace {

// Zero means unset; the field is left absent.
template <typename MutableFn>
void SetTimestamp(uint64_t ms, MutableFn&& mutable_field) {
  if (ms == 0) return;
  *mutable_field() = TimeUtil::MillisecondsToTimestamp(static_cast<int64_t>(ms));
}

} // namespace

v1::JobStatus ToProto(model::JobStatus status) {
  switch (status) {
    case model::JobStatus::kPending:
      return v1::JOB_STATUS_PENDING;
    case model::JobStatus::kProcessing:
      return v1::JOB_STATUS_PROCESSING;
    case model::JobStatus::kWriting:
      return v1::JOB_STATUS_WRITING;
    case model::JobStatus::kVerifying:
      return v1::JOB_STATUS_VERIFYING;
    case model::JobStatus::kDone:
      return v1::JOB_STATUS_DONE;
    case model::JobStatus::kFailed:
      return v1::JOB_STATUS_FAILED;
    case model::JobStatus::kRetry:
      return v1::JOB_STATUS_RETRY;
    case model::JobStatus::kCanceled:
      return v1::JOB_STATUS_CANCELED;
  }
  return v1::JOB_STATUS_UNSPECIFIED;
}

std::optional<model::JobStatus> FromProto(v1::JobStatus status) {
  switch (status) {
    case v1::JOB_STATUS_PENDING:
      return model::JobStatus::kPending;
    case v1::JOB_STATUS_PROCESSING:
      return model::JobStatus::kProcessing;
    case v1::JOB_STATUS_WRITING:
      return model::JobStatus::kWriting;
    case v1::JOB_STATUS_VERIFYING:
      return model::JobStatus::kVerifying;
    case v1::JOB_STATUS_DONE:
      return model::JobStatus::kDone;
    case v1::JOB_STATUS_FAILED:
      return model::JobStatus::kFailed;
    case v1::JOB_STATUS_RETRY:
      return model::JobStatus::kRetry;
    case v1::JOB_STATUS_CANCELED:
      return model::JobStatus::kCanceled;
    default:
      return std::nullopt;
  }
}

v1::LogLevel ToProto(model::LogLevel level) {
  switch (level) {
    case model::LogLevel::kDebug:
      return v1::LOG_LEVEL_DEBUG;
    case model::LogLevel::kInfo:
      return v1::LOG_LEVEL_INFO;
    case model::LogLevel::kWarning:
      return v1::LOG_LEVEL_WARNING;
    case model::LogLevel::kError:
      return v1::LOG_LEVEL_ERROR;
  }
  return v1::LOG_LEVEL_UNSPECIFIED;
}

std::optional<model::LogLevel> FromProto(v1::LogLevel level) {
  switch (level) {
    case v1::LOG_LEVEL_DEBUG:
      return model::LogLevel::kDebug;
    case v1::LOG_LEVEL_INFO:
      return model::LogLevel::kInfo;
    case v1::LOG_LEVEL_WARNING:
      return model::LogLevel::kWarning;
    case v1::LOG_LEVEL_ERROR:
      return model::LogLevel::kError;
    default:
      return std::nullopt;
  }
}

void ToProto(const model::Job& job, v1::Job* out) {
  out->set_id(job.id);
  out->set_job_token(job.job_token);
  out->set_order_ref(job.order_ref);
  out->set_capacity(job.capacity);
  out->set_preferences_json(job.preferences);
  out->set_content_plan_ref(job.content_plan_ref.value_or(""));
  out->set_volume_label(job.volume_label);
  out->set_assigned_device_id(job.assigned_device_id.value_or(""));

  out->set_status(ToProto(job.status));
  out->set_progress(job.progress);
  out->set_fail_reason(job.fail_reason);

  SetTimestamp(job.created_at_ms, [out] { return out->mutable_created_at(); });
  SetTimestamp(job.updated_at_ms, [out] { return out->mutable_updated_at(); });
  SetTimestamp(job.started_at_ms, [out] { return out->mutable_started_at(); });
  SetTimestamp(job.finished_at_ms, [out] { return out->mutable_finished_at(); });

  if (!job.locked_by.empty()) {
    out->mutable_lease()->set_locked_by(job.locked_by);
    SetTimestamp(job.locked_until_ms, [out] { return out->mutable_lease()->mutable_locked_until(); });
  }
  out->set_attempts(job.attempts);
  out->set_last_error(job.last_error);
}

void ToProto(const model::JobLogEntry& entry, v1::JobLogEntry* out) {
  out->set_id(entry.id);
  out->set_job_id(entry.job_id);
  out->set_level(ToProto(entry.level));
  out->set_category(entry.category);
  out->set_message(entry.message);
  out->set_details_json(entry.details);
  if (entry.file_path) out->set_file_path(*entry.file_path);
  if (entry.file_size) out->set_file_size(*entry.file_size);
  if (entry.error_code) out->set_error_code(*entry.error_code);
  if (entry.correlation_id) out->set_correlation_id(*entry.correlation_id);
  SetTimestamp(entry.created_at_ms, [out] { return out->mutable_created_at(); });
}

model::JobLogEntry FromProto(const v1::JobLogEntry& entry) {
  model::JobLogEntry out;
  out.job_id   = entry.job_id();
  out.level    = FromProto(entry.level()).value_or(model::LogLevel::kInfo);
  out.category = entry.category();
  out.message  = entry.message();
  out.details  = entry.details_json();

  if (!entry.file_path().empty()) out.file_path = entry.file_path();
  if (entry.file_size() != 0) out.file_size = entry.file_size();
  if (!entry.error_code().empty()) out.error_code = entry.error_code();
  if (!entry.correlation_id().empty()) out.correlation_id = entry.correlation_id();
  if (entry.has_created_at()) out.created_at_ms = ToMillis(entry.created_at());
  return out;
}

uint64_t ToMillis(const google::protobuf::Timestamp& ts) {
  const int64_t ms = TimeUtil::TimestampToMilliseconds(ts);
  return ms > 0 ? static_cast<uint64_t>(ms) : 0;
}

} // namespace usbforge::service
