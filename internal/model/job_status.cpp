#include "internal/model/job_status.hpp"

#include <array>
#include <utility>

namespace usbforge::model {

namespace {

constexpr std::array<std::pair<JobStatus, std::string_view>, 8> kJobStatusNames = {{
    {JobStatus::kPending, "pending"},
    {JobStatus::kProcessing, "processing"},
    {JobStatus::kWriting, "writing"},
    {JobStatus::kVerifying, "verifying"},
    {JobStatus::kDone, "done"},
    {JobStatus::kFailed, "failed"},
    {JobStatus::kRetry, "retry"},
    {JobStatus::kCanceled, "canceled"},
}};

constexpr std::array<std::pair<StorageStatus, std::string_view>, 5> kStorageStatusNames = {{
    {StorageStatus::kQueued, "queued"},
    {StorageStatus::kProcessing, "processing"},
    {StorageStatus::kCompleted, "completed"},
    {StorageStatus::kError, "error"},
    {StorageStatus::kFailed, "failed"},
}};

} // namespace

std::string_view ToString(JobStatus status) {
  for (const auto& [value, name] : kJobStatusNames) {
    if (value == status) return name;
  }
  return "pending";
}

std::optional<JobStatus> ParseJobStatus(std::string_view text) {
  for (const auto& [value, name] : kJobStatusNames) {
    if (name == text) return value;
  }
  return std::nullopt;
}

std::string_view ToString(StorageStatus status) {
  for (const auto& [value, name] : kStorageStatusNames) {
    if (value == status) return name;
  }
  return "queued";
}

std::optional<StorageStatus> ParseStorageStatus(std::string_view text) {
  for (const auto& [value, name] : kStorageStatusNames) {
    if (name == text) return value;
  }
  return std::nullopt;
}

StorageStatus ToStorageStatus(JobStatus status) {
  switch (status) {
    case JobStatus::kPending:
    case JobStatus::kRetry:
      return StorageStatus::kQueued;
    case JobStatus::kProcessing:
    case JobStatus::kWriting:
    case JobStatus::kVerifying:
      return StorageStatus::kProcessing;
    case JobStatus::kDone:
      return StorageStatus::kCompleted;
    case JobStatus::kFailed:
    case JobStatus::kCanceled:
      return StorageStatus::kFailed;
  }
  return StorageStatus::kQueued;
}

JobStatus FromStorageStatus(StorageStatus status) {
  switch (status) {
    case StorageStatus::kQueued:
      return JobStatus::kPending;
    case StorageStatus::kProcessing:
      return JobStatus::kProcessing;
    case StorageStatus::kCompleted:
      return JobStatus::kDone;
    case StorageStatus::kError:
    case StorageStatus::kFailed:
      return JobStatus::kFailed;
  }
  return JobStatus::kPending;
}

} // namespace usbforge::model
