#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace usbforge::model {

enum class JobStatus : std::uint8_t {
  kPending    = 0,
  kProcessing = 1,
  kWriting    = 2,
  kVerifying  = 3,
  kDone       = 4,
  kFailed     = 5,
  kRetry      = 6,
  kCanceled   = 7,
};

/*
  Coarse status kept in the legacy `status` column for readers that
  predate the lease columns. Never exposed above the repository.
*/
enum class StorageStatus : std::uint8_t {
  kQueued     = 0,
  kProcessing = 1,
  kCompleted  = 2,
  kError      = 3,
  kFailed     = 4,
};

constexpr bool IsTerminal(JobStatus status) {
  return status == JobStatus::kDone || status == JobStatus::kFailed || status == JobStatus::kCanceled;
}

constexpr bool IsAcquirable(JobStatus status) {
  return status == JobStatus::kPending || status == JobStatus::kRetry;
}

// States a worker holds under lease.
constexpr bool IsInFlight(JobStatus status) {
  return status == JobStatus::kProcessing || status == JobStatus::kWriting || status == JobStatus::kVerifying;
}

constexpr bool CanTransition(JobStatus from, JobStatus to) {
  if (from == to) {
    return !IsTerminal(from);
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (IsAcquirable(from)) {
    return to == JobStatus::kProcessing || to == JobStatus::kCanceled;
  }

  // in flight
  return to != JobStatus::kPending && to != JobStatus::kCanceled;
}

std::string_view         ToString(JobStatus status);
std::optional<JobStatus> ParseJobStatus(std::string_view text);

std::string_view             ToString(StorageStatus status);
std::optional<StorageStatus> ParseStorageStatus(std::string_view text);

StorageStatus ToStorageStatus(JobStatus status);
JobStatus     FromStorageStatus(StorageStatus status);

} // namespace usbforge::model
