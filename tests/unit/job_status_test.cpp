#include "internal/model/job_status.hpp"

#include <cassert>
#include <iostream>

namespace {

using usbforge::model::CanTransition;
using usbforge::model::JobStatus;
using usbforge::model::StorageStatus;

constexpr JobStatus kAll[] = {JobStatus::kPending, JobStatus::kProcessing, JobStatus::kWriting, JobStatus::kVerifying,
                              JobStatus::kDone,    JobStatus::kFailed,     JobStatus::kRetry,   JobStatus::kCanceled};

void TestNamesRoundTrip() {
  for (auto status : kAll) {
    auto parsed = usbforge::model::ParseJobStatus(usbforge::model::ToString(status));
    assert(parsed.has_value());
    assert(*parsed == status);
  }
  assert(!usbforge::model::ParseJobStatus("queued").has_value());
}

void TestTerminalStatesAreFinal() {
  for (auto from : {JobStatus::kDone, JobStatus::kFailed, JobStatus::kCanceled}) {
    for (auto to : kAll) {
      assert(!CanTransition(from, to));
    }
  }
}

void TestLeaseDrivenTransitions() {
  assert(CanTransition(JobStatus::kPending, JobStatus::kProcessing));
  assert(CanTransition(JobStatus::kRetry, JobStatus::kProcessing));
  assert(CanTransition(JobStatus::kPending, JobStatus::kCanceled));
  assert(!CanTransition(JobStatus::kPending, JobStatus::kDone));
  assert(!CanTransition(JobStatus::kRetry, JobStatus::kWriting));

  assert(CanTransition(JobStatus::kProcessing, JobStatus::kWriting));
  assert(CanTransition(JobStatus::kWriting, JobStatus::kVerifying));
  assert(CanTransition(JobStatus::kVerifying, JobStatus::kDone));
  assert(CanTransition(JobStatus::kWriting, JobStatus::kRetry));
  assert(CanTransition(JobStatus::kProcessing, JobStatus::kFailed));
  assert(!CanTransition(JobStatus::kWriting, JobStatus::kPending));
  assert(!CanTransition(JobStatus::kVerifying, JobStatus::kCanceled));
}

void TestCoarseStatusMapping() {
  using usbforge::model::FromStorageStatus;
  using usbforge::model::ToStorageStatus;

  assert(ToStorageStatus(JobStatus::kPending) == StorageStatus::kQueued);
  assert(ToStorageStatus(JobStatus::kWriting) == StorageStatus::kProcessing);
  assert(ToStorageStatus(JobStatus::kDone) == StorageStatus::kCompleted);
  assert(ToStorageStatus(JobStatus::kFailed) == StorageStatus::kFailed);

  // legacy rows without the fine status
  assert(FromStorageStatus(StorageStatus::kQueued) == JobStatus::kPending);
  assert(FromStorageStatus(StorageStatus::kCompleted) == JobStatus::kDone);
  assert(FromStorageStatus(StorageStatus::kFailed) == JobStatus::kFailed);
}

} // namespace

int main() {
  TestNamesRoundTrip();
  TestTerminalStatesAreFinal();
  TestLeaseDrivenTransitions();
  TestCoarseStatusMapping();

  std::cout << "usbforge_unit_job_status: pass\n";
  return 0;
}
