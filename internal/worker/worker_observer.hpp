#pragma once

#include <string>

#include "internal/model/job.hpp"

namespace usbforge::worker {

/*
  Worker lifecycle notifications. Each call happens after the matching
  state change is committed. Calls come from worker threads; overrides
  must be thread-safe and must not block.
*/
class WorkerObserver {
 public:
  virtual ~WorkerObserver() = default;

  virtual void OnWorkerStarted(const std::string& /*worker_id*/) {
  }
  virtual void OnWorkerStopped(const std::string& /*worker_id*/) {
  }

  virtual void OnJobStarted(const model::Job& /*job*/) {
  }
  virtual void OnJobCompleted(const model::Job& /*job*/) {
  }
  virtual void OnJobFailed(const model::Job& /*job*/, const std::string& /*error*/, model::JobStatus /*final_status*/) {
  }

  // Renewal was refused; the job may already belong to someone else.
  virtual void OnLeaseLost(const model::Job& /*job*/) {
  }
};

} // namespace usbforge::worker
