#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/job.hpp"

namespace usbforge::execution {

/*
  What a running job may see of its worker.
*/
class JobContext {
 public:
  virtual ~JobContext() = default;

  // False once the worker no longer holds the lease.
  virtual bool ReportProgress(int32_t progress, std::optional<model::JobStatus> phase = std::nullopt) = 0;

  // True when the job should stop between files (shutdown or lost lease).
  virtual bool ShouldStop() const = 0;
};

struct ExecutionOutcome {
  bool        success = false;
  std::string error;

  static ExecutionOutcome Ok() {
    return ExecutionOutcome{true, {}};
  }
  static ExecutionOutcome Failed(std::string error) {
    return ExecutionOutcome{false, std::move(error)};
  }
};

/*
  Work run for one leased job. Expected job failures are returned as
  outcomes; exceptions are treated as failures by the worker.
*/
class JobExecutor {
 public:
  virtual ~JobExecutor() = default;

  virtual ExecutionOutcome Execute(const model::Job& job, JobContext& context) = 0;
};

} // namespace usbforge::execution
