#pragma once

#include <memory>

#include "internal/execution/content_plan.hpp"
#include "internal/execution/execution_engine.hpp"
#include "internal/execution/job_executor.hpp"

namespace usbforge::joblog {
class LogSink;
}

namespace usbforge::execution {

struct PipelineOptions {
  VerificationConfig verification;

  // Copy the valid subset when some files fail validation.
  bool allow_partial_validation = false;
};

/*
  The production job: resolve plan -> validate -> check space ->
  copy (writing) -> verify (verifying).

  Space shortage, any copy error and any verification failure fail the
  job. Validation errors fail it unless partial validation is allowed
  and at least one file is valid.
*/
class PipelineExecutor final : public JobExecutor {
 public:
  PipelineExecutor(std::shared_ptr<ContentPlanResolver> resolver,
                   std::shared_ptr<ExecutionEngine>     engine,
                   std::shared_ptr<joblog::LogSink>     log_sink,
                   PipelineOptions                      options = {});

  ExecutionOutcome Execute(const model::Job& job, JobContext& context) override;

 private:
  ExecutionOutcome Fail(int64_t job_id, std::string error);

  std::shared_ptr<ContentPlanResolver> resolver_;
  std::shared_ptr<ExecutionEngine>     engine_;
  std::shared_ptr<joblog::LogSink>     log_sink_;
  PipelineOptions                      options_;
};

} // namespace usbforge::execution
