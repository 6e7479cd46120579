#include "internal/execution/job_pipeline.hpp"

#include <algorithm>
#include <iterator>
#include <set>

#include <spdlog/fmt/fmt.h>

#include "internal/joblog/log_sink.hpp"
#include "internal/util/errors.hpp"

namespace usbforge::execution {

PipelineExecutor::PipelineExecutor(std::shared_ptr<ContentPlanResolver> resolver,
                                   std::shared_ptr<ExecutionEngine>     engine,
                                   std::shared_ptr<joblog::LogSink>     log_sink,
                                   PipelineOptions                      options)
    : resolver_(std::move(resolver)), engine_(std::move(engine)), log_sink_(std::move(log_sink)), options_(options) {
}

ExecutionOutcome PipelineExecutor::Fail(int64_t job_id, std::string error) {
  log_sink_->Append(job_id, model::LogLevel::kError, model::log_category::kSystem, "Job failed: " + error);
  return ExecutionOutcome::Failed(std::move(error));
}

ExecutionOutcome PipelineExecutor::Execute(const model::Job& job, JobContext& context) {
  ContentPlan plan;
  try {
    plan = resolver_->Resolve(job);
  } catch (const util::NotFound& e) {
    return Fail(job.id, e.what());
  } catch (const util::InvalidArgument& e) {
    return Fail(job.id, e.what());
  }

  std::vector<std::filesystem::path> sources;
  sources.reserve(plan.items.size());
  for (const auto& item : plan.items) sources.push_back(item.source);

  auto validation = engine_->ValidateFiles(job.id, sources);
  if (validation.ValidCount() == 0) {
    return Fail(job.id, "No valid files to copy");
  }
  if (!validation.valid && !options_.allow_partial_validation) {
    return Fail(job.id, fmt::format("Validation failed for {} of {} files", validation.errors.size(), sources.size()));
  }

  std::vector<CopyItem> items;
  if (validation.valid) {
    items = plan.items;
  } else {
    std::set<std::filesystem::path> valid(validation.valid_files.begin(), validation.valid_files.end());
    std::copy_if(plan.items.begin(), plan.items.end(), std::back_inserter(items),
                 [&](const CopyItem& item) { return valid.contains(item.source); });
  }

  if (!engine_->CheckSpace(job.id, plan.destination_root, validation.total_size)) {
    return Fail(job.id, "Insufficient space on destination volume");
  }

  if (!context.ReportProgress(0, model::JobStatus::kWriting)) {
    return ExecutionOutcome::Failed("Lease lost before copy");
  }

  auto copy = engine_->CopyFiles(
      job.id, items, [&](int32_t progress) { context.ReportProgress(progress); }, [&] { return context.ShouldStop(); });
  if (copy.aborted) {
    return ExecutionOutcome::Failed("Copy aborted");
  }
  if (!copy.success) {
    return Fail(job.id, fmt::format("Copy failed for {} of {} files", copy.errors.size(), items.size()));
  }

  if (!context.ReportProgress(100, model::JobStatus::kVerifying)) {
    return ExecutionOutcome::Failed("Lease lost before verification");
  }

  auto verification = engine_->VerifyFiles(job.id, copy.copied, options_.verification);
  if (!verification.success) {
    return Fail(job.id, fmt::format("Verification failed for {} files", verification.failed));
  }

  log_sink_->Info(job.id, model::log_category::kSystem,
                  fmt::format("Job completed: {} files written to {}", copy.files_processed, plan.destination_root.string()));
  return ExecutionOutcome::Ok();
}

} // namespace usbforge::execution
