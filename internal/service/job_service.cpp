#include "job_service.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/api/run_in_transaction.hpp"
#include "internal/joblog/log_sink.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/service/job_proto.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/uuid.hpp"

namespace usbforge::service {

using namespace usbforge::v1;

namespace {

constexpr uint64_t kDayMs = 24ull * 60 * 60 * 1000;

double ElapsedMs(std::chrono::steady_clock::time_point started) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
}

template <typename Fn>
auto Guarded(std::string_view route, Fn&& fn) -> decltype(fn()) {
  observability::SpanScope span(route);
  auto&                    metrics = observability::Metrics::Instance();
  const auto               started = std::chrono::steady_clock::now();
  try {
    auto result = fn();
    metrics.RecordRequest(route, true);
    metrics.ObserveRequestLatencyMs(route, ElapsedMs(started));
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    metrics.RecordRequest(route, false);
    metrics.ObserveRequestLatencyMs(route, ElapsedMs(started));
    USBFORGE_LOG_ERROR("RPC failed",
                       {observability::StringField("route", route), observability::StringField("error", ex.what())});
    throw;
  }
}

std::size_t ClampLimit(uint32_t requested, std::size_t fallback, std::size_t max) {
  if (requested == 0) return fallback;
  return std::min<std::size_t>(requested, max);
}

model::Job RequireJob(db::Repository& repo, db::Transaction& tx, int64_t job_id, bool lock) {
  auto job = lock ? repo.LockJob(tx, job_id) : repo.GetJob(tx, job_id);
  if (!job) throw util::NotFound("job " + std::to_string(job_id) + " not found");
  return *job;
}

void ValidateLogEntry(const model::JobLogEntry& entry) {
  if (entry.job_id <= 0) throw util::InvalidArgument("log entry job_id is required");
  if (entry.category.empty()) throw util::InvalidArgument("log entry category is required");
  if (entry.message.empty()) throw util::InvalidArgument("log entry message is required");
  if (!entry.details.empty() && !util::IsJsonObject(entry.details)) {
    throw util::InvalidArgument("log entry details must be a JSON object");
  }
}

} // namespace

JobService::JobService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

uint64_t JobService::NowMs() const {
  return util::ToUnixMillis(ctx_.clock());
}

SubmitJobResponse JobService::SubmitJob(const SubmitJobRequest& req) {
  return Guarded("JobService.SubmitJob", [&] {
    if (req.order_ref().empty()) throw util::InvalidArgument("order_ref is required");
    if (req.capacity().empty()) throw util::InvalidArgument("capacity is required");

    std::string preferences = req.preferences_json().empty() ? "{}" : req.preferences_json();
    if (!util::IsJsonObject(preferences)) throw util::InvalidArgument("preferences must be a JSON object");

    const uint64_t now = NowMs();

    model::Job job;
    job.job_token     = util::GenerateJobToken();
    job.order_ref     = req.order_ref();
    job.capacity      = req.capacity();
    job.preferences   = std::move(preferences);
    job.volume_label  = req.volume_label();
    job.status        = model::JobStatus::kPending;
    job.created_at_ms = now;
    job.updated_at_ms = now;
    if (!req.content_plan_ref().empty()) job.content_plan_ref = req.content_plan_ref();
    if (!req.assigned_device_id().empty()) job.assigned_device_id = req.assigned_device_id();

    db::RunInTransaction(*ctx_.repository, [&](db::Transaction& tx) {
      db::ThrowIfError(ctx_.repository->InsertJob(tx, job), "insert job");
    });

    ctx_.log_sink->Info(job.id, model::log_category::kSystem, "Processing job created for order " + job.order_ref,
                        util::JsonObject().SetString("job_token", job.job_token).SetString("capacity", job.capacity));
    USBFORGE_LOG_INFO("job submitted", {observability::IntField("job_id", job.id),
                                        observability::StringField("order_ref", job.order_ref)});

    SubmitJobResponse resp;
    resp.set_job_id(job.id);
    resp.set_job_token(job.job_token);
    return resp;
  });
}

GetJobStatusResponse JobService::GetJobStatus(const GetJobStatusRequest& req) {
  return Guarded("JobService.GetJobStatus", [&] {
    auto job = db::RunInTransaction(*ctx_.repository, [&](db::Transaction& tx) {
      return RequireJob(*ctx_.repository, tx, req.job_id(), false);
    });

    GetJobStatusResponse resp;
    resp.set_status(ToProto(job.status));
    resp.set_progress(job.progress);
    resp.set_fail_reason(job.fail_reason);
    return resp;
  });
}

GetJobResponse JobService::GetJob(const GetJobRequest& req) {
  return Guarded("JobService.GetJob", [&] {
    auto job = db::RunInTransaction(*ctx_.repository, [&](db::Transaction& tx) -> model::Job {
      switch (req.selector_case()) {
        case GetJobRequest::kJobId:
          return RequireJob(*ctx_.repository, tx, req.job_id(), false);
        case GetJobRequest::kLatestForOrderRef: {
          auto latest = ctx_.repository->GetLatestJobForOrder(tx, req.latest_for_order_ref());
          if (!latest) throw util::NotFound("no job for order " + req.latest_for_order_ref());
          return *latest;
        }
        default:
          throw util::InvalidArgument("job_id or latest_for_order_ref is required");
      }
    });

    GetJobResponse resp;
    ToProto(job, resp.mutable_job());
    return resp;
  });
}

ListJobsResponse JobService::ListJobs(const ListJobsRequest& req) {
  return Guarded("JobService.ListJobs", [&] {
    db::JobFilter filter;
    for (int raw : req.statuses()) {
      auto status = FromProto(static_cast<usbforge::v1::JobStatus>(raw));
      if (!status) throw util::InvalidArgument("unknown job status in filter");
      filter.statuses.push_back(*status);
    }
    if (!req.order_ref().empty()) filter.order_ref = req.order_ref();
    if (!req.assigned_device_id().empty()) filter.assigned_device_id = req.assigned_device_id();
    if (req.has_created_from()) filter.created_from_ms = ToMillis(req.created_from());
    if (req.has_created_to()) filter.created_to_ms = ToMillis(req.created_to());

    const auto limit = ClampLimit(req.limit(), db::kDefaultListLimit, db::kMaxListLimit);
    auto       jobs  = db::RunInTransaction(*ctx_.repository, [&](db::Transaction& tx) {
      return ctx_.repository->ListJobs(tx, filter, limit);
    });

    ListJobsResponse resp;
    for (const auto& job : jobs) ToProto(job, resp.add_jobs());
    return resp;
  });
}

UpdateJobResponse JobService::UpdateJob(const UpdateJobRequest& req) {
  return Guarded("JobService.UpdateJob", [&] {
    std::optional<model::JobStatus> target;
    if (req.status() != JOB_STATUS_UNSPECIFIED) {
      target = FromProto(req.status());
      if (!target) throw util::InvalidArgument("unknown job status");
    }
    if (req.has_progress() && (req.progress() < 0 || req.progress() > 100)) {
      throw util::InvalidArgument("progress must be in 0..100");
    }

    const uint64_t now = NowMs();
    bool           status_changed = false;

    auto job = db::RunInTransaction(*ctx_.repository, [&](db::Transaction& tx) {
      auto job = RequireJob(*ctx_.repository, tx, req.job_id(), true);
      if (job.HasActiveLease(now)) {
        throw util::InvalidState("job " + std::to_string(job.id) + " is leased by " + job.locked_by);
      }
      // an expired in-flight job belongs to the reaper
      if (model::IsInFlight(job.status)) {
        throw util::InvalidState("job " + std::to_string(job.id) + " is " + std::string(model::ToString(job.status)) +
                                 " with an expired lease; wait for the reaper");
      }

      status_changed = false;
      if (target && *target != job.status) {
        // in-flight states are entered only under a lease
        if (model::IsInFlight(*target) || !model::CanTransition(job.status, *target)) {
          throw util::InvalidState("cannot move job from " + std::string(model::ToString(job.status)) + " to " +
                                   std::string(model::ToString(*target)));
        }
        job.status     = *target;
        status_changed = true;
        if (model::IsTerminal(job.status)) {
          job.finished_at_ms = now;
          job.locked_by.clear();
          job.locked_until_ms = 0;
        }
        if (job.status == model::JobStatus::kDone) job.progress = 100;
        if (job.status == model::JobStatus::kFailed && !req.message().empty()) job.fail_reason = req.message();
      } else if (model::IsTerminal(job.status) && req.has_progress()) {
        throw util::InvalidState("job " + std::to_string(job.id) + " is finished");
      }

      if (req.has_progress()) job.progress = req.progress();
      job.updated_at_ms = now;
      db::ThrowIfError(ctx_.repository->UpdateJob(tx, job), "update job");
      return job;
    });

    if (!req.message().empty()) {
      auto details = util::JsonObject().SetString("status", model::ToString(job.status)).SetInt("progress", job.progress);
      ctx_.log_sink->Info(job.id, status_changed ? model::log_category::kSystem : model::log_category::kProgress,
                          req.message(), details);
    }

    UpdateJobResponse resp;
    ToProto(job, resp.mutable_job());
    return resp;
  });
}

CancelJobResponse JobService::CancelJob(const CancelJobRequest& req) {
  return Guarded("JobService.CancelJob", [&] {
    const uint64_t    now    = NowMs();
    const std::string reason = req.reason().empty() ? "Canceled" : req.reason();

    auto job = db::RunInTransaction(*ctx_.repository, [&](db::Transaction& tx) {
      auto job = RequireJob(*ctx_.repository, tx, req.job_id(), true);
      if (!model::IsAcquirable(job.status) || job.HasActiveLease(now)) {
        throw util::InvalidState("job " + std::to_string(job.id) + " cannot be canceled in status " +
                                 std::string(model::ToString(job.status)));
      }

      job.status          = model::JobStatus::kCanceled;
      job.fail_reason     = reason;
      job.finished_at_ms  = now;
      job.updated_at_ms   = now;
      job.locked_by.clear();
      job.locked_until_ms = 0;
      db::ThrowIfError(ctx_.repository->UpdateJob(tx, job), "cancel job");
      return job;
    });

    ctx_.log_sink->Info(job.id, model::log_category::kSystem, "Job canceled: " + reason);

    CancelJobResponse resp;
    ToProto(job, resp.mutable_job());
    return resp;
  });
}

AppendLogResponse JobService::AppendLog(const AppendLogRequest& req) {
  return Guarded("JobService.AppendLog", [&] {
    auto entry = FromProto(req.entry());
    ValidateLogEntry(entry);

    auto stored = ctx_.log_sink->Write(std::move(entry));

    AppendLogResponse resp;
    resp.set_log_id(stored.id);
    return resp;
  });
}

AppendLogsResponse JobService::AppendLogs(const AppendLogsRequest& req) {
  return Guarded("JobService.AppendLogs", [&] {
    std::vector<model::JobLogEntry> entries;
    entries.reserve(req.entries_size());
    for (const auto& raw : req.entries()) {
      entries.push_back(FromProto(raw));
      ValidateLogEntry(entries.back());
    }

    AppendLogsResponse resp;
    for (const auto& stored : ctx_.log_sink->AppendBatch(std::move(entries))) resp.add_log_ids(stored.id);
    return resp;
  });
}

ListJobLogsResponse JobService::ListJobLogs(const ListJobLogsRequest& req) {
  return Guarded("JobService.ListJobLogs", [&] {
    db::LogFilter filter;
    if (req.job_id() != 0) filter.job_id = req.job_id();
    if (req.level() != LOG_LEVEL_UNSPECIFIED) {
      filter.level = FromProto(req.level());
      if (!filter.level) throw util::InvalidArgument("unknown log level");
    }
    if (!req.category().empty()) filter.category = req.category();
    if (!req.error_code().empty()) filter.error_code = req.error_code();
    if (!req.correlation_id().empty()) filter.correlation_id = req.correlation_id();
    if (req.has_created_from()) filter.created_from_ms = ToMillis(req.created_from());
    if (req.has_created_to()) filter.created_to_ms = ToMillis(req.created_to());
    filter.oldest_first = req.oldest_first();

    const auto limit = ClampLimit(req.limit(), joblog::kJobLogLimit, joblog::kCorrelationLogLimit);

    ListJobLogsResponse resp;
    for (const auto& entry : ctx_.log_sink->Query(filter, limit)) ToProto(entry, resp.add_entries());
    return resp;
  });
}

GetErrorSummaryResponse JobService::GetErrorSummary(const GetErrorSummaryRequest& req) {
  return Guarded("JobService.GetErrorSummary", [&] {
    db::LogFilter filter;
    if (req.job_id() != 0) filter.job_id = req.job_id();
    if (!req.correlation_id().empty()) filter.correlation_id = req.correlation_id();
    if (req.has_created_from()) filter.created_from_ms = ToMillis(req.created_from());
    if (req.has_created_to()) filter.created_to_ms = ToMillis(req.created_to());

    const auto summary = ctx_.log_sink->Summarize(filter);

    GetErrorSummaryResponse resp;
    resp.set_total_errors(summary.total_errors);
    for (const auto& [category, count] : summary.by_category) (*resp.mutable_by_category())[category] = count;
    for (const auto& [code, count] : summary.by_error_code) (*resp.mutable_by_error_code())[code] = count;
    return resp;
  });
}

GetStatisticsResponse JobService::GetStatistics(const GetStatisticsRequest&) {
  return Guarded("JobService.GetStatistics", [&] {
    const uint64_t now = NowMs();

    GetStatisticsResponse resp;
    db::RunInTransaction(*ctx_.repository, [&](db::Transaction& tx) {
      resp.Clear();
      uint64_t total = 0;
      for (const auto& row : ctx_.repository->CountJobsByStatus(tx)) {
        auto* out = resp.add_by_status();
        out->set_status(ToProto(row.status));
        out->set_count(row.count);
        total += row.count;
      }
      resp.set_total_jobs(total);
      resp.set_active_leases(static_cast<uint32_t>(ctx_.repository->ListActiveLeases(tx, now).size()));
      resp.set_expired_leases(static_cast<uint32_t>(ctx_.repository->ListExpiredLeases(tx, now).size()));
    });
    return resp;
  });
}

PurgeResponse JobService::Purge(const PurgeRequest& req) {
  return Guarded("JobService.Purge", [&] {
    const uint64_t now = NowMs();

    PurgeResponse resp;
    if (req.log_retention_days() > 0) {
      const uint64_t cutoff = now - std::min<uint64_t>(now, req.log_retention_days() * kDayMs);
      resp.set_logs_deleted(ctx_.log_sink->DeleteOlderThan(cutoff));
    }

    if (req.job_retention_days() > 0) {
      const uint64_t cutoff  = now - std::min<uint64_t>(now, req.job_retention_days() * kDayMs);
      const uint64_t deleted = db::RunInTransaction(*ctx_.repository, [&](db::Transaction& tx) {
        uint64_t count = 0;
        for (int64_t id : ctx_.repository->ListFinishedJobIds(tx, cutoff)) {
          db::ThrowIfError(ctx_.repository->DeleteJob(tx, id), "delete finished job");
          ++count;
        }
        return count;
      });
      resp.set_jobs_deleted(deleted);
    }

    if (resp.logs_deleted() > 0 || resp.jobs_deleted() > 0) {
      USBFORGE_LOG_INFO("retention purge", {observability::IntField("logs_deleted", static_cast<int64_t>(resp.logs_deleted())),
                                            observability::IntField("jobs_deleted", static_cast<int64_t>(resp.jobs_deleted()))});
    }
    return resp;
  });
}

} // namespace usbforge::service
