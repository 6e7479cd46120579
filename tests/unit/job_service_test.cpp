#include "internal/service/job_service.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include <google/protobuf/util/time_util.h>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/joblog/log_sink.hpp"
#include "internal/lease/lease_manager.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using namespace usbforge::v1;
using usbforge::service::JobService;

constexpr uint64_t kDayMs   = 24ull * 60 * 60 * 1000;
constexpr uint64_t kEpochMs = 1'700'000'000'000;

struct Fixture {
  std::shared_ptr<std::atomic<uint64_t>>         now_ms = std::make_shared<std::atomic<uint64_t>>(kEpochMs);
  usbforge::util::ClockFn                        clock  = [now = now_ms] { return usbforge::util::FromUnixMillis(now->load()); };
  std::shared_ptr<usbforge::db::Repository>      repository = std::make_shared<usbforge::db::memory::MemoryRepository>();
  std::shared_ptr<usbforge::joblog::LogSink>     log_sink   = std::make_shared<usbforge::joblog::LogSink>(repository, clock);
  std::shared_ptr<usbforge::lease::LeaseManager> leases =
      std::make_shared<usbforge::lease::LeaseManager>(repository, log_sink, usbforge::lease::LeasePolicy{}, clock);
  std::unique_ptr<JobService> service;

  Fixture() {
    usbforge::service::ServiceContext ctx;
    ctx.repository = repository;
    ctx.log_sink   = log_sink;
    ctx.clock      = clock;
    service        = std::make_unique<JobService>(ctx);
  }

  int64_t Submit(const std::string& order_ref, const std::string& preferences = {}) {
    SubmitJobRequest req;
    req.set_order_ref(order_ref);
    req.set_capacity("64GB");
    req.set_preferences_json(preferences);
    req.set_content_plan_ref(order_ref + ".yaml");
    return service->SubmitJob(req).job_id();
  }

  Job Get(int64_t id) {
    GetJobRequest req;
    req.set_job_id(id);
    return service->GetJob(req).job();
  }
};

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestSubmitCreatesPendingJob() {
  Fixture f;
  const auto id = f.Submit("order-100", R"({"genre":"jazz"})");
  assert(id > 0);

  const auto job = f.Get(id);
  assert(job.status() == JOB_STATUS_PENDING);
  assert(job.progress() == 0);
  assert(job.attempts() == 0);
  assert(job.job_token().rfind("job-", 0) == 0);
  assert(job.preferences_json() == R"({"genre":"jazz"})");
  assert(job.content_plan_ref() == "order-100.yaml");
  assert(!job.has_lease());
  assert(job.has_created_at());
  assert(job.has_updated_at());
  assert(!job.has_started_at());
  assert(!job.has_finished_at());

  // empty preferences default to an empty object
  assert(f.Get(f.Submit("order-101")).preferences_json() == "{}");

  ListJobLogsRequest logs;
  logs.set_job_id(id);
  const auto entries = f.service->ListJobLogs(logs).entries();
  assert(entries.size() == 1);
  assert(entries[0].category() == "system");
  assert(entries[0].message() == "Processing job created for order order-100");
}

void TestSubmitRejectsBadInput() {
  Fixture f;

  SubmitJobRequest req;
  req.set_capacity("64GB");
  assert(Throws<usbforge::util::InvalidArgument>([&] { f.service->SubmitJob(req); }));

  req.set_order_ref("order-1");
  req.set_capacity("");
  assert(Throws<usbforge::util::InvalidArgument>([&] { f.service->SubmitJob(req); }));

  req.set_capacity("64GB");
  req.set_preferences_json("[1,2]");
  assert(Throws<usbforge::util::InvalidArgument>([&] { f.service->SubmitJob(req); }));
}

void TestStatusAndLookups() {
  Fixture f;
  const auto first = f.Submit("order-200");
  f.now_ms->fetch_add(1000);
  const auto second = f.Submit("order-200");

  GetJobStatusRequest status_req;
  status_req.set_job_id(first);
  const auto status = f.service->GetJobStatus(status_req);
  assert(status.status() == JOB_STATUS_PENDING);
  assert(status.progress() == 0);
  assert(status.fail_reason().empty());

  status_req.set_job_id(9999);
  assert(Throws<usbforge::util::NotFound>([&] { f.service->GetJobStatus(status_req); }));

  GetJobRequest latest;
  latest.set_latest_for_order_ref("order-200");
  assert(f.service->GetJob(latest).job().id() == second);

  latest.set_latest_for_order_ref("order-none");
  assert(Throws<usbforge::util::NotFound>([&] { f.service->GetJob(latest); }));

  assert(Throws<usbforge::util::InvalidArgument>([&] { f.service->GetJob(GetJobRequest{}); }));
}

void TestListFiltersAndClamps() {
  Fixture f;
  for (int i = 0; i < 60; ++i) {
    f.Submit("order-list-" + std::to_string(i % 3));
    f.now_ms->fetch_add(10);
  }
  assert(f.leases->Acquire("worker-1", 60s).has_value());

  ListJobsRequest all;
  const auto page = f.service->ListJobs(all);
  assert(page.jobs_size() == 50);
  // newest first
  assert(page.jobs(0).id() > page.jobs(1).id());

  all.set_limit(1000);
  assert(f.service->ListJobs(all).jobs_size() == 60);

  ListJobsRequest by_order;
  by_order.set_order_ref("order-list-1");
  by_order.set_limit(100);
  assert(f.service->ListJobs(by_order).jobs_size() == 20);

  ListJobsRequest by_status;
  by_status.add_statuses(JOB_STATUS_PROCESSING);
  const auto processing = f.service->ListJobs(by_status);
  assert(processing.jobs_size() == 1);
  assert(processing.jobs(0).lease().locked_by() == "worker-1");

  ListJobsRequest by_time;
  *by_time.mutable_created_from() = google::protobuf::util::TimeUtil::MillisecondsToTimestamp(kEpochMs + 500);
  by_time.set_limit(200);
  assert(f.service->ListJobs(by_time).jobs_size() == 10);
}

void TestCancelOnlyUnleasedQueuedJobs() {
  Fixture f;
  const auto leased = f.Submit("order-300");
  f.now_ms->fetch_add(1);
  const auto queued = f.Submit("order-301");
  assert(f.leases->Acquire("worker-1", 60s)->id == leased);
  const auto running = f.Get(leased);
  assert(running.has_started_at());
  assert(!running.has_finished_at());
  assert(running.lease().locked_by() == "worker-1");
  assert(google::protobuf::util::TimeUtil::TimestampToMilliseconds(running.lease().locked_until()) ==
         static_cast<int64_t>(kEpochMs + 1 + 60'000));

  CancelJobRequest req;
  req.set_job_id(leased);
  assert(Throws<usbforge::util::InvalidState>([&] { f.service->CancelJob(req); }));

  req.set_job_id(queued);
  req.set_reason("customer request");
  const auto canceled = f.service->CancelJob(req).job();
  assert(canceled.status() == JOB_STATUS_CANCELED);
  assert(canceled.fail_reason() == "customer request");
  assert(canceled.has_finished_at());

  assert(Throws<usbforge::util::InvalidState>([&] { f.service->CancelJob(req); }));
  assert(!f.leases->Acquire("worker-2", 60s).has_value());

  req.set_job_id(12345);
  assert(Throws<usbforge::util::NotFound>([&] { f.service->CancelJob(req); }));
}

void TestUpdateRespectsLeases() {
  Fixture f;
  const auto id = f.Submit("order-400");

  UpdateJobRequest req;
  req.set_job_id(id);
  req.set_status(JOB_STATUS_WRITING);
  assert(Throws<usbforge::util::InvalidState>([&] { f.service->UpdateJob(req); }));

  req.set_status(JOB_STATUS_UNSPECIFIED);
  req.set_has_progress(true);
  req.set_progress(101);
  assert(Throws<usbforge::util::InvalidArgument>([&] { f.service->UpdateJob(req); }));

  assert(f.leases->Acquire("worker-1", 1000ms).has_value());
  req.set_progress(30);
  assert(Throws<usbforge::util::InvalidState>([&] { f.service->UpdateJob(req); }));

  // an expired in-flight job is left to the reaper, whatever the target
  f.now_ms->fetch_add(5000);
  req.set_has_progress(false);
  for (auto status : {JOB_STATUS_DONE, JOB_STATUS_FAILED, JOB_STATUS_RETRY}) {
    req.set_status(status);
    assert(Throws<usbforge::util::InvalidState>([&] { f.service->UpdateJob(req); }));
  }
  auto job = f.Get(id);
  assert(job.status() == JOB_STATUS_PROCESSING);
  assert(job.progress() == 0);
  assert(!job.has_finished_at());

  assert(f.leases->ResetExpired() == 1);
  assert(f.Get(id).status() == JOB_STATUS_RETRY);
}

void TestUpdateCannotStrandJobAtCeiling() {
  Fixture f;
  const auto id = f.Submit("order-401");

  for (int attempt = 1; attempt <= 3; ++attempt) {
    auto job = f.leases->Acquire("worker-1", 1000ms);
    assert(job.has_value() && job->id == id);
    assert(job->attempts == static_cast<uint32_t>(attempt));
    if (attempt < 3) {
      assert(f.leases->Release(id, "worker-1", usbforge::model::JobStatus::kRetry, "boom"));
    }
  }

  f.now_ms->fetch_add(5000);
  UpdateJobRequest req;
  req.set_job_id(id);
  req.set_status(JOB_STATUS_RETRY);
  assert(Throws<usbforge::util::InvalidState>([&] { f.service->UpdateJob(req); }));

  assert(f.leases->ResetExpired() == 1);
  const auto job = f.Get(id);
  assert(job.status() == JOB_STATUS_FAILED);
  assert(job.attempts() == 3);
  assert(job.has_finished_at());
  assert(!f.leases->Acquire("worker-2", 1000ms).has_value());
}

void TestAppendAndQueryLogs() {
  Fixture f;
  const auto id = f.Submit("order-500");

  AppendLogRequest single;
  auto*            entry = single.mutable_entry();
  entry->set_job_id(id);
  entry->set_level(LOG_LEVEL_ERROR);
  entry->set_category("copy");
  entry->set_message("Copy failed: Input/output error");
  entry->set_error_code("COPY_FAILED");
  entry->set_file_path("/library/a.mp3");
  entry->set_correlation_id("batch-7");
  assert(f.service->AppendLog(single).log_id() > 0);

  AppendLogsRequest batch;
  for (int i = 0; i < 3; ++i) {
    auto* e = batch.add_entries();
    e->set_job_id(id);
    e->set_level(i == 0 ? LOG_LEVEL_ERROR : LOG_LEVEL_INFO);
    e->set_category(i == 0 ? "verify" : "progress");
    e->set_message("entry " + std::to_string(i));
    e->set_correlation_id("batch-7");
    if (i == 0) e->set_error_code("SIZE_MISMATCH");
  }
  const auto ids = f.service->AppendLogs(batch).log_ids();
  assert(ids.size() == 3);
  assert(ids[0] < ids[1] && ids[1] < ids[2]);

  AppendLogRequest orphan;
  orphan.mutable_entry()->set_job_id(777);
  orphan.mutable_entry()->set_category("copy");
  orphan.mutable_entry()->set_message("nobody");
  assert(Throws<usbforge::util::NotFound>([&] { f.service->AppendLog(orphan); }));

  AppendLogRequest bad_details = single;
  bad_details.mutable_entry()->set_details_json("not json");
  assert(Throws<usbforge::util::InvalidArgument>([&] { f.service->AppendLog(bad_details); }));

  ListJobLogsRequest errors;
  errors.set_job_id(id);
  errors.set_level(LOG_LEVEL_ERROR);
  assert(f.service->ListJobLogs(errors).entries_size() == 2);

  ListJobLogsRequest correlated;
  correlated.set_correlation_id("batch-7");
  correlated.set_oldest_first(true);
  const auto chain = f.service->ListJobLogs(correlated);
  assert(chain.entries_size() == 4);
  assert(chain.entries(0).message() == "Copy failed: Input/output error");
  assert(chain.entries(0).file_path() == "/library/a.mp3");

  GetErrorSummaryRequest summary_req;
  summary_req.set_job_id(id);
  const auto summary = f.service->GetErrorSummary(summary_req);
  assert(summary.total_errors() == 2);
  assert(summary.by_category().at("copy") == 1);
  assert(summary.by_category().at("verify") == 1);
  assert(summary.by_error_code().at("COPY_FAILED") == 1);
  assert(summary.by_error_code().at("SIZE_MISMATCH") == 1);
}

void TestStatisticsAndRetention() {
  Fixture f;
  const auto done_id = f.Submit("order-600");
  f.now_ms->fetch_add(1);
  f.Submit("order-601");
  f.now_ms->fetch_add(1);
  f.Submit("order-602");

  assert(f.leases->Acquire("worker-1", 60s)->id == done_id);
  assert(f.leases->Release(done_id, "worker-1", usbforge::model::JobStatus::kDone));
  assert(f.leases->Acquire("worker-1", 1000ms).has_value());

  auto stats = f.service->GetStatistics(GetStatisticsRequest{});
  assert(stats.total_jobs() == 3);
  assert(stats.active_leases() == 1);
  assert(stats.expired_leases() == 0);

  f.now_ms->fetch_add(2000);
  stats = f.service->GetStatistics(GetStatisticsRequest{});
  assert(stats.active_leases() == 0);
  assert(stats.expired_leases() == 1);

  uint64_t done = 0;
  for (const auto& row : stats.by_status()) {
    if (row.status() == JOB_STATUS_DONE) done = row.count();
  }
  assert(done == 1);

  // nothing is old enough yet
  PurgeRequest purge;
  purge.set_log_retention_days(30);
  purge.set_job_retention_days(90);
  auto purged = f.service->Purge(purge);
  assert(purged.logs_deleted() == 0);
  assert(purged.jobs_deleted() == 0);

  f.now_ms->fetch_add(91 * kDayMs);
  purged = f.service->Purge(purge);
  assert(purged.logs_deleted() > 0);
  assert(purged.jobs_deleted() == 1);

  GetJobRequest gone;
  gone.set_job_id(done_id);
  assert(Throws<usbforge::util::NotFound>([&] { f.service->GetJob(gone); }));
  assert(f.service->GetStatistics(GetStatisticsRequest{}).total_jobs() == 2);
}

} // namespace

int main() {
  TestSubmitCreatesPendingJob();
  TestSubmitRejectsBadInput();
  TestStatusAndLookups();
  TestListFiltersAndClamps();
  TestCancelOnlyUnleasedQueuedJobs();
  TestUpdateRespectsLeases();
  TestUpdateCannotStrandJobAtCeiling();
  TestAppendAndQueryLogs();
  TestStatisticsAndRetention();

  std::cout << "usbforge_unit_job_service: pass\n";
  return 0;
}
