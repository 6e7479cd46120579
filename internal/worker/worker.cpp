#include "internal/worker/worker.hpp"

#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <climits>
#include <cstdint>
#include <cstdio>
#include <optional>

#include "internal/execution/job_executor.hpp"
#include "internal/joblog/log_sink.hpp"
#include "internal/lease/lease_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/worker/worker_observer.hpp"

namespace usbforge::worker {

namespace {

constexpr const char* kShutdownError = "Worker shutdown before job completion";

} // namespace

std::string_view ToString(WorkerState state) {
  switch (state) {
    case WorkerState::kStopped:
      return "stopped";
    case WorkerState::kRunning:
      return "running";
    case WorkerState::kStopping:
      return "stopping";
  }
  return "unknown";
}

std::string DefaultWorkerId() {
  char host[HOST_NAME_MAX + 1] = {};
  if (::gethostname(host, sizeof(host) - 1) != 0) {
    std::snprintf(host, sizeof(host), "unknown");
  }
  return "worker-" + std::string(host) + "-" + std::to_string(::getpid());
}

struct Worker::ActiveJob {
  model::Job  job;
  std::thread runner;
  std::thread renewer;

  // guards the flags below
  std::mutex              mutex;
  std::condition_variable cv;
  bool                    renew_stopped = false;
  bool                    finishing     = false;  // runner owns the release
  bool                    handed_back   = false;  // shutdown released it

  std::atomic<bool> stop{false};
  std::atomic<bool> lease_lost{false};
  std::atomic<bool> done{false};
};

class Worker::Context final : public execution::JobContext {
 public:
  Context(Worker& worker, ActiveJob& active) : worker_(worker), active_(active) {
  }

  bool ReportProgress(int32_t progress, std::optional<model::JobStatus> phase) override {
    try {
      if (worker_.leases_->UpdateProgress(active_.job.id, worker_.options_.worker_id, progress, phase)) {
        return true;
      }
    } catch (const util::StorageError& e) {
      // transient; the next report or the renewal will tell
      USBFORGE_LOG_WARN("progress update failed", {observability::IntField("job_id", active_.job.id),
                                                   observability::StringField("error", e.what())});
      return true;
    }
    active_.lease_lost = true;
    return false;
  }

  bool ShouldStop() const override {
    return active_.stop || (worker_.options_.abort_on_lease_loss && active_.lease_lost);
  }

 private:
  Worker&    worker_;
  ActiveJob& active_;
};

Worker::Worker(std::shared_ptr<lease::LeaseManager>    leases,
               std::shared_ptr<execution::JobExecutor> executor,
               std::shared_ptr<joblog::LogSink>        log_sink,
               WorkerOptions                           options,
               std::shared_ptr<WorkerObserver>         observer)
    : leases_(std::move(leases)),
      executor_(std::move(executor)),
      log_sink_(std::move(log_sink)),
      observer_(observer ? std::move(observer) : std::make_shared<WorkerObserver>()),
      options_(std::move(options)) {
  if (options_.worker_id.empty()) options_.worker_id = DefaultWorkerId();
  if (options_.lease_duration.count() <= 0) throw util::InvalidArgument("lease duration must be positive");
  if (options_.poll_interval.count() <= 0) throw util::InvalidArgument("poll interval must be positive");
  if (options_.max_concurrent_jobs == 0) throw util::InvalidArgument("max concurrent jobs must be positive");
  if (options_.extension_threshold_percent == 0 || options_.extension_threshold_percent >= 100) {
    throw util::InvalidArgument("lease extension threshold must be between 1 and 99 percent");
  }
}

Worker::~Worker() {
  Stop();
}

void Worker::Start() {
  {
    std::lock_guard lock(mutex_);
    if (state_ != WorkerState::kStopped) {
      throw util::InvalidState("worker " + options_.worker_id + " is " + std::string(ToString(state_)));
    }
    state_ = WorkerState::kRunning;
  }

  // reclaim work orphaned by a previous crash before taking new work
  SweepExpired();
  next_sweep_ = std::chrono::steady_clock::now() + options_.reaper_interval;

  poll_thread_ = std::thread(&Worker::PollLoop, this);

  USBFORGE_LOG_INFO("worker started", {observability::StringField("worker_id", options_.worker_id),
                                       observability::IntField("max_concurrent_jobs", static_cast<int64_t>(options_.max_concurrent_jobs)),
                                       observability::IntField("lease_ms", options_.lease_duration.count()),
                                       observability::IntField("poll_ms", options_.poll_interval.count())});
  observer_->OnWorkerStarted(options_.worker_id);
}

void Worker::Stop() {
  {
    std::lock_guard lock(mutex_);
    if (state_ != WorkerState::kRunning) return;
    state_ = WorkerState::kStopping;
  }
  cv_.notify_all();
  if (poll_thread_.joinable()) poll_thread_.join();

  std::vector<std::shared_ptr<ActiveJob>> jobs;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [_, active] : active_) jobs.push_back(active);
  }

  USBFORGE_LOG_INFO("worker stopping", {observability::StringField("worker_id", options_.worker_id),
                                        observability::IntField("active_jobs", static_cast<int64_t>(jobs.size()))});

  for (const auto& active : jobs) StopRenewal(*active);

  {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, options_.shutdown_grace, [&] {
      return std::all_of(jobs.begin(), jobs.end(), [](const auto& active) { return active->done.load(); });
    });
  }

  for (const auto& active : jobs) {
    if (!active->done) HandBack(*active);
  }

  for (const auto& active : jobs) {
    if (active->runner.joinable()) active->runner.join();
    if (active->renewer.joinable()) active->renewer.join();
  }

  {
    std::lock_guard lock(mutex_);
    active_.clear();
    state_ = WorkerState::kStopped;
  }

  USBFORGE_LOG_INFO("worker stopped", {observability::StringField("worker_id", options_.worker_id)});
  observer_->OnWorkerStopped(options_.worker_id);
}

WorkerStatus Worker::Status() const {
  std::lock_guard lock(mutex_);

  WorkerStatus status;
  status.worker_id           = options_.worker_id;
  status.state               = state_;
  status.max_concurrent_jobs = options_.max_concurrent_jobs;
  status.lease_duration      = options_.lease_duration;
  status.poll_interval       = options_.poll_interval;
  for (const auto& [id, active] : active_) {
    if (active->done) continue;
    status.active_job_ids.push_back(id);
  }
  status.active_jobs = status.active_job_ids.size();
  return status;
}

// ---------------------------------------------------------------------
// Poll thread
// ---------------------------------------------------------------------

void Worker::PollLoop() {
  std::unique_lock lock(mutex_);
  while (state_ == WorkerState::kRunning) {
    lock.unlock();

    JoinFinished();
    if (options_.reaper_interval.count() > 0 && std::chrono::steady_clock::now() >= next_sweep_) {
      SweepExpired();
      next_sweep_ = std::chrono::steady_clock::now() + options_.reaper_interval;
    }
    PollOnce();

    lock.lock();
    cv_.wait_for(lock, options_.poll_interval, [this] { return state_ != WorkerState::kRunning; });
  }
}

void Worker::PollOnce() {
  {
    std::lock_guard lock(mutex_);
    if (active_.size() >= options_.max_concurrent_jobs) return;
  }

  std::optional<model::Job> job;
  try {
    job = leases_->Acquire(options_.worker_id, options_.lease_duration);
  } catch (const util::StorageError& e) {
    USBFORGE_LOG_WARN("lease acquire failed", {observability::StringField("worker_id", options_.worker_id),
                                               observability::StringField("error", e.what())});
    return;
  }

  if (job) Launch(std::move(*job));
}

void Worker::SweepExpired() {
  try {
    auto reclaimed = leases_->ResetExpired();
    if (reclaimed > 0) {
      USBFORGE_LOG_INFO("expired leases reset", {observability::IntField("count", static_cast<int64_t>(reclaimed))});
    }
  } catch (const util::StorageError& e) {
    USBFORGE_LOG_WARN("expired lease sweep failed", {observability::StringField("error", e.what())});
  }
}

void Worker::Launch(model::Job job) {
  auto active = std::make_shared<ActiveJob>();
  active->job = std::move(job);

  {
    std::lock_guard lock(mutex_);
    active_[active->job.id] = active;
    observability::Metrics::Instance().SetActiveJobs(options_.worker_id, active_.size());
  }

  USBFORGE_LOG_INFO("job started", {observability::IntField("job_id", active->job.id),
                                    observability::StringField("worker_id", options_.worker_id),
                                    observability::IntField("attempt", active->job.attempts)});
  log_sink_->Info(active->job.id, model::log_category::kSystem,
                  "Job execution started by worker " + options_.worker_id + " (attempt " +
                      std::to_string(active->job.attempts) + ")");
  observer_->OnJobStarted(active->job);

  active->renewer = std::thread(&Worker::RenewLoop, this, active);
  active->runner  = std::thread(&Worker::RunJob, this, active);
}

void Worker::JoinFinished() {
  std::vector<std::shared_ptr<ActiveJob>> finished;
  {
    std::lock_guard lock(mutex_);
    for (auto it = active_.begin(); it != active_.end();) {
      if (it->second->done) {
        finished.push_back(std::move(it->second));
        it = active_.erase(it);
      } else {
        ++it;
      }
    }
    if (!finished.empty()) observability::Metrics::Instance().SetActiveJobs(options_.worker_id, active_.size());
  }

  for (const auto& active : finished) {
    if (active->runner.joinable()) active->runner.join();
    if (active->renewer.joinable()) active->renewer.join();
  }
}

// ---------------------------------------------------------------------
// Per-job threads
// ---------------------------------------------------------------------

void Worker::RunJob(const std::shared_ptr<ActiveJob>& active) {
  const auto& job     = active->job;
  const auto  started = std::chrono::steady_clock::now();

  observability::SpanScope span("usbforge.job");
  span.SetAttribute("job_id", static_cast<std::int64_t>(job.id));
  span.SetAttribute("order_ref", job.order_ref);
  span.SetAttribute("attempt", static_cast<std::int64_t>(job.attempts));
  span.SetAttribute("worker_id", options_.worker_id);

  Context                     context(*this, *active);
  execution::ExecutionOutcome outcome;
  try {
    outcome = executor_->Execute(job, context);
  } catch (const std::exception& e) {
    outcome = execution::ExecutionOutcome::Failed(e.what());
  }
  if (!outcome.success) span.RecordException(outcome.error);

  StopRenewal(*active);

  {
    std::lock_guard job_lock(active->mutex);
    if (!active->handed_back) {
      active->finishing = true;

      const auto final_status = outcome.success                           ? model::JobStatus::kDone
                                : job.attempts >= leases_->MaxAttempts() ? model::JobStatus::kFailed
                                                                          : model::JobStatus::kRetry;
      bool released = false;
      try {
        released = leases_->Release(job.id, options_.worker_id, final_status, outcome.error);
      } catch (const util::StorageError& e) {
        USBFORGE_LOG_ERROR("job release failed", {observability::IntField("job_id", job.id),
                                                  observability::StringField("error", e.what())});
      }

      const double elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
      observability::Metrics::Instance().ObserveJobDurationMs(released ? model::ToString(final_status) : "lost", elapsed_ms);

      if (!released) {
        // the reaper or the new owner decides what happens to the job
        USBFORGE_LOG_WARN("job finished without lease", {observability::IntField("job_id", job.id),
                                                         observability::BoolField("success", outcome.success)});
      } else if (outcome.success) {
        observer_->OnJobCompleted(job);
      } else {
        observer_->OnJobFailed(job, outcome.error, final_status);
      }
    }
  }

  {
    std::lock_guard lock(mutex_);
    active->done = true;
  }
  cv_.notify_all();
}

void Worker::RenewLoop(const std::shared_ptr<ActiveJob>& active) {
  const auto interval = std::max(std::chrono::milliseconds(1),
                                 options_.lease_duration * options_.extension_threshold_percent / 100);

  std::unique_lock job_lock(active->mutex);
  for (;;) {
    if (active->cv.wait_for(job_lock, interval, [&] { return active->renew_stopped; })) return;

    job_lock.unlock();
    bool extended = true;
    try {
      extended = leases_->Extend(active->job.id, options_.worker_id, options_.lease_duration);
    } catch (const util::StorageError& e) {
      USBFORGE_LOG_WARN("lease extension failed", {observability::IntField("job_id", active->job.id),
                                                   observability::StringField("error", e.what())});
    }
    job_lock.lock();

    if (active->renew_stopped) return;
    if (!extended) break;
  }
  job_lock.unlock();

  active->lease_lost = true;
  observability::Metrics::Instance().RecordLeaseEvent("lost");
  USBFORGE_LOG_WARN("lease lost", {observability::IntField("job_id", active->job.id),
                                   observability::StringField("worker_id", options_.worker_id)});
  log_sink_->Warn(active->job.id, model::log_category::kLease, "Lease extension failed - job may be reassigned to another worker");
  observer_->OnLeaseLost(active->job);
}

void Worker::StopRenewal(ActiveJob& active) {
  {
    std::lock_guard job_lock(active.mutex);
    active.renew_stopped = true;
  }
  active.cv.notify_all();
}

void Worker::HandBack(ActiveJob& active) {
  std::lock_guard job_lock(active.mutex);
  if (active.finishing) return;

  active.handed_back = true;
  active.stop        = true;

  bool released = false;
  try {
    released = leases_->Release(active.job.id, options_.worker_id, model::JobStatus::kRetry, kShutdownError);
  } catch (const util::StorageError& e) {
    USBFORGE_LOG_ERROR("shutdown release failed", {observability::IntField("job_id", active.job.id),
                                                   observability::StringField("error", e.what())});
  }

  USBFORGE_LOG_WARN("job handed back on shutdown", {observability::IntField("job_id", active.job.id),
                                                    observability::BoolField("released", released)});
  log_sink_->Warn(active.job.id, model::log_category::kSystem, kShutdownError);
}

} // namespace usbforge::worker
