#include "internal/lease/lease_manager.hpp"

#include <algorithm>

#include "internal/db/api/repository.hpp"
#include "internal/db/api/run_in_transaction.hpp"
#include "internal/joblog/log_sink.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace usbforge::lease {

namespace {

// Acquire races are expected under many pollers; give them more room.
constexpr int kAcquireCommitAttempts = 32;

std::string AppendError(const std::string& existing, const std::string& error) {
  if (existing.empty()) return error;
  return existing + "; " + error;
}

void ClearLease(model::Job& job) {
  job.locked_by.clear();
  job.locked_until_ms = 0;
}

struct ReclaimedJob {
  int64_t          id = 0;
  std::string      previous_owner;
  uint32_t         attempts = 0;
  model::JobStatus status   = model::JobStatus::kRetry;
};

} // namespace

LeaseManager::LeaseManager(std::shared_ptr<db::Repository> repository,
                           std::shared_ptr<joblog::LogSink> log_sink,
                           LeasePolicy                      policy,
                           util::ClockFn                    clock)
    : repository_(std::move(repository)), log_sink_(std::move(log_sink)), policy_(policy), clock_(std::move(clock)) {
  if (policy_.max_attempts == 0) {
    throw util::InvalidArgument("lease policy max_attempts must be positive");
  }
}

uint64_t LeaseManager::NowMs() const {
  return util::ToUnixMillis(clock_());
}

std::optional<model::Job> LeaseManager::Acquire(const std::string& worker_id, std::chrono::milliseconds lease_duration) {
  if (worker_id.empty()) throw util::InvalidArgument("worker id is required");
  if (lease_duration.count() <= 0) throw util::InvalidArgument("lease duration must be positive");

  auto acquired = db::RunInTransaction(
      *repository_,
      [&](db::Transaction& tx) -> std::optional<model::Job> {
        const uint64_t now = NowMs();

        auto job = repository_->NextAcquirableJob(tx, now, policy_.max_attempts);
        if (!job) return std::nullopt;

        job->locked_by       = worker_id;
        job->locked_until_ms = now + static_cast<uint64_t>(lease_duration.count());
        job->status          = model::JobStatus::kProcessing;
        job->attempts++;
        job->updated_at_ms = now;
        if (job->started_at_ms == 0) job->started_at_ms = now;

        db::ThrowIfError(repository_->UpdateJob(tx, *job), "acquire lease");
        return job;
      },
      kAcquireCommitAttempts);

  if (!acquired) return std::nullopt;

  observability::Metrics::Instance().RecordLeaseEvent("acquired");
  USBFORGE_LOG_INFO("lease acquired", {observability::IntField("job_id", acquired->id),
                                       observability::StringField("worker_id", worker_id),
                                       observability::IntField("attempt", acquired->attempts)});

  util::JsonObject details;
  details.SetString("worker_id", worker_id)
      .SetString("lease_until", util::FormatMillis(acquired->locked_until_ms))
      .SetInt("attempt", acquired->attempts);
  log_sink_->Info(acquired->id, model::log_category::kLease, "Lease acquired by worker " + worker_id, details);

  return acquired;
}

bool LeaseManager::Extend(int64_t job_id, const std::string& worker_id, std::chrono::milliseconds additional) {
  if (additional.count() <= 0) throw util::InvalidArgument("lease extension must be positive");

  uint64_t locked_until = 0;
  bool     extended     = db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    const uint64_t now = NowMs();

    auto job = repository_->LockJob(tx, job_id);
    if (!job || job->locked_by != worker_id || !job->HasActiveLease(now)) return false;

    job->locked_until_ms = now + static_cast<uint64_t>(additional.count());
    job->updated_at_ms   = now;
    db::ThrowIfError(repository_->UpdateJob(tx, *job), "extend lease");

    locked_until = job->locked_until_ms;
    return true;
  });

  if (extended) {
    USBFORGE_LOG_DEBUG("lease extended", {observability::IntField("job_id", job_id),
                                          observability::StringField("worker_id", worker_id),
                                          observability::StringField("locked_until", util::FormatMillis(locked_until))});
  }
  return extended;
}

bool LeaseManager::Release(int64_t job_id, const std::string& worker_id, model::JobStatus final_status, const std::string& error) {
  if (final_status != model::JobStatus::kDone && final_status != model::JobStatus::kFailed &&
      final_status != model::JobStatus::kRetry) {
    throw util::InvalidArgument("lease release status must be done, failed or retry, got " +
                                std::string(model::ToString(final_status)));
  }

  model::JobStatus applied  = final_status;
  bool             released = db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    const uint64_t now = NowMs();

    auto job = repository_->LockJob(tx, job_id);
    if (!job || job->locked_by.empty() || job->locked_by != worker_id) return false;

    // a worker whose lease ran out may hand the job back but not finish it
    if (model::IsTerminal(final_status) && !job->HasActiveLease(now)) return false;

    applied = final_status;
    if (applied == model::JobStatus::kRetry && job->attempts >= policy_.max_attempts) {
      applied = model::JobStatus::kFailed;
    }
    if (!model::CanTransition(job->status, applied)) return false;

    ClearLease(*job);
    job->status        = applied;
    job->updated_at_ms = now;
    if (!error.empty()) job->last_error = error;
    if (applied == model::JobStatus::kDone) job->progress = 100;
    if (applied == model::JobStatus::kFailed) job->fail_reason = error.empty() ? job->last_error : error;
    if (model::IsTerminal(applied)) job->finished_at_ms = now;

    db::ThrowIfError(repository_->UpdateJob(tx, *job), "release lease");
    return true;
  });

  if (!released) {
    USBFORGE_LOG_WARN("lease release rejected", {observability::IntField("job_id", job_id),
                                                 observability::StringField("worker_id", worker_id),
                                                 observability::StringField("status", model::ToString(final_status))});
    return false;
  }

  const std::string status_name(model::ToString(applied));
  observability::Metrics::Instance().RecordLeaseEvent("released");
  USBFORGE_LOG_INFO("lease released", {observability::IntField("job_id", job_id),
                                       observability::StringField("worker_id", worker_id),
                                       observability::StringField("status", status_name)});

  util::JsonObject details;
  details.SetString("worker_id", worker_id).SetString("status", status_name);
  if (!error.empty()) details.SetString("error", error);
  log_sink_->Append(job_id, applied == model::JobStatus::kDone ? model::LogLevel::kInfo : model::LogLevel::kWarning,
                    model::log_category::kLease, "Lease released with status " + status_name, details);
  return true;
}

std::size_t LeaseManager::ResetExpired() {
  std::vector<ReclaimedJob> reclaimed;

  db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    reclaimed.clear();
    const uint64_t now = NowMs();

    for (auto& job : repository_->ListExpiredLeases(tx, now)) {
      ReclaimedJob r;
      r.id             = job.id;
      r.previous_owner = job.locked_by;
      r.attempts       = job.attempts;
      r.status         = job.attempts >= policy_.max_attempts ? model::JobStatus::kFailed : model::JobStatus::kRetry;

      ClearLease(job);
      job.status        = r.status;
      job.last_error    = AppendError(job.last_error, kLeaseExpiredError);
      job.updated_at_ms = now;
      if (r.status == model::JobStatus::kFailed) {
        job.finished_at_ms = now;
        job.fail_reason    = job.last_error;
      }

      db::ThrowIfError(repository_->UpdateJob(tx, job), "reset expired lease");
      reclaimed.push_back(std::move(r));
    }
  });

  for (const auto& r : reclaimed) {
    observability::Metrics::Instance().RecordLeaseEvent("reclaimed");
    const std::string status_name(model::ToString(r.status));
    USBFORGE_LOG_WARN("expired lease reclaimed", {observability::IntField("job_id", r.id),
                                                  observability::StringField("previous_owner", r.previous_owner),
                                                  observability::StringField("status", status_name)});

    util::JsonObject details;
    details.SetString("previous_owner", r.previous_owner).SetInt("attempts", r.attempts).SetString("status", status_name);
    log_sink_->Warn(r.id, model::log_category::kLease,
                    r.status == model::JobStatus::kRetry ? "Lease expired - job reset for retry"
                                                         : "Lease expired - job failed after maximum attempts",
                    details);
  }
  return reclaimed.size();
}

bool LeaseManager::UpdateProgress(int64_t job_id, const std::string& worker_id, int32_t progress,
                                  std::optional<model::JobStatus> phase) {
  if (phase && !model::IsInFlight(*phase)) {
    throw util::InvalidArgument("progress phase must be processing, writing or verifying");
  }

  return db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    const uint64_t now = NowMs();

    auto job = repository_->LockJob(tx, job_id);
    if (!job || job->locked_by != worker_id || !job->HasActiveLease(now)) return false;
    if (phase && !model::CanTransition(job->status, *phase)) return false;

    job->progress      = std::clamp(progress, 0, 100);
    job->updated_at_ms = now;
    if (phase) job->status = *phase;

    db::ThrowIfError(repository_->UpdateJob(tx, *job), "update progress");
    return true;
  });
}

std::vector<model::Job> LeaseManager::ActiveLeases() {
  return db::RunInTransaction(*repository_, [&](db::Transaction& tx) { return repository_->ListActiveLeases(tx, NowMs()); });
}

std::vector<model::Job> LeaseManager::ExpiredLeases() {
  return db::RunInTransaction(*repository_, [&](db::Transaction& tx) { return repository_->ListExpiredLeases(tx, NowMs()); });
}

} // namespace usbforge::lease
