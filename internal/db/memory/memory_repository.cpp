#include "memory_repository.hpp"

#include <algorithm>

#include "internal/util/time.hpp"
#include "memory_tx.hpp"

namespace usbforge::db::memory {

namespace {

bool InRange(uint64_t value, uint64_t from_ms, uint64_t to_ms) {
  if (from_ms != 0 && value < from_ms) return false;
  if (to_ms != 0 && value > to_ms) return false;
  return true;
}

bool Matches(const model::Job& job, const JobFilter& f) {
  if (!f.statuses.empty() && std::find(f.statuses.begin(), f.statuses.end(), job.status) == f.statuses.end()) {
    return false;
  }
  if (f.order_ref && job.order_ref != *f.order_ref) return false;
  if (f.assigned_device_id && job.assigned_device_id != f.assigned_device_id) return false;
  return InRange(job.created_at_ms, f.created_from_ms, f.created_to_ms);
}

bool Matches(const model::JobLogEntry& e, const LogFilter& f) {
  if (f.job_id && e.job_id != *f.job_id) return false;
  if (f.level && e.level != *f.level) return false;
  if (f.category && e.category != *f.category) return false;
  if (f.error_code && e.error_code != f.error_code) return false;
  if (f.correlation_id && e.correlation_id != f.correlation_id) return false;
  return InRange(e.created_at_ms, f.created_from_ms, f.created_to_ms);
}

// created_at then id, like the SQL backends' ORDER BY
bool CreatedBefore(const model::Job& a, const model::Job& b) {
  if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
  return a.id < b.id;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertJob(Transaction& t, model::Job& job) {
  auto& s = TX(t).Mutable();
  for (const auto& [_, existing] : s.jobs) {
    if (existing.job_token == job.job_token) return Result::Err(ErrorCode::AlreadyExists, job.job_token);
  }

  job.id = s.next_job_id++;
  if (job.created_at_ms == 0) job.created_at_ms = util::NowMs();
  if (job.updated_at_ms == 0) job.updated_at_ms = job.created_at_ms;

  s.jobs[job.id] = job;
  return Result::Ok(1);
}

std::optional<model::Job> MemoryRepository::GetJob(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.jobs.find(id);
  if (it == s.jobs.end()) return std::nullopt;
  return it->second;
}

std::optional<model::Job> MemoryRepository::LockJob(Transaction& t, int64_t id) {
  // the commit-time version check stands in for a row lock
  return GetJob(t, id);
}

std::optional<model::Job> MemoryRepository::GetLatestJobForOrder(Transaction& t, const std::string& order_ref) {
  const model::Job* latest = nullptr;
  for (const auto& [_, job] : TX(t).View().jobs) {
    if (job.order_ref != order_ref) continue;
    if (!latest || CreatedBefore(*latest, job)) latest = &job;
  }
  if (!latest) return std::nullopt;
  return *latest;
}

std::vector<model::Job> MemoryRepository::ListJobs(Transaction& t, const JobFilter& filter, std::size_t limit) {
  std::vector<model::Job> out;
  for (const auto& [_, job] : TX(t).View().jobs) {
    if (Matches(job, filter)) out.push_back(job);
  }
  std::sort(out.begin(), out.end(), [](const model::Job& a, const model::Job& b) { return CreatedBefore(b, a); });
  if (out.size() > limit) out.resize(limit);
  return out;
}

Result MemoryRepository::UpdateJob(Transaction& t, const model::Job& job) {
  auto& s  = TX(t).Mutable();
  auto  it = s.jobs.find(job.id);
  if (it == s.jobs.end()) return Result::Err(ErrorCode::NotFound);

  // identity columns are immutable
  model::Job updated = job;
  updated.job_token     = it->second.job_token;
  updated.order_ref     = it->second.order_ref;
  updated.created_at_ms = it->second.created_at_ms;
  it->second            = std::move(updated);
  return Result::Ok(1);
}

Result MemoryRepository::DeleteJob(Transaction& t, int64_t id) {
  auto& s = TX(t).Mutable();
  if (s.jobs.erase(id) == 0) return Result::Ok(0);

  s.logs.erase(std::remove_if(s.logs.begin(), s.logs.end(), [&](const model::JobLogEntry& e) { return e.job_id == id; }),
               s.logs.end());
  return Result::Ok(1);
}

std::vector<StatusCount> MemoryRepository::CountJobsByStatus(Transaction& t) {
  std::map<model::JobStatus, uint64_t> counts;
  for (const auto& [_, job] : TX(t).View().jobs) {
    counts[job.status]++;
  }

  std::vector<StatusCount> out;
  out.reserve(counts.size());
  for (const auto& [status, count] : counts) {
    out.push_back(StatusCount{status, count});
  }
  return out;
}

std::vector<int64_t> MemoryRepository::ListFinishedJobIds(Transaction& t, uint64_t finished_before_ms) {
  std::vector<int64_t> out;
  for (const auto& [id, job] : TX(t).View().jobs) {
    if (model::IsTerminal(job.status) && job.finished_at_ms != 0 && job.finished_at_ms < finished_before_ms) {
      out.push_back(id);
    }
  }
  return out;
}

std::optional<model::Job> MemoryRepository::NextAcquirableJob(Transaction& t, uint64_t now_ms, uint32_t max_attempts) {
  const model::Job* next = nullptr;
  for (const auto& [_, job] : TX(t).View().jobs) {
    if (!model::IsAcquirable(job.status)) continue;
    if (job.locked_until_ms != 0 && job.locked_until_ms > now_ms) continue;
    if (job.attempts >= max_attempts) continue;
    if (!next || CreatedBefore(job, *next)) next = &job;
  }
  if (!next) return std::nullopt;
  return *next;
}

std::vector<model::Job> MemoryRepository::ListExpiredLeases(Transaction& t, uint64_t now_ms) {
  std::vector<model::Job> out;
  for (const auto& [_, job] : TX(t).View().jobs) {
    if (model::IsInFlight(job.status) && job.locked_until_ms != 0 && job.locked_until_ms <= now_ms) {
      out.push_back(job);
    }
  }
  return out;
}

std::vector<model::Job> MemoryRepository::ListActiveLeases(Transaction& t, uint64_t now_ms) {
  std::vector<model::Job> out;
  for (const auto& [_, job] : TX(t).View().jobs) {
    if (job.HasActiveLease(now_ms)) out.push_back(job);
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const model::Job& a, const model::Job& b) { return a.locked_until_ms < b.locked_until_ms; });
  return out;
}

Result MemoryRepository::InsertLog(Transaction& t, model::JobLogEntry& entry) {
  auto& s = TX(t).Mutable();
  if (!s.jobs.contains(entry.job_id)) {
    return Result::Err(ErrorCode::NotFound, "job " + std::to_string(entry.job_id));
  }

  entry.id = s.next_log_id++;
  if (entry.created_at_ms == 0) entry.created_at_ms = util::NowMs();
  s.logs.push_back(entry);
  return Result::Ok(1);
}

std::vector<model::JobLogEntry> MemoryRepository::ListLogs(Transaction& t, const LogFilter& filter, std::size_t limit) {
  std::vector<model::JobLogEntry> out;
  for (const auto& e : TX(t).View().logs) {
    if (Matches(e, filter)) out.push_back(e);
  }

  auto older = [](const model::JobLogEntry& a, const model::JobLogEntry& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
    return a.id < b.id;
  };
  std::sort(out.begin(), out.end(), [&](const model::JobLogEntry& a, const model::JobLogEntry& b) {
    return filter.oldest_first ? older(a, b) : older(b, a);
  });
  if (out.size() > limit) out.resize(limit);
  return out;
}

Result MemoryRepository::DeleteLogsOlderThan(Transaction& t, uint64_t cutoff_ms) {
  auto&      logs   = TX(t).Mutable().logs;
  const auto before = logs.size();
  logs.erase(std::remove_if(logs.begin(), logs.end(), [&](const model::JobLogEntry& e) { return e.created_at_ms < cutoff_ms; }),
             logs.end());
  return Result::Ok(before - logs.size());
}

} // namespace usbforge::db::memory
