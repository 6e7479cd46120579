#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "internal/model/job.hpp"

namespace usbforge::lease {
class LeaseManager;
}
namespace usbforge::execution {
class JobExecutor;
}
namespace usbforge::joblog {
class LogSink;
}

namespace usbforge::worker {

class WorkerObserver;

enum class WorkerState {
  kStopped,
  kRunning,
  kStopping,
};

std::string_view ToString(WorkerState state);

struct WorkerOptions {
  std::string               worker_id;  // empty = DefaultWorkerId()
  std::chrono::milliseconds lease_duration{std::chrono::seconds(300)};
  std::chrono::milliseconds poll_interval{5000};
  std::size_t               max_concurrent_jobs         = 1;
  uint32_t                  extension_threshold_percent = 50;
  std::chrono::milliseconds shutdown_grace{std::chrono::seconds(30)};
  std::chrono::milliseconds reaper_interval{std::chrono::seconds(60)};  // 0 = startup sweep only

  // Ask a job to stop between files once its renewal is refused.
  bool abort_on_lease_loss = false;
};

// "worker-<hostname>-<pid>"
std::string DefaultWorkerId();

struct WorkerStatus {
  std::string               worker_id;
  WorkerState               state = WorkerState::kStopped;
  std::size_t               active_jobs         = 0;
  std::size_t               max_concurrent_jobs = 0;
  std::chrono::milliseconds lease_duration{0};
  std::chrono::milliseconds poll_interval{0};
  std::vector<int64_t>      active_job_ids;
};

/*
  Polls for leasable jobs and runs them.

  Threads:
    - one poll thread (acquire, periodic reaper, joins finished jobs)
    - per active job: one runner and one lease renewal thread

  Stop() is graceful: polling and renewal end at once, running jobs get
  shutdown_grace to finish, and whatever is still running is handed back
  with status retry.
*/
class Worker {
 public:
  Worker(std::shared_ptr<lease::LeaseManager>    leases,
         std::shared_ptr<execution::JobExecutor> executor,
         std::shared_ptr<joblog::LogSink>        log_sink,
         WorkerOptions                           options,
         std::shared_ptr<WorkerObserver>         observer = nullptr);
  ~Worker();

  Worker(const Worker&)            = delete;
  Worker& operator=(const Worker&) = delete;

  // Throws util::InvalidState unless stopped.
  void Start();
  void Stop();

  WorkerStatus Status() const;

  const std::string& Id() const {
    return options_.worker_id;
  }

 private:
  struct ActiveJob;
  class Context;

  void PollLoop();
  void PollOnce();
  void SweepExpired();
  void Launch(model::Job job);
  void RunJob(const std::shared_ptr<ActiveJob>& active);
  void RenewLoop(const std::shared_ptr<ActiveJob>& active);
  void JoinFinished();
  void StopRenewal(ActiveJob& active);
  void HandBack(ActiveJob& active);

  std::shared_ptr<lease::LeaseManager>    leases_;
  std::shared_ptr<execution::JobExecutor> executor_;
  std::shared_ptr<joblog::LogSink>        log_sink_;
  std::shared_ptr<WorkerObserver>         observer_;
  WorkerOptions                           options_;

  mutable std::mutex                            mutex_;
  std::condition_variable                       cv_;
  WorkerState                                   state_ = WorkerState::kStopped;
  std::map<int64_t, std::shared_ptr<ActiveJob>> active_;

  std::thread                           poll_thread_;
  std::chrono::steady_clock::time_point next_sweep_;
};

} // namespace usbforge::worker
