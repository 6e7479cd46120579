#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

#include "internal/execution/types.hpp"

namespace usbforge::joblog {
class LogSink;
}

namespace usbforge::execution {

// Available bytes on the volume holding path. Throws std::filesystem::filesystem_error.
using SpaceProbe = std::function<uint64_t(const std::filesystem::path&)>;

using ProgressFn = std::function<void(int32_t progress)>;
using StopFn     = std::function<bool()>;

uint64_t FilesystemSpaceProbe(const std::filesystem::path& path);

// "1.5 GB"
std::string FormatBytes(uint64_t bytes);

std::size_t SampleSize(std::size_t total, const VerificationConfig& config);

/*
  Stateless file pipeline: validate -> check space -> copy -> verify.

  Per-file failures are collected in the stage result and never abort
  sibling files. Every stage writes start/summary entries to the job log.
  Safe to share between concurrently running jobs.
*/
class ExecutionEngine {
 public:
  explicit ExecutionEngine(std::shared_ptr<joblog::LogSink> log_sink,
                           SpaceProbe                       probe = FilesystemSpaceProbe,
                           uint64_t                         seed  = std::random_device{}());

  ValidationResult ValidateFiles(int64_t job_id, const std::vector<std::filesystem::path>& files);

  // false when short of space or when the probe fails
  bool CheckSpace(int64_t job_id, const std::filesystem::path& destination, uint64_t required_bytes);

  // should_stop is polled between files and between chunks of one file.
  CopyResult CopyFiles(int64_t job_id, const std::vector<CopyItem>& items, const ProgressFn& progress = {},
                       const StopFn& should_stop = {});

  VerificationResult VerifyFiles(int64_t job_id, const std::vector<CopyItem>& items, const VerificationConfig& config = {});

 private:
  std::vector<std::size_t> PickSample(std::size_t total, std::size_t count);

  std::shared_ptr<joblog::LogSink> log_sink_;
  SpaceProbe                       probe_;

  std::mutex      rng_mutex_;
  std::mt19937_64 rng_;
};

} // namespace usbforge::execution
