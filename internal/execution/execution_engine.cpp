#include "internal/execution/execution_engine.hpp"

#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <fstream>
#include <iterator>
#include <numeric>
#include <optional>
#include <system_error>
#include <vector>

#include <spdlog/fmt/fmt.h>

#include "internal/joblog/log_sink.hpp"
#include "internal/model/job_log.hpp"
#include "internal/observability/spans.hpp"

namespace usbforge::execution {

namespace fs = std::filesystem;

namespace {

std::string ErrnoName(const std::error_code& ec) {
  switch (ec.value()) {
    case ENOENT:
      return "ENOENT";
    case EACCES:
      return "EACCES";
    case EPERM:
      return "EPERM";
    case EIO:
      return "EIO";
    case ENOTDIR:
      return "ENOTDIR";
    case ELOOP:
      return "ELOOP";
    case ENAMETOOLONG:
      return "ENAMETOOLONG";
    default:
      return error_code::kVerifyFailed;
  }
}

constexpr std::size_t kCopyChunkBytes = 1 << 20;

enum class CopyStatus { kCopied, kFailed, kStopped };

// Streams source to destination in chunks, polling should_stop between
// chunks so a large file does not hold up shutdown. A stopped or failed
// copy removes the partial destination.
CopyStatus CopyInChunks(const fs::path& source, const fs::path& destination, const StopFn& should_stop,
                        std::string& failure) {
  std::ifstream in(source, std::ios::binary);
  if (!in) {
    failure = "cannot open source file";
    return CopyStatus::kFailed;
  }
  std::ofstream out(destination, std::ios::binary | std::ios::trunc);
  if (!out) {
    failure = "cannot create destination file";
    return CopyStatus::kFailed;
  }

  std::vector<char> buffer(kCopyChunkBytes);
  CopyStatus        status = CopyStatus::kCopied;
  while (in) {
    if (should_stop && should_stop()) {
      status = CopyStatus::kStopped;
      break;
    }
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const auto got = in.gcount();
    if (got > 0 && !out.write(buffer.data(), got)) {
      failure = "write failed";
      status  = CopyStatus::kFailed;
      break;
    }
  }
  if (status == CopyStatus::kCopied && in.bad()) {
    failure = "read failed";
    status  = CopyStatus::kFailed;
  }
  out.close();
  if (status == CopyStatus::kCopied && !out) {
    failure = "write failed";
    status  = CopyStatus::kFailed;
  }

  if (status != CopyStatus::kCopied) {
    std::error_code ec;
    fs::remove(destination, ec);
  }
  return status;
}

FileError MakeError(const fs::path& path, const char* code, std::string message) {
  return FileError{path.string(), code, std::move(message)};
}

std::optional<FileError> ClassifyFile(const fs::path& path, uint64_t& size) {
  std::error_code ec;
  auto            st = fs::status(path, ec);
  if (ec) {
    if (ec == std::errc::no_such_file_or_directory) return MakeError(path, error_code::kNotFound, "File not found");
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
      return MakeError(path, error_code::kNoPermission, "Permission denied");
    }
    return MakeError(path, error_code::kUnknown, ec.message());
  }
  if (!fs::exists(st)) return MakeError(path, error_code::kNotFound, "File not found");
  if (!fs::is_regular_file(st)) return MakeError(path, error_code::kNotFile, "Not a regular file");

  if (::access(path.c_str(), R_OK) != 0) {
    if (errno == EACCES || errno == EPERM) return MakeError(path, error_code::kNoPermission, "Permission denied");
    return MakeError(path, error_code::kUnknown, std::error_code(errno, std::generic_category()).message());
  }

  size = fs::file_size(path, ec);
  if (ec) return MakeError(path, error_code::kUnknown, ec.message());
  if (size == 0) return MakeError(path, error_code::kEmptyFile, "File is empty");
  return std::nullopt;
}

model::JobLogEntry FileEntry(int64_t job_id, model::LogLevel level, std::string_view category, std::string message,
                             const FileError& error) {
  model::JobLogEntry entry;
  entry.job_id     = job_id;
  entry.level      = level;
  entry.category   = std::string(category);
  entry.message    = std::move(message);
  entry.file_path  = error.path;
  entry.error_code = error.code;
  return entry;
}

int32_t PercentDone(std::size_t done, std::size_t total) {
  return static_cast<int32_t>(std::lround(static_cast<double>(done) / static_cast<double>(total) * 100.0));
}

} // namespace

uint64_t FilesystemSpaceProbe(const fs::path& path) {
  // the destination directory may not exist yet; measure its volume
  fs::path probe = path;
  while (!probe.empty() && !fs::exists(probe)) {
    if (probe == probe.parent_path()) break;
    probe = probe.parent_path();
  }
  if (probe.empty()) probe = fs::current_path();
  return fs::space(probe).available;
}

std::string FormatBytes(uint64_t bytes) {
  if (bytes == 0) return "0 Bytes";

  static constexpr const char* kUnits[] = {"Bytes", "KB", "MB", "GB", "TB"};

  std::size_t unit  = 0;
  double      value = static_cast<double>(bytes);
  while (value >= 1024.0 && unit + 1 < std::size(kUnits)) {
    value /= 1024.0;
    ++unit;
  }

  auto text = fmt::format("{:.2f}", value);
  text.erase(text.find_last_not_of('0') + 1);
  if (text.back() == '.') text.pop_back();
  return text + " " + kUnits[unit];
}

std::size_t SampleSize(std::size_t total, const VerificationConfig& config) {
  if (total == 0) return 0;
  if (config.strategy == VerificationStrategy::kFull) return total;

  const auto by_percent = static_cast<std::size_t>(std::ceil(static_cast<double>(total) * config.sample_percentage / 100.0));
  return std::min(total, std::max(config.min_sample_size, by_percent));
}

ExecutionEngine::ExecutionEngine(std::shared_ptr<joblog::LogSink> log_sink, SpaceProbe probe, uint64_t seed)
    : log_sink_(std::move(log_sink)), probe_(std::move(probe)), rng_(seed) {
}

// ---------------------------------------------------------------------
// Validate
// ---------------------------------------------------------------------

ValidationResult ExecutionEngine::ValidateFiles(int64_t job_id, const std::vector<fs::path>& files) {
  log_sink_->Info(job_id, model::log_category::kValidation, fmt::format("Starting validation of {} files", files.size()));

  ValidationResult result;
  for (const auto& path : files) {
    uint64_t size  = 0;
    auto     error = ClassifyFile(path, size);
    if (error) {
      log_sink_->Append(FileEntry(job_id, model::LogLevel::kWarning, model::log_category::kValidation,
                                  "File validation failed: " + error->message, *error));
      result.errors.push_back(std::move(*error));
      continue;
    }
    result.valid_files.push_back(path);
    result.total_size += size;
  }
  result.valid = result.errors.empty();

  util::JsonObject details;
  details.SetInt("valid_files", static_cast<int64_t>(result.ValidCount()))
      .SetInt("total_files", static_cast<int64_t>(files.size()))
      .SetInt("total_size", static_cast<int64_t>(result.total_size));
  log_sink_->Append(job_id, result.valid ? model::LogLevel::kInfo : model::LogLevel::kWarning, model::log_category::kValidation,
                    fmt::format("Validation complete: {}/{} files valid, {} errors", result.ValidCount(), files.size(),
                                result.errors.size()),
                    details);
  return result;
}

// ---------------------------------------------------------------------
// Space check
// ---------------------------------------------------------------------

bool ExecutionEngine::CheckSpace(int64_t job_id, const fs::path& destination, uint64_t required_bytes) {
  uint64_t available = 0;
  try {
    available = probe_(destination);
  } catch (const std::exception& e) {
    model::JobLogEntry entry;
    entry.job_id     = job_id;
    entry.level      = model::LogLevel::kError;
    entry.category   = std::string(model::log_category::kValidation);
    entry.message    = std::string("Space check failed: ") + e.what();
    entry.file_path  = destination.string();
    entry.error_code = error_code::kSpaceCheckFailed;
    log_sink_->Append(std::move(entry));
    return false;
  }

  const bool enough = available >= required_bytes;

  util::JsonObject details;
  details.SetInt("available", static_cast<int64_t>(available))
      .SetInt("required", static_cast<int64_t>(required_bytes))
      .SetBool("sufficient", enough);
  log_sink_->Append(job_id, enough ? model::LogLevel::kInfo : model::LogLevel::kError, model::log_category::kValidation,
                    fmt::format("Space check: available {}, required {}", FormatBytes(available), FormatBytes(required_bytes)),
                    details);
  return enough;
}

// ---------------------------------------------------------------------
// Copy
// ---------------------------------------------------------------------

CopyResult ExecutionEngine::CopyFiles(int64_t job_id, const std::vector<CopyItem>& items, const ProgressFn& progress,
                                      const StopFn& should_stop) {
  observability::SpanScope span("usbforge.copy");
  span.SetAttribute("job_id", static_cast<std::int64_t>(job_id));
  span.SetAttribute("files", static_cast<std::int64_t>(items.size()));
  log_sink_->Info(job_id, model::log_category::kCopy, fmt::format("Starting copy of {} files", items.size()));

  CopyResult result;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (should_stop && should_stop()) {
      result.aborted = true;
      log_sink_->Warn(job_id, model::log_category::kCopy,
                      fmt::format("Copy aborted after {}/{} files", result.files_processed, items.size()));
      break;
    }

    const auto&     item = items[i];
    std::error_code ec;
    std::string     failure;

    const auto parent = item.destination.parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);

    uint64_t source_size = 0;
    if (!ec) source_size = fs::file_size(item.source, ec);

    uint64_t copied_size = 0;
    if (ec) {
      failure = ec.message();
    } else {
      const auto status = CopyInChunks(item.source, item.destination, should_stop, failure);
      if (status == CopyStatus::kStopped) {
        result.aborted = true;
        log_sink_->Warn(job_id, model::log_category::kCopy,
                        fmt::format("Copy aborted during {} after {}/{} files", item.source.string(), result.files_processed,
                                    items.size()));
        break;
      }
      if (status == CopyStatus::kCopied) {
        copied_size = fs::file_size(item.destination, ec);
        if (ec) {
          failure = ec.message();
        } else if (copied_size != source_size) {
          failure = "Size mismatch after copy";
        }
      }
    }

    if (failure.empty()) {
      result.files_processed++;
      result.bytes_copied += copied_size;
      result.copied.push_back(item);
      if (result.files_processed % 10 == 0) {
        log_sink_->Info(job_id, model::log_category::kCopy,
                        fmt::format("Copied {}/{} files", result.files_processed, items.size()));
      }
    } else {
      FileError error = MakeError(item.source, error_code::kCopyFailed, failure);
      auto      entry = FileEntry(job_id, model::LogLevel::kError, model::log_category::kCopy, "Copy failed: " + failure, error);
      entry.file_size = static_cast<int64_t>(source_size);
      log_sink_->Append(std::move(entry));
      result.errors.push_back(std::move(error));
    }

    if (progress) progress(PercentDone(i + 1, items.size()));
  }

  result.success = result.errors.empty() && !result.aborted;
  observability::Metrics::Instance().AddCopiedBytes(result.bytes_copied);
  span.SetAttribute("bytes_copied", static_cast<std::int64_t>(result.bytes_copied));
  if (!result.success) span.RecordException(fmt::format("{} copy errors", result.errors.size()));

  util::JsonObject details;
  details.SetInt("files_processed", static_cast<int64_t>(result.files_processed))
      .SetInt("total_files", static_cast<int64_t>(items.size()))
      .SetInt("bytes_copied", static_cast<int64_t>(result.bytes_copied))
      .SetInt("errors", static_cast<int64_t>(result.errors.size()));
  log_sink_->Append(job_id, result.success ? model::LogLevel::kInfo : model::LogLevel::kWarning, model::log_category::kCopy,
                    fmt::format("Copy complete: {}/{} files copied ({}), {} errors", result.files_processed, items.size(),
                                FormatBytes(result.bytes_copied), result.errors.size()),
                    details);
  return result;
}

// ---------------------------------------------------------------------
// Verify
// ---------------------------------------------------------------------

std::vector<std::size_t> ExecutionEngine::PickSample(std::size_t total, std::size_t count) {
  std::vector<std::size_t> all(total);
  std::iota(all.begin(), all.end(), std::size_t{0});
  if (count >= total) return all;

  std::vector<std::size_t> picked;
  picked.reserve(count);
  std::lock_guard lock(rng_mutex_);
  std::sample(all.begin(), all.end(), std::back_inserter(picked), count, rng_);
  return picked;
}

VerificationResult ExecutionEngine::VerifyFiles(int64_t job_id, const std::vector<CopyItem>& items, const VerificationConfig& config) {
  const std::size_t to_check = SampleSize(items.size(), config);
  const char* strategy = config.strategy == VerificationStrategy::kFull ? "full" : "sampling";

  observability::SpanScope span("usbforge.verify");
  span.SetAttribute("job_id", static_cast<std::int64_t>(job_id));
  span.SetAttribute("strategy", strategy);
  span.SetAttribute("checked", static_cast<std::int64_t>(to_check));

  log_sink_->Info(job_id, model::log_category::kVerify,
                  fmt::format("Starting {} verification: checking {} of {} files", strategy, to_check, items.size()));

  VerificationResult result;
  for (std::size_t index : PickSample(items.size(), to_check)) {
    const auto& item = items[index];

    std::error_code ec;
    const auto      source_size = fs::file_size(item.source, ec);
    const auto      copied_size = ec ? 0 : fs::file_size(item.destination, ec);

    if (ec) {
      FileError error = MakeError(item.destination, "", ec.message());
      error.code      = ErrnoName(ec);
      log_sink_->Append(FileEntry(job_id, model::LogLevel::kError, model::log_category::kVerify,
                                  "Verification failed: " + ec.message(), error));
      result.errors.push_back(std::move(error));
      result.failed++;
      continue;
    }

    if (source_size != copied_size) {
      FileError error = MakeError(item.destination, error_code::kSizeMismatch,
                                  fmt::format("Size mismatch: source {} bytes, destination {} bytes", source_size, copied_size));

      util::JsonObject details;
      details.SetInt("source_size", static_cast<int64_t>(source_size)).SetInt("destination_size", static_cast<int64_t>(copied_size));

      auto entry      = FileEntry(job_id, model::LogLevel::kError, model::log_category::kVerify, error.message, error);
      entry.file_size = static_cast<int64_t>(copied_size);
      entry.details   = details.ToJson();
      log_sink_->Append(std::move(entry));

      result.errors.push_back(std::move(error));
      result.failed++;
      continue;
    }

    result.verified++;
  }

  result.skipped = items.size() - to_check;
  result.success = result.failed == 0;

  util::JsonObject details;
  details.SetString("strategy", strategy)
      .SetInt("verified", static_cast<int64_t>(result.verified))
      .SetInt("failed", static_cast<int64_t>(result.failed))
      .SetInt("skipped", static_cast<int64_t>(result.skipped));
  log_sink_->Append(job_id, result.success ? model::LogLevel::kInfo : model::LogLevel::kWarning, model::log_category::kVerify,
                    fmt::format("Verification complete: {} verified, {} failed, {} skipped", result.verified, result.failed,
                                result.skipped),
                    details);
  return result;
}

} // namespace usbforge::execution
