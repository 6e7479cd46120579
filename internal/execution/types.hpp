#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace usbforge::execution {

namespace error_code {
inline constexpr const char* kNotFound         = "NOT_FOUND";
inline constexpr const char* kNoPermission     = "NO_PERMISSION";
inline constexpr const char* kNotFile          = "NOT_FILE";
inline constexpr const char* kEmptyFile        = "EMPTY_FILE";
inline constexpr const char* kUnknown          = "UNKNOWN";
inline constexpr const char* kSpaceCheckFailed = "SPACE_CHECK_FAILED";
inline constexpr const char* kCopyFailed       = "COPY_FAILED";
inline constexpr const char* kSizeMismatch     = "SIZE_MISMATCH";
inline constexpr const char* kVerifyFailed     = "VERIFY_FAILED";
} // namespace error_code

struct CopyItem {
  std::filesystem::path source;
  std::filesystem::path destination;
};

struct FileError {
  std::string path;
  std::string code;
  std::string message;
};

struct ValidationResult {
  bool                               valid = false;  // no errors
  std::vector<std::filesystem::path> valid_files;
  uint64_t                           total_size = 0;
  std::vector<FileError>             errors;

  std::size_t ValidCount() const {
    return valid_files.size();
  }
};

struct CopyResult {
  bool                   success         = false;
  bool                   aborted         = false;
  std::size_t            files_processed = 0;
  uint64_t               bytes_copied    = 0;
  std::vector<CopyItem>  copied;
  std::vector<FileError> errors;
};

enum class VerificationStrategy {
  kFull,
  kSampling,
};

struct VerificationConfig {
  VerificationStrategy strategy          = VerificationStrategy::kSampling;
  double               sample_percentage = 20.0;
  std::size_t          min_sample_size   = 10;
};

struct VerificationResult {
  bool                   success  = false;
  std::size_t            verified = 0;
  std::size_t            failed   = 0;
  std::size_t            skipped  = 0;
  std::vector<FileError> errors;
};

} // namespace usbforge::execution
