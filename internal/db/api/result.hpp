#pragma once

#include <cstdint>
#include <string>

namespace usbforge::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on pqxx/sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,

  Unsupported,
  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  // rows touched by a successful write
  uint64_t affected_rows = 0;

  static Result Ok(uint64_t affected = 0) {
    Result r;
    r.affected_rows = affected;
    return r;
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    Result r;
    r.code    = c;
    r.message = std::move(msg);
    return r;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

const char* ToString(ErrorCode code);

// Throws util::NotFound / util::TransactionConflict / util::StorageError for a failed result.
void ThrowIfError(const Result& result, const std::string& what);

} // namespace usbforge::db
