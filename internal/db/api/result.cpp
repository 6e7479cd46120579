#include "internal/db/api/result.hpp"

#include "internal/util/errors.hpp"

namespace usbforge::db {

const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::SerializationFailure:
      return "serialization failure";
    case ErrorCode::IOError:
      return "io error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::Unsupported:
      return "unsupported";
    case ErrorCode::InternalError:
      return "internal error";
  }
  return "unknown";
}

void ThrowIfError(const Result& result, const std::string& what) {
  if (result) return;

  std::string msg = what + ": " + ToString(result.code);
  if (!result.message.empty()) msg += " (" + result.message + ")";

  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(msg);
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(msg);
    case ErrorCode::Conflict:
    case ErrorCode::SerializationFailure:
      throw util::TransactionConflict(msg);
    default:
      throw util::StorageError(msg);
  }
}

} // namespace usbforge::db
