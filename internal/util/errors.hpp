#pragma once

#include <stdexcept>
#include <string>

namespace usbforge::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
  Lease ownership failures are NOT exceptions: lease operations
  report them as boolean results.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Job store unreachable or a statement failed. Transient from the worker's view.
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Optimistic commit lost against a concurrent transaction.
class TransactionConflict : public StorageError {
 public:
  explicit TransactionConflict(const std::string& msg) : StorageError(msg) {
  }
};

} // namespace usbforge::util
