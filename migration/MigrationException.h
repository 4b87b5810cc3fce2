#pragma once

#include <migration/MigrationConstants.h>
#include <stdexcept>
#include <string>

namespace migration {

/**
 * Error raised by the protocol logic. The error code is the one that is
 * reported to the peer and exposed through the session status.
 */
class MigrationException : public std::runtime_error {
 public:
  explicit MigrationException(const std::string& errorMsg, ErrorCode errorCode);

  ErrorCode errorCode() const noexcept {
    return errorCode_;
  }

 private:
  ErrorCode errorCode_;
};

/**
 * Error raised on local faults: invalid configuration, misuse of an API,
 * codec or I/O failures. It is never sent to the peer.
 */
class MigrationInternalException : public std::runtime_error {
 public:
  explicit MigrationInternalException(
      const std::string& errorMsg,
      LocalErrorCode errorCode);

  LocalErrorCode errorCode() const noexcept {
    return errorCode_;
  }

 private:
  LocalErrorCode errorCode_;
};

} // namespace migration
