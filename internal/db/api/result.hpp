#pragma once

#include <string>
#include <utility>

namespace codeintel::db {

/*
  Outcome of one write statement.

  Statement wrappers report failures as a Result; stores turn them into
  exceptions with ThrowIfDbError() and a description of what they were
  writing. Nothing above the stores sees sqlite error codes.
*/

enum class ErrorCode {
  OK = 0,
  Busy,                // lock not acquired within the busy timeout
  ConstraintViolation, // maps to util::Conflict
  IOError,
  Corruption,
  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

// Throws util::Conflict for constraint violations, std::runtime_error otherwise.
void ThrowIfDbError(const Result& result, const std::string& context);

} // namespace codeintel::db
