#pragma once

#include <string>

namespace vesting::db {

/*
  Portable DB result codes.

  The repository layer must translate sqlite/pqxx errors into these.
  Ledgers never see backend error types; they turn a failed Result into
  an exception with ThrowIfDbError.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,

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

// Throws std::runtime_error("<context>: <message>") when result is an error.
void ThrowIfDbError(const Result& result, const std::string& context);

} // namespace vesting::db
