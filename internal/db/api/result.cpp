#include "result.hpp"

#include <stdexcept>

namespace vesting::db {

namespace {

const char* CodeName(ErrorCode code) {
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
    case ErrorCode::IOError:
      return "io error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal error";
  }
  return "unknown";
}

} // namespace

void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  std::string message = context + ": " + CodeName(result.code);
  if (!result.message.empty()) {
    message += ": " + result.message;
  }
  throw std::runtime_error(message);
}

} // namespace vesting::db
