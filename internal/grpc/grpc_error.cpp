#include "grpc_error.hpp"

#include <stdexcept>
#include <string>

namespace vesting::grpc {

namespace {

::grpc::StatusCode CodeFor(const vesting::util::LedgerError& e) {
  using namespace vesting::util;

  if (dynamic_cast<const Unauthorized*>(&e)) {
    return ::grpc::StatusCode::PERMISSION_DENIED;
  }
  if (dynamic_cast<const InvalidInput*>(&e)) {
    return ::grpc::StatusCode::INVALID_ARGUMENT;
  }
  if (dynamic_cast<const InvalidReference*>(&e)) {
    return ::grpc::StatusCode::NOT_FOUND;
  }
  if (dynamic_cast<const StateConflict*>(&e)) {
    return ::grpc::StatusCode::FAILED_PRECONDITION;
  }
  if (dynamic_cast<const SystemHalted*>(&e)) {
    return ::grpc::StatusCode::UNAVAILABLE;
  }
  return ::grpc::StatusCode::INTERNAL;
}

} // namespace

::grpc::Status ToStatus(const std::exception& e) {
  if (const auto* ledger_error = dynamic_cast<const vesting::util::LedgerError*>(&e)) {
    std::string message(vesting::util::ReasonName(ledger_error->reason()));
    message += ": ";
    message += e.what();
    return {CodeFor(*ledger_error), message};
  }
  if (dynamic_cast<const std::invalid_argument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace vesting::grpc
