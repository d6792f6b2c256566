#pragma once

#include <grpcpp/grpcpp.h>
#include "internal/util/errors.hpp"

namespace vesting::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  Ledger errors carry their reason as a message prefix,
  "<ReasonName>: <detail>", so clients can branch on it.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace vesting::grpc
