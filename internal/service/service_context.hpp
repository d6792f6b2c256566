#pragma once

#include <memory>

namespace vesting::core {
class AllocationLedger;
class VestingEngine;
} // namespace vesting::core
namespace vesting::token {
class TokenLedger;
}

namespace vesting::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<vesting::core::AllocationLedger> allocations;
  std::shared_ptr<vesting::core::VestingEngine>    vesting;
  std::shared_ptr<vesting::token::TokenLedger>     token;
};

} // namespace vesting::service
