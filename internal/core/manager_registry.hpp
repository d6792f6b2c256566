#pragma once

#include "internal/util/address.hpp"

namespace vesting::core {

// Answers "may this address act as a manager". Admins count as managers.
class ManagerRegistry {
 public:
  virtual ~ManagerRegistry() = default;

  virtual bool IsManager(const util::Address& account) = 0;
};

} // namespace vesting::core
