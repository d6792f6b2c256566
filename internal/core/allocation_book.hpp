#pragma once

#include "internal/db/model/allocation_record.hpp"
#include "internal/model/ids.hpp"
#include "internal/util/address.hpp"
#include "internal/util/amount.hpp"

namespace vesting::core {

/*
  The slice of the allocation ledger the vesting engine depends on.

  Mutations take the acting address and go through the allocation
  ledger's own pause and role checks.
*/
class AllocationBook {
 public:
  virtual ~AllocationBook() = default;

  // Throws InvalidReference(kInvalidAllocationId) for 0 or unknown ids.
  virtual db::model::AllocationRecord GetAllocation(model::AllocationId id) = 0;

  virtual bool ReduceAllocation(const util::Address& caller, model::AllocationId id, const util::Amount& amount) = 0;
  virtual bool RevokeAllocation(const util::Address& caller, model::AllocationId id) = 0;
};

} // namespace vesting::core
