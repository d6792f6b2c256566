#pragma once

#include <cstdint>

#include "internal/util/address.hpp"
#include "internal/util/amount.hpp"

namespace vesting::db::model {

struct AirdropRecord {
  uint64_t id = 0;

  util::Address executed_by;
  uint64_t      entry_count  = 0;
  util::Amount  total_amount = 0;

  // Allocations of one airdrop are contiguous ids
  uint64_t first_allocation_id = 0;
  uint64_t created_at          = 0;
};

} // namespace vesting::db::model
