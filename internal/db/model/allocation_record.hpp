#pragma once

#include <cstdint>

#include "internal/util/address.hpp"
#include "internal/util/amount.hpp"

namespace vesting::db::model {

/*
  Persistent allocation row.

  - amount only ever decreases (reduce) and is kept on revoke.
  - rows are never deleted.
*/
struct AllocationRecord {
  uint64_t id = 0;

  util::Amount  amount = 0;
  util::Address beneficiary;
  bool          revoked = false;

  // Unix seconds
  uint64_t created_at = 0;

  // Non-zero when the allocation was produced and paid out by an airdrop
  uint64_t airdrop_id = 0;
};

} // namespace vesting::db::model
