#pragma once

#include "internal/util/amount.hpp"

namespace vesting::db::model {

/*
  Single-row ledger state. The allocation ledger only uses paused; the
  vesting engine also keeps its observational counters here so they move
  in the same transaction as the schedule they describe.
*/
struct LedgerStateRecord {
  bool paused = false;

  util::Amount total_vested  = 0;
  util::Amount total_claimed = 0;
};

} // namespace vesting::db::model
