#pragma once

#include <cstdint>

#include "internal/model/state_machine.hpp"
#include "internal/util/address.hpp"
#include "internal/util/amount.hpp"

namespace vesting::db::model {

/*
  Persistent vesting schedule row.

  IMPORTANT:
  - released_amount <= total_amount at all times.
  - terminal status (completed/revoked) is final.
  - allocation_id = 0 means the schedule is not backed by an allocation.
*/
struct ScheduleRecord {
  uint64_t id = 0;

  util::Address beneficiary;
  util::Amount  total_amount    = 0;
  util::Amount  released_amount = 0;

  // Unix seconds
  uint64_t start_time     = 0;
  uint64_t cliff_duration = 0;
  uint64_t duration       = 0;
  uint64_t created_at     = 0;

  uint64_t allocation_id = 0;

  vesting::model::ScheduleStatus status = vesting::model::ScheduleStatus::kActive;
};

} // namespace vesting::db::model
