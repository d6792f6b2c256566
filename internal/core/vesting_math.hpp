#pragma once

#include <cstdint>

#include "internal/db/model/schedule_record.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/util/amount.hpp"

namespace vesting::core {

/*
  Linear vesting with a cliff.

    now <  start + cliff      -> 0
    now >= start + duration   -> total
    otherwise                 -> floor(total * (now - start) / duration)

  Callers guarantee start + duration fits in 64 bits and duration > 0.
*/
util::Amount VestedAmount(const db::model::ScheduleRecord& schedule, std::uint64_t now);

// Vested minus released, 0 for terminal schedules. Saturates at 0 when
// manual unlocks released more than the curve has vested.
util::Amount Releasable(const db::model::ScheduleRecord& schedule, std::uint64_t now);

model::SchedulePhase Phase(const db::model::ScheduleRecord& schedule, std::uint64_t now);

} // namespace vesting::core
