#include "vesting_math.hpp"

namespace vesting::core {

util::Amount VestedAmount(const db::model::ScheduleRecord& schedule, std::uint64_t now) {
  if (now < schedule.start_time + schedule.cliff_duration) {
    return 0;
  }
  if (now >= schedule.start_time + schedule.duration) {
    return schedule.total_amount;
  }
  return util::MulDiv(schedule.total_amount, now - schedule.start_time, schedule.duration);
}

util::Amount Releasable(const db::model::ScheduleRecord& schedule, std::uint64_t now) {
  if (model::IsTerminal(schedule.status)) {
    return 0;
  }
  const util::Amount vested = VestedAmount(schedule, now);
  if (vested <= schedule.released_amount) {
    return 0;
  }
  return vested - schedule.released_amount;
}

model::SchedulePhase Phase(const db::model::ScheduleRecord& schedule, std::uint64_t now) {
  if (model::IsTerminal(schedule.status)) {
    return model::SchedulePhase::kTerminal;
  }
  if (now < schedule.start_time + schedule.cliff_duration) {
    return model::SchedulePhase::kPending;
  }
  if (now >= schedule.start_time + schedule.duration) {
    return model::SchedulePhase::kFullyVested;
  }
  return model::SchedulePhase::kVesting;
}

} // namespace vesting::core
