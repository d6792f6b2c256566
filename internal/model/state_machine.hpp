#pragma once

#include <cstdint>

namespace vesting::model {

// Stored schedule status. Completed and Revoked both end the schedule.
enum class ScheduleStatus : std::uint8_t {
  kActive    = 1,
  kCompleted = 2,
  kRevoked   = 3,
};

// Derived from status and time, never stored.
enum class SchedulePhase : std::uint8_t {
  kPending     = 1,
  kVesting     = 2,
  kFullyVested = 3,
  kTerminal    = 4,
};

constexpr bool IsTerminal(ScheduleStatus status) {
  return status == ScheduleStatus::kCompleted || status == ScheduleStatus::kRevoked;
}

constexpr bool CanTransition(ScheduleStatus from, ScheduleStatus to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }
  return to == ScheduleStatus::kCompleted || to == ScheduleStatus::kRevoked;
}

} // namespace vesting::model
