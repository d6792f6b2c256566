#pragma once

#include <cstdint>

#include "internal/util/address.hpp"
#include "internal/util/amount.hpp"

namespace vesting::db::model {

enum class EventKind : uint8_t {
  kAllocationCreated    = 1,
  kAllocationRevoked    = 2,
  kAllocationReduced    = 3,
  kAirdropExecuted      = 4,
  kManagerAssigned      = 5,
  kManagerRemoved       = 6,
  kScheduleCreated      = 7,
  kTokensReleased       = 8,
  kManualUnlock         = 9,
  kScheduleRevoked      = 10,
  kScheduleCompleted    = 11,
  kPaused               = 12,
  kUnpaused             = 13,
  kAdminGranted         = 14,
  kAdminRevoked         = 15,
};

/*
  Append-only journal entry. offset is assigned by the repository on
  append, sequential per ledger starting at 1.
*/
struct EventRecord {
  uint64_t  offset = 0;
  EventKind kind   = EventKind::kAllocationCreated;

  // Allocation, schedule or airdrop id depending on kind; 0 otherwise
  uint64_t subject_id = 0;

  util::Address beneficiary;
  util::Amount  amount = 0;
  util::Address actor;

  // Unix seconds
  uint64_t timestamp = 0;
};

} // namespace vesting::db::model
