#pragma once

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#include "internal/core/allocation_book.hpp"
#include "internal/core/ledger_base.hpp"
#include "internal/core/manager_registry.hpp"
#include "internal/db/model/schedule_record.hpp"
#include "internal/model/ids.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/token/token_ledger.hpp"

namespace vesting::core {

struct ScheduleRequest {
  util::Address       beneficiary;
  util::Amount        total_amount   = 0;
  std::uint64_t       start_time     = 0;
  std::uint64_t       cliff_duration = 0;
  std::uint64_t       duration       = 0;
  model::AllocationId allocation_id;
};

// Outcome of the follow-up reduction of a linked allocation.
enum class AllocationSync {
  kNotLinked,
  kReduced,
  // allocation revoked or its remaining amount is too small
  kSkipped,
  kFailed,
};

struct ClaimResult {
  util::Amount   amount = 0;
  AllocationSync allocation_sync = AllocationSync::kNotLinked;
};

struct VestingInfo {
  util::Amount          total_amount    = 0;
  util::Amount          released_amount = 0;
  util::Amount          releasable      = 0;
  model::ScheduleStatus status          = model::ScheduleStatus::kActive;
  model::SchedulePhase  phase           = model::SchedulePhase::kPending;
};

struct VestingTotals {
  util::Amount total_vested  = 0;
  util::Amount total_claimed = 0;
};

struct BeneficiarySummary {
  util::Amount  total_allocated = 0;
  util::Amount  total_released  = 0;
  util::Amount  total_unclaimed = 0;
  util::Amount  claimable_now   = 0;
  std::uint64_t active_count    = 0;
  std::uint64_t completed_count = 0;
  std::uint64_t revoked_count   = 0;
};

/*
  Vesting engine: linear schedules with a cliff, optionally backed by an
  allocation on the allocation ledger.

  Claim and unlock mint before the transaction commits, so a failed mint
  leaves no accounting change. The linked allocation is reduced after the
  commit; that step never undoes a mint and its outcome is reported in
  ClaimResult::allocation_sync.
*/
class VestingEngine final : public LedgerBase {
 public:
  VestingEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<AllocationBook> allocations,
                std::shared_ptr<ManagerRegistry> managers, std::shared_ptr<token::TokenLedger> token, std::shared_ptr<util::Clock> clock,
                util::Address engine_address);

  model::ScheduleId CreateVestingSchedule(const util::Address& caller, const ScheduleRequest& request);

  ClaimResult ClaimVestedTokens(const util::Address& caller, model::ScheduleId id);
  ClaimResult ManualUnlock(const util::Address& caller, model::ScheduleId id, const util::Amount& amount);

  // Returns the unvested amount taken back.
  util::Amount RevokeSchedule(const util::Address& caller, model::ScheduleId id);
  util::Amount ForceRevokeSchedule(const util::Address& caller, model::ScheduleId id);

  // Skips 0, unknown and terminal ids. Returns how many were revoked.
  std::uint64_t BatchForceRevokeSchedules(const util::Address& caller, const std::vector<model::ScheduleId>& ids);

  db::model::ScheduleRecord              GetSchedule(model::ScheduleId id);
  VestingInfo                            GetVestingInfo(model::ScheduleId id);
  std::vector<db::model::ScheduleRecord> SchedulesForBeneficiary(const util::Address& beneficiary);
  std::uint64_t                          ScheduleCount();
  VestingTotals                          Totals();
  BeneficiarySummary                     SummaryFor(const util::Address& beneficiary);

  const util::Address& EngineAddress() const {
    return engine_address_;
  }

 private:
  db::model::ScheduleRecord LoadSchedule(db::Transaction& tx, model::ScheduleId id);
  void                      RequireLinkedAllocation(const ScheduleRequest& request);
  util::Amount ForceRevokeLocked(Unit& unit, const util::Address& caller, db::model::ScheduleRecord schedule);
  void                      CommitAfterEffect(Unit& unit, const db::model::ScheduleRecord& schedule, const util::Amount& amount,
                                              std::string_view op);
  AllocationSync            SyncAllocation(const db::model::ScheduleRecord& schedule, const util::Amount& amount, std::string_view op);

  std::shared_ptr<AllocationBook>     allocations_;
  std::shared_ptr<ManagerRegistry>    managers_;
  std::shared_ptr<token::TokenLedger> token_;
  util::Address                       engine_address_;
};

} // namespace vesting::core
