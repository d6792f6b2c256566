#include "vesting_engine.hpp"

#include <limits>
#include <stdexcept>

#include "internal/core/vesting_math.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace vesting::core {

using db::model::EventKind;
using model::ScheduleStatus;
using observability::AddressField;
using observability::AmountField;
using observability::BoolField;
using observability::StringField;
using observability::UintField;
using util::ErrorReason;

namespace {

std::string ScheduleName(std::uint64_t id) {
  return "schedule " + std::to_string(id);
}

std::string_view SyncName(AllocationSync sync) {
  switch (sync) {
    case AllocationSync::kNotLinked:
      return "not_linked";
    case AllocationSync::kReduced:
      return "reduced";
    case AllocationSync::kSkipped:
      return "skipped";
    case AllocationSync::kFailed:
      return "failed";
  }
  return "unknown";
}

} // namespace

VestingEngine::VestingEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<AllocationBook> allocations,
                             std::shared_ptr<ManagerRegistry> managers, std::shared_ptr<token::TokenLedger> token,
                             std::shared_ptr<util::Clock> clock, util::Address engine_address)
    : LedgerBase("vesting", std::move(repository), std::move(clock), managers.get()),
      allocations_(std::move(allocations)),
      managers_(std::move(managers)),
      token_(std::move(token)),
      engine_address_(std::move(engine_address)) {
  if (!allocations_ || !managers_ || !token_) {
    throw std::invalid_argument("vesting engine requires an allocation book, a manager registry and a token ledger");
  }
}

db::model::ScheduleRecord VestingEngine::LoadSchedule(db::Transaction& tx, model::ScheduleId id) {
  if (!id.IsSet()) {
    throw util::InvalidReference(ErrorReason::kInvalidScheduleId, "schedule id 0 is reserved");
  }
  auto record = Repo().GetSchedule(tx, id.value());
  if (!record) {
    throw util::InvalidReference(ErrorReason::kInvalidScheduleId, ScheduleName(id.value()) + " does not exist");
  }
  return *record;
}

// ------------------------------------------------------------------
// Creation
// ------------------------------------------------------------------

void VestingEngine::RequireLinkedAllocation(const ScheduleRequest& request) {
  // throws InvalidReference(kInvalidAllocationId) when unknown
  const auto allocation = allocations_->GetAllocation(request.allocation_id);
  if (allocation.beneficiary != request.beneficiary) {
    throw util::InvalidReference(ErrorReason::kAllocationBeneficiaryMismatch,
                                 "allocation " + std::to_string(allocation.id) + " belongs to " + allocation.beneficiary.ToString());
  }
  if (allocation.revoked) {
    throw util::InvalidReference(ErrorReason::kAllocationRevoked, "allocation " + std::to_string(allocation.id) + " is revoked");
  }
  if (allocation.amount < request.total_amount) {
    throw util::StateConflict(ErrorReason::kInsufficientAllocation, "allocation " + std::to_string(allocation.id) + " has " +
                                                                        util::ToString(allocation.amount) + " remaining");
  }
}

model::ScheduleId VestingEngine::CreateVestingSchedule(const util::Address& caller, const ScheduleRequest& request) {
  Unit unit(*this);
  Gate().RequireNotPaused(unit.Tx());
  Gate().RequirePrivileged(unit.Tx(), caller);

  if (request.beneficiary.IsZero()) {
    throw util::InvalidInput(ErrorReason::kInvalidBeneficiary, "beneficiary must not be the zero address");
  }
  if (request.total_amount == 0) {
    throw util::InvalidInput(ErrorReason::kInvalidAmount, "total amount must be positive");
  }
  if (request.duration == 0) {
    throw util::InvalidInput(ErrorReason::kInvalidDuration, "duration must be positive");
  }
  if (request.duration < request.cliff_duration) {
    throw util::InvalidInput(ErrorReason::kInvalidDuration, "duration is shorter than the cliff");
  }
  if (request.start_time < unit.Now()) {
    throw util::InvalidInput(ErrorReason::kInvalidStartTime, "start time " + std::to_string(request.start_time) + " is in the past");
  }
  if (request.start_time > std::numeric_limits<std::uint64_t>::max() - request.duration) {
    throw util::InvalidInput(ErrorReason::kInvalidDuration, "start time plus duration overflows");
  }
  if (request.allocation_id.IsSet()) {
    RequireLinkedAllocation(request);
  }

  db::model::ScheduleRecord record;
  record.beneficiary    = request.beneficiary;
  record.total_amount   = request.total_amount;
  record.start_time     = request.start_time;
  record.cliff_duration = request.cliff_duration;
  record.duration       = request.duration;
  record.created_at     = unit.Now();
  record.allocation_id  = request.allocation_id.value();
  record.status         = ScheduleStatus::kActive;
  db::ThrowIfDbError(Repo().InsertSchedule(unit.Tx(), record), "insert schedule");

  auto state = Repo().GetLedgerState(unit.Tx());
  state.total_vested += record.total_amount;
  db::ThrowIfDbError(Repo().PutLedgerState(unit.Tx(), state), "update vesting totals");

  db::model::EventRecord event;
  event.kind        = EventKind::kScheduleCreated;
  event.subject_id  = record.id;
  event.beneficiary = record.beneficiary;
  event.amount      = record.total_amount;
  event.actor       = caller;
  unit.Append(event);
  unit.Commit();

  VESTING_LOG_INFO("schedule created", {UintField("schedule_id", record.id),
                                        AddressField("beneficiary", record.beneficiary),
                                        AmountField("total", record.total_amount),
                                        UintField("allocation_id", record.allocation_id)});
  return model::ScheduleId(record.id);
}

// ------------------------------------------------------------------
// Releases
// ------------------------------------------------------------------

ClaimResult VestingEngine::ClaimVestedTokens(const util::Address& caller, model::ScheduleId id) {
  Unit unit(*this);
  Gate().RequireNotPaused(unit.Tx());

  auto schedule = LoadSchedule(unit.Tx(), id);
  if (model::IsTerminal(schedule.status)) {
    throw util::StateConflict(ErrorReason::kScheduleRevoked, ScheduleName(schedule.id) + " is closed");
  }
  if (caller != schedule.beneficiary) {
    throw util::Unauthorized(ErrorReason::kNotBeneficiary, caller.ToString() + " is not the beneficiary of " + ScheduleName(schedule.id));
  }

  const util::Amount releasable = Releasable(schedule, unit.Now());
  if (releasable == 0) {
    throw util::StateConflict(ErrorReason::kNoTokensDue, "nothing releasable on " + ScheduleName(schedule.id));
  }

  schedule.released_amount += releasable;
  const bool completed = schedule.released_amount == schedule.total_amount;
  if (completed) {
    schedule.status = ScheduleStatus::kCompleted;
  }
  db::ThrowIfDbError(Repo().UpdateSchedule(unit.Tx(), schedule), "update schedule");

  auto state = Repo().GetLedgerState(unit.Tx());
  state.total_claimed += releasable;
  db::ThrowIfDbError(Repo().PutLedgerState(unit.Tx(), state), "update vesting totals");

  db::model::EventRecord event;
  event.kind        = EventKind::kTokensReleased;
  event.subject_id  = schedule.id;
  event.beneficiary = schedule.beneficiary;
  event.amount      = releasable;
  event.actor       = caller;
  unit.Append(event);
  if (completed) {
    event.kind   = EventKind::kScheduleCompleted;
    event.amount = schedule.total_amount;
    unit.Append(event);
  }

  token_->Mint(schedule.beneficiary, releasable);
  CommitAfterEffect(unit, schedule, releasable, "claim");

  ClaimResult result;
  result.amount          = releasable;
  result.allocation_sync = SyncAllocation(schedule, releasable, "claim");

  VESTING_LOG_INFO("tokens claimed", {UintField("schedule_id", schedule.id),
                                      AmountField("amount", releasable), BoolField("completed", completed),
                                      StringField("allocation_sync", SyncName(result.allocation_sync))});
  return result;
}

ClaimResult VestingEngine::ManualUnlock(const util::Address& caller, model::ScheduleId id, const util::Amount& amount) {
  Unit unit(*this);
  Gate().RequireNotPaused(unit.Tx());
  Gate().RequirePrivileged(unit.Tx(), caller);

  auto schedule = LoadSchedule(unit.Tx(), id);
  if (model::IsTerminal(schedule.status)) {
    throw util::StateConflict(ErrorReason::kScheduleRevoked, ScheduleName(schedule.id) + " is closed");
  }
  if (amount == 0) {
    throw util::InvalidInput(ErrorReason::kInvalidAmount, "unlock amount must be positive");
  }
  const util::Amount remaining = schedule.total_amount - schedule.released_amount;
  if (amount > remaining) {
    throw util::StateConflict(ErrorReason::kAmountExceedsRemaining,
                              "unlock " + util::ToString(amount) + " exceeds remaining " + util::ToString(remaining));
  }

  // no transition to Completed here, even when the remainder is released
  schedule.released_amount += amount;
  db::ThrowIfDbError(Repo().UpdateSchedule(unit.Tx(), schedule), "update schedule");

  auto state = Repo().GetLedgerState(unit.Tx());
  state.total_claimed += amount;
  db::ThrowIfDbError(Repo().PutLedgerState(unit.Tx(), state), "update vesting totals");

  db::model::EventRecord event;
  event.kind        = EventKind::kManualUnlock;
  event.subject_id  = schedule.id;
  event.beneficiary = schedule.beneficiary;
  event.amount      = amount;
  event.actor       = caller;
  unit.Append(event);

  token_->Mint(schedule.beneficiary, amount);
  CommitAfterEffect(unit, schedule, amount, "unlock");

  ClaimResult result;
  result.amount          = amount;
  result.allocation_sync = SyncAllocation(schedule, amount, "unlock");

  VESTING_LOG_INFO("tokens unlocked", {UintField("schedule_id", schedule.id),
                                       AmountField("amount", amount), AddressField("actor", caller),
                                       StringField("allocation_sync", SyncName(result.allocation_sync))});
  return result;
}

// The mint (or linked allocation revoke) already happened and cannot be
// taken back. A commit failure now leaves it outside this ledger's books:
// the schedule still shows the amount as unreleased.
void VestingEngine::CommitAfterEffect(Unit& unit, const db::model::ScheduleRecord& schedule, const util::Amount& amount,
                                      std::string_view op) {
  try {
    unit.Commit();
  } catch (const std::exception& e) {
    VESTING_LOG_ERROR("ledger commit failed after external effect",
                      {StringField("op", op), UintField("schedule_id", schedule.id), AddressField("beneficiary", schedule.beneficiary),
                       AmountField("amount", amount), UintField("allocation_id", schedule.allocation_id),
                       StringField("error", e.what())});
    observability::Metrics::Instance().RecordUnrecordedEffect(op);
    throw;
  }
}

AllocationSync VestingEngine::SyncAllocation(const db::model::ScheduleRecord& schedule, const util::Amount& amount, std::string_view op) {
  if (schedule.allocation_id == 0) {
    return AllocationSync::kNotLinked;
  }

  const model::AllocationId allocation_id(schedule.allocation_id);
  try {
    const auto allocation = allocations_->GetAllocation(allocation_id);
    if (allocation.revoked || allocation.amount < amount) {
      VESTING_LOG_WARN("allocation sync skipped", {StringField("op", op), UintField("schedule_id", schedule.id),
                                                   UintField("allocation_id", allocation.id),
                                                   BoolField("revoked", allocation.revoked),
                                                   AmountField("remaining", allocation.amount),
                                                   AmountField("released", amount)});
      observability::Metrics::Instance().RecordAllocationSyncFailure(op);
      return AllocationSync::kSkipped;
    }
    allocations_->ReduceAllocation(engine_address_, allocation_id, amount);
    return AllocationSync::kReduced;
  } catch (const std::exception& e) {
    VESTING_LOG_WARN("allocation sync failed", {StringField("op", op), UintField("schedule_id", schedule.id),
                                                UintField("allocation_id", schedule.allocation_id),
                                                StringField("error", e.what())});
    observability::Metrics::Instance().RecordAllocationSyncFailure(op);
    return AllocationSync::kFailed;
  }
}

// ------------------------------------------------------------------
// Revocation
// ------------------------------------------------------------------

util::Amount VestingEngine::RevokeSchedule(const util::Address& caller, model::ScheduleId id) {
  Unit unit(*this);
  Gate().RequireNotPaused(unit.Tx());
  Gate().RequirePrivileged(unit.Tx(), caller);

  auto schedule = LoadSchedule(unit.Tx(), id);
  if (model::IsTerminal(schedule.status)) {
    throw util::StateConflict(ErrorReason::kScheduleRevoked, ScheduleName(schedule.id) + " is already closed");
  }
  const util::Amount unvested = schedule.total_amount - schedule.released_amount;
  if (unvested == 0) {
    throw util::StateConflict(ErrorReason::kNothingToRevoke, ScheduleName(schedule.id) + " has nothing left to revoke");
  }

  schedule.status = ScheduleStatus::kRevoked;
  db::ThrowIfDbError(Repo().UpdateSchedule(unit.Tx(), schedule), "revoke schedule");

  auto state = Repo().GetLedgerState(unit.Tx());
  state.total_vested -= unvested;
  db::ThrowIfDbError(Repo().PutLedgerState(unit.Tx(), state), "update vesting totals");

  db::model::EventRecord event;
  event.kind        = EventKind::kScheduleRevoked;
  event.subject_id  = schedule.id;
  event.beneficiary = schedule.beneficiary;
  event.amount      = unvested;
  event.actor       = caller;
  unit.Append(event);

  // a failure here leaves the schedule untouched
  if (schedule.allocation_id != 0) {
    allocations_->RevokeAllocation(engine_address_, model::AllocationId(schedule.allocation_id));
    CommitAfterEffect(unit, schedule, unvested, "revoke");
  } else {
    unit.Commit();
  }

  VESTING_LOG_INFO("schedule revoked", {UintField("schedule_id", schedule.id),
                                        AmountField("unvested", unvested),
                                        UintField("allocation_id", schedule.allocation_id)});
  return unvested;
}

util::Amount VestingEngine::ForceRevokeLocked(Unit& unit, const util::Address& caller, db::model::ScheduleRecord schedule) {
  const util::Amount unvested = schedule.total_amount - schedule.released_amount;

  schedule.status = ScheduleStatus::kRevoked;
  db::ThrowIfDbError(Repo().UpdateSchedule(unit.Tx(), schedule), "force revoke schedule");

  auto state = Repo().GetLedgerState(unit.Tx());
  state.total_vested -= unvested;
  db::ThrowIfDbError(Repo().PutLedgerState(unit.Tx(), state), "update vesting totals");

  db::model::EventRecord event;
  event.kind        = EventKind::kScheduleRevoked;
  event.subject_id  = schedule.id;
  event.beneficiary = schedule.beneficiary;
  event.amount      = unvested;
  event.actor       = caller;
  unit.Append(event);
  return unvested;
}

util::Amount VestingEngine::ForceRevokeSchedule(const util::Address& caller, model::ScheduleId id) {
  Unit unit(*this);
  Gate().RequireNotPaused(unit.Tx());
  Gate().RequireAdmin(unit.Tx(), caller);

  auto schedule = LoadSchedule(unit.Tx(), id);
  if (model::IsTerminal(schedule.status)) {
    throw util::StateConflict(ErrorReason::kScheduleRevoked, ScheduleName(schedule.id) + " is already closed");
  }

  const util::Amount unvested = ForceRevokeLocked(unit, caller, schedule);
  unit.Commit();

  VESTING_LOG_INFO("schedule force revoked",
                   {UintField("schedule_id", schedule.id), AmountField("unvested", unvested)});
  return unvested;
}

std::uint64_t VestingEngine::BatchForceRevokeSchedules(const util::Address& caller, const std::vector<model::ScheduleId>& ids) {
  Unit unit(*this);
  Gate().RequireNotPaused(unit.Tx());
  Gate().RequireAdmin(unit.Tx(), caller);

  std::uint64_t revoked = 0;
  for (const auto id : ids) {
    if (!id.IsSet()) {
      continue;
    }
    auto schedule = Repo().GetSchedule(unit.Tx(), id.value());
    if (!schedule || model::IsTerminal(schedule->status)) {
      continue;
    }
    ForceRevokeLocked(unit, caller, *schedule);
    ++revoked;
  }
  unit.Commit();

  VESTING_LOG_INFO("batch force revoke", {UintField("requested", ids.size()),
                                          UintField("revoked", revoked)});
  return revoked;
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

db::model::ScheduleRecord VestingEngine::GetSchedule(model::ScheduleId id) {
  auto tx = Repo().Begin();
  return LoadSchedule(*tx, id);
}

VestingInfo VestingEngine::GetVestingInfo(model::ScheduleId id) {
  const auto schedule = GetSchedule(id);
  const auto now      = Clock().NowSeconds();

  VestingInfo info;
  info.total_amount    = schedule.total_amount;
  info.released_amount = schedule.released_amount;
  info.releasable      = Releasable(schedule, now);
  info.status          = schedule.status;
  info.phase           = Phase(schedule, now);
  return info;
}

std::vector<db::model::ScheduleRecord> VestingEngine::SchedulesForBeneficiary(const util::Address& beneficiary) {
  auto tx = Repo().Begin();
  return Repo().ListSchedulesByBeneficiary(*tx, beneficiary);
}

std::uint64_t VestingEngine::ScheduleCount() {
  auto tx = Repo().Begin();
  return Repo().CountSchedules(*tx);
}

VestingTotals VestingEngine::Totals() {
  auto       tx    = Repo().Begin();
  const auto state = Repo().GetLedgerState(*tx);
  return VestingTotals{state.total_vested, state.total_claimed};
}

BeneficiarySummary VestingEngine::SummaryFor(const util::Address& beneficiary) {
  const auto now = Clock().NowSeconds();

  BeneficiarySummary summary;
  for (const auto& schedule : SchedulesForBeneficiary(beneficiary)) {
    summary.total_allocated += schedule.total_amount;
    summary.total_released += schedule.released_amount;
    summary.claimable_now += Releasable(schedule, now);
    switch (schedule.status) {
      case ScheduleStatus::kActive:
        summary.total_unclaimed += schedule.total_amount - schedule.released_amount;
        ++summary.active_count;
        break;
      case ScheduleStatus::kCompleted:
        ++summary.completed_count;
        break;
      case ScheduleStatus::kRevoked:
        ++summary.revoked_count;
        break;
    }
  }
  return summary;
}

} // namespace vesting::core
