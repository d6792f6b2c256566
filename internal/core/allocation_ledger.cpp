#include "allocation_ledger.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace vesting::core {

using db::model::EventKind;
using observability::AddressField;
using observability::AmountField;
using observability::UintField;

using util::ErrorReason;

AllocationLedger::AllocationLedger(std::shared_ptr<db::Repository> repository, std::shared_ptr<token::TokenLedger> token,
                                   std::shared_ptr<util::Clock> clock)
    : LedgerBase("allocation", std::move(repository), std::move(clock)), token_(std::move(token)) {
  if (!token_) {
    throw std::invalid_argument("allocation ledger requires a token ledger");
  }
}

db::model::AllocationRecord AllocationLedger::LoadAllocation(db::Transaction& tx, model::AllocationId id) {
  if (!id.IsSet()) {
    throw util::InvalidReference(ErrorReason::kInvalidAllocationId, "allocation id 0 is reserved");
  }
  auto record = Repo().GetAllocation(tx, id.value());
  if (!record) {
    throw util::InvalidReference(ErrorReason::kInvalidAllocationId, "allocation " + std::to_string(id.value()) + " does not exist");
  }
  return *record;
}

// ------------------------------------------------------------------
// Allocations
// ------------------------------------------------------------------

model::AllocationId AllocationLedger::CreateAllocation(const util::Address& caller, const util::Address& beneficiary, const util::Amount& amount) {
  Unit unit(*this);
  Gate().RequireNotPaused(unit.Tx());
  Gate().RequirePrivileged(unit.Tx(), caller);
  if (beneficiary.IsZero()) {
    throw util::InvalidInput(ErrorReason::kInvalidBeneficiary, "beneficiary must not be the zero address");
  }
  if (amount == 0) {
    throw util::InvalidInput(ErrorReason::kInvalidAmount, "allocation amount must be positive");
  }

  db::model::AllocationRecord record;
  record.amount      = amount;
  record.beneficiary = beneficiary;
  record.created_at  = unit.Now();
  db::ThrowIfDbError(Repo().InsertAllocation(unit.Tx(), record), "insert allocation");

  db::model::EventRecord event;
  event.kind        = EventKind::kAllocationCreated;
  event.subject_id  = record.id;
  event.beneficiary = beneficiary;
  event.amount      = amount;
  event.actor       = caller;
  unit.Append(event);
  unit.Commit();

  VESTING_LOG_INFO("allocation created", {UintField("allocation_id", record.id),
                                          AddressField("beneficiary", beneficiary), AmountField("amount", amount)});
  return model::AllocationId(record.id);
}

bool AllocationLedger::RevokeAllocation(const util::Address& caller, model::AllocationId id) {
  Unit unit(*this);
  Gate().RequireNotPaused(unit.Tx());
  Gate().RequirePrivileged(unit.Tx(), caller);

  auto record = LoadAllocation(unit.Tx(), id);
  if (record.revoked) {
    throw util::StateConflict(ErrorReason::kAllocationAlreadyRevoked, "allocation " + std::to_string(record.id) + " is already revoked");
  }

  record.revoked = true;
  db::ThrowIfDbError(Repo().UpdateAllocation(unit.Tx(), record), "revoke allocation");

  db::model::EventRecord event;
  event.kind        = EventKind::kAllocationRevoked;
  event.subject_id  = record.id;
  event.beneficiary = record.beneficiary;
  event.amount      = record.amount;
  event.actor       = caller;
  unit.Append(event);
  unit.Commit();

  VESTING_LOG_INFO("allocation revoked",
                   {UintField("allocation_id", record.id), AmountField("remaining", record.amount)});
  return true;
}

bool AllocationLedger::ReduceAllocation(const util::Address& caller, model::AllocationId id, const util::Amount& amount) {
  Unit unit(*this);
  Gate().RequireNotPaused(unit.Tx());
  Gate().RequirePrivileged(unit.Tx(), caller);

  auto record = LoadAllocation(unit.Tx(), id);
  if (record.revoked) {
    throw util::StateConflict(ErrorReason::kAllocationAlreadyRevoked, "allocation " + std::to_string(record.id) + " is revoked");
  }
  if (amount == 0 || amount > record.amount) {
    throw util::InvalidInput(ErrorReason::kInvalidAmount,
                             "reduction " + util::ToString(amount) + " outside (0, " + util::ToString(record.amount) + "]");
  }

  record.amount -= amount;
  db::ThrowIfDbError(Repo().UpdateAllocation(unit.Tx(), record), "reduce allocation");

  db::model::EventRecord event;
  event.kind        = EventKind::kAllocationReduced;
  event.subject_id  = record.id;
  event.beneficiary = record.beneficiary;
  event.amount      = amount;
  event.actor       = caller;
  unit.Append(event);
  unit.Commit();

  VESTING_LOG_INFO("allocation reduced", {UintField("allocation_id", record.id),
                                          AmountField("reduction", amount), AmountField("remaining", record.amount)});
  return true;
}

// ------------------------------------------------------------------
// Airdrops
// ------------------------------------------------------------------

AirdropResult AllocationLedger::ExecuteAirdrop(const util::Address& caller, const std::vector<util::Address>& beneficiaries,
                                               const std::vector<util::Amount>& amounts) {
  Unit unit(*this);
  Gate().RequireNotPaused(unit.Tx());
  Gate().RequirePrivileged(unit.Tx(), caller);
  if (beneficiaries.empty()) {
    throw util::InvalidInput(ErrorReason::kEmptyBeneficiariesList, "airdrop needs at least one beneficiary");
  }
  if (beneficiaries.size() != amounts.size()) {
    throw util::InvalidInput(ErrorReason::kArraysLengthMismatch, std::to_string(beneficiaries.size()) + " beneficiaries but " +
                                                                     std::to_string(amounts.size()) + " amounts");
  }

  AirdropResult result;
  for (std::size_t i = 0; i < beneficiaries.size(); ++i) {
    if (beneficiaries[i].IsZero()) {
      throw util::InvalidInput(ErrorReason::kInvalidBeneficiary, "airdrop entry " + std::to_string(i) + " has the zero address");
    }
    if (amounts[i] == 0) {
      throw util::InvalidInput(ErrorReason::kInvalidAmount, "airdrop entry " + std::to_string(i) + " has a zero amount");
    }
    try {
      result.total_amount += amounts[i];
    } catch (const std::overflow_error&) {
      throw util::InvalidInput(ErrorReason::kInvalidAmount, "airdrop total exceeds 256 bits");
    }
  }

  // Each entry is created, then consumed by the mint below.
  std::vector<db::model::AllocationRecord> created;
  std::vector<token::MintEntry>            mints;
  created.reserve(beneficiaries.size());
  mints.reserve(beneficiaries.size());
  for (std::size_t i = 0; i < beneficiaries.size(); ++i) {
    db::model::AllocationRecord record;
    record.amount      = amounts[i];
    record.beneficiary = beneficiaries[i];
    record.created_at  = unit.Now();
    db::ThrowIfDbError(Repo().InsertAllocation(unit.Tx(), record), "insert airdrop allocation");

    db::model::EventRecord event;
    event.kind        = EventKind::kAllocationCreated;
    event.subject_id  = record.id;
    event.beneficiary = record.beneficiary;
    event.amount      = record.amount;
    event.actor       = caller;
    unit.Append(event);

    created.push_back(record);
    mints.emplace_back(beneficiaries[i], amounts[i]);
  }

  db::model::AirdropRecord airdrop;
  airdrop.executed_by         = caller;
  airdrop.entry_count         = created.size();
  airdrop.total_amount        = result.total_amount;
  airdrop.first_allocation_id = created.front().id;
  airdrop.created_at          = unit.Now();
  db::ThrowIfDbError(Repo().InsertAirdrop(unit.Tx(), airdrop), "insert airdrop");

  for (auto& record : created) {
    record.amount     = 0;
    record.airdrop_id = airdrop.id;
    db::ThrowIfDbError(Repo().UpdateAllocation(unit.Tx(), record), "consume airdrop allocation");
    result.allocation_ids.emplace_back(record.id);
  }

  db::model::EventRecord event;
  event.kind       = EventKind::kAirdropExecuted;
  event.subject_id = airdrop.id;
  event.amount     = result.total_amount;
  event.actor      = caller;
  unit.Append(event);

  token_->MintBatch(mints);
  unit.Commit();

  result.id = model::AirdropId(airdrop.id);
  VESTING_LOG_INFO("airdrop executed", {UintField("airdrop_id", airdrop.id),
                                        UintField("entries", created.size()),
                                        AmountField("total", result.total_amount)});
  return result;
}

std::optional<db::model::AirdropRecord> AllocationLedger::GetAirdrop(model::AirdropId id) {
  auto tx = Repo().Begin();
  return Repo().GetAirdrop(*tx, id.value());
}

// ------------------------------------------------------------------
// Manager registry
// ------------------------------------------------------------------

bool AllocationLedger::AddManager(const util::Address& caller, const util::Address& manager) {
  Unit unit(*this);
  Gate().RequireNotPaused(unit.Tx());
  Gate().RequirePrivileged(unit.Tx(), caller);
  if (manager.IsZero()) {
    throw util::InvalidInput(ErrorReason::kInvalidAddress, "manager must not be the zero address");
  }
  if (manager == caller) {
    throw util::StateConflict(ErrorReason::kCannotAddSelf, "a caller cannot add itself as manager");
  }

  db::model::RoleMemberRecord member;
  member.role       = db::model::Role::kManager;
  member.member     = manager;
  member.granted_at = unit.Now();
  auto result       = Repo().InsertRoleMember(unit.Tx(), member);
  if (result.code == db::ErrorCode::AlreadyExists) {
    return false;
  }
  db::ThrowIfDbError(result, "add manager");

  db::model::EventRecord event;
  event.kind        = EventKind::kManagerAssigned;
  event.beneficiary = manager;
  event.actor       = caller;
  unit.Append(event);
  unit.Commit();

  VESTING_LOG_INFO("manager added", {AddressField("manager", manager), AddressField("actor", caller)});
  return true;
}

bool AllocationLedger::RemoveManager(const util::Address& caller, const util::Address& manager) {
  Unit unit(*this);
  Gate().RequireNotPaused(unit.Tx());
  Gate().RequirePrivileged(unit.Tx(), caller);
  if (manager.IsZero()) {
    throw util::InvalidInput(ErrorReason::kInvalidAddress, "manager must not be the zero address");
  }
  if (manager == caller) {
    throw util::StateConflict(ErrorReason::kCannotRemoveSelf, "a caller cannot remove itself as manager");
  }

  auto result = Repo().DeleteRoleMember(unit.Tx(), db::model::Role::kManager, manager);
  if (result.code == db::ErrorCode::NotFound) {
    return false;
  }
  db::ThrowIfDbError(result, "remove manager");

  db::model::EventRecord event;
  event.kind        = EventKind::kManagerRemoved;
  event.beneficiary = manager;
  event.actor       = caller;
  unit.Append(event);
  unit.Commit();

  VESTING_LOG_INFO("manager removed", {AddressField("manager", manager), AddressField("actor", caller)});
  return true;
}

bool AllocationLedger::IsManager(const util::Address& account) {
  auto tx = Repo().Begin();
  return Gate().IsPrivileged(*tx, account);
}

std::vector<util::Address> AllocationLedger::ListManagers() {
  auto                       tx = Repo().Begin();
  std::vector<util::Address> out;
  for (const auto& member : Repo().ListRoleMembers(*tx, db::model::Role::kManager)) {
    out.push_back(member.member);
  }
  return out;
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

db::model::AllocationRecord AllocationLedger::GetAllocation(model::AllocationId id) {
  auto tx = Repo().Begin();
  return LoadAllocation(*tx, id);
}

std::vector<db::model::AllocationRecord> AllocationLedger::AllocationsForBeneficiary(const util::Address& beneficiary) {
  auto tx = Repo().Begin();
  return Repo().ListAllocationsByBeneficiary(*tx, beneficiary);
}

std::uint64_t AllocationLedger::AllocationCount() {
  auto tx = Repo().Begin();
  return Repo().CountAllocations(*tx);
}

} // namespace vesting::core
