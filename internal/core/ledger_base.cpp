#include "ledger_base.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace vesting::core {

using db::model::EventKind;
using util::ErrorReason;

std::string_view EventKindName(EventKind kind) {
  switch (kind) {
    case EventKind::kAllocationCreated:
      return "allocation_created";
    case EventKind::kAllocationRevoked:
      return "allocation_revoked";
    case EventKind::kAllocationReduced:
      return "allocation_reduced";
    case EventKind::kAirdropExecuted:
      return "airdrop_executed";
    case EventKind::kManagerAssigned:
      return "manager_assigned";
    case EventKind::kManagerRemoved:
      return "manager_removed";
    case EventKind::kScheduleCreated:
      return "schedule_created";
    case EventKind::kTokensReleased:
      return "tokens_released";
    case EventKind::kManualUnlock:
      return "manual_unlock";
    case EventKind::kScheduleRevoked:
      return "schedule_revoked";
    case EventKind::kScheduleCompleted:
      return "schedule_completed";
    case EventKind::kPaused:
      return "paused";
    case EventKind::kUnpaused:
      return "unpaused";
    case EventKind::kAdminGranted:
      return "admin_granted";
    case EventKind::kAdminRevoked:
      return "admin_revoked";
  }
  return "unknown";
}

namespace {

db::Repository& RequireRepository(const std::shared_ptr<db::Repository>& repository, const std::string& name) {
  if (!repository) {
    throw std::invalid_argument(name + " ledger requires a repository");
  }
  return *repository;
}

} // namespace

LedgerBase::LedgerBase(std::string name, std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock,
                       ManagerRegistry* managers)
    : name_(std::move(name)),
      repository_(std::move(repository)),
      clock_(std::move(clock)),
      gate_(name_, RequireRepository(repository_, name_), managers),
      guard_(name_) {
  if (!clock_) {
    throw std::invalid_argument(name_ + " ledger requires a clock");
  }
}

// ------------------------------------------------------------------
// Unit
// ------------------------------------------------------------------

LedgerBase::Unit::Unit(LedgerBase& ledger)
    : ledger_(ledger), scope_(ledger.guard_), tx_(ledger.repository_->Begin()), now_(ledger.clock_->NowSeconds()) {
}

void LedgerBase::Unit::Append(db::model::EventRecord event) {
  event.timestamp = now_;
  db::ThrowIfDbError(ledger_.repository_->AppendEvent(*tx_, event), "append event");
  appended_.push_back(event.kind);
}

void LedgerBase::Unit::Commit() {
  tx_->Commit();
  for (auto kind : appended_) {
    observability::Metrics::Instance().RecordLedgerEvent(ledger_.name_, EventKindName(kind));
  }
}

// ------------------------------------------------------------------
// Pause and admin role
// ------------------------------------------------------------------

bool LedgerBase::IsPaused() {
  auto tx = repository_->Begin();
  return repository_->GetLedgerState(*tx).paused;
}

void LedgerBase::RequireNotPaused() {
  auto tx = repository_->Begin();
  gate_.RequireNotPaused(*tx);
}

void LedgerBase::RequireRole(const util::Address& caller, Access access) {
  auto tx = repository_->Begin();
  switch (access) {
    case Access::kAnyone:
      return;
    case Access::kPrivileged:
      gate_.RequirePrivileged(*tx, caller);
      return;
    case Access::kAdmin:
    case Access::kAdminAlways:
      gate_.RequireAdmin(*tx, caller);
      return;
  }
}

void LedgerBase::Pause(const util::Address& caller) {
  Unit unit(*this);
  gate_.RequireAdmin(unit.Tx(), caller);

  auto state = repository_->GetLedgerState(unit.Tx());
  if (state.paused) {
    throw util::StateConflict(ErrorReason::kAlreadyPaused, name_ + " ledger is already paused");
  }
  state.paused = true;
  db::ThrowIfDbError(repository_->PutLedgerState(unit.Tx(), state), "pause");

  db::model::EventRecord event;
  event.kind  = EventKind::kPaused;
  event.actor = caller;
  unit.Append(event);
  unit.Commit();

  VESTING_LOG_INFO("ledger paused", {observability::StringField("ledger", name_), observability::AddressField("actor", caller)});
}

void LedgerBase::Unpause(const util::Address& caller) {
  Unit unit(*this);
  gate_.RequireAdmin(unit.Tx(), caller);

  auto state = repository_->GetLedgerState(unit.Tx());
  if (!state.paused) {
    throw util::StateConflict(ErrorReason::kNotPaused, name_ + " ledger is not paused");
  }
  state.paused = false;
  db::ThrowIfDbError(repository_->PutLedgerState(unit.Tx(), state), "unpause");

  db::model::EventRecord event;
  event.kind  = EventKind::kUnpaused;
  event.actor = caller;
  unit.Append(event);
  unit.Commit();

  VESTING_LOG_INFO("ledger unpaused", {observability::StringField("ledger", name_), observability::AddressField("actor", caller)});
}

bool LedgerBase::GrantAdmin(const util::Address& caller, const util::Address& account) {
  Unit unit(*this);
  gate_.RequireAdmin(unit.Tx(), caller);
  if (account.IsZero()) {
    throw util::InvalidInput(ErrorReason::kInvalidAddress, "admin must not be the zero address");
  }

  db::model::RoleMemberRecord member;
  member.role       = db::model::Role::kAdmin;
  member.member     = account;
  member.granted_at = unit.Now();
  auto result       = repository_->InsertRoleMember(unit.Tx(), member);
  if (result.code == db::ErrorCode::AlreadyExists) {
    return false;
  }
  db::ThrowIfDbError(result, "grant admin");

  db::model::EventRecord event;
  event.kind        = EventKind::kAdminGranted;
  event.beneficiary = account;
  event.actor       = caller;
  unit.Append(event);
  unit.Commit();

  VESTING_LOG_INFO("admin granted", {observability::StringField("ledger", name_), observability::AddressField("admin", account),
                                     observability::AddressField("actor", caller)});
  return true;
}

bool LedgerBase::RevokeAdmin(const util::Address& caller, const util::Address& account) {
  Unit unit(*this);
  gate_.RequireAdmin(unit.Tx(), caller);
  if (account.IsZero()) {
    throw util::InvalidInput(ErrorReason::kInvalidAddress, "admin must not be the zero address");
  }
  if (account == caller) {
    throw util::StateConflict(ErrorReason::kCannotRemoveSelf, "an admin cannot revoke its own role");
  }

  auto result = repository_->DeleteRoleMember(unit.Tx(), db::model::Role::kAdmin, account);
  if (result.code == db::ErrorCode::NotFound) {
    return false;
  }
  db::ThrowIfDbError(result, "revoke admin");

  db::model::EventRecord event;
  event.kind        = EventKind::kAdminRevoked;
  event.beneficiary = account;
  event.actor       = caller;
  unit.Append(event);
  unit.Commit();

  VESTING_LOG_INFO("admin revoked", {observability::StringField("ledger", name_), observability::AddressField("admin", account),
                                     observability::AddressField("actor", caller)});
  return true;
}

bool LedgerBase::IsAdmin(const util::Address& account) {
  auto tx = repository_->Begin();
  return gate_.IsAdmin(*tx, account);
}

std::vector<util::Address> LedgerBase::Admins() {
  auto                       tx = repository_->Begin();
  std::vector<util::Address> out;
  for (const auto& member : repository_->ListRoleMembers(*tx, db::model::Role::kAdmin)) {
    out.push_back(member.member);
  }
  return out;
}

void LedgerBase::BootstrapAdmin(const util::Address& admin) {
  if (admin.IsZero()) {
    throw util::InvalidInput(ErrorReason::kInvalidAddress, "bootstrap admin must not be the zero address");
  }

  Unit unit(*this);
  if (!repository_->ListRoleMembers(unit.Tx(), db::model::Role::kAdmin).empty()) {
    return;
  }

  db::model::RoleMemberRecord member;
  member.role       = db::model::Role::kAdmin;
  member.member     = admin;
  member.granted_at = unit.Now();
  db::ThrowIfDbError(repository_->InsertRoleMember(unit.Tx(), member), "bootstrap admin");

  db::model::EventRecord event;
  event.kind        = EventKind::kAdminGranted;
  event.beneficiary = admin;
  event.actor       = admin;
  unit.Append(event);
  unit.Commit();

  VESTING_LOG_INFO("admin bootstrapped", {observability::StringField("ledger", name_), observability::AddressField("admin", admin)});
}

std::vector<db::model::EventRecord> LedgerBase::ReadEvents(std::uint64_t start_offset, std::optional<std::uint64_t> max_events) {
  auto tx = repository_->Begin();
  return repository_->ReadEvents(*tx, start_offset, max_events);
}

} // namespace vesting::core
