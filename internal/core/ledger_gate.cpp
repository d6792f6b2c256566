#include "ledger_gate.hpp"

#include "internal/core/manager_registry.hpp"
#include "internal/util/errors.hpp"

namespace vesting::core {

using util::ErrorReason;

LedgerGate::LedgerGate(std::string ledger, db::Repository& repository, ManagerRegistry* managers)
    : ledger_(std::move(ledger)), repository_(repository), managers_(managers) {
}

void LedgerGate::RequireNotPaused(db::Transaction& tx) const {
  if (repository_.GetLedgerState(tx).paused) {
    throw util::SystemHalted(ledger_ + " ledger is paused");
  }
}

void LedgerGate::RequireAdmin(db::Transaction& tx, const util::Address& caller) const {
  if (!IsAdmin(tx, caller)) {
    throw util::Unauthorized(ErrorReason::kNotAuthorized, caller.ToString() + " is not a " + ledger_ + " admin");
  }
}

void LedgerGate::RequirePrivileged(db::Transaction& tx, const util::Address& caller) const {
  if (!IsPrivileged(tx, caller)) {
    throw util::Unauthorized(ErrorReason::kNotAuthorized, caller.ToString() + " is neither " + ledger_ + " admin nor manager");
  }
}

bool LedgerGate::IsAdmin(db::Transaction& tx, const util::Address& account) const {
  return !account.IsZero() && repository_.HasRoleMember(tx, db::model::Role::kAdmin, account);
}

bool LedgerGate::IsPrivileged(db::Transaction& tx, const util::Address& account) const {
  if (account.IsZero()) {
    return false;
  }
  if (IsAdmin(tx, account)) {
    return true;
  }
  if (managers_) {
    return managers_->IsManager(account);
  }
  return repository_.HasRoleMember(tx, db::model::Role::kManager, account);
}

} // namespace vesting::core
