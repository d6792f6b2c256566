#pragma once

#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/util/address.hpp"

namespace vesting::core {

class ManagerRegistry;

// The checks an entry point runs before it looks at its arguments.
enum class Access {
  kAnyone,       // pause only
  kPrivileged,   // pause, then admin or manager
  kAdmin,        // pause, then admin
  kAdminAlways,  // admin, also while paused
};

/*
  Pause and role checks for one ledger, evaluated inside the caller's
  transaction so the decision and the mutation see the same state.

  Privileged means admin of this ledger OR a manager. Without a registry
  managers come from this ledger's own role table; with one, manager-ness
  is delegated to it.
*/
class LedgerGate {
 public:
  LedgerGate(std::string ledger, db::Repository& repository, ManagerRegistry* managers = nullptr);

  // SystemHalted when paused.
  void RequireNotPaused(db::Transaction& tx) const;

  // Unauthorized(kNotAuthorized) unless caller holds the admin role.
  void RequireAdmin(db::Transaction& tx, const util::Address& caller) const;

  // Unauthorized(kNotAuthorized) unless caller is admin or manager.
  void RequirePrivileged(db::Transaction& tx, const util::Address& caller) const;

  bool IsAdmin(db::Transaction& tx, const util::Address& account) const;
  bool IsPrivileged(db::Transaction& tx, const util::Address& account) const;

 private:
  std::string      ledger_;
  db::Repository&  repository_;
  ManagerRegistry* managers_;
};

} // namespace vesting::core
