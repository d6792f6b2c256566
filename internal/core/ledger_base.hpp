#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/ledger_gate.hpp"
#include "internal/core/reentrancy_guard.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace vesting::core {

std::string_view EventKindName(db::model::EventKind kind);

/*
  State and entry points shared by both ledgers: the pause flag, the admin
  role and the event journal.

  Every mutation runs inside a Unit: the ledger's reentrancy guard plus
  one repository transaction. Dropping a Unit without Commit() rolls back
  every record, counter and journal write made through it.
*/
class LedgerBase {
 public:
  virtual ~LedgerBase() = default;

  LedgerBase(const LedgerBase&)            = delete;
  LedgerBase& operator=(const LedgerBase&) = delete;

  const std::string& Name() const {
    return name_;
  }

  bool IsPaused();

  // Pause and role checks of an entry point, for requests turned away
  // before they reach it. RequireRole ignores the pause flag.
  void RequireNotPaused();
  void RequireRole(const util::Address& caller, Access access);
  void Pause(const util::Address& caller);
  void Unpause(const util::Address& caller);

  // false when account already holds / does not hold the role.
  bool GrantAdmin(const util::Address& caller, const util::Address& account);
  bool RevokeAdmin(const util::Address& caller, const util::Address& account);

  bool                       IsAdmin(const util::Address& account);
  std::vector<util::Address> Admins();

  // Seeds the first admin. No-op once any admin exists.
  void BootstrapAdmin(const util::Address& admin);

  // max_events unset reads to the end of the journal.
  std::vector<db::model::EventRecord> ReadEvents(std::uint64_t start_offset, std::optional<std::uint64_t> max_events);

 protected:
  LedgerBase(std::string name, std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock,
             ManagerRegistry* managers = nullptr);

  class Unit {
   public:
    explicit Unit(LedgerBase& ledger);

    Unit(const Unit&)            = delete;
    Unit& operator=(const Unit&) = delete;

    db::Transaction& Tx() {
      return *tx_;
    }

    std::uint64_t Now() const {
      return now_;
    }

    // Stamps the event with this unit's time and appends it.
    void Append(db::model::EventRecord event);

    void Commit();

   private:
    LedgerBase&                       ledger_;
    ReentrancyGuard::Scope            scope_;
    std::unique_ptr<db::Transaction>  tx_;
    std::uint64_t                     now_;
    std::vector<db::model::EventKind> appended_;
  };

  db::Repository& Repo() {
    return *repository_;
  }

  const util::Clock& Clock() const {
    return *clock_;
  }

  const LedgerGate& Gate() const {
    return gate_;
  }

 private:
  std::string                     name_;
  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<util::Clock>    clock_;
  LedgerGate                      gate_;
  ReentrancyGuard                 guard_;
};

} // namespace vesting::core
