#include "internal/core/ledger_gate.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <set>

#include "internal/core/manager_registry.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "ledger_test_support.hpp"

namespace {

using vesting::core::LedgerGate;
using vesting::core::ManagerRegistry;
using vesting::db::memory::MemoryRepository;
using vesting::db::model::Role;
using vesting::db::model::RoleMemberRecord;
using vesting::testing::ExpectError;
using vesting::testing::kAdmin;
using vesting::testing::kAlice;
using vesting::testing::kManager;
using vesting::testing::kMallory;
using vesting::util::Address;
using vesting::util::ErrorReason;

class StubRegistry final : public ManagerRegistry {
 public:
  bool IsManager(const Address& account) override {
    ++queries;
    return managers.count(account) > 0;
  }

  std::set<Address> managers;
  int               queries = 0;
};

void Seed(MemoryRepository& repo, Role role, const Address& member) {
  auto             tx = repo.Begin();
  RoleMemberRecord record;
  record.role   = role;
  record.member = member;
  assert(repo.InsertRoleMember(*tx, record));
  tx->Commit();
}

void TestLocalRolesWithoutRegistry() {
  MemoryRepository repo;
  Seed(repo, Role::kAdmin, kAdmin);
  Seed(repo, Role::kManager, kManager);
  LedgerGate gate("allocation", repo);

  auto tx = repo.Begin();
  gate.RequireAdmin(*tx, kAdmin);
  gate.RequirePrivileged(*tx, kAdmin);
  gate.RequirePrivileged(*tx, kManager);
  assert(!gate.IsAdmin(*tx, kManager));

  ExpectError<vesting::util::Unauthorized>(ErrorReason::kNotAuthorized, [&] { gate.RequireAdmin(*tx, kManager); });
  ExpectError<vesting::util::Unauthorized>(ErrorReason::kNotAuthorized, [&] { gate.RequirePrivileged(*tx, kMallory); });
  assert(!gate.IsPrivileged(*tx, Address()));
}

void TestManagersDelegatedToRegistry() {
  MemoryRepository repo;
  Seed(repo, Role::kAdmin, kAdmin);
  // a local manager row is ignored once a registry is injected
  Seed(repo, Role::kManager, kMallory);

  StubRegistry registry;
  registry.managers.insert(kManager);
  LedgerGate gate("vesting", repo, &registry);

  auto tx = repo.Begin();
  assert(gate.IsPrivileged(*tx, kManager));
  assert(!gate.IsPrivileged(*tx, kMallory));
  assert(!gate.IsPrivileged(*tx, kAlice));

  // admins never reach the registry
  const int before = registry.queries;
  assert(gate.IsPrivileged(*tx, kAdmin));
  assert(registry.queries == before);
}

void TestPauseFlag() {
  MemoryRepository repo;
  LedgerGate       gate("vesting", repo);

  {
    auto tx = repo.Begin();
    gate.RequireNotPaused(*tx);
    auto state   = repo.GetLedgerState(*tx);
    state.paused = true;
    assert(repo.PutLedgerState(*tx, state));
    tx->Commit();
  }

  auto tx = repo.Begin();
  ExpectError<vesting::util::SystemHalted>(ErrorReason::kEnforcedPause, [&] { gate.RequireNotPaused(*tx); });
}

void TestLedgerPauseAndAdminRoles() {
  auto l = vesting::testing::MakeLedgers();
  auto& ledger = *l.allocations;

  ExpectError<vesting::util::Unauthorized>(ErrorReason::kNotAuthorized, [&] { ledger.Pause(kManager); });
  ExpectError<vesting::util::StateConflict>(ErrorReason::kNotPaused, [&] { ledger.Unpause(kAdmin); });

  ledger.Pause(kAdmin);
  assert(ledger.IsPaused());
  ExpectError<vesting::util::StateConflict>(ErrorReason::kAlreadyPaused, [&] { ledger.Pause(kAdmin); });
  // reads stay available while paused
  assert(ledger.AllocationCount() == 0);
  ExpectError<vesting::util::SystemHalted>(ErrorReason::kEnforcedPause, [&] { ledger.CreateAllocation(kAdmin, kAlice, 1); });
  // the pause check comes before the role check
  ExpectError<vesting::util::SystemHalted>(ErrorReason::kEnforcedPause, [&] { ledger.CreateAllocation(kMallory, kAlice, 1); });
  ledger.Unpause(kAdmin);
  assert(!ledger.IsPaused());

  // pausing one ledger leaves the other running
  l.engine->Pause(kAdmin);
  assert(!ledger.IsPaused());
  assert(ledger.CreateAllocation(kAdmin, kAlice, 1).value() == 1);

  assert(ledger.GrantAdmin(kAdmin, kManager));
  assert(!ledger.GrantAdmin(kAdmin, kManager));
  assert(ledger.IsAdmin(kManager));
  assert(ledger.Admins().size() == 2);
  ExpectError<vesting::util::StateConflict>(ErrorReason::kCannotRemoveSelf, [&] { ledger.RevokeAdmin(kAdmin, kAdmin); });
  ExpectError<vesting::util::InvalidInput>(ErrorReason::kInvalidAddress, [&] { ledger.GrantAdmin(kAdmin, Address()); });
  assert(ledger.RevokeAdmin(kManager, kAdmin));
  assert(!ledger.IsAdmin(kAdmin));
  assert(!ledger.RevokeAdmin(kManager, kAdmin));

  // bootstrap is a no-op once an admin exists
  ledger.BootstrapAdmin(kAdmin);
  assert(!ledger.IsAdmin(kAdmin));
}

} // namespace

int main() {
  TestLocalRolesWithoutRegistry();
  TestManagersDelegatedToRegistry();
  TestPauseFlag();
  TestLedgerPauseAndAdminRoles();

  std::cout << "vesting_ledger_unit_ledger_gate: pass\n";
  return 0;
}
