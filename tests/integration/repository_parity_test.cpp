#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/util/address.hpp"
#include "internal/util/amount.hpp"

#if VESTING_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if VESTING_DB_POSTGRES
#include <pqxx/pqxx>
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using vesting::db::ErrorCode;
using vesting::db::Repository;
using vesting::db::memory::MemoryRepository;
using vesting::db::model::AirdropRecord;
using vesting::db::model::AllocationRecord;
using vesting::db::model::EventKind;
using vesting::db::model::EventRecord;
using vesting::db::model::LedgerStateRecord;
using vesting::db::model::Role;
using vesting::db::model::RoleMemberRecord;
using vesting::db::model::ScheduleRecord;
using vesting::model::ScheduleStatus;
using vesting::util::Address;
using vesting::util::Amount;
using vesting::util::ParseAmount;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

const Address kAlice = Address::Parse("0x00000000000000000000000000000000000000a1");
const Address kBob   = Address::Parse("0x00000000000000000000000000000000000000b0");
const Address kAdmin = Address::Parse("0xad00000000000000000000000000000000000001");

// 2^200, well past any native integer column
const Amount kHuge = ParseAmount("1606938044258990275541962092341162602522202993782792835301376");

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

void VerifySequentialIdsAndRollback(Repository& repo) {
  {
    auto tx = repo.Begin();

    AllocationRecord first{.amount = 100, .beneficiary = kAlice, .created_at = 10};
    AllocationRecord second{.amount = kHuge, .beneficiary = kBob, .created_at = 11};
    assert(repo.InsertAllocation(*tx, first));
    assert(repo.InsertAllocation(*tx, second));
    assert(first.id == 1);
    assert(second.id == 2);

    // visible inside the writing transaction
    assert(repo.CountAllocations(*tx) == 2);
    tx->Commit();
    assert(tx->IsCommitted());
  }

  {
    auto             tx = repo.Begin();
    AllocationRecord discarded{.amount = 5, .beneficiary = kAlice, .created_at = 12};
    assert(repo.InsertAllocation(*tx, discarded));
    assert(discarded.id == 3);
    tx->Rollback();
  }

  {
    // dropping an uncommitted transaction rolls it back too
    auto             tx = repo.Begin();
    AllocationRecord discarded{.amount = 6, .beneficiary = kAlice, .created_at = 12};
    assert(repo.InsertAllocation(*tx, discarded));
  }

  auto tx = repo.Begin();
  assert(repo.CountAllocations(*tx) == 2);
  assert(!repo.GetAllocation(*tx, 3).has_value());

  AllocationRecord third{.amount = 7, .beneficiary = kAlice, .created_at = 13};
  assert(repo.InsertAllocation(*tx, third));
  assert(third.id == 3);

  const auto stored = repo.GetAllocation(*tx, 2);
  assert(stored.has_value());
  assert(stored->amount == kHuge);
  assert(stored->beneficiary == kBob);
  assert(!stored->revoked);
  tx->Commit();
}

void VerifyAllocationUpdatesAndAirdrops(Repository& repo) {
  auto tx = repo.Begin();

  auto record = repo.GetAllocation(*tx, 1);
  assert(record.has_value());
  record->amount  = 40;
  record->revoked = true;
  assert(repo.UpdateAllocation(*tx, *record));

  AllocationRecord missing{.id = 99, .amount = 1, .beneficiary = kAlice};
  assert(repo.UpdateAllocation(*tx, missing).code == ErrorCode::NotFound);

  AirdropRecord airdrop{.executed_by = kAdmin, .entry_count = 2, .total_amount = kHuge, .first_allocation_id = 4, .created_at = 20};
  assert(repo.InsertAirdrop(*tx, airdrop));
  assert(airdrop.id == 1);
  tx->Commit();

  auto verify = repo.Begin();
  const auto reread = repo.GetAllocation(*verify, 1);
  assert(reread->amount == 40);
  assert(reread->revoked);

  const auto stored_airdrop = repo.GetAirdrop(*verify, 1);
  assert(stored_airdrop.has_value());
  assert(stored_airdrop->executed_by == kAdmin);
  assert(stored_airdrop->total_amount == kHuge);
  assert(stored_airdrop->first_allocation_id == 4);
  assert(!repo.GetAirdrop(*verify, 2).has_value());

  // id order within a beneficiary
  const auto alice = repo.ListAllocationsByBeneficiary(*verify, kAlice);
  assert(alice.size() == 2);
  assert(alice[0].id == 1);
  assert(alice[1].id == 3);
  assert(repo.ListAllocationsByBeneficiary(*verify, kAdmin).empty());
  verify->Commit();
}

void VerifySchedules(Repository& repo) {
  auto tx = repo.Begin();

  ScheduleRecord linked{.beneficiary = kAlice,
                        .total_amount = 1000,
                        .start_time = 100,
                        .cliff_duration = 10,
                        .duration = 100,
                        .created_at = 50,
                        .allocation_id = 3};
  ScheduleRecord plain{.beneficiary = kBob, .total_amount = kHuge, .start_time = 100, .duration = 1, .created_at = 50};
  assert(repo.InsertSchedule(*tx, linked));
  assert(repo.InsertSchedule(*tx, plain));
  assert(linked.id == 1);
  assert(plain.id == 2);

  linked.released_amount = 250;
  linked.status          = ScheduleStatus::kRevoked;
  assert(repo.UpdateSchedule(*tx, linked));
  tx->Commit();

  auto verify = repo.Begin();
  assert(repo.CountSchedules(*verify) == 2);

  const auto stored = repo.GetSchedule(*verify, 1);
  assert(stored.has_value());
  assert(stored->released_amount == 250);
  assert(stored->status == ScheduleStatus::kRevoked);
  assert(stored->cliff_duration == 10);
  assert(stored->allocation_id == 3);

  const auto bob = repo.ListSchedulesByBeneficiary(*verify, kBob);
  assert(bob.size() == 1);
  assert(bob[0].total_amount == kHuge);
  assert(bob[0].status == ScheduleStatus::kActive);
  assert(!repo.GetSchedule(*verify, 3).has_value());
  verify->Commit();
}

void VerifyRoles(Repository& repo) {
  auto tx = repo.Begin();

  RoleMemberRecord admin{.role = Role::kAdmin, .member = kAdmin, .granted_at = 1};
  RoleMemberRecord alice{.role = Role::kManager, .member = kAlice, .granted_at = 2};
  RoleMemberRecord bob{.role = Role::kManager, .member = kBob, .granted_at = 3};
  assert(repo.InsertRoleMember(*tx, admin));
  assert(repo.InsertRoleMember(*tx, alice));
  assert(repo.InsertRoleMember(*tx, bob));

  RoleMemberRecord duplicate{.role = Role::kManager, .member = kAlice, .granted_at = 4};
  assert(repo.InsertRoleMember(*tx, duplicate).code == ErrorCode::AlreadyExists);

  // roles are independent of each other
  assert(repo.HasRoleMember(*tx, Role::kAdmin, kAdmin));
  assert(!repo.HasRoleMember(*tx, Role::kManager, kAdmin));

  assert(repo.DeleteRoleMember(*tx, Role::kManager, kAlice));
  assert(repo.DeleteRoleMember(*tx, Role::kManager, kAlice).code == ErrorCode::NotFound);

  // re-granted members go to the back
  RoleMemberRecord again{.role = Role::kManager, .member = kAlice, .granted_at = 5};
  assert(repo.InsertRoleMember(*tx, again));
  tx->Commit();

  auto       verify   = repo.Begin();
  const auto managers = repo.ListRoleMembers(*verify, Role::kManager);
  assert(managers.size() == 2);
  assert(managers[0].member == kBob);
  assert(managers[1].member == kAlice);
  assert(managers[0].seq < managers[1].seq);
  assert(managers[1].granted_at == 5);
  assert(repo.ListRoleMembers(*verify, Role::kAdmin).size() == 1);
  verify->Commit();
}

void VerifyLedgerState(Repository& repo) {
  {
    auto       tx      = repo.Begin();
    const auto initial = repo.GetLedgerState(*tx);
    assert(!initial.paused);
    assert(initial.total_vested == 0);
    assert(initial.total_claimed == 0);

    LedgerStateRecord state{.paused = true, .total_vested = kHuge, .total_claimed = 12};
    assert(repo.PutLedgerState(*tx, state));
    tx->Rollback();
  }

  {
    auto tx = repo.Begin();
    assert(!repo.GetLedgerState(*tx).paused);

    LedgerStateRecord state{.paused = true, .total_vested = kHuge, .total_claimed = 12};
    assert(repo.PutLedgerState(*tx, state));
    state.paused = false;
    assert(repo.PutLedgerState(*tx, state));
    tx->Commit();
  }

  auto       verify = repo.Begin();
  const auto state  = repo.GetLedgerState(*verify);
  assert(!state.paused);
  assert(state.total_vested == kHuge);
  assert(state.total_claimed == 12);
  verify->Commit();
}

void VerifyEventJournal(Repository& repo) {
  {
    auto tx = repo.Begin();
    for (uint64_t i = 1; i <= 5; ++i) {
      EventRecord event{.kind       = i % 2 == 0 ? EventKind::kTokensReleased : EventKind::kScheduleCreated,
                        .subject_id = i,
                        .beneficiary = kAlice,
                        .amount     = i * 10,
                        .actor      = kAdmin,
                        .timestamp  = 1000 + i};
      assert(repo.AppendEvent(*tx, event));
      assert(event.offset == i);
    }
    tx->Commit();
  }

  {
    auto        tx = repo.Begin();
    EventRecord lost{.kind = EventKind::kPaused, .actor = kAdmin, .timestamp = 2000};
    assert(repo.AppendEvent(*tx, lost));
    assert(lost.offset == 6);
    tx->Rollback();
  }

  auto tx = repo.Begin();

  const auto all = repo.ReadEvents(*tx, 0, std::nullopt);
  assert(all.size() == 5);
  assert(all[1].kind == EventKind::kTokensReleased);
  assert(all[1].amount == 20);
  assert(all[4].timestamp == 1005);

  // start offset is inclusive
  const auto page = repo.ReadEvents(*tx, 2, 2);
  assert(page.size() == 2);
  assert(page[0].offset == 2);
  assert(page[1].offset == 3);

  assert(repo.ReadEvents(*tx, 5, 10).size() == 1);
  assert(repo.ReadEvents(*tx, 6, std::nullopt).empty());
  assert(repo.ReadEvents(*tx, 1, 0).empty());

  EventRecord next{.kind = EventKind::kUnpaused, .actor = kAdmin, .timestamp = 2001};
  assert(repo.AppendEvent(*tx, next));
  assert(next.offset == 6);
  tx->Commit();
}

void VerifyBeneficiaryIndex(Repository& repo) {
  const Address carol = Address::Parse("0x00000000000000000000000000000000000000c0");
  const Address dave  = Address::Parse("0x00000000000000000000000000000000000000d0");

  std::vector<uint64_t> carol_allocations;
  std::vector<uint64_t> carol_schedules;
  {
    auto tx = repo.Begin();
    for (uint64_t i = 0; i < 600; ++i) {
      const Address& owner = i % 3 == 0 ? carol : dave;

      AllocationRecord allocation{.amount = i + 1, .beneficiary = owner, .created_at = 20};
      assert(repo.InsertAllocation(*tx, allocation));
      ScheduleRecord schedule{
          .beneficiary = owner, .total_amount = i + 1, .start_time = 100, .duration = 10, .created_at = 20};
      assert(repo.InsertSchedule(*tx, schedule));

      if (owner == carol) {
        carol_allocations.push_back(allocation.id);
        carol_schedules.push_back(schedule.id);
      }
    }
    tx->Commit();
  }

  auto tx = repo.Begin();

  const auto allocations = repo.ListAllocationsByBeneficiary(*tx, carol);
  assert(allocations.size() == carol_allocations.size());
  for (size_t i = 0; i < allocations.size(); ++i) {
    assert(allocations[i].id == carol_allocations[i]);
    assert(allocations[i].beneficiary == carol);
  }

  const auto schedules = repo.ListSchedulesByBeneficiary(*tx, carol);
  assert(schedules.size() == carol_schedules.size());
  for (size_t i = 0; i < schedules.size(); ++i) {
    assert(schedules[i].id == carol_schedules[i]);
    assert(schedules[i].beneficiary == carol);
  }

  assert(repo.ListAllocationsByBeneficiary(*tx, dave).size() == 400);
  assert(repo.ListSchedulesByBeneficiary(*tx, kAdmin).empty());
  tx->Commit();
}

// Memory backend only: readers keep the snapshot they began with, and a
// writer that lost the race is rejected on commit.
void VerifyMemorySnapshots() {
  MemoryRepository repo;
  {
    auto             tx = repo.Begin();
    AllocationRecord seed{.amount = 1, .beneficiary = kAlice, .created_at = 1};
    assert(repo.InsertAllocation(*tx, seed));
    EventRecord created{.kind = EventKind::kAllocationCreated, .subject_id = seed.id, .actor = kAdmin, .timestamp = 1};
    assert(repo.AppendEvent(*tx, created));
    tx->Commit();
  }

  auto reader = repo.Begin();
  auto loser  = repo.Begin();

  {
    auto             writer = repo.Begin();
    AllocationRecord later{.amount = 2, .beneficiary = kAlice, .created_at = 2};
    assert(repo.InsertAllocation(*writer, later));
    EventRecord created{.kind = EventKind::kAllocationCreated, .subject_id = later.id, .actor = kAdmin, .timestamp = 2};
    assert(repo.AppendEvent(*writer, created));
    assert(created.offset == 2);
    writer->Commit();
  }

  assert(repo.CountAllocations(*reader) == 1);
  assert(repo.ListAllocationsByBeneficiary(*reader, kAlice).size() == 1);
  assert(repo.ReadEvents(*reader, 1, std::nullopt).size() == 1);
  reader->Commit();

  EventRecord stale{.kind = EventKind::kPaused, .actor = kAdmin, .timestamp = 3};
  assert(repo.AppendEvent(*loser, stale));
  bool rejected = false;
  try {
    loser->Commit();
  } catch (const std::runtime_error&) {
    rejected = true;
  }
  assert(rejected);
  loser->Rollback();

  auto fresh = repo.Begin();
  assert(repo.CountAllocations(*fresh) == 2);
  assert(repo.ListAllocationsByBeneficiary(*fresh, kAlice).size() == 2);
  assert(repo.ReadEvents(*fresh, 0, std::nullopt).size() == 2);
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();

    AllocationRecord allocation{.amount = kHuge, .beneficiary = kBob, .created_at = 30, .airdrop_id = 0};
    assert(repo->InsertAllocation(*tx, allocation));

    RoleMemberRecord admin{.role = Role::kAdmin, .member = kAdmin, .granted_at = 30};
    assert(repo->InsertRoleMember(*tx, admin));

    LedgerStateRecord state{.paused = true, .total_vested = 77, .total_claimed = 7};
    assert(repo->PutLedgerState(*tx, state));

    EventRecord event{.kind = EventKind::kAllocationCreated, .subject_id = allocation.id, .beneficiary = kBob, .amount = kHuge, .actor = kAdmin};
    assert(repo->AppendEvent(*tx, event));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->CountAllocations(*tx) == 1);
  assert(repo->GetAllocation(*tx, 1)->amount == kHuge);
  assert(repo->HasRoleMember(*tx, Role::kAdmin, kAdmin));

  const auto state = repo->GetLedgerState(*tx);
  assert(state.paused);
  assert(state.total_vested == 77);

  const auto events = repo->ReadEvents(*tx, 1, std::nullopt);
  assert(events.size() == 1);
  assert(events[0].amount == kHuge);

  // ids continue after a restart
  AllocationRecord next{.amount = 1, .beneficiary = kBob, .created_at = 31};
  assert(repo->InsertAllocation(*tx, next));
  assert(next.id == 2);
  tx->Rollback();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if VESTING_DB_SQLITE
BackendFactory MakeSqliteFactory(const std::string& suffix) {
  auto db_path = (std::filesystem::temp_directory_path() / ("vesting_ledger_integration_sqlite_" + suffix + "_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<vesting::db::sqlite::SqliteDB>(db_path);
    for (const char* sql : vesting::db::sql::kLedgerSchema) {
      db->Exec(sql);
    }
    return std::make_shared<vesting::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

#if VESTING_DB_POSTGRES
BackendFactory MakePostgresFactory(const std::string& suffix) {
  const char* uri = std::getenv("VESTING_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("VESTING_TEST_POSTGRES_URI is not set");
  }

  auto conninfo = std::string(uri);
  auto schema   = "vesting_parity_" + suffix + "_" + std::to_string(NowMs());

  auto make_repo = [conninfo, schema]() {
    {
      pqxx::connection conn(conninfo);
      pqxx::work       tx(conn);
      tx.exec("CREATE SCHEMA IF NOT EXISTS " + tx.quote_name(schema));
      tx.exec("SET LOCAL search_path TO " + tx.quote_name(schema));
      for (const char* sql : vesting::db::sql::kLedgerSchema) {
        tx.exec(sql);
      }
      tx.commit();
    }
    auto pool = std::make_shared<vesting::db::postgres::PgPool>(conninfo, schema);
    return std::make_shared<vesting::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [conninfo, schema]() {
        pqxx::connection conn(conninfo);
        pqxx::work       tx(conn);
        tx.exec("DROP SCHEMA IF EXISTS " + tx.quote_name(schema) + " CASCADE");
        tx.commit();
      },
  };
}
#endif

void RunBackendSuite(const std::function<BackendFactory(const std::string&)>& make_backend) {
  // the restart check gets a fresh store so its ids start at 1
  auto backend = make_backend("suite");
  std::cout << "running backend suite: " << backend.name << "\n";
  {
    auto repo = backend.make_repository();

    VerifySequentialIdsAndRollback(*repo);
    VerifyAllocationUpdatesAndAirdrops(*repo);
    VerifySchedules(*repo);
    VerifyRoles(*repo);
    VerifyLedgerState(*repo);
    VerifyEventJournal(*repo);
    VerifyBeneficiaryIndex(*repo);
  }
  backend.cleanup();

  auto durable = make_backend("durable");
  VerifyRestartDurability(durable);
  durable.cleanup();
}

} // namespace

int main() {
  std::vector<std::function<BackendFactory(const std::string&)>> backends;
  backends.push_back([](const std::string&) { return MakeMemoryFactory(); });

#if VESTING_DB_SQLITE
  backends.push_back(MakeSqliteFactory);
#endif

#if VESTING_DB_POSTGRES
  if (const char* uri = std::getenv("VESTING_TEST_POSTGRES_URI"); uri != nullptr && *uri != '\0') {
    backends.push_back(MakePostgresFactory);
  } else {
    std::cout << "skipping postgres integration suite: VESTING_TEST_POSTGRES_URI is not set\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }
  VerifyMemorySnapshots();

  std::cout << "vesting_ledger_integration_repository_parity: pass\n";
  return 0;
}
