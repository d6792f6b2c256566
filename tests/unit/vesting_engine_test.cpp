#include "internal/core/vesting_engine.hpp"

#include <cassert>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <vector>

#include "ledger_test_support.hpp"

namespace {

using vesting::core::AllocationSync;
using vesting::db::model::EventKind;
using vesting::model::SchedulePhase;
using vesting::model::ScheduleId;
using vesting::model::ScheduleStatus;
using vesting::testing::ExpectError;
using vesting::testing::kAdmin;
using vesting::testing::kAlice;
using vesting::testing::kBob;
using vesting::testing::kEngine;
using vesting::testing::kGenesis;
using vesting::testing::kManager;
using vesting::testing::kMallory;
using vesting::testing::MakeLedgers;
using vesting::testing::Request;
using vesting::util::Address;
using vesting::util::ErrorReason;
using vesting::util::InvalidInput;
using vesting::util::InvalidReference;
using vesting::util::StateConflict;
using vesting::util::SystemHalted;
using vesting::util::Unauthorized;

constexpr std::uint64_t T = kGenesis;

void TestCreateValidation() {
  auto  l      = MakeLedgers();
  auto& engine = *l.engine;

  ExpectError<Unauthorized>(ErrorReason::kNotAuthorized, [&] { engine.CreateVestingSchedule(kMallory, Request(kAlice, 1, T, 0, 1)); });
  ExpectError<InvalidInput>(ErrorReason::kInvalidBeneficiary, [&] { engine.CreateVestingSchedule(kAdmin, Request(Address(), 1, T, 0, 1)); });
  ExpectError<InvalidInput>(ErrorReason::kInvalidAmount, [&] { engine.CreateVestingSchedule(kAdmin, Request(kAlice, 0, T, 0, 1)); });
  ExpectError<InvalidInput>(ErrorReason::kInvalidDuration, [&] { engine.CreateVestingSchedule(kAdmin, Request(kAlice, 1, T, 0, 0)); });
  ExpectError<InvalidInput>(ErrorReason::kInvalidDuration, [&] { engine.CreateVestingSchedule(kAdmin, Request(kAlice, 1, T, 11, 10)); });
  ExpectError<InvalidInput>(ErrorReason::kInvalidStartTime, [&] { engine.CreateVestingSchedule(kAdmin, Request(kAlice, 1, T - 1, 0, 10)); });
  ExpectError<InvalidInput>(ErrorReason::kInvalidDuration, [&] {
    engine.CreateVestingSchedule(kAdmin, Request(kAlice, 1, std::numeric_limits<std::uint64_t>::max() - 5, 0, 10));
  });

  assert(engine.ScheduleCount() == 0);
  assert(engine.Totals().total_vested == 0);

  const auto id = engine.CreateVestingSchedule(kAdmin, Request(kAlice, 1000, T + 10, 5, 100));
  assert(id.value() == 1);
  const auto schedule = engine.GetSchedule(id);
  assert(schedule.beneficiary == kAlice);
  assert(schedule.total_amount == 1000);
  assert(schedule.released_amount == 0);
  assert(schedule.start_time == T + 10);
  assert(schedule.created_at == T);
  assert(schedule.status == ScheduleStatus::kActive);
  assert(engine.Totals().total_vested == 1000);
}

void TestManagersFromAllocationLedgerMayCreate() {
  auto l = MakeLedgers();

  ExpectError<Unauthorized>(ErrorReason::kNotAuthorized, [&] { l.engine->CreateVestingSchedule(kManager, Request(kAlice, 1, T, 0, 1)); });
  l.allocations->AddManager(kAdmin, kManager);
  assert(l.engine->CreateVestingSchedule(kManager, Request(kAlice, 1, T, 0, 1)).IsSet());

  // force revoke stays admin only
  ExpectError<Unauthorized>(ErrorReason::kNotAuthorized, [&] { l.engine->ForceRevokeSchedule(kManager, ScheduleId(1)); });
}

void TestClaimFollowsCurveAndIsIdempotent() {
  auto l  = MakeLedgers();
  auto id = l.engine->CreateVestingSchedule(kAdmin, Request(kAlice, 1000, T, 0, 1000));

  ExpectError<StateConflict>(ErrorReason::kNoTokensDue, [&] { l.engine->ClaimVestedTokens(kAlice, id); });

  l.clock->Set(T + 250);
  auto first = l.engine->ClaimVestedTokens(kAlice, id);
  assert(first.amount == 250);
  assert(first.allocation_sync == AllocationSync::kNotLinked);
  ExpectError<StateConflict>(ErrorReason::kNoTokensDue, [&] { l.engine->ClaimVestedTokens(kAlice, id); });
  assert(l.token->BalanceOf(kAlice) == 250);

  l.clock->Set(T + 500);
  assert(l.engine->ClaimVestedTokens(kAlice, id).amount == 250);
  assert(l.engine->GetSchedule(id).released_amount == 500);
  assert(l.engine->Totals().total_claimed == 500);

  ExpectError<Unauthorized>(ErrorReason::kNotBeneficiary, [&] { l.engine->ClaimVestedTokens(kBob, id); });
  ExpectError<InvalidReference>(ErrorReason::kInvalidScheduleId, [&] { l.engine->ClaimVestedTokens(kAlice, ScheduleId(42)); });
  ExpectError<InvalidReference>(ErrorReason::kInvalidScheduleId, [&] { l.engine->ClaimVestedTokens(kAlice, ScheduleId()); });
}

void TestCliffAndFullVestBoundaries() {
  auto l  = MakeLedgers();
  auto id = l.engine->CreateVestingSchedule(kAdmin, Request(kAlice, 1000, T, 100, 300));

  l.clock->Set(T + 99);
  assert(l.engine->GetVestingInfo(id).releasable == 0);
  assert(l.engine->GetVestingInfo(id).phase == SchedulePhase::kPending);
  ExpectError<StateConflict>(ErrorReason::kNoTokensDue, [&] { l.engine->ClaimVestedTokens(kAlice, id); });

  l.clock->Set(T + 100);
  const auto at_cliff = l.engine->GetVestingInfo(id);
  assert(at_cliff.releasable == 333);
  assert(at_cliff.phase == SchedulePhase::kVesting);
  assert(l.engine->ClaimVestedTokens(kAlice, id).amount == 333);

  l.clock->Set(T + 300);
  assert(l.engine->GetVestingInfo(id).releasable == 667);
  assert(l.engine->GetVestingInfo(id).phase == SchedulePhase::kFullyVested);
  assert(l.engine->ClaimVestedTokens(kAlice, id).amount == 667);

  // a full claim completes the schedule, it is not a revocation
  const auto info = l.engine->GetVestingInfo(id);
  assert(info.status == ScheduleStatus::kCompleted);
  assert(info.phase == SchedulePhase::kTerminal);
  assert(info.released_amount == 1000);
  ExpectError<StateConflict>(ErrorReason::kScheduleRevoked, [&] { l.engine->ClaimVestedTokens(kAlice, id); });

  const auto events = l.engine->ReadEvents(0, std::nullopt);
  assert(events.back().kind == EventKind::kScheduleCompleted);
  assert(events[events.size() - 2].kind == EventKind::kTokensReleased);
}

void TestRevokeFreezesSchedule() {
  auto l  = MakeLedgers();
  auto id = l.engine->CreateVestingSchedule(kAdmin, Request(kAlice, 1000, T, 0, 1000));

  l.clock->Set(T + 400);
  l.engine->ClaimVestedTokens(kAlice, id);

  ExpectError<Unauthorized>(ErrorReason::kNotAuthorized, [&] { l.engine->RevokeSchedule(kAlice, id); });
  assert(l.engine->RevokeSchedule(kAdmin, id) == 600);

  // claimed tokens stay counted as vested
  assert(l.engine->Totals().total_vested == 400);
  assert(l.engine->Totals().total_claimed == 400);

  l.clock->Set(T + 5000);
  ExpectError<StateConflict>(ErrorReason::kScheduleRevoked, [&] { l.engine->ClaimVestedTokens(kAlice, id); });
  ExpectError<StateConflict>(ErrorReason::kScheduleRevoked, [&] { l.engine->ManualUnlock(kAdmin, id, 1); });
  ExpectError<StateConflict>(ErrorReason::kScheduleRevoked, [&] { l.engine->RevokeSchedule(kAdmin, id); });
  assert(l.engine->GetVestingInfo(id).status == ScheduleStatus::kRevoked);
  assert(l.engine->GetVestingInfo(id).releasable == 0);
}

void TestManualUnlock() {
  auto l  = MakeLedgers();
  auto id = l.engine->CreateVestingSchedule(kAdmin, Request(kAlice, 1000, T + 100, 0, 1000));

  ExpectError<Unauthorized>(ErrorReason::kNotAuthorized, [&] { l.engine->ManualUnlock(kAlice, id, 1); });
  ExpectError<InvalidInput>(ErrorReason::kInvalidAmount, [&] { l.engine->ManualUnlock(kAdmin, id, 0); });
  ExpectError<StateConflict>(ErrorReason::kAmountExceedsRemaining, [&] { l.engine->ManualUnlock(kAdmin, id, 1001); });

  // ignores the curve: nothing has vested yet
  assert(l.engine->ManualUnlock(kAdmin, id, 300).amount == 300);
  assert(l.token->BalanceOf(kAlice) == 300);

  // releasing the remainder leaves the schedule active
  assert(l.engine->ManualUnlock(kAdmin, id, 700).amount == 700);
  const auto schedule = l.engine->GetSchedule(id);
  assert(schedule.released_amount == 1000);
  assert(schedule.status == ScheduleStatus::kActive);

  l.clock->Set(T + 2000);
  ExpectError<StateConflict>(ErrorReason::kNoTokensDue, [&] { l.engine->ClaimVestedTokens(kAlice, id); });
  ExpectError<StateConflict>(ErrorReason::kNothingToRevoke, [&] { l.engine->RevokeSchedule(kAdmin, id); });
  assert(l.engine->ForceRevokeSchedule(kAdmin, id) == 0);
}

void TestLinkedAllocationChecksAtCreation() {
  auto l     = MakeLedgers();
  auto alloc = l.allocations->CreateAllocation(kAdmin, kAlice, 500);

  ExpectError<InvalidReference>(ErrorReason::kInvalidAllocationId,
                                [&] { l.engine->CreateVestingSchedule(kAdmin, Request(kAlice, 100, T, 0, 10, 99)); });
  ExpectError<InvalidReference>(ErrorReason::kAllocationBeneficiaryMismatch,
                                [&] { l.engine->CreateVestingSchedule(kAdmin, Request(kBob, 100, T, 0, 10, alloc.value())); });
  ExpectError<StateConflict>(ErrorReason::kInsufficientAllocation,
                             [&] { l.engine->CreateVestingSchedule(kAdmin, Request(kAlice, 501, T, 0, 10, alloc.value())); });

  // nothing written, no id consumed, no counter moved
  assert(l.engine->ScheduleCount() == 0);
  assert(l.engine->Totals().total_vested == 0);

  l.allocations->RevokeAllocation(kAdmin, alloc);
  ExpectError<InvalidReference>(ErrorReason::kAllocationRevoked,
                                [&] { l.engine->CreateVestingSchedule(kAdmin, Request(kAlice, 100, T, 0, 10, alloc.value())); });

  auto fresh = l.allocations->CreateAllocation(kAdmin, kAlice, 500);
  assert(l.engine->CreateVestingSchedule(kAdmin, Request(kAlice, 500, T, 0, 10, fresh.value())).value() == 1);
}

void TestClaimReducesLinkedAllocation() {
  auto l     = MakeLedgers();
  auto alloc = l.allocations->CreateAllocation(kAdmin, kAlice, 1000);
  auto id    = l.engine->CreateVestingSchedule(kAdmin, Request(kAlice, 800, T, 0, 100, alloc.value()));

  l.clock->Set(T + 50);
  const auto claim = l.engine->ClaimVestedTokens(kAlice, id);
  assert(claim.amount == 400);
  assert(claim.allocation_sync == AllocationSync::kReduced);
  assert(l.allocations->GetAllocation(alloc).amount == 600);

  const auto unlock = l.engine->ManualUnlock(kAdmin, id, 100);
  assert(unlock.allocation_sync == AllocationSync::kReduced);
  assert(l.allocations->GetAllocation(alloc).amount == 500);
}

void TestAllocationSyncIsBestEffort() {
  auto l     = MakeLedgers();
  auto alloc = l.allocations->CreateAllocation(kAdmin, kAlice, 1000);
  auto id    = l.engine->CreateVestingSchedule(kAdmin, Request(kAlice, 1000, T, 0, 100, alloc.value()));

  // allocation drained out of band: the claim still pays out
  l.allocations->ReduceAllocation(kAdmin, alloc, 900);
  l.clock->Set(T + 50);
  auto skipped = l.engine->ClaimVestedTokens(kAlice, id);
  assert(skipped.amount == 500);
  assert(skipped.allocation_sync == AllocationSync::kSkipped);
  assert(l.allocations->GetAllocation(alloc).amount == 100);
  assert(l.token->BalanceOf(kAlice) == 500);

  // engine no longer a manager: the reduction call itself fails
  l.allocations->RemoveManager(kAdmin, kEngine);
  auto failed = l.engine->ManualUnlock(kAdmin, id, 50);
  assert(failed.amount == 50);
  assert(failed.allocation_sync == AllocationSync::kFailed);
  assert(l.allocations->GetAllocation(alloc).amount == 100);
  assert(l.engine->GetSchedule(id).released_amount == 550);

  // paused allocation ledger fails the sync the same way
  l.allocations->AddManager(kAdmin, kEngine);
  l.allocations->Pause(kAdmin);
  l.clock->Set(T + 60);
  auto paused = l.engine->ClaimVestedTokens(kAlice, id);
  assert(paused.amount == 50);
  assert(paused.allocation_sync == AllocationSync::kFailed);
}

void TestRevokeAlsoRevokesLinkedAllocation() {
  auto l     = MakeLedgers();
  auto alloc = l.allocations->CreateAllocation(kAdmin, kAlice, 1000);
  auto id    = l.engine->CreateVestingSchedule(kAdmin, Request(kAlice, 1000, T, 0, 100, alloc.value()));

  assert(l.engine->RevokeSchedule(kAdmin, id) == 1000);
  assert(l.allocations->GetAllocation(alloc).revoked);

  // allocation already revoked out of band: the normal revoke fails and
  // changes nothing, force revoke is the way out
  auto alloc2 = l.allocations->CreateAllocation(kAdmin, kBob, 100);
  auto id2    = l.engine->CreateVestingSchedule(kAdmin, Request(kBob, 100, T, 0, 100, alloc2.value()));
  l.allocations->RevokeAllocation(kAdmin, alloc2);

  ExpectError<StateConflict>(ErrorReason::kAllocationAlreadyRevoked, [&] { l.engine->RevokeSchedule(kAdmin, id2); });
  assert(l.engine->GetSchedule(id2).status == ScheduleStatus::kActive);
  assert(l.engine->Totals().total_vested == 100);

  assert(l.engine->ForceRevokeSchedule(kAdmin, id2) == 100);
  assert(l.engine->GetSchedule(id2).status == ScheduleStatus::kRevoked);
  assert(l.engine->Totals().total_vested == 0);
}

void TestBatchForceRevokeToleratesBadIds() {
  auto l       = MakeLedgers();
  auto valid_a = l.engine->CreateVestingSchedule(kAdmin, Request(kAlice, 100, T, 0, 100));
  auto valid_b = l.engine->CreateVestingSchedule(kAdmin, Request(kBob, 100, T, 0, 100));
  auto revoked = l.engine->CreateVestingSchedule(kAdmin, Request(kBob, 100, T, 0, 100));
  l.engine->ForceRevokeSchedule(kAdmin, revoked);

  ExpectError<Unauthorized>(ErrorReason::kNotAuthorized, [&] { l.engine->BatchForceRevokeSchedules(kAlice, {valid_a}); });

  const auto count = l.engine->BatchForceRevokeSchedules(kAdmin, {valid_a, ScheduleId(), ScheduleId(77), valid_b, revoked});
  assert(count == 2);
  assert(l.engine->GetSchedule(valid_a).status == ScheduleStatus::kRevoked);
  assert(l.engine->GetSchedule(valid_b).status == ScheduleStatus::kRevoked);
  assert(l.engine->Totals().total_vested == 0);

  assert(l.engine->BatchForceRevokeSchedules(kAdmin, {}) == 0);
}

void TestPauseBlocksMutationsOnly() {
  auto l  = MakeLedgers();
  auto id = l.engine->CreateVestingSchedule(kAdmin, Request(kAlice, 100, T, 0, 100));
  l.clock->Set(T + 100);

  l.engine->Pause(kAdmin);
  ExpectError<SystemHalted>(ErrorReason::kEnforcedPause, [&] { l.engine->ClaimVestedTokens(kAlice, id); });
  ExpectError<SystemHalted>(ErrorReason::kEnforcedPause, [&] { l.engine->ForceRevokeSchedule(kAdmin, id); });
  ExpectError<SystemHalted>(ErrorReason::kEnforcedPause, [&] { l.engine->BatchForceRevokeSchedules(kAdmin, {id}); });
  assert(l.engine->GetVestingInfo(id).releasable == 100);

  l.engine->Unpause(kAdmin);
  assert(l.engine->ClaimVestedTokens(kAlice, id).amount == 100);
}

void TestMintFailureLeavesNoAccounting() {
  auto l = MakeLedgers();

  // a token with no room left rejects the mint; the claim rolls back
  auto capped = std::make_shared<vesting::token::MemoryTokenLedger>(10);
  auto repo   = std::make_shared<vesting::db::memory::MemoryRepository>();
  auto engine = std::make_shared<vesting::core::VestingEngine>(repo, l.allocations, l.allocations, capped, l.clock, kEngine);
  engine->BootstrapAdmin(kAdmin);

  auto id = engine->CreateVestingSchedule(kAdmin, Request(kAlice, 100, T, 0, 100));
  l.clock->Set(T + 100);
  ExpectError<StateConflict>(ErrorReason::kMaxSupplyExceeded, [&] { engine->ClaimVestedTokens(kAlice, id); });

  assert(engine->GetSchedule(id).released_amount == 0);
  assert(engine->Totals().total_claimed == 0);
  assert(capped->TotalMinted() == 0);
}

void TestCommitFailureAfterMintSurfaces() {
  auto l  = MakeLedgers();
  auto id = l.engine->CreateVestingSchedule(kAdmin, Request(kAlice, 100, T, 0, 100));
  l.clock->Set(T + 40);

  // another writer commits to the vesting store while the mint is in flight
  l.token->SetMintHook([&](const Address&, const vesting::util::Amount&) {
    auto tx    = l.vesting_repo->Begin();
    auto state = l.vesting_repo->GetLedgerState(*tx);
    vesting::db::ThrowIfDbError(l.vesting_repo->PutLedgerState(*tx, state), "touch state");
    tx->Commit();
  });

  bool failed = false;
  try {
    l.engine->ClaimVestedTokens(kAlice, id);
  } catch (const vesting::util::LedgerError&) {
    assert(false);
  } catch (const std::runtime_error&) {
    failed = true;
  }
  assert(failed);

  // the mint went out, the books did not move
  assert(l.token->BalanceOf(kAlice) == 40);
  assert(l.engine->GetSchedule(id).released_amount == 0);
  assert(l.engine->Totals().total_claimed == 0);

  // the ledger is not wedged; the unrecorded amount is releasable again
  l.token->SetMintHook(nullptr);
  assert(l.engine->ClaimVestedTokens(kAlice, id).amount == 40);
  assert(l.token->BalanceOf(kAlice) == 80);
  assert(l.engine->GetSchedule(id).released_amount == 40);
}

void TestBeneficiarySummary() {
  auto l         = MakeLedgers();
  auto active    = l.engine->CreateVestingSchedule(kAdmin, Request(kAlice, 1000, T, 0, 100));
  auto completed = l.engine->CreateVestingSchedule(kAdmin, Request(kAlice, 10, T, 0, 10));
  auto revoked   = l.engine->CreateVestingSchedule(kAdmin, Request(kAlice, 50, T, 0, 100));
  l.engine->CreateVestingSchedule(kAdmin, Request(kBob, 5, T, 0, 10));

  l.clock->Set(T + 10);
  l.engine->ClaimVestedTokens(kAlice, completed);
  l.engine->ClaimVestedTokens(kAlice, active);
  l.engine->RevokeSchedule(kAdmin, revoked);
  l.clock->Set(T + 20);

  const auto summary = l.engine->SummaryFor(kAlice);
  assert(summary.total_allocated == 1060);
  assert(summary.total_released == 110);
  assert(summary.total_unclaimed == 900);
  assert(summary.claimable_now == 100);
  assert(summary.active_count == 1);
  assert(summary.completed_count == 1);
  assert(summary.revoked_count == 1);

  assert(l.engine->SchedulesForBeneficiary(kAlice).size() == 3);
  assert(l.engine->SchedulesForBeneficiary(kMallory).empty());
  assert(l.engine->ScheduleCount() == 4);
}

} // namespace

int main() {
  TestCreateValidation();
  TestManagersFromAllocationLedgerMayCreate();
  TestClaimFollowsCurveAndIsIdempotent();
  TestCliffAndFullVestBoundaries();
  TestRevokeFreezesSchedule();
  TestManualUnlock();
  TestLinkedAllocationChecksAtCreation();
  TestClaimReducesLinkedAllocation();
  TestAllocationSyncIsBestEffort();
  TestRevokeAlsoRevokesLinkedAllocation();
  TestBatchForceRevokeToleratesBadIds();
  TestPauseBlocksMutationsOnly();
  TestMintFailureLeavesNoAccounting();
  TestCommitFailureAfterMintSurfaces();
  TestBeneficiarySummary();

  std::cout << "vesting_ledger_unit_vesting_engine: pass\n";
  return 0;
}
