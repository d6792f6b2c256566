#include "internal/core/reentrancy_guard.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <optional>
#include <thread>

#include "ledger_test_support.hpp"

namespace {

using vesting::core::ReentrancyGuard;
using vesting::testing::ExpectError;
using vesting::testing::kAdmin;
using vesting::testing::kAlice;
using vesting::testing::kBob;
using vesting::testing::kGenesis;
using vesting::testing::MakeLedgers;
using vesting::testing::Request;
using vesting::util::ErrorReason;
using vesting::util::StateConflict;

void TestSameThreadReentryFails() {
  ReentrancyGuard guard("test");

  {
    ReentrancyGuard::Scope outer(guard);
    assert(guard.HeldByCurrentThread());
    ExpectError<StateConflict>(ErrorReason::kReentrantCall, [&] { ReentrancyGuard::Scope inner(guard); });
    assert(guard.HeldByCurrentThread());
  }
  assert(!guard.HeldByCurrentThread());

  ReentrancyGuard::Scope again(guard);
}

void TestOtherThreadsWait() {
  ReentrancyGuard   guard("test");
  std::atomic<bool> entered{false};
  std::thread       waiter;

  {
    ReentrancyGuard::Scope scope(guard);
    waiter = std::thread([&] {
      ReentrancyGuard::Scope other(guard);
      entered = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    assert(!entered);
  }

  waiter.join();
  assert(entered);
}

void TestTokenCallbackCannotReenterClaim() {
  auto l = MakeLedgers();

  const auto id = l.engine->CreateVestingSchedule(kAdmin, Request(kAlice, 1000, kGenesis, 0, 100));
  l.clock->Advance(50);

  std::optional<ErrorReason> nested_reason;
  l.token->SetMintHook([&](const vesting::util::Address&, const vesting::util::Amount&) {
    try {
      l.engine->ClaimVestedTokens(kAlice, id);
    } catch (const vesting::util::LedgerError& e) {
      nested_reason = e.reason();
    }
  });

  const auto result = l.engine->ClaimVestedTokens(kAlice, id);
  assert(result.amount == 500);
  assert(nested_reason == ErrorReason::kReentrantCall);
  assert(l.token->BalanceOf(kAlice) == 500);
  assert(l.engine->GetSchedule(id).released_amount == 500);
}

void TestReentryFailureRollsBackOuterClaim() {
  auto l = MakeLedgers();

  const auto id = l.engine->CreateVestingSchedule(kAdmin, Request(kAlice, 1000, kGenesis, 0, 100));
  l.clock->Advance(100);
  const auto events_before = l.engine->ReadEvents(0, std::nullopt).size();

  // the nested error escapes the token and aborts the outer claim
  l.token->SetMintHook([&](const vesting::util::Address&, const vesting::util::Amount&) { l.engine->ClaimVestedTokens(kAlice, id); });
  ExpectError<StateConflict>(ErrorReason::kReentrantCall, [&] { l.engine->ClaimVestedTokens(kAlice, id); });

  assert(l.token->TotalMinted() == 0);
  assert(l.engine->GetSchedule(id).released_amount == 0);
  assert(l.engine->Totals().total_claimed == 0);
  assert(l.engine->ReadEvents(0, std::nullopt).size() == events_before);

  l.token->SetMintHook(nullptr);
  assert(l.engine->ClaimVestedTokens(kAlice, id).amount == 1000);
}

void TestCallbackIntoOtherLedgerIsAllowed() {
  auto l = MakeLedgers();

  const auto id = l.engine->CreateVestingSchedule(kAdmin, Request(kAlice, 10, kGenesis, 0, 10));
  l.clock->Advance(10);

  vesting::model::AllocationId created;
  l.token->SetMintHook([&](const vesting::util::Address&, const vesting::util::Amount&) {
    created = l.allocations->CreateAllocation(kAdmin, kBob, 7);
  });

  l.engine->ClaimVestedTokens(kAlice, id);
  assert(created.IsSet());
  assert(l.allocations->GetAllocation(created).amount == 7);
}

} // namespace

int main() {
  TestSameThreadReentryFails();
  TestOtherThreadsWait();
  TestTokenCallbackCannotReenterClaim();
  TestReentryFailureRollsBackOuterClaim();
  TestCallbackIntoOtherLedgerIsAllowed();

  std::cout << "vesting_ledger_unit_reentrancy_guard: pass\n";
  return 0;
}
