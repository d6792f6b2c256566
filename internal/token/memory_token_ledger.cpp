#include "memory_token_ledger.hpp"

#include "internal/util/errors.hpp"

namespace vesting::token {

using util::ErrorReason;

util::Amount MemoryTokenLedger::DefaultMaxSupply() {
  // 1,000,000,000 tokens with 18 decimals
  return util::ParseAmount("1000000000000000000000000000");
}

MemoryTokenLedger::MemoryTokenLedger(util::Amount max_supply) : max_supply_(std::move(max_supply)) {
}

void MemoryTokenLedger::RequireMintable(const util::Address& to, const util::Amount& amount) const {
  if (to.IsZero()) {
    throw util::InvalidInput(ErrorReason::kInvalidAddress, "cannot mint to the zero address");
  }
  if (amount == 0) {
    throw util::InvalidInput(ErrorReason::kInvalidAmount, "mint amount must be positive");
  }
}

// caller holds mutex_
void MemoryTokenLedger::RequireCapacity(const util::Amount& requested) const {
  const util::Amount available = max_supply_ - total_minted_;
  if (requested > available) {
    throw util::StateConflict(ErrorReason::kMaxSupplyExceeded,
                              "requested " + util::ToString(requested) + ", available " + util::ToString(available));
  }
}

void MemoryTokenLedger::Mint(const util::Address& to, const util::Amount& amount) {
  RequireMintable(to, amount);

  if (auto hook = Hook()) {
    hook(to, amount);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  RequireCapacity(amount);
  balances_[to] += amount;
  total_minted_ += amount;
}

void MemoryTokenLedger::MintBatch(const std::vector<MintEntry>& entries) {
  util::Amount requested = 0;
  for (const auto& [to, amount] : entries) {
    RequireMintable(to, amount);
    if (amount > max_supply_ - requested) {
      throw util::StateConflict(ErrorReason::kMaxSupplyExceeded, "batch exceeds max supply");
    }
    requested += amount;
  }

  if (auto hook = Hook()) {
    for (const auto& [to, amount] : entries) {
      hook(to, amount);
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  RequireCapacity(requested);
  for (const auto& [to, amount] : entries) {
    balances_[to] += amount;
  }
  total_minted_ += requested;
}

util::Amount MemoryTokenLedger::BalanceOf(const util::Address& holder) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = balances_.find(holder);
  return it == balances_.end() ? util::Amount(0) : it->second;
}

util::Amount MemoryTokenLedger::TotalMinted() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return total_minted_;
}

void MemoryTokenLedger::Burn(const util::Address& holder, const util::Amount& amount) {
  if (amount == 0) {
    throw util::InvalidInput(ErrorReason::kInvalidAmount, "burn amount must be positive");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it      = balances_.find(holder);
  const util::Amount          balance = it == balances_.end() ? util::Amount(0) : it->second;
  if (balance < amount) {
    throw util::StateConflict(ErrorReason::kInsufficientBalance,
                              "balance " + util::ToString(balance) + ", requested " + util::ToString(amount));
  }
  it->second -= amount;
}

MemoryTokenLedger::MintHook MemoryTokenLedger::Hook() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return hook_;
}

void MemoryTokenLedger::SetMintHook(MintHook hook) {
  std::lock_guard<std::mutex> lock(mutex_);
  hook_ = std::move(hook);
}

} // namespace vesting::token
