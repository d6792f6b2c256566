#pragma once

#include <functional>
#include <mutex>
#include <unordered_map>

#include "token_ledger.hpp"

namespace vesting::token {

/*
  In-process capped token.

  - TotalMinted never exceeds the cap; Burn lowers balances but not
    TotalMinted, so burned supply cannot be minted again.
  - An optional mint hook runs for every entry before any balance
    changes, without the ledger lock held. Throwing from it aborts the
    mint. Tests use it to model a token that calls back into the ledgers
    or rejects a transfer.
*/
class MemoryTokenLedger final : public TokenLedger {
 public:
  using MintHook = std::function<void(const util::Address& to, const util::Amount& amount)>;

  static util::Amount DefaultMaxSupply();

  explicit MemoryTokenLedger(util::Amount max_supply = DefaultMaxSupply());

  void Mint(const util::Address& to, const util::Amount& amount) override;
  void MintBatch(const std::vector<MintEntry>& entries) override;

  util::Amount BalanceOf(const util::Address& holder) const override;
  util::Amount TotalMinted() const override;

  void Burn(const util::Address& holder, const util::Amount& amount);

  util::Amount MaxSupply() const {
    return max_supply_;
  }

  void SetMintHook(MintHook hook);

 private:
  void RequireMintable(const util::Address& to, const util::Amount& amount) const;
  void RequireCapacity(const util::Amount& requested) const;
  MintHook Hook() const;

  const util::Amount max_supply_;

  mutable std::mutex                              mutex_;
  std::unordered_map<util::Address, util::Amount> balances_;
  util::Amount                                    total_minted_ = 0;
  MintHook                                        hook_;
};

} // namespace vesting::token
