#pragma once

#include <utility>
#include <vector>

#include "internal/util/address.hpp"
#include "internal/util/amount.hpp"

namespace vesting::token {

using MintEntry = std::pair<util::Address, util::Amount>;

/*
  Boundary to the external token. The ledgers only ever mint; balances
  are exposed for callers and never drive a ledger decision.
*/
class TokenLedger {
 public:
  virtual ~TokenLedger() = default;

  virtual void Mint(const util::Address& to, const util::Amount& amount) = 0;

  // All entries are minted or none are.
  virtual void MintBatch(const std::vector<MintEntry>& entries) = 0;

  virtual util::Amount BalanceOf(const util::Address& holder) const = 0;
  virtual util::Amount TotalMinted() const                          = 0;
};

} // namespace vesting::token
