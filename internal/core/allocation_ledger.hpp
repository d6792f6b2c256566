#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "internal/core/allocation_book.hpp"
#include "internal/core/ledger_base.hpp"
#include "internal/core/manager_registry.hpp"
#include "internal/db/model/airdrop_record.hpp"
#include "internal/token/token_ledger.hpp"

namespace vesting::core {

struct AirdropResult {
  model::AirdropId                 id;
  std::vector<model::AllocationId> allocation_ids;
  util::Amount                     total_amount = 0;
};

/*
  Allocation ledger: revocable token reservations per beneficiary, the
  manager registry, and all-or-nothing airdrops.

  Mutations check pause -> role -> input -> state, in that order, inside
  one transaction. Nothing is written unless every check passes.
*/
class AllocationLedger final : public LedgerBase, public AllocationBook, public ManagerRegistry {
 public:
  AllocationLedger(std::shared_ptr<db::Repository> repository, std::shared_ptr<token::TokenLedger> token, std::shared_ptr<util::Clock> clock);

  model::AllocationId CreateAllocation(const util::Address& caller, const util::Address& beneficiary, const util::Amount& amount);
  bool                RevokeAllocation(const util::Address& caller, model::AllocationId id) override;
  bool                ReduceAllocation(const util::Address& caller, model::AllocationId id, const util::Amount& amount) override;

  AirdropResult ExecuteAirdrop(const util::Address& caller, const std::vector<util::Address>& beneficiaries,
                               const std::vector<util::Amount>& amounts);

  // false when the address already is / is not a manager.
  bool AddManager(const util::Address& caller, const util::Address& manager);
  bool RemoveManager(const util::Address& caller, const util::Address& manager);

  bool                       IsManager(const util::Address& account) override;
  std::vector<util::Address> ListManagers();

  db::model::AllocationRecord              GetAllocation(model::AllocationId id) override;
  std::vector<db::model::AllocationRecord> AllocationsForBeneficiary(const util::Address& beneficiary);
  std::uint64_t                            AllocationCount();
  std::optional<db::model::AirdropRecord>  GetAirdrop(model::AirdropId id);

 private:
  db::model::AllocationRecord LoadAllocation(db::Transaction& tx, model::AllocationId id);

  std::shared_ptr<token::TokenLedger> token_;
};

} // namespace vesting::core
