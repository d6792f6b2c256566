#pragma once

#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace vesting::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  // beneficiary -> ids, ascending
  using IdIndex = std::unordered_map<util::Address, std::vector<uint64_t>>;

  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertAllocation(Transaction&, model::AllocationRecord&) override;
  std::optional<model::AllocationRecord> GetAllocation(Transaction&, uint64_t) override;
  Result UpdateAllocation(Transaction&, const model::AllocationRecord&) override;
  std::vector<model::AllocationRecord> ListAllocationsByBeneficiary(Transaction&, const util::Address&) override;
  uint64_t CountAllocations(Transaction&) override;
  Result InsertAirdrop(Transaction&, model::AirdropRecord&) override;
  std::optional<model::AirdropRecord> GetAirdrop(Transaction&, uint64_t) override;

  Result InsertSchedule(Transaction&, model::ScheduleRecord&) override;
  std::optional<model::ScheduleRecord> GetSchedule(Transaction&, uint64_t) override;
  Result UpdateSchedule(Transaction&, const model::ScheduleRecord&) override;
  std::vector<model::ScheduleRecord> ListSchedulesByBeneficiary(Transaction&, const util::Address&) override;
  uint64_t CountSchedules(Transaction&) override;

  Result InsertRoleMember(Transaction&, model::RoleMemberRecord&) override;
  Result DeleteRoleMember(Transaction&, model::Role, const util::Address&) override;
  bool HasRoleMember(Transaction&, model::Role, const util::Address&) override;
  std::vector<model::RoleMemberRecord> ListRoleMembers(Transaction&, model::Role) override;

  model::LedgerStateRecord GetLedgerState(Transaction&) override;
  Result PutLedgerState(Transaction&, const model::LedgerStateRecord&) override;

  Result AppendEvent(Transaction&, model::EventRecord&) override;
  std::vector<model::EventRecord> ReadEvents(Transaction&, uint64_t start_offset,
                                             std::optional<uint64_t> max_events) override;

private:
  friend class MemoryTransaction;

  // Immutable once published. Writers copy it on their first mutation.
  struct Tables {
    std::unordered_map<uint64_t, model::AllocationRecord> allocations;
    std::unordered_map<uint64_t, model::AirdropRecord> airdrops;
    std::unordered_map<uint64_t, model::ScheduleRecord> schedules;

    IdIndex allocations_by_beneficiary;
    IdIndex schedules_by_beneficiary;

    // insertion order, seq ascending
    std::vector<model::RoleMemberRecord> roles;

    model::LedgerStateRecord ledger_state;

    uint64_t next_allocation_id = 1;
    uint64_t next_airdrop_id = 1;
    uint64_t next_schedule_id = 1;
    uint64_t next_role_seq = 1;
  };

  std::mutex mutex_;
  std::shared_ptr<const Tables> committed_;
  // append-only; entries below a transaction's snapshot size never change
  std::vector<model::EventRecord> events_;
  uint64_t committed_version_ = 0;
};

}
