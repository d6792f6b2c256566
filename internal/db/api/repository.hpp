#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/airdrop_record.hpp"
#include "internal/db/model/allocation_record.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/ledger_state_record.hpp"
#include "internal/db/model/role_record.hpp"
#include "internal/db/model/schedule_record.hpp"

namespace vesting::db {

/*
  Repository abstraction.

  One repository instance backs exactly one ledger. The allocation ledger
  and the vesting engine never share an instance, so a nested call from
  one ledger into the other never waits on its own write lock.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Insert* assigns the next sequential id (from 1) inside the
    transaction; a rolled back insert does not consume the id
  - AppendEvent assigns the next journal offset the same way

  The DB is the source of truth for:
    allocations and airdrops
    vesting schedules
    role membership
    pause flag and vesting counters
    the event journal
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Allocations
  // ---------------------------------------------------------------------

  virtual Result InsertAllocation(Transaction&, model::AllocationRecord&) = 0;

  virtual std::optional<model::AllocationRecord> GetAllocation(Transaction&, uint64_t id) = 0;

  virtual Result UpdateAllocation(Transaction&, const model::AllocationRecord&) = 0;

  virtual std::vector<model::AllocationRecord> ListAllocationsByBeneficiary(Transaction&, const util::Address& beneficiary) = 0;

  virtual uint64_t CountAllocations(Transaction&) = 0;

  virtual Result InsertAirdrop(Transaction&, model::AirdropRecord&) = 0;

  virtual std::optional<model::AirdropRecord> GetAirdrop(Transaction&, uint64_t id) = 0;

  // ---------------------------------------------------------------------
  // Vesting schedules
  // ---------------------------------------------------------------------

  virtual Result InsertSchedule(Transaction&, model::ScheduleRecord&) = 0;

  virtual std::optional<model::ScheduleRecord> GetSchedule(Transaction&, uint64_t id) = 0;

  virtual Result UpdateSchedule(Transaction&, const model::ScheduleRecord&) = 0;

  virtual std::vector<model::ScheduleRecord> ListSchedulesByBeneficiary(Transaction&, const util::Address& beneficiary) = 0;

  virtual uint64_t CountSchedules(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Roles (insertion ordered)
  // ---------------------------------------------------------------------

  // AlreadyExists when the member already holds the role
  virtual Result InsertRoleMember(Transaction&, model::RoleMemberRecord&) = 0;

  // NotFound when the member does not hold the role
  virtual Result DeleteRoleMember(Transaction&, model::Role role, const util::Address& member) = 0;

  virtual bool HasRoleMember(Transaction&, model::Role role, const util::Address& member) = 0;

  virtual std::vector<model::RoleMemberRecord> ListRoleMembers(Transaction&, model::Role role) = 0;

  // ---------------------------------------------------------------------
  // Ledger state
  // ---------------------------------------------------------------------

  virtual model::LedgerStateRecord GetLedgerState(Transaction&) = 0;

  virtual Result PutLedgerState(Transaction&, const model::LedgerStateRecord&) = 0;

  // ---------------------------------------------------------------------
  // Event journal
  // ---------------------------------------------------------------------

  virtual Result AppendEvent(Transaction&, model::EventRecord&) = 0;

  virtual std::vector<model::EventRecord> ReadEvents(Transaction&, uint64_t start_offset, std::optional<uint64_t> max_events) = 0;
};

} // namespace vesting::db
