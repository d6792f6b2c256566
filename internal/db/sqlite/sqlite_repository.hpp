#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace vesting::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
