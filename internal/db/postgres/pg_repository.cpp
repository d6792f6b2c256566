#include "pg_repository.hpp"

#include <string>

namespace vesting::db::postgres {

namespace {

std::string Text(const util::Amount& amount) {
  return util::ToString(amount);
}

model::AllocationRecord ReadAllocation(const pqxx::row& row) {
  model::AllocationRecord r;
  r.id          = row[0].as<uint64_t>();
  r.amount      = util::ParseAmount(row[1].c_str());
  r.beneficiary = util::Address::Parse(row[2].c_str());
  r.revoked     = row[3].as<int>() != 0;
  r.created_at  = row[4].as<uint64_t>();
  r.airdrop_id  = row[5].as<uint64_t>();
  return r;
}

model::ScheduleRecord ReadSchedule(const pqxx::row& row) {
  model::ScheduleRecord r;
  r.id              = row[0].as<uint64_t>();
  r.beneficiary     = util::Address::Parse(row[1].c_str());
  r.total_amount    = util::ParseAmount(row[2].c_str());
  r.released_amount = util::ParseAmount(row[3].c_str());
  r.start_time      = row[4].as<uint64_t>();
  r.cliff_duration  = row[5].as<uint64_t>();
  r.duration        = row[6].as<uint64_t>();
  r.created_at      = row[7].as<uint64_t>();
  r.allocation_id   = row[8].as<uint64_t>();
  r.status          = static_cast<vesting::model::ScheduleStatus>(row[9].as<int>());
  return r;
}

model::EventRecord ReadEvent(const pqxx::row& row) {
  model::EventRecord r;
  r.offset      = row[0].as<uint64_t>();
  r.kind        = static_cast<model::EventKind>(row[1].as<int>());
  r.subject_id  = row[2].as<uint64_t>();
  r.beneficiary = util::Address::Parse(row[3].c_str());
  r.amount      = util::ParseAmount(row[4].c_str());
  r.actor       = util::Address::Parse(row[5].c_str());
  r.timestamp   = row[6].as<uint64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::Conflict, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Allocations
// ------------------------------------------------------------------

Result PgRepository::InsertAllocation(Transaction& t, model::AllocationRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_allocation", Text(r.amount), r.beneficiary.ToString(), r.revoked ? 1 : 0, r.created_at,
                                          r.airdrop_id);
    r.id     = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::AllocationRecord> PgRepository::GetAllocation(Transaction& t, uint64_t id) {
  auto res = TX(t).Work().exec_prepared("get_allocation", id);
  if (res.empty()) return std::nullopt;
  return ReadAllocation(res[0]);
}

Result PgRepository::UpdateAllocation(Transaction& t, const model::AllocationRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_allocation", r.id, Text(r.amount), r.revoked ? 1 : 0, r.airdrop_id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "allocation " + std::to_string(r.id));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::AllocationRecord> PgRepository::ListAllocationsByBeneficiary(Transaction& t, const util::Address& beneficiary) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,amount,beneficiary,revoked,created_at,airdrop_id FROM allocations WHERE beneficiary=$1 ORDER BY id ASC;", beneficiary.ToString());

  std::vector<model::AllocationRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadAllocation(row));
  return out;
}

uint64_t PgRepository::CountAllocations(Transaction& t) {
  return TX(t).Work().exec("SELECT COUNT(*) FROM allocations;")[0][0].as<uint64_t>();
}

Result PgRepository::InsertAirdrop(Transaction& t, model::AirdropRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO airdrops(id,executed_by,entry_count,total_amount,first_allocation_id,created_at) "
        "VALUES((SELECT COALESCE(MAX(id),0)+1 FROM airdrops),$1,$2,$3,$4,$5) RETURNING id;",
        r.executed_by.ToString(), r.entry_count, Text(r.total_amount), r.first_allocation_id, r.created_at);
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::AirdropRecord> PgRepository::GetAirdrop(Transaction& t, uint64_t id) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,executed_by,entry_count,total_amount,first_allocation_id,created_at FROM airdrops WHERE id=$1;", id);
  if (res.empty()) return std::nullopt;

  model::AirdropRecord r;
  r.id                  = res[0][0].as<uint64_t>();
  r.executed_by         = util::Address::Parse(res[0][1].c_str());
  r.entry_count         = res[0][2].as<uint64_t>();
  r.total_amount        = util::ParseAmount(res[0][3].c_str());
  r.first_allocation_id = res[0][4].as<uint64_t>();
  r.created_at          = res[0][5].as<uint64_t>();
  return r;
}

// ------------------------------------------------------------------
// Schedules
// ------------------------------------------------------------------

Result PgRepository::InsertSchedule(Transaction& t, model::ScheduleRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_schedule", r.beneficiary.ToString(), Text(r.total_amount), Text(r.released_amount), r.start_time,
                                          r.cliff_duration, r.duration, r.created_at, r.allocation_id, static_cast<int>(r.status));
    r.id     = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ScheduleRecord> PgRepository::GetSchedule(Transaction& t, uint64_t id) {
  auto res = TX(t).Work().exec_prepared("get_schedule", id);
  if (res.empty()) return std::nullopt;
  return ReadSchedule(res[0]);
}

Result PgRepository::UpdateSchedule(Transaction& t, const model::ScheduleRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_schedule", r.id, Text(r.released_amount), static_cast<int>(r.status));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "schedule " + std::to_string(r.id));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ScheduleRecord> PgRepository::ListSchedulesByBeneficiary(Transaction& t, const util::Address& beneficiary) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,beneficiary,total_amount,released_amount,start_time,cliff_duration,duration,created_at,allocation_id,status "
      "FROM schedules WHERE beneficiary=$1 ORDER BY id ASC;",
      beneficiary.ToString());

  std::vector<model::ScheduleRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadSchedule(row));
  return out;
}

uint64_t PgRepository::CountSchedules(Transaction& t) {
  return TX(t).Work().exec("SELECT COUNT(*) FROM schedules;")[0][0].as<uint64_t>();
}

// ------------------------------------------------------------------
// Roles
// ------------------------------------------------------------------

Result PgRepository::InsertRoleMember(Transaction& t, model::RoleMemberRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO role_members(role,member,seq,granted_at) "
        "VALUES($1,$2,(SELECT COALESCE(MAX(seq),0)+1 FROM role_members),$3) ON CONFLICT DO NOTHING RETURNING seq;",
        static_cast<int>(r.role), r.member.ToString(), r.granted_at);
    if (res.empty()) return Result::Err(ErrorCode::AlreadyExists);
    r.seq = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteRoleMember(Transaction& t, model::Role role, const util::Address& member) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM role_members WHERE role=$1 AND member=$2;", static_cast<int>(role), member.ToString());
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

bool PgRepository::HasRoleMember(Transaction& t, model::Role role, const util::Address& member) {
  auto res = TX(t).Work().exec_params("SELECT 1 FROM role_members WHERE role=$1 AND member=$2;", static_cast<int>(role), member.ToString());
  return !res.empty();
}

std::vector<model::RoleMemberRecord> PgRepository::ListRoleMembers(Transaction& t, model::Role role) {
  auto res = TX(t).Work().exec_params("SELECT role,member,seq,granted_at FROM role_members WHERE role=$1 ORDER BY seq ASC;", static_cast<int>(role));

  std::vector<model::RoleMemberRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::RoleMemberRecord r;
    r.role       = static_cast<model::Role>(row[0].as<int>());
    r.member     = util::Address::Parse(row[1].c_str());
    r.seq        = row[2].as<uint64_t>();
    r.granted_at = row[3].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Ledger state
// ------------------------------------------------------------------

model::LedgerStateRecord PgRepository::GetLedgerState(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT paused,total_vested,total_claimed FROM ledger_state WHERE id=1;");

  model::LedgerStateRecord r;
  if (!res.empty()) {
    r.paused        = res[0][0].as<int>() != 0;
    r.total_vested  = util::ParseAmount(res[0][1].c_str());
    r.total_claimed = util::ParseAmount(res[0][2].c_str());
  }
  return r;
}

Result PgRepository::PutLedgerState(Transaction& t, const model::LedgerStateRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO ledger_state(id,paused,total_vested,total_claimed) VALUES(1,$1,$2,$3) "
        "ON CONFLICT(id) DO UPDATE SET paused=EXCLUDED.paused,total_vested=EXCLUDED.total_vested,total_claimed=EXCLUDED.total_claimed;",
        r.paused ? 1 : 0, Text(r.total_vested), Text(r.total_claimed));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result PgRepository::AppendEvent(Transaction& t, model::EventRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("append_event", static_cast<int>(r.kind), r.subject_id, r.beneficiary.ToString(), Text(r.amount),
                                          r.actor.ToString(), r.timestamp);
    r.offset = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::EventRecord> PgRepository::ReadEvents(Transaction& t, uint64_t start_offset, std::optional<uint64_t> max_events) {
  pqxx::result res;
  if (max_events) {
    res = TX(t).Work().exec_params(
        "SELECT event_offset,kind,subject_id,beneficiary,amount,actor,event_time FROM ledger_events "
        "WHERE event_offset>=$1 ORDER BY event_offset ASC LIMIT $2;",
        start_offset, *max_events);
  } else {
    res = TX(t).Work().exec_params(
        "SELECT event_offset,kind,subject_id,beneficiary,amount,actor,event_time FROM ledger_events "
        "WHERE event_offset>=$1 ORDER BY event_offset ASC;",
        start_offset);
  }

  std::vector<model::EventRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadEvent(row));
  return out;
}

} // namespace vesting::db::postgres
