#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <string>

namespace vesting::db::sqlite {

using vesting::db::ErrorCode;
using vesting::db::Result;

namespace {

// Owns one prepared statement for the duration of a repository call.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
  }
  ~Statement() {
    sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }

  int Step() {
    return sqlite3_step(st_);
  }

 private:
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindAmount(sqlite3_stmt* st, int idx, const util::Amount& v) {
  BindText(st, idx, util::ToString(v));
}

void BindAddress(sqlite3_stmt* st, int idx, const util::Address& v) {
  BindText(st, idx, v.ToString());
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

util::Amount ColAmount(sqlite3_stmt* st, int col) {
  return util::ParseAmount(ColText(st, col));
}

util::Address ColAddress(sqlite3_stmt* st, int col) {
  return util::Address::Parse(ColText(st, col));
}

uint64_t NextKey(sqlite3* db, const char* sql) {
  Statement st(db, sql);
  if (st.Step() != SQLITE_ROW) {
    throw std::runtime_error(std::string("sqlite next key: ") + sqlite3_errmsg(db));
  }
  return ColU64(st.get(), 0);
}

model::AllocationRecord ReadAllocation(sqlite3_stmt* st) {
  model::AllocationRecord r;
  r.id          = ColU64(st, 0);
  r.amount      = ColAmount(st, 1);
  r.beneficiary = ColAddress(st, 2);
  r.revoked     = ColU64(st, 3) != 0;
  r.created_at  = ColU64(st, 4);
  r.airdrop_id  = ColU64(st, 5);
  return r;
}

model::ScheduleRecord ReadSchedule(sqlite3_stmt* st) {
  model::ScheduleRecord r;
  r.id              = ColU64(st, 0);
  r.beneficiary     = ColAddress(st, 1);
  r.total_amount    = ColAmount(st, 2);
  r.released_amount = ColAmount(st, 3);
  r.start_time      = ColU64(st, 4);
  r.cliff_duration  = ColU64(st, 5);
  r.duration        = ColU64(st, 6);
  r.created_at      = ColU64(st, 7);
  r.allocation_id   = ColU64(st, 8);
  r.status          = static_cast<vesting::model::ScheduleStatus>(ColU64(st, 9));
  return r;
}

model::EventRecord ReadEvent(sqlite3_stmt* st) {
  model::EventRecord r;
  r.offset      = ColU64(st, 0);
  r.kind        = static_cast<model::EventKind>(ColU64(st, 1));
  r.subject_id  = ColU64(st, 2);
  r.beneficiary = ColAddress(st, 3);
  r.amount      = ColAmount(st, 4);
  r.actor       = ColAddress(st, 5);
  r.timestamp   = ColU64(st, 6);
  return r;
}

constexpr const char* kAllocationColumns = "SELECT id,amount,beneficiary,revoked,created_at,airdrop_id FROM allocations ";
constexpr const char* kScheduleColumns =
    "SELECT id,beneficiary,total_amount,released_amount,start_time,cliff_duration,duration,created_at,allocation_id,status FROM schedules ";

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Allocations
// ------------------------------------------------------------------

Result SqliteRepository::InsertAllocation(Transaction& t, model::AllocationRecord& r) {
  auto*          db = TX(t).Handle();
  const uint64_t id = NextKey(db, "SELECT COALESCE(MAX(id),0)+1 FROM allocations;");

  Statement st(db, "INSERT INTO allocations(id,amount,beneficiary,revoked,created_at,airdrop_id) VALUES(?,?,?,?,?,?);");
  BindU64(st.get(), 1, id);
  BindAmount(st.get(), 2, r.amount);
  BindAddress(st.get(), 3, r.beneficiary);
  BindU64(st.get(), 4, r.revoked ? 1 : 0);
  BindU64(st.get(), 5, r.created_at);
  BindU64(st.get(), 6, r.airdrop_id);

  auto result = Translate(db, st.Step());
  if (result) r.id = id;
  return result;
}

std::optional<model::AllocationRecord> SqliteRepository::GetAllocation(Transaction& t, uint64_t id) {
  auto*     db = TX(t).Handle();
  Statement st(db, (std::string(kAllocationColumns) + "WHERE id=?;").c_str());
  BindU64(st.get(), 1, id);

  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return ReadAllocation(st.get());
}

Result SqliteRepository::UpdateAllocation(Transaction& t, const model::AllocationRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, "UPDATE allocations SET amount=?,revoked=?,airdrop_id=? WHERE id=?;");
  BindAmount(st.get(), 1, r.amount);
  BindU64(st.get(), 2, r.revoked ? 1 : 0);
  BindU64(st.get(), 3, r.airdrop_id);
  BindU64(st.get(), 4, r.id);

  auto result = Translate(db, st.Step());
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "allocation " + std::to_string(r.id));
  return result;
}

std::vector<model::AllocationRecord> SqliteRepository::ListAllocationsByBeneficiary(Transaction& t, const util::Address& beneficiary) {
  auto*     db = TX(t).Handle();
  Statement st(db, (std::string(kAllocationColumns) + "WHERE beneficiary=? ORDER BY id ASC;").c_str());
  BindAddress(st.get(), 1, beneficiary);

  std::vector<model::AllocationRecord> out;
  while (st.Step() == SQLITE_ROW) out.push_back(ReadAllocation(st.get()));
  return out;
}

uint64_t SqliteRepository::CountAllocations(Transaction& t) {
  return NextKey(TX(t).Handle(), "SELECT COUNT(*) FROM allocations;");
}

Result SqliteRepository::InsertAirdrop(Transaction& t, model::AirdropRecord& r) {
  auto*          db = TX(t).Handle();
  const uint64_t id = NextKey(db, "SELECT COALESCE(MAX(id),0)+1 FROM airdrops;");

  Statement st(db, "INSERT INTO airdrops(id,executed_by,entry_count,total_amount,first_allocation_id,created_at) VALUES(?,?,?,?,?,?);");
  BindU64(st.get(), 1, id);
  BindAddress(st.get(), 2, r.executed_by);
  BindU64(st.get(), 3, r.entry_count);
  BindAmount(st.get(), 4, r.total_amount);
  BindU64(st.get(), 5, r.first_allocation_id);
  BindU64(st.get(), 6, r.created_at);

  auto result = Translate(db, st.Step());
  if (result) r.id = id;
  return result;
}

std::optional<model::AirdropRecord> SqliteRepository::GetAirdrop(Transaction& t, uint64_t id) {
  auto*     db = TX(t).Handle();
  Statement st(db, "SELECT id,executed_by,entry_count,total_amount,first_allocation_id,created_at FROM airdrops WHERE id=?;");
  BindU64(st.get(), 1, id);

  if (st.Step() != SQLITE_ROW) return std::nullopt;

  model::AirdropRecord r;
  r.id                  = ColU64(st.get(), 0);
  r.executed_by         = ColAddress(st.get(), 1);
  r.entry_count         = ColU64(st.get(), 2);
  r.total_amount        = ColAmount(st.get(), 3);
  r.first_allocation_id = ColU64(st.get(), 4);
  r.created_at          = ColU64(st.get(), 5);
  return r;
}

// ------------------------------------------------------------------
// Schedules
// ------------------------------------------------------------------

Result SqliteRepository::InsertSchedule(Transaction& t, model::ScheduleRecord& r) {
  auto*          db = TX(t).Handle();
  const uint64_t id = NextKey(db, "SELECT COALESCE(MAX(id),0)+1 FROM schedules;");

  Statement st(db,
               "INSERT INTO schedules(id,beneficiary,total_amount,released_amount,start_time,cliff_duration,duration,created_at,allocation_id,status) "
               "VALUES(?,?,?,?,?,?,?,?,?,?);");
  BindU64(st.get(), 1, id);
  BindAddress(st.get(), 2, r.beneficiary);
  BindAmount(st.get(), 3, r.total_amount);
  BindAmount(st.get(), 4, r.released_amount);
  BindU64(st.get(), 5, r.start_time);
  BindU64(st.get(), 6, r.cliff_duration);
  BindU64(st.get(), 7, r.duration);
  BindU64(st.get(), 8, r.created_at);
  BindU64(st.get(), 9, r.allocation_id);
  BindU64(st.get(), 10, static_cast<uint64_t>(r.status));

  auto result = Translate(db, st.Step());
  if (result) r.id = id;
  return result;
}

std::optional<model::ScheduleRecord> SqliteRepository::GetSchedule(Transaction& t, uint64_t id) {
  auto*     db = TX(t).Handle();
  Statement st(db, (std::string(kScheduleColumns) + "WHERE id=?;").c_str());
  BindU64(st.get(), 1, id);

  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return ReadSchedule(st.get());
}

Result SqliteRepository::UpdateSchedule(Transaction& t, const model::ScheduleRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, "UPDATE schedules SET released_amount=?,status=? WHERE id=?;");
  BindAmount(st.get(), 1, r.released_amount);
  BindU64(st.get(), 2, static_cast<uint64_t>(r.status));
  BindU64(st.get(), 3, r.id);

  auto result = Translate(db, st.Step());
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "schedule " + std::to_string(r.id));
  return result;
}

std::vector<model::ScheduleRecord> SqliteRepository::ListSchedulesByBeneficiary(Transaction& t, const util::Address& beneficiary) {
  auto*     db = TX(t).Handle();
  Statement st(db, (std::string(kScheduleColumns) + "WHERE beneficiary=? ORDER BY id ASC;").c_str());
  BindAddress(st.get(), 1, beneficiary);

  std::vector<model::ScheduleRecord> out;
  while (st.Step() == SQLITE_ROW) out.push_back(ReadSchedule(st.get()));
  return out;
}

uint64_t SqliteRepository::CountSchedules(Transaction& t) {
  return NextKey(TX(t).Handle(), "SELECT COUNT(*) FROM schedules;");
}

// ------------------------------------------------------------------
// Roles
// ------------------------------------------------------------------

Result SqliteRepository::InsertRoleMember(Transaction& t, model::RoleMemberRecord& r) {
  if (HasRoleMember(t, r.role, r.member)) return Result::Err(ErrorCode::AlreadyExists);

  auto*          db  = TX(t).Handle();
  const uint64_t seq = NextKey(db, "SELECT COALESCE(MAX(seq),0)+1 FROM role_members;");

  Statement st(db, "INSERT INTO role_members(role,member,seq,granted_at) VALUES(?,?,?,?);");
  BindU64(st.get(), 1, static_cast<uint64_t>(r.role));
  BindAddress(st.get(), 2, r.member);
  BindU64(st.get(), 3, seq);
  BindU64(st.get(), 4, r.granted_at);

  auto result = Translate(db, st.Step());
  if (result) r.seq = seq;
  return result;
}

Result SqliteRepository::DeleteRoleMember(Transaction& t, model::Role role, const util::Address& member) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM role_members WHERE role=? AND member=?;");
  BindU64(st.get(), 1, static_cast<uint64_t>(role));
  BindAddress(st.get(), 2, member);

  auto result = Translate(db, st.Step());
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return result;
}

bool SqliteRepository::HasRoleMember(Transaction& t, model::Role role, const util::Address& member) {
  auto*     db = TX(t).Handle();
  Statement st(db, "SELECT 1 FROM role_members WHERE role=? AND member=?;");
  BindU64(st.get(), 1, static_cast<uint64_t>(role));
  BindAddress(st.get(), 2, member);
  return st.Step() == SQLITE_ROW;
}

std::vector<model::RoleMemberRecord> SqliteRepository::ListRoleMembers(Transaction& t, model::Role role) {
  auto*     db = TX(t).Handle();
  Statement st(db, "SELECT role,member,seq,granted_at FROM role_members WHERE role=? ORDER BY seq ASC;");
  BindU64(st.get(), 1, static_cast<uint64_t>(role));

  std::vector<model::RoleMemberRecord> out;
  while (st.Step() == SQLITE_ROW) {
    model::RoleMemberRecord r;
    r.role       = static_cast<model::Role>(ColU64(st.get(), 0));
    r.member     = ColAddress(st.get(), 1);
    r.seq        = ColU64(st.get(), 2);
    r.granted_at = ColU64(st.get(), 3);
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Ledger state
// ------------------------------------------------------------------

model::LedgerStateRecord SqliteRepository::GetLedgerState(Transaction& t) {
  auto*     db = TX(t).Handle();
  Statement st(db, "SELECT paused,total_vested,total_claimed FROM ledger_state WHERE id=1;");

  model::LedgerStateRecord r;
  if (st.Step() == SQLITE_ROW) {
    r.paused        = ColU64(st.get(), 0) != 0;
    r.total_vested  = ColAmount(st.get(), 1);
    r.total_claimed = ColAmount(st.get(), 2);
  }
  return r;
}

Result SqliteRepository::PutLedgerState(Transaction& t, const model::LedgerStateRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO ledger_state(id,paused,total_vested,total_claimed) VALUES(1,?,?,?) "
               "ON CONFLICT(id) DO UPDATE SET paused=excluded.paused,total_vested=excluded.total_vested,total_claimed=excluded.total_claimed;");
  BindU64(st.get(), 1, r.paused ? 1 : 0);
  BindAmount(st.get(), 2, r.total_vested);
  BindAmount(st.get(), 3, r.total_claimed);
  return Translate(db, st.Step());
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result SqliteRepository::AppendEvent(Transaction& t, model::EventRecord& r) {
  auto*          db     = TX(t).Handle();
  const uint64_t offset = NextKey(db, "SELECT COALESCE(MAX(event_offset),0)+1 FROM ledger_events;");

  Statement st(db, "INSERT INTO ledger_events(event_offset,kind,subject_id,beneficiary,amount,actor,event_time) VALUES(?,?,?,?,?,?,?);");
  BindU64(st.get(), 1, offset);
  BindU64(st.get(), 2, static_cast<uint64_t>(r.kind));
  BindU64(st.get(), 3, r.subject_id);
  BindAddress(st.get(), 4, r.beneficiary);
  BindAmount(st.get(), 5, r.amount);
  BindAddress(st.get(), 6, r.actor);
  BindU64(st.get(), 7, r.timestamp);

  auto result = Translate(db, st.Step());
  if (result) r.offset = offset;
  return result;
}

std::vector<model::EventRecord> SqliteRepository::ReadEvents(Transaction& t, uint64_t start_offset, std::optional<uint64_t> max_events) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "SELECT event_offset,kind,subject_id,beneficiary,amount,actor,event_time FROM ledger_events "
               "WHERE event_offset>=? ORDER BY event_offset ASC LIMIT ?;");
  BindU64(st.get(), 1, start_offset);
  // LIMIT -1 reads to the end
  sqlite3_bind_int64(st.get(), 2, max_events ? static_cast<sqlite3_int64>(*max_events) : -1);

  std::vector<model::EventRecord> out;
  while (st.Step() == SQLITE_ROW) out.push_back(ReadEvent(st.get()));
  return out;
}

} // namespace vesting::db::sqlite
