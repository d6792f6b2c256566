#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace vesting::db::memory {

MemoryRepository::MemoryRepository() : committed_(std::make_shared<const Tables>()) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

static void IndexId(std::vector<uint64_t>& ids, uint64_t id) {
  // ids are handed out in ascending order, so this is an append
  ids.insert(std::upper_bound(ids.begin(), ids.end(), id), id);
}

static void UnindexId(MemoryRepository::IdIndex& index, const util::Address& key, uint64_t id) {
  auto it = index.find(key);
  if (it == index.end()) return;
  auto& ids = it->second;
  ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
  if (ids.empty()) index.erase(it);
}

template <typename Record, typename Rows>
static std::vector<Record> Lookup(const MemoryRepository::IdIndex& index, const Rows& rows, const util::Address& key) {
  std::vector<Record> out;
  auto                it = index.find(key);
  if (it == index.end()) return out;
  out.reserve(it->second.size());
  for (uint64_t id : it->second) out.push_back(rows.at(id));
  return out;
}

// ------------------------------------------------------------------
// Allocations
// ------------------------------------------------------------------

Result MemoryRepository::InsertAllocation(Transaction& t, model::AllocationRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_allocation_id++;
  s.allocations[r.id] = r;
  IndexId(s.allocations_by_beneficiary[r.beneficiary], r.id);
  return Result::Ok();
}

std::optional<model::AllocationRecord> MemoryRepository::GetAllocation(Transaction& t, uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.allocations.find(id);
  if (it == s.allocations.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateAllocation(Transaction& t, const model::AllocationRecord& r) {
  if (!TX(t).View().allocations.contains(r.id)) return Result::Err(ErrorCode::NotFound, "allocation " + std::to_string(r.id));
  auto& s   = TX(t).Mutable();
  auto& row = s.allocations.at(r.id);
  if (row.beneficiary != r.beneficiary) {
    UnindexId(s.allocations_by_beneficiary, row.beneficiary, r.id);
    IndexId(s.allocations_by_beneficiary[r.beneficiary], r.id);
  }
  row = r;
  return Result::Ok();
}

std::vector<model::AllocationRecord> MemoryRepository::ListAllocationsByBeneficiary(Transaction& t, const util::Address& beneficiary) {
  const auto& s = TX(t).View();
  return Lookup<model::AllocationRecord>(s.allocations_by_beneficiary, s.allocations, beneficiary);
}

uint64_t MemoryRepository::CountAllocations(Transaction& t) {
  return TX(t).View().allocations.size();
}

Result MemoryRepository::InsertAirdrop(Transaction& t, model::AirdropRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_airdrop_id++;
  s.airdrops[r.id] = r;
  return Result::Ok();
}

std::optional<model::AirdropRecord> MemoryRepository::GetAirdrop(Transaction& t, uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.airdrops.find(id);
  if (it == s.airdrops.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------------
// Schedules
// ------------------------------------------------------------------

Result MemoryRepository::InsertSchedule(Transaction& t, model::ScheduleRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_schedule_id++;
  s.schedules[r.id] = r;
  IndexId(s.schedules_by_beneficiary[r.beneficiary], r.id);
  return Result::Ok();
}

std::optional<model::ScheduleRecord> MemoryRepository::GetSchedule(Transaction& t, uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.schedules.find(id);
  if (it == s.schedules.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateSchedule(Transaction& t, const model::ScheduleRecord& r) {
  if (!TX(t).View().schedules.contains(r.id)) return Result::Err(ErrorCode::NotFound, "schedule " + std::to_string(r.id));
  auto& s   = TX(t).Mutable();
  auto& row = s.schedules.at(r.id);
  if (row.beneficiary != r.beneficiary) {
    UnindexId(s.schedules_by_beneficiary, row.beneficiary, r.id);
    IndexId(s.schedules_by_beneficiary[r.beneficiary], r.id);
  }
  row = r;
  return Result::Ok();
}

std::vector<model::ScheduleRecord> MemoryRepository::ListSchedulesByBeneficiary(Transaction& t, const util::Address& beneficiary) {
  const auto& s = TX(t).View();
  return Lookup<model::ScheduleRecord>(s.schedules_by_beneficiary, s.schedules, beneficiary);
}

uint64_t MemoryRepository::CountSchedules(Transaction& t) {
  return TX(t).View().schedules.size();
}

// ------------------------------------------------------------------
// Roles
// ------------------------------------------------------------------

Result MemoryRepository::InsertRoleMember(Transaction& t, model::RoleMemberRecord& r) {
  if (HasRoleMember(t, r.role, r.member)) return Result::Err(ErrorCode::AlreadyExists);
  auto& s = TX(t).Mutable();
  r.seq   = s.next_role_seq++;
  s.roles.push_back(r);
  return Result::Ok();
}

Result MemoryRepository::DeleteRoleMember(Transaction& t, model::Role role, const util::Address& member) {
  auto& roles = TX(t).Mutable().roles;
  auto  it    = std::find_if(roles.begin(), roles.end(), [&](const auto& r) { return r.role == role && r.member == member; });
  if (it == roles.end()) return Result::Err(ErrorCode::NotFound);
  roles.erase(it);
  return Result::Ok();
}

bool MemoryRepository::HasRoleMember(Transaction& t, model::Role role, const util::Address& member) {
  const auto& roles = TX(t).View().roles;
  return std::any_of(roles.begin(), roles.end(), [&](const auto& r) { return r.role == role && r.member == member; });
}

std::vector<model::RoleMemberRecord> MemoryRepository::ListRoleMembers(Transaction& t, model::Role role) {
  std::vector<model::RoleMemberRecord> out;
  for (const auto& r : TX(t).View().roles) {
    if (r.role == role) out.push_back(r);
  }
  return out;
}

// ------------------------------------------------------------------
// Ledger state
// ------------------------------------------------------------------

model::LedgerStateRecord MemoryRepository::GetLedgerState(Transaction& t) {
  return TX(t).View().ledger_state;
}

Result MemoryRepository::PutLedgerState(Transaction& t, const model::LedgerStateRecord& r) {
  TX(t).Mutable().ledger_state = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result MemoryRepository::AppendEvent(Transaction& t, model::EventRecord& r) {
  auto& tx      = TX(t);
  auto& pending = tx.PendingEvents();
  r.offset      = tx.SnapshotEvents() + pending.size() + 1;
  pending.push_back(r);
  return Result::Ok();
}

std::vector<model::EventRecord> MemoryRepository::ReadEvents(Transaction& t, uint64_t start_offset, std::optional<uint64_t> max_events) {
  auto&                           tx      = TX(t);
  const auto&                     pending = tx.PendingEvents();
  const uint64_t                  pinned  = tx.SnapshotEvents();
  const uint64_t                  last    = pinned + pending.size();
  std::vector<model::EventRecord> out;

  uint64_t offset = std::max<uint64_t>(start_offset, 1);
  {
    std::scoped_lock lock(mutex_);
    for (; offset <= pinned; ++offset) {
      if (max_events && out.size() >= *max_events) return out;
      out.push_back(events_[offset - 1]);
    }
  }
  for (; offset <= last; ++offset) {
    if (max_events && out.size() >= *max_events) break;
    out.push_back(pending[offset - pinned - 1]);
  }
  return out;
}

} // namespace vesting::db::memory
