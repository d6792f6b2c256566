#pragma once

#include <array>

namespace vesting::db::sql {

/*
  Ledger schema shared by the SQLite and Postgres backends.

  IMPORTANT:
  - Written in the SQL subset both engines accept.
  - Amounts are decimal TEXT (256-bit values do not fit any native type).
  - Ids and offsets are assigned by the repository inside the writing
    transaction, never by the engine, so a rollback gives them back.
*/

inline constexpr std::array<const char*, 8> kLedgerSchema = {
    "CREATE TABLE IF NOT EXISTS allocations (id BIGINT PRIMARY KEY, amount TEXT NOT NULL, beneficiary TEXT NOT NULL, revoked SMALLINT NOT NULL, "
    "created_at BIGINT NOT NULL, airdrop_id BIGINT NOT NULL);",
    "CREATE INDEX IF NOT EXISTS allocations_by_beneficiary ON allocations(beneficiary, id);",
    "CREATE TABLE IF NOT EXISTS airdrops (id BIGINT PRIMARY KEY, executed_by TEXT NOT NULL, entry_count BIGINT NOT NULL, total_amount TEXT NOT NULL, "
    "first_allocation_id BIGINT NOT NULL, created_at BIGINT NOT NULL);",
    "CREATE TABLE IF NOT EXISTS schedules (id BIGINT PRIMARY KEY, beneficiary TEXT NOT NULL, total_amount TEXT NOT NULL, released_amount TEXT NOT NULL, "
    "start_time BIGINT NOT NULL, cliff_duration BIGINT NOT NULL, duration BIGINT NOT NULL, created_at BIGINT NOT NULL, allocation_id BIGINT NOT NULL, "
    "status SMALLINT NOT NULL);",
    "CREATE INDEX IF NOT EXISTS schedules_by_beneficiary ON schedules(beneficiary, id);",
    "CREATE TABLE IF NOT EXISTS role_members (role SMALLINT NOT NULL, member TEXT NOT NULL, seq BIGINT NOT NULL, granted_at BIGINT NOT NULL, "
    "PRIMARY KEY (role, member));",
    "CREATE TABLE IF NOT EXISTS ledger_state (id SMALLINT PRIMARY KEY, paused SMALLINT NOT NULL, total_vested TEXT NOT NULL, total_claimed TEXT NOT NULL);",
    "CREATE TABLE IF NOT EXISTS ledger_events (event_offset BIGINT PRIMARY KEY, kind SMALLINT NOT NULL, subject_id BIGINT NOT NULL, "
    "beneficiary TEXT NOT NULL, amount TEXT NOT NULL, actor TEXT NOT NULL, event_time BIGINT NOT NULL);",
};

// Probes run after bootstrap to fail fast on a schema from an older build.
inline constexpr std::array<const char*, 6> kSchemaProbes = {
    "SELECT id,amount,beneficiary,revoked,created_at,airdrop_id FROM allocations LIMIT 1;",
    "SELECT id,executed_by,entry_count,total_amount,first_allocation_id,created_at FROM airdrops LIMIT 1;",
    "SELECT id,beneficiary,total_amount,released_amount,start_time,cliff_duration,duration,created_at,allocation_id,status FROM schedules LIMIT 1;",
    "SELECT role,member,seq,granted_at FROM role_members LIMIT 1;",
    "SELECT id,paused,total_vested,total_claimed FROM ledger_state LIMIT 1;",
    "SELECT event_offset,kind,subject_id,beneficiary,amount,actor,event_time FROM ledger_events LIMIT 1;",
};

} // namespace vesting::db::sql
