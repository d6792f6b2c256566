#include "pg_pool.hpp"

namespace vesting::db::postgres {

PgPool::PgPool(std::string conninfo, std::string schema, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      schema_(schema.empty() ? "public" : std::move(schema)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareConnection(*conn);
          return Wrap(conn.release());
        } catch (const std::exception&) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareConnection(pqxx::connection& conn) const {
  {
    pqxx::nontransaction setup(conn);
    setup.exec("CREATE SCHEMA IF NOT EXISTS " + setup.quote_name(schema_));
    setup.exec("SET search_path TO " + setup.quote_name(schema_));
  }

  conn.prepare("get_allocation",
               "SELECT id,amount,beneficiary,revoked,created_at,airdrop_id "
               "FROM allocations WHERE id=$1");

  conn.prepare("insert_allocation",
               "INSERT INTO allocations(id,amount,beneficiary,revoked,created_at,airdrop_id) "
               "VALUES((SELECT COALESCE(MAX(id),0)+1 FROM allocations),$1,$2,$3,$4,$5) RETURNING id");

  conn.prepare("update_allocation", "UPDATE allocations SET amount=$2,revoked=$3,airdrop_id=$4 WHERE id=$1");

  conn.prepare("get_schedule",
               "SELECT id,beneficiary,total_amount,released_amount,start_time,cliff_duration,duration,created_at,allocation_id,status "
               "FROM schedules WHERE id=$1");

  conn.prepare("insert_schedule",
               "INSERT INTO schedules(id,beneficiary,total_amount,released_amount,start_time,cliff_duration,duration,created_at,allocation_id,status) "
               "VALUES((SELECT COALESCE(MAX(id),0)+1 FROM schedules),$1,$2,$3,$4,$5,$6,$7,$8,$9) RETURNING id");

  conn.prepare("update_schedule", "UPDATE schedules SET released_amount=$2,status=$3 WHERE id=$1");

  conn.prepare("append_event",
               "INSERT INTO ledger_events(event_offset,kind,subject_id,beneficiary,amount,actor,event_time) "
               "VALUES((SELECT COALESCE(MAX(event_offset),0)+1 FROM ledger_events),$1,$2,$3,$4,$5,$6) RETURNING event_offset");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace vesting::db::postgres
