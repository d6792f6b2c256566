#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace vesting::db::postgres {

/*
  PgPool

  Connection pool used by PgRepository. One pool per ledger; every
  connection it hands out has search_path set to that ledger's schema,
  so both ledgers can share one database without sharing tables.

  - libpqxx connections are NOT thread-safe, a connection belongs to one
    transaction at a time.
  - Prepared statements are installed once per connection.

  Lifetime:
    Repository owns shared_ptr<PgPool>
    Transaction holds shared_ptr<pqxx::connection>; dropping it returns
    the connection to the pool
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  PgPool(std::string conninfo, std::string schema, std::size_t max_connections = 8);

  std::shared_ptr<pqxx::connection> Acquire();

  const std::string& Schema() const {
    return schema_;
  }

 private:
  void                              PrepareConnection(pqxx::connection& conn) const;
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::string schema_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace vesting::db::postgres
