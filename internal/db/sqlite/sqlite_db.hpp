#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace vesting::db::sqlite {

/*
  Thin RAII wrapper around one sqlite3 connection.

  One SqliteDB per ledger file. All transactions share the connection, so
  a transaction holds the connection's tx mutex from BEGIN until it
  finishes; a second transaction on the same thread would deadlock.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (pragmas, schema, transaction control)
  void Exec(const std::string& sql);

  std::unique_lock<std::mutex> LockTransaction() {
    return std::unique_lock<std::mutex>(tx_mutex_);
  }

 private:
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace vesting::db::sqlite
