#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace vesting::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  conn_ = pool->Acquire();
  tx_   = std::make_unique<pqxx::work>(*conn_);
  // ids are MAX()+1, writers on the same schema must not interleave
  tx_->exec("SET TRANSACTION ISOLATION LEVEL SERIALIZABLE");
}

PgTransaction::~PgTransaction() {
  if (finished_) {
    return;
  }
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    VESTING_LOG_WARN("postgres rollback failed", {vesting::observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  tx_->commit();
  committed_ = true;
  finished_  = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

} // namespace vesting::db::postgres
