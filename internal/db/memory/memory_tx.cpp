#include "memory_tx.hpp"

#include <iterator>
#include <stdexcept>

namespace vesting::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  snapshot_         = repo_.committed_;
  snapshot_events_  = repo_.events_.size();
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::runtime_error("transaction already finished");
  }
  if (!Dirty()) {
    committed_ = true;
    return;
  }

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != snapshot_version_) {
    throw std::runtime_error("transaction conflict: ledger state was modified by a concurrent transaction");
  }
  if (working_) repo_.committed_ = std::move(working_);
  repo_.events_.insert(repo_.events_.end(), std::make_move_iterator(pending_events_.begin()),
                       std::make_move_iterator(pending_events_.end()));
  pending_events_.clear();
  repo_.committed_version_++;
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  working_.reset();
  pending_events_.clear();
  rolled_back_ = true;
}

} // namespace vesting::db::memory
