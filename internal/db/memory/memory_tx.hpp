#pragma once

#include <memory>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace vesting::db::memory {

/*
  Transaction = pinned snapshot + private write set

  Begin pins the committed tables and the journal length without copying.
  The first Mutable() copies the tables; appended events stay in a
  pending list. Commit publishes both only if no other writer committed
  since the snapshot was pinned. A transaction that never wrote commits
  without the check.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::Tables& Mutable() {
    if (!working_) working_ = std::make_unique<MemoryRepository::Tables>(*snapshot_);
    return *working_;
  }
  const MemoryRepository::Tables& View() const {
    return working_ ? *working_ : *snapshot_;
  }

  std::vector<model::EventRecord>& PendingEvents() {
    return pending_events_;
  }
  uint64_t SnapshotEvents() const {
    return snapshot_events_;
  }

 private:
  bool Dirty() const {
    return working_ != nullptr || !pending_events_.empty();
  }

  MemoryRepository&                               repo_;
  std::shared_ptr<const MemoryRepository::Tables> snapshot_;
  std::unique_ptr<MemoryRepository::Tables>       working_;
  std::vector<model::EventRecord>                 pending_events_;
  uint64_t                                        snapshot_events_  = 0;
  uint64_t                                        snapshot_version_ = 0;
  bool                                            committed_        = false;
  bool                                            rolled_back_      = false;
};

} // namespace vesting::db::memory
