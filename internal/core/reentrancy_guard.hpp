#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <thread>

namespace vesting::core {

/*
  Whole-ledger mutual exclusion for mutating entry points.

  Other threads queue on the mutex. The thread that already holds it gets
  StateConflict(kReentrantCall) instead of deadlocking, which is how a
  token callback into a running claim is rejected.
*/
class ReentrancyGuard {
 public:
  explicit ReentrancyGuard(std::string name) : name_(std::move(name)) {
  }

  ReentrancyGuard(const ReentrancyGuard&)            = delete;
  ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;

  class Scope {
   public:
    explicit Scope(ReentrancyGuard& guard);
    ~Scope();

    Scope(const Scope&)            = delete;
    Scope& operator=(const Scope&) = delete;

   private:
    ReentrancyGuard& guard_;
  };

  bool HeldByCurrentThread() const {
    return owner_.load() == std::this_thread::get_id();
  }

 private:
  std::string                  name_;
  std::mutex                   mutex_;
  std::atomic<std::thread::id> owner_{};
};

} // namespace vesting::core
