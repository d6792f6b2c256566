#include "reentrancy_guard.hpp"

#include "internal/util/errors.hpp"

namespace vesting::core {

ReentrancyGuard::Scope::Scope(ReentrancyGuard& guard) : guard_(guard) {
  if (guard_.HeldByCurrentThread()) {
    throw util::StateConflict(util::ErrorReason::kReentrantCall, guard_.name_ + " is already executing on this thread");
  }
  guard_.mutex_.lock();
  guard_.owner_.store(std::this_thread::get_id());
}

ReentrancyGuard::Scope::~Scope() {
  guard_.owner_.store(std::thread::id{});
  guard_.mutex_.unlock();
}

} // namespace vesting::core
