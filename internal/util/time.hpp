#pragma once

#include <atomic>
#include <cstdint>

namespace vesting::util {

/*
  Time source for every ledger decision.

  Ledger time is whole Unix seconds. Production uses SystemClock; tests
  drive ManualClock to hit cliff and end boundaries exactly.
*/
class Clock {
 public:
  virtual ~Clock() = default;

  virtual std::uint64_t NowSeconds() const = 0;
};

class SystemClock final : public Clock {
 public:
  std::uint64_t NowSeconds() const override;
};

class ManualClock final : public Clock {
 public:
  explicit ManualClock(std::uint64_t now_seconds = 0) : now_(now_seconds) {
  }

  std::uint64_t NowSeconds() const override {
    return now_.load();
  }

  void Set(std::uint64_t now_seconds) {
    now_.store(now_seconds);
  }

  void Advance(std::uint64_t seconds) {
    now_.fetch_add(seconds);
  }

 private:
  std::atomic<std::uint64_t> now_;
};

} // namespace vesting::util
