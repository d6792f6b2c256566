#pragma once

#include <compare>
#include <cstdint>

namespace vesting::model {

/*
  Sequential record id. Each ledger assigns ids from 1 upward and never
  reuses them; 0 means "absent" or "unlinked".
*/
template <typename Tag>
class SequentialId {
 public:
  constexpr SequentialId() = default;
  constexpr explicit SequentialId(std::uint64_t value) : value_(value) {
  }

  constexpr std::uint64_t value() const {
    return value_;
  }

  constexpr bool IsSet() const {
    return value_ != 0;
  }

  constexpr auto operator<=>(const SequentialId&) const = default;

 private:
  std::uint64_t value_ = 0;
};

using AllocationId = SequentialId<struct AllocationIdTag>;
using ScheduleId   = SequentialId<struct ScheduleIdTag>;
using AirdropId    = SequentialId<struct AirdropIdTag>;

} // namespace vesting::model
