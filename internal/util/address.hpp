#pragma once

#include <compare>
#include <functional>
#include <string>
#include <string_view>

namespace vesting::util {

/*
  20-byte account identifier in its canonical text form:
  "0x" followed by 40 lowercase hex digits.

  A default-constructed Address is the zero address, which stands for
  "no beneficiary".
*/
class Address {
 public:
  Address();

  // Throws InvalidInput(kInvalidAddress) on malformed text.
  static Address Parse(std::string_view text);

  const std::string& ToString() const {
    return hex_;
  }

  bool IsZero() const;

  auto operator<=>(const Address&) const = default;

 private:
  explicit Address(std::string hex) : hex_(std::move(hex)) {
  }

  std::string hex_;
};

} // namespace vesting::util

template <>
struct std::hash<vesting::util::Address> {
  std::size_t operator()(const vesting::util::Address& address) const noexcept {
    return std::hash<std::string>{}(address.ToString());
  }
};
