#include "amount.hpp"

#include <stdexcept>
#include <string>

#include "errors.hpp"

namespace vesting::util {

Amount ParseAmount(std::string_view text) {
  if (text.empty()) {
    throw InvalidInput(ErrorReason::kInvalidAmount, "amount is empty");
  }

  Amount value = 0;
  try {
    for (const char c : text) {
      if (c < '0' || c > '9') {
        throw InvalidInput(ErrorReason::kInvalidAmount, "amount must be a base-10 unsigned integer: " + std::string(text));
      }
      value = value * 10 + static_cast<unsigned>(c - '0');
    }
  } catch (const std::overflow_error&) {
    throw InvalidInput(ErrorReason::kInvalidAmount, "amount exceeds 256 bits: " + std::string(text));
  }
  return value;
}

std::string ToString(const Amount& amount) {
  return amount.str();
}

Amount MulDiv(const Amount& total, std::uint64_t numerator, std::uint64_t denominator) {
  if (denominator == 0) {
    throw std::invalid_argument("MulDiv: zero denominator");
  }
  boost::multiprecision::uint512_t wide(total);
  wide *= numerator;
  wide /= denominator;
  return Amount(wide);
}

} // namespace vesting::util
