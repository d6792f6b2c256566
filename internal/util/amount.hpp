#pragma once

#include <string>
#include <string_view>

#include <boost/multiprecision/cpp_int.hpp>

namespace vesting::util {

/*
  Token amount in the smallest unit.

  Checked arithmetic: overflow or a negative result throws instead of
  wrapping, so a counter can never silently roll over.
*/
using Amount = boost::multiprecision::checked_uint256_t;

// Parses a base-10 string. Throws InvalidInput(kInvalidAmount) on signs,
// non-digits, empty input or values wider than 256 bits.
Amount ParseAmount(std::string_view text);

std::string ToString(const Amount& amount);

// floor(total * numerator / denominator) without intermediate overflow.
Amount MulDiv(const Amount& total, std::uint64_t numerator, std::uint64_t denominator);

} // namespace vesting::util
