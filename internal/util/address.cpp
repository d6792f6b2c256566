#include "address.hpp"

#include <cctype>

#include "errors.hpp"

namespace vesting::util {

namespace {

constexpr std::size_t kHexDigits = 40;

const std::string& ZeroHex() {
  static const std::string zero = "0x" + std::string(kHexDigits, '0');
  return zero;
}

} // namespace

Address::Address() : hex_(ZeroHex()) {
}

Address Address::Parse(std::string_view text) {
  if (text.size() != kHexDigits + 2 || text[0] != '0' || (text[1] != 'x' && text[1] != 'X')) {
    throw InvalidInput(ErrorReason::kInvalidAddress, "address must be 0x followed by 40 hex digits: " + std::string(text));
  }

  std::string hex = "0x";
  hex.reserve(kHexDigits + 2);
  for (std::size_t i = 2; i < text.size(); ++i) {
    const auto c = static_cast<unsigned char>(text[i]);
    if (!std::isxdigit(c)) {
      throw InvalidInput(ErrorReason::kInvalidAddress, "address contains a non-hex digit: " + std::string(text));
    }
    hex.push_back(static_cast<char>(std::tolower(c)));
  }
  return Address(std::move(hex));
}

bool Address::IsZero() const {
  return hex_ == ZeroHex();
}

} // namespace vesting::util
