#include "cdp/math/fixed_point.hpp"

#include <boost/multiprecision/cpp_int.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>

namespace cdp {
namespace fixed {

namespace {

using boost::multiprecision::uint256_t;

constexpr std::uint64_t kLow64 = std::numeric_limits<std::uint64_t>::max();

// Builds the 256-bit value from the two 64-bit halves. Going through
// uint64_t keeps the conversion independent of Boost's __int128 support.
uint256_t widen(Amount value) {
  uint256_t wide = static_cast<std::uint64_t>(value >> 64);
  wide <<= 64;
  wide |= static_cast<std::uint64_t>(value & kLow64);
  return wide;
}

Amount narrow(const uint256_t& wide) {
  static const uint256_t kLimit = widen(kMaxSentinel);
  if (wide > kLimit) {
    return kMaxSentinel;
  }
  const uint256_t high = wide >> 64;
  const uint256_t low = wide & uint256_t(kLow64);
  const auto hi = high.convert_to<std::uint64_t>();
  const auto lo = low.convert_to<std::uint64_t>();
  return (static_cast<Amount>(hi) << 64) | static_cast<Amount>(lo);
}

}  // namespace

// -----------------------------------------------------------------------------
// mulDiv: floor(a * b / d), saturating
// -----------------------------------------------------------------------------
Amount mulDiv(Amount a, Amount b, Amount d) {
  if (d == 0) {
    return kMaxSentinel;
  }
  if (a == 0 || b == 0) {
    return 0;
  }
  return narrow(widen(a) * widen(b) / widen(d));
}

// -----------------------------------------------------------------------------
// mulDivCeil: ceil(a * b / d), saturating
// -----------------------------------------------------------------------------
Amount mulDivCeil(Amount a, Amount b, Amount d) {
  if (d == 0) {
    return kMaxSentinel;
  }
  if (a == 0 || b == 0) {
    return 0;
  }
  const uint256_t product = widen(a) * widen(b);
  const uint256_t divisor = widen(d);
  uint256_t quotient = product / divisor;
  if (product % divisor != 0) {
    ++quotient;
  }
  return narrow(quotient);
}

Amount ceilDiv(Amount a, Amount b) {
  return a / b + (a % b != 0 ? 1 : 0);
}

std::optional<Amount> checkedAdd(Amount a, Amount b) {
  if (a > kMaxSentinel - b) {
    return std::nullopt;
  }
  return a + b;
}

Amount fromWhole(std::uint64_t whole) {
  return static_cast<Amount>(whole) * kScale;
}

// -----------------------------------------------------------------------------
// toString: base-10 rendering (std::to_string has no __int128 overload)
// -----------------------------------------------------------------------------
std::string toString(Amount value) {
  if (value == 0) {
    return "0";
  }
  std::string digits;
  while (value != 0) {
    digits.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
    value /= 10;
  }
  std::reverse(digits.begin(), digits.end());
  return digits;
}

std::optional<Amount> parseAmount(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  Amount value = 0;
  for (char c : text) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    const auto digit = static_cast<Amount>(c - '0');
    if (value > (kMaxSentinel - digit) / 10) {
      return std::nullopt;
    }
    value = value * 10 + digit;
  }
  return value;
}

std::string toDecimalString(Amount value) {
  if (value == kMaxSentinel) {
    return "max";
  }
  std::string result = toString(value / kScale);
  std::string fraction = toString(value % kScale);
  if (fraction == "0") {
    return result;
  }
  fraction.insert(0, 18 - fraction.size(), '0');
  while (!fraction.empty() && fraction.back() == '0') {
    fraction.pop_back();
  }
  return result + "." + fraction;
}

}  // namespace fixed
}  // namespace cdp
