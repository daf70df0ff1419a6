#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cdp {

// -----------------------------------------------------------------------------
// Scalar types shared by every layer of the engine
// -----------------------------------------------------------------------------
//
// Amount:       smallest-unit fixed point with 18 decimals, held in an
//               unsigned 128-bit integer. Collateral, debt, prices and fees
//               all use this type.
// HealthFactor: an Amount in WAD units (10^18 == 1.0).
// Bps:          basis points, 10000 == 100%.
// Timestamp:    logical seconds supplied by the caller. The engine never
//               reads a clock.
// -----------------------------------------------------------------------------
using Amount = unsigned __int128;
using HealthFactor = Amount;
using Bps = std::uint32_t;
using Timestamp = std::int64_t;

namespace fixed {

constexpr Amount kScale = 1000000000000000000ULL;  // 10^18
constexpr Amount kWad = kScale;
constexpr Amount kBpsDenominator = 10000;

// Represents "unbounded" for ratios and health factors of debt-free
// positions. Never a floating infinity.
constexpr Amount kMaxSentinel = ~static_cast<Amount>(0);

// 365.25 days.
constexpr std::int64_t kSecondsPerYear = 31557600;

// -------------------------------------------------------------------------
// mulDiv(a, b, d)
// -------------------------------------------------------------------------
// @brief  floor(a * b / d) computed through a 256-bit intermediate.
//
// @return The quotient, or kMaxSentinel when it does not fit in 128 bits
//         or when d == 0.
//
// @details
// The product of two 128-bit amounts needs up to 256 bits. The
// intermediate is a boost::multiprecision::uint256_t so that no product
// ever wraps. Saturation is the correct behavior for every caller in this
// engine: an oversized ratio or health factor is "unbounded".
// -------------------------------------------------------------------------
Amount mulDiv(Amount a, Amount b, Amount d);

// -------------------------------------------------------------------------
// mulDivCeil(a, b, d)
// -------------------------------------------------------------------------
// @brief  ceil(a * b / d), saturating like mulDiv().
// -------------------------------------------------------------------------
Amount mulDivCeil(Amount a, Amount b, Amount d);

// ceil(a / b). b must be non-zero.
Amount ceilDiv(Amount a, Amount b);

// a + b, or std::nullopt when the sum would wrap.
std::optional<Amount> checkedAdd(Amount a, Amount b);

// whole * 10^18, e.g. fromWhole(2000) is 2000.0 in fixed point.
Amount fromWhole(std::uint64_t whole);

// Decimal text of a raw Amount ("2000000000000000000").
std::string toString(Amount value);

// Parses decimal digits into an Amount. Rejects empty input, signs,
// separators and values above 2^128 - 1.
std::optional<Amount> parseAmount(std::string_view text);

// Human-readable decimal rendering of a fixed-point value ("1.9"). Used
// only for log lines; trailing zeros of the fraction are trimmed.
std::string toDecimalString(Amount value);

}  // namespace fixed
}  // namespace cdp
