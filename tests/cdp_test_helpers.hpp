#pragma once

// =============================================================================
// cdp_test_helpers.hpp
// =============================================================================
// Builders shared by the engine test suites. Every amount is in raw 18-dec
// fixed point; whole() and milli() keep the literals readable.
// =============================================================================

#include "cdp/domain/cdp.hpp"
#include "cdp/domain/cdp_error.hpp"
#include "cdp/domain/operation.hpp"
#include "cdp/math/fixed_point.hpp"

#include <string>
#include <variant>

namespace cdp_test {

using cdp::Amount;

inline Amount whole(std::uint64_t n) { return cdp::fixed::fromWhole(n); }

// n / 1000 of one unit, e.g. milli(470) == 0.47.
inline Amount milli(std::uint64_t n) {
  return static_cast<Amount>(n) * (cdp::fixed::kScale / 1000);
}

inline const std::string kOwner = "alice";
inline const std::string kStranger = "mallory";

inline cdp::domain::CdpConfig defaultConfig() {
  cdp::domain::CdpConfig config;
  config.min_collateralization_ratio = 15000;
  config.liquidation_ratio = 13000;
  config.liquidation_penalty_bps = 1300;
  config.stability_fee_bps = 0;
  return config;
}

inline cdp::domain::Cdp makeCdp(Amount collateral, Amount debt,
                                cdp::domain::CdpConfig config = defaultConfig(),
                                const std::string& id = "cdp-1") {
  cdp::domain::Cdp cdp;
  cdp.id = id;
  cdp.owner = kOwner;
  cdp.collateral_type = "ETH";
  cdp.collateral_amount = collateral;
  cdp.debt_amount = debt;
  cdp.config = config;
  cdp.created_at = 0;
  cdp.updated_at = 0;
  return cdp;
}

inline cdp::domain::OperationContext makeContext(Amount price,
                                                 cdp::Bps buffer = 0) {
  cdp::domain::OperationContext context;
  context.collateral_price = price;
  context.safety_buffer_bps = buffer;
  return context;
}

inline cdp::domain::OperationParams makeParams(const cdp::domain::Cdp& cdp,
                                               Amount amount,
                                               const std::string& actor = kOwner,
                                               cdp::Timestamp timestamp = 0) {
  cdp::domain::OperationParams params;
  params.cdp = cdp;
  params.amount = amount;
  params.actor = actor;
  params.timestamp = timestamp;
  return params;
}

inline cdp::domain::Operation makeOp(cdp::domain::OperationKind kind,
                                     const cdp::domain::Cdp& cdp, Amount amount,
                                     cdp::Timestamp timestamp = 0) {
  return cdp::domain::Operation{kind, makeParams(cdp, amount, kOwner, timestamp)};
}

// True if error holds alternative E.
template <typename E>
bool holds(const cdp::CdpError& error) {
  return std::holds_alternative<E>(error);
}

}  // namespace cdp_test
