#pragma once

#include "cdp/math/fixed_point.hpp"

namespace cdp {
namespace domain {

// -----------------------------------------------------------------------------
// CdpConfig — per-position risk parameters
// -----------------------------------------------------------------------------
//
// @brief  Immutable risk parameters attached to a CDP when it is opened.
//
// @details
// Ratios are in basis points (10000 = 100%). Debt limits are Amounts in
// the stablecoin's smallest unit. A CDP carries its own copy of the config
// for its whole lifetime; executors copy it into every updated snapshot
// unchanged.
//
// Relationship between the two ratios:
//   min_collateralization_ratio  gate for voluntary operations (withdraw,
//                                mint). Must be >= liquidation_ratio.
//   liquidation_ratio            threshold used by the health factor. A
//                                health factor of 1.0 means the position
//                                sits exactly on this ratio.
//
// The protocol config loader rejects inconsistent values (see
// ProtocolConfig::validateConfig); the engine itself trusts the CDP it is
// handed.
// -----------------------------------------------------------------------------
struct CdpConfig {
  /// Minimum ratio required after a withdraw or mint (e.g. 15000 = 150%).
  Bps min_collateralization_ratio{15000};

  /// Ratio at which the health factor equals 1.0 (e.g. 13000 = 130%).
  Bps liquidation_ratio{13000};

  /// Penalty charged by the external liquidation service. Carried, not
  /// applied, by this engine.
  Bps liquidation_penalty_bps{1300};

  /// Annual stability fee, simple interest on outstanding debt.
  Bps stability_fee_bps{0};

  /// Maximum debt this CDP may carry.
  Amount debt_ceiling{fixed::kMaxSentinel};

  /// Minimum non-zero debt this CDP may retain.
  Amount debt_floor{0};
};

}  // namespace domain
}  // namespace cdp
