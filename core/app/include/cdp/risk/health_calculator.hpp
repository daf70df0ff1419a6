#pragma once

#include "cdp/domain/cdp.hpp"
#include "cdp/domain/cdp_config.hpp"
#include "cdp/domain/cdp_state.hpp"
#include "cdp/math/fixed_point.hpp"

namespace cdp {

// -----------------------------------------------------------------------------
// Health / ratio calculator
// -----------------------------------------------------------------------------
//
// @brief  Pure functions deriving solvency metrics from collateral, debt,
//         price and the CDP's config.
//
// @details
// Every division rounds in the direction that never over-reports
// collateral strength: ratios and health factors round down, required
// collateral and liquidation prices round up. All products go through
// fixed::mulDiv (256-bit intermediate). A debt of zero yields
// fixed::kMaxSentinel for both the ratio and the health factor.
//
// Thread-safety: stateless, safe to call from any thread.
// -----------------------------------------------------------------------------

// Health factor of exactly 1.0. At or below this value the position is
// eligible for liquidation.
constexpr HealthFactor kHealthFactorOne = fixed::kWad;

// 1.1. Positions between kHealthFactorOne and this value stay Active but
// are one price move from liquidation. Exposed for monitoring callers; the
// executors do not reject operations based on it.
constexpr HealthFactor kBorderlineHealthFactor =
    fixed::kWad + fixed::kWad / 10;

// floor(collateral * price / 10^18), in stablecoin smallest units.
Amount collateralValue(Amount collateral, Amount price);

// -------------------------------------------------------------------------
// collateralizationRatioBps(collateral, debt, price)
// -------------------------------------------------------------------------
// @brief  floor(collateralValue * 10000 / debt).
//
// @return Ratio in basis points, or kMaxSentinel when debt == 0.
// -------------------------------------------------------------------------
Amount collateralizationRatioBps(Amount collateral, Amount debt, Amount price);
Amount collateralizationRatioBps(const domain::Cdp& cdp, Amount price);

// -------------------------------------------------------------------------
// healthFactor(collateral, debt, price, liquidation_ratio)
// -------------------------------------------------------------------------
// @brief  (collateralValue * 10000 / liquidation_ratio) / debt, in WAD.
//
// @return kHealthFactorOne when the position sits exactly on the
//         liquidation ratio; kMaxSentinel when debt == 0.
// -------------------------------------------------------------------------
HealthFactor healthFactor(Amount collateral, Amount debt, Amount price,
                          Bps liquidation_ratio);
HealthFactor healthFactor(const domain::Cdp& cdp, Amount price);

// min_collateralization_ratio + safety_buffer, in basis points.
Amount requiredRatioBps(const domain::CdpConfig& config, Bps safety_buffer_bps);

// -------------------------------------------------------------------------
// minCollateralFor(debt, price, required_ratio_bps)
// -------------------------------------------------------------------------
// @brief  Smallest collateral amount whose collateralizationRatioBps() is
//         >= required_ratio_bps.
//
// @details
// Two ceilings: ceil(ceil(debt * required / 10000) * 10^18 / price).
// One unit less collateral drops the floored ratio below the requirement.
// Returns 0 for zero debt and kMaxSentinel for a zero price with
// outstanding debt (no amount of worthless collateral suffices).
// -------------------------------------------------------------------------
Amount minCollateralFor(Amount debt, Amount price, Amount required_ratio_bps);

// -------------------------------------------------------------------------
// maxWithdrawable(cdp, price, safety_buffer_bps)
// -------------------------------------------------------------------------
// @brief  Largest withdrawal that keeps the ratio at or above
//         min_collateralization_ratio + safety_buffer_bps.
//
// @details
// Debt-free positions may withdraw everything. Otherwise the result is
// collateral - minCollateralFor(...), floored at zero. The per-call
// OperationContext::max_withdraw_amount cap is NOT applied here.
// -------------------------------------------------------------------------
Amount maxWithdrawable(const domain::Cdp& cdp, Amount price,
                       Bps safety_buffer_bps);

// -------------------------------------------------------------------------
// maxMintable(cdp, price, safety_buffer_bps)
// -------------------------------------------------------------------------
// @brief  Largest mint that keeps the ratio at or above the required ratio
//         and the total debt at or below the debt ceiling.
//
// @details
// The debt floor is not folded in: a result below
// debt_floor - debt_amount means no mint is currently possible.
// -------------------------------------------------------------------------
Amount maxMintable(const domain::Cdp& cdp, Amount price,
                   Bps safety_buffer_bps);

// -------------------------------------------------------------------------
// liquidationPrice(collateral, debt, liquidation_ratio)
// -------------------------------------------------------------------------
// @brief  Collateral price at which the health factor reaches 1.0,
//         rounded up.
//
// @return 0 for zero debt, kMaxSentinel for zero collateral with debt.
// -------------------------------------------------------------------------
Amount liquidationPrice(Amount collateral, Amount debt, Bps liquidation_ratio);

// -------------------------------------------------------------------------
// accruedStabilityFee(debt, stability_fee_bps, elapsed_seconds)
// -------------------------------------------------------------------------
// @brief  Simple-interest fee on debt for the elapsed period:
//         debt * fee_bps * elapsed / (10000 * seconds_per_year).
//
// @details
// Non-positive elapsed time accrues nothing, so an out-of-order timestamp
// can never reduce the fee total.
// -------------------------------------------------------------------------
Amount accruedStabilityFee(Amount debt, Bps stability_fee_bps,
                           Timestamp elapsed_seconds);

// Seconds from `from` to `to`, or 0 when `to` is not later. Computed in
// unsigned arithmetic and clamped to the int64 range, so any pair of
// timestamps is accepted.
Timestamp elapsedSeconds(Timestamp from, Timestamp to);

// Fee accrued on cdp.debt_amount between cdp.updated_at and timestamp.
Amount pendingStabilityFee(const domain::Cdp& cdp, Timestamp timestamp);

// accrued_fees + pendingStabilityFee(), saturating at kMaxSentinel.
Amount outstandingFees(const domain::Cdp& cdp, Timestamp timestamp);

// -------------------------------------------------------------------------
// fullClosureAmount(cdp, timestamp)
// -------------------------------------------------------------------------
// @brief  Burn amount that settles every fee and all principal at
//         timestamp, leaving the position ready for Close.
// -------------------------------------------------------------------------
Amount fullClosureAmount(const domain::Cdp& cdp, Timestamp timestamp);

// Split of a burn amount: fees are paid first, the rest reduces principal.
struct BurnAllocation {
  Amount fees_payment{0};
  Amount principal_payment{0};
};

BurnAllocation allocateBurn(Amount amount, Amount outstanding_fees);

// -------------------------------------------------------------------------
// minBurnForHealthFactor(cdp, price, target_health_factor, timestamp)
// -------------------------------------------------------------------------
// @brief  Smallest burn after which healthFactor() >= target.
//
// @details
// Because fees are paid first, the result includes every outstanding fee
// whenever principal has to come down. Returns 0 if the position already
// meets the target or the target is 0. The debt floor is not folded in.
// -------------------------------------------------------------------------
Amount minBurnForHealthFactor(const domain::Cdp& cdp, Amount price,
                              HealthFactor target_health_factor,
                              Timestamp timestamp);

// Health factor once `amount` is burned at timestamp (principal part only).
HealthFactor healthFactorAfterBurn(const domain::Cdp& cdp, Amount price,
                                   Amount amount, Timestamp timestamp);

// Health factor once `amount` of collateral is withdrawn.
HealthFactor healthFactorAfterWithdraw(const domain::Cdp& cdp, Amount price,
                                       Amount amount);

// Stability fee one year of `debt` costs at stability_fee_bps.
Amount annualBorrowingCost(Amount debt, Bps stability_fee_bps);

// -------------------------------------------------------------------------
// nextState(health_factor, collateral, debt, config)
// -------------------------------------------------------------------------
// @brief  Post-operation state rule shared by Withdraw, Mint and Burn.
//
// @details
//   debt == 0                → Active{kMaxSentinel}
//   health_factor <= 1.0     → Liquidating{liquidationPrice(...)}
//   otherwise                → Active{health_factor}
// The 1.0 to 1.1 band stays Active.
// -------------------------------------------------------------------------
domain::CdpState nextState(HealthFactor health_factor, Amount collateral,
                           Amount debt, const domain::CdpConfig& config);

}  // namespace cdp
