#include "cdp/risk/health_calculator.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>

namespace cdp {

using fixed::kBpsDenominator;
using fixed::kMaxSentinel;
using fixed::kScale;
using fixed::kWad;
using fixed::mulDiv;
using fixed::mulDivCeil;

Amount collateralValue(Amount collateral, Amount price) {
  return mulDiv(collateral, price, kScale);
}

// -----------------------------------------------------------------------------
// collateralizationRatioBps
// -----------------------------------------------------------------------------
Amount collateralizationRatioBps(Amount collateral, Amount debt,
                                 Amount price) {
  if (debt == 0) {
    return kMaxSentinel;
  }
  return mulDiv(collateralValue(collateral, price), kBpsDenominator, debt);
}

Amount collateralizationRatioBps(const domain::Cdp& cdp, Amount price) {
  return collateralizationRatioBps(cdp.collateral_amount, cdp.debt_amount,
                                   price);
}

// -----------------------------------------------------------------------------
// healthFactor
// -----------------------------------------------------------------------------
HealthFactor healthFactor(Amount collateral, Amount debt, Amount price,
                          Bps liquidation_ratio) {
  if (debt == 0) {
    return kMaxSentinel;
  }
  // Collateral value discounted to the liquidation threshold, then
  // expressed per unit of debt.
  const Amount threshold_value = mulDiv(collateralValue(collateral, price),
                                        kBpsDenominator, liquidation_ratio);
  return mulDiv(threshold_value, kWad, debt);
}

HealthFactor healthFactor(const domain::Cdp& cdp, Amount price) {
  return healthFactor(cdp.collateral_amount, cdp.debt_amount, price,
                      cdp.config.liquidation_ratio);
}

Amount requiredRatioBps(const domain::CdpConfig& config,
                        Bps safety_buffer_bps) {
  return static_cast<Amount>(config.min_collateralization_ratio) +
         static_cast<Amount>(safety_buffer_bps);
}

// -----------------------------------------------------------------------------
// minCollateralFor: inverse of collateralizationRatioBps, rounded up
// -----------------------------------------------------------------------------
Amount minCollateralFor(Amount debt, Amount price, Amount required_ratio_bps) {
  if (debt == 0) {
    return 0;
  }
  if (price == 0) {
    return kMaxSentinel;
  }
  const Amount required_value =
      mulDivCeil(debt, required_ratio_bps, kBpsDenominator);
  if (required_value == kMaxSentinel) {
    return kMaxSentinel;
  }
  return mulDivCeil(required_value, kScale, price);
}

Amount maxWithdrawable(const domain::Cdp& cdp, Amount price,
                       Bps safety_buffer_bps) {
  if (cdp.debt_amount == 0) {
    return cdp.collateral_amount;
  }
  const Amount minimum =
      minCollateralFor(cdp.debt_amount, price,
                       requiredRatioBps(cdp.config, safety_buffer_bps));
  if (minimum >= cdp.collateral_amount) {
    return 0;
  }
  return cdp.collateral_amount - minimum;
}

// -----------------------------------------------------------------------------
// maxMintable: the tighter of the ratio bound and the debt ceiling
// -----------------------------------------------------------------------------
Amount maxMintable(const domain::Cdp& cdp, Amount price,
                   Bps safety_buffer_bps) {
  const Amount required = requiredRatioBps(cdp.config, safety_buffer_bps);
  const Amount ratio_bound =
      mulDiv(collateralValue(cdp.collateral_amount, price), kBpsDenominator,
             required);
  const Amount max_total_debt = std::min(ratio_bound, cdp.config.debt_ceiling);
  if (max_total_debt <= cdp.debt_amount) {
    return 0;
  }
  return max_total_debt - cdp.debt_amount;
}

Amount liquidationPrice(Amount collateral, Amount debt,
                        Bps liquidation_ratio) {
  if (debt == 0) {
    return 0;
  }
  const Amount threshold_value =
      mulDivCeil(debt, liquidation_ratio, kBpsDenominator);
  return mulDivCeil(threshold_value, kScale, collateral);
}

Amount accruedStabilityFee(Amount debt, Bps stability_fee_bps,
                           Timestamp elapsed_seconds) {
  if (debt == 0 || stability_fee_bps == 0 || elapsed_seconds <= 0) {
    return 0;
  }
  const Amount rate_time = static_cast<Amount>(stability_fee_bps) *
                           static_cast<Amount>(elapsed_seconds);
  const Amount denominator =
      kBpsDenominator * static_cast<Amount>(fixed::kSecondsPerYear);
  return mulDiv(debt, rate_time, denominator);
}

Timestamp elapsedSeconds(Timestamp from, Timestamp to) {
  if (to <= from) {
    return 0;
  }
  const std::uint64_t span =
      static_cast<std::uint64_t>(to) - static_cast<std::uint64_t>(from);
  constexpr auto kMaxElapsed =
      static_cast<std::uint64_t>(std::numeric_limits<Timestamp>::max());
  return static_cast<Timestamp>(std::min(span, kMaxElapsed));
}

Amount pendingStabilityFee(const domain::Cdp& cdp, Timestamp timestamp) {
  return accruedStabilityFee(cdp.debt_amount, cdp.config.stability_fee_bps,
                             elapsedSeconds(cdp.updated_at, timestamp));
}

Amount outstandingFees(const domain::Cdp& cdp, Timestamp timestamp) {
  const auto total = fixed::checkedAdd(cdp.accrued_fees,
                                       pendingStabilityFee(cdp, timestamp));
  return total ? *total : kMaxSentinel;
}

Amount fullClosureAmount(const domain::Cdp& cdp, Timestamp timestamp) {
  const auto total =
      fixed::checkedAdd(cdp.debt_amount, outstandingFees(cdp, timestamp));
  return total ? *total : kMaxSentinel;
}

BurnAllocation allocateBurn(Amount amount, Amount outstanding_fees) {
  BurnAllocation allocation;
  allocation.fees_payment = std::min(amount, outstanding_fees);
  allocation.principal_payment = amount - allocation.fees_payment;
  return allocation;
}

// -----------------------------------------------------------------------------
// minBurnForHealthFactor: largest debt meeting the target, plus fees
// -----------------------------------------------------------------------------
Amount minBurnForHealthFactor(const domain::Cdp& cdp, Amount price,
                              HealthFactor target_health_factor,
                              Timestamp timestamp) {
  if (target_health_factor == 0) {
    return 0;
  }
  const Amount threshold_value =
      mulDiv(collateralValue(cdp.collateral_amount, price), kBpsDenominator,
             cdp.config.liquidation_ratio);
  const Amount allowed_debt =
      mulDiv(threshold_value, kWad, target_health_factor);
  if (cdp.debt_amount <= allowed_debt) {
    return 0;
  }
  const auto total = fixed::checkedAdd(outstandingFees(cdp, timestamp),
                                       cdp.debt_amount - allowed_debt);
  return total ? *total : kMaxSentinel;
}

HealthFactor healthFactorAfterBurn(const domain::Cdp& cdp, Amount price,
                                   Amount amount, Timestamp timestamp) {
  const BurnAllocation allocation =
      allocateBurn(amount, outstandingFees(cdp, timestamp));
  const Amount principal =
      std::min(allocation.principal_payment, cdp.debt_amount);
  return healthFactor(cdp.collateral_amount, cdp.debt_amount - principal,
                      price, cdp.config.liquidation_ratio);
}

HealthFactor healthFactorAfterWithdraw(const domain::Cdp& cdp, Amount price,
                                       Amount amount) {
  const Amount withdrawn = std::min(amount, cdp.collateral_amount);
  return healthFactor(cdp.collateral_amount - withdrawn, cdp.debt_amount,
                      price, cdp.config.liquidation_ratio);
}

Amount annualBorrowingCost(Amount debt, Bps stability_fee_bps) {
  return accruedStabilityFee(debt, stability_fee_bps, fixed::kSecondsPerYear);
}

// -----------------------------------------------------------------------------
// nextState: liquidation signal
// -----------------------------------------------------------------------------
domain::CdpState nextState(HealthFactor health_factor, Amount collateral,
                           Amount debt, const domain::CdpConfig& config) {
  if (debt == 0) {
    return domain::Active{kMaxSentinel};
  }
  if (health_factor <= kHealthFactorOne) {
    return domain::Liquidating{
        liquidationPrice(collateral, debt, config.liquidation_ratio)};
  }
  return domain::Active{health_factor};
}

}  // namespace cdp
