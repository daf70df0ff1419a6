#pragma once

#include "cdp/domain/cdp.hpp"
#include "cdp/domain/operation.hpp"
#include "cdp/domain/result.hpp"

namespace cdp {

struct WithdrawOutcome {
  domain::Cdp updated_cdp;
  Amount withdrawn_amount{0};
  HealthFactor previous_health_factor{fixed::kMaxSentinel};
  HealthFactor new_health_factor{fixed::kMaxSentinel};
  // maxWithdrawable() of the updated CDP at the same price and buffer.
  Amount remaining_available_collateral{0};
};

// -----------------------------------------------------------------------------
// executeWithdraw(params, context)
// -----------------------------------------------------------------------------
//
// @brief  Removes params.amount from the CDP's collateral.
//
// @details
// Runs validateWithdraw() (availability, per-call limit, buffered ratio),
// then returns a new CDP with collateral_amount - amount. The new state
// follows nextState(): health factor <= 1.0 flags the position
// Liquidating, anything above stays Active with the recomputed health
// factor.
//
// remaining_available_collateral tells the caller how much more could be
// withdrawn right now without breaching min ratio + safety buffer.
// -----------------------------------------------------------------------------
Result<WithdrawOutcome> executeWithdraw(
    const domain::OperationParams& params,
    const domain::OperationContext& context);

}  // namespace cdp
