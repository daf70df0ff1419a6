#pragma once

#include "cdp/domain/cdp.hpp"
#include "cdp/domain/operation.hpp"
#include "cdp/domain/result.hpp"

namespace cdp {

struct BurnOutcome {
  domain::Cdp updated_cdp;
  Amount burned_amount{0};
  Amount fees_paid{0};       // Part of burned_amount that settled fees
  Amount principal_paid{0};  // Part of burned_amount that reduced debt
  HealthFactor previous_health_factor{fixed::kMaxSentinel};
  HealthFactor new_health_factor{fixed::kMaxSentinel};
};

// -----------------------------------------------------------------------------
// executeBurn(params, context)
// -----------------------------------------------------------------------------
//
// @brief  Repays params.amount, settling stability fees before principal.
//
// @details
// Fees are brought up to params.timestamp first. The amount then pays
// accrued_fees down, and whatever is left reduces debt_amount.
//
// Runs validateBurn(): the amount may not exceed debt plus outstanding
// fees, and a partial repayment may not leave a non-zero principal below
// debt_floor (repay in full, or stay at or above the floor).
//
// Repaying principal to zero yields health factor kMaxSentinel and state
// Active, not Closed: the collateral is still locked until a Close (or
// withdrawals) releases it. A partial burn that still leaves the health
// factor at or below 1.0 moves the position to Liquidating.
// -----------------------------------------------------------------------------
Result<BurnOutcome> executeBurn(const domain::OperationParams& params,
                                const domain::OperationContext& context);

}  // namespace cdp
