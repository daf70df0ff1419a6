#pragma once

#include "cdp/domain/cdp.hpp"
#include "cdp/domain/operation.hpp"
#include "cdp/domain/result.hpp"

namespace cdp {

struct DepositOutcome {
  domain::Cdp updated_cdp;
  Amount deposited_amount{0};
  HealthFactor previous_health_factor{fixed::kMaxSentinel};
  HealthFactor new_health_factor{fixed::kMaxSentinel};
};

// -----------------------------------------------------------------------------
// executeDeposit(params, context)
// -----------------------------------------------------------------------------
//
// @brief  Adds params.amount to the CDP's collateral.
//
// @details
// Runs validateDeposit(), then returns a new CDP with
// collateral_amount + amount and state Active{new health factor}. Adding
// collateral can never trigger liquidation, so the state is always Active.
//
// @return DepositOutcome on success, the first validation error otherwise.
// -----------------------------------------------------------------------------
Result<DepositOutcome> executeDeposit(const domain::OperationParams& params,
                                      const domain::OperationContext& context);

}  // namespace cdp
