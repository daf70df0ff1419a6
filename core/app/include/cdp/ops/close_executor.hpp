#pragma once

#include "cdp/domain/cdp.hpp"
#include "cdp/domain/operation.hpp"
#include "cdp/domain/result.hpp"

namespace cdp {

struct CloseOutcome {
  domain::Cdp updated_cdp;
  Amount released_collateral{0};
  HealthFactor previous_health_factor{fixed::kMaxSentinel};
  HealthFactor new_health_factor{fixed::kMaxSentinel};
};

// -----------------------------------------------------------------------------
// executeClose(params, context)
// -----------------------------------------------------------------------------
//
// @brief  Releases all remaining collateral of a fully repaid CDP and
//         retires it as Closed{params.timestamp}.
//
// @details
// params.amount is ignored. Fails with OutstandingDebt while any principal
// or stability fee remains unpaid (burn fullClosureAmount() first), and
// with WithdrawalLimitExceeded when the collateral to release is above the
// per-call limit (withdraw part of it first).
// -----------------------------------------------------------------------------
Result<CloseOutcome> executeClose(const domain::OperationParams& params,
                                  const domain::OperationContext& context);

}  // namespace cdp
