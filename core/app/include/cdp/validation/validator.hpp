#pragma once

#include "cdp/domain/operation.hpp"
#include "cdp/domain/result.hpp"

namespace cdp {

// -----------------------------------------------------------------------------
// Validator — pre-condition checks for every CDP operation
// -----------------------------------------------------------------------------
//
// @brief  Decides whether an operation may run against params.cdp under the
//         given context, without computing the new position.
//
// @details
// Shared checks, in order, stopping at the first failure:
//
//   1. context.emergency_shutdown            → EmergencyShutdown
//   2. params.actor != params.cdp.owner      → Unauthorized
//   3. params.amount == 0 (not for Close)    → InvalidAmount
//   4. params.cdp.state is not Active        → InvalidOperationForState
//
// The operation-specific validators run the shared checks first and then
// layer their own:
//
//   Deposit   collateral + amount must not wrap.
//   Withdraw  amount <= collateral, amount <= max_withdraw_amount, ratio
//             after withdrawal >= min ratio + safety buffer.
//   Mint      debt + amount <= debt_ceiling, debt + amount >= debt_floor,
//             ratio after mint >= min ratio + safety buffer.
//   Burn      amount <= debt, non-zero remainder >= debt_floor.
//   Close     debt == 0, collateral <= max_withdraw_amount.
//
// Thread-safety: pure functions, safe to call from any thread.
// -----------------------------------------------------------------------------

Result<void> validateCommon(domain::OperationKind kind,
                            const domain::OperationParams& params,
                            const domain::OperationContext& context);

Result<void> validateDeposit(const domain::OperationParams& params,
                             const domain::OperationContext& context);

Result<void> validateWithdraw(const domain::OperationParams& params,
                              const domain::OperationContext& context);

Result<void> validateMint(const domain::OperationParams& params,
                          const domain::OperationContext& context);

Result<void> validateBurn(const domain::OperationParams& params,
                          const domain::OperationContext& context);

Result<void> validateClose(const domain::OperationParams& params,
                           const domain::OperationContext& context);

// Dispatches to the operation-specific validator for kind.
Result<void> validate(domain::OperationKind kind,
                      const domain::OperationParams& params,
                      const domain::OperationContext& context);

}  // namespace cdp
