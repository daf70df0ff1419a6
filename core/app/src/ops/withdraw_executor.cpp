#include "cdp/ops/withdraw_executor.hpp"
#include "cdp/ops/executor_common.hpp"
#include "cdp/risk/health_calculator.hpp"
#include "cdp/validation/validator.hpp"

#include <utility>

namespace cdp {

Result<WithdrawOutcome> executeWithdraw(
    const domain::OperationParams& params,
    const domain::OperationContext& context) {
  auto validation = validateWithdraw(params, context);
  if (!validation) {
    return validation.error();
  }

  auto stamped = beginUpdate(domain::OperationKind::Withdraw, params);
  if (!stamped) {
    return stamped.error();
  }

  domain::Cdp updated = std::move(stamped).value();
  updated.collateral_amount -= params.amount;

  const HealthFactor new_hf = healthFactor(updated, context.collateral_price);
  updated.state = nextState(new_hf, updated.collateral_amount,
                            updated.debt_amount, updated.config);

  WithdrawOutcome outcome;
  outcome.withdrawn_amount = params.amount;
  outcome.previous_health_factor =
      healthFactor(params.cdp, context.collateral_price);
  outcome.new_health_factor = new_hf;
  outcome.remaining_available_collateral = maxWithdrawable(
      updated, context.collateral_price, context.safety_buffer_bps);
  outcome.updated_cdp = std::move(updated);
  return outcome;
}

}  // namespace cdp
