#include "cdp/ops/burn_executor.hpp"
#include "cdp/ops/executor_common.hpp"
#include "cdp/risk/health_calculator.hpp"
#include "cdp/validation/validator.hpp"

#include <utility>

namespace cdp {

Result<BurnOutcome> executeBurn(const domain::OperationParams& params,
                                const domain::OperationContext& context) {
  auto validation = validateBurn(params, context);
  if (!validation) {
    return validation.error();
  }

  auto stamped = beginUpdate(domain::OperationKind::Burn, params);
  if (!stamped) {
    return stamped.error();
  }

  domain::Cdp updated = std::move(stamped).value();
  const BurnAllocation allocation =
      allocateBurn(params.amount, updated.accrued_fees);
  updated.accrued_fees -= allocation.fees_payment;
  updated.debt_amount -= allocation.principal_payment;

  // healthFactor() returns kMaxSentinel for zero debt; no division happens.
  const HealthFactor new_hf = healthFactor(updated, context.collateral_price);
  updated.state = nextState(new_hf, updated.collateral_amount,
                            updated.debt_amount, updated.config);

  BurnOutcome outcome;
  outcome.burned_amount = params.amount;
  outcome.fees_paid = allocation.fees_payment;
  outcome.principal_paid = allocation.principal_payment;
  outcome.previous_health_factor =
      healthFactor(params.cdp, context.collateral_price);
  outcome.new_health_factor = new_hf;
  outcome.updated_cdp = std::move(updated);
  return outcome;
}

}  // namespace cdp
