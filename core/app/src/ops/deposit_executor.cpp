#include "cdp/ops/deposit_executor.hpp"
#include "cdp/ops/executor_common.hpp"
#include "cdp/risk/health_calculator.hpp"
#include "cdp/validation/validator.hpp"

#include <utility>

namespace cdp {

Result<DepositOutcome> executeDeposit(const domain::OperationParams& params,
                                      const domain::OperationContext& context) {
  auto validation = validateDeposit(params, context);
  if (!validation) {
    return validation.error();
  }

  auto stamped = beginUpdate(domain::OperationKind::Deposit, params);
  if (!stamped) {
    return stamped.error();
  }

  domain::Cdp updated = std::move(stamped).value();
  // validateDeposit() already ruled out overflow.
  updated.collateral_amount += params.amount;

  const HealthFactor new_hf = healthFactor(updated, context.collateral_price);
  updated.state = domain::Active{new_hf};

  DepositOutcome outcome;
  outcome.previous_health_factor =
      healthFactor(params.cdp, context.collateral_price);
  outcome.new_health_factor = new_hf;
  outcome.deposited_amount = params.amount;
  outcome.updated_cdp = std::move(updated);
  return outcome;
}

}  // namespace cdp
