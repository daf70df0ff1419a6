#include "cdp/ops/mint_executor.hpp"
#include "cdp/ops/executor_common.hpp"
#include "cdp/risk/health_calculator.hpp"
#include "cdp/validation/validator.hpp"

#include <utility>

namespace cdp {

Result<MintOutcome> executeMint(const domain::OperationParams& params,
                                const domain::OperationContext& context) {
  auto validation = validateMint(params, context);
  if (!validation) {
    return validation.error();
  }

  auto stamped = beginUpdate(domain::OperationKind::Mint, params);
  if (!stamped) {
    return stamped.error();
  }

  domain::Cdp updated = std::move(stamped).value();
  // Bounded by the debt ceiling check in validateMint().
  updated.debt_amount += params.amount;

  const HealthFactor new_hf = healthFactor(updated, context.collateral_price);
  updated.state = nextState(new_hf, updated.collateral_amount,
                            updated.debt_amount, updated.config);

  MintOutcome outcome;
  outcome.minted_amount = params.amount;
  outcome.previous_health_factor =
      healthFactor(params.cdp, context.collateral_price);
  outcome.new_health_factor = new_hf;
  outcome.updated_cdp = std::move(updated);
  return outcome;
}

}  // namespace cdp
