#include "cdp/ops/close_executor.hpp"
#include "cdp/ops/executor_common.hpp"
#include "cdp/risk/health_calculator.hpp"
#include "cdp/validation/validator.hpp"

#include <utility>

namespace cdp {

Result<CloseOutcome> executeClose(const domain::OperationParams& params,
                                  const domain::OperationContext& context) {
  auto validation = validateClose(params, context);
  if (!validation) {
    return validation.error();
  }

  auto stamped = beginUpdate(domain::OperationKind::Close, params);
  if (!stamped) {
    return stamped.error();
  }

  domain::Cdp updated = std::move(stamped).value();

  CloseOutcome outcome;
  outcome.released_collateral = updated.collateral_amount;
  outcome.previous_health_factor =
      healthFactor(params.cdp, context.collateral_price);
  outcome.new_health_factor = fixed::kMaxSentinel;

  updated.collateral_amount = 0;
  updated.state = domain::Closed{updated.updated_at};
  outcome.updated_cdp = std::move(updated);
  return outcome;
}

}  // namespace cdp
