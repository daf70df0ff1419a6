#include "cdp/ops/executor_common.hpp"
#include "cdp/risk/health_calculator.hpp"

#include <algorithm>

namespace cdp {

Result<domain::Cdp> beginUpdate(domain::OperationKind kind,
                                const domain::OperationParams& params) {
  domain::Cdp updated = params.cdp;

  const Amount fee = pendingStabilityFee(updated, params.timestamp);
  const auto fees = fixed::checkedAdd(updated.accrued_fees, fee);
  if (!fees) {
    return CdpError{errors::ArithmeticOverflow{kind}};
  }

  updated.accrued_fees = *fees;
  updated.updated_at = std::max(updated.updated_at, params.timestamp);
  ++updated.version;
  return updated;
}

}  // namespace cdp
