#pragma once

#include "cdp/domain/cdp.hpp"
#include "cdp/domain/operation.hpp"
#include "cdp/domain/result.hpp"

namespace cdp {

struct MintOutcome {
  domain::Cdp updated_cdp;
  Amount minted_amount{0};
  HealthFactor previous_health_factor{fixed::kMaxSentinel};
  HealthFactor new_health_factor{fixed::kMaxSentinel};
};

// -----------------------------------------------------------------------------
// executeMint(params, context)
// -----------------------------------------------------------------------------
//
// @brief  Issues params.amount of new stablecoin debt against the CDP.
//
// @details
// Runs validateMint() (debt ceiling, debt floor, buffered ratio against
// min_collateralization_ratio). That ratio check is the binding constraint
// for new debt; the state rule afterwards is the same as Withdraw's.
// -----------------------------------------------------------------------------
Result<MintOutcome> executeMint(const domain::OperationParams& params,
                                const domain::OperationContext& context);

}  // namespace cdp
