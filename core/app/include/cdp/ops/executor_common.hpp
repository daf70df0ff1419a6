#pragma once

#include "cdp/domain/cdp.hpp"
#include "cdp/domain/operation.hpp"
#include "cdp/domain/result.hpp"

namespace cdp {

// -----------------------------------------------------------------------------
// beginUpdate(kind, params)
// -----------------------------------------------------------------------------
//
// @brief  Produces the copy of params.cdp that an executor will modify,
//         with the bookkeeping every successful operation performs.
//
// @details
// On the copy:
//   1. Stability fees accrue on the pre-operation debt for the seconds
//      between updated_at and params.timestamp, added to accrued_fees.
//   2. updated_at advances to params.timestamp (never backwards).
//   3. version is incremented.
//
// Executors call this only after validation passed. The input snapshot is
// never touched.
//
// @return The stamped copy, or ArithmeticOverflow if accrued_fees would
//         wrap.
// -----------------------------------------------------------------------------
Result<domain::Cdp> beginUpdate(domain::OperationKind kind,
                                const domain::OperationParams& params);

}  // namespace cdp
