#pragma once

#include "cdp/domain/cdp.hpp"
#include "cdp/domain/operation.hpp"
#include "cdp/domain/result.hpp"

#include <vector>

namespace cdp {

// -----------------------------------------------------------------------------
// executeOperation(operation, context)
// -----------------------------------------------------------------------------
//
// @brief  Runs the executor matching operation.kind and converts its
//         kind-specific outcome into the uniform OperationOutcome.
// -----------------------------------------------------------------------------
Result<domain::OperationOutcome> executeOperation(
    const domain::Operation& operation,
    const domain::OperationContext& context);

// -----------------------------------------------------------------------------
// applyBatch(operations, context)
// -----------------------------------------------------------------------------
//
// @brief  Applies a sequence of operations with all-or-nothing result
//         semantics.
//
// @details
// Operations run in order. The first operation that touches a given CDP id
// runs against the snapshot it carries; every later operation on the same
// id runs against the CDP produced by the previous one, so a batch of
// [deposit, mint] on one position behaves like two sequential calls.
//
// The first validation or execution failure stops the batch and only that
// error is returned; no partial outcome list is ever produced. The index of
// the failing operation is not synthesized here; callers that need it
// track their own submission order.
//
// Persistence: this function only sequences pure executors. Committing the
// returned CDPs atomically (and rejecting them if a concurrent writer got
// there first) is the caller's job, e.g. IPositionStore::commit().
//
// @return One OperationOutcome per operation, in input order, or the first
//         CdpError. An empty batch succeeds with an empty list.
// -----------------------------------------------------------------------------
Result<std::vector<domain::OperationOutcome>> applyBatch(
    const std::vector<domain::Operation>& operations,
    const domain::OperationContext& context);

// One step of a single-CDP batch. The CDP comes from the previous step.
struct BatchStep {
  domain::OperationKind kind{domain::OperationKind::Deposit};
  Amount amount{0};
  domain::Address actor;
  Timestamp timestamp{0};
};

// Single-CDP convenience form: every step applies to the evolving
// descendant of initial.
Result<std::vector<domain::OperationOutcome>> applyBatch(
    const domain::Cdp& initial, const std::vector<BatchStep>& steps,
    const domain::OperationContext& context);

}  // namespace cdp
