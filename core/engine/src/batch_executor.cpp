#include "cdp/engine/batch_executor.hpp"
#include "cdp/ops/burn_executor.hpp"
#include "cdp/ops/close_executor.hpp"
#include "cdp/ops/deposit_executor.hpp"
#include "cdp/ops/mint_executor.hpp"
#include "cdp/ops/withdraw_executor.hpp"

#include <unordered_map>
#include <utility>

namespace cdp {

namespace {

domain::OperationOutcome toOutcome(DepositOutcome&& o) {
  domain::OperationOutcome out;
  out.kind = domain::OperationKind::Deposit;
  out.updated_cdp = std::move(o.updated_cdp);
  out.amount = o.deposited_amount;
  out.previous_health_factor = o.previous_health_factor;
  out.new_health_factor = o.new_health_factor;
  return out;
}

domain::OperationOutcome toOutcome(WithdrawOutcome&& o) {
  domain::OperationOutcome out;
  out.kind = domain::OperationKind::Withdraw;
  out.updated_cdp = std::move(o.updated_cdp);
  out.amount = o.withdrawn_amount;
  out.previous_health_factor = o.previous_health_factor;
  out.new_health_factor = o.new_health_factor;
  out.remaining_available_collateral = o.remaining_available_collateral;
  return out;
}

domain::OperationOutcome toOutcome(MintOutcome&& o) {
  domain::OperationOutcome out;
  out.kind = domain::OperationKind::Mint;
  out.updated_cdp = std::move(o.updated_cdp);
  out.amount = o.minted_amount;
  out.previous_health_factor = o.previous_health_factor;
  out.new_health_factor = o.new_health_factor;
  return out;
}

domain::OperationOutcome toOutcome(BurnOutcome&& o) {
  domain::OperationOutcome out;
  out.kind = domain::OperationKind::Burn;
  out.updated_cdp = std::move(o.updated_cdp);
  out.amount = o.burned_amount;
  out.previous_health_factor = o.previous_health_factor;
  out.new_health_factor = o.new_health_factor;
  out.fees_paid = o.fees_paid;
  return out;
}

domain::OperationOutcome toOutcome(CloseOutcome&& o) {
  domain::OperationOutcome out;
  out.kind = domain::OperationKind::Close;
  out.updated_cdp = std::move(o.updated_cdp);
  out.amount = o.released_collateral;
  out.previous_health_factor = o.previous_health_factor;
  out.new_health_factor = o.new_health_factor;
  return out;
}

// Unwraps an executor result into the uniform shape, forwarding errors.
template <typename T>
Result<domain::OperationOutcome> lift(Result<T>&& result) {
  if (!result) {
    return result.error();
  }
  return toOutcome(std::move(result).value());
}

}  // namespace

// -----------------------------------------------------------------------------
// executeOperation: kind → executor dispatch
// -----------------------------------------------------------------------------
Result<domain::OperationOutcome> executeOperation(
    const domain::Operation& operation,
    const domain::OperationContext& context) {
  switch (operation.kind) {
    case domain::OperationKind::Deposit:
      return lift(executeDeposit(operation.params, context));
    case domain::OperationKind::Withdraw:
      return lift(executeWithdraw(operation.params, context));
    case domain::OperationKind::Mint:
      return lift(executeMint(operation.params, context));
    case domain::OperationKind::Burn:
      return lift(executeBurn(operation.params, context));
    case domain::OperationKind::Close:
      return lift(executeClose(operation.params, context));
  }
  // Unreachable for valid enumerators; reject rather than guess.
  return CdpError{errors::InvalidOperationForState{
      operation.kind, domain::stateTag(operation.params.cdp.state)}};
}

// -----------------------------------------------------------------------------
// applyBatch: sequential, short-circuiting, chained per CDP id
// -----------------------------------------------------------------------------
Result<std::vector<domain::OperationOutcome>> applyBatch(
    const std::vector<domain::Operation>& operations,
    const domain::OperationContext& context) {
  std::vector<domain::OperationOutcome> outcomes;
  outcomes.reserve(operations.size());

  // Latest snapshot produced so far for each CDP id in the batch.
  std::unordered_map<domain::CdpId, domain::Cdp> latest;

  for (const domain::Operation& operation : operations) {
    auto it = latest.find(operation.params.cdp.id);

    Result<domain::OperationOutcome> result = [&]() {
      if (it == latest.end()) {
        return executeOperation(operation, context);
      }
      domain::Operation chained = operation;
      chained.params.cdp = it->second;
      return executeOperation(chained, context);
    }();

    if (!result) {
      return result.error();
    }

    domain::OperationOutcome outcome = std::move(result).value();
    latest[outcome.updated_cdp.id] = outcome.updated_cdp;
    outcomes.push_back(std::move(outcome));
  }

  return outcomes;
}

Result<std::vector<domain::OperationOutcome>> applyBatch(
    const domain::Cdp& initial, const std::vector<BatchStep>& steps,
    const domain::OperationContext& context) {
  std::vector<domain::Operation> operations;
  operations.reserve(steps.size());
  for (const BatchStep& step : steps) {
    domain::Operation operation;
    operation.kind = step.kind;
    operation.params.cdp = initial;
    operation.params.amount = step.amount;
    operation.params.actor = step.actor;
    operation.params.timestamp = step.timestamp;
    operations.push_back(std::move(operation));
  }
  return applyBatch(operations, context);
}

}  // namespace cdp
