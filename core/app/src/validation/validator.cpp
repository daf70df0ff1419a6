#include "cdp/validation/validator.hpp"
#include "cdp/risk/health_calculator.hpp"

namespace cdp {

using domain::OperationKind;

// -----------------------------------------------------------------------------
// validateCommon: shutdown, authorization, amount, state
// -----------------------------------------------------------------------------
Result<void> validateCommon(OperationKind kind,
                            const domain::OperationParams& params,
                            const domain::OperationContext& context) {
  if (context.emergency_shutdown) {
    return CdpError{errors::EmergencyShutdown{}};
  }

  if (params.actor != params.cdp.owner) {
    return CdpError{errors::Unauthorized{params.cdp.owner, params.actor}};
  }

  if (kind != OperationKind::Close && params.amount == 0) {
    return CdpError{errors::InvalidAmount{params.amount}};
  }

  const domain::StateTag state = domain::stateTag(params.cdp.state);
  if (state != domain::StateTag::Active) {
    return CdpError{errors::InvalidOperationForState{kind, state}};
  }

  return Result<void>::success();
}

// -----------------------------------------------------------------------------
// validateDeposit: adding collateral only improves solvency
// -----------------------------------------------------------------------------
Result<void> validateDeposit(const domain::OperationParams& params,
                             const domain::OperationContext& context) {
  auto common = validateCommon(OperationKind::Deposit, params, context);
  if (!common) {
    return common;
  }

  if (!fixed::checkedAdd(params.cdp.collateral_amount, params.amount)) {
    return CdpError{errors::ArithmeticOverflow{OperationKind::Deposit}};
  }

  return Result<void>::success();
}

// -----------------------------------------------------------------------------
// validateWithdraw: availability, per-call limit, buffered ratio
// -----------------------------------------------------------------------------
Result<void> validateWithdraw(const domain::OperationParams& params,
                              const domain::OperationContext& context) {
  auto common = validateCommon(OperationKind::Withdraw, params, context);
  if (!common) {
    return common;
  }

  const domain::Cdp& cdp = params.cdp;

  if (params.amount > cdp.collateral_amount) {
    return CdpError{errors::InsufficientAvailableCollateral{
        cdp.collateral_amount, params.amount}};
  }

  if (params.amount > context.max_withdraw_amount) {
    return CdpError{errors::WithdrawalLimitExceeded{
        context.max_withdraw_amount, params.amount}};
  }

  const Amount required =
      requiredRatioBps(cdp.config, context.safety_buffer_bps);
  const Amount new_ratio = collateralizationRatioBps(
      cdp.collateral_amount - params.amount, cdp.debt_amount,
      context.collateral_price);
  if (new_ratio < required) {
    return CdpError{errors::BelowMinCollateralRatio{new_ratio, required}};
  }

  return Result<void>::success();
}

// -----------------------------------------------------------------------------
// validateMint: ceiling, floor, buffered ratio
// -----------------------------------------------------------------------------
Result<void> validateMint(const domain::OperationParams& params,
                          const domain::OperationContext& context) {
  auto common = validateCommon(OperationKind::Mint, params, context);
  if (!common) {
    return common;
  }

  const domain::Cdp& cdp = params.cdp;

  // A sum that wraps is necessarily above any representable ceiling.
  const auto new_debt = fixed::checkedAdd(cdp.debt_amount, params.amount);
  if (!new_debt || *new_debt > cdp.config.debt_ceiling) {
    return CdpError{errors::DebtCeilingExceeded{
        cdp.config.debt_ceiling, new_debt.value_or(fixed::kMaxSentinel)}};
  }

  if (*new_debt < cdp.config.debt_floor) {
    return CdpError{errors::DebtFloorViolated{cdp.config.debt_floor,
                                              *new_debt}};
  }

  const Amount required =
      requiredRatioBps(cdp.config, context.safety_buffer_bps);
  const Amount new_ratio = collateralizationRatioBps(
      cdp.collateral_amount, *new_debt, context.collateral_price);
  if (new_ratio < required) {
    return CdpError{errors::BelowMinCollateralRatio{new_ratio, required}};
  }

  return Result<void>::success();
}

// -----------------------------------------------------------------------------
// validateBurn: fees first, cannot overpay, cannot leave dust below the floor
// -----------------------------------------------------------------------------
Result<void> validateBurn(const domain::OperationParams& params,
                          const domain::OperationContext& context) {
  auto common = validateCommon(OperationKind::Burn, params, context);
  if (!common) {
    return common;
  }

  const domain::Cdp& cdp = params.cdp;

  const auto fees = fixed::checkedAdd(
      cdp.accrued_fees, pendingStabilityFee(cdp, params.timestamp));
  if (!fees) {
    return CdpError{errors::ArithmeticOverflow{OperationKind::Burn}};
  }

  const BurnAllocation allocation = allocateBurn(params.amount, *fees);
  if (allocation.principal_payment > cdp.debt_amount) {
    return CdpError{errors::InvalidAmount{params.amount}};
  }

  const Amount remainder = cdp.debt_amount - allocation.principal_payment;
  if (remainder != 0 && remainder < cdp.config.debt_floor) {
    return CdpError{
        errors::DebtFloorViolated{cdp.config.debt_floor, remainder}};
  }

  return Result<void>::success();
}

// -----------------------------------------------------------------------------
// validateClose: debt- and fee-free, and the release fits the per-call limit
// -----------------------------------------------------------------------------
Result<void> validateClose(const domain::OperationParams& params,
                           const domain::OperationContext& context) {
  auto common = validateCommon(OperationKind::Close, params, context);
  if (!common) {
    return common;
  }

  const domain::Cdp& cdp = params.cdp;

  const Amount fees = outstandingFees(cdp, params.timestamp);
  if (cdp.debt_amount != 0 || fees != 0) {
    return CdpError{errors::OutstandingDebt{cdp.debt_amount, fees}};
  }

  if (cdp.collateral_amount > context.max_withdraw_amount) {
    return CdpError{errors::WithdrawalLimitExceeded{
        context.max_withdraw_amount, cdp.collateral_amount}};
  }

  return Result<void>::success();
}

Result<void> validate(OperationKind kind,
                      const domain::OperationParams& params,
                      const domain::OperationContext& context) {
  switch (kind) {
    case OperationKind::Deposit:
      return validateDeposit(params, context);
    case OperationKind::Withdraw:
      return validateWithdraw(params, context);
    case OperationKind::Mint:
      return validateMint(params, context);
    case OperationKind::Burn:
      return validateBurn(params, context);
    case OperationKind::Close:
      return validateClose(params, context);
  }
  return validateCommon(kind, params, context);
}

}  // namespace cdp
