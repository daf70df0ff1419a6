#include "cdp/domain/cdp_error.hpp"

#include <sstream>

namespace cdp {

namespace {

// Overload set builder for std::visit.
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace

std::string_view errorCode(const CdpError& error) {
  return std::visit(
      Overloaded{
          [](const errors::EmergencyShutdown&) -> std::string_view {
            return "emergency_shutdown";
          },
          [](const errors::Unauthorized&) -> std::string_view {
            return "unauthorized";
          },
          [](const errors::InvalidAmount&) -> std::string_view {
            return "invalid_amount";
          },
          [](const errors::InvalidOperationForState&) -> std::string_view {
            return "invalid_operation_for_state";
          },
          [](const errors::InsufficientAvailableCollateral&)
              -> std::string_view {
            return "insufficient_available_collateral";
          },
          [](const errors::WithdrawalLimitExceeded&) -> std::string_view {
            return "withdrawal_limit_exceeded";
          },
          [](const errors::BelowMinCollateralRatio&) -> std::string_view {
            return "below_min_collateral_ratio";
          },
          [](const errors::DebtCeilingExceeded&) -> std::string_view {
            return "debt_ceiling_exceeded";
          },
          [](const errors::DebtFloorViolated&) -> std::string_view {
            return "debt_floor_violated";
          },
          [](const errors::OutstandingDebt&) -> std::string_view {
            return "outstanding_debt";
          },
          [](const errors::ArithmeticOverflow&) -> std::string_view {
            return "arithmetic_overflow";
          },
      },
      error);
}

// -----------------------------------------------------------------------------
// describe: message text for logs and the replay driver
// -----------------------------------------------------------------------------
std::string describe(const CdpError& error) {
  using fixed::toString;

  std::ostringstream out;
  out << errorCode(error);

  std::visit(
      Overloaded{
          [](const errors::EmergencyShutdown&) {},
          [&out](const errors::Unauthorized& e) {
            out << ": owner=" << e.owner << " caller=" << e.caller;
          },
          [&out](const errors::InvalidAmount& e) {
            out << ": amount=" << toString(e.amount);
          },
          [&out](const errors::InvalidOperationForState& e) {
            out << ": operation=" << domain::operationName(e.operation)
                << " state=" << domain::stateName(e.state);
          },
          [&out](const errors::InsufficientAvailableCollateral& e) {
            out << ": available=" << toString(e.available)
                << " requested=" << toString(e.requested);
          },
          [&out](const errors::WithdrawalLimitExceeded& e) {
            out << ": limit=" << toString(e.limit)
                << " requested=" << toString(e.requested);
          },
          [&out](const errors::BelowMinCollateralRatio& e) {
            out << ": current=" << toString(e.current)
                << "bps minimum=" << toString(e.minimum) << "bps";
          },
          [&out](const errors::DebtCeilingExceeded& e) {
            out << ": ceiling=" << toString(e.ceiling)
                << " requested=" << toString(e.requested);
          },
          [&out](const errors::DebtFloorViolated& e) {
            out << ": floor=" << toString(e.floor)
                << " remainder=" << toString(e.remainder);
          },
          [&out](const errors::OutstandingDebt& e) {
            out << ": debt=" << toString(e.debt)
                << " fees=" << toString(e.fees);
          },
          [&out](const errors::ArithmeticOverflow& e) {
            out << ": operation=" << domain::operationName(e.operation);
          },
      },
      error);

  return out.str();
}

bool isRetryable(const CdpError& error) {
  return !(std::holds_alternative<errors::EmergencyShutdown>(error) ||
           std::holds_alternative<errors::Unauthorized>(error) ||
           std::holds_alternative<errors::InvalidOperationForState>(error));
}

}  // namespace cdp
