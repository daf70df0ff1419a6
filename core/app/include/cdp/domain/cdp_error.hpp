#pragma once

#include "cdp/domain/cdp.hpp"
#include "cdp/domain/cdp_state.hpp"
#include "cdp/domain/operation.hpp"
#include "cdp/math/fixed_point.hpp"

#include <string>
#include <string_view>
#include <variant>

namespace cdp {

// -----------------------------------------------------------------------------
// Error taxonomy
// -----------------------------------------------------------------------------
//
// @brief  One struct per failure reason, each carrying the values a caller
//         needs to explain or recover from it.
//
// @details
// Errors are values, not exceptions. Every validation failure is returned
// immediately inside a Result; executors only build a new CDP on the
// success path, so a failed call never leaves a partially updated
// position behind.
//
// Recoverability:
//   EmergencyShutdown         protocol-wide, not retryable.
//   Unauthorized              not retryable by the same caller.
//   InvalidOperationForState  not retryable (lifecycle moved on).
//   everything else           retryable with a different amount, or after
//                             the price moves.
//
// Ratios in BelowMinCollateralRatio are basis points.
// -----------------------------------------------------------------------------
namespace errors {

struct EmergencyShutdown {};

struct Unauthorized {
  domain::Address owner;
  domain::Address caller;
};

struct InvalidAmount {
  Amount amount{0};
};

struct InvalidOperationForState {
  domain::OperationKind operation{domain::OperationKind::Deposit};
  domain::StateTag state{domain::StateTag::Active};
};

struct InsufficientAvailableCollateral {
  Amount available{0};
  Amount requested{0};
};

struct WithdrawalLimitExceeded {
  Amount limit{0};
  Amount requested{0};
};

struct BelowMinCollateralRatio {
  Amount current{0};
  Amount minimum{0};
};

struct DebtCeilingExceeded {
  Amount ceiling{0};
  Amount requested{0};  // Total debt the operation would have produced
};

struct DebtFloorViolated {
  Amount floor{0};
  Amount remainder{0};  // Non-zero debt the operation would have left
};

// Close requested while principal or stability fees are still unpaid.
struct OutstandingDebt {
  Amount debt{0};
  Amount fees{0};  // Including fees accrued up to the request's timestamp
};

// A 128-bit sum would wrap (collateral or fee accumulation).
struct ArithmeticOverflow {
  domain::OperationKind operation{domain::OperationKind::Deposit};
};

}  // namespace errors

using CdpError = std::variant<errors::EmergencyShutdown,
                              errors::Unauthorized,
                              errors::InvalidAmount,
                              errors::InvalidOperationForState,
                              errors::InsufficientAvailableCollateral,
                              errors::WithdrawalLimitExceeded,
                              errors::BelowMinCollateralRatio,
                              errors::DebtCeilingExceeded,
                              errors::DebtFloorViolated,
                              errors::OutstandingDebt,
                              errors::ArithmeticOverflow>;

// Stable snake_case tag ("below_min_collateral_ratio"), used by the JSON
// codec and log lines.
std::string_view errorCode(const CdpError& error);

// One-line human-readable description including the carried values.
std::string describe(const CdpError& error);

bool isRetryable(const CdpError& error);

}  // namespace cdp
