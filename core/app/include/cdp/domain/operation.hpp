#pragma once

#include "cdp/domain/cdp.hpp"
#include "cdp/math/fixed_point.hpp"

#include <optional>
#include <string_view>

namespace cdp {
namespace domain {

// -----------------------------------------------------------------------------
// OperationKind
// -----------------------------------------------------------------------------
// Deposit/Withdraw move collateral, Mint/Burn move debt, Close releases the
// remaining collateral of a debt-free position and retires it.
// -----------------------------------------------------------------------------
enum class OperationKind {
  Deposit,
  Withdraw,
  Mint,
  Burn,
  Close,
};

const char* operationName(OperationKind kind);

// Inverse of operationName(). Returns std::nullopt for unknown names.
std::optional<OperationKind> parseOperationKind(std::string_view name);

// -----------------------------------------------------------------------------
// OperationContext — per-call market and protocol inputs
// -----------------------------------------------------------------------------
//
// @brief  Everything an executor needs besides the CDP and the request.
//
// @details
// Supplied by the caller for every call and never retained. The price
// comes from whatever oracle the caller trusts. current_time is the
// caller's clock; drivers use it as the default timestamp for requests
// that carry none. The executors themselves stamp updates with
// OperationParams::timestamp.
// -----------------------------------------------------------------------------
struct OperationContext {
  Amount collateral_price{0};                     // 18-dec price per unit
  Amount max_withdraw_amount{fixed::kMaxSentinel};  // Per-call cap
  Bps safety_buffer_bps{0};        // Added to min ratio for withdraw/mint
  bool emergency_shutdown{false};  // Protocol-wide halt
  Timestamp current_time{0};
};

// -----------------------------------------------------------------------------
// OperationParams — one request against one CDP
// -----------------------------------------------------------------------------
struct OperationParams {
  Cdp cdp;               // Snapshot the operation applies to
  Amount amount{0};      // Ignored by Close
  Address actor;         // Depositor / withdrawer / minter / burner
  Timestamp timestamp{0};
};

struct Operation {
  OperationKind kind{OperationKind::Deposit};
  OperationParams params;
};

// -----------------------------------------------------------------------------
// OperationOutcome — uniform result shape used by the batch executor
// -----------------------------------------------------------------------------
//
// @details
// amount holds the kind-specific moved quantity (deposited, withdrawn,
// minted, burned, or released collateral). remaining_available_collateral
// is only set for Withdraw, fees_paid only for Burn.
// -----------------------------------------------------------------------------
struct OperationOutcome {
  OperationKind kind{OperationKind::Deposit};
  Cdp updated_cdp;
  Amount amount{0};
  HealthFactor previous_health_factor{fixed::kMaxSentinel};
  HealthFactor new_health_factor{fixed::kMaxSentinel};
  std::optional<Amount> remaining_available_collateral;
  std::optional<Amount> fees_paid;
};

}  // namespace domain
}  // namespace cdp
