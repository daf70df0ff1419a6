#pragma once

#include "cdp/math/fixed_point.hpp"

#include <variant>

namespace cdp {
namespace domain {

// -----------------------------------------------------------------------------
// CdpState — position lifecycle as a sum type
// -----------------------------------------------------------------------------
//
// @brief  The three lifecycle states of a CDP, each carrying its own data.
//
// @details
// Legal transitions:
//
//   Active ──────────> Liquidating ──────> Closed
//     │                                      ▲
//     └──────────────────────────────────────┘
//
//   Active       → Active (recomputed health factor), Liquidating, Closed
//   Liquidating  → Closed (external liquidation settles the position)
//   Closed       → (none, terminal)
//
// Only Active accepts Deposit/Withdraw/Mint/Burn/Close. Every site that
// inspects the state uses std::visit or stateTag() with a switch that
// names all three alternatives, so adding a state is a compile error
// everywhere it matters.
// -----------------------------------------------------------------------------
struct Active {
  HealthFactor health_factor{fixed::kMaxSentinel};
};

struct Liquidating {
  // Collateral price at which the health factor reaches 1.0, rounded up.
  Amount liquidation_price{0};
};

struct Closed {
  Timestamp closed_at{0};
};

using CdpState = std::variant<Active, Liquidating, Closed>;

// Data-free discriminator, used by errors and log lines.
enum class StateTag {
  Active,
  Liquidating,
  Closed,
};

inline bool operator==(const Active& a, const Active& b) {
  return a.health_factor == b.health_factor;
}
inline bool operator!=(const Active& a, const Active& b) { return !(a == b); }

inline bool operator==(const Liquidating& a, const Liquidating& b) {
  return a.liquidation_price == b.liquidation_price;
}
inline bool operator!=(const Liquidating& a, const Liquidating& b) {
  return !(a == b);
}

inline bool operator==(const Closed& a, const Closed& b) {
  return a.closed_at == b.closed_at;
}
inline bool operator!=(const Closed& a, const Closed& b) { return !(a == b); }

StateTag stateTag(const CdpState& state);

const char* stateName(StateTag tag);

// -------------------------------------------------------------------------
// canTransition(current, next)
// -------------------------------------------------------------------------
// @brief  Validates a state change against the lifecycle graph above.
//
// @return true if the transition is permitted. Active → Active is legal
//         (health factor refresh); nothing leaves Closed.
// -------------------------------------------------------------------------
bool canTransition(StateTag current, StateTag next);

}  // namespace domain
}  // namespace cdp
