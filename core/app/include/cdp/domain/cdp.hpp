#pragma once

#include "cdp/domain/cdp_config.hpp"
#include "cdp/domain/cdp_state.hpp"
#include "cdp/math/fixed_point.hpp"

#include <cstdint>
#include <string>

namespace cdp {
namespace domain {

using CdpId = std::string;

// Actor identity (wallet address or account name). Compared byte-for-byte;
// normalization is the upstream authorization layer's job.
using Address = std::string;

// -----------------------------------------------------------------------------
// Cdp — the aggregate root
// -----------------------------------------------------------------------------
//
// @brief  A locked-collateral / borrowed-debt pair owned by one actor.
//
// @details
// A plain value type. The engine never mutates a Cdp it was handed:
// executors copy the input snapshot, apply the change to the copy, and
// return it inside an outcome. Callers replace their stored snapshot
// wholesale with the returned value.
//
// version is bumped by every successful executor. Stores use it for
// optimistic compare-and-swap so that two operations computed from the
// same snapshot cannot both commit.
//
// Ownership:
//   Owned by whoever holds it (store, caller, outcome). Safe to copy
//   between threads.
// -----------------------------------------------------------------------------
struct Cdp {
  CdpId id;                         // Unique position identifier
  Address owner;                    // Immutable after creation
  std::string collateral_type;      // Locked asset identifier (e.g. "ETH")
  Amount collateral_amount{0};      // Smallest-unit collateral
  Amount debt_amount{0};            // Smallest-unit stablecoin debt
  CdpState state{Active{}};         // Lifecycle state
  CdpConfig config;                 // Immutable risk parameters
  Amount accrued_fees{0};           // Unpaid stability fees; Burn pays these first
  Timestamp created_at{0};          // Logical creation time
  Timestamp updated_at{0};          // Logical time of the last operation
  std::uint64_t version{0};         // Incremented on every update
};

}  // namespace domain
}  // namespace cdp
