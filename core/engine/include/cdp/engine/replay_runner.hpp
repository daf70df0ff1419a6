#pragma once

#include "cdp/config/protocol_config.hpp"
#include "cdp/store/i_position_store.hpp"

#include <nlohmann/json.hpp>

namespace cdp {

struct ReplayReport {
  bool applied{false};     // false: batch rejected or commit conflict
  nlohmann::json body;     // Printed by the driver
};

// -----------------------------------------------------------------------------
// runScenario(protocol, scenario, store)
// -----------------------------------------------------------------------------
//
// @brief  Seeds the store with the scenario's positions, runs its
//         operations as one batch, and commits the result.
//
// @details
// Scenario document:
//
//   {
//     "context":   { "collateral_price": "2000000000000000000000",
//                    "emergency_shutdown": false, "current_time": 0 },
//     "positions": [ { "id": "cdp-1", "owner": "alice",
//                      "collateral_type": "ETH",
//                      "collateral_amount": "2000000000000000000",
//                      "debt_amount": "0" } ],
//     "operations": [ { "kind": "mint", "cdp_id": "cdp-1",
//                       "amount": "1000000000000000000000",
//                       "actor": "alice", "timestamp": 60 } ]
//   }
//
// Positions take their CdpConfig from the protocol's template for their
// collateral type (overridable per position with a "config" object). A
// position without an explicit "state" starts Active with its current
// health factor. The context starts from the protocol limits; fields in
// "context" override them.
//
// On success body is {"status": "applied", "outcomes": [...],
// "positions": [...]}. A rejected batch yields {"status": "rejected",
// "error": {...}} and leaves the store as seeded.
//
// @throws nlohmann::json::exception or std::runtime_error for malformed
//         scenarios (missing keys, unknown collateral type or CDP id,
//         duplicate positions). Engine rejections are never thrown.
// -----------------------------------------------------------------------------
ReplayReport runScenario(const config::ProtocolConfig& protocol,
                         const nlohmann::json& scenario,
                         IPositionStore& store);

}  // namespace cdp
