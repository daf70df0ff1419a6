#pragma once

#include "cdp/domain/cdp_config.hpp"
#include "cdp/domain/operation.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>

namespace cdp {
namespace config {

// -----------------------------------------------------------------------------
// ProtocolConfig — protocol-wide risk parameters
// -----------------------------------------------------------------------------
//
// @brief  Per-collateral-type CdpConfig templates plus the global limits
//         that feed every OperationContext.
//
// @details
// Loaded once at startup from a JSON document:
//
//   {
//     "collateral_types": {
//       "ETH": { "min_collateralization_ratio": 15000,
//                "liquidation_ratio": 13000,
//                "liquidation_penalty_bps": 1300,
//                "stability_fee_bps": 500,
//                "debt_ceiling": "1000000000000000000000000",
//                "debt_floor": "100000000000000000000" }
//     },
//     "limits": { "max_withdraw_amount": "max", "safety_buffer_bps": 300 }
//   }
//
// A new CDP copies the template of its collateral type; after that the CDP
// owns its config and later protocol changes do not reach it.
//
// Errors are exceptions here (std::runtime_error, or nlohmann::json
// exceptions for malformed documents). Config loading happens before any
// operation runs, and the driver treats a bad config as fatal.
// -----------------------------------------------------------------------------
struct ProtocolConfig {
  std::map<std::string, domain::CdpConfig> collateral_types;
  Amount max_withdraw_amount{fixed::kMaxSentinel};
  Bps safety_buffer_bps{0};

  // Throws std::runtime_error for an unknown collateral type.
  const domain::CdpConfig& collateralConfig(const std::string& type) const;

  // Context with this config's limits and the given market inputs.
  domain::OperationContext makeContext(Amount collateral_price,
                                       bool emergency_shutdown,
                                       Timestamp current_time) const;
};

// -----------------------------------------------------------------------------
// validateConfig(name, config)
// -----------------------------------------------------------------------------
// @brief  Rejects parameter sets the engine cannot evaluate consistently.
//
// @throws std::runtime_error naming the collateral type when
//         liquidation_ratio == 0, min_collateralization_ratio <
//         liquidation_ratio, or debt_floor > debt_ceiling.
// -----------------------------------------------------------------------------
void validateConfig(const std::string& name, const domain::CdpConfig& config);

// Parses and validates a document of the shape shown above.
ProtocolConfig parseProtocolConfig(const nlohmann::json& j);

// Reads path and calls parseProtocolConfig(). Logs "[ProtocolConfig]" lines.
ProtocolConfig loadProtocolConfig(const std::string& path);

}  // namespace config
}  // namespace cdp
