#include "cdp/config/protocol_config.hpp"
#include "cdp/codec/json_codec.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

namespace cdp {
namespace config {

const domain::CdpConfig& ProtocolConfig::collateralConfig(
    const std::string& type) const {
  auto it = collateral_types.find(type);
  if (it == collateral_types.end()) {
    throw std::runtime_error("unknown collateral type: " + type);
  }
  return it->second;
}

domain::OperationContext ProtocolConfig::makeContext(
    Amount collateral_price, bool emergency_shutdown,
    Timestamp current_time) const {
  domain::OperationContext context;
  context.collateral_price = collateral_price;
  context.max_withdraw_amount = max_withdraw_amount;
  context.safety_buffer_bps = safety_buffer_bps;
  context.emergency_shutdown = emergency_shutdown;
  context.current_time = current_time;
  return context;
}

// -----------------------------------------------------------------------------
// validateConfig: ratio ordering and debt bounds
// -----------------------------------------------------------------------------
void validateConfig(const std::string& name, const domain::CdpConfig& config) {
  if (config.liquidation_ratio == 0) {
    throw std::runtime_error("collateral type " + name +
                             ": liquidation_ratio must be non-zero");
  }
  if (config.min_collateralization_ratio < config.liquidation_ratio) {
    throw std::runtime_error(
        "collateral type " + name + ": min_collateralization_ratio (" +
        std::to_string(config.min_collateralization_ratio) +
        ") is below liquidation_ratio (" +
        std::to_string(config.liquidation_ratio) + ")");
  }
  if (config.debt_floor > config.debt_ceiling) {
    throw std::runtime_error("collateral type " + name + ": debt_floor " +
                             fixed::toString(config.debt_floor) +
                             " exceeds debt_ceiling " +
                             fixed::toString(config.debt_ceiling));
  }
}

ProtocolConfig parseProtocolConfig(const nlohmann::json& j) {
  ProtocolConfig protocol;

  const auto& types = j.at("collateral_types");
  if (!types.is_object() || types.empty()) {
    throw std::runtime_error("collateral_types must be a non-empty object");
  }
  for (const auto& item : types.items()) {
    domain::CdpConfig config = codec::cdpConfigFromJson(item.value());
    validateConfig(item.key(), config);
    protocol.collateral_types.emplace(item.key(), config);
  }

  if (j.contains("limits")) {
    const auto& limits = j.at("limits");
    if (limits.contains("max_withdraw_amount")) {
      protocol.max_withdraw_amount =
          codec::amountFromJson(limits.at("max_withdraw_amount"));
    }
    if (limits.contains("safety_buffer_bps")) {
      protocol.safety_buffer_bps =
          codec::bpsFromJson(limits.at("safety_buffer_bps"));
    }
  }

  return protocol;
}

// -----------------------------------------------------------------------------
// loadProtocolConfig: file → ProtocolConfig
// -----------------------------------------------------------------------------
ProtocolConfig loadProtocolConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("cannot open protocol config: " + path);
  }

  // nlohmann::json::parse throws parse_error on malformed input; the
  // caller decides whether that is fatal.
  nlohmann::json document = nlohmann::json::parse(in);
  ProtocolConfig protocol = parseProtocolConfig(document);

  std::cerr << "[ProtocolConfig] Loaded " << protocol.collateral_types.size()
            << " collateral type(s) from " << path
            << " (safety buffer " << protocol.safety_buffer_bps << " bps)\n";
  return protocol;
}

}  // namespace config
}  // namespace cdp
