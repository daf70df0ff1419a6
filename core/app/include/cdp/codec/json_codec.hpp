#pragma once

#include "cdp/domain/cdp.hpp"
#include "cdp/domain/cdp_config.hpp"
#include "cdp/domain/cdp_error.hpp"
#include "cdp/domain/cdp_state.hpp"
#include "cdp/domain/operation.hpp"

#include <nlohmann/json.hpp>

namespace cdp {
namespace codec {

// -----------------------------------------------------------------------------
// JSON codec for the replay driver and protocol config
// -----------------------------------------------------------------------------
//
// @brief  Converts engine values to and from nlohmann::json.
//
// @details
// Amounts are 128-bit and do not fit a JSON number, so they are written as
// decimal strings of the raw smallest-unit value. On input an Amount may
// also be given as a non-negative JSON integer, or as the string "max" for
// kMaxSentinel.
//
// Decoding failures throw: nlohmann::json::exception for missing keys and
// wrong JSON types, std::runtime_error for values that parse as JSON but
// are not valid engine values (bad amount text, unknown state or kind).
// These are input errors at the process boundary, caught by the driver.
// Engine errors never travel as exceptions; they are encoded by toJson().
// -----------------------------------------------------------------------------

nlohmann::json amountToJson(Amount value);
Amount amountFromJson(const nlohmann::json& j);

// JSON integer in [0, 2^32). Throws std::runtime_error outside that range.
Bps bpsFromJson(const nlohmann::json& j);

nlohmann::json toJson(const domain::CdpConfig& config);

// Fields missing from j keep the value they have in defaults.
domain::CdpConfig cdpConfigFromJson(const nlohmann::json& j,
                                    const domain::CdpConfig& defaults = {});

// {"tag": "active", "health_factor": "..."} and so on.
nlohmann::json toJson(const domain::CdpState& state);
domain::CdpState stateFromJson(const nlohmann::json& j);

nlohmann::json toJson(const domain::Cdp& cdp);

// Requires id, owner, collateral_type, collateral_amount, debt_amount.
// Everything else is optional; "config" fields fall back to
// config_defaults.
domain::Cdp cdpFromJson(const nlohmann::json& j,
                        const domain::CdpConfig& config_defaults = {});

nlohmann::json toJson(const domain::OperationContext& context);

// Requires collateral_price. Missing limits fall back to base.
domain::OperationContext contextFromJson(
    const nlohmann::json& j, const domain::OperationContext& base = {});

domain::OperationKind operationKindFromJson(const nlohmann::json& j);

nlohmann::json toJson(const domain::OperationOutcome& outcome);

// -----------------------------------------------------------------------------
// toJson(CdpError)
// -----------------------------------------------------------------------------
// @brief  {"code": errorCode(), "message": describe(), "retryable": bool,
//          ...carried values...}
// -----------------------------------------------------------------------------
nlohmann::json toJson(const CdpError& error);

}  // namespace codec
}  // namespace cdp
