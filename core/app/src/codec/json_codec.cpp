#include "cdp/codec/json_codec.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace cdp {
namespace codec {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace

Bps bpsFromJson(const nlohmann::json& j) {
  const std::int64_t value = j.get<std::int64_t>();
  if (value < 0 || value > 0xFFFFFFFFLL) {
    throw std::runtime_error("basis points out of range: " +
                             std::to_string(value));
  }
  return static_cast<Bps>(value);
}

// -----------------------------------------------------------------------------
// Amounts
// -----------------------------------------------------------------------------
nlohmann::json amountToJson(Amount value) { return fixed::toString(value); }

Amount amountFromJson(const nlohmann::json& j) {
  if (j.is_string()) {
    const std::string text = j.get<std::string>();
    if (text == "max") {
      return fixed::kMaxSentinel;
    }
    auto parsed = fixed::parseAmount(text);
    if (!parsed) {
      throw std::runtime_error("invalid amount: \"" + text + "\"");
    }
    return *parsed;
  }
  if (j.is_number_unsigned()) {
    return j.get<std::uint64_t>();
  }
  if (j.is_number_integer()) {
    const std::int64_t value = j.get<std::int64_t>();
    if (value < 0) {
      throw std::runtime_error("negative amount: " + std::to_string(value));
    }
    return static_cast<Amount>(value);
  }
  throw std::runtime_error("amount must be a decimal string or integer, got " +
                           std::string(j.type_name()));
}

// -----------------------------------------------------------------------------
// CdpConfig
// -----------------------------------------------------------------------------
nlohmann::json toJson(const domain::CdpConfig& config) {
  return nlohmann::json{
      {"min_collateralization_ratio", config.min_collateralization_ratio},
      {"liquidation_ratio", config.liquidation_ratio},
      {"liquidation_penalty_bps", config.liquidation_penalty_bps},
      {"stability_fee_bps", config.stability_fee_bps},
      {"debt_ceiling", amountToJson(config.debt_ceiling)},
      {"debt_floor", amountToJson(config.debt_floor)},
  };
}

domain::CdpConfig cdpConfigFromJson(const nlohmann::json& j,
                                    const domain::CdpConfig& defaults) {
  domain::CdpConfig config = defaults;
  if (j.contains("min_collateralization_ratio")) {
    config.min_collateralization_ratio =
        bpsFromJson(j.at("min_collateralization_ratio"));
  }
  if (j.contains("liquidation_ratio")) {
    config.liquidation_ratio = bpsFromJson(j.at("liquidation_ratio"));
  }
  if (j.contains("liquidation_penalty_bps")) {
    config.liquidation_penalty_bps =
        bpsFromJson(j.at("liquidation_penalty_bps"));
  }
  if (j.contains("stability_fee_bps")) {
    config.stability_fee_bps = bpsFromJson(j.at("stability_fee_bps"));
  }
  if (j.contains("debt_ceiling")) {
    config.debt_ceiling = amountFromJson(j.at("debt_ceiling"));
  }
  if (j.contains("debt_floor")) {
    config.debt_floor = amountFromJson(j.at("debt_floor"));
  }
  return config;
}

// -----------------------------------------------------------------------------
// CdpState
// -----------------------------------------------------------------------------
nlohmann::json toJson(const domain::CdpState& state) {
  return std::visit(
      Overloaded{
          [](const domain::Active& s) {
            return nlohmann::json{{"tag", "active"},
                                  {"health_factor",
                                   amountToJson(s.health_factor)}};
          },
          [](const domain::Liquidating& s) {
            return nlohmann::json{{"tag", "liquidating"},
                                  {"liquidation_price",
                                   amountToJson(s.liquidation_price)}};
          },
          [](const domain::Closed& s) {
            return nlohmann::json{{"tag", "closed"},
                                  {"closed_at", s.closed_at}};
          },
      },
      state);
}

domain::CdpState stateFromJson(const nlohmann::json& j) {
  const std::string tag = j.at("tag").get<std::string>();
  if (tag == "active") {
    domain::Active active;
    if (j.contains("health_factor")) {
      active.health_factor = amountFromJson(j.at("health_factor"));
    }
    return active;
  }
  if (tag == "liquidating") {
    return domain::Liquidating{amountFromJson(j.at("liquidation_price"))};
  }
  if (tag == "closed") {
    return domain::Closed{j.at("closed_at").get<Timestamp>()};
  }
  throw std::runtime_error("unknown CDP state: \"" + tag + "\"");
}

// -----------------------------------------------------------------------------
// Cdp
// -----------------------------------------------------------------------------
nlohmann::json toJson(const domain::Cdp& cdp) {
  return nlohmann::json{
      {"id", cdp.id},
      {"owner", cdp.owner},
      {"collateral_type", cdp.collateral_type},
      {"collateral_amount", amountToJson(cdp.collateral_amount)},
      {"debt_amount", amountToJson(cdp.debt_amount)},
      {"state", toJson(cdp.state)},
      {"config", toJson(cdp.config)},
      {"accrued_fees", amountToJson(cdp.accrued_fees)},
      {"created_at", cdp.created_at},
      {"updated_at", cdp.updated_at},
      {"version", cdp.version},
  };
}

domain::Cdp cdpFromJson(const nlohmann::json& j,
                        const domain::CdpConfig& config_defaults) {
  domain::Cdp cdp;
  cdp.id = j.at("id").get<std::string>();
  cdp.owner = j.at("owner").get<std::string>();
  cdp.collateral_type = j.at("collateral_type").get<std::string>();
  cdp.collateral_amount = amountFromJson(j.at("collateral_amount"));
  cdp.debt_amount = amountFromJson(j.at("debt_amount"));

  cdp.config = j.contains("config")
                   ? cdpConfigFromJson(j.at("config"), config_defaults)
                   : config_defaults;

  if (j.contains("state")) {
    cdp.state = stateFromJson(j.at("state"));
  }
  if (j.contains("accrued_fees")) {
    cdp.accrued_fees = amountFromJson(j.at("accrued_fees"));
  }
  cdp.created_at = j.value("created_at", Timestamp{0});
  cdp.updated_at = j.value("updated_at", cdp.created_at);
  cdp.version = j.value("version", std::uint64_t{0});
  return cdp;
}

// -----------------------------------------------------------------------------
// OperationContext
// -----------------------------------------------------------------------------
nlohmann::json toJson(const domain::OperationContext& context) {
  return nlohmann::json{
      {"collateral_price", amountToJson(context.collateral_price)},
      {"max_withdraw_amount", amountToJson(context.max_withdraw_amount)},
      {"safety_buffer_bps", context.safety_buffer_bps},
      {"emergency_shutdown", context.emergency_shutdown},
      {"current_time", context.current_time},
  };
}

domain::OperationContext contextFromJson(
    const nlohmann::json& j, const domain::OperationContext& base) {
  domain::OperationContext context = base;
  context.collateral_price = amountFromJson(j.at("collateral_price"));
  if (j.contains("max_withdraw_amount")) {
    context.max_withdraw_amount = amountFromJson(j.at("max_withdraw_amount"));
  }
  if (j.contains("safety_buffer_bps")) {
    context.safety_buffer_bps = bpsFromJson(j.at("safety_buffer_bps"));
  }
  context.emergency_shutdown =
      j.value("emergency_shutdown", base.emergency_shutdown);
  context.current_time = j.value("current_time", base.current_time);
  return context;
}

domain::OperationKind operationKindFromJson(const nlohmann::json& j) {
  const std::string name = j.get<std::string>();
  auto kind = domain::parseOperationKind(name);
  if (!kind) {
    throw std::runtime_error("unknown operation kind: \"" + name + "\"");
  }
  return *kind;
}

// -----------------------------------------------------------------------------
// OperationOutcome
// -----------------------------------------------------------------------------
nlohmann::json toJson(const domain::OperationOutcome& outcome) {
  nlohmann::json j{
      {"kind", domain::operationName(outcome.kind)},
      {"amount", amountToJson(outcome.amount)},
      {"previous_health_factor", amountToJson(outcome.previous_health_factor)},
      {"new_health_factor", amountToJson(outcome.new_health_factor)},
      {"cdp", toJson(outcome.updated_cdp)},
  };
  if (outcome.remaining_available_collateral) {
    j["remaining_available_collateral"] =
        amountToJson(*outcome.remaining_available_collateral);
  }
  if (outcome.fees_paid) {
    j["fees_paid"] = amountToJson(*outcome.fees_paid);
  }
  return j;
}

// -----------------------------------------------------------------------------
// CdpError
// -----------------------------------------------------------------------------
nlohmann::json toJson(const CdpError& error) {
  nlohmann::json j{
      {"code", std::string(errorCode(error))},
      {"message", describe(error)},
      {"retryable", isRetryable(error)},
  };

  std::visit(
      Overloaded{
          [](const errors::EmergencyShutdown&) {},
          [&j](const errors::Unauthorized& e) {
            j["owner"] = e.owner;
            j["caller"] = e.caller;
          },
          [&j](const errors::InvalidAmount& e) {
            j["amount"] = amountToJson(e.amount);
          },
          [&j](const errors::InvalidOperationForState& e) {
            j["operation"] = domain::operationName(e.operation);
            j["state"] = domain::stateName(e.state);
          },
          [&j](const errors::InsufficientAvailableCollateral& e) {
            j["available"] = amountToJson(e.available);
            j["requested"] = amountToJson(e.requested);
          },
          [&j](const errors::WithdrawalLimitExceeded& e) {
            j["limit"] = amountToJson(e.limit);
            j["requested"] = amountToJson(e.requested);
          },
          [&j](const errors::BelowMinCollateralRatio& e) {
            j["current"] = amountToJson(e.current);
            j["minimum"] = amountToJson(e.minimum);
          },
          [&j](const errors::DebtCeilingExceeded& e) {
            j["ceiling"] = amountToJson(e.ceiling);
            j["requested"] = amountToJson(e.requested);
          },
          [&j](const errors::DebtFloorViolated& e) {
            j["floor"] = amountToJson(e.floor);
            j["remainder"] = amountToJson(e.remainder);
          },
          [&j](const errors::OutstandingDebt& e) {
            j["debt"] = amountToJson(e.debt);
            j["fees"] = amountToJson(e.fees);
          },
          [&j](const errors::ArithmeticOverflow& e) {
            j["operation"] = domain::operationName(e.operation);
          },
      },
      error);

  return j;
}

}  // namespace codec
}  // namespace cdp
