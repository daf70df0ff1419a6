#include "cdp/engine/replay_runner.hpp"
#include "cdp/codec/json_codec.hpp"
#include "cdp/engine/batch_executor.hpp"
#include "cdp/risk/health_calculator.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cdp {

namespace {

// --- Step 1 helper: seed the store -------------------------------------------
void seedPositions(const config::ProtocolConfig& protocol,
                   const nlohmann::json& positions,
                   const domain::OperationContext& context,
                   IPositionStore& store) {
  for (const auto& entry : positions) {
    const std::string type = entry.at("collateral_type").get<std::string>();
    domain::Cdp cdp =
        codec::cdpFromJson(entry, protocol.collateralConfig(type));

    if (!entry.contains("state")) {
      cdp.state =
          domain::Active{healthFactor(cdp, context.collateral_price)};
    }

    if (!store.insert(cdp)) {
      throw std::runtime_error("duplicate position id: " + cdp.id);
    }
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// runScenario: seed → batch → commit
// -----------------------------------------------------------------------------
ReplayReport runScenario(const config::ProtocolConfig& protocol,
                         const nlohmann::json& scenario,
                         IPositionStore& store) {
  const auto& context_json = scenario.at("context");
  const domain::OperationContext base = protocol.makeContext(
      0, false, context_json.value("current_time", Timestamp{0}));
  const domain::OperationContext context =
      codec::contextFromJson(context_json, base);

  if (scenario.contains("positions")) {
    seedPositions(protocol, scenario.at("positions"), context, store);
  }

  // --- Step 2: resolve operations against stored snapshots ----------------
  std::vector<domain::Operation> operations;
  std::unordered_map<domain::CdpId, std::uint64_t> expected_versions;

  for (const auto& entry : scenario.at("operations")) {
    const domain::CdpId id = entry.at("cdp_id").get<std::string>();
    auto cdp = store.load(id);
    if (!cdp) {
      throw std::runtime_error("operation references unknown CDP: " + id);
    }
    expected_versions.emplace(id, cdp->version);

    domain::Operation operation;
    operation.kind = codec::operationKindFromJson(entry.at("kind"));
    operation.params.cdp = std::move(*cdp);
    operation.params.amount = entry.contains("amount")
                                  ? codec::amountFromJson(entry.at("amount"))
                                  : Amount{0};
    operation.params.actor = entry.at("actor").get<std::string>();
    operation.params.timestamp =
        entry.value("timestamp", context.current_time);
    operations.push_back(std::move(operation));
  }

  // --- Step 3: run the batch ----------------------------------------------
  auto result = applyBatch(operations, context);
  if (!result) {
    std::cerr << "[Replay] Batch of " << operations.size()
              << " operation(s) rejected: " << describe(result.error())
              << "\n";
    ReplayReport report;
    report.body = nlohmann::json{{"status", "rejected"},
                                 {"error", codec::toJson(result.error())}};
    return report;
  }

  // --- Step 4: commit the final snapshot of every touched CDP -------------
  std::unordered_map<domain::CdpId, domain::Cdp> final_snapshots;
  nlohmann::json outcomes = nlohmann::json::array();
  for (const domain::OperationOutcome& outcome : result.value()) {
    final_snapshots[outcome.updated_cdp.id] = outcome.updated_cdp;
    outcomes.push_back(codec::toJson(outcome));
  }

  std::vector<domain::Cdp> updated;
  updated.reserve(final_snapshots.size());
  for (auto& [id, cdp] : final_snapshots) {
    updated.push_back(std::move(cdp));
  }

  if (!store.commit(expected_versions, updated)) {
    ReplayReport report;
    report.body = nlohmann::json{{"status", "conflict"}};
    return report;
  }

  std::cerr << "[Replay] Applied " << operations.size() << " operation(s) to "
            << updated.size() << " CDP(s)\n";

  nlohmann::json positions = nlohmann::json::array();
  for (const domain::Cdp& cdp : store.snapshots()) {
    positions.push_back(codec::toJson(cdp));
  }

  ReplayReport report;
  report.applied = true;
  report.body = nlohmann::json{{"status", "applied"},
                               {"outcomes", std::move(outcomes)},
                               {"positions", std::move(positions)}};
  return report;
}

}  // namespace cdp
