// -----------------------------------------------------------------------------
// cdp_replay — single executable entry point.
//
// Usage: cdp_replay <protocol.json> <scenario.json>
//
//   1) Load and validate the protocol config (collateral types, limits).
//   2) Parse the scenario: market context, seed positions, operations.
//   3) Run the operations as one batch against an InMemoryPositionStore.
//   4) Print the outcome list, or the rejecting error, as JSON on stdout.
//
// Exit codes:
//   0  batch applied and committed
//   1  batch rejected by the engine (or a commit conflict)
//   2  bad usage or malformed input
//
// Diagnostics go to stderr as "[component] ..." lines so that stdout stays
// a single JSON document.
// -----------------------------------------------------------------------------

#include "cdp/config/protocol_config.hpp"
#include "cdp/engine/replay_runner.hpp"
#include "cdp/store/in_memory_position_store.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

constexpr int kExitApplied = 0;
constexpr int kExitRejected = 1;
constexpr int kExitBadInput = 2;

nlohmann::json readJsonFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("cannot open " + path);
  }
  return nlohmann::json::parse(in);
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc != 3) {
    std::cerr << "usage: " << argv[0] << " <protocol.json> <scenario.json>\n";
    return kExitBadInput;
  }

  try {
    // -------------------------------------------------------------------------
    // 1) Protocol config. Any inconsistency here is fatal.
    // -------------------------------------------------------------------------
    const cdp::config::ProtocolConfig protocol =
        cdp::config::loadProtocolConfig(argv[1]);

    // -------------------------------------------------------------------------
    // 2) Scenario + 3) replay. The store is stack-local; nothing persists
    // past this process.
    // -------------------------------------------------------------------------
    const nlohmann::json scenario = readJsonFile(argv[2]);
    cdp::InMemoryPositionStore store;
    cdp::ReplayReport report = cdp::runScenario(protocol, scenario, store);

    // -------------------------------------------------------------------------
    // 4) Report.
    // -------------------------------------------------------------------------
    std::cout << report.body.dump(2) << "\n";
    return report.applied ? kExitApplied : kExitRejected;

  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[main] JSON error: " << e.what() << "\n";
    return kExitBadInput;
  } catch (const std::exception& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return kExitBadInput;
  }
}
