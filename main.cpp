// -----------------------------------------------------------------------------
// depot_engine: single executable entry point.
//
// Usage: depot_engine [config.json]
//
//   1) Load EngineConfig from the given file, or use the built-in demo
//      configuration when no path is given.
//   2) Create a LiveTimeProvider and the DepotEngine; start() seeds the
//      ledger and puts the coordinator on the message bus.
//   3) Run one watch cycle: process() for every watched cell, each under
//      cell locks.
//   4) Approve every transfer left waiting for approval.
//   5) Run the daily stock verification.
//   6) Print transfers, the audit log and the decision trace as JSON.
//
// Exit code: 0 on success, 1 on a configuration error, 2 when the daily
// verification finds a discrepancy.
// -----------------------------------------------------------------------------

#include "depot/config/engine_config.hpp"
#include "depot/domain/errors.hpp"
#include "depot/engine/depot_engine.hpp"
#include "depot/serialization/json_codec.hpp"
#include "depot/time/live_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>
#include <utility>

namespace {

// Two warehouses, one of them short on S1.
const char* kDemoConfig = R"({
  "approval": { "value_threshold": 10000.0, "quantity_threshold": 500,
                "mode": "supervised" },
  "prices": { "S1": 25.0, "S2": 400.0 },
  "stock": [
    { "warehouse_id": "WH1", "sku": "S1", "quantity": 5 },
    { "warehouse_id": "WH2", "sku": "S1", "quantity": 200 },
    { "warehouse_id": "WH1", "sku": "S2", "quantity": 100 },
    { "warehouse_id": "WH2", "sku": "S2", "quantity": 0 }
  ],
  "watch": [
    { "warehouse_id": "WH1", "sku": "S1", "threshold": 40 },
    { "warehouse_id": "WH2", "sku": "S2", "threshold": 30 }
  ],
  "expected_totals": { "S1": 205, "S2": 100 }
})";

}  // namespace

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration.
  // -------------------------------------------------------------------------
  depot::EngineConfig config;
  try {
    config = (argc > 1) ? depot::loadEngineConfigFromFile(argv[1])
                        : depot::parseEngineConfigText(kDemoConfig);
  } catch (const depot::ConfigError& e) {
    std::cerr << "[main] Configuration error: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 2) Engine.
  // -------------------------------------------------------------------------
  depot::LiveTimeProvider clock;
  depot::DepotEngine engine(clock, std::move(config));
  engine.start();

  // -------------------------------------------------------------------------
  // 3) Watch cycle.
  // -------------------------------------------------------------------------
  for (const auto& result : engine.runWatchCycle("main")) {
    std::cout << "[main] " << depot::domain::cellKey(result.entry.warehouse_id,
                                                     result.entry.sku)
              << ": ";
    if (result.outcome.has_value()) {
      std::cout << depot::domain::actionName(*result.outcome) << "\n";
    } else {
      std::cout << "error: " << result.error << "\n";
    }
  }

  // -------------------------------------------------------------------------
  // 4) Approve what is waiting.
  // -------------------------------------------------------------------------
  auto& coordinator = engine.coordinator();
  for (const auto& pending : coordinator.getPendingApprovals()) {
    try {
      coordinator.approveTransfer(pending.id);
    } catch (const depot::ValidationError& e) {
      std::cerr << "[main] Approval of " << pending.id
                << " failed: " << e.what() << "\n";
    }
  }

  // -------------------------------------------------------------------------
  // 5) Verification.
  // -------------------------------------------------------------------------
  const depot::VerificationReport report = engine.verify();

  // -------------------------------------------------------------------------
  // 6) Report.
  // -------------------------------------------------------------------------
  nlohmann::json out;
  out["transfers"] = coordinator.getAllTransfers();
  out["audit_log"] = engine.validator().getAuditLog();
  out["decisions"] = coordinator.getDecisionLog();
  out["verification"] = report;
  std::cout << out.dump(2) << "\n";

  engine.stop();
  return report.all_valid ? 0 : 2;
}
