#pragma once

#include "depot/domain/approval_config.hpp"
#include "depot/domain/stock_key.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace depot {

// One ledger cell to seed at startup.
struct StockSeed {
  std::string warehouse_id;
  std::string sku;
  domain::Quantity quantity{0};
};

// One cell the demo binary runs process() on.
struct WatchEntry {
  std::string warehouse_id;
  std::string sku;
  domain::Quantity threshold{0};
};

// -----------------------------------------------------------------------------
// EngineConfig: startup configuration of the transfer engine
// -----------------------------------------------------------------------------
//
// @brief  Approval policy, sizing policy, lock timeout and optional seed data.
//
// @details
// JSON layout (every key optional; missing keys keep the defaults below):
//
//   {
//     "approval": { "value_threshold": 10000.0,
//                   "quantity_threshold": 500,
//                   "mode": "supervised" },
//     "policy":   { "source_retain_fraction": 0.2,
//                   "alternative_quantity_fraction": 0.5 },
//     "lock_timeout_ms": 10000,
//     "prices":   { "S1": 12.5 },
//     "stock":    [ { "warehouse_id": "WH1", "sku": "S1", "quantity": 5 } ],
//     "watch":    [ { "warehouse_id": "WH1", "sku": "S1", "threshold": 40 } ],
//     "expected_totals": { "S1": 205 }
//   }
//
// Validation (ConfigError on failure):
//   thresholds, quantities, prices and lock_timeout_ms >= 0
//   fractions in [0, 1]
//   mode is "autonomous" or "supervised"
//   wrong JSON types
// -----------------------------------------------------------------------------
struct EngineConfig {
  domain::ApprovalConfig approval;
  domain::TransferPolicy policy;
  std::int64_t lock_timeout_ms{10000};

  std::map<std::string, double> prices;
  std::vector<StockSeed> stock;
  std::vector<WatchEntry> watch;
  std::map<std::string, domain::Quantity> expected_totals;
};

// -------------------------------------------------------------------------
// parseEngineConfig(json)
// -------------------------------------------------------------------------
// @brief  Builds an EngineConfig from an already-parsed JSON document.
// @throws ConfigError on a wrong type or out-of-range value.
// -------------------------------------------------------------------------
EngineConfig parseEngineConfig(const nlohmann::json& document);

// Parses `text` as JSON first; a syntax error is reported as ConfigError.
// Distinct name so a string literal never converts to nlohmann::json.
EngineConfig parseEngineConfigText(const std::string& text);

// -------------------------------------------------------------------------
// loadEngineConfigFromFile(path)
// -------------------------------------------------------------------------
// @throws ConfigError if the file cannot be opened or parsed.
// -------------------------------------------------------------------------
EngineConfig loadEngineConfigFromFile(const std::string& path);

}  // namespace depot
