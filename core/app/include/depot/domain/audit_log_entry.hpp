#pragma once

#include "depot/domain/stock_key.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace depot {
namespace domain {

// -----------------------------------------------------------------------------
// AuditLogEntry: immutable record of one stock mutation
// -----------------------------------------------------------------------------
//
// @brief  Before/after view of a single stock cell change.
//
// @details
// Created by StockValidator::logStockChange() whenever the coordinator
// reports a mutation. delta is always quantity_after - quantity_before.
//
// operation_type values written by the coordinator:
//   "adjustment"    external setStock()
//   "transfer_out"  debit of the source cell
//   "transfer_in"   credit of the target cell
//   "rollback"      restore of a cell after a reverted commit
//
// details is free-form context supplied by the caller (null when none);
// rollback entries carry the reason the commit was reverted.
//
// The log is append-only; entries are never modified after creation.
// -----------------------------------------------------------------------------
struct AuditLogEntry {
  std::string entry_id;
  std::string operation_type;
  std::string warehouse_id;
  std::string sku;
  Quantity quantity_before{0};
  Quantity quantity_after{0};
  Quantity delta{0};
  std::string triggered_by;
  std::optional<std::string> transfer_id;
  nlohmann::json details;
  std::int64_t timestamp_ms{0};
};

}  // namespace domain
}  // namespace depot
