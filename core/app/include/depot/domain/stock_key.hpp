#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <tuple>

namespace depot {
namespace domain {

// -----------------------------------------------------------------------------
// Quantity
// -----------------------------------------------------------------------------
// Unit count of one SKU. Signed so that a defective mutation can be observed
// and reported by the validator instead of wrapping around.
// -----------------------------------------------------------------------------
using Quantity = std::int64_t;

// -----------------------------------------------------------------------------
// StockKey: identity of a stock cell
// -----------------------------------------------------------------------------
//
// @brief  (warehouse_id, sku) pair identifying one stock cell.
//
// @details
// Ordered lexicographically by warehouse first, then SKU, so ledgers and
// snapshots keyed by StockKey iterate deterministically.
// -----------------------------------------------------------------------------
struct StockKey {
  std::string warehouse_id;
  std::string sku;
};

inline bool operator<(const StockKey& lhs, const StockKey& rhs) {
  return std::tie(lhs.warehouse_id, lhs.sku) <
         std::tie(rhs.warehouse_id, rhs.sku);
}

inline bool operator==(const StockKey& lhs, const StockKey& rhs) {
  return lhs.warehouse_id == rhs.warehouse_id && lhs.sku == rhs.sku;
}

inline bool operator!=(const StockKey& lhs, const StockKey& rhs) {
  return !(lhs == rhs);
}

// -----------------------------------------------------------------------------
// StockSnapshot
// -----------------------------------------------------------------------------
// Full copy of a ledger at one instant. Used as the ledger representation
// inside TransferCoordinator and as the input type of every StockValidator
// check.
// -----------------------------------------------------------------------------
using StockSnapshot = std::map<StockKey, Quantity>;

// -------------------------------------------------------------------------
// cellKey
// -------------------------------------------------------------------------
// @brief  Resource key used with ResourceLock for a single stock cell.
// @return "<warehouse_id>:<sku>", e.g. "WH1:S1".
// -------------------------------------------------------------------------
inline std::string cellKey(const std::string& warehouse_id,
                           const std::string& sku) {
  return warehouse_id + ":" + sku;
}

inline std::string cellKey(const StockKey& key) {
  return cellKey(key.warehouse_id, key.sku);
}

}  // namespace domain
}  // namespace depot
