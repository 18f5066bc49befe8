#pragma once

#include "depot/domain/stock_key.hpp"
#include "depot/domain/transfer_status.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace depot {
namespace domain {

// -----------------------------------------------------------------------------
// TransferId
// -----------------------------------------------------------------------------
// Generated identifier of a transfer, e.g. "TRF-000042". Produced by the
// coordinator's IdGenerator; unique for the lifetime of the coordinator.
// -----------------------------------------------------------------------------
using TransferId = std::string;

// -----------------------------------------------------------------------------
// TransferRequest
// -----------------------------------------------------------------------------
//
// @brief  One requested movement of `quantity` units of `sku` from the source
//         warehouse to the target warehouse, together with its lifecycle
//         status.
//
// @details
// Created by TransferCoordinator in status Pending. Only the coordinator's
// authoritative copy is ever mutated; every copy handed out by an accessor
// is a snapshot. Requests are never deleted so that the full history stays
// available for audit.
//
// priority_score combines the external urgency signals:
//   aging_priority + sales_potential / 100
//
// Timestamps are epoch milliseconds from the coordinator's ITimeProvider.
// -----------------------------------------------------------------------------
struct TransferRequest {
  TransferId id;
  std::string source_warehouse_id;
  std::string target_warehouse_id;
  std::string sku;
  Quantity quantity{0};
  std::string reason;
  double priority_score{0.0};
  bool requires_approval{false};
  TransferStatus status{TransferStatus::Pending};
  std::int64_t created_at_ms{0};
  std::optional<std::int64_t> completed_at_ms;
};

}  // namespace domain
}  // namespace depot
