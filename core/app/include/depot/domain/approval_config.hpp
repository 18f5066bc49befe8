#pragma once

#include <cstdint>

namespace depot {
namespace domain {

// -----------------------------------------------------------------------------
// OperationMode
// -----------------------------------------------------------------------------
// Autonomous: transfers never wait for a human.
// Supervised: transfers above either ApprovalConfig threshold are parked in
//             the approval queue.
// -----------------------------------------------------------------------------
enum class OperationMode {
  Autonomous,
  Supervised,
};

const char* toString(OperationMode mode);

// Returns false for an unknown name and leaves `out` untouched.
bool parseOperationMode(const char* text, OperationMode& out);

// -----------------------------------------------------------------------------
// ApprovalConfig: process-wide human-approval policy
// -----------------------------------------------------------------------------
//
// @brief  Thresholds that decide whether a transfer needs human approval.
//
// @details
// Under Supervised mode a transfer requires approval when
//   price(sku) * quantity >= value_threshold   OR
//   quantity              >= quantity_threshold
//
// Configured once at startup from EngineConfig and replaceable at runtime
// through TransferCoordinator::setApprovalConfig(). Plain value type; the
// coordinator keeps its own copy.
// -----------------------------------------------------------------------------
struct ApprovalConfig {
  /// Monetary value (price * quantity) at or above which approval is needed.
  double value_threshold{10000.0};

  /// Unit count at or above which approval is needed.
  std::int64_t quantity_threshold{500};

  OperationMode mode{OperationMode::Supervised};
};

// -----------------------------------------------------------------------------
// TransferPolicy: fixed sizing constants, exposed as configuration
// -----------------------------------------------------------------------------
//
// @brief  Fractions used by calculateTransferQuantity() and rejectTransfer().
//
// @details
// source_retain_fraction: share of its pre-transfer stock a source keeps
//   when a transfer is sized from a deficit. Default 0.2 (keep 20%).
// alternative_quantity_fraction: size of the reduced-quantity alternative
//   offered when a transfer is rejected. Default 0.5 (half).
//
// Both must lie in [0, 1]; EngineConfig enforces the range when loading.
// -----------------------------------------------------------------------------
struct TransferPolicy {
  double source_retain_fraction{0.2};
  double alternative_quantity_fraction{0.5};
};

}  // namespace domain
}  // namespace depot
