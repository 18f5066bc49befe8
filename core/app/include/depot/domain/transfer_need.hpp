#pragma once

#include "depot/domain/stock_key.hpp"
#include "depot/domain/transfer_request.hpp"

#include <string>
#include <variant>

namespace depot {
namespace domain {

// -----------------------------------------------------------------------------
// StockSeverity
// -----------------------------------------------------------------------------
// How far below its threshold a cell sits:
//   Critical  stock is 0
//   High      stock < 25% of threshold
//   Medium    stock < 50% of threshold
//   Low       otherwise
// -----------------------------------------------------------------------------
enum class StockSeverity {
  Low,
  Medium,
  High,
  Critical,
};

const char* toString(StockSeverity severity);

// -----------------------------------------------------------------------------
// TransferNeed
// -----------------------------------------------------------------------------
//
// @brief  Result of evaluateTransferNeed(): a cell below its threshold.
//
// @details
// deficit        = threshold - current_stock (always > 0)
// priority_score = 1 + aging_priority + sales_potential / 100, where only
//                  positive signals contribute.
//
// aging_priority / is_aging_critical are filled in by
// prioritizeTransferWithAging(); they default to 0 / false.
// -----------------------------------------------------------------------------
struct TransferNeed {
  std::string warehouse_id;
  std::string sku;
  Quantity current_stock{0};
  Quantity threshold{0};
  Quantity deficit{0};
  double priority_score{1.0};
  StockSeverity severity{StockSeverity::Low};
  double aging_priority{0.0};
  bool is_aging_critical{false};
};

// Aging signal for one cell, supplied by an external aging analysis.
struct AgingSignal {
  std::string warehouse_id;
  std::string sku;
  double priority_score{0.0};
  bool is_critical{false};
};

// Sales-potential score for one warehouse, supplied by an external predictor.
struct SalesSignal {
  std::string warehouse_id;
  double sales_potential_score{0.0};
};

// -----------------------------------------------------------------------------
// TransferAlternative
// -----------------------------------------------------------------------------
// A proposal produced by rejectTransfer(). Proposals are not executed; the
// caller decides whether to submit one through executeTransfer().
// -----------------------------------------------------------------------------
struct TransferAlternative {
  enum class Kind { ReducedQuantity, AlternativeSource } kind{
      Kind::ReducedQuantity};
  std::string description;
  std::string source_warehouse_id;
  std::string target_warehouse_id;
  std::string sku;
  Quantity quantity{0};
};

const char* toString(TransferAlternative::Kind kind);

// -----------------------------------------------------------------------------
// ProcessOutcome: result of TransferCoordinator::process()
// -----------------------------------------------------------------------------
//
// @brief  Discriminated result of the evaluate → select → size → execute
//         pipeline.
//
// @details
// NoActionNeeded   stock already at or above the threshold.
// NoSource         no warehouse can cover the deficit above its safety floor.
// NothingToMove    the sized quantity came out as zero.
// Transferred      a TransferRequest was created; its status is either
//                  Completed or AwaitingApproval.
//
// Use std::get_if / std::visit to dispatch.
// -----------------------------------------------------------------------------
struct NoActionNeeded {
  Quantity current_stock{0};
  Quantity threshold{0};
};

struct NoSource {
  Quantity deficit{0};
};

struct NothingToMove {
  std::string source_warehouse_id;
  Quantity deficit{0};
};

struct Transferred {
  TransferId transfer_id;
  TransferStatus status{TransferStatus::Pending};
  std::string source_warehouse_id;
  Quantity quantity{0};
};

using ProcessOutcome =
    std::variant<NoActionNeeded, NoSource, NothingToMove, Transferred>;

// Short action name of an outcome: "none", "no_source", "insufficient" or
// "transferred".
const char* actionName(const ProcessOutcome& outcome);

}  // namespace domain
}  // namespace depot
