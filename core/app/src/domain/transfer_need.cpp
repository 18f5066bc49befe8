#include "depot/domain/transfer_need.hpp"

namespace depot {
namespace domain {

const char* toString(StockSeverity severity) {
  switch (severity) {
    case StockSeverity::Low:      return "low";
    case StockSeverity::Medium:   return "medium";
    case StockSeverity::High:     return "high";
    case StockSeverity::Critical: return "critical";
  }
  return "unknown";
}

const char* toString(TransferAlternative::Kind kind) {
  switch (kind) {
    case TransferAlternative::Kind::ReducedQuantity:   return "reduced_quantity";
    case TransferAlternative::Kind::AlternativeSource: return "alternative_source";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// actionName: variant index → action string
// -----------------------------------------------------------------------------
const char* actionName(const ProcessOutcome& outcome) {
  if (std::holds_alternative<NoActionNeeded>(outcome)) {
    return "none";
  }
  if (std::holds_alternative<NoSource>(outcome)) {
    return "no_source";
  }
  if (std::holds_alternative<NothingToMove>(outcome)) {
    return "insufficient";
  }
  return "transferred";
}

}  // namespace domain
}  // namespace depot
