#pragma once

#include "depot/domain/stock_key.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace depot {

// -----------------------------------------------------------------------------
// ValidationResult
// -----------------------------------------------------------------------------
// Outcome of a StockValidator check. is_valid is false iff errors is
// non-empty; warnings never affect validity.
// -----------------------------------------------------------------------------
struct ValidationResult {
  bool is_valid{true};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;

  void addError(std::string message) {
    errors.push_back(std::move(message));
    is_valid = false;
  }

  void addWarning(std::string message) {
    warnings.push_back(std::move(message));
  }
};

// One SKU whose actual total differs from its registered expected total.
// difference = actual - expected.
struct StockDiscrepancy {
  std::string sku;
  domain::Quantity expected{0};
  domain::Quantity actual{0};
  domain::Quantity difference{0};
};

// Per-SKU line of a VerificationReport.
struct SkuVerification {
  domain::Quantity expected{0};
  domain::Quantity actual{0};
  bool valid{true};
};

// -----------------------------------------------------------------------------
// VerificationReport
// -----------------------------------------------------------------------------
// Result of StockValidator::dailyStockVerification(). Only SKUs with a
// registered expected total are checked.
// -----------------------------------------------------------------------------
struct VerificationReport {
  std::int64_t verified_at_ms{0};
  std::size_t total_skus_checked{0};
  std::vector<StockDiscrepancy> discrepancies;
  std::map<std::string, SkuVerification> details;
  bool all_valid{true};
};

}  // namespace depot
