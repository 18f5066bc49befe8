#include "depot/validation/stock_validator.hpp"

#include <iostream>
#include <utility>

namespace depot {

namespace {

domain::Quantity quantityAt(const domain::StockSnapshot& snapshot,
                            const std::string& warehouse_id,
                            const std::string& sku) {
  auto it = snapshot.find(domain::StockKey{warehouse_id, sku});
  return (it != snapshot.end()) ? it->second : 0;
}

}  // namespace

StockValidator::StockValidator(const ITimeProvider& clock) : clock_(clock) {}

// -----------------------------------------------------------------------------
// validateAtomicTransfer: preconditions of a single two-cell transfer
// -----------------------------------------------------------------------------
ValidationResult StockValidator::validateAtomicTransfer(
    const std::string& source, const std::string& target,
    const std::string& sku, domain::Quantity quantity,
    const domain::StockSnapshot& snapshot) const {
  ValidationResult result;

  if (quantity <= 0) {
    result.addError("Transfer quantity must be positive, got " +
                    std::to_string(quantity));
  }
  if (source == target) {
    result.addError("Source and target warehouse are the same: " + source);
  }

  const domain::Quantity available = quantityAt(snapshot, source, sku);
  if (quantity > 0 && available < quantity) {
    result.addError("Insufficient stock at " + source + " for " + sku +
                    ": requested " + std::to_string(quantity) +
                    ", available " + std::to_string(available));
  }

  const domain::Quantity remaining = available - quantity;
  if (quantity > 0 && remaining < 0) {
    result.addError("Transfer would leave " + source + " with negative stock (" +
                    std::to_string(remaining) + ")");
  } else if (quantity > 0 && remaining == 0) {
    result.addWarning("Transfer empties " + domain::cellKey(source, sku));
  }

  return result;
}

// -----------------------------------------------------------------------------
// checkNoNegativeStock
// -----------------------------------------------------------------------------
ValidationResult StockValidator::checkNoNegativeStock(
    const domain::StockSnapshot& snapshot) const {
  ValidationResult result;
  for (const auto& [key, quantity] : snapshot) {
    if (quantity < 0) {
      result.addError("Negative stock at " + domain::cellKey(key) + ": " +
                      std::to_string(quantity));
    }
  }
  return result;
}

// -----------------------------------------------------------------------------
// verifyStockConservation: per-SKU totals must match
// -----------------------------------------------------------------------------
ValidationResult StockValidator::verifyStockConservation(
    const std::string& sku, const domain::StockSnapshot& before,
    const domain::StockSnapshot& after) const {
  ValidationResult result;
  const domain::Quantity total_before = totalFor(sku, before);
  const domain::Quantity total_after = totalFor(sku, after);
  if (total_before != total_after) {
    result.addError("Stock not conserved for " + sku + ": before " +
                    std::to_string(total_before) + ", after " +
                    std::to_string(total_after));
  }
  return result;
}

domain::Quantity StockValidator::totalFor(
    const std::string& sku, const domain::StockSnapshot& snapshot) {
  domain::Quantity total = 0;
  for (const auto& [key, quantity] : snapshot) {
    if (key.sku == sku) {
      total += quantity;
    }
  }
  return total;
}

void StockValidator::registerTotalStock(const std::string& sku,
                                        domain::Quantity expected_total) {
  std::lock_guard lock(mutex_);
  expected_totals_[sku] = expected_total;
}

// -----------------------------------------------------------------------------
// dailyStockVerification: reconcile registered totals against `current`
// -----------------------------------------------------------------------------
VerificationReport StockValidator::dailyStockVerification(
    const domain::StockSnapshot& current) const {
  std::map<std::string, domain::Quantity> expected;
  {
    std::lock_guard lock(mutex_);
    expected = expected_totals_;
  }

  VerificationReport report;
  report.verified_at_ms = clock_.now_ms();
  report.total_skus_checked = expected.size();

  for (const auto& [sku, expected_total] : expected) {
    const domain::Quantity actual = totalFor(sku, current);
    const bool valid = (actual == expected_total);
    report.details[sku] = SkuVerification{expected_total, actual, valid};
    if (!valid) {
      report.discrepancies.push_back(
          StockDiscrepancy{sku, expected_total, actual, actual - expected_total});
      std::cerr << "[StockValidator] Discrepancy for " << sku << ": expected "
                << expected_total << ", actual " << actual << "\n";
    }
  }
  report.all_valid = report.discrepancies.empty();

  std::cout << "[StockValidator] Daily verification: "
            << report.total_skus_checked << " SKUs checked, "
            << report.discrepancies.size() << " discrepancies.\n";
  return report;
}

// -----------------------------------------------------------------------------
// logStockChange: append-only audit trail
// -----------------------------------------------------------------------------
domain::AuditLogEntry StockValidator::logStockChange(
    const std::string& operation_type, const std::string& warehouse_id,
    const std::string& sku, domain::Quantity quantity_before,
    domain::Quantity quantity_after, const std::string& triggered_by,
    const std::optional<std::string>& transfer_id, nlohmann::json details) {
  domain::AuditLogEntry entry;
  entry.entry_id = audit_ids_.next();
  entry.operation_type = operation_type;
  entry.warehouse_id = warehouse_id;
  entry.sku = sku;
  entry.quantity_before = quantity_before;
  entry.quantity_after = quantity_after;
  entry.delta = quantity_after - quantity_before;
  entry.triggered_by = triggered_by;
  entry.transfer_id = transfer_id;
  entry.details = std::move(details);
  entry.timestamp_ms = clock_.now_ms();

  std::lock_guard lock(mutex_);
  audit_log_.push_back(entry);
  return entry;
}

std::vector<domain::AuditLogEntry> StockValidator::getAuditLog(
    const std::optional<std::string>& warehouse_id,
    const std::optional<std::string>& sku) const {
  std::lock_guard lock(mutex_);
  std::vector<domain::AuditLogEntry> result;
  for (const auto& entry : audit_log_) {
    if (warehouse_id && entry.warehouse_id != *warehouse_id) {
      continue;
    }
    if (sku && entry.sku != *sku) {
      continue;
    }
    result.push_back(entry);
  }
  return result;
}

void StockValidator::takeSnapshot(const domain::StockSnapshot& snapshot) {
  std::lock_guard lock(mutex_);
  snapshot_ = snapshot;
}

std::optional<domain::StockSnapshot> StockValidator::getSnapshot() const {
  std::lock_guard lock(mutex_);
  return snapshot_;
}

}  // namespace depot
