#pragma once

#include "depot/concurrent/id_generator.hpp"
#include "depot/domain/audit_log_entry.hpp"
#include "depot/domain/stock_key.hpp"
#include "depot/time/i_time_provider.hpp"
#include "depot/validation/validation_result.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace depot {

// -----------------------------------------------------------------------------
// StockValidator
// -----------------------------------------------------------------------------
//
// @brief  Invariant checks over stock snapshots plus the append-only audit
//         log of stock mutations.
//
// @details
// The validator owns no authoritative stock. Every check receives the
// snapshot it should inspect; the coordinator calls it before and after each
// ledger mutation.
//
// Checks:
//   validateAtomicTransfer   preconditions of one transfer
//   checkNoNegativeStock     every cell >= 0
//   verifyStockConservation  per-SKU total unchanged across a mutation
//   dailyStockVerification   actual totals vs. registered expected totals
//
// The three snapshot checks are virtual so that a test double can force a
// failure and exercise the coordinator's rollback path.
//
// Thread model:
//   All public methods are thread-safe. One mutex guards the audit log, the
//   expected totals and the stored snapshot. The check functions touch no
//   member state.
// -----------------------------------------------------------------------------
class StockValidator {
 public:
  explicit StockValidator(const ITimeProvider& clock);
  virtual ~StockValidator() = default;

  StockValidator(const StockValidator&) = delete;
  StockValidator& operator=(const StockValidator&) = delete;

  // -------------------------------------------------------------------------
  // validateAtomicTransfer(source, target, sku, quantity, snapshot)
  // -------------------------------------------------------------------------
  //
  // @brief  Checks a prospective transfer against `snapshot`.
  //
  // @details
  // Errors: quantity <= 0; source == target; source holds less than
  // `quantity`; source would go negative. A cell missing from the snapshot
  // counts as 0. Warns when the source would be left empty.
  // -------------------------------------------------------------------------
  virtual ValidationResult validateAtomicTransfer(
      const std::string& source, const std::string& target,
      const std::string& sku, domain::Quantity quantity,
      const domain::StockSnapshot& snapshot) const;

  // Reports every cell below zero.
  virtual ValidationResult checkNoNegativeStock(
      const domain::StockSnapshot& snapshot) const;

  // -------------------------------------------------------------------------
  // verifyStockConservation(sku, before, after)
  // -------------------------------------------------------------------------
  // @brief  Fails when the total of `sku` over all warehouses differs
  //         between the two snapshots; the error names both totals.
  // -------------------------------------------------------------------------
  virtual ValidationResult verifyStockConservation(
      const std::string& sku, const domain::StockSnapshot& before,
      const domain::StockSnapshot& after) const;

  // Sum of `sku` over every warehouse in `snapshot`.
  static domain::Quantity totalFor(const std::string& sku,
                                   const domain::StockSnapshot& snapshot);

  // -------------------------------------------------------------------------
  // registerTotalStock(sku, expected_total)
  // -------------------------------------------------------------------------
  // @brief  Records the total the daily verification should find for `sku`.
  //         Re-registering replaces the previous value.
  // -------------------------------------------------------------------------
  void registerTotalStock(const std::string& sku,
                          domain::Quantity expected_total);

  // -------------------------------------------------------------------------
  // dailyStockVerification(current)
  // -------------------------------------------------------------------------
  //
  // @brief  Compares every registered expected total with the actual total
  //         in `current`.
  //
  // @return Report listing each discrepancy with its signed difference
  //         (actual - expected). SKUs without a registered total are not
  //         checked.
  //
  // Side-effects: Logs a summary line; discrepancies go to std::cerr.
  // -------------------------------------------------------------------------
  VerificationReport dailyStockVerification(
      const domain::StockSnapshot& current) const;

  // -------------------------------------------------------------------------
  // logStockChange(...)
  // -------------------------------------------------------------------------
  //
  // @brief  Appends one entry to the audit log.
  //
  // @return The stored entry, with entry_id ("AUD-...") and timestamp set
  //         and delta = after - before.
  // -------------------------------------------------------------------------
  domain::AuditLogEntry logStockChange(
      const std::string& operation_type, const std::string& warehouse_id,
      const std::string& sku, domain::Quantity quantity_before,
      domain::Quantity quantity_after, const std::string& triggered_by,
      const std::optional<std::string>& transfer_id = std::nullopt,
      nlohmann::json details = nullptr);

  // Audit log, optionally filtered by warehouse and/or SKU, oldest first.
  std::vector<domain::AuditLogEntry> getAuditLog(
      const std::optional<std::string>& warehouse_id = std::nullopt,
      const std::optional<std::string>& sku = std::nullopt) const;

  // Stores a copy of `snapshot`, replacing the previous one.
  void takeSnapshot(const domain::StockSnapshot& snapshot);

  // Last stored snapshot, or nullopt when none was taken.
  std::optional<domain::StockSnapshot> getSnapshot() const;

 private:
  const ITimeProvider& clock_;
  IdGenerator audit_ids_{"AUD"};

  mutable std::mutex mutex_;
  std::vector<domain::AuditLogEntry> audit_log_;
  std::map<std::string, domain::Quantity> expected_totals_;
  std::optional<domain::StockSnapshot> snapshot_;
};

}  // namespace depot
