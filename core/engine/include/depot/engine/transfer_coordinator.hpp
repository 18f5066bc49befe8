#pragma once

#include "depot/concurrent/id_generator.hpp"
#include "depot/domain/approval_config.hpp"
#include "depot/domain/decision_record.hpp"
#include "depot/domain/stock_key.hpp"
#include "depot/domain/transfer_need.hpp"
#include "depot/domain/transfer_request.hpp"
#include "depot/time/i_time_provider.hpp"
#include "depot/validation/stock_validator.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace depot {

// -----------------------------------------------------------------------------
// TransferCoordinator: stock ledger owner and transfer orchestrator
// -----------------------------------------------------------------------------
//
// @brief  Holds the authoritative (warehouse, sku) → quantity ledger, decides
//         when and from where stock should move, gates transfers behind the
//         approval policy and applies them as all-or-nothing two-cell
//         commits.
//
// @details
// Decision pipeline (see process()):
//
//   evaluateTransferNeed ─> selectSourceWarehouse ─> calculateTransferQuantity
//                                                        │
//                                                        ▼
//                                                  executeTransfer
//                                                   │          │
//                                   requiresApproval│          │otherwise
//                                                   ▼          ▼
//                                         AwaitingApproval   commit
//                                           │        │
//                              approveTransfer   rejectTransfer
//                                   │                 │
//                                 commit        alternatives
//
// Atomic commit:
//   1. Source holds less than the quantity: request → Failed,
//      InsufficientStockError, no mutation.
//   2. Debit source, credit target, audit both cells.
//   3. Post-checks: source not negative, conservation of the SKU total,
//      no negative cell. Any failure (or any exception from step 2/3)
//      restores both cells, audits the restore as "rollback", marks the
//      request RolledBack and rethrows (StockInvariantError for a failed
//      check).
//   4. Otherwise the request becomes Completed with a completion time.
//
// Status changes always go through the TransferStatus transition table;
// an illegal change raises ValidationError.
//
// Logging:
//   Progress on std::cout, failures on std::cerr, tagged with the actor
//   name. Every decision is also kept as a DecisionRecord
//   (getDecisionLog()). Every ledger mutation is reported to the
//   StockValidator audit log; audit failures are logged and never fail the
//   operation being audited.
//
// Thread model:
//   All public methods are thread-safe. A shared_mutex guards the ledger,
//   prices, policy and transfers: reads take it shared, mutations take it
//   exclusive, and a whole commit runs under one exclusive hold, so no
//   reader ever observes a half-applied transfer. The decision log has its
//   own mutex.
//
//   Callers that read stock and then act on it (process() from several
//   monitors, for instance) must still serialize on the affected cells with
//   CellLockGuard; the coordinator does not lock cells on their behalf.
//
// Ownership:
//   Borrows the time provider and the validator; both must outlive the
//   coordinator.
// -----------------------------------------------------------------------------
class TransferCoordinator {
 public:
  static constexpr const char* kDefaultActorName = "TransferCoordinator";

  TransferCoordinator(const ITimeProvider& clock, StockValidator& validator,
                      domain::ApprovalConfig approval = {},
                      domain::TransferPolicy policy = {},
                      std::string actor_name = kDefaultActorName);

  TransferCoordinator(const TransferCoordinator&) = delete;
  TransferCoordinator& operator=(const TransferCoordinator&) = delete;
  TransferCoordinator(TransferCoordinator&&) = delete;
  TransferCoordinator& operator=(TransferCoordinator&&) = delete;

  const std::string& actorName() const { return actor_name_; }

  // ===========================================================================
  // Ledger
  // ===========================================================================

  // -------------------------------------------------------------------------
  // setStock(warehouse_id, sku, quantity, triggered_by)
  // -------------------------------------------------------------------------
  // @brief  Overwrites one ledger cell with an externally supplied quantity.
  // @throws ValidationError if quantity < 0.
  // Side-effects: Audited as an "adjustment".
  // -------------------------------------------------------------------------
  void setStock(const std::string& warehouse_id, const std::string& sku,
                domain::Quantity quantity,
                const std::string& triggered_by = "external");

  // Unit price used by requiresApproval(). Throws ValidationError if < 0.
  void setProductPrice(const std::string& sku, double price);

  // Quantity of one cell; 0 for an unknown cell. Pure read.
  domain::Quantity getStock(const std::string& warehouse_id,
                            const std::string& sku) const;

  // Sum of `sku` over every warehouse. Pure read.
  domain::Quantity getTotalStock(const std::string& sku) const;

  domain::StockSnapshot getLedgerSnapshot() const;

  // ===========================================================================
  // Decisions
  // ===========================================================================

  // -------------------------------------------------------------------------
  // evaluateTransferNeed(warehouse_id, sku, threshold, aging, sales)
  // -------------------------------------------------------------------------
  //
  // @brief  Reports whether a cell is below `threshold`.
  //
  // @return nullopt when stock >= threshold. Otherwise a TransferNeed with
  //         deficit = threshold - stock and
  //         priority = 1 + aging_priority + sales_potential / 100
  //         (only positive signals contribute, rounded to 3 decimals).
  //
  // Side-effects: Records a "transfer_need_evaluation" decision.
  // -------------------------------------------------------------------------
  std::optional<domain::TransferNeed> evaluateTransferNeed(
      const std::string& warehouse_id, const std::string& sku,
      domain::Quantity threshold, double aging_priority = 0.0,
      double sales_potential = 0.0);

  // -------------------------------------------------------------------------
  // selectSourceWarehouse(sku, target, required, safety, sales_scores)
  // -------------------------------------------------------------------------
  //
  // @brief  Picks the warehouse that should supply `required` units.
  //
  // @details
  // Candidates: every other warehouse holding `sku` with
  // stock - safety_threshold >= required.
  //   With sales scores: lowest score first (missing score = 0), then
  //     largest stock.
  //   Without: largest stock.
  // Remaining ties keep warehouse-id order.
  //
  // @return nullopt when no warehouse qualifies.
  // -------------------------------------------------------------------------
  std::optional<std::string> selectSourceWarehouse(
      const std::string& sku, const std::string& target_warehouse_id,
      domain::Quantity required_quantity, domain::Quantity safety_threshold = 0,
      const std::map<std::string, double>& sales_scores = {}) const;

  // min(requested, max(0, stock - safety_threshold)). Pure read.
  domain::Quantity getSafeTransferAmount(const std::string& source_warehouse_id,
                                         const std::string& sku,
                                         domain::Quantity requested_quantity,
                                         domain::Quantity safety_threshold) const;

  // -------------------------------------------------------------------------
  // calculateTransferQuantity(source, target, sku, deficit)
  // -------------------------------------------------------------------------
  // @brief  Caps `deficit` so the source keeps source_retain_fraction of its
  //         current stock: min(deficit, stock - floor(stock * fraction)),
  //         never below 0. Returns 0 for an empty source.
  // -------------------------------------------------------------------------
  domain::Quantity calculateTransferQuantity(
      const std::string& source_warehouse_id,
      const std::string& target_warehouse_id, const std::string& sku,
      domain::Quantity deficit) const;

  // -------------------------------------------------------------------------
  // selectTargetWarehouse(sku, source, predictions)
  // -------------------------------------------------------------------------
  // @brief  Highest sales-potential warehouse other than the source; the
  //         first one seen wins a tie.
  // Side-effects: Records a "target_warehouse_selection" decision when a
  //               target is found.
  // -------------------------------------------------------------------------
  std::optional<std::string> selectTargetWarehouse(
      const std::string& sku, const std::string& source_warehouse_id,
      const std::vector<domain::SalesSignal>& predictions);

  // False under Autonomous mode; otherwise price * quantity >=
  // value_threshold or quantity >= quantity_threshold. Unpriced SKUs count
  // as price 0.
  bool requiresApproval(const std::string& sku,
                        domain::Quantity quantity) const;

  // -------------------------------------------------------------------------
  // prioritizeTransferWithAging(needs, aging_signals)
  // -------------------------------------------------------------------------
  // @brief  Attaches the matching aging signal to each need and reorders:
  //         critical aging first, then aging priority descending. Needs
  //         without a signal get 0 / not critical. Stable otherwise.
  // -------------------------------------------------------------------------
  static std::vector<domain::TransferNeed> prioritizeTransferWithAging(
      std::vector<domain::TransferNeed> needs,
      const std::vector<domain::AgingSignal>& aging_signals);

  // -------------------------------------------------------------------------
  // scanTransferNeeds(thresholds, default_threshold)
  // -------------------------------------------------------------------------
  // @brief  Evaluates every ledger cell against its threshold in
  //         `thresholds` (or `default_threshold`) and returns every cell
  //         below it, most severe first. Records no decisions.
  // -------------------------------------------------------------------------
  std::vector<domain::TransferNeed> scanTransferNeeds(
      const std::map<domain::StockKey, domain::Quantity>& thresholds,
      domain::Quantity default_threshold) const;

  // ===========================================================================
  // Transfers
  // ===========================================================================

  // -------------------------------------------------------------------------
  // executeTransfer(source, target, sku, quantity, reason, aging, sales)
  // -------------------------------------------------------------------------
  //
  // @brief  Validates and creates a transfer, then either parks it for
  //         approval or commits it.
  //
  // @return Snapshot of the request: AwaitingApproval or Completed.
  //
  // @throws ValidationError         quantity <= 0, source == target.
  // @throws InsufficientStockError  source holds less than `quantity`.
  // @throws StockInvariantError     post-commit check failed; the ledger has
  //                                 been restored and the request is
  //                                 RolledBack.
  // -------------------------------------------------------------------------
  domain::TransferRequest executeTransfer(
      const std::string& source_warehouse_id,
      const std::string& target_warehouse_id, const std::string& sku,
      domain::Quantity quantity, const std::string& reason,
      double aging_priority = 0.0, double sales_potential = 0.0);

  // -------------------------------------------------------------------------
  // approveTransfer(transfer_id)
  // -------------------------------------------------------------------------
  // @brief  AwaitingApproval → Approved, then commits.
  // @throws ValidationError for an unknown id or any other status; commit
  //         errors as executeTransfer().
  // -------------------------------------------------------------------------
  domain::TransferRequest approveTransfer(const domain::TransferId& transfer_id);

  // -------------------------------------------------------------------------
  // rejectTransfer(transfer_id)
  // -------------------------------------------------------------------------
  //
  // @brief  AwaitingApproval → Rejected, and proposes alternatives:
  //           1. same route at alternative_quantity_fraction of the
  //              quantity, if positive;
  //           2. a different source from selectSourceWarehouse() for the
  //              full quantity, if one exists.
  //
  // @throws ValidationError for an unknown id or any other status.
  // -------------------------------------------------------------------------
  std::vector<domain::TransferAlternative> rejectTransfer(
      const domain::TransferId& transfer_id);

  // -------------------------------------------------------------------------
  // process(warehouse_id, sku, threshold)
  // -------------------------------------------------------------------------
  //
  // @brief  evaluate → select source → size → execute, as one step.
  //
  // @return NoActionNeeded, NoSource, NothingToMove or Transferred. The
  //         "nothing to do" outcomes never throw; lower-level contract
  //         violations from executeTransfer() propagate.
  // -------------------------------------------------------------------------
  domain::ProcessOutcome process(const std::string& warehouse_id,
                                 const std::string& sku,
                                 domain::Quantity threshold);

  std::optional<domain::TransferRequest> getTransfer(
      const domain::TransferId& transfer_id) const;

  // Every transfer ever created, oldest first.
  std::vector<domain::TransferRequest> getAllTransfers() const;

  // Transfers in AwaitingApproval, in the order they were parked.
  std::vector<domain::TransferRequest> getPendingApprovals() const;

  // ===========================================================================
  // Policy
  // ===========================================================================

  void setApprovalConfig(const domain::ApprovalConfig& config);

  // Records a "mode_change" decision.
  void setOperationMode(domain::OperationMode mode);

  domain::ApprovalConfig getApprovalConfig() const;
  domain::TransferPolicy getTransferPolicy() const;

  std::vector<domain::DecisionRecord> getDecisionLog() const;

 private:
  // The *Locked helpers expect mutex_ to be held (shared or exclusive).
  domain::Quantity stockLocked(const std::string& warehouse_id,
                               const std::string& sku) const;
  domain::StockSnapshot skuSnapshotLocked(const std::string& sku) const;
  std::optional<std::string> selectSourceLocked(
      const std::string& sku, const std::string& target_warehouse_id,
      domain::Quantity required_quantity, domain::Quantity safety_threshold,
      const std::map<std::string, double>& sales_scores) const;
  domain::Quantity calculateQuantityLocked(
      const std::string& source_warehouse_id, const std::string& sku,
      domain::Quantity deficit) const;
  bool requiresApprovalLocked(const std::string& sku,
                              domain::Quantity quantity) const;
  std::optional<domain::TransferNeed> evaluateNeedLocked(
      const std::string& warehouse_id, const std::string& sku,
      domain::Quantity threshold, double aging_priority,
      double sales_potential);

  // Exclusive hold required.
  domain::TransferRequest executeLocked(const std::string& source_warehouse_id,
                                        const std::string& target_warehouse_id,
                                        const std::string& sku,
                                        domain::Quantity quantity,
                                        const std::string& reason,
                                        double aging_priority,
                                        double sales_potential);
  void commitLocked(std::size_t index);
  domain::TransferRequest& findLocked(const domain::TransferId& transfer_id);
  void removePendingLocked(const domain::TransferId& transfer_id);

  // Applies `next` through the transition table; throws ValidationError on
  // an illegal change.
  void transition(domain::TransferRequest& request,
                  domain::TransferStatus next) const;

  // Best effort: failures are logged on std::cerr only.
  void audit(const std::string& operation_type,
             const std::string& warehouse_id, const std::string& sku,
             domain::Quantity before, domain::Quantity after,
             const std::optional<std::string>& transfer_id,
             const std::string& triggered_by,
             nlohmann::json details = nullptr);

  void recordDecision(const std::string& decision_type, nlohmann::json input,
                      nlohmann::json output, std::string reasoning);

  const ITimeProvider& clock_;
  StockValidator& validator_;
  const std::string actor_name_;

  IdGenerator transfer_ids_{"TRF"};
  IdGenerator decision_ids_{"DEC"};

  mutable std::shared_mutex mutex_;
  domain::StockSnapshot ledger_;
  std::map<std::string, double> prices_;
  domain::ApprovalConfig approval_;
  domain::TransferPolicy policy_;
  std::vector<domain::TransferRequest> transfers_;
  std::unordered_map<domain::TransferId, std::size_t> transfer_index_;
  std::vector<domain::TransferId> pending_approvals_;

  mutable std::mutex decisions_mutex_;
  std::vector<domain::DecisionRecord> decisions_;
};

}  // namespace depot
