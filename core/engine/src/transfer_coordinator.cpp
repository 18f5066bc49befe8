#include "depot/engine/transfer_coordinator.hpp"
#include "depot/domain/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <utility>

namespace depot {

namespace {

domain::StockSeverity severityOf(domain::Quantity current,
                                 domain::Quantity threshold) {
  if (current <= 0) {
    return domain::StockSeverity::Critical;
  }
  const double ratio =
      static_cast<double>(current) / static_cast<double>(threshold);
  if (ratio < 0.25) {
    return domain::StockSeverity::High;
  }
  if (ratio < 0.5) {
    return domain::StockSeverity::Medium;
  }
  return domain::StockSeverity::Low;
}

// Crediting `quantity` to a cell already at `current` would leave Quantity.
bool creditOverflows(domain::Quantity current, domain::Quantity quantity) {
  return quantity > 0 &&
         current > std::numeric_limits<domain::Quantity>::max() - quantity;
}

// Caller guarantees current < threshold.
domain::TransferNeed buildNeed(const std::string& warehouse_id,
                               const std::string& sku,
                               domain::Quantity current,
                               domain::Quantity threshold,
                               double aging_priority, double sales_potential) {
  double priority = 1.0;
  if (aging_priority > 0.0) {
    priority += aging_priority;
  }
  if (sales_potential > 0.0) {
    priority += sales_potential / 100.0;
  }

  domain::TransferNeed need;
  need.warehouse_id = warehouse_id;
  need.sku = sku;
  need.current_stock = current;
  need.threshold = threshold;
  need.deficit = threshold - current;
  need.priority_score = std::round(priority * 1000.0) / 1000.0;
  need.severity = severityOf(current, threshold);
  return need;
}

std::string joinErrors(const std::vector<std::string>& errors) {
  std::string joined;
  for (const auto& error : errors) {
    if (!joined.empty()) {
      joined += "; ";
    }
    joined += error;
  }
  return joined;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
TransferCoordinator::TransferCoordinator(const ITimeProvider& clock,
                                         StockValidator& validator,
                                         domain::ApprovalConfig approval,
                                         domain::TransferPolicy policy,
                                         std::string actor_name)
    : clock_(clock),
      validator_(validator),
      actor_name_(std::move(actor_name)),
      approval_(approval),
      policy_(policy) {}

// =============================================================================
// Ledger
// =============================================================================

// -----------------------------------------------------------------------------
// setStock: external adjustment, audited
// -----------------------------------------------------------------------------
void TransferCoordinator::setStock(const std::string& warehouse_id,
                                   const std::string& sku,
                                   domain::Quantity quantity,
                                   const std::string& triggered_by) {
  if (quantity < 0) {
    throw ValidationError("Stock of " + domain::cellKey(warehouse_id, sku) +
                          " cannot be negative: " + std::to_string(quantity));
  }

  std::unique_lock lock(mutex_);
  const domain::Quantity before = stockLocked(warehouse_id, sku);
  ledger_[domain::StockKey{warehouse_id, sku}] = quantity;
  audit("adjustment", warehouse_id, sku, before, quantity, std::nullopt,
        triggered_by);
}

void TransferCoordinator::setProductPrice(const std::string& sku,
                                          double price) {
  if (price < 0.0) {
    throw ValidationError("Price of " + sku + " cannot be negative");
  }
  std::unique_lock lock(mutex_);
  prices_[sku] = price;
}

domain::Quantity TransferCoordinator::getStock(const std::string& warehouse_id,
                                               const std::string& sku) const {
  std::shared_lock lock(mutex_);
  return stockLocked(warehouse_id, sku);
}

domain::Quantity TransferCoordinator::getTotalStock(
    const std::string& sku) const {
  std::shared_lock lock(mutex_);
  return StockValidator::totalFor(sku, ledger_);
}

domain::StockSnapshot TransferCoordinator::getLedgerSnapshot() const {
  std::shared_lock lock(mutex_);
  return ledger_;
}

// =============================================================================
// Decisions
// =============================================================================

// -----------------------------------------------------------------------------
// evaluateTransferNeed
// -----------------------------------------------------------------------------
std::optional<domain::TransferNeed> TransferCoordinator::evaluateTransferNeed(
    const std::string& warehouse_id, const std::string& sku,
    domain::Quantity threshold, double aging_priority,
    double sales_potential) {
  std::shared_lock lock(mutex_);
  return evaluateNeedLocked(warehouse_id, sku, threshold, aging_priority,
                            sales_potential);
}

std::optional<domain::TransferNeed> TransferCoordinator::evaluateNeedLocked(
    const std::string& warehouse_id, const std::string& sku,
    domain::Quantity threshold, double aging_priority,
    double sales_potential) {
  const domain::Quantity current = stockLocked(warehouse_id, sku);
  if (current >= threshold) {
    return std::nullopt;
  }

  domain::TransferNeed need = buildNeed(warehouse_id, sku, current, threshold,
                                        aging_priority, sales_potential);

  recordDecision(
      "transfer_need_evaluation",
      {{"warehouse_id", warehouse_id}, {"sku", sku}, {"current_stock", current}},
      {{"threshold", threshold},
       {"deficit", need.deficit},
       {"priority_score", need.priority_score},
       {"severity", domain::toString(need.severity)},
       {"should_transfer", true}},
      "Stock (" + std::to_string(current) + ") below threshold (" +
          std::to_string(threshold) + "), deficit " +
          std::to_string(need.deficit));
  return need;
}

// -----------------------------------------------------------------------------
// selectSourceWarehouse: safety-floor filter, then ranking
// -----------------------------------------------------------------------------
std::optional<std::string> TransferCoordinator::selectSourceWarehouse(
    const std::string& sku, const std::string& target_warehouse_id,
    domain::Quantity required_quantity, domain::Quantity safety_threshold,
    const std::map<std::string, double>& sales_scores) const {
  std::shared_lock lock(mutex_);
  return selectSourceLocked(sku, target_warehouse_id, required_quantity,
                            safety_threshold, sales_scores);
}

std::optional<std::string> TransferCoordinator::selectSourceLocked(
    const std::string& sku, const std::string& target_warehouse_id,
    domain::Quantity required_quantity, domain::Quantity safety_threshold,
    const std::map<std::string, double>& sales_scores) const {
  struct Candidate {
    std::string warehouse_id;
    domain::Quantity quantity;
    double score;
  };

  std::vector<Candidate> candidates;
  for (const auto& [key, quantity] : ledger_) {
    if (key.sku != sku || key.warehouse_id == target_warehouse_id) {
      continue;
    }
    if (quantity - std::max<domain::Quantity>(0, safety_threshold) <
        required_quantity) {
      continue;
    }
    auto score_it = sales_scores.find(key.warehouse_id);
    const double score =
        (score_it != sales_scores.end()) ? score_it->second : 0.0;
    candidates.push_back(Candidate{key.warehouse_id, quantity, score});
  }

  if (candidates.empty()) {
    return std::nullopt;
  }

  if (!sales_scores.empty()) {
    // Slowest seller first; more stock wins a score tie.
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& a, const Candidate& b) {
                       if (a.score != b.score) {
                         return a.score < b.score;
                       }
                       return a.quantity > b.quantity;
                     });
  } else {
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& a, const Candidate& b) {
                       return a.quantity > b.quantity;
                     });
  }

  return candidates.front().warehouse_id;
}

domain::Quantity TransferCoordinator::getSafeTransferAmount(
    const std::string& source_warehouse_id, const std::string& sku,
    domain::Quantity requested_quantity,
    domain::Quantity safety_threshold) const {
  std::shared_lock lock(mutex_);
  const domain::Quantity available = stockLocked(source_warehouse_id, sku);
  const domain::Quantity safe_available =
      std::max<domain::Quantity>(
          0, available - std::max<domain::Quantity>(0, safety_threshold));
  return std::min(requested_quantity, safe_available);
}

// -----------------------------------------------------------------------------
// calculateTransferQuantity: keep source_retain_fraction at the source
// -----------------------------------------------------------------------------
domain::Quantity TransferCoordinator::calculateTransferQuantity(
    const std::string& source_warehouse_id,
    const std::string& /*target_warehouse_id*/, const std::string& sku,
    domain::Quantity deficit) const {
  std::shared_lock lock(mutex_);
  return calculateQuantityLocked(source_warehouse_id, sku, deficit);
}

domain::Quantity TransferCoordinator::calculateQuantityLocked(
    const std::string& source_warehouse_id, const std::string& sku,
    domain::Quantity deficit) const {
  const domain::Quantity available = stockLocked(source_warehouse_id, sku);
  if (available <= 0) {
    return 0;
  }
  const auto retained = static_cast<domain::Quantity>(std::floor(
      static_cast<double>(available) * policy_.source_retain_fraction));
  const domain::Quantity max_transferable = available - retained;
  return std::max<domain::Quantity>(0, std::min(deficit, max_transferable));
}

// -----------------------------------------------------------------------------
// selectTargetWarehouse: highest sales potential, first seen wins ties
// -----------------------------------------------------------------------------
std::optional<std::string> TransferCoordinator::selectTargetWarehouse(
    const std::string& sku, const std::string& source_warehouse_id,
    const std::vector<domain::SalesSignal>& predictions) {
  const domain::SalesSignal* best = nullptr;
  for (const auto& signal : predictions) {
    if (signal.warehouse_id == source_warehouse_id) {
      continue;
    }
    if (best == nullptr ||
        signal.sales_potential_score > best->sales_potential_score) {
      best = &signal;
    }
  }

  if (best == nullptr) {
    return std::nullopt;
  }

  recordDecision("target_warehouse_selection",
                 {{"sku", sku},
                  {"source_warehouse_id", source_warehouse_id},
                  {"candidates", predictions.size()}},
                 {{"target_warehouse_id", best->warehouse_id},
                  {"sales_potential_score", best->sales_potential_score}},
                 "Highest sales potential: " + best->warehouse_id);
  return best->warehouse_id;
}

bool TransferCoordinator::requiresApproval(const std::string& sku,
                                           domain::Quantity quantity) const {
  std::shared_lock lock(mutex_);
  return requiresApprovalLocked(sku, quantity);
}

bool TransferCoordinator::requiresApprovalLocked(
    const std::string& sku, domain::Quantity quantity) const {
  if (approval_.mode == domain::OperationMode::Autonomous) {
    return false;
  }
  auto price_it = prices_.find(sku);
  const double price = (price_it != prices_.end()) ? price_it->second : 0.0;
  const double value = price * static_cast<double>(quantity);
  return value >= approval_.value_threshold ||
         quantity >= approval_.quantity_threshold;
}

// -----------------------------------------------------------------------------
// prioritizeTransferWithAging: critical aging first, then aging priority
// -----------------------------------------------------------------------------
std::vector<domain::TransferNeed>
TransferCoordinator::prioritizeTransferWithAging(
    std::vector<domain::TransferNeed> needs,
    const std::vector<domain::AgingSignal>& aging_signals) {
  std::map<domain::StockKey, const domain::AgingSignal*> by_cell;
  for (const auto& signal : aging_signals) {
    by_cell.emplace(domain::StockKey{signal.warehouse_id, signal.sku}, &signal);
  }

  for (auto& need : needs) {
    auto it = by_cell.find(domain::StockKey{need.warehouse_id, need.sku});
    if (it != by_cell.end()) {
      need.aging_priority = it->second->priority_score;
      need.is_aging_critical = it->second->is_critical;
    } else {
      need.aging_priority = 0.0;
      need.is_aging_critical = false;
    }
  }

  std::stable_sort(needs.begin(), needs.end(),
                   [](const domain::TransferNeed& a,
                      const domain::TransferNeed& b) {
                     if (a.is_aging_critical != b.is_aging_critical) {
                       return a.is_aging_critical;
                     }
                     return a.aging_priority > b.aging_priority;
                   });
  return needs;
}

// -----------------------------------------------------------------------------
// scanTransferNeeds: every cell against its own threshold
// -----------------------------------------------------------------------------
std::vector<domain::TransferNeed> TransferCoordinator::scanTransferNeeds(
    const std::map<domain::StockKey, domain::Quantity>& thresholds,
    domain::Quantity default_threshold) const {
  std::vector<domain::TransferNeed> needs;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [key, quantity] : ledger_) {
      auto it = thresholds.find(key);
      const domain::Quantity threshold =
          (it != thresholds.end()) ? it->second : default_threshold;
      if (quantity < threshold) {
        needs.push_back(
            buildNeed(key.warehouse_id, key.sku, quantity, threshold, 0.0, 0.0));
      }
    }
  }

  std::stable_sort(needs.begin(), needs.end(),
                   [](const domain::TransferNeed& a,
                      const domain::TransferNeed& b) {
                     return static_cast<int>(a.severity) >
                            static_cast<int>(b.severity);
                   });
  return needs;
}

// =============================================================================
// Transfers
// =============================================================================

domain::TransferRequest TransferCoordinator::executeTransfer(
    const std::string& source_warehouse_id,
    const std::string& target_warehouse_id, const std::string& sku,
    domain::Quantity quantity, const std::string& reason,
    double aging_priority, double sales_potential) {
  std::unique_lock lock(mutex_);
  return executeLocked(source_warehouse_id, target_warehouse_id, sku, quantity,
                       reason, aging_priority, sales_potential);
}

// -----------------------------------------------------------------------------
// executeLocked: validate, create, then park or commit
// -----------------------------------------------------------------------------
domain::TransferRequest TransferCoordinator::executeLocked(
    const std::string& source_warehouse_id,
    const std::string& target_warehouse_id, const std::string& sku,
    domain::Quantity quantity, const std::string& reason,
    double aging_priority, double sales_potential) {
  if (source_warehouse_id.empty() || target_warehouse_id.empty() ||
      sku.empty()) {
    throw ValidationError("Warehouse ids and SKU must not be empty");
  }

  const ValidationResult check = validator_.validateAtomicTransfer(
      source_warehouse_id, target_warehouse_id, sku, quantity,
      skuSnapshotLocked(sku));
  if (!check.is_valid) {
    const domain::Quantity available = stockLocked(source_warehouse_id, sku);
    std::cerr << "[" << actor_name_ << "] Transfer refused: "
              << joinErrors(check.errors) << "\n";
    if (quantity > 0 && source_warehouse_id != target_warehouse_id &&
        available < quantity) {
      throw InsufficientStockError(joinErrors(check.errors), quantity,
                                   available);
    }
    throw ValidationError(joinErrors(check.errors));
  }
  if (creditOverflows(stockLocked(target_warehouse_id, sku), quantity)) {
    std::cerr << "[" << actor_name_ << "] Transfer refused: "
              << domain::cellKey(target_warehouse_id, sku)
              << " cannot hold " << quantity << " more units\n";
    throw ValidationError("Target " + domain::cellKey(target_warehouse_id, sku) +
                          " cannot hold " + std::to_string(quantity) +
                          " more units");
  }

  domain::TransferRequest request;
  request.id = transfer_ids_.next();
  request.source_warehouse_id = source_warehouse_id;
  request.target_warehouse_id = target_warehouse_id;
  request.sku = sku;
  request.quantity = quantity;
  request.reason = reason;
  request.priority_score = aging_priority + sales_potential / 100.0;
  request.requires_approval = requiresApprovalLocked(sku, quantity);
  request.created_at_ms = clock_.now_ms();

  const std::size_t index = transfers_.size();
  transfers_.push_back(request);
  transfer_index_[request.id] = index;

  if (request.requires_approval) {
    domain::TransferRequest& stored = transfers_[index];
    transition(stored, domain::TransferStatus::AwaitingApproval);
    pending_approvals_.push_back(stored.id);

    recordDecision("transfer_awaiting_approval",
                   {{"transfer_id", stored.id},
                    {"sku", sku},
                    {"quantity", quantity}},
                   {{"status", domain::toString(stored.status)}},
                   "Transfer exceeds approval thresholds under " +
                       std::string(domain::toString(approval_.mode)) +
                       " mode");
    std::cout << "[" << actor_name_ << "] " << stored.id << " awaiting approval ("
              << quantity << " x " << sku << " " << source_warehouse_id
              << " -> " << target_warehouse_id << ")\n";
    return stored;
  }

  commitLocked(index);
  return transfers_[index];
}

// -----------------------------------------------------------------------------
// commitLocked: two-cell all-or-nothing update
// -----------------------------------------------------------------------------
void TransferCoordinator::commitLocked(std::size_t index) {
  domain::TransferRequest& request = transfers_[index];
  const std::string& source = request.source_warehouse_id;
  const std::string& target = request.target_warehouse_id;
  const std::string& sku = request.sku;
  const domain::Quantity quantity = request.quantity;

  const domain::StockKey source_key{source, sku};
  const domain::StockKey target_key{target, sku};
  const domain::Quantity source_before = stockLocked(source, sku);
  const domain::Quantity target_before = stockLocked(target, sku);

  if (source_before < quantity) {
    transition(request, domain::TransferStatus::Failed);
    recordDecision("transfer_failed",
                   {{"transfer_id", request.id},
                    {"requested", quantity},
                    {"available", source_before}},
                   {{"status", domain::toString(request.status)}},
                   "Insufficient stock at " + source);
    std::cerr << "[" << actor_name_ << "] " << request.id
              << " failed: insufficient stock at " << source << " (requested "
              << quantity << ", available " << source_before << ")\n";
    throw InsufficientStockError("Insufficient stock at " + source + " for " +
                                     sku + ": requested " +
                                     std::to_string(quantity) + ", available " +
                                     std::to_string(source_before),
                                 quantity, source_before);
  }

  // The target can grow while an approved transfer waits in the queue.
  if (creditOverflows(target_before, quantity)) {
    transition(request, domain::TransferStatus::Failed);
    recordDecision("transfer_failed",
                   {{"transfer_id", request.id},
                    {"requested", quantity},
                    {"target_quantity", target_before}},
                   {{"status", domain::toString(request.status)}},
                   "Target " + target + " cannot hold the transfer");
    std::cerr << "[" << actor_name_ << "] " << request.id
              << " failed: " << domain::cellKey(target_key) << " cannot hold "
              << quantity << " more units\n";
    throw ValidationError("Target " + domain::cellKey(target_key) +
                          " cannot hold " + std::to_string(quantity) +
                          " more units");
  }

  const domain::StockSnapshot before = skuSnapshotLocked(sku);

  try {
    ledger_[source_key] = source_before - quantity;
    ledger_[target_key] = target_before + quantity;
    audit("transfer_out", source, sku, source_before, source_before - quantity,
          request.id, actor_name_);
    audit("transfer_in", target, sku, target_before, target_before + quantity,
          request.id, actor_name_);

    if (ledger_[source_key] < 0) {
      throw StockInvariantError("Negative stock at " + domain::cellKey(source_key) +
                                " after " + request.id);
    }

    const domain::StockSnapshot after = skuSnapshotLocked(sku);
    const ValidationResult conservation =
        validator_.verifyStockConservation(sku, before, after);
    if (!conservation.is_valid) {
      throw StockInvariantError(joinErrors(conservation.errors));
    }
    const ValidationResult non_negative = validator_.checkNoNegativeStock(after);
    if (!non_negative.is_valid) {
      throw StockInvariantError(joinErrors(non_negative.errors));
    }
  } catch (const std::exception& e) {
    const domain::Quantity source_now = stockLocked(source, sku);
    const domain::Quantity target_now = stockLocked(target, sku);
    ledger_[source_key] = source_before;
    ledger_[target_key] = target_before;
    if (source_now != source_before) {
      audit("rollback", source, sku, source_now, source_before, request.id,
            actor_name_, {{"reason", e.what()}});
    }
    if (target_now != target_before) {
      audit("rollback", target, sku, target_now, target_before, request.id,
            actor_name_, {{"reason", e.what()}});
    }

    transition(request, domain::TransferStatus::RolledBack);
    recordDecision("transfer_rolled_back",
                   {{"transfer_id", request.id}, {"sku", sku}},
                   {{"status", domain::toString(request.status)},
                    {"source_quantity", source_before},
                    {"target_quantity", target_before}},
                   std::string("Commit reverted: ") + e.what());
    std::cerr << "[" << actor_name_ << "] " << request.id
              << " rolled back: " << e.what() << "\n";
    throw;
  }

  transition(request, domain::TransferStatus::Completed);
  request.completed_at_ms = clock_.now_ms();

  const domain::Quantity source_after = stockLocked(source, sku);
  const domain::Quantity target_after = stockLocked(target, sku);
  recordDecision("transfer_completed",
                 {{"transfer_id", request.id},
                  {"source_warehouse_id", source},
                  {"target_warehouse_id", target},
                  {"sku", sku},
                  {"quantity", quantity}},
                 {{"status", domain::toString(request.status)},
                  {"source_quantity", source_after},
                  {"target_quantity", target_after}},
                 "Moved " + std::to_string(quantity) + " units of " + sku);
  std::cout << "[" << actor_name_ << "] " << request.id << " completed: "
            << quantity << " x " << sku << " " << source << " (" << source_after
            << ") -> " << target << " (" << target_after << ")\n";
}

// -----------------------------------------------------------------------------
// approveTransfer
// -----------------------------------------------------------------------------
domain::TransferRequest TransferCoordinator::approveTransfer(
    const domain::TransferId& transfer_id) {
  std::unique_lock lock(mutex_);
  domain::TransferRequest& request = findLocked(transfer_id);
  if (request.status != domain::TransferStatus::AwaitingApproval) {
    throw ValidationError("Transfer " + transfer_id + " is " +
                          domain::toString(request.status) +
                          ", not awaiting approval");
  }

  removePendingLocked(transfer_id);
  transition(request, domain::TransferStatus::Approved);
  std::cout << "[" << actor_name_ << "] " << transfer_id << " approved\n";

  const std::size_t index = transfer_index_.at(transfer_id);
  commitLocked(index);
  return transfers_[index];
}

// -----------------------------------------------------------------------------
// rejectTransfer: reject and propose alternatives
// -----------------------------------------------------------------------------
std::vector<domain::TransferAlternative> TransferCoordinator::rejectTransfer(
    const domain::TransferId& transfer_id) {
  std::unique_lock lock(mutex_);
  domain::TransferRequest& request = findLocked(transfer_id);
  if (request.status != domain::TransferStatus::AwaitingApproval) {
    throw ValidationError("Transfer " + transfer_id + " is " +
                          domain::toString(request.status) +
                          ", not awaiting approval");
  }

  removePendingLocked(transfer_id);
  transition(request, domain::TransferStatus::Rejected);

  std::vector<domain::TransferAlternative> alternatives;

  const auto reduced = static_cast<domain::Quantity>(
      std::floor(static_cast<double>(request.quantity) *
                 policy_.alternative_quantity_fraction));
  if (reduced > 0) {
    domain::TransferAlternative alt;
    alt.kind = domain::TransferAlternative::Kind::ReducedQuantity;
    alt.description = "Transfer " + std::to_string(reduced) + " units instead of " +
                      std::to_string(request.quantity);
    alt.source_warehouse_id = request.source_warehouse_id;
    alt.target_warehouse_id = request.target_warehouse_id;
    alt.sku = request.sku;
    alt.quantity = reduced;
    alternatives.push_back(std::move(alt));
  }

  auto other_source = selectSourceLocked(request.sku, request.target_warehouse_id,
                                         request.quantity, 0, {});
  if (other_source.has_value() && *other_source != request.source_warehouse_id) {
    domain::TransferAlternative alt;
    alt.kind = domain::TransferAlternative::Kind::AlternativeSource;
    alt.description = "Supply from " + *other_source + " instead of " +
                      request.source_warehouse_id;
    alt.source_warehouse_id = *other_source;
    alt.target_warehouse_id = request.target_warehouse_id;
    alt.sku = request.sku;
    alt.quantity = request.quantity;
    alternatives.push_back(std::move(alt));
  }

  nlohmann::json proposed = nlohmann::json::array();
  for (const auto& alt : alternatives) {
    proposed.push_back({{"type", domain::toString(alt.kind)},
                        {"source_warehouse_id", alt.source_warehouse_id},
                        {"quantity", alt.quantity}});
  }
  recordDecision("transfer_rejected_alternatives",
                 {{"transfer_id", transfer_id}, {"quantity", request.quantity}},
                 {{"alternatives", proposed}},
                 std::to_string(alternatives.size()) +
                     " alternative(s) proposed after rejection");
  std::cout << "[" << actor_name_ << "] " << transfer_id << " rejected, "
            << alternatives.size() << " alternative(s)\n";
  return alternatives;
}

// -----------------------------------------------------------------------------
// process: evaluate → select → size → execute under one exclusive hold
// -----------------------------------------------------------------------------
domain::ProcessOutcome TransferCoordinator::process(
    const std::string& warehouse_id, const std::string& sku,
    domain::Quantity threshold) {
  std::unique_lock lock(mutex_);

  auto need = evaluateNeedLocked(warehouse_id, sku, threshold, 0.0, 0.0);
  if (!need.has_value()) {
    return domain::NoActionNeeded{stockLocked(warehouse_id, sku), threshold};
  }

  auto source = selectSourceLocked(sku, warehouse_id, need->deficit, 0, {});
  if (!source.has_value()) {
    std::cout << "[" << actor_name_ << "] No source can cover "
              << need->deficit << " x " << sku << " for " << warehouse_id
              << "\n";
    return domain::NoSource{need->deficit};
  }

  const domain::Quantity quantity =
      calculateQuantityLocked(*source, sku, need->deficit);
  if (quantity <= 0) {
    return domain::NothingToMove{*source, need->deficit};
  }

  domain::TransferRequest request = executeLocked(
      *source, warehouse_id, sku, quantity, "auto_transfer", 0.0, 0.0);
  return domain::Transferred{request.id, request.status, *source, quantity};
}

std::optional<domain::TransferRequest> TransferCoordinator::getTransfer(
    const domain::TransferId& transfer_id) const {
  std::shared_lock lock(mutex_);
  auto it = transfer_index_.find(transfer_id);
  if (it == transfer_index_.end()) {
    return std::nullopt;
  }
  return transfers_[it->second];
}

std::vector<domain::TransferRequest> TransferCoordinator::getAllTransfers()
    const {
  std::shared_lock lock(mutex_);
  return transfers_;
}

std::vector<domain::TransferRequest> TransferCoordinator::getPendingApprovals()
    const {
  std::shared_lock lock(mutex_);
  std::vector<domain::TransferRequest> result;
  result.reserve(pending_approvals_.size());
  for (const auto& id : pending_approvals_) {
    result.push_back(transfers_[transfer_index_.at(id)]);
  }
  return result;
}

// =============================================================================
// Policy
// =============================================================================

void TransferCoordinator::setApprovalConfig(
    const domain::ApprovalConfig& config) {
  std::unique_lock lock(mutex_);
  approval_ = config;
}

void TransferCoordinator::setOperationMode(domain::OperationMode mode) {
  domain::OperationMode previous;
  {
    std::unique_lock lock(mutex_);
    previous = approval_.mode;
    approval_.mode = mode;
  }
  recordDecision("mode_change", {{"previous_mode", domain::toString(previous)}},
                 {{"mode", domain::toString(mode)}},
                 std::string("Operation mode set to ") + domain::toString(mode));
  std::cout << "[" << actor_name_ << "] Mode: " << domain::toString(previous)
            << " -> " << domain::toString(mode) << "\n";
}

domain::ApprovalConfig TransferCoordinator::getApprovalConfig() const {
  std::shared_lock lock(mutex_);
  return approval_;
}

domain::TransferPolicy TransferCoordinator::getTransferPolicy() const {
  std::shared_lock lock(mutex_);
  return policy_;
}

std::vector<domain::DecisionRecord> TransferCoordinator::getDecisionLog()
    const {
  std::lock_guard lock(decisions_mutex_);
  return decisions_;
}

// =============================================================================
// Private helpers
// =============================================================================

domain::Quantity TransferCoordinator::stockLocked(
    const std::string& warehouse_id, const std::string& sku) const {
  auto it = ledger_.find(domain::StockKey{warehouse_id, sku});
  return (it != ledger_.end()) ? it->second : 0;
}

domain::StockSnapshot TransferCoordinator::skuSnapshotLocked(
    const std::string& sku) const {
  domain::StockSnapshot snapshot;
  for (const auto& [key, quantity] : ledger_) {
    if (key.sku == sku) {
      snapshot.emplace(key, quantity);
    }
  }
  return snapshot;
}

domain::TransferRequest& TransferCoordinator::findLocked(
    const domain::TransferId& transfer_id) {
  auto it = transfer_index_.find(transfer_id);
  if (it == transfer_index_.end()) {
    throw ValidationError("Transfer not found: " + transfer_id);
  }
  return transfers_[it->second];
}

void TransferCoordinator::removePendingLocked(
    const domain::TransferId& transfer_id) {
  pending_approvals_.erase(std::remove(pending_approvals_.begin(),
                                       pending_approvals_.end(), transfer_id),
                           pending_approvals_.end());
}

// -----------------------------------------------------------------------------
// transition: every status change passes the transition table
// -----------------------------------------------------------------------------
void TransferCoordinator::transition(domain::TransferRequest& request,
                                     domain::TransferStatus next) const {
  if (!domain::canTransition(request.status, next)) {
    throw ValidationError(std::string("Illegal transition for ") + request.id +
                          ": " + domain::toString(request.status) + " -> " +
                          domain::toString(next));
  }
  request.status = next;
}

// -----------------------------------------------------------------------------
// audit: best effort, never propagates
// -----------------------------------------------------------------------------
void TransferCoordinator::audit(const std::string& operation_type,
                                const std::string& warehouse_id,
                                const std::string& sku,
                                domain::Quantity before,
                                domain::Quantity after,
                                const std::optional<std::string>& transfer_id,
                                const std::string& triggered_by,
                                nlohmann::json details) {
  try {
    validator_.logStockChange(operation_type, warehouse_id, sku, before, after,
                              triggered_by, transfer_id, std::move(details));
  } catch (const std::exception& e) {
    std::cerr << "[" << actor_name_ << "] WARNING: audit of " << operation_type
              << " on " << domain::cellKey(warehouse_id, sku)
              << " failed: " << e.what() << "\n";
  }
}

void TransferCoordinator::recordDecision(const std::string& decision_type,
                                         nlohmann::json input,
                                         nlohmann::json output,
                                         std::string reasoning) {
  domain::DecisionRecord record;
  record.decision_id = decision_ids_.next();
  record.actor = actor_name_;
  record.decision_type = decision_type;
  record.input = std::move(input);
  record.output = std::move(output);
  record.reasoning = std::move(reasoning);
  record.timestamp_ms = clock_.now_ms();

  std::lock_guard lock(decisions_mutex_);
  decisions_.push_back(std::move(record));
}

}  // namespace depot
