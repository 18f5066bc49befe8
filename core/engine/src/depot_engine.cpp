#include "depot/engine/depot_engine.hpp"

#include <iostream>
#include <utility>

namespace depot {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
DepotEngine::DepotEngine(const ITimeProvider& clock, EngineConfig config)
    : clock_(clock),
      config_(std::move(config)),
      validator_(clock_),
      coordinator_(clock_, validator_, config_.approval, config_.policy),
      bus_(clock_) {}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
DepotEngine::~DepotEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void DepotEngine::start() {
  if (running_) {
    return;
  }

  // ---  1) Expected totals -------------------------------------------------
  for (const auto& [sku, total] : config_.expected_totals) {
    validator_.registerTotalStock(sku, total);
  }

  // ---  2) Seed data -------------------------------------------------------
  for (const auto& [sku, price] : config_.prices) {
    coordinator_.setProductPrice(sku, price);
  }
  for (const auto& seed : config_.stock) {
    coordinator_.setStock(seed.warehouse_id, seed.sku, seed.quantity, "config");
  }

  // ---  3) Baseline snapshot -----------------------------------------------
  validator_.takeSnapshot(coordinator_.getLedgerSnapshot());

  // ---  4) Bus endpoint ----------------------------------------------------
  endpoint_ = std::make_unique<CoordinatorEndpoint>(bus_, coordinator_);

  running_ = true;
  std::cout << "[DepotEngine] Started: " << config_.stock.size()
            << " stock cell(s), " << config_.watch.size()
            << " watch entr(ies), mode "
            << domain::toString(config_.approval.mode) << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void DepotEngine::stop() {
  if (!running_) {
    return;
  }
  endpoint_.reset();
  running_ = false;
  std::cout << "[DepotEngine] Stopped.\n";
}

std::chrono::milliseconds DepotEngine::lockTimeout() const {
  return std::chrono::milliseconds(config_.lock_timeout_ms);
}

// -----------------------------------------------------------------------------
// runWatchCycle: process() per watch entry under cell locks
// -----------------------------------------------------------------------------
std::vector<WatchResult> DepotEngine::runWatchCycle(const std::string& owner) {
  std::vector<WatchResult> results;
  results.reserve(config_.watch.size());

  for (const auto& entry : config_.watch) {
    WatchResult result;
    result.entry = entry;

    CellLockGuard guard(locks_, owner,
                        cellKeysFor(entry.sku, entry.warehouse_id),
                        lockTimeout());
    if (!guard.owns()) {
      result.lock_timeout = true;
      result.error = "lock timeout on " +
                     domain::cellKey(entry.warehouse_id, entry.sku);
      std::cerr << "[DepotEngine] " << result.error << "\n";
      results.push_back(std::move(result));
      continue;
    }

    try {
      result.outcome =
          coordinator_.process(entry.warehouse_id, entry.sku, entry.threshold);
    } catch (const std::exception& e) {
      result.error = e.what();
      std::cerr << "[DepotEngine] process("
                << domain::cellKey(entry.warehouse_id, entry.sku)
                << ") failed: " << e.what() << "\n";
    }
    results.push_back(std::move(result));
  }
  return results;
}

VerificationReport DepotEngine::verify() const {
  return validator_.dailyStockVerification(coordinator_.getLedgerSnapshot());
}

std::vector<std::string> DepotEngine::cellKeysFor(
    const std::string& sku, const std::string& extra) const {
  std::vector<std::string> keys;
  keys.push_back(domain::cellKey(extra, sku));
  for (const auto& [key, quantity] : coordinator_.getLedgerSnapshot()) {
    if (key.sku == sku) {
      keys.push_back(domain::cellKey(key));
    }
  }
  return keys;
}

}  // namespace depot
