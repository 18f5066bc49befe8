#pragma once

#include "depot/concurrent/resource_lock.hpp"
#include "depot/config/engine_config.hpp"
#include "depot/domain/transfer_need.hpp"
#include "depot/engine/coordinator_endpoint.hpp"
#include "depot/engine/transfer_coordinator.hpp"
#include "depot/messaging/message_bus.hpp"
#include "depot/time/i_time_provider.hpp"
#include "depot/validation/stock_validator.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace depot {

// Result of one watched cell in DepotEngine::runWatchCycle().
struct WatchResult {
  WatchEntry entry;
  std::optional<domain::ProcessOutcome> outcome;  // empty on error / timeout
  bool lock_timeout{false};
  std::string error;
};

// -----------------------------------------------------------------------------
// DepotEngine
// -----------------------------------------------------------------------------
//
// @brief  Owns and wires the engine components from one EngineConfig.
//
// @details
// Gives main() and tests a start/stop lifecycle instead of wiring the
// validator, coordinator, bus, locks and bus endpoint by hand.
//
// Startup sequence (start()):
//   1. Register expected totals with the validator.
//   2. Seed prices and stock from the configuration.
//   3. Take a validator snapshot of the seeded ledger.
//   4. Put the coordinator on the bus (CoordinatorEndpoint).
//
// runWatchCycle() runs process() for every configured watch entry. Each
// call holds every cell of the entry's SKU through a CellLockGuard, since
// the source is not known until selection has run. A lock timeout is
// reported in the WatchResult and never retried.
//
// Thread model:
//   start()/stop() from one thread. Between them, runWatchCycle() and the
//   component accessors may be used from any number of threads.
//
// Ownership:
//   DepotEngine
//    ├── validator_    (StockValidator: value member)
//    ├── coordinator_  (TransferCoordinator: value member)
//    ├── bus_          (MessageBus: value member)
//    ├── locks_        (ResourceLock: value member)
//    └── endpoint_     (unique_ptr<CoordinatorEndpoint>, created in start())
//
//   The endpoint is heap-allocated so it can be removed from the bus in
//   stop() before the bus and coordinator are destroyed.
// -----------------------------------------------------------------------------
class DepotEngine {
 public:
  DepotEngine(const ITimeProvider& clock, EngineConfig config);

  // Destructor calls stop().
  ~DepotEngine();

  DepotEngine(const DepotEngine&) = delete;
  DepotEngine& operator=(const DepotEngine&) = delete;
  DepotEngine(DepotEngine&&) = delete;
  DepotEngine& operator=(DepotEngine&&) = delete;

  // Idempotent.
  void start();

  // Unregisters the endpoint. Idempotent.
  void stop();

  bool isRunning() const { return running_; }

  // -------------------------------------------------------------------------
  // runWatchCycle(owner)
  // -------------------------------------------------------------------------
  // @brief  process() for every watch entry, under cell locks held by
  //         `owner`.
  // @return One WatchResult per entry, in configuration order.
  // -------------------------------------------------------------------------
  std::vector<WatchResult> runWatchCycle(const std::string& owner = "watcher");

  // Daily verification of the current ledger.
  VerificationReport verify() const;

  const EngineConfig& config() const { return config_; }
  std::chrono::milliseconds lockTimeout() const;

  StockValidator& validator() { return validator_; }
  TransferCoordinator& coordinator() { return coordinator_; }
  MessageBus& bus() { return bus_; }
  ResourceLock& locks() { return locks_; }

 private:
  // Lock keys of every ledger cell holding `sku`, plus `extra`.
  std::vector<std::string> cellKeysFor(const std::string& sku,
                                       const std::string& extra) const;

  const ITimeProvider& clock_;
  const EngineConfig config_;

  StockValidator validator_;
  TransferCoordinator coordinator_;
  MessageBus bus_;
  ResourceLock locks_;
  std::unique_ptr<CoordinatorEndpoint> endpoint_;

  bool running_{false};
};

}  // namespace depot
