// =============================================================================
// transfer_pipeline_test.cpp
// =============================================================================
// Integration tests: DepotEngine end to end and concurrent transfers.
//
// Pipeline under test:
//   EngineConfig -> DepotEngine::start() -> runWatchCycle() -> process()
//     -> approve / verify
//
// Concurrency tests use real threads; assertions are on final state
// (conservation, non-negativity, transfer counts), never on interleaving.
// =============================================================================

#include "depot/domain/errors.hpp"
#include "depot/engine/depot_engine.hpp"
#include "depot/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using depot::domain::OperationMode;
using depot::domain::TransferStatus;

namespace {

depot::EngineConfig demoConfig(OperationMode mode) {
  depot::EngineConfig config;
  config.approval.value_threshold = 5000.0;
  config.approval.mode = mode;
  config.lock_timeout_ms = 2000;
  config.prices = {{"S1", 1000.0}};
  config.stock = {{"WH1", "S1", 5}, {"WH2", "S1", 200}, {"WH3", "S1", 60}};
  config.watch = {{"WH1", "S1", 40}};
  config.expected_totals = {{"S1", 265}};
  return config;
}

}  // namespace

// =============================================================================
// Test fixture: simulated clock shared by every engine in a test.
// =============================================================================
class TransferPipelineTest : public ::testing::Test {
 protected:
  depot::SimulationTimeProvider clock{1'700'000'000'000};
};

// -----------------------------------------------------------------------------
// 1. Autonomous: one watch cycle restocks WH1 from the largest source and
//    the daily verification still balances.
// -----------------------------------------------------------------------------
TEST_F(TransferPipelineTest, WatchCycleRestocksAutonomously) {
  depot::DepotEngine engine(clock, demoConfig(OperationMode::Autonomous));
  engine.start();

  auto results = engine.runWatchCycle();

  ASSERT_EQ(results.size(), 1u);
  ASSERT_TRUE(results[0].outcome.has_value());
  auto* transferred = std::get_if<depot::domain::Transferred>(&*results[0].outcome);
  ASSERT_NE(transferred, nullptr);
  EXPECT_EQ(transferred->status, TransferStatus::Completed);
  EXPECT_EQ(transferred->source_warehouse_id, "WH2");
  EXPECT_EQ(transferred->quantity, 35);

  EXPECT_EQ(engine.coordinator().getStock("WH1", "S1"), 40);
  EXPECT_EQ(engine.coordinator().getStock("WH2", "S1"), 165);
  EXPECT_TRUE(engine.verify().all_valid);

  // Lock released after the cycle.
  EXPECT_FALSE(engine.locks().isLocked("WH1:S1"));
}

// -----------------------------------------------------------------------------
// 2. Supervised: the cycle parks the transfer; approving it completes the
//    restock. start() also put the coordinator on the bus.
// -----------------------------------------------------------------------------
TEST_F(TransferPipelineTest, SupervisedCycleThenApproval) {
  depot::DepotEngine engine(clock, demoConfig(OperationMode::Supervised));
  engine.start();
  engine.start();  // idempotent

  auto results = engine.runWatchCycle();
  ASSERT_TRUE(results[0].outcome.has_value());
  auto& transferred = std::get<depot::domain::Transferred>(*results[0].outcome);
  EXPECT_EQ(transferred.status, TransferStatus::AwaitingApproval);
  EXPECT_EQ(engine.coordinator().getStock("WH1", "S1"), 5);

  auto pending = engine.bus().requestData(
      "Operator", engine.coordinator().actorName(), "pending_approvals");
  ASSERT_TRUE(pending.has_value());
  EXPECT_EQ(
      std::get<depot::DataResponsePayload>(pending->payload).data["transfers"].size(),
      1u);

  auto approved = engine.coordinator().approveTransfer(transferred.transfer_id);
  EXPECT_EQ(approved.status, TransferStatus::Completed);
  EXPECT_EQ(engine.coordinator().getStock("WH1", "S1"), 40);
  EXPECT_TRUE(engine.verify().all_valid);

  engine.stop();
  EXPECT_FALSE(engine.isRunning());
  EXPECT_TRUE(engine.bus().registeredActors().empty());
}

// -----------------------------------------------------------------------------
// 3. A cell held by someone else makes the cycle report a lock timeout
//    instead of blocking or transferring.
// -----------------------------------------------------------------------------
TEST_F(TransferPipelineTest, HeldCellReportsLockTimeout) {
  auto config = demoConfig(OperationMode::Autonomous);
  config.lock_timeout_ms = 20;
  depot::DepotEngine engine(clock, config);
  engine.start();

  ASSERT_TRUE(engine.locks().acquire("WH2:S1", "auditor"));
  auto results = engine.runWatchCycle();
  ASSERT_TRUE(engine.locks().release("WH2:S1", "auditor"));

  ASSERT_EQ(results.size(), 1u);
  EXPECT_TRUE(results[0].lock_timeout);
  EXPECT_FALSE(results[0].outcome.has_value());
  EXPECT_EQ(engine.coordinator().getStock("WH1", "S1"), 5);
  EXPECT_TRUE(engine.coordinator().getAllTransfers().empty());
}

// -----------------------------------------------------------------------------
// 4. A seeded ledger that does not match the expected totals is reported.
// -----------------------------------------------------------------------------
TEST_F(TransferPipelineTest, VerificationFlagsDiscrepancy) {
  auto config = demoConfig(OperationMode::Autonomous);
  config.expected_totals["S1"] = 300;
  depot::DepotEngine engine(clock, config);
  engine.start();

  auto report = engine.verify();
  EXPECT_FALSE(report.all_valid);
  ASSERT_EQ(report.discrepancies.size(), 1u);
  EXPECT_EQ(report.discrepancies[0].difference, -35);
}

// -----------------------------------------------------------------------------
// 5. Several monitors run the same watch cycle at once: exactly one of them
//    transfers, the others find the cell already restocked.
// -----------------------------------------------------------------------------
TEST_F(TransferPipelineTest, ConcurrentMonitorsTransferOnce) {
  depot::DepotEngine engine(clock, demoConfig(OperationMode::Autonomous));
  engine.start();

  constexpr int kMonitors = 4;
  std::atomic<int> transferred{0};
  std::atomic<int> timeouts{0};
  std::vector<std::thread> monitors;
  for (int i = 0; i < kMonitors; ++i) {
    monitors.emplace_back([&engine, &transferred, &timeouts, i] {
      for (const auto& result : engine.runWatchCycle("monitor-" + std::to_string(i))) {
        if (result.lock_timeout) {
          ++timeouts;
        } else if (result.outcome.has_value() &&
                   std::holds_alternative<depot::domain::Transferred>(
                       *result.outcome)) {
          ++transferred;
        }
      }
    });
  }
  for (auto& t : monitors) {
    t.join();
  }

  EXPECT_EQ(timeouts.load(), 0);
  EXPECT_EQ(transferred.load(), 1);
  EXPECT_EQ(engine.coordinator().getAllTransfers().size(), 1u);
  EXPECT_EQ(engine.coordinator().getStock("WH1", "S1"), 40);
}

// -----------------------------------------------------------------------------
// 6. Many threads shuffling stock around a ring of warehouses: the SKU total
//    is conserved and no cell ever ends negative.
// -----------------------------------------------------------------------------
TEST_F(TransferPipelineTest, ConcurrentTransfersConserveStock) {
  depot::StockValidator validator{clock};
  depot::domain::ApprovalConfig approval;
  approval.mode = OperationMode::Autonomous;
  depot::TransferCoordinator coordinator{clock, validator, approval};
  depot::ResourceLock locks;

  const std::vector<std::string> ring{"WH1", "WH2", "WH3", "WH4"};
  for (const auto& wh : ring) {
    coordinator.setStock(wh, "S1", 100);
  }

  std::atomic<int> completed{0};
  std::atomic<int> refused{0};
  std::vector<std::thread> workers;
  for (std::size_t i = 0; i < ring.size(); ++i) {
    workers.emplace_back([&, i] {
      const std::string& source = ring[i];
      const std::string& target = ring[(i + 1) % ring.size()];
      const std::string owner = "worker-" + std::to_string(i);
      for (int n = 0; n < 100; ++n) {
        depot::CellLockGuard guard(
            locks, owner,
            {depot::domain::cellKey(source, "S1"),
             depot::domain::cellKey(target, "S1")},
            std::chrono::milliseconds(5000));
        if (!guard.owns()) {
          continue;
        }
        try {
          coordinator.executeTransfer(source, target, "S1", 7, "rebalance");
          ++completed;
        } catch (const depot::InsufficientStockError&) {
          ++refused;
        }
      }
    });
  }
  for (auto& t : workers) {
    t.join();
  }

  EXPECT_EQ(completed.load() + refused.load(), 400);
  EXPECT_EQ(coordinator.getTotalStock("S1"), 400);
  for (const auto& [key, quantity] : coordinator.getLedgerSnapshot()) {
    EXPECT_GE(quantity, 0) << depot::domain::cellKey(key);
  }
  EXPECT_TRUE(validator.checkNoNegativeStock(coordinator.getLedgerSnapshot())
                  .is_valid);

  // Four seeding adjustments plus one out and one in per completed transfer.
  EXPECT_EQ(validator.getAuditLog().size(),
            4u + 2u * static_cast<std::size_t>(completed.load()));
}
