// =============================================================================
// transfer_approval_test.cpp
// =============================================================================
// Tests for the human-approval gate of depot::TransferCoordinator.
//
// Validates:
//   - requiresApproval() thresholds and operation modes
//   - Supervised transfers park in AwaitingApproval and do not move stock
//   - approveTransfer commits; rejectTransfer proposes alternatives
//   - Wrong-state and unknown-id calls raise ValidationError
//   - An approved transfer whose source drained meanwhile fails cleanly
// =============================================================================

#include "depot/domain/errors.hpp"
#include "depot/engine/transfer_coordinator.hpp"
#include "depot/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <string>
#include <vector>

using depot::domain::OperationMode;
using depot::domain::TransferAlternative;
using depot::domain::TransferStatus;

// =============================================================================
// Test fixture: supervised mode, value threshold 5000, S1 priced at 1000.
// =============================================================================
class TransferApprovalTest : public ::testing::Test {
 protected:
  static depot::domain::ApprovalConfig supervised() {
    depot::domain::ApprovalConfig config;
    config.value_threshold = 5000.0;
    config.quantity_threshold = 100;
    config.mode = OperationMode::Supervised;
    return config;
  }

  void SetUp() override {
    coordinator.setProductPrice("S1", 1000.0);
    coordinator.setStock("WH1", "S1", 5);
    coordinator.setStock("WH2", "S1", 50);
    coordinator.setStock("WH3", "S1", 80);
  }

  depot::SimulationTimeProvider clock{0};
  depot::StockValidator validator{clock};
  depot::TransferCoordinator coordinator{clock, validator, supervised()};
};

// -----------------------------------------------------------------------------
// 1. Value and quantity thresholds are inclusive; Autonomous never gates.
// -----------------------------------------------------------------------------
TEST_F(TransferApprovalTest, RequiresApprovalThresholds) {
  EXPECT_TRUE(coordinator.requiresApproval("S1", 10));   // 10000 >= 5000
  EXPECT_TRUE(coordinator.requiresApproval("S1", 5));    // 5000 >= 5000
  EXPECT_FALSE(coordinator.requiresApproval("S1", 4));

  // Unpriced SKU: only the quantity threshold applies.
  EXPECT_FALSE(coordinator.requiresApproval("S9", 99));
  EXPECT_TRUE(coordinator.requiresApproval("S9", 100));

  coordinator.setOperationMode(OperationMode::Autonomous);
  EXPECT_FALSE(coordinator.requiresApproval("S1", 10));
  EXPECT_FALSE(coordinator.requiresApproval("S9", 1000));
}

// -----------------------------------------------------------------------------
// 2. A gated transfer is parked: no stock moves until it is approved.
// -----------------------------------------------------------------------------
TEST_F(TransferApprovalTest, GatedTransferWaitsForApproval) {
  auto request = coordinator.executeTransfer("WH3", "WH1", "S1", 10, "restock");

  EXPECT_EQ(request.status, TransferStatus::AwaitingApproval);
  EXPECT_TRUE(request.requires_approval);
  EXPECT_EQ(coordinator.getStock("WH1", "S1"), 5);
  EXPECT_EQ(coordinator.getStock("WH3", "S1"), 80);

  auto pending = coordinator.getPendingApprovals();
  ASSERT_EQ(pending.size(), 1u);
  EXPECT_EQ(pending[0].id, request.id);
}

// -----------------------------------------------------------------------------
// 3. Approving commits the transfer and empties the queue.
// -----------------------------------------------------------------------------
TEST_F(TransferApprovalTest, ApproveCommits) {
  auto request = coordinator.executeTransfer("WH3", "WH1", "S1", 10, "restock");

  clock.advance_time(500);
  auto approved = coordinator.approveTransfer(request.id);

  EXPECT_EQ(approved.status, TransferStatus::Completed);
  EXPECT_EQ(approved.completed_at_ms, std::optional<std::int64_t>(500));
  EXPECT_EQ(coordinator.getStock("WH1", "S1"), 15);
  EXPECT_EQ(coordinator.getStock("WH3", "S1"), 70);
  EXPECT_TRUE(coordinator.getPendingApprovals().empty());
}

// -----------------------------------------------------------------------------
// 4. Under Autonomous mode the same request completes immediately.
// -----------------------------------------------------------------------------
TEST_F(TransferApprovalTest, AutonomousModeSkipsGate) {
  coordinator.setOperationMode(OperationMode::Autonomous);

  auto request = coordinator.executeTransfer("WH3", "WH1", "S1", 10, "restock");

  EXPECT_EQ(request.status, TransferStatus::Completed);
  EXPECT_FALSE(request.requires_approval);
  EXPECT_TRUE(coordinator.getPendingApprovals().empty());

  auto decisions = coordinator.getDecisionLog();
  ASSERT_FALSE(decisions.empty());
  EXPECT_EQ(decisions.front().decision_type, "mode_change");
  EXPECT_EQ(decisions.front().output["mode"], "autonomous");
}

// -----------------------------------------------------------------------------
// 5. Rejecting proposes half the quantity on the same route and the same
//    quantity from another source. Nothing moves.
// -----------------------------------------------------------------------------
TEST_F(TransferApprovalTest, RejectProposesAlternatives) {
  auto request = coordinator.executeTransfer("WH2", "WH1", "S1", 20, "restock");
  ASSERT_EQ(request.status, TransferStatus::AwaitingApproval);

  auto alternatives = coordinator.rejectTransfer(request.id);

  ASSERT_EQ(alternatives.size(), 2u);
  EXPECT_EQ(alternatives[0].kind, TransferAlternative::Kind::ReducedQuantity);
  EXPECT_EQ(alternatives[0].quantity, 10);
  EXPECT_EQ(alternatives[0].source_warehouse_id, "WH2");
  EXPECT_EQ(alternatives[1].kind, TransferAlternative::Kind::AlternativeSource);
  EXPECT_EQ(alternatives[1].source_warehouse_id, "WH3");
  EXPECT_EQ(alternatives[1].quantity, 20);

  auto stored = coordinator.getTransfer(request.id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status, TransferStatus::Rejected);
  EXPECT_EQ(coordinator.getStock("WH1", "S1"), 5);
  EXPECT_TRUE(coordinator.getPendingApprovals().empty());

  auto decisions = coordinator.getDecisionLog();
  ASSERT_FALSE(decisions.empty());
  EXPECT_EQ(decisions.back().decision_type, "transfer_rejected_alternatives");
}

// -----------------------------------------------------------------------------
// 6. When the rejected source is already the best one, only the reduced
//    quantity is proposed.
// -----------------------------------------------------------------------------
TEST_F(TransferApprovalTest, RejectWithoutBetterSource) {
  auto request = coordinator.executeTransfer("WH3", "WH1", "S1", 60, "restock");

  auto alternatives = coordinator.rejectTransfer(request.id);

  ASSERT_EQ(alternatives.size(), 1u);
  EXPECT_EQ(alternatives[0].kind, TransferAlternative::Kind::ReducedQuantity);
  EXPECT_EQ(alternatives[0].quantity, 30);
}

// -----------------------------------------------------------------------------
// 7. approve / reject on an unknown id or a transfer not awaiting approval
//    raise ValidationError.
// -----------------------------------------------------------------------------
TEST_F(TransferApprovalTest, WrongStateRaises) {
  EXPECT_THROW(coordinator.approveTransfer("TRF-999999"), depot::ValidationError);
  EXPECT_THROW(coordinator.rejectTransfer("TRF-999999"), depot::ValidationError);

  auto request = coordinator.executeTransfer("WH3", "WH1", "S1", 10, "restock");
  coordinator.approveTransfer(request.id);

  EXPECT_THROW(coordinator.approveTransfer(request.id), depot::ValidationError);
  EXPECT_THROW(coordinator.rejectTransfer(request.id), depot::ValidationError);
  EXPECT_EQ(coordinator.getTransfer(request.id)->status,
            TransferStatus::Completed);
}

// -----------------------------------------------------------------------------
// 8. Stock drained while a transfer waits: approval fails the transfer with
//    InsufficientStockError and leaves the ledger untouched.
// -----------------------------------------------------------------------------
TEST_F(TransferApprovalTest, ApproveAfterSourceDrainedFails) {
  auto request = coordinator.executeTransfer("WH3", "WH1", "S1", 10, "restock");
  coordinator.setStock("WH3", "S1", 3);

  EXPECT_THROW(coordinator.approveTransfer(request.id),
               depot::InsufficientStockError);

  EXPECT_EQ(coordinator.getTransfer(request.id)->status, TransferStatus::Failed);
  EXPECT_EQ(coordinator.getStock("WH1", "S1"), 5);
  EXPECT_EQ(coordinator.getStock("WH3", "S1"), 3);
  EXPECT_EQ(coordinator.getDecisionLog().back().decision_type, "transfer_failed");
}

// -----------------------------------------------------------------------------
// 9. process() on a gated quantity reports the parked transfer.
// -----------------------------------------------------------------------------
TEST_F(TransferApprovalTest, ProcessReportsParkedTransfer) {
  auto outcome = coordinator.process("WH1", "S1", 40);

  auto* transferred = std::get_if<depot::domain::Transferred>(&outcome);
  ASSERT_NE(transferred, nullptr);
  EXPECT_EQ(transferred->status, TransferStatus::AwaitingApproval);
  EXPECT_EQ(transferred->source_warehouse_id, "WH3");
  EXPECT_EQ(transferred->quantity, 35);
  EXPECT_EQ(coordinator.getStock("WH1", "S1"), 5);
}

// -----------------------------------------------------------------------------
// 10. The target filled up while a transfer waited: approval fails the
//     transfer with ValidationError instead of overflowing the cell.
// -----------------------------------------------------------------------------
TEST_F(TransferApprovalTest, ApproveIntoFullTargetFails) {
  auto request = coordinator.executeTransfer("WH3", "WH1", "S1", 10, "restock");
  ASSERT_EQ(request.status, TransferStatus::AwaitingApproval);
  const auto near_max = std::numeric_limits<depot::domain::Quantity>::max() - 5;
  coordinator.setStock("WH1", "S1", near_max);

  EXPECT_THROW(coordinator.approveTransfer(request.id), depot::ValidationError);

  EXPECT_EQ(coordinator.getTransfer(request.id)->status, TransferStatus::Failed);
  EXPECT_EQ(coordinator.getStock("WH1", "S1"), near_max);
  EXPECT_EQ(coordinator.getStock("WH3", "S1"), 80);
  EXPECT_EQ(coordinator.getDecisionLog().back().decision_type, "transfer_failed");
}
