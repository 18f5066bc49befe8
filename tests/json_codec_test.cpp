// =============================================================================
// json_codec_test.cpp
// =============================================================================
// Field-level checks of the JSON renderers used for export and reporting.
// =============================================================================

#include "depot/serialization/json_codec.hpp"
#include "depot/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

// 2023-11-14T22:13:20.000Z
constexpr std::int64_t kEpochMs = 1'700'000'000'000;

// -----------------------------------------------------------------------------
// 1. formatIso8601 renders UTC with millisecond precision.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, Iso8601Formatting) {
  EXPECT_EQ(depot::formatIso8601(0), "1970-01-01T00:00:00.000Z");
  EXPECT_EQ(depot::formatIso8601(kEpochMs + 123), "2023-11-14T22:13:20.123Z");
}

// -----------------------------------------------------------------------------
// 2. TransferRequest: wire status name, ISO time next to the raw value,
//    null completion while unfinished.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, TransferRequestFields) {
  depot::domain::TransferRequest request;
  request.id = "TRF-000001";
  request.source_warehouse_id = "WH2";
  request.target_warehouse_id = "WH1";
  request.sku = "S1";
  request.quantity = 35;
  request.reason = "auto_transfer";
  request.requires_approval = true;
  request.status = depot::domain::TransferStatus::AwaitingApproval;
  request.created_at_ms = kEpochMs;

  nlohmann::json j = request;

  EXPECT_EQ(j["id"], "TRF-000001");
  EXPECT_EQ(j["quantity"], 35);
  EXPECT_EQ(j["status"], "awaiting_approval");
  EXPECT_EQ(j["requires_approval"], true);
  EXPECT_EQ(j["created_at_ms"], kEpochMs);
  EXPECT_EQ(j["created_at"], "2023-11-14T22:13:20.000Z");
  EXPECT_TRUE(j["completed_at"].is_null());
  EXPECT_TRUE(j["completed_at_ms"].is_null());

  request.status = depot::domain::TransferStatus::Completed;
  request.completed_at_ms = kEpochMs + 1000;
  j = request;
  EXPECT_EQ(j["status"], "completed");
  EXPECT_EQ(j["completed_at"], "2023-11-14T22:13:21.000Z");
}

// -----------------------------------------------------------------------------
// 3. AuditLogEntry: delta, a null transfer id for adjustments, details as
//    given.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, AuditLogEntryFields) {
  depot::domain::AuditLogEntry entry;
  entry.entry_id = "AUD-000001";
  entry.operation_type = "adjustment";
  entry.warehouse_id = "WH1";
  entry.sku = "S1";
  entry.quantity_before = 0;
  entry.quantity_after = 5;
  entry.delta = 5;
  entry.triggered_by = "config";
  entry.timestamp_ms = kEpochMs;

  nlohmann::json j = entry;

  EXPECT_EQ(j["operation_type"], "adjustment");
  EXPECT_EQ(j["delta"], 5);
  EXPECT_EQ(j["triggered_by"], "config");
  EXPECT_TRUE(j["transfer_id"].is_null());
  EXPECT_TRUE(j["details"].is_null());
  EXPECT_EQ(j["timestamp"], "2023-11-14T22:13:20.000Z");

  entry.operation_type = "rollback";
  entry.details = {{"reason", "conservation check failed"}};
  j = entry;
  EXPECT_EQ(j["details"]["reason"], "conservation check failed");
}

// -----------------------------------------------------------------------------
// 4. AgentMessage: message_type and type-specific payload keys.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, AgentMessagePayloads) {
  depot::AgentMessage message;
  message.id = "MSG-000002";
  message.sender = "TransferCoordinator";
  message.receiver = "Monitor";
  message.timestamp_ms = kEpochMs;
  message.correlation_id = "MSG-000001";
  message.payload = depot::ErrorPayload{"TransferCoordinator",
                                        "InsufficientStockError",
                                        "only 3 left", std::string("MSG-000001")};

  nlohmann::json j = message;

  EXPECT_EQ(j["message_type"], "error");
  EXPECT_EQ(j["correlation_id"], "MSG-000001");
  EXPECT_EQ(j["payload"]["failed_agent"], "TransferCoordinator");
  EXPECT_EQ(j["payload"]["error_type"], "InsufficientStockError");
  EXPECT_EQ(j["payload"]["original_message_id"], "MSG-000001");

  depot::TransferResponsePayload response;
  response.transfer_id = "TRF-000003";
  response.status = depot::domain::TransferStatus::Completed;
  auto payload = depot::payloadToJson(response);
  EXPECT_EQ(payload["transfer_id"], "TRF-000003");
  EXPECT_EQ(payload["status"], "completed");
  EXPECT_EQ(payload["error"], "");

  auto refused = depot::payloadToJson(depot::TransferResponsePayload{});
  EXPECT_TRUE(refused["transfer_id"].is_null());
  EXPECT_TRUE(refused["status"].is_null());
}

// -----------------------------------------------------------------------------
// 5. VerificationReport: discrepancy list and per-SKU details.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, VerificationReportFields) {
  depot::VerificationReport report;
  report.verified_at_ms = kEpochMs;
  report.total_skus_checked = 2;
  report.discrepancies.push_back(depot::StockDiscrepancy{"S2", 15, 10, -5});
  report.details["S1"] = depot::SkuVerification{205, 205, true};
  report.details["S2"] = depot::SkuVerification{15, 10, false};
  report.all_valid = false;

  nlohmann::json j = report;

  EXPECT_EQ(j["all_valid"], false);
  EXPECT_EQ(j["total_skus_checked"], 2);
  EXPECT_EQ(j["verified_at"], "2023-11-14T22:13:20.000Z");
  ASSERT_EQ(j["discrepancies"].size(), 1u);
  EXPECT_EQ(j["discrepancies"][0]["difference"], -5);
  EXPECT_EQ(j["details"]["S1"]["valid"], true);
  EXPECT_EQ(j["details"]["S2"]["actual"], 10);
}
