#pragma once

#include "depot/domain/audit_log_entry.hpp"
#include "depot/domain/decision_record.hpp"
#include "depot/domain/transfer_need.hpp"
#include "depot/domain/transfer_request.hpp"
#include "depot/messaging/agent_message.hpp"
#include "depot/validation/validation_result.hpp"

#include <nlohmann/json.hpp>

// -----------------------------------------------------------------------------
// JSON rendering of engine records
// -----------------------------------------------------------------------------
//
// @brief  nlohmann::json to_json() overloads, found by ADL, so records can be
//         assigned directly: `nlohmann::json j = transfer;`.
//
// @details
// Rendering is one-way: the engine never reads these records back. Enums are
// written as their wire names ("awaiting_approval", "transfer_request", ...).
// Every epoch-millisecond field "<x>_ms" is accompanied by an ISO-8601 UTC
// string field "<x>".
//
// Optional fields are written as null when empty.
// -----------------------------------------------------------------------------

namespace depot {
namespace domain {

void to_json(nlohmann::json& j, const TransferRequest& request);
void to_json(nlohmann::json& j, const AuditLogEntry& entry);
void to_json(nlohmann::json& j, const DecisionRecord& record);
void to_json(nlohmann::json& j, const TransferAlternative& alternative);
void to_json(nlohmann::json& j, const TransferNeed& need);

}  // namespace domain

// Payload rendered as an object whose keys depend on the message type.
nlohmann::json payloadToJson(const MessagePayload& payload);

void to_json(nlohmann::json& j, const AgentMessage& message);
void to_json(nlohmann::json& j, const StockDiscrepancy& discrepancy);
void to_json(nlohmann::json& j, const VerificationReport& report);

}  // namespace depot
