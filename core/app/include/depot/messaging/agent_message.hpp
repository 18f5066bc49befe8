#pragma once

#include "depot/domain/stock_key.hpp"
#include "depot/domain/transfer_request.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace depot {

// -----------------------------------------------------------------------------
// MessageType
// -----------------------------------------------------------------------------
// Kind of an AgentMessage. Always derived from the payload alternative, see
// AgentMessage::type().
// -----------------------------------------------------------------------------
enum class MessageType {
  DataRequest,
  DataResponse,
  Alert,
  TransferRequest,
  TransferResponse,
  Error,
  StatusUpdate,
};

// Wire name, e.g. "data_request".
const char* toString(MessageType type);

// -----------------------------------------------------------------------------
// Payloads: one struct per message type
// -----------------------------------------------------------------------------

// Ask the receiver for a named piece of data ("stock_level", ...).
struct DataRequestPayload {
  std::string data_type;
  nlohmann::json params = nlohmann::json::object();
};

// Answer to a DataRequestPayload. `data` layout depends on data_type.
struct DataResponsePayload {
  std::string data_type;
  nlohmann::json data = nlohmann::json::object();
};

// Fan-out notice, e.g. "transfer_awaiting_approval" or "low_stock".
struct AlertPayload {
  std::string alert_type;
  nlohmann::json details = nlohmann::json::object();
};

// Ask the receiver (normally the coordinator) to move stock.
struct TransferRequestPayload {
  std::string source_warehouse_id;
  std::string target_warehouse_id;
  std::string sku;
  domain::Quantity quantity{0};
  std::string reason;
  double aging_priority{0.0};
  double sales_potential{0.0};
};

// Answer to a TransferRequestPayload. On refusal transfer_id and status are
// empty and `error` holds the reason.
struct TransferResponsePayload {
  std::optional<domain::TransferId> transfer_id;
  std::optional<domain::TransferStatus> status;
  std::string error;
};

// A handler failed. Sent back to the original sender and, as a separate
// notification from "system", to every other registered actor.
struct ErrorPayload {
  std::string failed_actor;
  std::string error_type;
  std::string error_message;
  std::optional<std::string> original_message_id;
};

struct StatusUpdatePayload {
  std::string status;
  nlohmann::json details = nlohmann::json::object();
};

// Variant order mirrors MessageType.
using MessagePayload = std::variant<
    DataRequestPayload,
    DataResponsePayload,
    AlertPayload,
    TransferRequestPayload,
    TransferResponsePayload,
    ErrorPayload,
    StatusUpdatePayload>;

MessageType messageTypeOf(const MessagePayload& payload);

// -----------------------------------------------------------------------------
// AgentMessage
// -----------------------------------------------------------------------------
//
// @brief  One exchange on the MessageBus.
//
// @details
// Messages are values: the bus logs a copy on every send and never mutates
// a message after logging it. `id` and `timestamp_ms` are stamped by the
// bus when left empty / zero. `correlation_id` links a response to the id
// of the request it answers.
//
// Handlers use std::get_if on `payload` to read the concrete type.
// -----------------------------------------------------------------------------
struct AgentMessage {
  std::string id;
  std::string sender;
  std::string receiver;
  MessagePayload payload;
  std::int64_t timestamp_ms{0};
  std::optional<std::string> correlation_id;

  MessageType type() const { return messageTypeOf(payload); }
};

}  // namespace depot
