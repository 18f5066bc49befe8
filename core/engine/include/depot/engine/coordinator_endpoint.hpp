#pragma once

#include "depot/engine/transfer_coordinator.hpp"
#include "depot/messaging/message_bus.hpp"

#include <optional>

namespace depot {

// -----------------------------------------------------------------------------
// CoordinatorEndpoint
// -----------------------------------------------------------------------------
//
// @brief  Puts a TransferCoordinator on the MessageBus under its actor name.
//
// @details
// Handled message types:
//
//   data_request      "stock_level"        params {warehouse_id, sku}
//                     "total_stock"        params {sku}
//                     "pending_approvals"  no params
//                     Answered with a data_response. An unknown data_type or
//                     a missing parameter raises ValidationError, which the
//                     bus turns into an error response.
//
//   transfer_request  Calls executeTransfer() and answers with a
//                     transfer_response carrying the transfer id and status.
//                     Validation and stock errors are answered in the
//                     response's `error` field rather than thrown. When the
//                     transfer is parked for approval, an alert
//                     "transfer_awaiting_approval" is broadcast to every
//                     other actor first.
//
//   alert / error / status_update
//                     Logged, no response.
//
// Thread model:
//   Handlers run on whichever thread sends the message. The coordinator is
//   thread-safe, so concurrent senders are fine.
//
// Ownership:
//   Registers in the constructor and unregisters in the destructor. The bus
//   and the coordinator must outlive the endpoint.
// -----------------------------------------------------------------------------
class CoordinatorEndpoint {
 public:
  CoordinatorEndpoint(MessageBus& bus, TransferCoordinator& coordinator);
  ~CoordinatorEndpoint();

  CoordinatorEndpoint(const CoordinatorEndpoint&) = delete;
  CoordinatorEndpoint& operator=(const CoordinatorEndpoint&) = delete;
  CoordinatorEndpoint(CoordinatorEndpoint&&) = delete;
  CoordinatorEndpoint& operator=(CoordinatorEndpoint&&) = delete;

 private:
  std::optional<AgentMessage> onMessage(const AgentMessage& message);

  AgentMessage onDataRequest(const AgentMessage& message,
                             const DataRequestPayload& request);
  AgentMessage onTransferRequest(const AgentMessage& message,
                                 const TransferRequestPayload& request);

  MessageBus& bus_;
  TransferCoordinator& coordinator_;
  MessageBus::HandlerId handler_id_;
};

}  // namespace depot
