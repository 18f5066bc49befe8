#include "depot/engine/coordinator_endpoint.hpp"
#include "depot/domain/errors.hpp"
#include "depot/serialization/json_codec.hpp"

#include <iostream>
#include <string>
#include <utility>

namespace depot {

namespace {

std::string requireParam(const nlohmann::json& params, const char* name) {
  auto it = params.find(name);
  if (it == params.end() || !it->is_string()) {
    throw ValidationError(std::string("Missing string parameter '") + name +
                          "'");
  }
  return it->get<std::string>();
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor / destructor: bus registration
// -----------------------------------------------------------------------------
CoordinatorEndpoint::CoordinatorEndpoint(MessageBus& bus,
                                         TransferCoordinator& coordinator)
    : bus_(bus), coordinator_(coordinator) {
  handler_id_ = bus_.registerHandler(
      coordinator_.actorName(),
      [this](const AgentMessage& m) { return onMessage(m); });
}

CoordinatorEndpoint::~CoordinatorEndpoint() {
  bus_.unregisterHandler(handler_id_);
}

// -----------------------------------------------------------------------------
// onMessage: dispatch on payload alternative
// -----------------------------------------------------------------------------
std::optional<AgentMessage> CoordinatorEndpoint::onMessage(
    const AgentMessage& message) {
  if (auto* request = std::get_if<DataRequestPayload>(&message.payload)) {
    return onDataRequest(message, *request);
  }
  if (auto* request = std::get_if<TransferRequestPayload>(&message.payload)) {
    return onTransferRequest(message, *request);
  }
  if (auto* error = std::get_if<ErrorPayload>(&message.payload)) {
    std::cerr << "[" << coordinator_.actorName() << "] Peer failure reported: "
              << error->failed_actor << " (" << error->error_type
              << "): " << error->error_message << "\n";
    return std::nullopt;
  }
  if (auto* alert = std::get_if<AlertPayload>(&message.payload)) {
    std::cout << "[" << coordinator_.actorName() << "] Alert from "
              << message.sender << ": " << alert->alert_type << "\n";
    return std::nullopt;
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// onDataRequest
// -----------------------------------------------------------------------------
AgentMessage CoordinatorEndpoint::onDataRequest(
    const AgentMessage& message, const DataRequestPayload& request) {
  DataResponsePayload response;
  response.data_type = request.data_type;

  if (request.data_type == "stock_level") {
    const std::string warehouse_id = requireParam(request.params, "warehouse_id");
    const std::string sku = requireParam(request.params, "sku");
    response.data = {{"warehouse_id", warehouse_id},
                     {"sku", sku},
                     {"quantity", coordinator_.getStock(warehouse_id, sku)}};
  } else if (request.data_type == "total_stock") {
    const std::string sku = requireParam(request.params, "sku");
    response.data = {{"sku", sku}, {"total", coordinator_.getTotalStock(sku)}};
  } else if (request.data_type == "pending_approvals") {
    nlohmann::json transfers = nlohmann::json::array();
    for (const auto& transfer : coordinator_.getPendingApprovals()) {
      transfers.push_back(transfer);
    }
    response.data = {{"transfers", transfers}};
  } else {
    throw ValidationError("Unknown data_type '" + request.data_type + "'");
  }

  return bus_.createMessage(coordinator_.actorName(), message.sender,
                            std::move(response));
}

// -----------------------------------------------------------------------------
// onTransferRequest: execute, alert on approval gating, answer
// -----------------------------------------------------------------------------
AgentMessage CoordinatorEndpoint::onTransferRequest(
    const AgentMessage& message, const TransferRequestPayload& request) {
  TransferResponsePayload response;
  try {
    domain::TransferRequest transfer = coordinator_.executeTransfer(
        request.source_warehouse_id, request.target_warehouse_id, request.sku,
        request.quantity, request.reason, request.aging_priority,
        request.sales_potential);
    response.transfer_id = transfer.id;
    response.status = transfer.status;

    if (transfer.status == domain::TransferStatus::AwaitingApproval) {
      AlertPayload alert;
      alert.alert_type = "transfer_awaiting_approval";
      alert.details = transfer;
      bus_.broadcastAlert(coordinator_.actorName(), std::move(alert));
    }
  } catch (const ValidationError& e) {
    response.error = e.what();
  }

  return bus_.createMessage(coordinator_.actorName(), message.sender,
                            std::move(response));
}

}  // namespace depot
