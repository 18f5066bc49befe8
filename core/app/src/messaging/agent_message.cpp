#include "depot/messaging/agent_message.hpp"

namespace depot {

const char* toString(MessageType type) {
  using T = MessageType;
  switch (type) {
    case T::DataRequest:      return "data_request";
    case T::DataResponse:     return "data_response";
    case T::Alert:            return "alert";
    case T::TransferRequest:  return "transfer_request";
    case T::TransferResponse: return "transfer_response";
    case T::Error:            return "error";
    case T::StatusUpdate:     return "status_update";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// messageTypeOf: variant alternative → MessageType
// -----------------------------------------------------------------------------
MessageType messageTypeOf(const MessagePayload& payload) {
  struct Visitor {
    MessageType operator()(const DataRequestPayload&) const {
      return MessageType::DataRequest;
    }
    MessageType operator()(const DataResponsePayload&) const {
      return MessageType::DataResponse;
    }
    MessageType operator()(const AlertPayload&) const {
      return MessageType::Alert;
    }
    MessageType operator()(const TransferRequestPayload&) const {
      return MessageType::TransferRequest;
    }
    MessageType operator()(const TransferResponsePayload&) const {
      return MessageType::TransferResponse;
    }
    MessageType operator()(const ErrorPayload&) const {
      return MessageType::Error;
    }
    MessageType operator()(const StatusUpdatePayload&) const {
      return MessageType::StatusUpdate;
    }
  };
  return std::visit(Visitor{}, payload);
}

}  // namespace depot
