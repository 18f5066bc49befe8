#include "depot/messaging/message_bus.hpp"
#include "depot/domain/errors.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace depot {

MessageBus::MessageBus(const ITimeProvider& clock) : clock_(clock) {}

// -----------------------------------------------------------------------------
// registerHandler / unregisterHandler
// -----------------------------------------------------------------------------
MessageBus::HandlerId MessageBus::registerHandler(const std::string& actor,
                                                  Handler handler) {
  std::lock_guard lock(mutex_);
  HandlerId id = next_handler_id_++;
  handlers_.push_back(HandlerEntry{id, actor, std::move(handler)});
  return id;
}

void MessageBus::unregisterHandler(HandlerId id) {
  std::lock_guard lock(mutex_);
  handlers_.erase(
      std::remove_if(handlers_.begin(), handlers_.end(),
                     [id](const HandlerEntry& e) { return e.id == id; }),
      handlers_.end());
}

std::vector<std::string> MessageBus::registeredActors() const {
  std::lock_guard lock(mutex_);
  std::vector<std::string> actors;
  for (const auto& entry : handlers_) {
    if (std::find(actors.begin(), actors.end(), entry.actor) == actors.end()) {
      actors.push_back(entry.actor);
    }
  }
  return actors;
}

// -----------------------------------------------------------------------------
// createMessage
// -----------------------------------------------------------------------------
AgentMessage MessageBus::createMessage(const std::string& sender,
                                       const std::string& receiver,
                                       MessagePayload payload) {
  AgentMessage message;
  message.id = id_gen_.next();
  message.sender = sender;
  message.receiver = receiver;
  message.payload = std::move(payload);
  message.timestamp_ms = clock_.now_ms();
  return message;
}

// -----------------------------------------------------------------------------
// sendMessage
// -----------------------------------------------------------------------------
std::optional<AgentMessage> MessageBus::sendMessage(AgentMessage message) {
  return dispatch(std::move(message), true);
}

// -----------------------------------------------------------------------------
// dispatch: log, run handlers in order, convert a throwing handler into an
// Error response
// -----------------------------------------------------------------------------
std::optional<AgentMessage> MessageBus::dispatch(AgentMessage message,
                                                 bool fan_out_errors) {
  stamp(message);
  appendLog(message);

  std::cout << "[MessageBus] " << message.sender << " -> " << message.receiver
            << " [" << toString(message.type()) << "] " << message.id << "\n";

  std::vector<Handler> targets;
  {
    std::lock_guard lock(mutex_);
    for (const auto& entry : handlers_) {
      if (entry.actor == message.receiver) {
        targets.push_back(entry.handler);
      }
    }
  }

  if (targets.empty()) {
    std::cerr << "[MessageBus] WARNING: no handler registered for "
              << message.receiver << ".\n";
    return std::nullopt;
  }

  for (const auto& handler : targets) {
    try {
      std::optional<AgentMessage> response = handler(message);
      if (response.has_value()) {
        stamp(*response);
        response->correlation_id = message.id;
        appendLog(*response);
        return response;
      }
    } catch (const std::exception& e) {
      ErrorPayload payload;
      payload.failed_actor = message.receiver;
      payload.error_type = errorTypeName(e);
      payload.error_message = e.what();
      payload.original_message_id = message.id;

      AgentMessage error_msg =
          createMessage(message.receiver, message.sender, std::move(payload));
      error_msg.correlation_id = message.id;
      appendLog(error_msg);

      std::cerr << "[MessageBus] ERROR: handler of " << message.receiver
                << " failed on " << message.id << ": " << e.what() << "\n";

      if (fan_out_errors) {
        notifyAgentsOfError(message.receiver, e);
      }
      return error_msg;
    }
  }

  return std::nullopt;
}

// -----------------------------------------------------------------------------
// requestData
// -----------------------------------------------------------------------------
std::optional<AgentMessage> MessageBus::requestData(
    const std::string& requester, const std::string& provider,
    const std::string& data_type, nlohmann::json params) {
  DataRequestPayload payload;
  payload.data_type = data_type;
  payload.params = std::move(params);
  return sendMessage(createMessage(requester, provider, std::move(payload)));
}

// -----------------------------------------------------------------------------
// broadcastAlert: fan-out to all but the sender
// -----------------------------------------------------------------------------
std::vector<AgentMessage> MessageBus::broadcastAlert(const std::string& sender,
                                                     AlertPayload alert) {
  std::vector<AgentMessage> responses;
  for (const auto& actor : registeredActors()) {
    if (actor == sender) {
      continue;
    }
    auto response = sendMessage(createMessage(sender, actor, alert));
    if (response.has_value()) {
      responses.push_back(std::move(*response));
    }
  }
  return responses;
}

// -----------------------------------------------------------------------------
// notifyAgentsOfError: fan-out from "system", no cascade
// -----------------------------------------------------------------------------
std::vector<AgentMessage> MessageBus::notifyAgentsOfError(
    const std::string& failed_actor, const std::exception& error,
    const std::vector<std::string>& exclude) {
  std::vector<AgentMessage> responses;
  for (const auto& actor : registeredActors()) {
    if (actor == failed_actor ||
        std::find(exclude.begin(), exclude.end(), actor) != exclude.end()) {
      continue;
    }

    ErrorPayload payload;
    payload.failed_actor = failed_actor;
    payload.error_type = errorTypeName(error);
    payload.error_message = error.what();

    auto response = dispatch(
        createMessage(kSystemActor, actor, std::move(payload)), false);
    if (response.has_value()) {
      responses.push_back(std::move(*response));
    }
  }
  return responses;
}

// -----------------------------------------------------------------------------
// Log accessors
// -----------------------------------------------------------------------------
std::vector<AgentMessage> MessageBus::getMessageLog() const {
  std::lock_guard lock(mutex_);
  return log_;
}

std::vector<AgentMessage> MessageBus::getAgentMessages(
    const std::string& actor) const {
  std::lock_guard lock(mutex_);
  std::vector<AgentMessage> result;
  for (const auto& message : log_) {
    if (message.sender == actor || message.receiver == actor) {
      result.push_back(message);
    }
  }
  return result;
}

void MessageBus::appendLog(const AgentMessage& message) {
  std::lock_guard lock(mutex_);
  log_.push_back(message);
}

void MessageBus::stamp(AgentMessage& message) {
  if (message.id.empty()) {
    message.id = id_gen_.next();
  }
  if (message.timestamp_ms == 0) {
    message.timestamp_ms = clock_.now_ms();
  }
}

// -----------------------------------------------------------------------------
// errorTypeName: most specific known exception type
// -----------------------------------------------------------------------------
std::string MessageBus::errorTypeName(const std::exception& error) {
  if (dynamic_cast<const InsufficientStockError*>(&error) != nullptr) {
    return "InsufficientStockError";
  }
  if (dynamic_cast<const StockInvariantError*>(&error) != nullptr) {
    return "StockInvariantError";
  }
  if (dynamic_cast<const ValidationError*>(&error) != nullptr) {
    return "ValidationError";
  }
  if (dynamic_cast<const ConfigError*>(&error) != nullptr) {
    return "ConfigError";
  }
  if (dynamic_cast<const std::runtime_error*>(&error) != nullptr) {
    return "runtime_error";
  }
  if (dynamic_cast<const std::logic_error*>(&error) != nullptr) {
    return "logic_error";
  }
  return "exception";
}

}  // namespace depot
