#pragma once

#include "depot/concurrent/id_generator.hpp"
#include "depot/messaging/agent_message.hpp"
#include "depot/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace depot {

// -----------------------------------------------------------------------------
// MessageBus
// -----------------------------------------------------------------------------
//
// @brief  Synchronous request/response and broadcast channel between named
//         actors, with a full chronological message log.
//
// @details
// Actors register one or more handlers under their name. sendMessage()
// logs the message, then invokes the receiver's handlers in registration
// order and returns the first non-empty response, stamped with
// correlation_id = request id and appended to the log.
//
// Handler failure:
//   If a handler throws a std::exception, the bus
//     1. builds an Error-typed response from the receiver back to the
//        sender (correlation_id = request id) and logs it,
//     2. notifies every other registered actor with an Error message from
//        "system" naming the failed actor and the exception,
//     3. returns the error response to the caller.
//   Notifications do not cascade: if a handler fails while processing an
//   error notification, the failure is logged on std::cerr and no further
//   notifications are sent. This is fault awareness, not recovery.
//
// Thread model:
//   Thread-safe for concurrent register/unregister/send from any thread.
//   Handlers run synchronously on the caller's thread. The handler list is
//   copied under the lock and handlers are invoked without holding it, so a
//   handler may send further messages or unregister without deadlock.
//
// Ownership:
//   Does not own the time provider; it must outlive the bus.
// -----------------------------------------------------------------------------
class MessageBus {
 public:
  // Returns a response, or nullopt to let the next handler (if any) answer.
  using Handler =
      std::function<std::optional<AgentMessage>(const AgentMessage&)>;

  // Opaque id returned by registerHandler(); pass to unregisterHandler().
  using HandlerId = std::size_t;

  /// Sender name used for error notifications.
  static constexpr const char* kSystemActor = "system";

  explicit MessageBus(const ITimeProvider& clock);

  MessageBus(const MessageBus&) = delete;
  MessageBus& operator=(const MessageBus&) = delete;

  // -------------------------------------------------------------------------
  // registerHandler(actor, handler)
  // -------------------------------------------------------------------------
  // @brief  Adds `handler` to the handlers of `actor`. An actor may hold
  //         several handlers; they are tried in registration order.
  // @return HandlerId for unregisterHandler().
  // -------------------------------------------------------------------------
  HandlerId registerHandler(const std::string& actor, Handler handler);

  // Removes one handler. Unknown ids are ignored.
  void unregisterHandler(HandlerId id);

  // Actors with at least one handler, in order of first registration.
  std::vector<std::string> registeredActors() const;

  // -------------------------------------------------------------------------
  // createMessage(sender, receiver, payload)
  // -------------------------------------------------------------------------
  // @brief  Builds a message with a fresh "MSG-" id and the current time.
  //         Does not send or log it.
  // -------------------------------------------------------------------------
  AgentMessage createMessage(const std::string& sender,
                             const std::string& receiver,
                             MessagePayload payload);

  // -------------------------------------------------------------------------
  // sendMessage(message)
  // -------------------------------------------------------------------------
  //
  // @brief  Logs `message` and delivers it to the receiver's handlers.
  //
  // @return The first non-empty handler response; an Error response if a
  //         handler threw; nullopt if the receiver has no handler or no
  //         handler answered.
  //
  // Side-effects: Appends the message, the response, and any error
  //               notifications to the log.
  // -------------------------------------------------------------------------
  std::optional<AgentMessage> sendMessage(AgentMessage message);

  // -------------------------------------------------------------------------
  // requestData(requester, provider, data_type, params)
  // -------------------------------------------------------------------------
  // @brief  Point-to-point DataRequest; returns the provider's answer.
  // -------------------------------------------------------------------------
  std::optional<AgentMessage> requestData(
      const std::string& requester, const std::string& provider,
      const std::string& data_type,
      nlohmann::json params = nlohmann::json::object());

  // -------------------------------------------------------------------------
  // broadcastAlert(sender, alert)
  // -------------------------------------------------------------------------
  // @brief  Sends an Alert to every registered actor except `sender`.
  // @return The non-empty responses, in actor registration order.
  // -------------------------------------------------------------------------
  std::vector<AgentMessage> broadcastAlert(const std::string& sender,
                                           AlertPayload alert);

  // -------------------------------------------------------------------------
  // notifyAgentsOfError(failed_actor, error, exclude)
  // -------------------------------------------------------------------------
  // @brief  Sends an Error notification from "system" to every registered
  //         actor other than `failed_actor` and those listed in `exclude`.
  // @return The non-empty responses.
  // -------------------------------------------------------------------------
  std::vector<AgentMessage> notifyAgentsOfError(
      const std::string& failed_actor, const std::exception& error,
      const std::vector<std::string>& exclude = {});

  // Full chronological log (copy).
  std::vector<AgentMessage> getMessageLog() const;

  // Messages sent or received by `actor`.
  std::vector<AgentMessage> getAgentMessages(const std::string& actor) const;

 private:
  struct HandlerEntry {
    HandlerId id;
    std::string actor;
    Handler handler;
  };

  // Delivery with or without the error fan-out; notifications use
  // fan_out_errors = false so they never cascade.
  std::optional<AgentMessage> dispatch(AgentMessage message,
                                       bool fan_out_errors);

  void appendLog(const AgentMessage& message);

  // Fills in id / timestamp when the handler left them empty.
  void stamp(AgentMessage& message);

  static std::string errorTypeName(const std::exception& error);

  const ITimeProvider& clock_;
  IdGenerator id_gen_{"MSG"};

  mutable std::mutex mutex_;        // Protects handlers_, next_handler_id_, log_
  HandlerId next_handler_id_{0};
  std::vector<HandlerEntry> handlers_;
  std::vector<AgentMessage> log_;
};

}  // namespace depot
