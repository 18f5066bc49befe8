// =============================================================================
// message_bus_test.cpp
// =============================================================================
// Unit tests for depot::MessageBus.
//
// Validates:
//   - Point-to-point delivery and correlation ids on responses
//   - Handler order and "first non-empty response wins"
//   - Missing receiver, unregisterHandler
//   - broadcastAlert fan-out to all but the sender
//   - Handler failure: error response to the sender plus error notifications
//     to every other actor, without cascading
//   - Message log and per-actor filtering
//
// All tests are single-threaded; handlers run on the sending thread.
// =============================================================================

#include "depot/domain/errors.hpp"
#include "depot/messaging/message_bus.hpp"
#include "depot/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace {

// Handler that answers every data_request with a data_response echoing the
// requested data_type.
depot::MessageBus::Handler echoHandler(depot::MessageBus& bus,
                                       const std::string& self) {
  return [&bus, self](const depot::AgentMessage& m)
             -> std::optional<depot::AgentMessage> {
    auto* request = std::get_if<depot::DataRequestPayload>(&m.payload);
    if (request == nullptr) {
      return std::nullopt;
    }
    depot::DataResponsePayload response;
    response.data_type = request->data_type;
    response.data = {{"from", self}};
    return bus.createMessage(self, m.sender, response);
  };
}

}  // namespace

// =============================================================================
// Test fixture: fresh bus on a simulated clock.
// =============================================================================
class MessageBusTest : public ::testing::Test {
 protected:
  depot::SimulationTimeProvider clock{1'700'000'000'000};
  depot::MessageBus bus{clock};
};

// -----------------------------------------------------------------------------
// 1. requestData reaches the provider and the response is correlated.
// -----------------------------------------------------------------------------
TEST_F(MessageBusTest, RequestDataReturnsCorrelatedResponse) {
  bus.registerHandler("Inventory", echoHandler(bus, "Inventory"));

  auto response = bus.requestData("Monitor", "Inventory", "stock_level");

  ASSERT_TRUE(response.has_value());
  EXPECT_EQ(response->type(), depot::MessageType::DataResponse);
  EXPECT_EQ(response->sender, "Inventory");
  EXPECT_EQ(response->receiver, "Monitor");
  ASSERT_TRUE(response->correlation_id.has_value());

  auto log = bus.getMessageLog();
  ASSERT_EQ(log.size(), 2u);
  EXPECT_EQ(*response->correlation_id, log[0].id);
  EXPECT_EQ(log[0].type(), depot::MessageType::DataRequest);
  EXPECT_EQ(log[0].timestamp_ms, 1'700'000'000'000);
}

// -----------------------------------------------------------------------------
// 2. Handlers run in registration order; the first non-empty answer wins and
//    later handlers are not invoked.
// -----------------------------------------------------------------------------
TEST_F(MessageBusTest, FirstNonEmptyResponseWins) {
  std::vector<std::string> calls;

  bus.registerHandler("Svc", [&calls](const depot::AgentMessage&)
                                 -> std::optional<depot::AgentMessage> {
    calls.push_back("silent");
    return std::nullopt;
  });
  bus.registerHandler("Svc", [&calls, this](const depot::AgentMessage& m)
                                 -> std::optional<depot::AgentMessage> {
    calls.push_back("answer");
    return bus.createMessage("Svc", m.sender,
                             depot::StatusUpdatePayload{"ok", {}});
  });
  bus.registerHandler("Svc", [&calls](const depot::AgentMessage&)
                                 -> std::optional<depot::AgentMessage> {
    calls.push_back("never");
    return std::nullopt;
  });

  auto response = bus.requestData("Client", "Svc", "anything");

  ASSERT_TRUE(response.has_value());
  EXPECT_EQ(response->type(), depot::MessageType::StatusUpdate);
  EXPECT_EQ(calls, (std::vector<std::string>{"silent", "answer"}));
}

// -----------------------------------------------------------------------------
// 3. Sending to an actor without handlers logs the message and returns
//    nullopt.
// -----------------------------------------------------------------------------
TEST_F(MessageBusTest, UnknownReceiverReturnsNullopt) {
  auto response = bus.requestData("Client", "Nobody", "stock_level");

  EXPECT_FALSE(response.has_value());
  EXPECT_EQ(bus.getMessageLog().size(), 1u);
}

// -----------------------------------------------------------------------------
// 4. unregisterHandler stops delivery; unknown ids are ignored.
// -----------------------------------------------------------------------------
TEST_F(MessageBusTest, UnregisterStopsDelivery) {
  auto id = bus.registerHandler("Inventory", echoHandler(bus, "Inventory"));
  ASSERT_TRUE(bus.requestData("Client", "Inventory", "x").has_value());

  bus.unregisterHandler(id);
  bus.unregisterHandler(9999);

  EXPECT_FALSE(bus.requestData("Client", "Inventory", "x").has_value());
  EXPECT_TRUE(bus.registeredActors().empty());
}

// -----------------------------------------------------------------------------
// 5. broadcastAlert reaches every actor except the sender.
// -----------------------------------------------------------------------------
TEST_F(MessageBusTest, BroadcastAlertSkipsSender) {
  std::vector<std::string> alerted;
  auto recorder = [&alerted](const std::string& name) {
    return [&alerted, name](const depot::AgentMessage& m)
               -> std::optional<depot::AgentMessage> {
      if (m.type() == depot::MessageType::Alert) {
        alerted.push_back(name);
      }
      return std::nullopt;
    };
  };
  bus.registerHandler("A", recorder("A"));
  bus.registerHandler("B", recorder("B"));
  bus.registerHandler("C", recorder("C"));

  bus.broadcastAlert("B", depot::AlertPayload{"low_stock", {{"sku", "S1"}}});

  EXPECT_EQ(alerted, (std::vector<std::string>{"A", "C"}));
}

// -----------------------------------------------------------------------------
// 6. A throwing handler produces an error response to the sender and an
//    error notification from "system" to every other registered actor.
// Why: Other actors must learn that a peer failed even though nobody asked
//      them.
// -----------------------------------------------------------------------------
TEST_F(MessageBusTest, HandlerFailureNotifiesOtherActors) {
  std::vector<depot::AgentMessage> observer_inbox;

  bus.registerHandler("Faulty", [](const depot::AgentMessage&)
                                    -> std::optional<depot::AgentMessage> {
    throw depot::InsufficientStockError("only 3 left", 10, 3);
  });
  bus.registerHandler("Observer", [&observer_inbox](const depot::AgentMessage& m)
                                      -> std::optional<depot::AgentMessage> {
    observer_inbox.push_back(m);
    return std::nullopt;
  });
  bus.registerHandler("Client", [](const depot::AgentMessage&)
                                    -> std::optional<depot::AgentMessage> {
    return std::nullopt;
  });

  auto response = bus.requestData("Client", "Faulty", "stock_level");

  ASSERT_TRUE(response.has_value());
  EXPECT_EQ(response->type(), depot::MessageType::Error);
  EXPECT_EQ(response->sender, "Faulty");
  EXPECT_EQ(response->receiver, "Client");
  auto* error = std::get_if<depot::ErrorPayload>(&response->payload);
  ASSERT_NE(error, nullptr);
  EXPECT_EQ(error->failed_actor, "Faulty");
  EXPECT_EQ(error->error_type, "InsufficientStockError");
  EXPECT_EQ(error->error_message, "only 3 left");

  ASSERT_EQ(observer_inbox.size(), 1u);
  EXPECT_EQ(observer_inbox[0].sender, depot::MessageBus::kSystemActor);
  EXPECT_EQ(observer_inbox[0].type(), depot::MessageType::Error);

  // Client is notified too: it is neither the failed actor nor excluded.
  auto client_messages = bus.getAgentMessages("Client");
  int system_notices = 0;
  for (const auto& m : client_messages) {
    if (m.sender == depot::MessageBus::kSystemActor) {
      ++system_notices;
    }
  }
  EXPECT_EQ(system_notices, 1);
}

// -----------------------------------------------------------------------------
// 7. A handler that fails while processing an error notification does not
//    trigger another round of notifications.
// -----------------------------------------------------------------------------
TEST_F(MessageBusTest, ErrorNotificationsDoNotCascade) {
  int observer_calls = 0;

  bus.registerHandler("Faulty", [](const depot::AgentMessage&)
                                    -> std::optional<depot::AgentMessage> {
    throw std::runtime_error("boom");
  });
  bus.registerHandler("Fragile", [](const depot::AgentMessage&)
                                     -> std::optional<depot::AgentMessage> {
    throw std::runtime_error("fragile too");
  });
  bus.registerHandler("Observer", [&observer_calls](const depot::AgentMessage&)
                                      -> std::optional<depot::AgentMessage> {
    ++observer_calls;
    return std::nullopt;
  });

  bus.requestData("Client", "Faulty", "x");

  // Observer sees the single notification about Faulty, nothing about
  // Fragile's failure while handling it.
  EXPECT_EQ(observer_calls, 1);
}

// -----------------------------------------------------------------------------
// 8. notifyAgentsOfError honours the exclude list.
// -----------------------------------------------------------------------------
TEST_F(MessageBusTest, NotifyAgentsOfErrorHonoursExclude) {
  std::vector<std::string> notified;
  auto recorder = [&notified](const std::string& name) {
    return [&notified, name](const depot::AgentMessage&)
               -> std::optional<depot::AgentMessage> {
      notified.push_back(name);
      return std::nullopt;
    };
  };
  bus.registerHandler("A", recorder("A"));
  bus.registerHandler("B", recorder("B"));
  bus.registerHandler("C", recorder("C"));

  bus.notifyAgentsOfError("A", depot::ValidationError("bad"), {"C"});

  EXPECT_EQ(notified, (std::vector<std::string>{"B"}));
}

// -----------------------------------------------------------------------------
// 9. getAgentMessages returns only messages the actor sent or received.
// -----------------------------------------------------------------------------
TEST_F(MessageBusTest, AgentMessagesFilterByActor) {
  bus.registerHandler("Inventory", echoHandler(bus, "Inventory"));
  bus.requestData("Monitor", "Inventory", "a");
  bus.requestData("Planner", "Inventory", "b");

  EXPECT_EQ(bus.getAgentMessages("Monitor").size(), 2u);
  EXPECT_EQ(bus.getAgentMessages("Planner").size(), 2u);
  EXPECT_EQ(bus.getAgentMessages("Inventory").size(), 4u);
  EXPECT_TRUE(bus.getAgentMessages("Other").empty());
}
