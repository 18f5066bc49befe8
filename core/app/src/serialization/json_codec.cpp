#include "depot/serialization/json_codec.hpp"
#include "depot/time/time_utils.hpp"

namespace depot {

namespace {

template <typename T>
nlohmann::json optionalToJson(const std::optional<T>& value) {
  return value.has_value() ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

}  // namespace

namespace domain {

// -----------------------------------------------------------------------------
// TransferRequest
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const TransferRequest& request) {
  j = nlohmann::json::object();
  j["id"] = request.id;
  j["source_warehouse_id"] = request.source_warehouse_id;
  j["target_warehouse_id"] = request.target_warehouse_id;
  j["sku"] = request.sku;
  j["quantity"] = request.quantity;
  j["reason"] = request.reason;
  j["priority_score"] = request.priority_score;
  j["requires_approval"] = request.requires_approval;
  j["status"] = toString(request.status);
  j["created_at_ms"] = request.created_at_ms;
  j["created_at"] = formatIso8601(request.created_at_ms);
  if (request.completed_at_ms.has_value()) {
    j["completed_at_ms"] = *request.completed_at_ms;
    j["completed_at"] = formatIso8601(*request.completed_at_ms);
  } else {
    j["completed_at_ms"] = nullptr;
    j["completed_at"] = nullptr;
  }
}

// -----------------------------------------------------------------------------
// AuditLogEntry
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const AuditLogEntry& entry) {
  j = nlohmann::json::object();
  j["entry_id"] = entry.entry_id;
  j["operation_type"] = entry.operation_type;
  j["warehouse_id"] = entry.warehouse_id;
  j["sku"] = entry.sku;
  j["quantity_before"] = entry.quantity_before;
  j["quantity_after"] = entry.quantity_after;
  j["delta"] = entry.delta;
  j["triggered_by"] = entry.triggered_by;
  j["transfer_id"] = optionalToJson(entry.transfer_id);
  j["details"] = entry.details;
  j["timestamp_ms"] = entry.timestamp_ms;
  j["timestamp"] = formatIso8601(entry.timestamp_ms);
}

void to_json(nlohmann::json& j, const DecisionRecord& record) {
  j = nlohmann::json::object();
  j["decision_id"] = record.decision_id;
  j["actor"] = record.actor;
  j["decision_type"] = record.decision_type;
  j["input"] = record.input;
  j["output"] = record.output;
  j["reasoning"] = record.reasoning;
  j["timestamp_ms"] = record.timestamp_ms;
  j["timestamp"] = formatIso8601(record.timestamp_ms);
}

void to_json(nlohmann::json& j, const TransferAlternative& alternative) {
  j = nlohmann::json::object();
  j["type"] = toString(alternative.kind);
  j["description"] = alternative.description;
  j["source_warehouse_id"] = alternative.source_warehouse_id;
  j["target_warehouse_id"] = alternative.target_warehouse_id;
  j["sku"] = alternative.sku;
  j["quantity"] = alternative.quantity;
}

void to_json(nlohmann::json& j, const TransferNeed& need) {
  j = nlohmann::json::object();
  j["warehouse_id"] = need.warehouse_id;
  j["sku"] = need.sku;
  j["current_stock"] = need.current_stock;
  j["threshold"] = need.threshold;
  j["deficit"] = need.deficit;
  j["priority_score"] = need.priority_score;
  j["severity"] = toString(need.severity);
  j["aging_priority"] = need.aging_priority;
  j["is_aging_critical"] = need.is_aging_critical;
}

}  // namespace domain

// -----------------------------------------------------------------------------
// payloadToJson: one visitor overload per payload alternative
// -----------------------------------------------------------------------------
nlohmann::json payloadToJson(const MessagePayload& payload) {
  struct Visitor {
    nlohmann::json operator()(const DataRequestPayload& p) const {
      return {{"data_type", p.data_type}, {"params", p.params}};
    }
    nlohmann::json operator()(const DataResponsePayload& p) const {
      return {{"data_type", p.data_type}, {"data", p.data}};
    }
    nlohmann::json operator()(const AlertPayload& p) const {
      return {{"alert_type", p.alert_type}, {"details", p.details}};
    }
    nlohmann::json operator()(const TransferRequestPayload& p) const {
      nlohmann::json j = nlohmann::json::object();
      j["source_warehouse_id"] = p.source_warehouse_id;
      j["target_warehouse_id"] = p.target_warehouse_id;
      j["sku"] = p.sku;
      j["quantity"] = p.quantity;
      j["reason"] = p.reason;
      j["aging_priority"] = p.aging_priority;
      j["sales_potential"] = p.sales_potential;
      return j;
    }
    nlohmann::json operator()(const TransferResponsePayload& p) const {
      nlohmann::json j = nlohmann::json::object();
      j["transfer_id"] = optionalToJson(p.transfer_id);
      j["status"] = p.status.has_value()
                        ? nlohmann::json(domain::toString(*p.status))
                        : nlohmann::json(nullptr);
      j["error"] = p.error;
      return j;
    }
    nlohmann::json operator()(const ErrorPayload& p) const {
      nlohmann::json j = nlohmann::json::object();
      j["failed_agent"] = p.failed_actor;
      j["error_type"] = p.error_type;
      j["error_message"] = p.error_message;
      j["original_message_id"] = optionalToJson(p.original_message_id);
      return j;
    }
    nlohmann::json operator()(const StatusUpdatePayload& p) const {
      return {{"status", p.status}, {"details", p.details}};
    }
  };
  return std::visit(Visitor{}, payload);
}

// -----------------------------------------------------------------------------
// AgentMessage
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const AgentMessage& message) {
  j = nlohmann::json::object();
  j["id"] = message.id;
  j["sender"] = message.sender;
  j["receiver"] = message.receiver;
  j["message_type"] = toString(message.type());
  j["payload"] = payloadToJson(message.payload);
  j["timestamp_ms"] = message.timestamp_ms;
  j["timestamp"] = formatIso8601(message.timestamp_ms);
  j["correlation_id"] = optionalToJson(message.correlation_id);
}

void to_json(nlohmann::json& j, const StockDiscrepancy& discrepancy) {
  j = nlohmann::json::object();
  j["sku"] = discrepancy.sku;
  j["expected"] = discrepancy.expected;
  j["actual"] = discrepancy.actual;
  j["difference"] = discrepancy.difference;
}

// -----------------------------------------------------------------------------
// VerificationReport
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const VerificationReport& report) {
  j = nlohmann::json::object();
  j["verified_at_ms"] = report.verified_at_ms;
  j["verified_at"] = formatIso8601(report.verified_at_ms);
  j["total_skus_checked"] = report.total_skus_checked;
  j["all_valid"] = report.all_valid;

  nlohmann::json discrepancies = nlohmann::json::array();
  for (const auto& d : report.discrepancies) {
    discrepancies.push_back(d);
  }
  j["discrepancies"] = discrepancies;

  nlohmann::json details = nlohmann::json::object();
  for (const auto& [sku, line] : report.details) {
    details[sku] = {{"expected", line.expected},
                    {"actual", line.actual},
                    {"valid", line.valid}};
  }
  j["details"] = details;
}

}  // namespace depot
