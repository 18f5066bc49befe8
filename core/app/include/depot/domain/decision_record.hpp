#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace depot {
namespace domain {

// -----------------------------------------------------------------------------
// DecisionRecord: one entry of a component's decision trace
// -----------------------------------------------------------------------------
//
// @brief  Records what the coordinator decided, from which inputs, and why.
//
// @details
// The decision trace is separate from the stock audit log: it explains
// choices (need evaluation, warehouse selection, approval gating, commit
// results) and never describes a stock mutation by itself.
//
// input / output are free-form JSON objects; their keys depend on
// decision_type.
// -----------------------------------------------------------------------------
struct DecisionRecord {
  std::string decision_id;
  std::string actor;
  std::string decision_type;
  nlohmann::json input = nlohmann::json::object();
  nlohmann::json output = nlohmann::json::object();
  std::string reasoning;
  std::int64_t timestamp_ms{0};
};

}  // namespace domain
}  // namespace depot
