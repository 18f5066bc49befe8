#pragma once

#include <cstdint>

namespace depot {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that hides where "now" comes from.
//
// @details
// Every timestamp written by the engine (transfer creation and completion,
// audit entries, messages, decision records) is read through this
// interface:
//   - LiveTimeProvider       → std::chrono::system_clock.
//   - SimulationTimeProvider → a value set explicitly by the caller, so
//                              tests see deterministic timestamps.
//
// Components receive `const ITimeProvider&` and never own the provider.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from any thread.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Current time as milliseconds since the Unix epoch.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace depot
