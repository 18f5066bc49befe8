#pragma once

#include "depot/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace depot {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose current time is set by the caller.
//
// @details
// Tests construct one, set a start time, and advance it between operations
// to assert on created_at / completed_at / audit timestamps exactly.
//
// Internal storage is a std::atomic<int64_t>, so one writer and any number
// of readers can run concurrently without a mutex.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to new_time_ms. Monotonicity is the caller's
  //         responsibility.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace depot
