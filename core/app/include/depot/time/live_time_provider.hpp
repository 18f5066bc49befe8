#pragma once

#include "depot/time/i_time_provider.hpp"

namespace depot {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns std::chrono::system_clock::now() in epoch milliseconds.
//
// @details
// Used by the depot_engine binary. Stateless; safe from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace depot
