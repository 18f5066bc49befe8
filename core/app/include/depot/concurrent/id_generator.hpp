#pragma once

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <string>
#include <utility>

namespace depot {

// -----------------------------------------------------------------------------
// IdGenerator: thread-safe, monotonically increasing identifier source
// -----------------------------------------------------------------------------
//
// @brief  Produces unique prefixed identifiers ("TRF-000001", "MSG-000002",
//         ...) from an atomic counter.
//
// @details
// The counter starts at 1 and increments by 1 on every call. fetch_add with
// memory_order_relaxed is enough because the only requirement is that each
// call returns a distinct value.
//
// Each component that mints identifiers owns its own generator as a value
// member (TransferCoordinator: "TRF" and "DEC", MessageBus: "MSG",
// StockValidator: "AUD"). There is no process-wide instance.
//
// Thread model:
//   next() and next_sequence() are safe to call concurrently from any
//   number of threads.
// -----------------------------------------------------------------------------
class IdGenerator {
 public:
  explicit IdGenerator(std::string prefix) : prefix_(std::move(prefix)) {}

  // Non-copyable, non-movable: copying a generator would create two sources
  // producing duplicate identifiers.
  IdGenerator(const IdGenerator&) = delete;
  IdGenerator& operator=(const IdGenerator&) = delete;
  IdGenerator(IdGenerator&&) = delete;
  IdGenerator& operator=(IdGenerator&&) = delete;

  // -------------------------------------------------------------------------
  // next_sequence()
  // -------------------------------------------------------------------------
  // @brief  Returns the next raw sequence number (1, 2, 3, ...).
  // -------------------------------------------------------------------------
  std::uint64_t next_sequence() {
    return next_.fetch_add(1, std::memory_order_relaxed);
  }

  // -------------------------------------------------------------------------
  // next()
  // -------------------------------------------------------------------------
  // @brief  Returns "<prefix>-<sequence>", the sequence zero-padded to six
  //         digits (wider once it exceeds 999999).
  // -------------------------------------------------------------------------
  std::string next() {
    char digits[24];
    std::snprintf(digits, sizeof(digits), "%06llu",
                  static_cast<unsigned long long>(next_sequence()));
    return prefix_ + "-" + digits;
  }

  const std::string& prefix() const { return prefix_; }

 private:
  const std::string prefix_;
  std::atomic<std::uint64_t> next_{1};
};

}  // namespace depot
