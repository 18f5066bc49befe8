#pragma once

#include "depot/domain/stock_key.hpp"

#include <stdexcept>
#include <string>

namespace depot {

// -----------------------------------------------------------------------------
// ValidationError
// -----------------------------------------------------------------------------
// Malformed or illegal request: non-positive quantity, identical source and
// target, unknown transfer id, transition out of the wrong state. Always
// surfaced to the caller.
// -----------------------------------------------------------------------------
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& what)
      : std::runtime_error(what) {}
};

// -----------------------------------------------------------------------------
// InsufficientStockError
// -----------------------------------------------------------------------------
// The source cell holds less than the requested quantity. Carries both
// figures so callers can resize and retry.
// -----------------------------------------------------------------------------
class InsufficientStockError : public ValidationError {
 public:
  InsufficientStockError(const std::string& what,
                         domain::Quantity requested,
                         domain::Quantity available)
      : ValidationError(what), requested_(requested), available_(available) {}

  domain::Quantity requested() const noexcept { return requested_; }
  domain::Quantity available() const noexcept { return available_; }

 private:
  domain::Quantity requested_;
  domain::Quantity available_;
};

// -----------------------------------------------------------------------------
// StockInvariantError
// -----------------------------------------------------------------------------
// A stock invariant (non-negativity, conservation) failed during a commit.
// By the time this is thrown both ledger cells have been restored and the
// transfer is RolledBack.
// -----------------------------------------------------------------------------
class StockInvariantError : public ValidationError {
 public:
  explicit StockInvariantError(const std::string& what)
      : ValidationError(what) {}
};

// -----------------------------------------------------------------------------
// ConfigError
// -----------------------------------------------------------------------------
// Configuration text or file could not be read or holds invalid values.
// -----------------------------------------------------------------------------
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace depot
