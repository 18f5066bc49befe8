#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace depot {

// -----------------------------------------------------------------------------
// ResourceLock: named exclusive locks keyed by resource identifier
// -----------------------------------------------------------------------------
//
// @brief  Gives one owner at a time exclusive use of a resource key such as
//         "WH1:S1" (see domain::cellKey()).
//
// @details
// Each key maps to an Entry holding the current owner name (if any) and a
// condition variable that waiters block on. Entries are created on the
// first acquire() for a key and are never erased; a released entry simply
// has no owner.
//
// Ownership is tracked by actor name, not by thread: the actor that acquired
// a key may release it from any thread, and a different actor can never
// release it. A second acquire() by the current owner is NOT re-entrant; it
// waits like any other caller.
//
// Timeouts are hard failures: acquire() returns false and never retries.
//
// Thread model:
//   All public methods are thread-safe. One registry mutex guards the map
//   and every entry; waiters release it while blocked on the entry.
//   unordered_map guarantees reference stability of its elements across
//   rehashing, so Entry references stay valid while waiting.
// -----------------------------------------------------------------------------
class ResourceLock {
 public:
  using Clock = std::chrono::steady_clock;

  /// Default acquisition timeout (10 s).
  static constexpr std::chrono::milliseconds kDefaultTimeout{10000};

  ResourceLock() = default;

  ResourceLock(const ResourceLock&) = delete;
  ResourceLock& operator=(const ResourceLock&) = delete;
  ResourceLock(ResourceLock&&) = delete;
  ResourceLock& operator=(ResourceLock&&) = delete;

  // -------------------------------------------------------------------------
  // acquire(key, owner, timeout)
  // -------------------------------------------------------------------------
  //
  // @brief  Blocks up to `timeout` for exclusive ownership of `key`.
  //
  // @param  key      Resource identifier.
  // @param  owner    Name of the acquiring actor; must be non-empty.
  // @param  timeout  Maximum wait. Zero means "try once".
  //
  // @return true if `owner` now holds `key`, false on timeout or an empty
  //         owner name.
  //
  // Side-effects: Creates the entry for `key` on first use. Logs a warning
  //               on timeout.
  // -------------------------------------------------------------------------
  bool acquire(const std::string& key, const std::string& owner,
               std::chrono::milliseconds timeout = kDefaultTimeout);

  // As acquire(), bounded by an absolute deadline. Clock::time_point::max()
  // waits without limit.
  bool acquireUntil(const std::string& key, const std::string& owner,
                    Clock::time_point deadline);

  // now + timeout, saturating at Clock::time_point::max() for timeouts the
  // clock cannot represent. A non-positive timeout yields now.
  static Clock::time_point deadlineAfter(std::chrono::milliseconds timeout);

  // -------------------------------------------------------------------------
  // release(key, owner)
  // -------------------------------------------------------------------------
  //
  // @brief  Releases `key` if and only if `owner` holds it.
  //
  // @return false for an unknown key, an unlocked key, or an owner mismatch.
  //         A mismatch is rejected and logged; the lock stays with its
  //         current owner.
  // -------------------------------------------------------------------------
  bool release(const std::string& key, const std::string& owner);

  // Non-blocking query.
  bool isLocked(const std::string& key) const;

  // Current owner of `key`, or nullopt when unlocked / unknown.
  std::optional<std::string> owner(const std::string& key) const;

 private:
  struct Entry {
    std::optional<std::string> owner;
    std::condition_variable released;
  };

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;
};

// -----------------------------------------------------------------------------
// CellLockGuard: RAII guard over the cells touched by one transfer
// -----------------------------------------------------------------------------
//
// @brief  Acquires a set of resource keys for one owner and releases them on
//         destruction.
//
// @details
// Keys are de-duplicated and acquired in sorted order, so two guards over
// overlapping key sets can never deadlock on each other. `timeout` bounds
// the whole acquisition, not each key. If any key times
// out, the keys already held are released immediately and owns() reports
// false; the caller must not touch the cells in that case.
//
// Typical use around a transfer:
//
//   CellLockGuard guard(locks, "monitor-WH1",
//                       {cellKey(src, sku), cellKey(dst, sku)}, timeout);
//   if (!guard.owns()) { /* surface the timeout */ }
//   coordinator.executeTransfer(src, dst, sku, qty, reason);
//
// Non-copyable, non-movable.
// -----------------------------------------------------------------------------
class CellLockGuard {
 public:
  CellLockGuard(ResourceLock& locks, std::string owner,
                std::vector<std::string> keys,
                std::chrono::milliseconds timeout =
                    ResourceLock::kDefaultTimeout);
  ~CellLockGuard();

  CellLockGuard(const CellLockGuard&) = delete;
  CellLockGuard& operator=(const CellLockGuard&) = delete;
  CellLockGuard(CellLockGuard&&) = delete;
  CellLockGuard& operator=(CellLockGuard&&) = delete;

  bool owns() const { return owns_; }

  // Keys held by this guard (sorted), empty if acquisition failed.
  const std::vector<std::string>& keys() const { return held_; }

 private:
  void releaseAll();

  ResourceLock& locks_;
  std::string owner_;
  std::vector<std::string> held_;
  bool owns_{false};
};

}  // namespace depot
