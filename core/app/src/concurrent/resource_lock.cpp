#include "depot/concurrent/resource_lock.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace depot {

ResourceLock::Clock::time_point ResourceLock::deadlineAfter(
    std::chrono::milliseconds timeout) {
  const auto now = Clock::now();
  if (timeout <= std::chrono::milliseconds::zero()) {
    return now;
  }
  const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
      Clock::time_point::max() - now);
  if (timeout >= headroom) {
    return Clock::time_point::max();
  }
  return now + timeout;
}

bool ResourceLock::acquire(const std::string& key, const std::string& owner,
                           std::chrono::milliseconds timeout) {
  return acquireUntil(key, owner, deadlineAfter(timeout));
}

// -----------------------------------------------------------------------------
// acquireUntil: wait on the entry's condition variable until it has no owner
// -----------------------------------------------------------------------------
bool ResourceLock::acquireUntil(const std::string& key,
                                const std::string& owner,
                                Clock::time_point deadline) {
  if (owner.empty()) {
    std::cerr << "[ResourceLock] WARNING: acquire of " << key
              << " with empty owner name refused.\n";
    return false;
  }

  std::unique_lock lock(mutex_);
  Entry& entry = entries_[key];
  auto is_free = [&entry] { return !entry.owner.has_value(); };

  if (deadline == Clock::time_point::max()) {
    entry.released.wait(lock, is_free);
  } else if (!entry.released.wait_until(lock, deadline, is_free)) {
    std::cerr << "[ResourceLock] WARNING: " << owner
              << " timed out waiting for " << key << " (held by "
              << *entry.owner << ").\n";
    return false;
  }

  entry.owner = owner;
  return true;
}

// -----------------------------------------------------------------------------
// release: only the recorded owner may release
// -----------------------------------------------------------------------------
bool ResourceLock::release(const std::string& key, const std::string& owner) {
  std::unique_lock lock(mutex_);

  auto it = entries_.find(key);
  if (it == entries_.end() || !it->second.owner.has_value()) {
    return false;
  }

  Entry& entry = it->second;
  if (*entry.owner != owner) {
    std::cerr << "[ResourceLock] WARNING: owner mismatch on " << key
              << ": " << owner << " != " << *entry.owner
              << ". Release refused.\n";
    return false;
  }

  entry.owner.reset();
  lock.unlock();

  // All waiters re-check the predicate; the first to reacquire the mutex
  // takes ownership and the rest go back to waiting.
  entry.released.notify_all();
  return true;
}

bool ResourceLock::isLocked(const std::string& key) const {
  std::lock_guard lock(mutex_);
  auto it = entries_.find(key);
  return it != entries_.end() && it->second.owner.has_value();
}

std::optional<std::string> ResourceLock::owner(const std::string& key) const {
  std::lock_guard lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second.owner;
}

// =============================================================================
// CellLockGuard
// =============================================================================

CellLockGuard::CellLockGuard(ResourceLock& locks, std::string owner,
                             std::vector<std::string> keys,
                             std::chrono::milliseconds timeout)
    : locks_(locks), owner_(std::move(owner)) {
  std::sort(keys.begin(), keys.end());
  keys.erase(std::unique(keys.begin(), keys.end()), keys.end());

  const auto deadline = ResourceLock::deadlineAfter(timeout);
  held_.reserve(keys.size());
  for (const auto& key : keys) {
    if (!locks_.acquireUntil(key, owner_, deadline)) {
      releaseAll();
      return;
    }
    held_.push_back(key);
  }
  owns_ = true;
}

CellLockGuard::~CellLockGuard() { releaseAll(); }

void CellLockGuard::releaseAll() {
  // Reverse acquisition order.
  for (auto it = held_.rbegin(); it != held_.rend(); ++it) {
    if (!locks_.release(*it, owner_)) {
      std::cerr << "[ResourceLock] WARNING: guard for " << owner_
                << " could not release " << *it << ".\n";
    }
  }
  held_.clear();
  owns_ = false;
}

}  // namespace depot
