#include "resource_lock_manager.hpp"

#include "internal/util/errors.hpp"

namespace signage::lock {

// ------------------------------------------------------------------
// Guard
// ------------------------------------------------------------------

ResourceLockManager::Guard::Guard(ResourceLockManager* owner, std::string key) : owner_(owner), key_(std::move(key)) {
}

ResourceLockManager::Guard::Guard(Guard&& other) noexcept : owner_(other.owner_), key_(std::move(other.key_)) {
  other.owner_ = nullptr;
}

ResourceLockManager::Guard::~Guard() {
  if (owner_) {
    owner_->Release(key_);
  }
}

// ------------------------------------------------------------------
// Locks
// ------------------------------------------------------------------

/*
  Ticket lock per key. The map mutex is only held while taking a ticket
  and while waiting on the key's condition variable.
*/
ResourceLockManager::Guard ResourceLockManager::Acquire(const std::string& key) {
  std::unique_lock<std::mutex> lock(mutex_);

  auto& slot = keys_[key];
  if (!slot) {
    slot = std::make_unique<KeyState>();
  }
  KeyState* state = slot.get();

  if (state->serving != state->next_ticket && state->holder == std::this_thread::get_id()) {
    throw util::InvalidState("lock already held by this thread: " + key);
  }

  const auto ticket = state->next_ticket++;
  ++state->refs;
  state->turn.wait(lock, [state, ticket] { return state->serving == ticket; });
  state->holder = std::this_thread::get_id();

  return Guard(this, key);
}

void ResourceLockManager::Release(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = keys_.find(key);
  if (it == keys_.end()) {
    return;
  }

  auto& state  = *it->second;
  state.holder = std::thread::id{};
  ++state.serving;
  --state.refs;

  if (state.refs == 0) {
    keys_.erase(it);
    return;
  }
  state.turn.notify_all();
}

bool ResourceLockManager::IsLocked(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = keys_.find(key);
  return it != keys_.end() && it->second->serving != it->second->next_ticket;
}

size_t ResourceLockManager::ActiveKeyCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return keys_.size();
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

void ResourceLockManager::RecordReadTimestamp(const std::string& path, util::TimePoint observed_modified_at) {
  std::lock_guard<std::mutex> lock(ledger_mutex_);
  read_timestamps_[path] = observed_modified_at;
}

void ResourceLockManager::ClearTimestamp(const std::string& path) {
  std::lock_guard<std::mutex> lock(ledger_mutex_);
  read_timestamps_.erase(path);
}

void ResourceLockManager::ClearAllTimestamps() {
  std::lock_guard<std::mutex> lock(ledger_mutex_);
  read_timestamps_.clear();
}

std::optional<util::TimePoint> ResourceLockManager::LastReadTimestamp(const std::string& path) const {
  std::lock_guard<std::mutex> lock(ledger_mutex_);
  auto                        it = read_timestamps_.find(path);
  if (it == read_timestamps_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool ResourceLockManager::HasConflict(const std::string& path, util::TimePoint current_modified_at) const {
  auto last_read = LastReadTimestamp(path);
  return last_read.has_value() && current_modified_at > *last_read;
}

} // namespace signage::lock
