#pragma once

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <utility>

#include "internal/util/time.hpp"

namespace signage::lock {

/*
  Named mutual exclusion keyed by logical resource ("content-<id>",
  "contents-create", "contents-index").

  - one holder per key, waiters served strictly in arrival order
  - different keys never block each other
  - released on every exit path (Guard is RAII)
  - re-acquiring a key on the thread that holds it throws
    util::InvalidState instead of deadlocking

  Also keeps the read-timestamp ledger: the last observed write time of
  each physical path, recorded after successful reads and cleared after
  deletes. The ledger is advisory; nothing refuses writes based on it.
*/
class ResourceLockManager {
 public:
  class Guard {
   public:
    Guard(Guard&& other) noexcept;
    Guard& operator=(Guard&&) = delete;
    Guard(const Guard&)       = delete;
    ~Guard();

    const std::string& key() const {
      return key_;
    }

   private:
    friend class ResourceLockManager;
    Guard(ResourceLockManager* owner, std::string key);

    ResourceLockManager* owner_;
    std::string          key_;
  };

  ResourceLockManager() = default;
  ResourceLockManager(const ResourceLockManager&) = delete;
  ResourceLockManager& operator=(const ResourceLockManager&) = delete;

  Guard Acquire(const std::string& key);

  template <typename Fn>
  std::invoke_result_t<Fn> WithLock(const std::string& key, Fn&& fn) {
    auto guard = Acquire(key);
    return std::forward<Fn>(fn)();
  }

  bool   IsLocked(const std::string& key) const;
  size_t ActiveKeyCount() const;

  // ------------------------------------------------------------------
  // Read-timestamp ledger
  // ------------------------------------------------------------------
  void                           RecordReadTimestamp(const std::string& path, util::TimePoint observed_modified_at);
  void                           ClearTimestamp(const std::string& path);
  void                           ClearAllTimestamps();
  std::optional<util::TimePoint> LastReadTimestamp(const std::string& path) const;

  /*
    True when path has been written after the last recorded read.
    Paths never read report no conflict.
  */
  bool HasConflict(const std::string& path, util::TimePoint current_modified_at) const;

 private:
  struct KeyState {
    uint64_t                next_ticket = 0;
    uint64_t                serving     = 0;
    size_t                  refs        = 0;
    std::thread::id         holder;
    std::condition_variable turn;
  };

  void Release(const std::string& key);

  mutable std::mutex                                         mutex_;
  std::unordered_map<std::string, std::unique_ptr<KeyState>> keys_;

  mutable std::mutex                               ledger_mutex_;
  std::unordered_map<std::string, util::TimePoint> read_timestamps_;
};

using ResourceLockManagerPtr = std::shared_ptr<ResourceLockManager>;

} // namespace signage::lock
