#include "internal/lock/resource_lock_manager.hpp"

#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using signage::lock::ResourceLockManager;

void TestSameKeySerializesCriticalSections() {
  ResourceLockManager locks;
  int                 counter = 0;

  auto worker = [&] {
    for (int i = 0; i < 1000; ++i) {
      locks.WithLock("content-1", [&] {
        const int seen = counter;
        std::this_thread::yield();
        counter = seen + 1;
      });
    }
  };

  std::thread a(worker);
  std::thread b(worker);
  a.join();
  b.join();

  assert(counter == 2000);
  assert(locks.ActiveKeyCount() == 0);
}

void TestDifferentKeysDoNotBlock() {
  ResourceLockManager locks;
  auto                held = locks.Acquire("layout-a");

  auto other = std::async(std::launch::async, [&] { return locks.WithLock("layout-b", [] { return 7; }); });
  assert(other.wait_for(std::chrono::seconds(2)) == std::future_status::ready);
  assert(other.get() == 7);
  assert(locks.IsLocked("layout-a"));
  assert(!locks.IsLocked("layout-b"));
}

void TestWaitersAreServedInArrivalOrder() {
  ResourceLockManager locks;
  std::mutex          order_mutex;
  std::vector<int>    order;

  std::vector<std::thread> waiters;
  {
    auto held = locks.Acquire("playlist-1");
    for (int i = 0; i < 4; ++i) {
      waiters.emplace_back([&, i] {
        locks.WithLock("playlist-1", [&] {
          std::lock_guard<std::mutex> lock(order_mutex);
          order.push_back(i);
        });
      });
      // let waiter i take its ticket before the next one arrives
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
  }
  for (auto& t : waiters) {
    t.join();
  }

  assert((order == std::vector<int>{0, 1, 2, 3}));
}

void TestLockIsReleasedWhenBodyThrows() {
  ResourceLockManager locks;

  bool threw = false;
  try {
    locks.WithLock("schedule-9", [] { throw std::runtime_error("boom"); });
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw);
  assert(!locks.IsLocked("schedule-9"));
  assert(locks.ActiveKeyCount() == 0);

  // usable again
  assert(locks.WithLock("schedule-9", [] { return true; }));
}

void TestReentryOnSameThreadThrows() {
  ResourceLockManager locks;

  bool threw = false;
  locks.WithLock("contents-index", [&] {
    try {
      auto again = locks.Acquire("contents-index");
    } catch (const signage::util::InvalidState&) {
      threw = true;
    }
  });

  assert(threw && "re-acquiring a held key must fail instead of deadlocking");
  assert(!locks.IsLocked("contents-index"));
}

void TestGuardMoveKeepsSingleRelease() {
  ResourceLockManager locks;
  {
    auto first  = locks.Acquire("content-2");
    auto second = std::move(first);
    assert(second.key() == "content-2");
    assert(locks.IsLocked("content-2"));
  }
  assert(!locks.IsLocked("content-2"));
  assert(locks.ActiveKeyCount() == 0);
}

void TestReadTimestampLedger() {
  ResourceLockManager locks;
  const auto          read_at = signage::util::Now();

  assert(!locks.LastReadTimestamp("layouts/index.json").has_value());
  assert(!locks.HasConflict("layouts/index.json", read_at));

  locks.RecordReadTimestamp("layouts/index.json", read_at);
  assert(locks.LastReadTimestamp("layouts/index.json") == read_at);
  assert(!locks.HasConflict("layouts/index.json", read_at));
  assert(locks.HasConflict("layouts/index.json", read_at + std::chrono::seconds(1)));

  locks.ClearTimestamp("layouts/index.json");
  assert(!locks.HasConflict("layouts/index.json", read_at + std::chrono::seconds(1)));

  locks.RecordReadTimestamp("a", read_at);
  locks.RecordReadTimestamp("b", read_at);
  locks.ClearAllTimestamps();
  assert(!locks.LastReadTimestamp("a").has_value());
  assert(!locks.LastReadTimestamp("b").has_value());
}

} // namespace

int main() {
  TestSameKeySerializesCriticalSections();
  TestDifferentKeysDoNotBlock();
  TestWaitersAreServedInArrivalOrder();
  TestLockIsReleasedWhenBodyThrows();
  TestReentryOnSameThreadThrows();
  TestGuardMoveKeepsSingleRelease();
  TestReadTimestampLedger();

  std::cout << "signage_unit_resource_lock_manager: pass\n";
  return 0;
}
