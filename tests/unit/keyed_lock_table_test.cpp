#include "internal/lock/keyed_lock_table.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <thread>

#include "internal/util/errors.hpp"
#include "support/harness.hpp"

namespace {

using routebid::lock::KeyedLockTable;
using routebid::lock::LockOptions;
using routebid::testing::Harness;
using routebid::testing::MakeDraft;
using routebid::testing::Throws;
namespace util = routebid::util;

LockOptions ShortOptions() {
  LockOptions options;
  options.acquire_timeout = std::chrono::milliseconds(20);
  options.max_attempts    = 2;
  options.retry_backoff   = std::chrono::milliseconds(5);
  return options;
}

// Holds `key` on a helper thread until the returned promise is fulfilled.
std::thread HoldInBackground(KeyedLockTable& table, const std::string& key, std::promise<void>& held,
                             std::shared_future<void> release) {
  return std::thread([&table, key, &held, release] {
    auto guard = table.Acquire(key);
    held.set_value();
    release.wait();
  });
}

void TestKeysAreNamespaced() {
  assert(KeyedLockTable::PackageKey("42") == "package:42");
  assert(KeyedLockTable::CourierKey("42") == "courier:42");
}

void TestBusyAfterRetryBudget() {
  KeyedLockTable     table(ShortOptions());
  std::promise<void> held;
  std::promise<void> release;
  auto               worker = HoldInBackground(table, "package:p1", held, release.get_future().share());
  held.get_future().wait();

  const auto started = std::chrono::steady_clock::now();
  assert(Throws<util::Busy>([&] { auto guard = table.Acquire("package:p1"); }));
  assert(std::chrono::steady_clock::now() - started >= std::chrono::milliseconds(40));

  // Other keys are unaffected.
  { auto guard = table.Acquire("package:p2"); }

  release.set_value();
  worker.join();

  auto guard = table.Acquire("package:p1");
  assert(guard.Key() == "package:p1");
}

void TestGuardMoveAndRelease() {
  KeyedLockTable table(ShortOptions());

  auto first = table.Acquire("courier:c1");
  KeyedLockTable::Guard moved(std::move(first));
  assert(moved.Key() == "courier:c1");

  moved.Release();
  moved.Release();

  KeyedLockTable::Guard assigned;
  assigned = table.Acquire("courier:c1");
  assigned = table.Acquire("courier:c2");

  // courier:c1 was released by the assignment above.
  std::atomic<bool> acquired{false};
  std::thread       contender([&] {
    auto guard = table.Acquire("courier:c1");
    acquired   = true;
  });
  contender.join();
  assert(acquired);
}

void TestZeroAttemptsStillTriesOnce() {
  LockOptions options = ShortOptions();
  options.max_attempts = 0;
  KeyedLockTable table(options);
  assert(table.Options().max_attempts == 1);
  auto guard = table.Acquire("package:p1");
  assert(guard.Key() == "package:p1");
}

void TestBusyPackageSurfacesFromLifecycle() {
  Harness    h(std::make_shared<routebid::db::memory::MemoryRepository>(), {}, ShortOptions());
  const auto pkg = h.lifecycle->CreatePackage(MakeDraft("sender-1"));

  std::promise<void> held;
  std::promise<void> release;
  auto worker = HoldInBackground(*h.locks, KeyedLockTable::PackageKey(pkg.id), held, release.get_future().share());
  held.get_future().wait();

  assert(Throws<util::Busy>([&] { h.lifecycle->Cancel(pkg.id, "sender-1"); }));

  release.set_value();
  worker.join();

  assert(h.lifecycle->GetPackage(pkg.id).status == routebid::model::PackageStatus::kOpenForBids);
  assert(h.lifecycle->Cancel(pkg.id, "sender-1").status == routebid::model::PackageStatus::kCanceled);
}

void TestIdleKeysAreDropped() {
  KeyedLockTable table(ShortOptions());
  assert(table.Size() == 0);

  {
    auto a = table.Acquire("package:p1");
    auto b = table.Acquire("courier:c1");
    assert(table.Size() == 2);
  }
  assert(table.Size() == 0);

  // A failed acquisition leaves only the holder's entry, which goes with it.
  std::promise<void> held;
  std::promise<void> release;
  auto               holder = HoldInBackground(table, "courier:c2", held, release.get_future().share());
  held.get_future().wait();
  assert(Throws<util::Busy>([&] { auto guard = table.Acquire("courier:c2"); }));
  assert(table.Size() == 1);
  release.set_value();
  holder.join();
  assert(table.Size() == 0);

  auto again = table.Acquire("courier:c2");
  assert(table.Size() == 1);
}

} // namespace

int main() {
  TestKeysAreNamespaced();
  TestBusyAfterRetryBudget();
  TestGuardMoveAndRelease();
  TestZeroAttemptsStillTriesOnce();
  TestBusyPackageSurfacesFromLifecycle();
  TestIdleKeysAreDropped();

  std::cout << "routebid_unit_keyed_lock_table: pass\n";
  return 0;
}
