#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/lifecycle/package_lifecycle.hpp"
#include "internal/route/route_manager.hpp"

namespace routebid::deadline {

struct SweepReport {
  std::size_t examined     = 0;
  std::size_t warned       = 0;
  std::size_t extended     = 0;
  std::size_t reset        = 0;
  std::size_t bids_expired = 0;
  std::size_t failures     = 0;

  std::size_t routes_expired       = 0;
  std::size_t route_bids_withdrawn = 0;
};

/*
  Background sweep over OPEN_FOR_BIDS packages.

  Each package is handed to PackageLifecycle::ProcessDeadline, which
  re-checks the deadline under the package lock, so a sweep racing a
  client request or another sweep never double-applies a rule. One
  failing package is logged and counted; the sweep moves on.

  After the packages, routes whose trip date has passed are taken out of
  service. A background pass stops between packages once Stop is called.
*/
class DeadlineScheduler {
 public:
  DeadlineScheduler(std::shared_ptr<lifecycle::PackageLifecycle> lifecycle,
                    std::shared_ptr<route::RouteManager>         routes,
                    std::chrono::milliseconds                    interval);
  ~DeadlineScheduler();

  void Start();
  void Stop();

  bool Running() const {
    return running_;
  }

  // One synchronous pass; also used by the admin RPC and tests.
  SweepReport SweepOnce();

 private:
  void        Run();
  SweepReport Sweep(bool stop_on_shutdown);

  std::shared_ptr<lifecycle::PackageLifecycle> lifecycle_;
  std::shared_ptr<route::RouteManager>         routes_;
  std::chrono::milliseconds                    interval_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace routebid::deadline
