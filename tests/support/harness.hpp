#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/bid/bid_ledger.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/events/domain_event.hpp"
#include "internal/geo/distance_model.hpp"
#include "internal/identity/courier_eligibility.hpp"
#include "internal/lifecycle/package_lifecycle.hpp"
#include "internal/lock/keyed_lock_table.hpp"
#include "internal/match/match_engine.hpp"
#include "internal/route/route_manager.hpp"
#include "internal/util/time.hpp"

namespace routebid::testing {

// Captures published events for assertions.
class RecordingEventSink final : public events::EventSink {
 public:
  void Publish(const events::DomainEvent& event) override {
    if (delay_.count() > 0) {
      std::this_thread::sleep_for(delay_);
    }
    std::lock_guard lock(mutex_);
    events_.push_back(event);
  }

  std::vector<events::DomainEvent> Events() const {
    std::lock_guard lock(mutex_);
    return events_;
  }

  std::vector<events::DomainEvent> OfKind(events::EventKind kind) const {
    std::vector<events::DomainEvent> out;
    for (const auto& event : Events()) {
      if (event.kind == kind) out.push_back(event);
    }
    return out;
  }

  // Set before any publishing thread starts.
  void SetPublishDelay(std::chrono::milliseconds delay) {
    delay_ = delay;
  }

  void Clear() {
    std::lock_guard lock(mutex_);
    events_.clear();
  }

 private:
  mutable std::mutex               mutex_;
  std::vector<events::DomainEvent> events_;
  std::chrono::milliseconds        delay_{0};
};

inline util::TimePoint Epoch() {
  return util::FromUnixMillis(1'700'000'000'000);
}

/*
  The full domain wired against one repository and a manual clock.
*/
struct Harness {
  explicit Harness(std::shared_ptr<db::Repository> repo   = std::make_shared<db::memory::MemoryRepository>(),
                   lifecycle::BiddingPolicy        policy = {},
                   lock::LockOptions               lock_options = {})
      : repository(std::move(repo)),
        clock(std::make_shared<util::ManualClock>(Epoch())),
        locks(std::make_shared<lock::KeyedLockTable>(lock_options)),
        eligibility(std::make_shared<identity::EligibilityRegistry>()),
        sink(std::make_shared<RecordingEventSink>()) {
    ledger    = std::make_shared<bid::BidLedger>(repository, locks, eligibility, sink, clock);
    lifecycle = std::make_shared<lifecycle::PackageLifecycle>(repository, locks, ledger, sink, clock, policy);
    ledger->SetLifecycle(lifecycle);
    routes  = std::make_shared<route::RouteManager>(repository, locks, ledger, clock);
    matcher = std::make_shared<match::MatchEngine>(repository, std::make_shared<geo::GreatCircleDistance>(), clock);
  }

  std::shared_ptr<db::Repository>                repository;
  std::shared_ptr<util::ManualClock>             clock;
  std::shared_ptr<lock::KeyedLockTable>          locks;
  std::shared_ptr<identity::EligibilityRegistry> eligibility;
  std::shared_ptr<RecordingEventSink>            sink;
  std::shared_ptr<bid::BidLedger>                ledger;
  std::shared_ptr<lifecycle::PackageLifecycle>   lifecycle;
  std::shared_ptr<route::RouteManager>           routes;
  std::shared_ptr<match::MatchEngine>            matcher;
};

inline model::PackageDraft MakeDraft(const std::string& sender_id,
                                     model::GeoPoint    pickup  = {37.7749, -122.4194},
                                     model::GeoPoint    dropoff = {37.8044, -122.2712}) {
  model::PackageDraft draft;
  draft.sender_id       = sender_id;
  draft.description     = "box of books";
  draft.size            = model::PackageSize::kMedium;
  draft.weight_kg       = 4.5;
  draft.pickup          = pickup;
  draft.pickup_address  = "pickup street 1";
  draft.dropoff         = dropoff;
  draft.dropoff_address = "dropoff avenue 2";
  draft.offered_price   = 25.0;
  return draft;
}

inline bid::BidDraft MakeBid(const std::string& package_id, const std::string& courier_id, double price = 20.0) {
  bid::BidDraft draft;
  draft.package_id     = package_id;
  draft.courier_id     = courier_id;
  draft.proposed_price = price;
  draft.message        = "on my way anyway";
  return draft;
}

// Runs fn and reports whether it threw E.
template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

} // namespace routebid::testing
