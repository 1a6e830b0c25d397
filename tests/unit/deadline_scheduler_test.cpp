#include "internal/deadline/deadline_scheduler.hpp"

#include <cassert>
#include <chrono>
#include <cstddef>
#include <future>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include "internal/util/errors.hpp"
#include "support/harness.hpp"

namespace {

using routebid::deadline::DeadlineScheduler;
using routebid::events::EventKind;
using routebid::model::BidStatus;
using routebid::model::PackageStatus;
using routebid::testing::Harness;
using routebid::testing::MakeBid;
using routebid::testing::MakeDraft;
namespace db   = routebid::db;
namespace util = routebid::util;
using routebid::lifecycle::DeadlineAction;

using std::chrono::hours;

// Delegates to an in-memory store but fails every read of one package.
class PoisonedRepository final : public db::Repository {
 public:
  explicit PoisonedRepository(std::string poisoned_id) : poisoned_id_(std::move(poisoned_id)) {
  }

  void Poison(std::string id) {
    poisoned_id_ = std::move(id);
  }

  std::unique_ptr<db::Transaction> Begin() override {
    return inner_.Begin();
  }

  db::Result InsertPackage(db::Transaction& tx, routebid::model::Package& pkg) override {
    return inner_.InsertPackage(tx, pkg);
  }

  std::optional<routebid::model::Package> GetPackage(db::Transaction& tx, const std::string& id) override {
    if (id == poisoned_id_) {
      throw std::runtime_error("disk read failed");
    }
    return inner_.GetPackage(tx, id);
  }

  std::vector<routebid::model::Package> ListPackages(db::Transaction& tx, const db::PackageFilter& filter) override {
    return inner_.ListPackages(tx, filter);
  }

  db::Result UpdatePackage(db::Transaction& tx, routebid::model::Package& pkg) override {
    return inner_.UpdatePackage(tx, pkg);
  }

  db::Result InsertBid(db::Transaction& tx, const routebid::model::Bid& bid) override {
    return inner_.InsertBid(tx, bid);
  }

  std::optional<routebid::model::Bid> GetBid(db::Transaction& tx, const std::string& id) override {
    return inner_.GetBid(tx, id);
  }

  std::vector<routebid::model::Bid> ListBidsForPackage(db::Transaction& tx, const std::string& id, const db::BidFilter& f) override {
    return inner_.ListBidsForPackage(tx, id, f);
  }

  std::vector<routebid::model::Bid> ListBidsForCourier(db::Transaction& tx, const std::string& id, const db::BidFilter& f) override {
    return inner_.ListBidsForCourier(tx, id, f);
  }

  db::Result UpdateBid(db::Transaction& tx, const routebid::model::Bid& bid) override {
    return inner_.UpdateBid(tx, bid);
  }

  db::Result InsertRoute(db::Transaction& tx, const routebid::model::Route& route) override {
    return inner_.InsertRoute(tx, route);
  }

  std::optional<routebid::model::Route> GetRoute(db::Transaction& tx, const std::string& id) override {
    return inner_.GetRoute(tx, id);
  }

  std::vector<routebid::model::Route> ListRoutesForCourier(db::Transaction& tx, const std::string& id) override {
    return inner_.ListRoutesForCourier(tx, id);
  }

  std::vector<routebid::model::Route> ListActiveRoutes(db::Transaction& tx) override {
    return inner_.ListActiveRoutes(tx);
  }

  db::Result UpdateRoute(db::Transaction& tx, const routebid::model::Route& route) override {
    return inner_.UpdateRoute(tx, route);
  }

 private:
  db::memory::MemoryRepository inner_;
  std::string                  poisoned_id_;
};

void TestExtendTwiceThenReset() {
  Harness           h;
  DeadlineScheduler scheduler(h.lifecycle, h.routes, std::chrono::seconds(60));

  const auto pkg = h.lifecycle->CreatePackage(MakeDraft("sender-1"));
  const auto bid = h.ledger->PlaceBid(MakeBid(pkg.id, "courier-1"));

  h.clock->Advance(hours(24));
  auto report = scheduler.SweepOnce();
  assert(report.examined == 1);
  assert(report.extended == 1);
  auto current = h.lifecycle->GetPackage(pkg.id);
  assert(current.deadline_extension_count == 1);
  assert(*current.bidding_deadline == h.clock->Now() + hours(12));
  assert(h.ledger->GetBid(bid.id).status == BidStatus::kPending);

  h.clock->Advance(hours(12));
  assert(scheduler.SweepOnce().extended == 1);
  assert(h.lifecycle->GetPackage(pkg.id).deadline_extension_count == 2);

  h.clock->Advance(hours(12));
  report = scheduler.SweepOnce();
  assert(report.reset == 1);
  assert(report.bids_expired == 1);

  current = h.lifecycle->GetPackage(pkg.id);
  assert(current.status == PackageStatus::kOpenForBids);
  assert(current.deadline_extension_count == 0);
  assert(*current.bidding_deadline == h.clock->Now() + hours(24));
  assert(h.ledger->GetBid(bid.id).status == BidStatus::kExpired);

  assert(h.sink->OfKind(EventKind::kBidDeadlineExtended).size() == 2);
  assert(h.sink->OfKind(EventKind::kBiddingReset).size() == 1);
  assert(h.sink->OfKind(EventKind::kBidExpired).size() == 1);

  // Fresh window: the courier may bid again.
  h.ledger->PlaceBid(MakeBid(pkg.id, "courier-1"));
}

void TestRepeatedSweepIsIdempotent() {
  Harness           h;
  DeadlineScheduler scheduler(h.lifecycle, h.routes, std::chrono::seconds(60));
  const auto        pkg = h.lifecycle->CreatePackage(MakeDraft("sender-1"));

  h.clock->Advance(hours(24));
  assert(scheduler.SweepOnce().extended == 1);
  const auto version = h.lifecycle->GetPackage(pkg.id).version;

  const auto again = scheduler.SweepOnce();
  assert(again.extended == 0);
  assert(again.reset == 0);
  assert(h.lifecycle->GetPackage(pkg.id).deadline_extension_count == 1);
  assert(h.lifecycle->GetPackage(pkg.id).version == version);
}

void TestWarningFiresOncePerWindow() {
  Harness           h;
  DeadlineScheduler scheduler(h.lifecycle, h.routes, std::chrono::seconds(60));
  const auto        pkg = h.lifecycle->CreatePackage(MakeDraft("sender-1"));

  h.clock->Advance(hours(17));
  assert(scheduler.SweepOnce().warned == 0);

  h.clock->Advance(hours(1));
  assert(scheduler.SweepOnce().warned == 1);
  assert(h.lifecycle->GetPackage(pkg.id).deadline_warning_sent);
  assert(scheduler.SweepOnce().warned == 0);

  const auto warnings = h.sink->OfKind(EventKind::kBidDeadlineWarning);
  assert(warnings.size() == 1);
  assert(warnings[0].package_id == pkg.id);
  assert(warnings[0].sender_id == "sender-1");

  // The extension opens a new window with its own warning.
  h.clock->Advance(hours(6));
  assert(scheduler.SweepOnce().extended == 1);
  assert(!h.lifecycle->GetPackage(pkg.id).deadline_warning_sent);
  h.clock->Advance(hours(6));
  assert(scheduler.SweepOnce().warned == 1);
}

void TestOnlyOpenPackagesAreSwept() {
  Harness           h;
  DeadlineScheduler scheduler(h.lifecycle, h.routes, std::chrono::seconds(60));

  const auto open     = h.lifecycle->CreatePackage(MakeDraft("sender-1"));
  const auto selected = h.lifecycle->CreatePackage(MakeDraft("sender-1"));
  const auto bid      = h.ledger->PlaceBid(MakeBid(selected.id, "courier-1"));
  h.ledger->SelectBid(bid.id, "sender-1");

  h.clock->Advance(hours(30));
  const auto report = scheduler.SweepOnce();
  assert(report.examined == 1);
  assert(report.extended == 1);
  assert(h.lifecycle->GetPackage(open.id).deadline_extension_count == 1);
  assert(h.lifecycle->GetPackage(selected.id).status == PackageStatus::kBidSelected);
}

void TestOneFailureDoesNotStopTheSweep() {
  auto              repo = std::make_shared<PoisonedRepository>("");
  Harness           h(repo);
  DeadlineScheduler scheduler(h.lifecycle, h.routes, std::chrono::seconds(60));

  const auto bad  = h.lifecycle->CreatePackage(MakeDraft("sender-1"));
  const auto good = h.lifecycle->CreatePackage(MakeDraft("sender-2"));
  repo->Poison(bad.id);

  h.clock->Advance(hours(24));
  const auto report = scheduler.SweepOnce();
  assert(report.examined == 2);
  assert(report.failures == 1);
  assert(report.extended == 1);
  assert(h.lifecycle->GetPackage(good.id).deadline_extension_count == 1);
}

void TestBackgroundLoopStartsAndStops() {
  Harness           h;
  DeadlineScheduler scheduler(h.lifecycle, h.routes, std::chrono::milliseconds(10));
  const auto        pkg = h.lifecycle->CreatePackage(MakeDraft("sender-1"));
  h.clock->Advance(hours(24));

  scheduler.Start();
  scheduler.Start();
  assert(scheduler.Running());

  const auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (h.lifecycle->GetPackage(pkg.id).deadline_extension_count == 0 && std::chrono::steady_clock::now() < give_up) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  scheduler.Stop();
  scheduler.Stop();
  assert(!scheduler.Running());
  // Clock is frozen, so later passes were no-ops.
  assert(h.lifecycle->GetPackage(pkg.id).deadline_extension_count == 1);
}

void TestStopInterruptsBackgroundSweep() {
  Harness         h;
  constexpr int   kPackages = 40;
  for (int i = 0; i < kPackages; ++i) {
    h.lifecycle->CreatePackage(MakeDraft("sender-" + std::to_string(i)));
  }
  h.clock->Advance(hours(24));
  h.sink->Clear();
  h.sink->SetPublishDelay(std::chrono::milliseconds(25));

  DeadlineScheduler scheduler(h.lifecycle, h.routes, std::chrono::seconds(60));
  scheduler.Start();

  const auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (h.sink->OfKind(EventKind::kBidDeadlineExtended).empty() && std::chrono::steady_clock::now() < give_up) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  scheduler.Stop();

  std::size_t extended = 0;
  for (const auto& pkg : h.lifecycle->ListPackages(db::PackageFilter{})) {
    if (pkg.deadline_extension_count == 1) ++extended;
  }
  assert(extended >= 1);
  assert(extended < static_cast<std::size_t>(kPackages));
  // The package in flight when Stop was called finished with its event.
  assert(h.sink->OfKind(EventKind::kBidDeadlineExtended).size() == extended);
}

void TestSweepRetiresRoutesPastTripDate() {
  Harness           h;
  DeadlineScheduler scheduler(h.lifecycle, h.routes, std::chrono::seconds(60));

  routebid::model::RouteDraft draft;
  draft.courier_id       = "courier-1";
  draft.start            = {37.7749, -122.4194};
  draft.end              = {37.8716, -122.2727};
  draft.max_deviation_km = 5.0;
  draft.trip_date        = routebid::testing::Epoch() + hours(1);
  const auto route       = h.routes->CreateRoute(draft);

  const auto pkg = h.lifecycle->CreatePackage(MakeDraft("sender-1"));
  const auto bid = h.ledger->PlaceBid(MakeBid(pkg.id, "courier-1"));

  h.clock->Advance(hours(2));
  const auto report = scheduler.SweepOnce();
  assert(report.examined == 1);
  assert(report.routes_expired == 1);
  assert(report.route_bids_withdrawn == 1);
  assert(report.failures == 0);
  assert(!h.routes->GetRoute(route.id).is_active);
  assert(h.ledger->GetBid(bid.id).status == BidStatus::kWithdrawn);

  assert(scheduler.SweepOnce().routes_expired == 0);
}

// A sender selects a bid while the sweep purges the same package after its
// last extension. Exactly one side wins and the loser changes nothing.
void TestSelectionRacingPurge() {
  for (int round = 0; round < 25; ++round) {
    Harness    h;
    const auto pkg   = h.lifecycle->CreatePackage(MakeDraft("sender-1"));
    const auto bid   = h.ledger->PlaceBid(MakeBid(pkg.id, "courier-1"));
    const auto rival = h.ledger->PlaceBid(MakeBid(pkg.id, "courier-2"));

    h.clock->Advance(hours(24));
    assert(h.lifecycle->ProcessDeadline(pkg.id).action == DeadlineAction::kExtended);
    h.clock->Advance(hours(12));
    assert(h.lifecycle->ProcessDeadline(pkg.id).action == DeadlineAction::kExtended);
    h.clock->Advance(hours(12));
    assert(h.lifecycle->GetPackage(pkg.id).deadline_extension_count == 2);
    h.sink->Clear();

    std::promise<void>                        go;
    std::shared_future<void>                  start = go.get_future().share();
    bool                                      selected = false;
    routebid::lifecycle::DeadlineOutcome      outcome;

    std::thread selector([&] {
      start.wait();
      try {
        h.ledger->SelectBid(bid.id, "sender-1");
        selected = true;
      } catch (const util::AlreadyTerminal&) {
      }
    });
    std::thread sweeper([&] {
      start.wait();
      outcome = h.lifecycle->ProcessDeadline(pkg.id);
    });
    go.set_value();
    selector.join();
    sweeper.join();

    const auto after = h.lifecycle->GetPackage(pkg.id);
    if (selected) {
      assert(outcome.action == DeadlineAction::kNone);
      assert(after.status == PackageStatus::kBidSelected);
      assert(after.selected_bid_id == bid.id);
      assert(h.ledger->GetBid(bid.id).status == BidStatus::kSelected);
      assert(h.ledger->GetBid(rival.id).status == BidStatus::kRejected);
      assert(h.sink->OfKind(EventKind::kBidExpired).empty());
      assert(h.sink->OfKind(EventKind::kBiddingReset).empty());
    } else {
      assert(outcome.action == DeadlineAction::kReset);
      assert(outcome.bids_expired == 2);
      assert(after.status == PackageStatus::kOpenForBids);
      assert(after.deadline_extension_count == 0);
      assert(!after.selected_bid_id.has_value());
      assert(h.ledger->GetBid(bid.id).status == BidStatus::kExpired);
      assert(h.ledger->GetBid(rival.id).status == BidStatus::kExpired);
      assert(h.sink->OfKind(EventKind::kBidSelected).empty());
    }
  }
}

} // namespace

int main() {
  TestExtendTwiceThenReset();
  TestRepeatedSweepIsIdempotent();
  TestWarningFiresOncePerWindow();
  TestOnlyOpenPackagesAreSwept();
  TestOneFailureDoesNotStopTheSweep();
  TestBackgroundLoopStartsAndStops();
  TestStopInterruptsBackgroundSweep();
  TestSweepRetiresRoutesPastTripDate();
  TestSelectionRacingPurge();

  std::cout << "routebid_unit_deadline_scheduler: pass\n";
  return 0;
}
