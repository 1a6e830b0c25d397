#include "internal/match/match_engine.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

#include "internal/util/errors.hpp"
#include "support/harness.hpp"

namespace {

using routebid::model::GeoPoint;
using routebid::model::Route;
using routebid::testing::Harness;
using routebid::testing::MakeDraft;
using routebid::testing::Throws;

Route EquatorRoute(double max_deviation_km) {
  Route route;
  route.id               = "route-equator";
  route.courier_id       = "courier-1";
  route.start            = {0.0, 0.0};
  route.end              = {0.0, 1.0};
  route.max_deviation_km = max_deviation_km;
  route.is_active        = true;
  return route;
}

void TestPickupBeyondDeviationIsExcludedEvenWithSmallDetour() {
  Harness h;
  // ~8 km off the route; the detour alone (~1.3 km) would pass.
  const auto far  = h.lifecycle->CreatePackage(MakeDraft("sender-far", GeoPoint{0.07195, 0.5}, GeoPoint{0.0, 0.9}));
  // ~3 km off the route.
  const auto near = h.lifecycle->CreatePackage(MakeDraft("sender-near", GeoPoint{0.027, 0.5}, GeoPoint{0.0, 0.9}));

  const auto matches = h.matcher->FindMatches(EquatorRoute(5.0));
  assert(matches.size() == 1);
  assert(matches[0].package_id == near.id);
  assert(matches[0].package.id == near.id);
  assert(matches[0].distance_from_route_km > 2.9 && matches[0].distance_from_route_km < 3.1);
  assert(matches[0].estimated_detour_km > 0.17 && matches[0].estimated_detour_km < 0.2);
  (void)far;
}

void TestResultsAreOrderedByDetourAndDeterministic() {
  Harness h;
  const auto a = h.lifecycle->CreatePackage(MakeDraft("s-a", GeoPoint{0.01, 0.3}, GeoPoint{0.01, 0.7}));
  const auto b = h.lifecycle->CreatePackage(MakeDraft("s-b", GeoPoint{0.02, 0.3}, GeoPoint{0.0, 0.7}));
  const auto c = h.lifecycle->CreatePackage(MakeDraft("s-c", GeoPoint{0.005, 0.2}, GeoPoint{0.0, 0.4}));

  const auto first = h.matcher->FindMatches(EquatorRoute(5.0));
  assert(first.size() == 3);
  assert(first[0].package_id == c.id);
  assert(first[1].package_id == a.id);
  assert(first[2].package_id == b.id);

  const auto second = h.matcher->FindMatches(EquatorRoute(5.0));
  assert(second.size() == first.size());
  for (std::size_t i = 0; i < first.size(); ++i) {
    assert(second[i].package_id == first[i].package_id);
  }

  const auto limited = h.matcher->FindMatches(EquatorRoute(5.0), 2);
  assert(limited.size() == 2);
  assert(limited[0].package_id == c.id);
}

void TestOnlyOpenPackagesWithLiveDeadlinesMatch() {
  Harness h;
  const auto open     = h.lifecycle->CreatePackage(MakeDraft("s-open", GeoPoint{0.0, 0.2}, GeoPoint{0.0, 0.8}));
  const auto canceled = h.lifecycle->CreatePackage(MakeDraft("s-cancel", GeoPoint{0.0, 0.2}, GeoPoint{0.0, 0.8}));
  h.lifecycle->Cancel(canceled.id, "s-cancel");

  auto matches = h.matcher->FindMatches(EquatorRoute(5.0));
  assert(matches.size() == 1);
  assert(matches[0].package_id == open.id);

  // Deadline reached but not yet processed by the sweep.
  h.clock->Advance(std::chrono::hours(24));
  matches = h.matcher->FindMatches(EquatorRoute(5.0));
  assert(matches.empty());
}

void TestFindMatchesForRouteLoadsStoredRoute() {
  Harness h;
  const auto pkg = h.lifecycle->CreatePackage(MakeDraft("s-1", GeoPoint{0.0, 0.2}, GeoPoint{0.0, 0.8}));

  routebid::model::RouteDraft draft;
  draft.courier_id       = "courier-1";
  draft.start            = {0.0, 0.0};
  draft.end              = {0.0, 1.0};
  draft.max_deviation_km = 5.0;
  const auto route       = h.routes->CreateRoute(draft);

  const auto matches = h.matcher->FindMatchesForRoute(route.id);
  assert(matches.size() == 1);
  assert(matches[0].package_id == pkg.id);

  assert(Throws<routebid::util::NotFound>([&] { h.matcher->FindMatchesForRoute("missing-route"); }));
}

void TestInvalidRouteIsRejected() {
  Harness h;
  auto    route = EquatorRoute(0.0);
  assert(Throws<routebid::util::InvalidArgument>([&] { h.matcher->FindMatches(route); }));
  route                  = EquatorRoute(5.0);
  route.start.lat        = 91.0;
  assert(Throws<routebid::util::InvalidArgument>([&] { h.matcher->FindMatches(route); }));
}

} // namespace

int main() {
  TestPickupBeyondDeviationIsExcludedEvenWithSmallDetour();
  TestResultsAreOrderedByDetourAndDeterministic();
  TestOnlyOpenPackagesWithLiveDeadlinesMatch();
  TestFindMatchesForRouteLoadsStoredRoute();
  TestInvalidRouteIsRejected();

  std::cout << "routebid_unit_match_engine: pass\n";
  return 0;
}
