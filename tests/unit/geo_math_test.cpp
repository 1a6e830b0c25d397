#include "internal/geo/geo_math.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

namespace {

using routebid::geo::DetourKm;
using routebid::geo::HaversineKm;
using routebid::geo::PointToSegmentKm;
using routebid::model::GeoPoint;

bool Near(double actual, double expected, double tolerance = 0.01) {
  return std::abs(actual - expected) <= tolerance;
}

void TestHaversineOneDegreeOfLongitudeAtEquator() {
  assert(Near(HaversineKm({0.0, 0.0}, {0.0, 1.0}), 111.195));
  assert(HaversineKm({12.5, 40.0}, {12.5, 40.0}) == 0.0);
  assert(Near(HaversineKm({37.7749, -122.4194}, {37.8044, -122.2712}), HaversineKm({37.8044, -122.2712}, {37.7749, -122.4194}), 1e-9));
}

void TestPointBesideSegmentUsesCrossTrack() {
  const GeoPoint start{0.0, 0.0};
  const GeoPoint end{0.0, 1.0};
  assert(Near(PointToSegmentKm({0.1, 0.5}, start, end), 11.119));
  assert(Near(PointToSegmentKm({-0.1, 0.5}, start, end), 11.119));
  assert(PointToSegmentKm({0.0, 0.5}, start, end) < 1e-6);
}

void TestPointOutsideSegmentUsesNearestEndpoint() {
  const GeoPoint start{0.0, 0.0};
  const GeoPoint end{0.0, 1.0};
  // Behind the start.
  assert(Near(PointToSegmentKm({0.0, -0.5}, start, end), 55.597));
  // Past the end.
  assert(Near(PointToSegmentKm({0.0, 1.5}, start, end), 55.597));
}

void TestDegenerateSegmentFallsBackToStartDistance() {
  const GeoPoint here{0.0, 0.0};
  const GeoPoint nearby{0.0, 0.0005}; // ~55 m, below the 0.1 km threshold
  const GeoPoint p{0.3, 0.3};
  assert(Near(PointToSegmentKm(p, here, here), HaversineKm(here, p), 1e-9));
  assert(Near(PointToSegmentKm(p, here, nearby), HaversineKm(here, p), 1e-9));
}

void TestDetourIsZeroAlongRouteAndNonNegativeElsewhere() {
  const GeoPoint start{0.0, 0.0};
  const GeoPoint end{0.0, 1.0};
  assert(Near(DetourKm(start, end, {0.0, 0.2}, {0.0, 0.8}), 0.0, 1e-6));
  assert(Near(DetourKm(start, end, {0.027, 0.5}, {0.0, 0.9}), 0.182));
  assert(DetourKm(start, end, {0.5, -0.5}, {-0.5, 1.5}) > 0.0);
  assert(DetourKm(start, end, {0.0, 0.8}, {0.0, 0.2}) > 0.0);
}

} // namespace

int main() {
  TestHaversineOneDegreeOfLongitudeAtEquator();
  TestPointBesideSegmentUsesCrossTrack();
  TestPointOutsideSegmentUsesNearestEndpoint();
  TestDegenerateSegmentFallsBackToStartDistance();
  TestDetourIsZeroAlongRouteAndNonNegativeElsewhere();

  std::cout << "routebid_unit_geo_math: pass\n";
  return 0;
}
