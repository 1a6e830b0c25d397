#include "internal/geo/geo_math.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace routebid::geo {
namespace {

double ToRadians(double degrees) {
  return degrees * std::numbers::pi / 180.0;
}

double InitialBearing(const model::GeoPoint& from, const model::GeoPoint& to) {
  const double lat1 = ToRadians(from.lat);
  const double lat2 = ToRadians(to.lat);
  const double dlng = ToRadians(to.lng - from.lng);

  const double y = std::sin(dlng) * std::cos(lat2);
  const double x = std::cos(lat1) * std::sin(lat2) - std::sin(lat1) * std::cos(lat2) * std::cos(dlng);
  return std::atan2(y, x);
}

} // namespace

double HaversineKm(const model::GeoPoint& a, const model::GeoPoint& b) {
  const double lat1 = ToRadians(a.lat);
  const double lat2 = ToRadians(b.lat);
  const double dlat = lat2 - lat1;
  const double dlng = ToRadians(b.lng - a.lng);

  const double h = std::sin(dlat / 2) * std::sin(dlat / 2) + std::cos(lat1) * std::cos(lat2) * std::sin(dlng / 2) * std::sin(dlng / 2);
  return 2.0 * kEarthRadiusKm * std::asin(std::min(1.0, std::sqrt(h)));
}

double PointToSegmentKm(const model::GeoPoint& p, const model::GeoPoint& start, const model::GeoPoint& end) {
  const double d_start_point = HaversineKm(start, p);
  const double d_start_end   = HaversineKm(start, end);

  if (d_start_end < kDegenerateSegmentKm) {
    return d_start_point;
  }

  const double angle = InitialBearing(start, p) - InitialBearing(start, end);

  // Projection falls behind the start.
  if (std::cos(angle) < 0.0) {
    return d_start_point;
  }

  const double angular_start_point = d_start_point / kEarthRadiusKm;
  const double cross_track         = std::asin(std::clamp(std::sin(angular_start_point) * std::sin(angle), -1.0, 1.0));
  const double along_track =
      std::acos(std::clamp(std::cos(angular_start_point) / std::cos(cross_track), -1.0, 1.0)) * kEarthRadiusKm;

  if (along_track > d_start_end) {
    return HaversineKm(end, p);
  }
  return std::abs(cross_track) * kEarthRadiusKm;
}

double DetourKm(const model::GeoPoint& start,
                const model::GeoPoint& end,
                const model::GeoPoint& pickup,
                const model::GeoPoint& dropoff) {
  const double direct    = HaversineKm(start, end);
  const double with_trip = HaversineKm(start, pickup) + HaversineKm(pickup, dropoff) + HaversineKm(dropoff, end);
  return with_trip - direct;
}

} // namespace routebid::geo
