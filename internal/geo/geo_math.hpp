#pragma once

#include "internal/model/geo_point.hpp"

namespace routebid::geo {

/*
  Spherical-earth geometry on WGS84 degrees.

  All results are kilometers as doubles; nothing is rounded here.
*/

inline constexpr double kEarthRadiusKm = 6371.0;

// Segments shorter than this are treated as a single point.
inline constexpr double kDegenerateSegmentKm = 0.1;

double HaversineKm(const model::GeoPoint& a, const model::GeoPoint& b);

// Distance from p to the great-circle segment start-end. Uses the
// cross-track distance when the projection falls inside the segment and
// the nearer endpoint otherwise.
double PointToSegmentKm(const model::GeoPoint& p, const model::GeoPoint& start, const model::GeoPoint& end);

// d(start,pickup) + d(pickup,dropoff) + d(dropoff,end) - d(start,end)
double DetourKm(const model::GeoPoint& start,
                const model::GeoPoint& end,
                const model::GeoPoint& pickup,
                const model::GeoPoint& dropoff);

} // namespace routebid::geo
