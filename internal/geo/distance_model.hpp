#pragma once

#include "internal/geo/geo_math.hpp"
#include "internal/model/geo_point.hpp"

namespace routebid::geo {

/*
  Distance strategy used by matching.

  The great-circle model is the only one shipped; a road-network model can
  be plugged in without touching the match engine.
*/
class DistanceModel {
 public:
  virtual ~DistanceModel() = default;

  virtual double DistanceToRouteKm(const model::GeoPoint& p, const model::GeoPoint& start, const model::GeoPoint& end) const = 0;

  virtual double DetourKm(const model::GeoPoint& start,
                          const model::GeoPoint& end,
                          const model::GeoPoint& pickup,
                          const model::GeoPoint& dropoff) const = 0;
};

class GreatCircleDistance final : public DistanceModel {
 public:
  double DistanceToRouteKm(const model::GeoPoint& p, const model::GeoPoint& start, const model::GeoPoint& end) const override {
    return PointToSegmentKm(p, start, end);
  }

  double DetourKm(const model::GeoPoint& start,
                  const model::GeoPoint& end,
                  const model::GeoPoint& pickup,
                  const model::GeoPoint& dropoff) const override {
    return geo::DetourKm(start, end, pickup, dropoff);
  }
};

} // namespace routebid::geo
