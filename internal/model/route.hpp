#pragma once

#include <optional>
#include <string>

#include "internal/model/geo_point.hpp"
#include "internal/model/package.hpp"
#include "internal/util/time.hpp"

namespace routebid::model {

struct Route {
  std::string id;
  std::string courier_id;

  GeoPoint    start;
  std::string start_address;
  GeoPoint    end;
  std::string end_address;

  double max_deviation_km = 0.0;

  std::optional<util::TimePoint> trip_date;
  bool                           is_active = false;
  util::TimePoint                created_at{};
};

struct RouteDraft {
  std::string courier_id;

  GeoPoint    start;
  std::string start_address;
  GeoPoint    end;
  std::string end_address;

  double                         max_deviation_km = 0.0;
  std::optional<util::TimePoint> trip_date;
};

// Derived; never persisted.
struct MatchResult {
  std::string package_id;
  double      distance_from_route_km = 0.0;
  double      estimated_detour_km    = 0.0;
  Package     package;
};

} // namespace routebid::model
