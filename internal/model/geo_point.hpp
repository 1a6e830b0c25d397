#pragma once

namespace routebid::model {

// WGS84 degrees.
struct GeoPoint {
  double lat = 0.0;
  double lng = 0.0;
};

constexpr bool IsValid(const GeoPoint& p) {
  return p.lat >= -90.0 && p.lat <= 90.0 && p.lng >= -180.0 && p.lng <= 180.0;
}

} // namespace routebid::model
