#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/geo_point.hpp"
#include "internal/model/package_status.hpp"
#include "internal/util/time.hpp"

namespace routebid::model {

struct Package {
  std::string   id;
  PackageStatus status = PackageStatus::kUnspecified;
  std::string   sender_id;

  std::string   description;
  PackageSize   size      = PackageSize::kUnspecified;
  double        weight_kg = 0.0;

  GeoPoint    pickup;
  std::string pickup_address;
  GeoPoint    dropoff;
  std::string dropoff_address;

  std::optional<double> offered_price;

  std::optional<std::string> selected_bid_id;
  std::optional<std::string> courier_id;

  util::TimePoint                created_at{};
  util::TimePoint                status_changed_at{};
  std::optional<util::TimePoint> bidding_deadline;
  std::uint32_t                  deadline_extension_count = 0;
  bool                           deadline_warning_sent    = false;

  std::string delivery_proof_ref;
  std::string failure_reason;

  // Bumped on every persisted write.
  std::uint64_t version = 0;
};

// Caller-supplied fields for a new package.
struct PackageDraft {
  std::string sender_id;
  std::string description;
  PackageSize size      = PackageSize::kUnspecified;
  double      weight_kg = 0.0;

  GeoPoint    pickup;
  std::string pickup_address;
  GeoPoint    dropoff;
  std::string dropoff_address;

  std::optional<double> offered_price;
};

} // namespace routebid::model
