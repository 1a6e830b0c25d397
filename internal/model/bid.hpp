#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "internal/model/package_status.hpp"
#include "internal/util/time.hpp"

namespace routebid::model {

inline constexpr std::size_t kMaxBidMessageLength = 500;

struct Bid {
  std::string id;
  std::string package_id;
  std::string courier_id;

  double                         proposed_price = 0.0;
  std::optional<util::TimePoint> proposed_pickup_time;
  std::string                    message;

  BidStatus                      status = BidStatus::kUnspecified;
  util::TimePoint                created_at{};
  std::optional<util::TimePoint> resolved_at;
};

} // namespace routebid::model
