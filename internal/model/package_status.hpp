#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace routebid::model {

enum class PackageStatus : std::uint8_t {
  kUnspecified   = 0,
  kNew           = 1,
  kOpenForBids   = 2,
  kBidSelected   = 3,
  kPendingPickup = 4,
  kInTransit     = 5,
  kDelivered     = 6,
  kCanceled      = 7,
  kFailed        = 8,
};

enum class BidStatus : std::uint8_t {
  kUnspecified = 0,
  kPending     = 1,
  kSelected    = 2,
  kRejected    = 3,
  kWithdrawn   = 4,
  kExpired     = 5,
};

enum class PackageSize : std::uint8_t {
  kUnspecified = 0,
  kSmall       = 1,
  kMedium      = 2,
  kLarge       = 3,
  kExtraLarge  = 4,
};

constexpr bool IsTerminal(PackageStatus status) {
  return status == PackageStatus::kDelivered || status == PackageStatus::kCanceled || status == PackageStatus::kFailed;
}

constexpr bool IsTerminal(BidStatus status) {
  return status != BidStatus::kPending && status != BidStatus::kUnspecified;
}

// Statuses that carry a selected bid.
constexpr bool HasSelectedBid(PackageStatus status) {
  switch (status) {
    case PackageStatus::kBidSelected:
    case PackageStatus::kPendingPickup:
    case PackageStatus::kInTransit:
    case PackageStatus::kDelivered:
    case PackageStatus::kFailed:
      return true;
    default:
      return false;
  }
}

/*
  Package transition table.

  OPEN_FOR_BIDS -> OPEN_FOR_BIDS is the deadline extension / bidding reset
  self-transition; it is the only self-edge.
*/
constexpr bool CanTransition(PackageStatus from, PackageStatus to) {
  switch (from) {
    case PackageStatus::kNew:
      return to == PackageStatus::kOpenForBids || to == PackageStatus::kCanceled;
    case PackageStatus::kOpenForBids:
      return to == PackageStatus::kOpenForBids || to == PackageStatus::kBidSelected || to == PackageStatus::kCanceled;
    case PackageStatus::kBidSelected:
      return to == PackageStatus::kPendingPickup || to == PackageStatus::kCanceled;
    case PackageStatus::kPendingPickup:
      return to == PackageStatus::kInTransit || to == PackageStatus::kCanceled || to == PackageStatus::kFailed;
    case PackageStatus::kInTransit:
      return to == PackageStatus::kDelivered || to == PackageStatus::kFailed;
    default:
      return false;
  }
}

constexpr std::string_view ToString(PackageStatus status) {
  switch (status) {
    case PackageStatus::kNew:
      return "NEW";
    case PackageStatus::kOpenForBids:
      return "OPEN_FOR_BIDS";
    case PackageStatus::kBidSelected:
      return "BID_SELECTED";
    case PackageStatus::kPendingPickup:
      return "PENDING_PICKUP";
    case PackageStatus::kInTransit:
      return "IN_TRANSIT";
    case PackageStatus::kDelivered:
      return "DELIVERED";
    case PackageStatus::kCanceled:
      return "CANCELED";
    case PackageStatus::kFailed:
      return "FAILED";
    default:
      return "UNSPECIFIED";
  }
}

constexpr std::string_view ToString(BidStatus status) {
  switch (status) {
    case BidStatus::kPending:
      return "PENDING";
    case BidStatus::kSelected:
      return "SELECTED";
    case BidStatus::kRejected:
      return "REJECTED";
    case BidStatus::kWithdrawn:
      return "WITHDRAWN";
    case BidStatus::kExpired:
      return "EXPIRED";
    default:
      return "UNSPECIFIED";
  }
}

constexpr std::string_view ToString(PackageSize size) {
  switch (size) {
    case PackageSize::kSmall:
      return "SMALL";
    case PackageSize::kMedium:
      return "MEDIUM";
    case PackageSize::kLarge:
      return "LARGE";
    case PackageSize::kExtraLarge:
      return "EXTRA_LARGE";
    default:
      return "UNSPECIFIED";
  }
}

std::optional<PackageStatus> ParsePackageStatus(std::string_view text);
std::optional<BidStatus>     ParseBidStatus(std::string_view text);
std::optional<PackageSize>   ParsePackageSize(std::string_view text);

} // namespace routebid::model
