#pragma once

#include <chrono>
#include <cstdint>

namespace routebid::lifecycle {

// Bidding window rules applied at creation and by the deadline sweep.
struct BiddingPolicy {
  std::chrono::milliseconds base_window{std::chrono::hours(24)};
  std::chrono::milliseconds extension_window{std::chrono::hours(12)};
  std::uint32_t             max_extensions{2};
  // BidDeadlineWarning fires once this close to the deadline.
  std::chrono::milliseconds warning_lead{std::chrono::hours(6)};
};

} // namespace routebid::lifecycle
