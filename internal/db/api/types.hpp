#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "internal/model/package_status.hpp"

namespace routebid::db {

struct PackageFilter {
  std::optional<model::PackageStatus> status;
  std::optional<std::string>          sender_id;
  std::optional<std::string>          courier_id;
  // 0 = unlimited
  std::size_t limit = 0;
};

struct BidFilter {
  std::optional<model::BidStatus> status;
};

} // namespace routebid::db
