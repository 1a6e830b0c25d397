#include "internal/model/package_status.hpp"

namespace routebid::model {
namespace {

template <typename Enum>
std::optional<Enum> ParseEnum(std::string_view text, Enum first, Enum last) {
  for (auto i = static_cast<std::uint8_t>(first); i <= static_cast<std::uint8_t>(last); ++i) {
    const auto value = static_cast<Enum>(i);
    if (ToString(value) == text) {
      return value;
    }
  }
  return std::nullopt;
}

} // namespace

std::optional<PackageStatus> ParsePackageStatus(std::string_view text) {
  return ParseEnum(text, PackageStatus::kNew, PackageStatus::kFailed);
}

std::optional<BidStatus> ParseBidStatus(std::string_view text) {
  return ParseEnum(text, BidStatus::kPending, BidStatus::kExpired);
}

std::optional<PackageSize> ParsePackageSize(std::string_view text) {
  return ParseEnum(text, PackageSize::kSmall, PackageSize::kExtraLarge);
}

} // namespace routebid::model
