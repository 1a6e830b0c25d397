#include "internal/match/match_engine.hpp"

#include <algorithm>
#include <tuple>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace routebid::match {

MatchEngine::MatchEngine(std::shared_ptr<db::Repository>           repository,
                         std::shared_ptr<const geo::DistanceModel> distance,
                         std::shared_ptr<const util::Clock>        clock)
    : repository_(std::move(repository)), distance_(std::move(distance)), clock_(std::move(clock)) {
}

std::vector<model::MatchResult> MatchEngine::FindMatches(const model::Route& route, std::size_t limit) const {
  if (!model::IsValid(route.start) || !model::IsValid(route.end)) {
    throw util::InvalidArgument("route coordinates must be valid WGS84 degrees");
  }
  if (!(route.max_deviation_km > 0.0)) {
    throw util::InvalidArgument("route max deviation must be positive");
  }

  db::PackageFilter filter;
  filter.status = model::PackageStatus::kOpenForBids;

  std::vector<model::Package> candidates;
  {
    auto tx    = repository_->Begin();
    candidates = repository_->ListPackages(*tx, filter);
  }

  const auto now = clock_->Now();
  const auto max = route.max_deviation_km;

  std::vector<model::MatchResult> matches;
  for (auto& pkg : candidates) {
    if (pkg.bidding_deadline && now >= *pkg.bidding_deadline) {
      continue;
    }

    const double pickup_km = distance_->DistanceToRouteKm(pkg.pickup, route.start, route.end);
    if (pickup_km > max) continue;

    const double dropoff_km = distance_->DistanceToRouteKm(pkg.dropoff, route.start, route.end);
    if (dropoff_km > max) continue;

    const double detour_km = distance_->DetourKm(route.start, route.end, pkg.pickup, pkg.dropoff);
    if (detour_km > max) continue;

    model::MatchResult result;
    result.package_id             = pkg.id;
    result.distance_from_route_km = pickup_km;
    result.estimated_detour_km    = detour_km;
    result.package                = std::move(pkg);
    matches.push_back(std::move(result));
  }

  std::sort(matches.begin(), matches.end(), [](const model::MatchResult& a, const model::MatchResult& b) {
    return std::tie(a.estimated_detour_km, a.distance_from_route_km, a.package.created_at, a.package_id) <
           std::tie(b.estimated_detour_km, b.distance_from_route_km, b.package.created_at, b.package_id);
  });

  if (limit > 0 && matches.size() > limit) {
    matches.resize(limit);
  }

  ROUTEBID_LOG_DEBUG("matches computed", {observability::StringField("route_id", route.id),
                                          observability::IntField("candidates", static_cast<int64_t>(candidates.size())),
                                          observability::IntField("matches", static_cast<int64_t>(matches.size()))});
  return matches;
}

std::vector<model::MatchResult> MatchEngine::FindMatchesForRoute(const std::string& route_id, std::size_t limit) const {
  std::optional<model::Route> route;
  {
    auto tx = repository_->Begin();
    route   = repository_->GetRoute(*tx, route_id);
  }
  if (!route) {
    throw util::NotFound("route not found: " + route_id);
  }
  return FindMatches(*route, limit);
}

} // namespace routebid::match
