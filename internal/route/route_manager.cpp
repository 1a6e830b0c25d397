#include "internal/route/route_manager.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace routebid::route {

using observability::IntField;
using observability::StringField;

namespace {

bool TripOver(const model::Route& route, util::TimePoint now) {
  return route.trip_date && *route.trip_date < now;
}

} // namespace

RouteManager::RouteManager(std::shared_ptr<db::Repository>       repository,
                           std::shared_ptr<lock::KeyedLockTable> locks,
                           std::shared_ptr<bid::BidLedger>       ledger,
                           std::shared_ptr<const util::Clock>    clock)
    : repository_(std::move(repository)), locks_(std::move(locks)), ledger_(std::move(ledger)), clock_(std::move(clock)) {
}

model::Route RouteManager::CreateRoute(const model::RouteDraft& draft) {
  if (draft.courier_id.empty()) {
    throw util::InvalidArgument("courier_id is required");
  }
  if (!model::IsValid(draft.start) || !model::IsValid(draft.end)) {
    throw util::InvalidArgument("route coordinates must be valid WGS84 degrees");
  }
  if (!(draft.max_deviation_km > 0.0)) {
    throw util::InvalidArgument("max deviation must be positive");
  }

  model::Route route;
  route.id               = util::NewId();
  route.courier_id       = draft.courier_id;
  route.start            = draft.start;
  route.start_address    = draft.start_address;
  route.end              = draft.end;
  route.end_address      = draft.end_address;
  route.max_deviation_km = draft.max_deviation_km;
  route.trip_date        = draft.trip_date;
  route.is_active        = true;

  auto guard = locks_->Acquire(lock::KeyedLockTable::CourierKey(draft.courier_id));

  bool replaces_active = false;
  {
    auto tx = repository_->Begin();
    for (const auto& existing : repository_->ListRoutesForCourier(*tx, draft.courier_id)) {
      replaces_active = replaces_active || existing.is_active;
    }
    if (replaces_active) {
      RequireNoActiveDeliveries(*tx, draft.courier_id);
    }
  }

  // Bids placed under the old route go with it.
  const std::size_t withdrawn = replaces_active ? WithdrawPendingBids(draft.courier_id) : 0;

  auto tx          = repository_->Begin();
  route.created_at = clock_->Now();

  // Deactivate first so the one-active-route index never sees two rows.
  for (auto existing : repository_->ListRoutesForCourier(*tx, draft.courier_id)) {
    if (!existing.is_active) continue;
    existing.is_active = false;
    db::ThrowIfError(repository_->UpdateRoute(*tx, existing), "deactivate route");
    ROUTEBID_LOG_INFO("route deactivated", {StringField("route_id", existing.id), StringField("courier_id", existing.courier_id),
                                            IntField("bids_withdrawn", static_cast<int64_t>(withdrawn))});
  }

  db::ThrowIfError(repository_->InsertRoute(*tx, route), "insert route");
  tx->Commit();

  ROUTEBID_LOG_INFO("route created", {StringField("route_id", route.id),
                                      StringField("courier_id", route.courier_id),
                                      observability::DoubleField("max_deviation_km", route.max_deviation_km)});
  return route;
}

model::Route RouteManager::DeactivateRoute(const std::string& route_id, const std::string& courier_id) {
  auto guard = locks_->Acquire(lock::KeyedLockTable::CourierKey(courier_id));

  {
    auto tx    = repository_->Begin();
    auto route = repository_->GetRoute(*tx, route_id);
    if (!route) {
      throw util::NotFound("route not found: " + route_id);
    }
    if (route->courier_id != courier_id) {
      throw util::NotOwner("route " + route_id + " does not belong to courier " + courier_id);
    }
    if (!route->is_active) {
      return *route;
    }
    RequireNoActiveDeliveries(*tx, courier_id);
  }

  const std::size_t withdrawn = WithdrawPendingBids(courier_id);

  auto tx    = repository_->Begin();
  auto route = repository_->GetRoute(*tx, route_id);
  if (!route) {
    throw util::NotFound("route not found: " + route_id);
  }
  route->is_active = false;
  db::ThrowIfError(repository_->UpdateRoute(*tx, *route), "deactivate route");
  tx->Commit();

  ROUTEBID_LOG_INFO("route deactivated", {StringField("route_id", route_id), StringField("courier_id", courier_id),
                                          IntField("bids_withdrawn", static_cast<int64_t>(withdrawn))});
  return *route;
}

RouteExpiryReport RouteManager::ExpireRoutes() {
  RouteExpiryReport report;

  std::vector<model::Route> candidates;
  {
    auto       tx  = repository_->Begin();
    const auto now = clock_->Now();
    for (auto& route : repository_->ListActiveRoutes(*tx)) {
      if (TripOver(route, now)) candidates.push_back(std::move(route));
    }
  }

  for (const auto& candidate : candidates) {
    try {
      auto guard = locks_->Acquire(lock::KeyedLockTable::CourierKey(candidate.courier_id));

      // Replaced or deactivated since the scan.
      {
        auto tx      = repository_->Begin();
        auto current = repository_->GetRoute(*tx, candidate.id);
        if (!current || !current->is_active || !TripOver(*current, clock_->Now())) continue;
      }

      const std::size_t withdrawn = WithdrawPendingBids(candidate.courier_id);

      auto tx    = repository_->Begin();
      auto route = repository_->GetRoute(*tx, candidate.id);
      if (!route) continue;
      route->is_active = false;
      db::ThrowIfError(repository_->UpdateRoute(*tx, *route), "expire route");
      tx->Commit();

      ++report.routes_deactivated;
      report.bids_withdrawn += withdrawn;
      ROUTEBID_LOG_INFO("route trip date passed",
                        {StringField("route_id", route->id), StringField("courier_id", route->courier_id),
                         IntField("trip_date_ms", util::ToUnixMillis(*route->trip_date)),
                         IntField("bids_withdrawn", static_cast<int64_t>(withdrawn))});
    } catch (const std::exception& e) {
      ++report.failures;
      ROUTEBID_LOG_WARN("route expiry failed", {StringField("route_id", candidate.id), StringField("error", e.what())});
    }
  }
  return report;
}

model::Route RouteManager::GetRoute(const std::string& route_id) const {
  auto tx    = repository_->Begin();
  auto route = repository_->GetRoute(*tx, route_id);
  if (!route) {
    throw util::NotFound("route not found: " + route_id);
  }
  return *route;
}

std::optional<model::Route> RouteManager::ActiveRoute(const std::string& courier_id) const {
  for (auto& route : ListRoutes(courier_id)) {
    if (route.is_active) return route;
  }
  return std::nullopt;
}

std::vector<model::Route> RouteManager::ListRoutes(const std::string& courier_id) const {
  auto tx = repository_->Begin();
  return repository_->ListRoutesForCourier(*tx, courier_id);
}

void RouteManager::RequireNoActiveDeliveries(db::Transaction& tx, const std::string& courier_id) {
  db::PackageFilter filter;
  filter.courier_id = courier_id;

  std::string blocking;
  for (const auto& pkg : repository_->ListPackages(tx, filter)) {
    if (pkg.status != model::PackageStatus::kPendingPickup && pkg.status != model::PackageStatus::kInTransit) continue;
    blocking += (blocking.empty() ? "" : ",") + pkg.id;
  }
  if (!blocking.empty()) {
    throw util::ActiveDeliveries("courier " + courier_id + " has active deliveries: " + blocking);
  }
}

std::size_t RouteManager::WithdrawPendingBids(const std::string& courier_id) {
  std::size_t withdrawn = 0;
  for (const auto& bid : ledger_->ListBidsForCourier(courier_id, model::BidStatus::kPending)) {
    try {
      ledger_->WithdrawBid(bid.id, courier_id);
      ++withdrawn;
    } catch (const util::AlreadyTerminal&) {
      // Selected or expired after the listing.
    }
  }
  return withdrawn;
}

} // namespace routebid::route
