#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/bid/bid_ledger.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/lock/keyed_lock_table.hpp"
#include "internal/model/route.hpp"
#include "internal/util/time.hpp"

namespace routebid::route {

struct RouteExpiryReport {
  std::size_t routes_deactivated = 0;
  std::size_t bids_withdrawn     = 0;
  std::size_t failures           = 0;
};

/*
  Courier routes. A courier has at most one active route; activating a new
  one deactivates the rest in the same transaction under the courier lock.

  Taking a route out of service withdraws the courier's PENDING bids, each
  under its package lock. A courier with a package in PENDING_PICKUP or
  IN_TRANSIT cannot replace or deactivate a route (ActiveDeliveries).

  Lock order is courier, then package.
*/
class RouteManager {
 public:
  RouteManager(std::shared_ptr<db::Repository>       repository,
               std::shared_ptr<lock::KeyedLockTable> locks,
               std::shared_ptr<bid::BidLedger>       ledger,
               std::shared_ptr<const util::Clock>    clock);

  model::Route CreateRoute(const model::RouteDraft& draft);

  // Idempotent for an already inactive route.
  model::Route DeactivateRoute(const std::string& route_id, const std::string& courier_id);

  // Deactivates every active route whose trip_date has passed. Runs from
  // the deadline sweep; active deliveries do not block it.
  RouteExpiryReport ExpireRoutes();

  model::Route                GetRoute(const std::string& route_id) const;
  std::optional<model::Route> ActiveRoute(const std::string& courier_id) const;
  std::vector<model::Route>   ListRoutes(const std::string& courier_id) const;

 private:
  void        RequireNoActiveDeliveries(db::Transaction& tx, const std::string& courier_id);
  std::size_t WithdrawPendingBids(const std::string& courier_id);

  std::shared_ptr<db::Repository>       repository_;
  std::shared_ptr<lock::KeyedLockTable> locks_;
  std::shared_ptr<bid::BidLedger>       ledger_;
  std::shared_ptr<const util::Clock>    clock_;
};

} // namespace routebid::route
