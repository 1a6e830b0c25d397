#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/model/bid.hpp"
#include "internal/model/package.hpp"
#include "internal/model/route.hpp"

namespace routebid::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - UpdatePackage is a compare-and-swap on Package::version; a stale
    version yields ErrorCode::Conflict and nothing is written
  - At most one PENDING-or-SELECTED bid per (package, courier) and at most
    one SELECTED bid per package; violations yield AlreadyExists /
    ConstraintViolation
  - Lists are ordered by created_at, then id

  The DB is the source of truth for packages, bids and routes.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Packages
  // ---------------------------------------------------------------------

  // Stores the package with version 1.
  virtual Result InsertPackage(Transaction&, model::Package&) = 0;

  virtual std::optional<model::Package> GetPackage(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::Package> ListPackages(Transaction&, const PackageFilter&) = 0;

  // Succeeds only when the stored version equals pkg.version; on success
  // pkg.version is advanced to the stored value.
  virtual Result UpdatePackage(Transaction&, model::Package& pkg) = 0;

  // ---------------------------------------------------------------------
  // Bids
  // ---------------------------------------------------------------------

  virtual Result InsertBid(Transaction&, const model::Bid&) = 0;

  virtual std::optional<model::Bid> GetBid(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::Bid> ListBidsForPackage(Transaction&, const std::string& package_id, const BidFilter&) = 0;

  virtual std::vector<model::Bid> ListBidsForCourier(Transaction&, const std::string& courier_id, const BidFilter&) = 0;

  virtual Result UpdateBid(Transaction&, const model::Bid&) = 0;

  // ---------------------------------------------------------------------
  // Routes
  // ---------------------------------------------------------------------

  virtual Result InsertRoute(Transaction&, const model::Route&) = 0;

  virtual std::optional<model::Route> GetRoute(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::Route> ListRoutesForCourier(Transaction&, const std::string& courier_id) = 0;

  // Active routes of every courier.
  virtual std::vector<model::Route> ListActiveRoutes(Transaction&) = 0;

  virtual Result UpdateRoute(Transaction&, const model::Route&) = 0;
};

} // namespace routebid::db
