#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace routebid::db::postgres {

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result                        InsertPackage(Transaction&, model::Package&) override;
  std::optional<model::Package> GetPackage(Transaction&, const std::string&) override;
  std::vector<model::Package>   ListPackages(Transaction&, const PackageFilter&) override;
  Result                        UpdatePackage(Transaction&, model::Package&) override;

  Result                    InsertBid(Transaction&, const model::Bid&) override;
  std::optional<model::Bid> GetBid(Transaction&, const std::string&) override;
  std::vector<model::Bid>   ListBidsForPackage(Transaction&, const std::string&, const BidFilter&) override;
  std::vector<model::Bid>   ListBidsForCourier(Transaction&, const std::string&, const BidFilter&) override;
  Result                    UpdateBid(Transaction&, const model::Bid&) override;

  Result                      InsertRoute(Transaction&, const model::Route&) override;
  std::optional<model::Route> GetRoute(Transaction&, const std::string&) override;
  std::vector<model::Route>   ListRoutesForCourier(Transaction&, const std::string&) override;
  std::vector<model::Route>   ListActiveRoutes(Transaction&) override;
  Result                      UpdateRoute(Transaction&, const model::Route&) override;

  // Creates tables and indexes if they do not exist.
  static void BootstrapSchema(const std::string& conninfo);

 private:
  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception& e);

  std::shared_ptr<PgPool> pool_;
};

} // namespace routebid::db::postgres
