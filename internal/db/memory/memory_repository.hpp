#pragma once

#include <mutex>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace routebid::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

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

 private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::Package> packages;
    std::unordered_map<std::string, model::Bid>     bids;
    std::unordered_map<std::string, model::Route>   routes;
  };

  // Checks the bid uniqueness rules for `candidate` against `state`.
  static Result CheckBidInvariants(const State& state, const model::Bid& candidate);

  std::mutex mutex_;
  State      committed_;
};

} // namespace routebid::db::memory
