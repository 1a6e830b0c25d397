#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace routebid::db::memory {

namespace {

bool IsActive(model::BidStatus status) {
  return status == model::BidStatus::kPending || status == model::BidStatus::kSelected;
}

template <typename T>
void SortByCreation(std::vector<T>& rows) {
  std::sort(rows.begin(), rows.end(), [](const T& a, const T& b) {
    if (a.created_at != b.created_at) return a.created_at < b.created_at;
    return a.id < b.id;
  });
}

bool Matches(const model::Bid& bid, const BidFilter& filter) {
  return !filter.status || bid.status == *filter.status;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::CheckBidInvariants(const State& state, const model::Bid& candidate) {
  if (!IsActive(candidate.status)) {
    return Result::Ok();
  }

  for (const auto& [id, other] : state.bids) {
    if (id == candidate.id || other.package_id != candidate.package_id) continue;

    if (candidate.status == model::BidStatus::kSelected && other.status == model::BidStatus::kSelected) {
      return Result::Err(ErrorCode::ConstraintViolation, "package already has a selected bid");
    }
    if (other.courier_id == candidate.courier_id && IsActive(other.status)) {
      return Result::Err(ErrorCode::AlreadyExists, "courier already has an active bid on this package");
    }
  }
  return Result::Ok();
}

Result MemoryRepository::InsertPackage(Transaction& t, model::Package& pkg) {
  auto& tx = TX(t);
  if (tx.View().packages.contains(pkg.id)) return Result::Err(ErrorCode::AlreadyExists);
  pkg.version = 1;
  tx.PutPackage(pkg);
  return Result::Ok();
}

std::optional<model::Package> MemoryRepository::GetPackage(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.packages.find(id);
  if (it == s.packages.end()) return std::nullopt;
  return it->second;
}

std::vector<model::Package> MemoryRepository::ListPackages(Transaction& t, const PackageFilter& filter) {
  std::vector<model::Package> out;
  for (const auto& [_, pkg] : TX(t).View().packages) {
    if (filter.status && pkg.status != *filter.status) continue;
    if (filter.sender_id && pkg.sender_id != *filter.sender_id) continue;
    if (filter.courier_id && pkg.courier_id != *filter.courier_id) continue;
    out.push_back(pkg);
  }
  SortByCreation(out);
  if (filter.limit > 0 && out.size() > filter.limit) {
    out.resize(filter.limit);
  }
  return out;
}

Result MemoryRepository::UpdatePackage(Transaction& t, model::Package& pkg) {
  auto&       tx = TX(t);
  const auto& s  = tx.View();
  auto        it = s.packages.find(pkg.id);
  if (it == s.packages.end()) return Result::Err(ErrorCode::NotFound);
  if (it->second.version != pkg.version) {
    return Result::Err(ErrorCode::Conflict, "stale package version");
  }
  ++pkg.version;
  tx.PutPackage(pkg);
  return Result::Ok();
}

Result MemoryRepository::InsertBid(Transaction& t, const model::Bid& bid) {
  auto& tx = TX(t);
  if (tx.View().bids.contains(bid.id)) return Result::Err(ErrorCode::AlreadyExists);
  if (auto result = CheckBidInvariants(tx.View(), bid); !result) return result;
  tx.PutBid(bid);
  return Result::Ok();
}

std::optional<model::Bid> MemoryRepository::GetBid(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.bids.find(id);
  if (it == s.bids.end()) return std::nullopt;
  return it->second;
}

std::vector<model::Bid> MemoryRepository::ListBidsForPackage(Transaction& t, const std::string& package_id, const BidFilter& filter) {
  std::vector<model::Bid> out;
  for (const auto& [_, bid] : TX(t).View().bids) {
    if (bid.package_id == package_id && Matches(bid, filter)) out.push_back(bid);
  }
  SortByCreation(out);
  return out;
}

std::vector<model::Bid> MemoryRepository::ListBidsForCourier(Transaction& t, const std::string& courier_id, const BidFilter& filter) {
  std::vector<model::Bid> out;
  for (const auto& [_, bid] : TX(t).View().bids) {
    if (bid.courier_id == courier_id && Matches(bid, filter)) out.push_back(bid);
  }
  SortByCreation(out);
  return out;
}

Result MemoryRepository::UpdateBid(Transaction& t, const model::Bid& bid) {
  auto& tx = TX(t);
  if (!tx.View().bids.contains(bid.id)) return Result::Err(ErrorCode::NotFound);
  if (auto result = CheckBidInvariants(tx.View(), bid); !result) return result;
  tx.PutBid(bid);
  return Result::Ok();
}

Result MemoryRepository::InsertRoute(Transaction& t, const model::Route& route) {
  auto& tx = TX(t);
  if (tx.View().routes.contains(route.id)) return Result::Err(ErrorCode::AlreadyExists);
  tx.PutRoute(route);
  return Result::Ok();
}

std::optional<model::Route> MemoryRepository::GetRoute(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.routes.find(id);
  if (it == s.routes.end()) return std::nullopt;
  return it->second;
}

std::vector<model::Route> MemoryRepository::ListRoutesForCourier(Transaction& t, const std::string& courier_id) {
  std::vector<model::Route> out;
  for (const auto& [_, route] : TX(t).View().routes) {
    if (route.courier_id == courier_id) out.push_back(route);
  }
  SortByCreation(out);
  return out;
}

std::vector<model::Route> MemoryRepository::ListActiveRoutes(Transaction& t) {
  std::vector<model::Route> out;
  for (const auto& [_, route] : TX(t).View().routes) {
    if (route.is_active) out.push_back(route);
  }
  SortByCreation(out);
  return out;
}

Result MemoryRepository::UpdateRoute(Transaction& t, const model::Route& route) {
  auto& tx = TX(t);
  if (!tx.View().routes.contains(route.id)) return Result::Err(ErrorCode::NotFound);
  tx.PutRoute(route);
  return Result::Ok();
}

} // namespace routebid::db::memory
