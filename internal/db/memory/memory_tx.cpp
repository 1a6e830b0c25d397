#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace routebid::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::PutPackage(const model::Package& pkg) {
  auto it = working_.packages.find(pkg.id);
  if (!package_base_versions_.contains(pkg.id)) {
    package_base_versions_[pkg.id] = it == working_.packages.end() ? 0 : it->second.version;
  }
  working_.packages[pkg.id] = pkg;
}

void MemoryTransaction::PutBid(const model::Bid& bid) {
  dirty_bids_.insert(bid.id);
  working_.bids[bid.id] = bid;
}

void MemoryTransaction::PutRoute(const model::Route& route) {
  dirty_routes_.insert(route.id);
  working_.routes[route.id] = route;
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::logic_error("transaction already finished");
  }

  std::scoped_lock lock(repo_.mutex_);

  for (const auto& [id, base_version] : package_base_versions_) {
    auto           it      = repo_.committed_.packages.find(id);
    const uint64_t current = it == repo_.committed_.packages.end() ? 0 : it->second.version;
    if (current != base_version) {
      throw util::Conflict("package " + id + " was modified by a concurrent transaction");
    }
  }

  auto next = repo_.committed_;
  for (const auto& [id, _] : package_base_versions_) {
    next.packages[id] = working_.packages.at(id);
  }
  for (const auto& id : dirty_bids_) {
    next.bids[id] = working_.bids.at(id);
  }
  for (const auto& id : dirty_routes_) {
    next.routes[id] = working_.routes.at(id);
  }

  for (const auto& id : dirty_bids_) {
    if (auto result = MemoryRepository::CheckBidInvariants(next, next.bids.at(id)); !result) {
      throw util::Conflict("bid " + id + " conflicts with a concurrent commit: " + result.message);
    }
  }

  repo_.committed_ = std::move(next);
  committed_       = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace routebid::db::memory
