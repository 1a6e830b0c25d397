#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace routebid::db::memory {

/*
  Transaction = snapshot + write set

  Reads are served from a private snapshot. Commit merges only the rows
  this transaction wrote, so transactions on different packages never
  conflict. A package written here whose committed version moved since
  the snapshot fails the commit with util::Conflict.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  const MemoryRepository::State& View() const {
    return working_;
  }

  void PutPackage(const model::Package& pkg);
  void PutBid(const model::Bid& bid);
  void PutRoute(const model::Route& route);

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;

  // version seen at first write, 0 for packages created here
  std::unordered_map<std::string, std::uint64_t> package_base_versions_;
  std::unordered_set<std::string>                dirty_bids_;
  std::unordered_set<std::string>                dirty_routes_;

  bool committed_   = false;
  bool rolled_back_ = false;
};

} // namespace routebid::db::memory
