#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/events/domain_event.hpp"
#include "internal/identity/courier_eligibility.hpp"
#include "internal/lock/keyed_lock_table.hpp"
#include "internal/model/bid.hpp"
#include "internal/util/time.hpp"

namespace routebid::lifecycle {
class PackageLifecycle;
}

namespace routebid::bid {

struct BidDraft {
  std::string                    package_id;
  std::string                    courier_id;
  double                         proposed_price = 0.0;
  std::optional<util::TimePoint> proposed_pickup_time;
  std::string                    message;
};

/*
  BidLedger

  Owns bid records. Courier-facing operations take the package lock
  themselves; the transaction-level primitives below are only called by
  PackageLifecycle, which already holds the lock and an open transaction,
  and append the events they cause to `events` for publishing after commit.
*/
class BidLedger {
 public:
  BidLedger(std::shared_ptr<db::Repository>                 repository,
            std::shared_ptr<lock::KeyedLockTable>           locks,
            std::shared_ptr<const identity::CourierEligibility> eligibility,
            std::shared_ptr<events::EventSink>              sink,
            std::shared_ptr<const util::Clock>              clock);

  // Wired once at startup; SelectBid delegates through it.
  void SetLifecycle(std::weak_ptr<lifecycle::PackageLifecycle> lifecycle);

  model::Bid PlaceBid(const BidDraft& draft);
  model::Bid WithdrawBid(const std::string& bid_id, const std::string& courier_id);
  model::Bid SelectBid(const std::string& bid_id, const std::string& sender_id);

  model::Bid              GetBid(const std::string& bid_id) const;
  std::vector<model::Bid> ListBidsForPackage(const std::string& package_id) const;
  std::vector<model::Bid> ListBidsForCourier(const std::string& courier_id, std::optional<model::BidStatus> status = std::nullopt) const;

  // --- transaction-level primitives (package lock held by caller) ---

  // PENDING -> SELECTED for exactly this bid.
  model::Bid MarkSelected(db::Transaction& tx, model::Bid bid, util::TimePoint now, std::vector<events::DomainEvent>& events);

  // Every PENDING bid except `keep_bid_id` -> REJECTED.
  std::size_t RejectPending(db::Transaction& tx, const std::string& package_id, const std::string& keep_bid_id, util::TimePoint now,
                            std::vector<events::DomainEvent>& events);

  // PENDING -> WITHDRAWN and SELECTED -> REJECTED, used on cancel.
  std::size_t ResolveForCancel(db::Transaction& tx, const std::string& package_id, util::TimePoint now,
                               std::vector<events::DomainEvent>& events);

  // Every PENDING bid -> EXPIRED. Only the deadline purge calls this.
  std::size_t ExpireOverdue(db::Transaction& tx, const std::string& package_id, util::TimePoint now,
                            std::vector<events::DomainEvent>& events);

 private:
  std::size_t Resolve(db::Transaction& tx, const std::string& package_id, model::BidStatus from, model::BidStatus to,
                      const std::string& keep_bid_id, util::TimePoint now, std::vector<events::DomainEvent>& events);

  std::shared_ptr<db::Repository>                     repository_;
  std::shared_ptr<lock::KeyedLockTable>               locks_;
  std::shared_ptr<const identity::CourierEligibility> eligibility_;
  std::shared_ptr<events::EventSink>                  sink_;
  std::shared_ptr<const util::Clock>                  clock_;

  std::weak_ptr<lifecycle::PackageLifecycle> lifecycle_;
};

} // namespace routebid::bid
