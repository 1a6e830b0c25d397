#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/bid/bid_ledger.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/events/domain_event.hpp"
#include "internal/lifecycle/bidding_policy.hpp"
#include "internal/lock/keyed_lock_table.hpp"
#include "internal/model/package.hpp"
#include "internal/util/time.hpp"

namespace routebid::lifecycle {

enum class DeadlineAction {
  kNone,
  kWarned,
  kExtended,
  kReset,
};

struct DeadlineOutcome {
  DeadlineAction action       = DeadlineAction::kNone;
  std::size_t    bids_expired = 0;
};

/*
  PackageLifecycle

  The package state machine and the only writer of package status.

  Every mutation runs the same way: take the package lock, read the
  package inside a fresh transaction, validate the trigger against the
  transition table, write, commit, then publish the collected events
  while the lock is still held.
*/
class PackageLifecycle {
 public:
  PackageLifecycle(std::shared_ptr<db::Repository>       repository,
                   std::shared_ptr<lock::KeyedLockTable> locks,
                   std::shared_ptr<bid::BidLedger>       ledger,
                   std::shared_ptr<events::EventSink>    sink,
                   std::shared_ptr<const util::Clock>    clock,
                   BiddingPolicy                         policy = {});

  // NEW -> OPEN_FOR_BIDS in one transaction.
  model::Package CreatePackage(const model::PackageDraft& draft);

  model::Bid SelectBid(const std::string& bid_id, const std::string& sender_id);

  model::Package ConfirmPickupIntent(const std::string& package_id, const std::string& courier_id);
  model::Package ConfirmPickup(const std::string& package_id, const std::string& courier_id);
  model::Package MarkDelivered(const std::string& package_id, const std::string& proof_reference);
  model::Package Cancel(const std::string& package_id, const std::string& sender_id);
  model::Package ReportFailure(const std::string& package_id, const std::string& reason);

  // Scheduler-driven self-transitions. Each re-checks its guard under the
  // lock and throws InvalidTransition when it does not hold.
  model::Package ExtendDeadline(const std::string& package_id);
  model::Package ResetBidding(const std::string& package_id);

  // Applies whichever deadline rule is due right now (warn, extend, or
  // purge-and-reset); a no-op when nothing is due.
  DeadlineOutcome ProcessDeadline(const std::string& package_id);

  model::Package              GetPackage(const std::string& package_id) const;
  std::vector<model::Package> ListPackages(const db::PackageFilter& filter) const;

  const BiddingPolicy& Policy() const {
    return policy_;
  }

 private:
  // Returns false when nothing changed; the transaction is then rolled back.
  using Mutation = std::function<bool(db::Transaction&, model::Package&, util::TimePoint, std::vector<events::DomainEvent>&)>;

  model::Package Mutate(const std::string& package_id, std::string_view op, const Mutation& mutation);

  void Transition(model::Package& pkg, model::PackageStatus to, std::string_view op, util::TimePoint now,
                  std::vector<events::DomainEvent>& events) const;

  void ApplyExtension(model::Package& pkg, util::TimePoint now, std::vector<events::DomainEvent>& events) const;
  std::size_t ApplyReset(db::Transaction& tx, model::Package& pkg, util::TimePoint now, std::vector<events::DomainEvent>& events);

  std::shared_ptr<db::Repository>       repository_;
  std::shared_ptr<lock::KeyedLockTable> locks_;
  std::shared_ptr<bid::BidLedger>       ledger_;
  std::shared_ptr<events::EventSink>    sink_;
  std::shared_ptr<const util::Clock>    clock_;
  BiddingPolicy                         policy_;
};

} // namespace routebid::lifecycle
