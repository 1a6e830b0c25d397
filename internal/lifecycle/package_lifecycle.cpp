#include "internal/lifecycle/package_lifecycle.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace routebid::lifecycle {

namespace {

using observability::StringField;

void ValidateDraft(const model::PackageDraft& draft) {
  if (draft.sender_id.empty()) {
    throw util::InvalidArgument("sender_id is required");
  }
  if (!model::IsValid(draft.pickup) || !model::IsValid(draft.dropoff)) {
    throw util::InvalidArgument("pickup and dropoff coordinates must be valid WGS84 degrees");
  }
  if (draft.pickup_address.empty() || draft.dropoff_address.empty()) {
    throw util::InvalidArgument("pickup and dropoff addresses are required");
  }
  if (draft.size == model::PackageSize::kUnspecified) {
    throw util::InvalidArgument("package size is required");
  }
  if (!(draft.weight_kg > 0.0)) {
    throw util::InvalidArgument("weight must be positive");
  }
  if (draft.offered_price && !(*draft.offered_price > 0.0)) {
    throw util::InvalidArgument("offered price must be positive");
  }
}

void RequireTransition(const model::Package& pkg, model::PackageStatus to, std::string_view op) {
  if (!model::CanTransition(pkg.status, to)) {
    throw util::InvalidTransition("cannot " + std::string(op) + " package " + pkg.id + " in status " +
                                  std::string(model::ToString(pkg.status)));
  }
}

void RequireCourier(const model::Package& pkg, const std::string& courier_id) {
  if (!pkg.courier_id || *pkg.courier_id != courier_id) {
    throw util::NotOwner("courier " + courier_id + " is not assigned to package " + pkg.id);
  }
}

bool DeadlinePassed(const model::Package& pkg, util::TimePoint now) {
  return pkg.bidding_deadline && now >= *pkg.bidding_deadline;
}

events::DomainEvent PackageEvent(events::EventKind kind, const model::Package& pkg, util::TimePoint now) {
  events::DomainEvent event;
  event.kind        = kind;
  event.package_id  = pkg.id;
  event.sender_id   = pkg.sender_id;
  event.from_status = pkg.status;
  event.to_status   = pkg.status;
  event.occurred_at = now;
  return event;
}

} // namespace

PackageLifecycle::PackageLifecycle(std::shared_ptr<db::Repository>       repository,
                                   std::shared_ptr<lock::KeyedLockTable> locks,
                                   std::shared_ptr<bid::BidLedger>       ledger,
                                   std::shared_ptr<events::EventSink>    sink,
                                   std::shared_ptr<const util::Clock>    clock,
                                   BiddingPolicy                         policy)
    : repository_(std::move(repository)),
      locks_(std::move(locks)),
      ledger_(std::move(ledger)),
      sink_(std::move(sink)),
      clock_(std::move(clock)),
      policy_(policy) {
}

model::Package PackageLifecycle::Mutate(const std::string& package_id, std::string_view op, const Mutation& mutation) {
  auto guard = locks_->Acquire(lock::KeyedLockTable::PackageKey(package_id));
  auto tx    = repository_->Begin();
  auto now   = clock_->Now();

  auto pkg = repository_->GetPackage(*tx, package_id);
  if (!pkg) {
    throw util::NotFound("package not found: " + package_id);
  }

  std::vector<events::DomainEvent> events;
  if (!mutation(*tx, *pkg, now, events)) {
    return *pkg;
  }

  db::ThrowIfError(repository_->UpdatePackage(*tx, *pkg), op);
  tx->Commit();

  for (auto& event : events) {
    if (event.sender_id.empty()) event.sender_id = pkg->sender_id;
  }
  events::PublishAll(*sink_, events);

  ROUTEBID_LOG_INFO("package updated", {StringField("op", op),
                                        StringField("package_id", pkg->id),
                                        StringField("status", model::ToString(pkg->status)),
                                        observability::IntField("version", static_cast<int64_t>(pkg->version))});
  return *pkg;
}

void PackageLifecycle::Transition(model::Package& pkg, model::PackageStatus to, std::string_view op, util::TimePoint now,
                                  std::vector<events::DomainEvent>& events) const {
  RequireTransition(pkg, to, op);

  const auto from = pkg.status;
  if (from == to) {
    return;
  }

  pkg.status            = to;
  pkg.status_changed_at = now;

  auto event        = PackageEvent(events::EventKind::kPackageStatusChanged, pkg, now);
  event.from_status = from;
  event.detail      = std::string(op);
  events.push_back(std::move(event));
}

model::Package PackageLifecycle::CreatePackage(const model::PackageDraft& draft) {
  ValidateDraft(draft);

  model::Package pkg;
  pkg.id              = util::NewId();
  pkg.status          = model::PackageStatus::kNew;
  pkg.sender_id       = draft.sender_id;
  pkg.description     = draft.description;
  pkg.size            = draft.size;
  pkg.weight_kg       = draft.weight_kg;
  pkg.pickup          = draft.pickup;
  pkg.pickup_address  = draft.pickup_address;
  pkg.dropoff         = draft.dropoff;
  pkg.dropoff_address = draft.dropoff_address;
  pkg.offered_price   = draft.offered_price;

  auto guard = locks_->Acquire(lock::KeyedLockTable::PackageKey(pkg.id));
  auto tx    = repository_->Begin();
  auto now   = clock_->Now();

  pkg.created_at        = now;
  pkg.status_changed_at = now;

  std::vector<events::DomainEvent> events;
  Transition(pkg, model::PackageStatus::kOpenForBids, "open bidding", now, events);
  pkg.bidding_deadline         = now + policy_.base_window;
  pkg.deadline_extension_count = 0;

  db::ThrowIfError(repository_->InsertPackage(*tx, pkg), "insert package");
  tx->Commit();

  events::PublishAll(*sink_, events);
  ROUTEBID_LOG_INFO("package created", {StringField("package_id", pkg.id), StringField("sender_id", pkg.sender_id)});
  return pkg;
}

model::Bid PackageLifecycle::SelectBid(const std::string& bid_id, const std::string& sender_id) {
  std::string package_id;
  {
    auto tx  = repository_->Begin();
    auto bid = repository_->GetBid(*tx, bid_id);
    if (!bid) {
      throw util::NotFound("bid not found: " + bid_id);
    }
    package_id = bid->package_id;
  }

  model::Bid selected;
  Mutate(package_id, "select bid", [&](db::Transaction& tx, model::Package& pkg, util::TimePoint now, auto& events) {
    auto bid = repository_->GetBid(tx, bid_id);
    if (!bid || bid->package_id != pkg.id) {
      throw util::NotFound("bid not found: " + bid_id);
    }
    if (pkg.sender_id != sender_id) {
      throw util::NotOwner("package " + pkg.id + " does not belong to sender " + sender_id);
    }
    if (bid->status != model::BidStatus::kPending) {
      throw util::AlreadyTerminal("bid " + bid_id + " is " + std::string(model::ToString(bid->status)));
    }

    Transition(pkg, model::PackageStatus::kBidSelected, "select bid", now, events);
    pkg.selected_bid_id       = bid->id;
    pkg.courier_id            = bid->courier_id;
    pkg.bidding_deadline      = std::nullopt;
    pkg.deadline_warning_sent = false;

    selected = ledger_->MarkSelected(tx, *bid, now, events);
    ledger_->RejectPending(tx, pkg.id, bid->id, now, events);
    return true;
  });
  return selected;
}

model::Package PackageLifecycle::ConfirmPickupIntent(const std::string& package_id, const std::string& courier_id) {
  return Mutate(package_id, "confirm pickup intent", [&](db::Transaction&, model::Package& pkg, util::TimePoint now, auto& events) {
    RequireTransition(pkg, model::PackageStatus::kPendingPickup, "confirm pickup intent for");
    RequireCourier(pkg, courier_id);
    Transition(pkg, model::PackageStatus::kPendingPickup, "confirm pickup intent", now, events);
    return true;
  });
}

model::Package PackageLifecycle::ConfirmPickup(const std::string& package_id, const std::string& courier_id) {
  return Mutate(package_id, "confirm pickup", [&](db::Transaction&, model::Package& pkg, util::TimePoint now, auto& events) {
    RequireTransition(pkg, model::PackageStatus::kInTransit, "confirm pickup of");
    RequireCourier(pkg, courier_id);
    Transition(pkg, model::PackageStatus::kInTransit, "confirm pickup", now, events);
    return true;
  });
}

model::Package PackageLifecycle::MarkDelivered(const std::string& package_id, const std::string& proof_reference) {
  if (proof_reference.empty()) {
    throw util::InvalidArgument("delivery proof reference is required");
  }
  return Mutate(package_id, "mark delivered", [&](db::Transaction&, model::Package& pkg, util::TimePoint now, auto& events) {
    Transition(pkg, model::PackageStatus::kDelivered, "mark delivered", now, events);
    pkg.delivery_proof_ref = proof_reference;
    return true;
  });
}

model::Package PackageLifecycle::Cancel(const std::string& package_id, const std::string& sender_id) {
  return Mutate(package_id, "cancel", [&](db::Transaction& tx, model::Package& pkg, util::TimePoint now, auto& events) {
    if (pkg.sender_id != sender_id) {
      throw util::NotOwner("package " + pkg.id + " does not belong to sender " + sender_id);
    }
    Transition(pkg, model::PackageStatus::kCanceled, "cancel", now, events);
    ledger_->ResolveForCancel(tx, pkg.id, now, events);
    pkg.selected_bid_id       = std::nullopt;
    pkg.courier_id            = std::nullopt;
    pkg.bidding_deadline      = std::nullopt;
    pkg.deadline_warning_sent = false;
    return true;
  });
}

model::Package PackageLifecycle::ReportFailure(const std::string& package_id, const std::string& reason) {
  if (reason.empty()) {
    throw util::InvalidArgument("failure reason is required");
  }
  return Mutate(package_id, "report failure", [&](db::Transaction&, model::Package& pkg, util::TimePoint now, auto& events) {
    Transition(pkg, model::PackageStatus::kFailed, "report failure", now, events);
    pkg.failure_reason = reason;
    return true;
  });
}

void PackageLifecycle::ApplyExtension(model::Package& pkg, util::TimePoint now, std::vector<events::DomainEvent>& events) const {
  Transition(pkg, model::PackageStatus::kOpenForBids, "extend deadline", now, events);
  pkg.bidding_deadline = now + policy_.extension_window;
  ++pkg.deadline_extension_count;
  pkg.deadline_warning_sent = false;

  auto event   = PackageEvent(events::EventKind::kBidDeadlineExtended, pkg, now);
  event.detail = "extension " + std::to_string(pkg.deadline_extension_count) + " of " + std::to_string(policy_.max_extensions);
  events.push_back(std::move(event));
}

std::size_t PackageLifecycle::ApplyReset(db::Transaction& tx, model::Package& pkg, util::TimePoint now,
                                         std::vector<events::DomainEvent>& events) {
  Transition(pkg, model::PackageStatus::kOpenForBids, "reset bidding", now, events);
  const auto expired = ledger_->ExpireOverdue(tx, pkg.id, now, events);
  pkg.bidding_deadline         = now + policy_.base_window;
  pkg.deadline_extension_count = 0;
  pkg.deadline_warning_sent    = false;

  auto event   = PackageEvent(events::EventKind::kBiddingReset, pkg, now);
  event.detail = "expired " + std::to_string(expired) + " bids";
  events.push_back(std::move(event));
  return expired;
}

model::Package PackageLifecycle::ExtendDeadline(const std::string& package_id) {
  return Mutate(package_id, "extend deadline", [&](db::Transaction&, model::Package& pkg, util::TimePoint now, auto& events) {
    RequireTransition(pkg, model::PackageStatus::kOpenForBids, "extend deadline of");
    if (pkg.status != model::PackageStatus::kOpenForBids || !DeadlinePassed(pkg, now) ||
        pkg.deadline_extension_count >= policy_.max_extensions) {
      throw util::InvalidTransition("deadline extension is not due for package " + pkg.id);
    }
    ApplyExtension(pkg, now, events);
    return true;
  });
}

model::Package PackageLifecycle::ResetBidding(const std::string& package_id) {
  return Mutate(package_id, "reset bidding", [&](db::Transaction& tx, model::Package& pkg, util::TimePoint now, auto& events) {
    if (pkg.status != model::PackageStatus::kOpenForBids || !DeadlinePassed(pkg, now) ||
        pkg.deadline_extension_count < policy_.max_extensions) {
      throw util::InvalidTransition("bidding reset is not due for package " + pkg.id);
    }
    ApplyReset(tx, pkg, now, events);
    return true;
  });
}

DeadlineOutcome PackageLifecycle::ProcessDeadline(const std::string& package_id) {
  DeadlineOutcome outcome;
  Mutate(package_id, "process deadline", [&](db::Transaction& tx, model::Package& pkg, util::TimePoint now, auto& events) {
    if (pkg.status != model::PackageStatus::kOpenForBids || !pkg.bidding_deadline) {
      return false;
    }

    if (DeadlinePassed(pkg, now)) {
      if (pkg.deadline_extension_count < policy_.max_extensions) {
        ApplyExtension(pkg, now, events);
        outcome.action = DeadlineAction::kExtended;
      } else {
        outcome.bids_expired = ApplyReset(tx, pkg, now, events);
        outcome.action       = DeadlineAction::kReset;
      }
      return true;
    }

    if (!pkg.deadline_warning_sent && now >= *pkg.bidding_deadline - policy_.warning_lead) {
      pkg.deadline_warning_sent = true;
      auto event                = PackageEvent(events::EventKind::kBidDeadlineWarning, pkg, now);
      event.detail              = "deadline at " + std::to_string(util::ToUnixMillis(*pkg.bidding_deadline));
      events.push_back(std::move(event));
      outcome.action = DeadlineAction::kWarned;
      return true;
    }
    return false;
  });
  return outcome;
}

model::Package PackageLifecycle::GetPackage(const std::string& package_id) const {
  auto tx  = repository_->Begin();
  auto pkg = repository_->GetPackage(*tx, package_id);
  if (!pkg) {
    throw util::NotFound("package not found: " + package_id);
  }
  return *pkg;
}

std::vector<model::Package> PackageLifecycle::ListPackages(const db::PackageFilter& filter) const {
  auto tx = repository_->Begin();
  return repository_->ListPackages(*tx, filter);
}

} // namespace routebid::lifecycle
