#include "internal/bid/bid_ledger.hpp"

#include <optional>
#include <string_view>

#include "internal/lifecycle/package_lifecycle.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace routebid::bid {

namespace {

using observability::StringField;

events::EventKind EventFor(model::BidStatus status) {
  switch (status) {
    case model::BidStatus::kSelected:
      return events::EventKind::kBidSelected;
    case model::BidStatus::kRejected:
      return events::EventKind::kBidRejected;
    case model::BidStatus::kWithdrawn:
      return events::EventKind::kBidWithdrawn;
    case model::BidStatus::kExpired:
      return events::EventKind::kBidExpired;
    default:
      return events::EventKind::kBidPlaced;
  }
}

events::DomainEvent BidEvent(const model::Bid& bid, util::TimePoint now) {
  events::DomainEvent event;
  event.kind        = EventFor(bid.status);
  event.package_id  = bid.package_id;
  event.bid_id      = bid.id;
  event.courier_id  = bid.courier_id;
  event.occurred_at = now;
  return event;
}

// Number of UTF-8 code points in text, or nullopt when text is not valid UTF-8.
std::optional<std::size_t> CodePointCount(std::string_view text) {
  std::size_t count = 0;
  std::size_t i     = 0;
  while (i < text.size()) {
    const auto  lead = static_cast<unsigned char>(text[i]);
    std::size_t width;
    if (lead < 0x80) {
      width = 1;
    } else if (lead >= 0xC2 && lead <= 0xDF) {
      width = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
      width = 3;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
      width = 4;
    } else {
      return std::nullopt;
    }
    if (i + width > text.size()) {
      return std::nullopt;
    }
    for (std::size_t k = 1; k < width; ++k) {
      if ((static_cast<unsigned char>(text[i + k]) & 0xC0) != 0x80) {
        return std::nullopt;
      }
    }
    // Overlong three and four byte forms, surrogates and values past U+10FFFF.
    const auto second = static_cast<unsigned char>(width > 1 ? text[i + 1] : 0);
    if ((lead == 0xE0 && second < 0xA0) || (lead == 0xED && second > 0x9F) || (lead == 0xF0 && second < 0x90) ||
        (lead == 0xF4 && second > 0x8F)) {
      return std::nullopt;
    }
    i += width;
    ++count;
  }
  return count;
}

model::Bid LoadBid(db::Repository& repository, db::Transaction& tx, const std::string& bid_id) {
  auto bid = repository.GetBid(tx, bid_id);
  if (!bid) {
    throw util::NotFound("bid not found: " + bid_id);
  }
  return *bid;
}

} // namespace

BidLedger::BidLedger(std::shared_ptr<db::Repository>                     repository,
                     std::shared_ptr<lock::KeyedLockTable>               locks,
                     std::shared_ptr<const identity::CourierEligibility> eligibility,
                     std::shared_ptr<events::EventSink>                  sink,
                     std::shared_ptr<const util::Clock>                  clock)
    : repository_(std::move(repository)),
      locks_(std::move(locks)),
      eligibility_(std::move(eligibility)),
      sink_(std::move(sink)),
      clock_(std::move(clock)) {
}

void BidLedger::SetLifecycle(std::weak_ptr<lifecycle::PackageLifecycle> lifecycle) {
  lifecycle_ = std::move(lifecycle);
}

model::Bid BidLedger::PlaceBid(const BidDraft& draft) {
  if (!eligibility_->IsEligible(draft.courier_id)) {
    throw util::CourierNotEligible("courier is not eligible to bid: " + draft.courier_id);
  }
  if (draft.courier_id.empty()) {
    throw util::InvalidArgument("courier_id is required");
  }
  if (!(draft.proposed_price > 0.0)) {
    throw util::InvalidArgument("proposed price must be positive");
  }
  const auto message_length = CodePointCount(draft.message);
  if (!message_length) {
    throw util::InvalidArgument("bid message is not valid UTF-8");
  }
  if (*message_length > model::kMaxBidMessageLength) {
    throw util::InvalidArgument("bid message exceeds 500 characters");
  }

  auto guard = locks_->Acquire(lock::KeyedLockTable::PackageKey(draft.package_id));
  auto tx    = repository_->Begin();
  auto now   = clock_->Now();

  auto package = repository_->GetPackage(*tx, draft.package_id);
  if (!package) {
    throw util::NotFound("package not found: " + draft.package_id);
  }
  if (package->sender_id == draft.courier_id) {
    throw util::InvalidArgument("cannot bid on your own package");
  }
  if (package->status != model::PackageStatus::kOpenForBids) {
    throw util::PackageNotBiddable("package " + package->id + " is " + std::string(model::ToString(package->status)));
  }
  if (package->bidding_deadline && now >= *package->bidding_deadline) {
    throw util::PackageNotBiddable("bidding deadline has passed for package " + package->id);
  }

  for (const auto& existing : repository_->ListBidsForPackage(*tx, package->id, {})) {
    if (existing.courier_id == draft.courier_id &&
        (existing.status == model::BidStatus::kPending || existing.status == model::BidStatus::kSelected)) {
      throw util::DuplicateBid("courier " + draft.courier_id + " already has an active bid on package " + package->id);
    }
  }

  model::Bid bid;
  bid.id                   = util::NewId();
  bid.package_id           = package->id;
  bid.courier_id           = draft.courier_id;
  bid.proposed_price       = draft.proposed_price;
  bid.proposed_pickup_time = draft.proposed_pickup_time;
  bid.message              = draft.message;
  bid.status               = model::BidStatus::kPending;
  bid.created_at           = now;

  auto result = repository_->InsertBid(*tx, bid);
  if (result.code == db::ErrorCode::AlreadyExists) {
    throw util::DuplicateBid("courier " + draft.courier_id + " already has an active bid on package " + package->id);
  }
  db::ThrowIfError(result, "insert bid");
  tx->Commit();

  events::DomainEvent placed = BidEvent(bid, now);
  placed.kind                = events::EventKind::kBidPlaced;
  placed.sender_id           = package->sender_id;
  events::PublishAll(*sink_, {placed});
  return bid;
}

model::Bid BidLedger::WithdrawBid(const std::string& bid_id, const std::string& courier_id) {
  // Lock-free lookup only to find which package lock to take.
  std::string package_id;
  {
    auto tx    = repository_->Begin();
    package_id = LoadBid(*repository_, *tx, bid_id).package_id;
  }

  auto guard = locks_->Acquire(lock::KeyedLockTable::PackageKey(package_id));
  auto tx    = repository_->Begin();
  auto now   = clock_->Now();

  auto bid = LoadBid(*repository_, *tx, bid_id);
  if (bid.courier_id != courier_id) {
    throw util::NotOwner("bid " + bid_id + " does not belong to courier " + courier_id);
  }
  if (bid.status != model::BidStatus::kPending) {
    throw util::AlreadyTerminal("bid " + bid_id + " is " + std::string(model::ToString(bid.status)));
  }

  bid.status      = model::BidStatus::kWithdrawn;
  bid.resolved_at = now;
  db::ThrowIfError(repository_->UpdateBid(*tx, bid), "withdraw bid");
  tx->Commit();

  events::PublishAll(*sink_, {BidEvent(bid, now)});
  return bid;
}

model::Bid BidLedger::SelectBid(const std::string& bid_id, const std::string& sender_id) {
  auto lifecycle = lifecycle_.lock();
  if (!lifecycle) {
    throw std::logic_error("bid ledger is not wired to a package lifecycle");
  }
  return lifecycle->SelectBid(bid_id, sender_id);
}

model::Bid BidLedger::GetBid(const std::string& bid_id) const {
  auto tx = repository_->Begin();
  return LoadBid(*repository_, *tx, bid_id);
}

std::vector<model::Bid> BidLedger::ListBidsForPackage(const std::string& package_id) const {
  auto tx = repository_->Begin();
  if (!repository_->GetPackage(*tx, package_id)) {
    throw util::NotFound("package not found: " + package_id);
  }
  return repository_->ListBidsForPackage(*tx, package_id, {});
}

std::vector<model::Bid> BidLedger::ListBidsForCourier(const std::string& courier_id, std::optional<model::BidStatus> status) const {
  auto tx = repository_->Begin();
  return repository_->ListBidsForCourier(*tx, courier_id, db::BidFilter{status});
}

model::Bid BidLedger::MarkSelected(db::Transaction& tx, model::Bid bid, util::TimePoint now, std::vector<events::DomainEvent>& events) {
  if (bid.status != model::BidStatus::kPending) {
    throw util::AlreadyTerminal("bid " + bid.id + " is " + std::string(model::ToString(bid.status)));
  }

  bid.status      = model::BidStatus::kSelected;
  bid.resolved_at = now;

  auto result = repository_->UpdateBid(tx, bid);
  if (result.code == db::ErrorCode::ConstraintViolation) {
    throw util::AlreadyTerminal("package " + bid.package_id + " already has a selected bid");
  }
  db::ThrowIfError(result, "select bid");

  events.push_back(BidEvent(bid, now));
  return bid;
}

std::size_t BidLedger::RejectPending(db::Transaction& tx, const std::string& package_id, const std::string& keep_bid_id,
                                     util::TimePoint now, std::vector<events::DomainEvent>& events) {
  return Resolve(tx, package_id, model::BidStatus::kPending, model::BidStatus::kRejected, keep_bid_id, now, events);
}

std::size_t BidLedger::ResolveForCancel(db::Transaction& tx, const std::string& package_id, util::TimePoint now,
                                        std::vector<events::DomainEvent>& events) {
  auto withdrawn = Resolve(tx, package_id, model::BidStatus::kPending, model::BidStatus::kWithdrawn, {}, now, events);
  auto rejected  = Resolve(tx, package_id, model::BidStatus::kSelected, model::BidStatus::kRejected, {}, now, events);
  return withdrawn + rejected;
}

std::size_t BidLedger::ExpireOverdue(db::Transaction& tx, const std::string& package_id, util::TimePoint now,
                                     std::vector<events::DomainEvent>& events) {
  return Resolve(tx, package_id, model::BidStatus::kPending, model::BidStatus::kExpired, {}, now, events);
}

std::size_t BidLedger::Resolve(db::Transaction& tx, const std::string& package_id, model::BidStatus from, model::BidStatus to,
                               const std::string& keep_bid_id, util::TimePoint now, std::vector<events::DomainEvent>& events) {
  std::size_t count = 0;
  for (auto bid : repository_->ListBidsForPackage(tx, package_id, db::BidFilter{from})) {
    if (bid.id == keep_bid_id) continue;

    bid.status      = to;
    bid.resolved_at = now;
    db::ThrowIfError(repository_->UpdateBid(tx, bid), "resolve bid");
    events.push_back(BidEvent(bid, now));
    ++count;
  }

  if (count > 0) {
    ROUTEBID_LOG_DEBUG("bids resolved", {StringField("package_id", package_id),
                                         StringField("from", model::ToString(from)),
                                         StringField("to", model::ToString(to)),
                                         observability::IntField("count", static_cast<int64_t>(count))});
  }
  return count;
}

} // namespace routebid::bid
