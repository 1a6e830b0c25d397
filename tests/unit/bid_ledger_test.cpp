#include "internal/bid/bid_ledger.hpp"

#include <cassert>
#include <chrono>
#include <cstddef>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "support/harness.hpp"

namespace {

using routebid::events::EventKind;
using routebid::model::BidStatus;
using routebid::model::PackageStatus;
using routebid::testing::Harness;
using routebid::testing::MakeBid;
using routebid::testing::MakeDraft;
using routebid::testing::Throws;
namespace util = routebid::util;

void TestSingleBidSelectionWithoutSiblings() {
  Harness    h;
  const auto pkg = h.lifecycle->CreatePackage(MakeDraft("sender-1"));
  assert(pkg.status == PackageStatus::kOpenForBids);
  assert(pkg.deadline_extension_count == 0);
  assert(pkg.bidding_deadline && *pkg.bidding_deadline == routebid::testing::Epoch() + std::chrono::hours(24));

  const auto bid = h.ledger->PlaceBid(MakeBid(pkg.id, "courier-1", 20.0));
  assert(bid.status == BidStatus::kPending);
  assert(Throws<util::DuplicateBid>([&] { h.ledger->PlaceBid(MakeBid(pkg.id, "courier-1", 18.0)); }));

  h.sink->Clear();
  const auto selected = h.ledger->SelectBid(bid.id, "sender-1");
  assert(selected.status == BidStatus::kSelected);
  assert(selected.resolved_at.has_value());

  const auto after = h.lifecycle->GetPackage(pkg.id);
  assert(after.status == PackageStatus::kBidSelected);
  assert(after.selected_bid_id == bid.id);
  assert(after.courier_id == std::string("courier-1"));
  assert(!after.bidding_deadline.has_value());

  assert(h.sink->OfKind(EventKind::kBidRejected).empty());
  assert(h.sink->OfKind(EventKind::kBidSelected).size() == 1);
  assert(h.sink->OfKind(EventKind::kPackageStatusChanged).size() == 1);
}

void TestSelectionRejectsSiblingBids() {
  Harness    h;
  const auto pkg   = h.lifecycle->CreatePackage(MakeDraft("sender-1"));
  const auto cheap = h.ledger->PlaceBid(MakeBid(pkg.id, "courier-a", 20.0));
  const auto dear  = h.ledger->PlaceBid(MakeBid(pkg.id, "courier-b", 25.0));

  h.sink->Clear();
  h.ledger->SelectBid(cheap.id, "sender-1");

  assert(h.ledger->GetBid(cheap.id).status == BidStatus::kSelected);
  assert(h.ledger->GetBid(dear.id).status == BidStatus::kRejected);
  assert(h.lifecycle->GetPackage(pkg.id).status == PackageStatus::kBidSelected);

  const auto rejected = h.sink->OfKind(EventKind::kBidRejected);
  assert(rejected.size() == 1);
  assert(rejected[0].bid_id == dear.id);
  assert(rejected[0].sender_id == "sender-1");

  // Selection is final for the other bid.
  assert(Throws<util::AlreadyTerminal>([&] { h.ledger->SelectBid(dear.id, "sender-1"); }));
  assert(Throws<util::AlreadyTerminal>([&] { h.ledger->SelectBid(cheap.id, "sender-1"); }));
}

void TestOnlySenderMaySelect() {
  Harness    h;
  const auto pkg = h.lifecycle->CreatePackage(MakeDraft("sender-1"));
  const auto bid = h.ledger->PlaceBid(MakeBid(pkg.id, "courier-1"));

  assert(Throws<util::NotOwner>([&] { h.ledger->SelectBid(bid.id, "someone-else"); }));
  assert(h.ledger->GetBid(bid.id).status == BidStatus::kPending);
  assert(Throws<util::NotFound>([&] { h.ledger->SelectBid("missing-bid", "sender-1"); }));
}

void TestPlaceBidValidation() {
  Harness    h;
  const auto pkg = h.lifecycle->CreatePackage(MakeDraft("sender-1"));

  assert(Throws<util::InvalidArgument>([&] { h.ledger->PlaceBid(MakeBid(pkg.id, "courier-1", 0.0)); }));
  assert(Throws<util::InvalidArgument>([&] { h.ledger->PlaceBid(MakeBid(pkg.id, "courier-1", -3.0)); }));
  assert(Throws<util::InvalidArgument>([&] { h.ledger->PlaceBid(MakeBid(pkg.id, "", 10.0)); }));
  assert(Throws<util::InvalidArgument>([&] { h.ledger->PlaceBid(MakeBid(pkg.id, "sender-1", 10.0)); }));

  auto long_message    = MakeBid(pkg.id, "courier-1");
  long_message.message = std::string(501, 'x');
  assert(Throws<util::InvalidArgument>([&] { h.ledger->PlaceBid(long_message); }));
  long_message.message = std::string(500, 'x');
  assert(h.ledger->PlaceBid(long_message).message.size() == 500);

  assert(Throws<util::NotFound>([&] { h.ledger->PlaceBid(MakeBid("missing-package", "courier-2")); }));
}

std::string Repeat(const std::string& piece, std::size_t times) {
  std::string out;
  for (std::size_t i = 0; i < times; ++i) out += piece;
  return out;
}

void TestMessageLengthCountsCharacters() {
  Harness    h;
  const auto pkg = h.lifecycle->CreatePackage(MakeDraft("sender-1"));

  // Two bytes per character in Cyrillic.
  auto cyrillic    = MakeBid(pkg.id, "courier-1");
  cyrillic.message = Repeat("\xD0\x96", 300);
  assert(cyrillic.message.size() == 600);
  assert(h.ledger->PlaceBid(cyrillic).message == cyrillic.message);

  auto too_long    = MakeBid(pkg.id, "courier-2");
  too_long.message = Repeat("\xD0\x96", 501);
  assert(Throws<util::InvalidArgument>([&] { h.ledger->PlaceBid(too_long); }));

  auto wide    = MakeBid(pkg.id, "courier-3");
  wide.message = Repeat("\xF0\x9F\x9A\x9A", 500);
  assert(h.ledger->PlaceBid(wide).status == BidStatus::kPending);

  auto truncated    = MakeBid(pkg.id, "courier-4");
  truncated.message = "ok \xD0";
  assert(Throws<util::InvalidArgument>([&] { h.ledger->PlaceBid(truncated); }));
  truncated.message = "\xC0\xAF";
  assert(Throws<util::InvalidArgument>([&] { h.ledger->PlaceBid(truncated); }));
  truncated.message = "\xED\xA0\x80";
  assert(Throws<util::InvalidArgument>([&] { h.ledger->PlaceBid(truncated); }));
  assert(h.ledger->ListBidsForCourier("courier-4").empty());
}

void TestIneligibleCourierCannotBid() {
  Harness    h;
  const auto pkg = h.lifecycle->CreatePackage(MakeDraft("sender-1"));

  h.eligibility->SetEligible("courier-blocked", false);
  assert(Throws<util::CourierNotEligible>([&] { h.ledger->PlaceBid(MakeBid(pkg.id, "courier-blocked")); }));

  h.eligibility->SetEligible("courier-blocked", true);
  assert(h.ledger->PlaceBid(MakeBid(pkg.id, "courier-blocked")).status == BidStatus::kPending);
}

void TestBiddingClosesWithDeadlineAndStatus() {
  Harness    h;
  const auto pkg = h.lifecycle->CreatePackage(MakeDraft("sender-1"));

  h.clock->Advance(std::chrono::hours(24));
  assert(Throws<util::PackageNotBiddable>([&] { h.ledger->PlaceBid(MakeBid(pkg.id, "courier-late")); }));

  const auto other = h.lifecycle->CreatePackage(MakeDraft("sender-2"));
  h.lifecycle->Cancel(other.id, "sender-2");
  assert(Throws<util::PackageNotBiddable>([&] { h.ledger->PlaceBid(MakeBid(other.id, "courier-1")); }));
}

void TestWithdrawBid() {
  Harness    h;
  const auto pkg = h.lifecycle->CreatePackage(MakeDraft("sender-1"));
  const auto bid = h.ledger->PlaceBid(MakeBid(pkg.id, "courier-1"));

  assert(Throws<util::NotOwner>([&] { h.ledger->WithdrawBid(bid.id, "courier-2"); }));

  const auto withdrawn = h.ledger->WithdrawBid(bid.id, "courier-1");
  assert(withdrawn.status == BidStatus::kWithdrawn);
  assert(h.sink->OfKind(EventKind::kBidWithdrawn).size() == 1);
  assert(Throws<util::AlreadyTerminal>([&] { h.ledger->WithdrawBid(bid.id, "courier-1"); }));

  // A withdrawn bid no longer blocks a fresh one from the same courier.
  const auto again = h.ledger->PlaceBid(MakeBid(pkg.id, "courier-1", 30.0));
  assert(again.status == BidStatus::kPending);
  assert(again.id != bid.id);
}

void TestListings() {
  Harness    h;
  const auto pkg_a = h.lifecycle->CreatePackage(MakeDraft("sender-1"));
  const auto pkg_b = h.lifecycle->CreatePackage(MakeDraft("sender-2"));

  const auto first = h.ledger->PlaceBid(MakeBid(pkg_a.id, "courier-1"));
  h.clock->Advance(std::chrono::seconds(1));
  const auto second = h.ledger->PlaceBid(MakeBid(pkg_a.id, "courier-2"));
  h.clock->Advance(std::chrono::seconds(1));
  h.ledger->PlaceBid(MakeBid(pkg_b.id, "courier-1"));
  h.ledger->WithdrawBid(first.id, "courier-1");

  const auto on_a = h.ledger->ListBidsForPackage(pkg_a.id);
  assert(on_a.size() == 2);
  assert(on_a[0].id == first.id);
  assert(on_a[1].id == second.id);

  assert(h.ledger->ListBidsForCourier("courier-1").size() == 2);
  assert(h.ledger->ListBidsForCourier("courier-1", BidStatus::kPending).size() == 1);
  assert(h.ledger->ListBidsForCourier("courier-1", BidStatus::kWithdrawn).size() == 1);
  assert(Throws<util::NotFound>([&] { h.ledger->ListBidsForPackage("missing-package"); }));
}

} // namespace

int main() {
  TestSingleBidSelectionWithoutSiblings();
  TestSelectionRejectsSiblingBids();
  TestOnlySenderMaySelect();
  TestPlaceBidValidation();
  TestMessageLengthCountsCharacters();
  TestIneligibleCourierCannotBid();
  TestBiddingClosesWithDeadlineAndStatus();
  TestWithdrawBid();
  TestListings();

  std::cout << "routebid_unit_bid_ledger: pass\n";
  return 0;
}
