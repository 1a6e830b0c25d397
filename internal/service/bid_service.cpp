#include "internal/service/bid_service.hpp"

#include "internal/bid/bid_ledger.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/service/proto_convert.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace routebid::service {

using namespace routebid::v1;

namespace {

BidResponse Wrap(const model::Bid& bid) {
  BidResponse resp;
  *resp.mutable_bid() = ToProto(bid);
  return resp;
}

ListBidsResponse WrapAll(const std::vector<model::Bid>& bids) {
  ListBidsResponse resp;
  for (const auto& bid : bids) {
    *resp.add_bids() = ToProto(bid);
  }
  return resp;
}

} // namespace

BidService::BidService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

BidResponse BidService::PlaceBid(const PlaceBidRequest& req) {
  return ObserveRpc("BidService.PlaceBid", "package.id", req.package_id(), [&] {
    if (req.package_id().empty()) {
      throw util::InvalidArgument("package_id is required");
    }

    bid::BidDraft draft;
    draft.package_id     = req.package_id();
    draft.courier_id     = req.courier_id();
    draft.proposed_price = req.proposed_price();
    if (req.has_proposed_pickup_time()) {
      draft.proposed_pickup_time = util::FromProto(req.proposed_pickup_time());
    }
    draft.message = req.message();
    return Wrap(ctx_.ledger->PlaceBid(draft));
  });
}

BidResponse BidService::WithdrawBid(const WithdrawBidRequest& req) {
  return ObserveRpc("BidService.WithdrawBid", "bid.id", req.bid_id(), [&] {
    if (req.bid_id().empty() || req.courier_id().empty()) {
      throw util::InvalidArgument("bid_id and courier_id are required");
    }
    return Wrap(ctx_.ledger->WithdrawBid(req.bid_id(), req.courier_id()));
  });
}

BidResponse BidService::SelectBid(const SelectBidRequest& req) {
  return ObserveRpc("BidService.SelectBid", "bid.id", req.bid_id(), [&] {
    if (req.bid_id().empty() || req.sender_id().empty()) {
      throw util::InvalidArgument("bid_id and sender_id are required");
    }
    return Wrap(ctx_.ledger->SelectBid(req.bid_id(), req.sender_id()));
  });
}

ListBidsResponse BidService::ListPackageBids(const ListPackageBidsRequest& req) {
  return ObserveRpc("BidService.ListPackageBids", "package.id", req.package_id(), [&] {
    return WrapAll(ctx_.ledger->ListBidsForPackage(req.package_id()));
  });
}

ListBidsResponse BidService::ListCourierBids(const ListCourierBidsRequest& req) {
  return ObserveRpc("BidService.ListCourierBids", "courier.id", req.courier_id(), [&] {
    if (req.courier_id().empty()) {
      throw util::InvalidArgument("courier_id is required");
    }
    std::optional<model::BidStatus> status;
    if (req.status() != BID_STATUS_UNSPECIFIED) {
      status = FromProto(req.status());
    }
    return WrapAll(ctx_.ledger->ListBidsForCourier(req.courier_id(), status));
  });
}

} // namespace routebid::service
