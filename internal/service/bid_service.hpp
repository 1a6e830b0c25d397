#pragma once

#include "internal/service/service_context.hpp"
#include "routebid/v1/bid_service.pb.h"

namespace routebid::service {

class BidService {
 public:
  explicit BidService(ServiceContext ctx);

  routebid::v1::BidResponse      PlaceBid(const routebid::v1::PlaceBidRequest& req);
  routebid::v1::BidResponse      WithdrawBid(const routebid::v1::WithdrawBidRequest& req);
  routebid::v1::BidResponse      SelectBid(const routebid::v1::SelectBidRequest& req);
  routebid::v1::ListBidsResponse ListPackageBids(const routebid::v1::ListPackageBidsRequest& req);
  routebid::v1::ListBidsResponse ListCourierBids(const routebid::v1::ListCourierBidsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace routebid::service
