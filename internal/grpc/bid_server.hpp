#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/bid_service.hpp"
#include "routebid/v1/bid_service.grpc.pb.h"

namespace routebid::grpc {

class BidServer final : public routebid::v1::BidService::Service {
 public:
  explicit BidServer(std::shared_ptr<routebid::service::BidService> svc);

  ::grpc::Status PlaceBid(::grpc::ServerContext*, const routebid::v1::PlaceBidRequest*, routebid::v1::BidResponse*) override;
  ::grpc::Status WithdrawBid(::grpc::ServerContext*, const routebid::v1::WithdrawBidRequest*, routebid::v1::BidResponse*) override;
  ::grpc::Status SelectBid(::grpc::ServerContext*, const routebid::v1::SelectBidRequest*, routebid::v1::BidResponse*) override;
  ::grpc::Status ListPackageBids(::grpc::ServerContext*, const routebid::v1::ListPackageBidsRequest*, routebid::v1::ListBidsResponse*) override;
  ::grpc::Status ListCourierBids(::grpc::ServerContext*, const routebid::v1::ListCourierBidsRequest*, routebid::v1::ListBidsResponse*) override;

 private:
  std::shared_ptr<routebid::service::BidService> service_;
};

} // namespace routebid::grpc
