#include "internal/grpc/bid_server.hpp"

#include "internal/grpc/grpc_error.hpp"

namespace routebid::grpc {

namespace v1 = routebid::v1;

BidServer::BidServer(std::shared_ptr<routebid::service::BidService> svc) : service_(std::move(svc)) {
}

::grpc::Status BidServer::PlaceBid(::grpc::ServerContext*, const v1::PlaceBidRequest* req, v1::BidResponse* resp) {
  return Handle([&] { *resp = service_->PlaceBid(*req); });
}

::grpc::Status BidServer::WithdrawBid(::grpc::ServerContext*, const v1::WithdrawBidRequest* req, v1::BidResponse* resp) {
  return Handle([&] { *resp = service_->WithdrawBid(*req); });
}

::grpc::Status BidServer::SelectBid(::grpc::ServerContext*, const v1::SelectBidRequest* req, v1::BidResponse* resp) {
  return Handle([&] { *resp = service_->SelectBid(*req); });
}

::grpc::Status BidServer::ListPackageBids(::grpc::ServerContext*, const v1::ListPackageBidsRequest* req, v1::ListBidsResponse* resp) {
  return Handle([&] { *resp = service_->ListPackageBids(*req); });
}

::grpc::Status BidServer::ListCourierBids(::grpc::ServerContext*, const v1::ListCourierBidsRequest* req, v1::ListBidsResponse* resp) {
  return Handle([&] { *resp = service_->ListCourierBids(*req); });
}

} // namespace routebid::grpc
