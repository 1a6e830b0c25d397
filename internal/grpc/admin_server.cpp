#include "internal/grpc/admin_server.hpp"

#include "internal/grpc/grpc_error.hpp"

namespace routebid::grpc {

namespace v1 = routebid::v1;

AdminServer::AdminServer(std::shared_ptr<routebid::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::SetCourierEligibility(::grpc::ServerContext*,
                                                  const v1::SetCourierEligibilityRequest* req,
                                                  v1::SetCourierEligibilityResponse*      resp) {
  return Handle([&] { *resp = service_->SetCourierEligibility(*req); });
}

::grpc::Status AdminServer::RunDeadlineSweep(::grpc::ServerContext*, const v1::RunDeadlineSweepRequest* req, v1::RunDeadlineSweepResponse* resp) {
  return Handle([&] { *resp = service_->RunDeadlineSweep(*req); });
}

} // namespace routebid::grpc
