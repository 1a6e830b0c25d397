#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/admin_service.hpp"
#include "routebid/v1/admin_service.grpc.pb.h"

namespace routebid::grpc {

class AdminServer final : public routebid::v1::AdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<routebid::service::AdminService> svc);

  ::grpc::Status SetCourierEligibility(::grpc::ServerContext*,
                                       const routebid::v1::SetCourierEligibilityRequest*,
                                       routebid::v1::SetCourierEligibilityResponse*) override;

  ::grpc::Status RunDeadlineSweep(::grpc::ServerContext*, const routebid::v1::RunDeadlineSweepRequest*, routebid::v1::RunDeadlineSweepResponse*) override;

 private:
  std::shared_ptr<routebid::service::AdminService> service_;
};

} // namespace routebid::grpc
