#pragma once

#include "internal/service/service_context.hpp"
#include "routebid/v1/admin_service.pb.h"

namespace routebid::service {

// Operator actions: courier eligibility and on-demand deadline sweeps.
class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  routebid::v1::SetCourierEligibilityResponse SetCourierEligibility(const routebid::v1::SetCourierEligibilityRequest& req);
  routebid::v1::RunDeadlineSweepResponse      RunDeadlineSweep(const routebid::v1::RunDeadlineSweepRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace routebid::service
