#include "internal/service/admin_service.hpp"

#include "internal/deadline/deadline_scheduler.hpp"
#include "internal/identity/courier_eligibility.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/util/errors.hpp"

namespace routebid::service {

using namespace routebid::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

SetCourierEligibilityResponse AdminService::SetCourierEligibility(const SetCourierEligibilityRequest& req) {
  return ObserveRpc("AdminService.SetCourierEligibility", "courier.id", req.courier_id(), [&] {
    if (req.courier_id().empty()) {
      throw util::InvalidArgument("courier_id is required");
    }
    ctx_.eligibility->SetEligible(req.courier_id(), req.eligible());
    ROUTEBID_LOG_INFO("courier eligibility changed", {observability::StringField("courier_id", req.courier_id()),
                                                      observability::BoolField("eligible", req.eligible())});

    SetCourierEligibilityResponse resp;
    resp.set_courier_id(req.courier_id());
    resp.set_eligible(ctx_.eligibility->IsEligible(req.courier_id()));
    return resp;
  });
}

RunDeadlineSweepResponse AdminService::RunDeadlineSweep(const RunDeadlineSweepRequest&) {
  return ObserveRpc("AdminService.RunDeadlineSweep", "", "", [&] {
    const auto report = ctx_.scheduler->SweepOnce();

    RunDeadlineSweepResponse resp;
    resp.set_examined(report.examined);
    resp.set_warned(report.warned);
    resp.set_extended(report.extended);
    resp.set_reset(report.reset);
    resp.set_bids_expired(report.bids_expired);
    resp.set_failures(report.failures);
    resp.set_routes_expired(report.routes_expired);
    resp.set_route_bids_withdrawn(report.route_bids_withdrawn);
    return resp;
  });
}

} // namespace routebid::service
