#include "internal/service/package_service.hpp"

#include "internal/lifecycle/package_lifecycle.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/service/proto_convert.hpp"
#include "internal/util/errors.hpp"

namespace routebid::service {

using namespace routebid::v1;

namespace {

PackageResponse Wrap(const model::Package& pkg) {
  PackageResponse resp;
  *resp.mutable_package() = ToProto(pkg);
  return resp;
}

void RequireId(const std::string& id, const char* name) {
  if (id.empty()) {
    throw util::InvalidArgument(std::string(name) + " is required");
  }
}

} // namespace

PackageService::PackageService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

PackageResponse PackageService::CreatePackage(const CreatePackageRequest& req) {
  return ObserveRpc("PackageService.CreatePackage", "sender.id", req.sender_id(), [&] {
    if (!req.has_pickup() || !req.has_dropoff()) {
      throw util::InvalidArgument("pickup and dropoff are required");
    }

    model::PackageDraft draft;
    draft.sender_id       = req.sender_id();
    draft.description     = req.description();
    draft.size            = FromProto(req.size());
    draft.weight_kg       = req.weight_kg();
    draft.pickup          = FromProto(req.pickup());
    draft.pickup_address  = req.pickup_address();
    draft.dropoff         = FromProto(req.dropoff());
    draft.dropoff_address = req.dropoff_address();
    if (req.has_offered_price()) {
      draft.offered_price = req.offered_price();
    }
    return Wrap(ctx_.lifecycle->CreatePackage(draft));
  });
}

PackageResponse PackageService::GetPackage(const GetPackageRequest& req) {
  return ObserveRpc("PackageService.GetPackage", "package.id", req.package_id(), [&] {
    RequireId(req.package_id(), "package_id");
    return Wrap(ctx_.lifecycle->GetPackage(req.package_id()));
  });
}

ListPackagesResponse PackageService::ListPackages(const ListPackagesRequest& req) {
  return ObserveRpc("PackageService.ListPackages", "sender.id", req.sender_id(), [&] {
    db::PackageFilter filter;
    if (req.status() != PACKAGE_STATUS_UNSPECIFIED) {
      filter.status = FromProto(req.status());
    }
    if (!req.sender_id().empty()) {
      filter.sender_id = req.sender_id();
    }
    filter.limit = req.limit();

    ListPackagesResponse resp;
    for (const auto& pkg : ctx_.lifecycle->ListPackages(filter)) {
      *resp.add_packages() = ToProto(pkg);
    }
    return resp;
  });
}

PackageResponse PackageService::CancelPackage(const CancelPackageRequest& req) {
  return ObserveRpc("PackageService.CancelPackage", "package.id", req.package_id(), [&] {
    RequireId(req.package_id(), "package_id");
    RequireId(req.sender_id(), "sender_id");
    return Wrap(ctx_.lifecycle->Cancel(req.package_id(), req.sender_id()));
  });
}

PackageResponse PackageService::ConfirmPickupIntent(const CourierActionRequest& req) {
  return ObserveRpc("PackageService.ConfirmPickupIntent", "package.id", req.package_id(), [&] {
    RequireId(req.package_id(), "package_id");
    RequireId(req.courier_id(), "courier_id");
    return Wrap(ctx_.lifecycle->ConfirmPickupIntent(req.package_id(), req.courier_id()));
  });
}

PackageResponse PackageService::ConfirmPickup(const CourierActionRequest& req) {
  return ObserveRpc("PackageService.ConfirmPickup", "package.id", req.package_id(), [&] {
    RequireId(req.package_id(), "package_id");
    RequireId(req.courier_id(), "courier_id");
    return Wrap(ctx_.lifecycle->ConfirmPickup(req.package_id(), req.courier_id()));
  });
}

PackageResponse PackageService::MarkDelivered(const MarkDeliveredRequest& req) {
  return ObserveRpc("PackageService.MarkDelivered", "package.id", req.package_id(), [&] {
    RequireId(req.package_id(), "package_id");
    return Wrap(ctx_.lifecycle->MarkDelivered(req.package_id(), req.proof_reference()));
  });
}

PackageResponse PackageService::ReportFailure(const ReportFailureRequest& req) {
  return ObserveRpc("PackageService.ReportFailure", "package.id", req.package_id(), [&] {
    RequireId(req.package_id(), "package_id");
    return Wrap(ctx_.lifecycle->ReportFailure(req.package_id(), req.reason()));
  });
}

} // namespace routebid::service
