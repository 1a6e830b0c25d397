#pragma once

#include "internal/service/service_context.hpp"
#include "routebid/v1/package_service.pb.h"

namespace routebid::service {

class PackageService {
 public:
  explicit PackageService(ServiceContext ctx);

  routebid::v1::PackageResponse      CreatePackage(const routebid::v1::CreatePackageRequest& req);
  routebid::v1::PackageResponse      GetPackage(const routebid::v1::GetPackageRequest& req);
  routebid::v1::ListPackagesResponse ListPackages(const routebid::v1::ListPackagesRequest& req);
  routebid::v1::PackageResponse      CancelPackage(const routebid::v1::CancelPackageRequest& req);
  routebid::v1::PackageResponse      ConfirmPickupIntent(const routebid::v1::CourierActionRequest& req);
  routebid::v1::PackageResponse      ConfirmPickup(const routebid::v1::CourierActionRequest& req);
  routebid::v1::PackageResponse      MarkDelivered(const routebid::v1::MarkDeliveredRequest& req);
  routebid::v1::PackageResponse      ReportFailure(const routebid::v1::ReportFailureRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace routebid::service
