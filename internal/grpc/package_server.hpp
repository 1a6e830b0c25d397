#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/package_service.hpp"
#include "routebid/v1/package_service.grpc.pb.h"

namespace routebid::grpc {

class PackageServer final : public routebid::v1::PackageService::Service {
 public:
  explicit PackageServer(std::shared_ptr<routebid::service::PackageService> svc);

  ::grpc::Status CreatePackage(::grpc::ServerContext*, const routebid::v1::CreatePackageRequest*, routebid::v1::PackageResponse*) override;
  ::grpc::Status GetPackage(::grpc::ServerContext*, const routebid::v1::GetPackageRequest*, routebid::v1::PackageResponse*) override;
  ::grpc::Status ListPackages(::grpc::ServerContext*, const routebid::v1::ListPackagesRequest*, routebid::v1::ListPackagesResponse*) override;
  ::grpc::Status CancelPackage(::grpc::ServerContext*, const routebid::v1::CancelPackageRequest*, routebid::v1::PackageResponse*) override;
  ::grpc::Status ConfirmPickupIntent(::grpc::ServerContext*, const routebid::v1::CourierActionRequest*, routebid::v1::PackageResponse*) override;
  ::grpc::Status ConfirmPickup(::grpc::ServerContext*, const routebid::v1::CourierActionRequest*, routebid::v1::PackageResponse*) override;
  ::grpc::Status MarkDelivered(::grpc::ServerContext*, const routebid::v1::MarkDeliveredRequest*, routebid::v1::PackageResponse*) override;
  ::grpc::Status ReportFailure(::grpc::ServerContext*, const routebid::v1::ReportFailureRequest*, routebid::v1::PackageResponse*) override;

 private:
  std::shared_ptr<routebid::service::PackageService> service_;
};

} // namespace routebid::grpc
