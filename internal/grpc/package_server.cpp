#include "internal/grpc/package_server.hpp"

#include "internal/grpc/grpc_error.hpp"

namespace routebid::grpc {

namespace v1 = routebid::v1;

PackageServer::PackageServer(std::shared_ptr<routebid::service::PackageService> svc) : service_(std::move(svc)) {
}

::grpc::Status PackageServer::CreatePackage(::grpc::ServerContext*, const v1::CreatePackageRequest* req, v1::PackageResponse* resp) {
  return Handle([&] { *resp = service_->CreatePackage(*req); });
}

::grpc::Status PackageServer::GetPackage(::grpc::ServerContext*, const v1::GetPackageRequest* req, v1::PackageResponse* resp) {
  return Handle([&] { *resp = service_->GetPackage(*req); });
}

::grpc::Status PackageServer::ListPackages(::grpc::ServerContext*, const v1::ListPackagesRequest* req, v1::ListPackagesResponse* resp) {
  return Handle([&] { *resp = service_->ListPackages(*req); });
}

::grpc::Status PackageServer::CancelPackage(::grpc::ServerContext*, const v1::CancelPackageRequest* req, v1::PackageResponse* resp) {
  return Handle([&] { *resp = service_->CancelPackage(*req); });
}

::grpc::Status PackageServer::ConfirmPickupIntent(::grpc::ServerContext*, const v1::CourierActionRequest* req, v1::PackageResponse* resp) {
  return Handle([&] { *resp = service_->ConfirmPickupIntent(*req); });
}

::grpc::Status PackageServer::ConfirmPickup(::grpc::ServerContext*, const v1::CourierActionRequest* req, v1::PackageResponse* resp) {
  return Handle([&] { *resp = service_->ConfirmPickup(*req); });
}

::grpc::Status PackageServer::MarkDelivered(::grpc::ServerContext*, const v1::MarkDeliveredRequest* req, v1::PackageResponse* resp) {
  return Handle([&] { *resp = service_->MarkDelivered(*req); });
}

::grpc::Status PackageServer::ReportFailure(::grpc::ServerContext*, const v1::ReportFailureRequest* req, v1::PackageResponse* resp) {
  return Handle([&] { *resp = service_->ReportFailure(*req); });
}

} // namespace routebid::grpc
