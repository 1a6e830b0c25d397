#include "internal/grpc/route_server.hpp"

#include "internal/grpc/grpc_error.hpp"

namespace routebid::grpc {

namespace v1 = routebid::v1;

RouteServer::RouteServer(std::shared_ptr<routebid::service::RouteService> svc) : service_(std::move(svc)) {
}

::grpc::Status RouteServer::CreateRoute(::grpc::ServerContext*, const v1::CreateRouteRequest* req, v1::RouteResponse* resp) {
  return Handle([&] { *resp = service_->CreateRoute(*req); });
}

::grpc::Status RouteServer::DeactivateRoute(::grpc::ServerContext*, const v1::DeactivateRouteRequest* req, v1::RouteResponse* resp) {
  return Handle([&] { *resp = service_->DeactivateRoute(*req); });
}

::grpc::Status RouteServer::GetRoute(::grpc::ServerContext*, const v1::GetRouteRequest* req, v1::RouteResponse* resp) {
  return Handle([&] { *resp = service_->GetRoute(*req); });
}

::grpc::Status RouteServer::ListRoutes(::grpc::ServerContext*, const v1::ListRoutesRequest* req, v1::ListRoutesResponse* resp) {
  return Handle([&] { *resp = service_->ListRoutes(*req); });
}

MatchServer::MatchServer(std::shared_ptr<routebid::service::RouteService> svc) : service_(std::move(svc)) {
}

::grpc::Status MatchServer::FindMatches(::grpc::ServerContext*, const v1::FindMatchesRequest* req, v1::FindMatchesResponse* resp) {
  return Handle([&] { *resp = service_->FindMatches(*req); });
}

} // namespace routebid::grpc
