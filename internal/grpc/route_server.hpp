#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/route_service.hpp"
#include "routebid/v1/match_service.grpc.pb.h"
#include "routebid/v1/route_service.grpc.pb.h"

namespace routebid::grpc {

class RouteServer final : public routebid::v1::RouteService::Service {
 public:
  explicit RouteServer(std::shared_ptr<routebid::service::RouteService> svc);

  ::grpc::Status CreateRoute(::grpc::ServerContext*, const routebid::v1::CreateRouteRequest*, routebid::v1::RouteResponse*) override;
  ::grpc::Status DeactivateRoute(::grpc::ServerContext*, const routebid::v1::DeactivateRouteRequest*, routebid::v1::RouteResponse*) override;
  ::grpc::Status GetRoute(::grpc::ServerContext*, const routebid::v1::GetRouteRequest*, routebid::v1::RouteResponse*) override;
  ::grpc::Status ListRoutes(::grpc::ServerContext*, const routebid::v1::ListRoutesRequest*, routebid::v1::ListRoutesResponse*) override;

 private:
  std::shared_ptr<routebid::service::RouteService> service_;
};

// Matching shares RouteService since every query starts from a stored route.
class MatchServer final : public routebid::v1::MatchService::Service {
 public:
  explicit MatchServer(std::shared_ptr<routebid::service::RouteService> svc);

  ::grpc::Status FindMatches(::grpc::ServerContext*, const routebid::v1::FindMatchesRequest*, routebid::v1::FindMatchesResponse*) override;

 private:
  std::shared_ptr<routebid::service::RouteService> service_;
};

} // namespace routebid::grpc
