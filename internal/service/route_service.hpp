#pragma once

#include "internal/service/service_context.hpp"
#include "routebid/v1/match_service.pb.h"
#include "routebid/v1/route_service.pb.h"

namespace routebid::service {

// Courier routes and the matches computed against them.
class RouteService {
 public:
  explicit RouteService(ServiceContext ctx);

  routebid::v1::RouteResponse       CreateRoute(const routebid::v1::CreateRouteRequest& req);
  routebid::v1::RouteResponse       DeactivateRoute(const routebid::v1::DeactivateRouteRequest& req);
  routebid::v1::RouteResponse       GetRoute(const routebid::v1::GetRouteRequest& req);
  routebid::v1::ListRoutesResponse  ListRoutes(const routebid::v1::ListRoutesRequest& req);
  routebid::v1::FindMatchesResponse FindMatches(const routebid::v1::FindMatchesRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace routebid::service
