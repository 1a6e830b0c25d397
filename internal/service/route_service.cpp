#include "internal/service/route_service.hpp"

#include "internal/match/match_engine.hpp"
#include "internal/route/route_manager.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/service/proto_convert.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace routebid::service {

using namespace routebid::v1;

namespace {

RouteResponse Wrap(const model::Route& route) {
  RouteResponse resp;
  *resp.mutable_route() = ToProto(route);
  return resp;
}

} // namespace

RouteService::RouteService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

RouteResponse RouteService::CreateRoute(const CreateRouteRequest& req) {
  return ObserveRpc("RouteService.CreateRoute", "courier.id", req.courier_id(), [&] {
    if (!req.has_start() || !req.has_end()) {
      throw util::InvalidArgument("start and end are required");
    }

    model::RouteDraft draft;
    draft.courier_id       = req.courier_id();
    draft.start            = FromProto(req.start());
    draft.start_address    = req.start_address();
    draft.end              = FromProto(req.end());
    draft.end_address      = req.end_address();
    draft.max_deviation_km = req.max_deviation_km();
    if (req.has_trip_date()) {
      draft.trip_date = util::FromProto(req.trip_date());
    }
    return Wrap(ctx_.routes->CreateRoute(draft));
  });
}

RouteResponse RouteService::DeactivateRoute(const DeactivateRouteRequest& req) {
  return ObserveRpc("RouteService.DeactivateRoute", "route.id", req.route_id(), [&] {
    if (req.route_id().empty() || req.courier_id().empty()) {
      throw util::InvalidArgument("route_id and courier_id are required");
    }
    return Wrap(ctx_.routes->DeactivateRoute(req.route_id(), req.courier_id()));
  });
}

RouteResponse RouteService::GetRoute(const GetRouteRequest& req) {
  return ObserveRpc("RouteService.GetRoute", "route.id", req.route_id(), [&] {
    return Wrap(ctx_.routes->GetRoute(req.route_id()));
  });
}

ListRoutesResponse RouteService::ListRoutes(const ListRoutesRequest& req) {
  return ObserveRpc("RouteService.ListRoutes", "courier.id", req.courier_id(), [&] {
    if (req.courier_id().empty()) {
      throw util::InvalidArgument("courier_id is required");
    }
    ListRoutesResponse resp;
    for (const auto& route : ctx_.routes->ListRoutes(req.courier_id())) {
      *resp.add_routes() = ToProto(route);
    }
    return resp;
  });
}

FindMatchesResponse RouteService::FindMatches(const FindMatchesRequest& req) {
  return ObserveRpc("MatchService.FindMatches", "route.id", req.route_id(), [&] {
    FindMatchesResponse resp;
    for (const auto& match : ctx_.matcher->FindMatchesForRoute(req.route_id(), req.limit())) {
      *resp.add_matches() = ToProto(match);
    }
    return resp;
  });
}

} // namespace routebid::service
