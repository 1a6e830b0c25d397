#include "internal/service/proto_convert.hpp"

#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace routebid::service {

namespace {

template <typename Model, typename Proto>
Model CheckedEnum(Proto value, int max, const char* name) {
  const int raw = static_cast<int>(value);
  if (raw < 0 || raw > max) {
    throw util::InvalidArgument(std::string("unknown ") + name + " value " + std::to_string(raw));
  }
  return static_cast<Model>(raw);
}

} // namespace

routebid::v1::GeoPoint ToProto(const model::GeoPoint& p) {
  routebid::v1::GeoPoint out;
  out.set_lat(p.lat);
  out.set_lng(p.lng);
  return out;
}

model::GeoPoint FromProto(const routebid::v1::GeoPoint& p) {
  return model::GeoPoint{p.lat(), p.lng()};
}

routebid::v1::PackageStatus ToProto(model::PackageStatus status) {
  return static_cast<routebid::v1::PackageStatus>(status);
}

routebid::v1::BidStatus ToProto(model::BidStatus status) {
  return static_cast<routebid::v1::BidStatus>(status);
}

routebid::v1::PackageSize ToProto(model::PackageSize size) {
  return static_cast<routebid::v1::PackageSize>(size);
}

model::PackageStatus FromProto(routebid::v1::PackageStatus status) {
  return CheckedEnum<model::PackageStatus>(status, routebid::v1::PackageStatus_MAX, "package status");
}

model::BidStatus FromProto(routebid::v1::BidStatus status) {
  return CheckedEnum<model::BidStatus>(status, routebid::v1::BidStatus_MAX, "bid status");
}

model::PackageSize FromProto(routebid::v1::PackageSize size) {
  return CheckedEnum<model::PackageSize>(size, routebid::v1::PackageSize_MAX, "package size");
}

routebid::v1::Package ToProto(const model::Package& pkg) {
  routebid::v1::Package out;
  out.set_id(pkg.id);
  out.set_status(ToProto(pkg.status));
  out.set_sender_id(pkg.sender_id);
  out.set_description(pkg.description);
  out.set_size(ToProto(pkg.size));
  out.set_weight_kg(pkg.weight_kg);
  *out.mutable_pickup() = ToProto(pkg.pickup);
  out.set_pickup_address(pkg.pickup_address);
  *out.mutable_dropoff() = ToProto(pkg.dropoff);
  out.set_dropoff_address(pkg.dropoff_address);
  if (pkg.offered_price) out.set_offered_price(*pkg.offered_price);
  if (pkg.selected_bid_id) out.set_selected_bid_id(*pkg.selected_bid_id);
  if (pkg.courier_id) out.set_courier_id(*pkg.courier_id);
  *out.mutable_created_at()        = util::ToProto(pkg.created_at);
  *out.mutable_status_changed_at() = util::ToProto(pkg.status_changed_at);
  if (pkg.bidding_deadline) *out.mutable_bidding_deadline() = util::ToProto(*pkg.bidding_deadline);
  out.set_deadline_extension_count(pkg.deadline_extension_count);
  out.set_delivery_proof_ref(pkg.delivery_proof_ref);
  out.set_failure_reason(pkg.failure_reason);
  out.set_version(pkg.version);
  return out;
}

routebid::v1::Bid ToProto(const model::Bid& bid) {
  routebid::v1::Bid out;
  out.set_id(bid.id);
  out.set_package_id(bid.package_id);
  out.set_courier_id(bid.courier_id);
  out.set_proposed_price(bid.proposed_price);
  if (bid.proposed_pickup_time) *out.mutable_proposed_pickup_time() = util::ToProto(*bid.proposed_pickup_time);
  out.set_message(bid.message);
  out.set_status(ToProto(bid.status));
  *out.mutable_created_at() = util::ToProto(bid.created_at);
  if (bid.resolved_at) *out.mutable_resolved_at() = util::ToProto(*bid.resolved_at);
  return out;
}

routebid::v1::Route ToProto(const model::Route& route) {
  routebid::v1::Route out;
  out.set_id(route.id);
  out.set_courier_id(route.courier_id);
  *out.mutable_start() = ToProto(route.start);
  out.set_start_address(route.start_address);
  *out.mutable_end() = ToProto(route.end);
  out.set_end_address(route.end_address);
  out.set_max_deviation_km(route.max_deviation_km);
  if (route.trip_date) *out.mutable_trip_date() = util::ToProto(*route.trip_date);
  out.set_is_active(route.is_active);
  *out.mutable_created_at() = util::ToProto(route.created_at);
  return out;
}

routebid::v1::MatchResult ToProto(const model::MatchResult& match) {
  routebid::v1::MatchResult out;
  out.set_package_id(match.package_id);
  out.set_distance_from_route_km(match.distance_from_route_km);
  out.set_estimated_detour_km(match.estimated_detour_km);
  *out.mutable_package() = ToProto(match.package);
  return out;
}

} // namespace routebid::service
