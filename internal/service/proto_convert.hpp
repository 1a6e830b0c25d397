#pragma once

#include "internal/model/bid.hpp"
#include "internal/model/package.hpp"
#include "internal/model/route.hpp"
#include "routebid/v1/types.pb.h"

namespace routebid::service {

/*
  Model <-> wire conversion. Enum values share numbering with the proto
  enums; anything outside the known range is rejected as InvalidArgument.
*/

routebid::v1::GeoPoint    ToProto(const model::GeoPoint& p);
routebid::v1::Package     ToProto(const model::Package& pkg);
routebid::v1::Bid         ToProto(const model::Bid& bid);
routebid::v1::Route       ToProto(const model::Route& route);
routebid::v1::MatchResult ToProto(const model::MatchResult& match);

model::GeoPoint FromProto(const routebid::v1::GeoPoint& p);

routebid::v1::PackageStatus ToProto(model::PackageStatus status);
routebid::v1::BidStatus     ToProto(model::BidStatus status);
routebid::v1::PackageSize   ToProto(model::PackageSize size);

model::PackageStatus FromProto(routebid::v1::PackageStatus status);
model::BidStatus     FromProto(routebid::v1::BidStatus status);
model::PackageSize   FromProto(routebid::v1::PackageSize size);

} // namespace routebid::service
