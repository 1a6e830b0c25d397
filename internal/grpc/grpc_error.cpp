#include "internal/grpc/grpc_error.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace routebid::grpc {

namespace {

::grpc::Status Make(::grpc::StatusCode code, const char* kind, const std::exception& e) {
  return {code, std::string(kind) + ": " + e.what()};
}

} // namespace

::grpc::Status ToStatus(const std::exception& e) {
  using namespace routebid::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return Make(::grpc::StatusCode::NOT_FOUND, "NotFound", e);
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return Make(::grpc::StatusCode::INVALID_ARGUMENT, "InvalidArgument", e);
  }
  if (dynamic_cast<const InvalidTransition*>(&e)) {
    return Make(::grpc::StatusCode::FAILED_PRECONDITION, "InvalidTransition", e);
  }
  if (dynamic_cast<const PackageNotBiddable*>(&e)) {
    return Make(::grpc::StatusCode::FAILED_PRECONDITION, "PackageNotBiddable", e);
  }
  if (dynamic_cast<const AlreadyTerminal*>(&e)) {
    return Make(::grpc::StatusCode::FAILED_PRECONDITION, "AlreadyTerminal", e);
  }
  if (dynamic_cast<const ActiveDeliveries*>(&e)) {
    return Make(::grpc::StatusCode::FAILED_PRECONDITION, "ActiveDeliveries", e);
  }
  if (dynamic_cast<const DuplicateBid*>(&e)) {
    return Make(::grpc::StatusCode::ALREADY_EXISTS, "DuplicateBid", e);
  }
  if (dynamic_cast<const NotOwner*>(&e)) {
    return Make(::grpc::StatusCode::PERMISSION_DENIED, "NotOwner", e);
  }
  if (dynamic_cast<const CourierNotEligible*>(&e)) {
    return Make(::grpc::StatusCode::PERMISSION_DENIED, "CourierNotEligible", e);
  }
  if (dynamic_cast<const Busy*>(&e)) {
    return Make(::grpc::StatusCode::UNAVAILABLE, "Busy", e);
  }
  if (dynamic_cast<const Conflict*>(&e)) {
    return Make(::grpc::StatusCode::ABORTED, "Conflict", e);
  }

  return Make(::grpc::StatusCode::INTERNAL, "Internal", e);
}

} // namespace routebid::grpc
