#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace routebid::grpc {

/*
  Converts internal exceptions into gRPC status codes. The message is
  prefixed with the error kind, e.g. "NotOwner: ...".
*/

::grpc::Status ToStatus(const std::exception& e);

// Runs one handler body and maps whatever it throws.
template <typename Fn>
::grpc::Status Handle(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace routebid::grpc
