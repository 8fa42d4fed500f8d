#pragma once

#include <grpcpp/grpcpp.h>

#include "internal/util/errors.hpp"

namespace taskgate::grpc {

/*
  Converts internal exceptions into gRPC status codes and back.
*/

::grpc::Status ToStatus(const std::exception& e);

::grpc::StatusCode ToStatusCode(util::ErrorKind kind);

// Kind a remote status maps to on the calling side. Only NotFound,
// InvalidArgument, Unavailable and DeadlineExceeded survive; the rest is Internal.
util::ErrorKind KindFromStatus(const ::grpc::Status& status);

} // namespace taskgate::grpc
