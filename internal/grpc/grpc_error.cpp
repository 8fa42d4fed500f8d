#include "grpc_error.hpp"

namespace taskgate::grpc {

using util::ErrorKind;

::grpc::StatusCode ToStatusCode(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNotFound:
      return ::grpc::StatusCode::NOT_FOUND;
    case ErrorKind::kEncoding:
    case ErrorKind::kDecoding:
    case ErrorKind::kInvalidArgument:
      return ::grpc::StatusCode::INVALID_ARGUMENT;
    case ErrorKind::kTransport:
    case ErrorKind::kUnavailable:
      return ::grpc::StatusCode::UNAVAILABLE;
    case ErrorKind::kDeadlineExceeded:
      return ::grpc::StatusCode::DEADLINE_EXCEEDED;
    case ErrorKind::kUnroutable:
      return ::grpc::StatusCode::UNIMPLEMENTED;
    case ErrorKind::kInternal:
      return ::grpc::StatusCode::INTERNAL;
  }
  return ::grpc::StatusCode::INTERNAL;
}

::grpc::Status ToStatus(const std::exception& e) {
  if (const auto* typed = dynamic_cast<const util::TaskgateError*>(&e)) {
    return {ToStatusCode(typed->Kind()), e.what()};
  }
  return {::grpc::StatusCode::INTERNAL, e.what()};
}

ErrorKind KindFromStatus(const ::grpc::Status& status) {
  switch (status.error_code()) {
    case ::grpc::StatusCode::NOT_FOUND:
      return ErrorKind::kNotFound;
    case ::grpc::StatusCode::INVALID_ARGUMENT:
    case ::grpc::StatusCode::OUT_OF_RANGE:
      return ErrorKind::kInvalidArgument;
    case ::grpc::StatusCode::UNAVAILABLE:
      return ErrorKind::kUnavailable;
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
      return ErrorKind::kDeadlineExceeded;
    default:
      return ErrorKind::kInternal;
  }
}

} // namespace taskgate::grpc
