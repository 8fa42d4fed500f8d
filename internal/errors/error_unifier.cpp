#include "internal/errors/error_unifier.hpp"

#include "client/cpp/tasks_client.h"
#include "internal/grpc/grpc_error.hpp"

namespace taskgate::errors {

using util::ErrorKind;

Error FromException(const std::exception& e) {
  if (const auto* typed = dynamic_cast<const util::TaskgateError*>(&e)) {
    return {typed->Kind(), typed->what(), typed->Cause()};
  }
  return {ErrorKind::kInternal, "internal error", e.what()};
}

Error FromGrpcStatus(const ::grpc::Status& status) {
  const auto kind = taskgate::grpc::KindFromStatus(status);
  return {kind, status.error_message(), "grpc status " + std::to_string(status.error_code())};
}

Error FromArrowStatus(const arrow::Status& status) {
  return {client::ErrorKindOf(status), status.message(), client::ErrorCauseOf(status)};
}

Error FromDbResult(const db::Result& result) {
  ErrorKind kind = ErrorKind::kInternal;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      kind = ErrorKind::kNotFound;
      break;
    case db::ErrorCode::AlreadyExists:
    case db::ErrorCode::ConstraintViolation:
    case db::ErrorCode::InvalidQuery:
      kind = ErrorKind::kInvalidArgument;
      break;
    case db::ErrorCode::Busy:
    case db::ErrorCode::Conflict:
    case db::ErrorCode::SerializationFailure:
    case db::ErrorCode::IOError:
      kind = ErrorKind::kUnavailable;
      break;
    default:
      break;
  }

  std::string message = "datastore " + std::string(ErrorCodeName(result.code));
  return {kind, std::move(message), result.message};
}

Error FromPublishAck(const queue::PublishAck& ack) {
  // a broker that refuses for good (shut down) is not the caller's fault
  const auto kind = ack.retryable ? ErrorKind::kUnavailable : ErrorKind::kInternal;
  return {kind, "publish to " + ack.subject + " rejected", ack.reason};
}

Error FromAgentFailure(const agent::AgentFailure& failure) {
  using Reason = agent::AgentFailure::Reason;
  switch (failure.reason) {
    case Reason::kTimeout:
      return {ErrorKind::kDeadlineExceeded, "agent timed out", failure.message};
    case Reason::kUnreachable:
      return {ErrorKind::kUnavailable, "agent unreachable", failure.message};
    case Reason::kRejected:
      return {ErrorKind::kInvalidArgument, "agent rejected request", failure.message};
    case Reason::kCancelled:
      return {ErrorKind::kInternal, "agent call cancelled", failure.message};
    case Reason::kAgentError:
      break;
  }
  return {ErrorKind::kInternal, "agent failed", failure.message};
}

bool IsRetryable(ErrorKind kind) {
  return kind == ErrorKind::kUnavailable || kind == ErrorKind::kTransport;
}

std::string_view ErrorCodeName(db::ErrorCode code) {
  switch (code) {
    case db::ErrorCode::OK:
      return "ok";
    case db::ErrorCode::NotFound:
      return "not found";
    case db::ErrorCode::AlreadyExists:
      return "already exists";
    case db::ErrorCode::Conflict:
      return "conflict";
    case db::ErrorCode::Busy:
      return "busy";
    case db::ErrorCode::ConstraintViolation:
      return "constraint violation";
    case db::ErrorCode::SerializationFailure:
      return "serialization failure";
    case db::ErrorCode::IOError:
      return "io error";
    case db::ErrorCode::Corruption:
      return "corruption";
    case db::ErrorCode::InvalidQuery:
      return "invalid query";
    case db::ErrorCode::Unsupported:
      return "unsupported";
    case db::ErrorCode::InternalError:
      return "internal error";
  }
  return "internal error";
}

} // namespace taskgate::errors
