#include "internal/errors/error_unifier.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "client/cpp/tasks_client.h"

namespace {

using taskgate::errors::Error;
using taskgate::util::ErrorKind;

namespace errors = taskgate::errors;
namespace db     = taskgate::db;

void TestExceptionsKeepTheirKind() {
  const auto unroutable = errors::FromException(taskgate::util::UnroutableRequest("no route for domain 'billing'"));
  assert(unroutable.kind == ErrorKind::kUnroutable);
  assert(unroutable.message == "no route for domain 'billing'");

  const auto transport = errors::FromException(taskgate::util::TransportError("no channel", "connect refused"));
  assert(transport.kind == ErrorKind::kTransport);
  assert(transport.cause == "connect refused");

  assert(errors::FromException(taskgate::util::EncodingError("bad utf-8")).kind == ErrorKind::kEncoding);
  assert(errors::FromException(taskgate::util::DecodingError("truncated")).kind == ErrorKind::kDecoding);

  // foreign exceptions never leak their text into the message
  const auto foreign = errors::FromException(std::logic_error("vector::at"));
  assert(foreign.kind == ErrorKind::kInternal);
  assert(foreign.message == "internal error");
  assert(foreign.cause == "vector::at");
}

void TestGrpcStatuses() {
  const auto missing = errors::FromGrpcStatus({::grpc::StatusCode::NOT_FOUND, "task not found"});
  assert(missing.kind == ErrorKind::kNotFound);
  assert(missing.message == "task not found");
  assert(missing.cause == "grpc status 5");

  assert(errors::FromGrpcStatus({::grpc::StatusCode::DEADLINE_EXCEEDED, ""}).kind == ErrorKind::kDeadlineExceeded);
  assert(errors::FromGrpcStatus({::grpc::StatusCode::UNAVAILABLE, ""}).kind == ErrorKind::kUnavailable);
  assert(errors::FromGrpcStatus({::grpc::StatusCode::ABORTED, ""}).kind == ErrorKind::kInternal);
}

void TestClientStatuses() {
  const auto status = taskgate::client::MakeTaskStatus(ErrorKind::kDeadlineExceeded, "Create timed out", "grpc status 4: deadline");
  const auto error  = errors::FromArrowStatus(status);
  assert(error.kind == ErrorKind::kDeadlineExceeded);
  assert(error.message == "Create timed out");
  assert(error.cause == "grpc status 4: deadline");

  // a status produced elsewhere carries no detail
  const auto plain = errors::FromArrowStatus(arrow::Status::IOError("disk"));
  assert(plain.kind == ErrorKind::kInternal);
}

void TestDatastoreResults() {
  const auto missing = errors::FromDbResult(db::Result::Err(db::ErrorCode::NotFound, "no row in projects"));
  assert(missing.kind == ErrorKind::kNotFound);
  assert(missing.message == "datastore not found");
  assert(missing.cause == "no row in projects");

  assert(errors::FromDbResult(db::Result::Err(db::ErrorCode::AlreadyExists)).kind == ErrorKind::kInvalidArgument);
  assert(errors::FromDbResult(db::Result::Err(db::ErrorCode::ConstraintViolation)).kind == ErrorKind::kInvalidArgument);
  assert(errors::FromDbResult(db::Result::Err(db::ErrorCode::InvalidQuery)).kind == ErrorKind::kInvalidArgument);
  assert(errors::FromDbResult(db::Result::Err(db::ErrorCode::Busy)).kind == ErrorKind::kUnavailable);
  assert(errors::FromDbResult(db::Result::Err(db::ErrorCode::SerializationFailure)).kind == ErrorKind::kUnavailable);
  assert(errors::FromDbResult(db::Result::Err(db::ErrorCode::IOError)).kind == ErrorKind::kUnavailable);
  assert(errors::FromDbResult(db::Result::Err(db::ErrorCode::Corruption)).kind == ErrorKind::kInternal);
  assert(errors::FromDbResult(db::Result::Err(db::ErrorCode::Unsupported)).kind == ErrorKind::kInternal);
}

void TestPublishNacks() {
  taskgate::queue::PublishAck full;
  full.subject   = "notifications.email";
  full.retryable = true;
  full.reason    = "broker at capacity (16)";
  const auto busy = errors::FromPublishAck(full);
  assert(busy.kind == ErrorKind::kUnavailable);
  assert(busy.cause == full.reason);
  assert(busy.message.find("notifications.email") != std::string::npos);

  taskgate::queue::PublishAck closed;
  closed.subject = "notifications.email";
  closed.reason  = "broker is shut down";
  const auto gone = errors::FromPublishAck(closed);
  assert(gone.kind == ErrorKind::kInternal);
  assert(gone.cause == "broker is shut down");
  assert(!errors::IsRetryable(gone.kind));
}

void TestAgentFailures() {
  using Reason = taskgate::agent::AgentFailure::Reason;
  assert(errors::FromAgentFailure({Reason::kTimeout, ""}).kind == ErrorKind::kDeadlineExceeded);
  assert(errors::FromAgentFailure({Reason::kUnreachable, ""}).kind == ErrorKind::kUnavailable);
  assert(errors::FromAgentFailure({Reason::kRejected, ""}).kind == ErrorKind::kInvalidArgument);
  assert(errors::FromAgentFailure({Reason::kCancelled, ""}).kind == ErrorKind::kInternal);

  const auto failed = errors::FromAgentFailure({Reason::kAgentError, "tool call failed"});
  assert(failed.kind == ErrorKind::kInternal);
  assert(failed.cause == "tool call failed");
}

void TestSameKindFromEveryBackend() {
  // a missing record looks the same whichever pattern served it
  const Error from_rpc   = errors::FromGrpcStatus({::grpc::StatusCode::NOT_FOUND, "x"});
  const Error from_db    = errors::FromDbResult(db::Result::Err(db::ErrorCode::NotFound, "x"));
  const Error from_arrow = errors::FromArrowStatus(taskgate::client::MakeTaskStatus(ErrorKind::kNotFound, "x"));
  assert(from_rpc.kind == from_db.kind);
  assert(from_db.kind == from_arrow.kind);
}

void TestRetryability() {
  assert(errors::IsRetryable(ErrorKind::kUnavailable));
  assert(errors::IsRetryable(ErrorKind::kTransport));
  assert(!errors::IsRetryable(ErrorKind::kDeadlineExceeded));
  assert(!errors::IsRetryable(ErrorKind::kNotFound));
  assert(!errors::IsRetryable(ErrorKind::kInvalidArgument));
  assert(!errors::IsRetryable(ErrorKind::kInternal));
}

} // namespace

int main() {
  TestExceptionsKeepTheirKind();
  TestGrpcStatuses();
  TestClientStatuses();
  TestDatastoreResults();
  TestPublishNacks();
  TestAgentFailures();
  TestSameKindFromEveryBackend();
  TestRetryability();

  std::cout << "taskgate_unit_error_unifier: pass\n";
  return 0;
}
