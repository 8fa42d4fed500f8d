#pragma once

#include <exception>
#include <string>
#include <string_view>

#include <arrow/status.h>
#include <grpcpp/support/status.h>

#include "internal/agent/agent_endpoint.hpp"
#include "internal/db/api/result.hpp"
#include "internal/queue/queue_publisher.hpp"
#include "internal/util/errors.hpp"

namespace taskgate::errors {

/*
  The one failure shape callers above the router see.

  `kind` is the discriminant; `cause` carries backend detail (driver text,
  transport status, broker reason) and is never needed to decide anything.
*/
struct Error {
  util::ErrorKind kind = util::ErrorKind::kInternal;
  std::string     message;
  std::string     cause;

  bool operator==(const Error&) const = default;
};

Error FromException(const std::exception& e);

Error FromGrpcStatus(const ::grpc::Status& status);

// Statuses produced by client::TasksClient.
Error FromArrowStatus(const arrow::Status& status);

// Datastore driver results. `result` must not be OK.
Error FromDbResult(const db::Result& result);

// Broker nack. `ack` must not be accepted.
Error FromPublishAck(const queue::PublishAck& ack);

Error FromAgentFailure(const agent::AgentFailure& failure);

// Worth retrying with backoff by the caller. Nothing in the core retries.
bool IsRetryable(util::ErrorKind kind);

std::string_view ErrorCodeName(db::ErrorCode code);

} // namespace taskgate::errors
