#pragma once

#include "internal/codec/task_codec.hpp"
#include "internal/router/request.hpp"
#include "taskgate/gateway/v1/gateway.pb.h"

namespace taskgate::grpc {

/*
  Conversions between taskgate.gateway.v1 messages and router types.

  Request conversion throws util::InvalidArgument for a missing operation
  and util::DecodingError for undecodable task payloads.
*/

router::RouterRequest FromDispatchRequest(const taskgate::gateway::v1::DispatchRequest& request, const codec::TaskCodec& codec);

taskgate::gateway::v1::DispatchResponse ToDispatchResponse(const router::RouterResponse& response, const codec::TaskCodec& codec);

taskgate::gateway::v1::DispatchChunk ToDispatchChunk(const router::StreamItem& item, const codec::TaskCodec& codec);

// Failure response for requests that never reached the router.
taskgate::gateway::v1::DispatchResponse FailedResponse(const errors::Error& error);

taskgate::gateway::v1::ErrorKind ToProto(util::ErrorKind kind);
util::ErrorKind                  FromProto(taskgate::gateway::v1::ErrorKind kind);

taskgate::gateway::v1::Value ToProto(const db::sql::Value& value);
db::sql::Value               FromProto(const taskgate::gateway::v1::Value& value);

} // namespace taskgate::grpc
