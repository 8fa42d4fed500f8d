#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/codec/task_codec.hpp"
#include "internal/router/request_router.hpp"
#include "taskgate/gateway/v1/gateway.grpc.pb.h"

namespace taskgate::grpc {

/*
  GatewayService over the RequestRouter, on the callback API: no handler
  thread waits for a backend. Failures travel in-band as a FAILED
  DispatchResponse; the gRPC status is only non-OK when the stream itself
  broke.
*/
class GatewayServer final : public taskgate::gateway::v1::GatewayService::CallbackService {
 public:
  GatewayServer(std::shared_ptr<const router::RequestRouter> router, codec::TaskCodec codec = codec::TaskCodec());

  ::grpc::ServerUnaryReactor* Dispatch(::grpc::CallbackServerContext* context, const taskgate::gateway::v1::DispatchRequest* request,
                                       taskgate::gateway::v1::DispatchResponse* response) override;

  ::grpc::ServerWriteReactor<taskgate::gateway::v1::DispatchChunk>* DispatchStream(
      ::grpc::CallbackServerContext* context, const taskgate::gateway::v1::DispatchRequest* request) override;

 private:
  std::shared_ptr<const router::RequestRouter> router_;
  codec::TaskCodec                             codec_;
};

} // namespace taskgate::grpc
