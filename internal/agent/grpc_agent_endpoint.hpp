#pragma once

#include <memory>

#include "internal/agent/agent_endpoint.hpp"
#include "internal/transport/channel_pool.hpp"

namespace taskgate::agent {

// AgentEndpoint over taskgate.agent.v1.AgentService, on its own channel pool.
class GrpcAgentEndpoint : public AgentEndpoint {
 public:
  explicit GrpcAgentEndpoint(std::shared_ptr<transport::ChannelPool> pool);

  void Invoke(AgentRequest request, const AgentCallOptions& options, InvokeCallback done) override;

  void Stream(AgentRequest request, const AgentCallOptions& options, ChunkSink on_chunk, StreamCallback done) override;

 private:
  std::shared_ptr<transport::ChannelPool> pool_;
};

} // namespace taskgate::agent
