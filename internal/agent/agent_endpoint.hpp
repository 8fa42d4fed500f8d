#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>

#include "internal/transport/cancellation.hpp"

namespace taskgate::agent {

struct AgentRequest {
  std::string                        agent;
  std::string                        prompt;
  std::string                        session_id;
  std::string                        caller_id;
  std::map<std::string, std::string> attributes;
};

struct AgentReply {
  std::string  request_id;
  std::string  agent;
  std::string  content;
  std::int64_t latency_ms = 0;
};

struct AgentChunk {
  std::string content;
  std::string event;
  bool        done = false;
};

struct AgentFailure {
  enum class Reason {
    kTimeout,
    kUnreachable,
    kRejected,   // agent refused the request as malformed
    kCancelled,
    kAgentError, // agent ran and reported a failure
  };

  Reason      reason = Reason::kAgentError;
  std::string message;
};

using InvokeOutcome = std::variant<AgentReply, AgentFailure>;

struct AgentCallOptions {
  std::optional<std::chrono::milliseconds> deadline;
  transport::CancelToken                   cancel;
};

/*
  Collaborator contract: invoke(payload) -> result and
  stream(payload) -> sequence of chunks.

  Calls may take tens of seconds; both complete through callbacks and never
  block the caller. `done` runs exactly once.
*/
class AgentEndpoint {
 public:
  using InvokeCallback = std::function<void(InvokeOutcome)>;
  // Return false to stop the stream.
  using ChunkSink      = std::function<bool(AgentChunk)>;
  using StreamCallback = std::function<void(std::optional<AgentFailure>)>;

  virtual ~AgentEndpoint() = default;

  virtual void Invoke(AgentRequest request, const AgentCallOptions& options, InvokeCallback done) = 0;

  virtual void Stream(AgentRequest request, const AgentCallOptions& options, ChunkSink on_chunk, StreamCallback done) = 0;
};

} // namespace taskgate::agent
