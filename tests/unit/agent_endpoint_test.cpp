#include "internal/agent/grpc_agent_endpoint.hpp"

#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "tests/support/stub_services.hpp"

namespace {

using taskgate::agent::AgentCallOptions;
using taskgate::agent::AgentChunk;
using taskgate::agent::AgentFailure;
using taskgate::agent::AgentReply;
using taskgate::agent::AgentRequest;
using taskgate::agent::GrpcAgentEndpoint;
using taskgate::agent::InvokeOutcome;
using taskgate::testing::InProcessOptions;
using taskgate::testing::InProcessPeer;
using taskgate::testing::StubAgentService;
using taskgate::testing::StubBehavior;
using taskgate::transport::ChannelPool;

using Reason = AgentFailure::Reason;

struct Fixture {
  Fixture()
      : stub(std::make_shared<StubAgentService>()),
        peer({stub}),
        pool(ChannelPool::Create(InProcessOptions(), peer.Factory())),
        endpoint(pool) {
  }

  std::shared_ptr<StubAgentService> stub;
  InProcessPeer                     peer;
  std::shared_ptr<ChannelPool>      pool;
  GrpcAgentEndpoint                 endpoint;
};

AgentRequest MakeRequest(const std::string& prompt) {
  AgentRequest request;
  request.agent      = "rag-agent";
  request.prompt     = prompt;
  request.session_id = "session-1";
  request.caller_id  = "agent-test";
  return request;
}

InvokeOutcome InvokeSync(GrpcAgentEndpoint& endpoint, AgentRequest request, const AgentCallOptions& options = {}) {
  std::promise<InvokeOutcome> promise;
  auto                        future = promise.get_future();
  endpoint.Invoke(std::move(request), options, [&promise](InvokeOutcome outcome) { promise.set_value(std::move(outcome)); });
  return future.get();
}

Reason FailureReason(const InvokeOutcome& outcome) {
  const auto* failure = std::get_if<AgentFailure>(&outcome);
  assert(failure != nullptr);
  return failure->reason;
}

struct StreamOutcome {
  std::vector<AgentChunk>     chunks;
  std::optional<AgentFailure> failure;
};

StreamOutcome StreamSync(GrpcAgentEndpoint& endpoint, AgentRequest request, std::size_t stop_after = 0) {
  auto chunks = std::make_shared<std::vector<AgentChunk>>();
  auto mutex  = std::make_shared<std::mutex>();

  std::promise<std::optional<AgentFailure>> promise;
  auto                                      future = promise.get_future();
  endpoint.Stream(
      std::move(request), {},
      [chunks, mutex, stop_after](AgentChunk chunk) {
        std::lock_guard lock(*mutex);
        chunks->push_back(std::move(chunk));
        return stop_after == 0 || chunks->size() < stop_after;
      },
      [&promise](std::optional<AgentFailure> failure) { promise.set_value(std::move(failure)); });

  StreamOutcome outcome;
  outcome.failure = future.get();
  std::lock_guard lock(*mutex);
  outcome.chunks = *chunks;
  return outcome;
}

void TestInvokeReturnsReply() {
  Fixture f;
  const auto outcome = InvokeSync(f.endpoint, MakeRequest("what is due today"));
  const auto* reply  = std::get_if<AgentReply>(&outcome);
  assert(reply != nullptr);
  assert(reply->agent == "rag-agent");
  assert(reply->content == "echo:what is due today");
  assert(!reply->request_id.empty());
  assert(f.stub->Calls() == 1);
}

void TestStreamDeliversChunksThenMarker() {
  Fixture f;
  const auto outcome = StreamSync(f.endpoint, MakeRequest("alpha beta gamma"));
  assert(!outcome.failure);
  assert(outcome.chunks.size() == 4);
  assert(outcome.chunks[0].content == "alpha");
  assert(outcome.chunks[0].event == "token");
  assert(outcome.chunks[2].content == "gamma");
  assert(outcome.chunks[3].done);
  assert(outcome.chunks[3].content.empty());
}

void TestStreamStopsWhenSinkDeclines() {
  Fixture f;
  const auto outcome = StreamSync(f.endpoint, MakeRequest("one two three four five"), 2);
  assert(!outcome.failure);
  assert(outcome.chunks.size() == 2);
}

void TestSilentAgentTimesOut() {
  Fixture f;
  f.stub->SetBehavior(StubBehavior{.silent = true});

  AgentCallOptions options;
  options.deadline = std::chrono::milliseconds(100);

  const auto started = std::chrono::steady_clock::now();
  const auto outcome = InvokeSync(f.endpoint, MakeRequest("slow"), options);
  const auto elapsed = std::chrono::steady_clock::now() - started;
  assert(FailureReason(outcome) == Reason::kTimeout);
  assert(elapsed < std::chrono::milliseconds(1000));
}

void TestStatusesMapToReasons() {
  Fixture f;

  f.stub->SetBehavior(StubBehavior{.script = ::grpc::Status(::grpc::StatusCode::INVALID_ARGUMENT, "prompt too long")});
  assert(FailureReason(InvokeSync(f.endpoint, MakeRequest("x"))) == Reason::kRejected);

  f.stub->SetBehavior(StubBehavior{.script = ::grpc::Status(::grpc::StatusCode::INTERNAL, "model crashed")});
  const auto crashed = InvokeSync(f.endpoint, MakeRequest("x"));
  assert(FailureReason(crashed) == Reason::kAgentError);
  assert(std::get<AgentFailure>(crashed).message == "model crashed");

  f.stub->SetBehavior(StubBehavior{.script = ::grpc::Status(::grpc::StatusCode::UNAVAILABLE, "overloaded")});
  assert(FailureReason(InvokeSync(f.endpoint, MakeRequest("x"))) == Reason::kUnreachable);

  f.stub->SetBehavior(StubBehavior{.script = ::grpc::Status(::grpc::StatusCode::INTERNAL, "stream broke")});
  const auto streamed = StreamSync(f.endpoint, MakeRequest("a b"));
  assert(streamed.failure && streamed.failure->reason == Reason::kAgentError);
}

void TestUnreachablePool() {
  auto pool = ChannelPool::Create(InProcessOptions(), [](const auto&, const auto&) -> std::shared_ptr<::grpc::Channel> { return nullptr; });
  GrpcAgentEndpoint endpoint(pool);

  assert(FailureReason(InvokeSync(endpoint, MakeRequest("x"))) == Reason::kUnreachable);
  const auto streamed = StreamSync(endpoint, MakeRequest("x"));
  assert(streamed.failure && streamed.failure->reason == Reason::kUnreachable);
}

void TestCallerCancellation() {
  Fixture f;

  taskgate::transport::CancelSource before;
  before.Cancel();
  AgentCallOptions cancelled;
  cancelled.cancel = before.Token();
  assert(FailureReason(InvokeSync(f.endpoint, MakeRequest("x"), cancelled)) == Reason::kCancelled);
  assert(f.stub->Calls() == 0);

  f.stub->SetBehavior(StubBehavior{.silent = true});
  taskgate::transport::CancelSource during;
  AgentCallOptions                  options;
  options.cancel = during.Token();

  std::promise<InvokeOutcome> promise;
  auto                        future = promise.get_future();
  f.endpoint.Invoke(MakeRequest("x"), options, [&promise](InvokeOutcome outcome) { promise.set_value(std::move(outcome)); });
  assert(taskgate::testing::WaitFor([&] { return f.stub->Calls() == 1; }));
  during.Cancel();
  assert(FailureReason(future.get()) == Reason::kCancelled);
}

} // namespace

int main() {
  TestInvokeReturnsReply();
  TestStreamDeliversChunksThenMarker();
  TestStreamStopsWhenSinkDeclines();
  TestSilentAgentTimesOut();
  TestStatusesMapToReasons();
  TestUnreachablePool();
  TestCallerCancellation();

  std::cout << "taskgate_unit_agent_endpoint: pass\n";
  return 0;
}
