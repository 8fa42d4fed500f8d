#include "internal/agent/grpc_agent_endpoint.hpp"

#include <grpcpp/client_context.h>
#include <grpcpp/support/client_callback.h>

#include "internal/util/errors.hpp"
#include "taskgate/agent/v1/agent.grpc.pb.h"

namespace taskgate::agent {

namespace pb = taskgate::agent::v1;

namespace {

AgentFailure FailureFromStatus(const ::grpc::Status& status) {
  AgentFailure failure;
  failure.message = status.error_message();
  switch (status.error_code()) {
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
      failure.reason = AgentFailure::Reason::kTimeout;
      break;
    case ::grpc::StatusCode::UNAVAILABLE:
      failure.reason = AgentFailure::Reason::kUnreachable;
      break;
    case ::grpc::StatusCode::INVALID_ARGUMENT:
      failure.reason = AgentFailure::Reason::kRejected;
      break;
    case ::grpc::StatusCode::CANCELLED:
      failure.reason = AgentFailure::Reason::kCancelled;
      break;
    default:
      failure.reason = AgentFailure::Reason::kAgentError;
      break;
  }
  return failure;
}

pb::InvokeRequest ToMessage(const AgentRequest& request) {
  pb::InvokeRequest out;
  out.set_agent(request.agent);
  out.set_prompt(request.prompt);
  out.set_session_id(request.session_id);
  out.set_caller_id(request.caller_id);
  for (const auto& [key, value] : request.attributes) {
    (*out.mutable_attributes())[key] = value;
  }
  return out;
}

void SetDeadline(::grpc::ClientContext& context, const transport::ChannelOptions& pool_options, const AgentCallOptions& options) {
  context.set_deadline(std::chrono::system_clock::now() + options.deadline.value_or(pool_options.default_deadline));
}

struct InvokeCall {
  ::grpc::ClientContext                   context;
  pb::InvokeRequest                       request;
  pb::InvokeResponse                      response;
  transport::ChannelHandle                handle;
  std::unique_ptr<pb::AgentService::Stub> stub;
  transport::CancelRegistration           cancel;
};

class StreamReactor : public ::grpc::ClientReadReactor<pb::StreamChunk>, public std::enable_shared_from_this<StreamReactor> {
 public:
  StreamReactor(std::shared_ptr<transport::ChannelPool> pool, AgentEndpoint::ChunkSink on_chunk, AgentEndpoint::StreamCallback done)
      : pool_(std::move(pool)), on_chunk_(std::move(on_chunk)), done_(std::move(done)) {
  }

  void Start(pb::InvokeRequest request, const AgentCallOptions& options, transport::ChannelHandle handle) {
    request_ = std::move(request);
    handle_  = std::move(handle);
    stub_    = pb::AgentService::NewStub(handle_->channel);
    SetDeadline(context_, pool_->Options(), options);

    self_ = shared_from_this();

    // registered before StartCall so OnDone always sees the final registration
    std::weak_ptr<StreamReactor> weak = self_;
    cancel_ = options.cancel.OnCancel([weak] {
      if (auto r = weak.lock()) {
        r->context_.TryCancel();
      }
    });

    stub_->async()->Stream(&context_, &request_, this);
    StartRead(&chunk_);
    StartCall();
  }

  void OnReadDone(bool ok) override {
    if (!ok) {
      return;
    }
    AgentChunk chunk{chunk_.content(), chunk_.event(), chunk_.done()};
    if (!on_chunk_(std::move(chunk))) {
      stopped_ = true;
      context_.TryCancel();
      return;
    }
    StartRead(&chunk_);
  }

  void OnDone(const ::grpc::Status& status) override {
    auto self = std::move(self_);
    cancel_.Reset();
    pool_->ReportResult(*handle_, status);
    handle_.reset();

    if (status.ok() || stopped_) {
      done_(std::nullopt);
    } else {
      done_(FailureFromStatus(status));
    }
  }

 private:
  std::shared_ptr<transport::ChannelPool> pool_;
  AgentEndpoint::ChunkSink                on_chunk_;
  AgentEndpoint::StreamCallback           done_;

  ::grpc::ClientContext                   context_;
  pb::InvokeRequest                       request_;
  pb::StreamChunk                         chunk_;
  transport::ChannelHandle                handle_;
  std::unique_ptr<pb::AgentService::Stub> stub_;
  transport::CancelRegistration           cancel_;
  bool                                    stopped_ = false;
  std::shared_ptr<StreamReactor>          self_;
};

} // namespace

GrpcAgentEndpoint::GrpcAgentEndpoint(std::shared_ptr<transport::ChannelPool> pool) : pool_(std::move(pool)) {
}

void GrpcAgentEndpoint::Invoke(AgentRequest request, const AgentCallOptions& options, InvokeCallback done) {
  if (options.cancel.IsCancelled()) {
    done(AgentFailure{AgentFailure::Reason::kCancelled, "cancelled by caller"});
    return;
  }

  auto call     = std::make_shared<InvokeCall>();
  call->request = ToMessage(request);
  try {
    call->handle = pool_->Acquire();
  } catch (const util::TaskgateError& e) {
    done(AgentFailure{AgentFailure::Reason::kUnreachable, e.what()});
    return;
  }
  call->stub = pb::AgentService::NewStub(call->handle->channel);
  SetDeadline(call->context, pool_->Options(), options);

  std::weak_ptr<InvokeCall> weak_call = call;
  call->cancel = options.cancel.OnCancel([weak_call] {
    if (auto c = weak_call.lock()) {
      c->context.TryCancel();
    }
  });

  call->stub->async()->Invoke(&call->context, &call->request, &call->response,
                              [call, pool = pool_, done = std::move(done)](::grpc::Status status) {
                                call->cancel.Reset();
                                pool->ReportResult(*call->handle, status);
                                call->handle.reset();
                                if (!status.ok()) {
                                  done(FailureFromStatus(status));
                                  return;
                                }
                                const auto& r = call->response;
                                done(AgentReply{r.request_id(), r.agent(), r.content(), r.latency_ms()});
                              });
}

void GrpcAgentEndpoint::Stream(AgentRequest request, const AgentCallOptions& options, ChunkSink on_chunk, StreamCallback done) {
  if (options.cancel.IsCancelled()) {
    done(AgentFailure{AgentFailure::Reason::kCancelled, "cancelled by caller"});
    return;
  }

  transport::ChannelHandle handle;
  try {
    handle = pool_->Acquire();
  } catch (const util::TaskgateError& e) {
    done(AgentFailure{AgentFailure::Reason::kUnreachable, e.what()});
    return;
  }

  auto reactor = std::make_shared<StreamReactor>(pool_, std::move(on_chunk), std::move(done));
  reactor->Start(ToMessage(request), options, std::move(handle));
}

} // namespace taskgate::agent
