#include "gateway_server.hpp"

#include <algorithm>
#include <deque>
#include <mutex>

#include "gateway_mapping.hpp"
#include "internal/errors/error_unifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/transport/cancellation.hpp"

namespace taskgate::grpc {

namespace gw = taskgate::gateway::v1;

using observability::StringField;

namespace {

// The remaining client deadline is used when the request carries none.
void InheritDeadline(const ::grpc::CallbackServerContext& context, router::RouterRequest& request) {
  if (request.deadline) return;
  const auto deadline = context.deadline();
  if (deadline == std::chrono::system_clock::time_point::max()) return;

  const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::system_clock::now());
  request.deadline     = std::max(remaining, std::chrono::milliseconds(1));
}

gw::DispatchResponse Render(const router::RouterResponse& response, const codec::TaskCodec& codec) {
  try {
    return ToDispatchResponse(response, codec);
  } catch (const std::exception& e) {
    return FailedResponse(errors::FromException(e));
  }
}

/*
  Writes chunks in arrival order with one write outstanding at a time.
  Router callbacks may outlive the RPC, so the reactor is shared and every
  entry point checks whether the stream is still open.
*/
class DispatchStreamReactor : public ::grpc::ServerWriteReactor<gw::DispatchChunk>,
                              public std::enable_shared_from_this<DispatchStreamReactor> {
 public:
  explicit DispatchStreamReactor(codec::TaskCodec codec) : codec_(std::move(codec)) {
  }

  void Start(const router::RequestRouter& router, router::RouterRequest request) {
    self_          = shared_from_this();
    request.cancel = cancel_.Token();

    std::weak_ptr<DispatchStreamReactor> weak = self_;
    router.DispatchStream(
        std::move(request),
        [weak](router::StreamItem item) {
          auto self = weak.lock();
          if (!self) return false;
          try {
            return self->Enqueue(ToDispatchChunk(item, self->codec_), false);
          } catch (const std::exception& e) {
            TASKGATE_LOG_WARN("dropping stream chunk", {StringField("error", e.what())});
            return false;
          }
        },
        [weak](router::RouterResponse response) {
          if (auto self = weak.lock()) {
            gw::DispatchChunk chunk;
            *chunk.mutable_final() = Render(response, self->codec_);
            self->Enqueue(std::move(chunk), true);
          }
        });
  }

  // Finishes immediately with a single final chunk.
  void StartFailed(const errors::Error& error) {
    self_ = shared_from_this();
    gw::DispatchChunk chunk;
    *chunk.mutable_final() = FailedResponse(error);
    Enqueue(std::move(chunk), true);
  }

  void OnWriteDone(bool ok) override {
    std::lock_guard lock(mutex_);
    pending_.pop_front();
    if (!ok) {
      closed_ = true;
      FinishLocked(::grpc::Status(::grpc::StatusCode::CANCELLED, "client stopped reading"));
      return;
    }
    if (!pending_.empty()) {
      StartWrite(&pending_.front());
    } else if (final_queued_) {
      FinishLocked(::grpc::Status::OK);
    }
  }

  void OnCancel() override {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    cancel_.Cancel();
  }

  void OnDone() override {
    auto self = std::move(self_);
    std::lock_guard lock(mutex_);
    closed_ = true;
  }

 private:
  // Returns false once the stream can no longer carry chunks.
  bool Enqueue(gw::DispatchChunk chunk, bool final) {
    std::lock_guard lock(mutex_);
    if (closed_ || final_queued_) return false;

    pending_.push_back(std::move(chunk));
    final_queued_ = final;
    if (pending_.size() == 1) {
      StartWrite(&pending_.front());
    }
    return true;
  }

  void FinishLocked(const ::grpc::Status& status) {
    if (finished_) return;
    finished_ = true;
    Finish(status);
  }

  codec::TaskCodec        codec_;
  transport::CancelSource cancel_;

  std::mutex                    mutex_;
  std::deque<gw::DispatchChunk> pending_;
  bool                          final_queued_ = false;
  bool                          closed_       = false;
  bool                          finished_     = false;

  std::shared_ptr<DispatchStreamReactor> self_;
};

} // namespace

GatewayServer::GatewayServer(std::shared_ptr<const router::RequestRouter> router, codec::TaskCodec codec)
    : router_(std::move(router)), codec_(std::move(codec)) {
}

::grpc::ServerUnaryReactor* GatewayServer::Dispatch(::grpc::CallbackServerContext* context, const gw::DispatchRequest* request,
                                                    gw::DispatchResponse* response) {
  auto* reactor = context->DefaultReactor();

  router::RouterRequest routed;
  try {
    routed = FromDispatchRequest(*request, codec_);
  } catch (const std::exception& e) {
    *response = FailedResponse(errors::FromException(e));
    reactor->Finish(::grpc::Status::OK);
    return reactor;
  }
  InheritDeadline(*context, routed);

  router_->Dispatch(std::move(routed), [reactor, response, codec = codec_](router::RouterResponse result) {
    *response = Render(result, codec);
    reactor->Finish(::grpc::Status::OK);
  });
  return reactor;
}

::grpc::ServerWriteReactor<gw::DispatchChunk>* GatewayServer::DispatchStream(::grpc::CallbackServerContext* context,
                                                                              const gw::DispatchRequest* request) {
  auto reactor = std::make_shared<DispatchStreamReactor>(codec_);

  router::RouterRequest routed;
  try {
    routed = FromDispatchRequest(*request, codec_);
  } catch (const std::exception& e) {
    reactor->StartFailed(errors::FromException(e));
    return reactor.get();
  }
  InheritDeadline(*context, routed);

  reactor->Start(*router_, std::move(routed));
  return reactor.get();
}

} // namespace taskgate::grpc
