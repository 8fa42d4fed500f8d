#include "client/cpp/tasks_client.h"

#include <condition_variable>
#include <mutex>
#include <string_view>
#include <utility>

#include <grpcpp/client_context.h>
#include <grpcpp/support/client_callback.h>

#include "internal/grpc/grpc_error.hpp"
#include "taskgate/tasks/v1/tasks.grpc.pb.h"

namespace taskgate::client {

namespace pb = taskgate::tasks::v1;

using util::ErrorKind;

namespace {

arrow::StatusCode ArrowCode(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNotFound:
      return arrow::StatusCode::KeyError;
    case ErrorKind::kEncoding:
    case ErrorKind::kInvalidArgument:
      return arrow::StatusCode::Invalid;
    case ErrorKind::kTransport:
    case ErrorKind::kUnavailable:
    case ErrorKind::kDeadlineExceeded:
      return arrow::StatusCode::IOError;
    default:
      return arrow::StatusCode::UnknownError;
  }
}

arrow::Status FromGrpc(std::string_view method, const ::grpc::Status& status) {
  if (status.ok()) {
    return arrow::Status::OK();
  }
  if (status.error_code() == ::grpc::StatusCode::CANCELLED) {
    return arrow::Status(arrow::StatusCode::Cancelled, std::string(method) + " cancelled",
                         std::make_shared<TaskStatusDetail>(ErrorKind::kInternal, "grpc status 1: " + status.error_message()));
  }
  return MakeTaskStatus(taskgate::grpc::KindFromStatus(status), std::string(method) + " failed: " + status.error_message(),
                        "grpc status " + std::to_string(status.error_code()) + ": " + status.error_message());
}

arrow::Status Cancelled(std::string_view method) {
  return arrow::Status(arrow::StatusCode::Cancelled, std::string(method) + " cancelled",
                       std::make_shared<TaskStatusDetail>(ErrorKind::kInternal, "cancelled by caller"));
}

// Failures raised before anything was sent.
arrow::Status FromLocalError(std::string_view method, const util::TaskgateError& e) {
  const auto kind = e.Kind() == ErrorKind::kEncoding ? ErrorKind::kInvalidArgument : e.Kind();
  return MakeTaskStatus(kind, std::string(method) + ": " + e.what(), e.Cause().empty() ? std::string(e.what()) : e.Cause());
}

// A peer that sends records the codec cannot read is a server fault.
arrow::Status FromDecodeError(std::string_view method, const std::exception& e) {
  return MakeTaskStatus(ErrorKind::kInternal, std::string(method) + ": malformed response", e.what());
}

void PrepareContext(::grpc::ClientContext& context, const transport::ChannelOptions& pool_options, const CallOptions& options,
                    bool compress_by_default) {
  const auto deadline = options.deadline.value_or(pool_options.default_deadline);
  context.set_deadline(std::chrono::system_clock::now() + deadline);

  const bool compress = options.compress.value_or(compress_by_default && pool_options.compress_list_responses);
  if (compress) {
    context.AddMetadata(transport::kResponseCompressionKey, "gzip");
  }
}

template <typename Request, typename Response>
struct UnaryCall {
  ::grpc::ClientContext                   context;
  Request                                 request;
  Response                                response;
  transport::ChannelHandle                handle;
  std::unique_ptr<pb::TasksService::Stub> stub;
  transport::CancelRegistration           cancel;
};

/*
  Shared unary path: acquire, prepare, start, report to the pool, finish.
  `finish` receives the call status and the response message.
*/
template <typename Request, typename Response, typename StartFn, typename FinishFn>
void StartUnary(const std::shared_ptr<transport::ChannelPool>& pool, std::string_view method, Request request, const CallOptions& options,
                StartFn start, FinishFn finish) {
  auto call     = std::make_shared<UnaryCall<Request, Response>>();
  call->request = std::move(request);

  if (options.cancel.IsCancelled()) {
    finish(Cancelled(method), call->response);
    return;
  }

  try {
    call->handle = pool->Acquire();
  } catch (const util::TaskgateError& e) {
    finish(FromLocalError(method, e), call->response);
    return;
  }

  call->stub = pb::TasksService::NewStub(call->handle->channel);
  PrepareContext(call->context, pool->Options(), options, /*compress_by_default=*/false);

  std::weak_ptr<UnaryCall<Request, Response>> weak_call = call;
  call->cancel = options.cancel.OnCancel([weak_call] {
    if (auto c = weak_call.lock()) {
      c->context.TryCancel();
    }
  });

  auto* async = call->stub->async();
  start(async, &call->context, &call->request, &call->response,
        [call, pool, method = std::string(method), finish = std::move(finish)](::grpc::Status status) mutable {
          call->cancel.Reset();
          pool->ReportResult(*call->handle, status);
          call->handle.reset();
          finish(FromGrpc(method, status), call->response);
        });
}

template <typename T, typename Invoke>
std::future<T> ToFuture(Invoke invoke) {
  auto promise = std::make_shared<std::promise<T>>();
  auto future  = promise->get_future();
  invoke([promise](T value) { promise->set_value(std::move(value)); });
  return future;
}

} // namespace

std::string TaskStatusDetail::ToString() const {
  std::string out(util::ErrorKindName(kind_));
  if (!cause_.empty()) {
    out += " (" + cause_ + ")";
  }
  return out;
}

ErrorKind ErrorKindOf(const arrow::Status& status) {
  const auto& detail = status.detail();
  if (detail && std::string_view(detail->type_id()) == TaskStatusDetail::kTypeId) {
    return static_cast<const TaskStatusDetail&>(*detail).kind();
  }
  return ErrorKind::kInternal;
}

std::string ErrorCauseOf(const arrow::Status& status) {
  const auto& detail = status.detail();
  if (detail && std::string_view(detail->type_id()) == TaskStatusDetail::kTypeId) {
    return static_cast<const TaskStatusDetail&>(*detail).cause();
  }
  return {};
}

arrow::Status MakeTaskStatus(ErrorKind kind, const std::string& message, std::string cause) {
  return arrow::Status(ArrowCode(kind), message, std::make_shared<TaskStatusDetail>(kind, std::move(cause)));
}

TasksClient::TasksClient(std::shared_ptr<transport::ChannelPool> pool, codec::TaskCodec codec)
    : pool_(std::move(pool)), codec_(std::move(codec)) {
}

void TasksClient::Create(const model::NewTask& task, const CallOptions& options, ResultCallback<model::Task> done) const {
  pb::CreateRequest request;
  try {
    request = codec_.ToMessage(task);
  } catch (const util::TaskgateError& e) {
    done(FromLocalError("Create", e));
    return;
  }

  StartUnary<pb::CreateRequest, pb::Task>(
      pool_, "Create", std::move(request), options,
      [](auto* async, auto* context, auto* req, auto* resp, auto cb) { async->Create(context, req, resp, std::move(cb)); },
      [codec = codec_, done = std::move(done)](arrow::Status status, const pb::Task& response) {
        if (!status.ok()) {
          done(std::move(status));
          return;
        }
        try {
          done(codec.FromMessage(response));
        } catch (const std::exception& e) {
          done(FromDecodeError("Create", e));
        }
      });
}

std::future<arrow::Result<model::Task>> TasksClient::Create(const model::NewTask& task, const CallOptions& options) const {
  return ToFuture<arrow::Result<model::Task>>([&](auto cb) { Create(task, options, std::move(cb)); });
}

void TasksClient::GetById(const model::TaskId& id, const CallOptions& options, ResultCallback<model::Task> done) const {
  pb::GetByIdRequest request;
  request.set_id(util::ToBytes(id));

  StartUnary<pb::GetByIdRequest, pb::Task>(
      pool_, "GetById", std::move(request), options,
      [](auto* async, auto* context, auto* req, auto* resp, auto cb) { async->GetById(context, req, resp, std::move(cb)); },
      [codec = codec_, done = std::move(done)](arrow::Status status, const pb::Task& response) {
        if (!status.ok()) {
          done(std::move(status));
          return;
        }
        try {
          done(codec.FromMessage(response));
        } catch (const std::exception& e) {
          done(FromDecodeError("GetById", e));
        }
      });
}

std::future<arrow::Result<model::Task>> TasksClient::GetById(const model::TaskId& id, const CallOptions& options) const {
  return ToFuture<arrow::Result<model::Task>>([&](auto cb) { GetById(id, options, std::move(cb)); });
}

void TasksClient::UpdateById(const model::Task& task, const CallOptions& options, ResultCallback<model::Task> done) const {
  pb::UpdateByIdRequest request;
  try {
    *request.mutable_task() = codec_.ToMessage(task);
  } catch (const util::TaskgateError& e) {
    done(FromLocalError("UpdateById", e));
    return;
  }

  StartUnary<pb::UpdateByIdRequest, pb::Task>(
      pool_, "UpdateById", std::move(request), options,
      [](auto* async, auto* context, auto* req, auto* resp, auto cb) { async->UpdateById(context, req, resp, std::move(cb)); },
      [codec = codec_, done = std::move(done)](arrow::Status status, const pb::Task& response) {
        if (!status.ok()) {
          done(std::move(status));
          return;
        }
        try {
          done(codec.FromMessage(response));
        } catch (const std::exception& e) {
          done(FromDecodeError("UpdateById", e));
        }
      });
}

std::future<arrow::Result<model::Task>> TasksClient::UpdateById(const model::Task& task, const CallOptions& options) const {
  return ToFuture<arrow::Result<model::Task>>([&](auto cb) { UpdateById(task, options, std::move(cb)); });
}

void TasksClient::DeleteById(const model::TaskId& id, const CallOptions& options, StatusCallback done) const {
  pb::DeleteByIdRequest request;
  request.set_id(util::ToBytes(id));

  StartUnary<pb::DeleteByIdRequest, pb::DeleteByIdResponse>(
      pool_, "DeleteById", std::move(request), options,
      [](auto* async, auto* context, auto* req, auto* resp, auto cb) { async->DeleteById(context, req, resp, std::move(cb)); },
      [done = std::move(done)](arrow::Status status, const pb::DeleteByIdResponse&) { done(std::move(status)); });
}

std::future<arrow::Status> TasksClient::DeleteById(const model::TaskId& id, const CallOptions& options) const {
  return ToFuture<arrow::Status>([&](auto cb) { DeleteById(id, options, std::move(cb)); });
}

void TasksClient::List(const model::TaskFilter& filter, const CallOptions& options, ResultCallback<std::vector<model::Task>> done) const {
  pb::ListRequest request;
  try {
    request = codec_.ToMessage(filter);
  } catch (const util::TaskgateError& e) {
    done(FromLocalError("List", e));
    return;
  }

  CallOptions effective = options;
  if (!effective.compress) {
    effective.compress = pool_->Options().compress_list_responses;
  }

  StartUnary<pb::ListRequest, pb::ListResponse>(
      pool_, "List", std::move(request), effective,
      [](auto* async, auto* context, auto* req, auto* resp, auto cb) { async->List(context, req, resp, std::move(cb)); },
      [codec = codec_, done = std::move(done)](arrow::Status status, const pb::ListResponse& response) {
        if (!status.ok()) {
          done(std::move(status));
          return;
        }
        std::vector<model::Task> tasks;
        tasks.reserve(static_cast<std::size_t>(response.tasks_size()));
        try {
          for (const auto& task : response.tasks()) {
            tasks.push_back(codec.FromMessage(task));
          }
        } catch (const std::exception& e) {
          done(FromDecodeError("List", e));
          return;
        }
        done(std::move(tasks));
      });
}

std::future<arrow::Result<std::vector<model::Task>>> TasksClient::List(const model::TaskFilter& filter, const CallOptions& options) const {
  return ToFuture<arrow::Result<std::vector<model::Task>>>([&](auto cb) { List(filter, options, std::move(cb)); });
}

// ---------------------------------------------------------------------------
// ListStream, push form
// ---------------------------------------------------------------------------

namespace {

class ListPushReactor : public ::grpc::ClientReadReactor<pb::Task>, public std::enable_shared_from_this<ListPushReactor> {
 public:
  ListPushReactor(std::shared_ptr<transport::ChannelPool> pool, codec::TaskCodec codec, TaskSink on_item, StatusCallback done)
      : pool_(std::move(pool)), codec_(std::move(codec)), on_item_(std::move(on_item)), done_(std::move(done)) {
  }

  void Start(pb::ListRequest request, const CallOptions& options) {
    request_ = std::move(request);
    try {
      handle_ = pool_->Acquire();
    } catch (const util::TaskgateError& e) {
      done_(FromLocalError("ListStream", e));
      return;
    }
    stub_ = pb::TasksService::NewStub(handle_->channel);
    PrepareContext(context_, pool_->Options(), options, /*compress_by_default=*/true);

    self_ = shared_from_this();
    std::weak_ptr<ListPushReactor> weak = self_;

    stub_->async()->ListStream(&context_, &request_, this);
    // registered before StartCall: OnDone may run on a gRPC thread as soon as the call starts
    cancel_ = options.cancel.OnCancel([weak] {
      if (auto r = weak.lock()) {
        r->context_.TryCancel();
      }
    });
    StartRead(&current_);
    StartCall();
  }

  void OnReadDone(bool ok) override {
    if (!ok) {
      return;
    }
    model::Task task;
    try {
      task = codec_.FromMessage(current_);
    } catch (const std::exception& e) {
      failure_ = FromDecodeError("ListStream", e);
      context_.TryCancel();
      return;
    }
    if (!on_item_(std::move(task))) {
      stopped_ = true;
      context_.TryCancel();
      return;
    }
    StartRead(&current_);
  }

  void OnDone(const ::grpc::Status& status) override {
    auto self = std::move(self_);
    cancel_.Reset();
    pool_->ReportResult(*handle_, status);
    // released before `done` runs so callers observe the pool settled
    handle_.reset();

    arrow::Status result;
    if (failure_) {
      result = std::move(*failure_);
    } else if (!stopped_) {
      result = status.error_code() == ::grpc::StatusCode::CANCELLED ? Cancelled("ListStream") : FromGrpc("ListStream", status);
    }
    done_(std::move(result));
  }

 private:
  std::shared_ptr<transport::ChannelPool> pool_;
  codec::TaskCodec                        codec_;
  TaskSink                                on_item_;
  StatusCallback                          done_;

  ::grpc::ClientContext                   context_;
  pb::ListRequest                         request_;
  pb::Task                                current_;
  transport::ChannelHandle                handle_;
  std::unique_ptr<pb::TasksService::Stub> stub_;
  transport::CancelRegistration           cancel_;

  std::optional<arrow::Status>     failure_;
  bool                             stopped_ = false;
  std::shared_ptr<ListPushReactor> self_;
};

} // namespace

void TasksClient::ListStream(const model::TaskFilter& filter, const CallOptions& options, TaskSink on_item, StatusCallback done) const {
  pb::ListRequest request;
  try {
    request = codec_.ToMessage(filter);
  } catch (const util::TaskgateError& e) {
    done(FromLocalError("ListStream", e));
    return;
  }
  if (options.cancel.IsCancelled()) {
    done(Cancelled("ListStream"));
    return;
  }

  auto reactor = std::make_shared<ListPushReactor>(pool_, codec_, std::move(on_item), std::move(done));
  reactor->Start(std::move(request), options);
}

// ---------------------------------------------------------------------------
// ListStream, pull form
// ---------------------------------------------------------------------------

/*
  One read is outstanding at a time; the next StartRead is issued from Next().
  A hold keeps the call open while the consumer owns the last record.
*/
class TaskStream::Reactor : public ::grpc::ClientReadReactor<pb::Task>, public std::enable_shared_from_this<TaskStream::Reactor> {
 public:
  Reactor(std::shared_ptr<transport::ChannelPool> pool, codec::TaskCodec codec) : pool_(std::move(pool)), codec_(std::move(codec)) {
  }

  // Next() reports the failure when the call could not be started.
  void Start(pb::ListRequest request, const CallOptions& options) {
    request_ = std::move(request);
    if (options.cancel.IsCancelled()) {
      Fail(Cancelled("ListStream"));
      return;
    }
    try {
      handle_ = pool_->Acquire();
    } catch (const util::TaskgateError& e) {
      Fail(FromLocalError("ListStream", e));
      return;
    }
    stub_ = pb::TasksService::NewStub(handle_->channel);
    PrepareContext(context_, pool_->Options(), options, /*compress_by_default=*/true);

    self_ = shared_from_this();
    std::weak_ptr<Reactor> weak = self_;

    stub_->async()->ListStream(&context_, &request_, this);
    {
      std::lock_guard lock(mutex_);
      reading_ = true;
    }
    StartRead(&current_);
    AddHold();
    // reading_ is set, so an early Cancel() leaves the hold to OnReadDone
    cancel_ = options.cancel.OnCancel([weak] {
      if (auto r = weak.lock()) {
        r->Cancel();
      }
    });
    StartCall();
  }

  // Completes the stream without starting a call.
  void Fail(arrow::Status status) {
    {
      std::lock_guard lock(mutex_);
      failure_  = std::move(status);
      finished_ = true;
    }
    cv_.notify_all();
  }

  arrow::Result<std::optional<model::Task>> Next() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return pending_.has_value() || finished_; });

    if (pending_ && !cancelled_) {
      auto task = std::move(*pending_);
      pending_.reset();
      reading_ = true;
      lock.unlock();
      StartRead(&current_);
      return std::optional<model::Task>(std::move(task));
    }

    cv_.wait(lock, [this] { return finished_; });
    if (failure_) {
      return *failure_;
    }
    return std::optional<model::Task>();
  }

  void Cancel() {
    bool release_hold = false;
    {
      std::lock_guard lock(mutex_);
      if (finished_ || cancelled_) {
        return;
      }
      cancelled_ = true;
      if (!failure_) {
        failure_ = Cancelled("ListStream");
      }
      // no read outstanding: the hold is all that keeps the call open
      if (!reading_ && !hold_released_) {
        pending_.reset();
        hold_released_ = true;
        release_hold   = true;
      }
    }
    context_.TryCancel();
    if (release_hold) {
      RemoveHold();
    }
  }

  void OnReadDone(bool ok) override {
    bool release_hold = false;
    bool malformed    = false;
    {
      std::lock_guard lock(mutex_);
      reading_ = false;
      if (!ok || cancelled_) {
        release_hold   = !hold_released_;
        hold_released_ = true;
      } else {
        try {
          pending_ = codec_.FromMessage(current_);
        } catch (const std::exception& e) {
          failure_       = FromDecodeError("ListStream", e);
          cancelled_     = true;
          malformed      = true;
          release_hold   = !hold_released_;
          hold_released_ = true;
        }
      }
    }
    cv_.notify_all();
    if (malformed) {
      context_.TryCancel();
    }
    if (release_hold) {
      RemoveHold();
    }
  }

  void OnDone(const ::grpc::Status& status) override {
    auto self = std::move(self_);
    cancel_.Reset();
    pool_->ReportResult(*handle_, status);
    handle_.reset();

    {
      std::lock_guard lock(mutex_);
      if (!failure_ && !status.ok()) {
        failure_ = FromGrpc("ListStream", status);
      }
      pending_.reset();
      finished_ = true;
    }
    cv_.notify_all();
  }

 private:
  std::shared_ptr<transport::ChannelPool> pool_;
  codec::TaskCodec                        codec_;

  ::grpc::ClientContext                   context_;
  pb::ListRequest                         request_;
  pb::Task                                current_;
  transport::ChannelHandle                handle_;
  std::unique_ptr<pb::TasksService::Stub> stub_;
  transport::CancelRegistration           cancel_;

  std::mutex                   mutex_;
  std::condition_variable      cv_;
  std::optional<model::Task>   pending_;
  std::optional<arrow::Status> failure_;
  bool                         reading_       = false;
  bool                         cancelled_     = false;
  bool                         hold_released_ = false;
  bool                         finished_      = false;

  std::shared_ptr<Reactor> self_;
};

TaskStream::TaskStream(std::shared_ptr<Reactor> reactor) : reactor_(std::move(reactor)) {
}

// The reactor owns itself until OnDone, so the call may finish after this.
TaskStream::~TaskStream() {
  Cancel();
}

arrow::Result<std::optional<model::Task>> TaskStream::Next() {
  return reactor_->Next();
}

void TaskStream::Cancel() {
  reactor_->Cancel();
}

std::unique_ptr<TaskStream> TasksClient::ListStream(const model::TaskFilter& filter, const CallOptions& options) const {
  auto reactor = std::make_shared<TaskStream::Reactor>(pool_, codec_);

  pb::ListRequest request;
  try {
    request = codec_.ToMessage(filter);
  } catch (const util::TaskgateError& e) {
    reactor->Fail(FromLocalError("ListStream", e));
    return std::make_unique<TaskStream>(std::move(reactor));
  }
  reactor->Start(std::move(request), options);
  return std::make_unique<TaskStream>(std::move(reactor));
}

} // namespace taskgate::client
