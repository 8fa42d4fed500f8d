#pragma once

#include <arrow/result.h>
#include <arrow/status.h>

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/codec/task_codec.hpp"
#include "internal/model/task.hpp"
#include "internal/transport/cancellation.hpp"
#include "internal/transport/channel_pool.hpp"
#include "internal/util/errors.hpp"

namespace taskgate::client {

/*
  Attached to every non-OK arrow::Status produced by TasksClient.

  kind() is one of NotFound, InvalidArgument, Unavailable, DeadlineExceeded,
  TransportError (no channel could be acquired) or Internal. cause() holds the
  raw transport text and is supplementary only.
*/
class TaskStatusDetail : public arrow::StatusDetail {
 public:
  static constexpr const char* kTypeId = "taskgate::client::TaskStatusDetail";

  TaskStatusDetail(util::ErrorKind kind, std::string cause) : kind_(kind), cause_(std::move(cause)) {
  }

  const char* type_id() const override {
    return kTypeId;
  }

  std::string ToString() const override;

  util::ErrorKind kind() const {
    return kind_;
  }

  const std::string& cause() const {
    return cause_;
  }

 private:
  util::ErrorKind kind_;
  std::string     cause_;
};

// Internal when the status carries no TaskStatusDetail.
util::ErrorKind ErrorKindOf(const arrow::Status& status);
std::string     ErrorCauseOf(const arrow::Status& status);

arrow::Status MakeTaskStatus(util::ErrorKind kind, const std::string& message, std::string cause = {});

struct CallOptions {
  // Falls back to the pool's default deadline.
  std::optional<std::chrono::milliseconds> deadline;
  transport::CancelToken                   cancel;
  // Response compression. Unset means on for List/ListStream (when the pool
  // allows it) and off for single-record calls.
  std::optional<bool> compress;
};

template <typename T>
using ResultCallback = std::function<void(arrow::Result<T>)>;
using StatusCallback = std::function<void(arrow::Status)>;

// Return false to stop the stream; no further items are delivered.
using TaskSink = std::function<bool(model::Task)>;

/*
  Pull view over a ListStream call. Records arrive in server order and the
  next one is only requested from the wire once the previous was taken.
*/
class TaskStream {
 public:
  class Reactor;

  explicit TaskStream(std::shared_ptr<Reactor> reactor);
  ~TaskStream();

  TaskStream(const TaskStream&)            = delete;
  TaskStream& operator=(const TaskStream&) = delete;

  // nullopt at the end of the stream. Blocks the calling thread.
  arrow::Result<std::optional<model::Task>> Next();

  // Stops delivery and releases the pooled handle once the call unwinds.
  void Cancel();

 private:
  std::shared_ptr<Reactor> reactor_;
};

/*
  TasksClient

  Typed client for taskgate.tasks.v1.TasksService. Every call acquires a
  shared handle from the pool, so any number of callers may use one client
  concurrently without waiting on each other. Calls are never retried.

  Callback overloads complete on a gRPC thread; future overloads wrap them.
*/
class TasksClient {
 public:
  explicit TasksClient(std::shared_ptr<transport::ChannelPool> pool, codec::TaskCodec codec = codec::TaskCodec());

  void Create(const model::NewTask& task, const CallOptions& options, ResultCallback<model::Task> done) const;
  std::future<arrow::Result<model::Task>> Create(const model::NewTask& task, const CallOptions& options = {}) const;

  void GetById(const model::TaskId& id, const CallOptions& options, ResultCallback<model::Task> done) const;
  std::future<arrow::Result<model::Task>> GetById(const model::TaskId& id, const CallOptions& options = {}) const;

  void UpdateById(const model::Task& task, const CallOptions& options, ResultCallback<model::Task> done) const;
  std::future<arrow::Result<model::Task>> UpdateById(const model::Task& task, const CallOptions& options = {}) const;

  void DeleteById(const model::TaskId& id, const CallOptions& options, StatusCallback done) const;
  std::future<arrow::Status> DeleteById(const model::TaskId& id, const CallOptions& options = {}) const;

  void List(const model::TaskFilter& filter, const CallOptions& options, ResultCallback<std::vector<model::Task>> done) const;
  std::future<arrow::Result<std::vector<model::Task>>> List(const model::TaskFilter& filter, const CallOptions& options = {}) const;

  void ListStream(const model::TaskFilter& filter, const CallOptions& options, TaskSink on_item, StatusCallback done) const;
  std::unique_ptr<TaskStream> ListStream(const model::TaskFilter& filter, const CallOptions& options = {}) const;

  const std::shared_ptr<transport::ChannelPool>& Pool() const {
    return pool_;
  }

  const codec::TaskCodec& Codec() const {
    return codec_;
  }

 private:
  std::shared_ptr<transport::ChannelPool> pool_;
  codec::TaskCodec                        codec_;
};

} // namespace taskgate::client
