#pragma once

#include <memory>
#include <string>

#include "internal/codec/task_codec.hpp"
#include "internal/queue/memory_broker.hpp"
#include "internal/router/request.hpp"

namespace taskgate::client {
class TasksClient;
}

namespace taskgate::router {

struct EncodedJob {
  std::string job_id; // 16 raw bytes
  std::string bytes;  // serialized taskgate.jobs.v1.Job
};

// Serializes a task command for out-of-band execution. Throws
// util::InvalidArgument when the payload does not fit the operation.
EncodedJob EncodeTaskJob(const RouterRequest& request, const codec::TaskCodec& codec);

/*
  Worker-side handler for deferred task commands: decodes the Job and
  replays it against the task service. Throws on any failure so the worker
  can log it; nothing is reported back to the original caller.
*/
class TaskJobRunner {
 public:
  explicit TaskJobRunner(std::shared_ptr<client::TasksClient> tasks);

  void operator()(const queue::QueuedMessage& message) const;

 private:
  std::shared_ptr<client::TasksClient> tasks_;
};

} // namespace taskgate::router
