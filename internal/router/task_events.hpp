#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "internal/codec/task_codec.hpp"
#include "internal/model/task.hpp"
#include "internal/queue/memory_broker.hpp"
#include "internal/queue/queue_publisher.hpp"

namespace taskgate::router {

inline constexpr std::string_view kTaskCreated = "task.created";
inline constexpr std::string_view kTaskUpdated = "task.updated";
inline constexpr std::string_view kTaskDeleted = "task.deleted";

/*
  Announces successful task mutations on an RPC route's events subject.

  Fire and forget: the ack, a missing queue and encoding problems only
  produce a log line. The mutation's response never depends on them.
*/
class TaskEventPublisher {
 public:
  TaskEventPublisher(std::shared_ptr<queue::QueuePublisher> queue, std::string subject, codec::TaskCodec codec);

  // `task` is null for task.deleted.
  void Publish(std::string_view type, const model::TaskId& id, const model::Task* task, const std::string& caller_id) const;

  const std::string& Subject() const {
    return subject_;
  }

 private:
  std::shared_ptr<queue::QueuePublisher> queue_;
  std::string                            subject_;
  codec::TaskCodec                       codec_;
};

// Worker-side consumer: decodes a taskgate.jobs.v1.TaskEvent and logs it.
// Throws util::DecodingError on a malformed event.
class TaskEventLogger {
 public:
  void operator()(const queue::QueuedMessage& message) const;
};

} // namespace taskgate::router
