#include "internal/router/task_events.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "taskgate/jobs/v1/jobs.pb.h"

namespace taskgate::router {

using observability::StringField;

TaskEventPublisher::TaskEventPublisher(std::shared_ptr<queue::QueuePublisher> queue, std::string subject, codec::TaskCodec codec)
    : queue_(std::move(queue)), subject_(std::move(subject)), codec_(std::move(codec)) {
}

void TaskEventPublisher::Publish(std::string_view type, const model::TaskId& id, const model::Task* task,
                                 const std::string& caller_id) const {
  const auto task_id = util::ToString(id);
  if (!queue_) {
    TASKGATE_LOG_WARN("task event dropped",
                      {StringField("subject", subject_), StringField("type", type), StringField("task_id", task_id), StringField("error", "no queue configured")});
    return;
  }

  taskgate::jobs::v1::TaskEvent event;
  event.set_type(std::string(type));
  event.set_task_id(util::ToBytes(id));
  event.set_caller_id(caller_id);
  event.set_occurred_at(util::ToUnixSeconds(util::Now()));

  try {
    if (task) {
      *event.mutable_task() = codec_.ToMessage(*task);
    }
  } catch (const util::TaskgateError& e) {
    TASKGATE_LOG_WARN("task event dropped",
                      {StringField("subject", subject_), StringField("type", type), StringField("task_id", task_id), StringField("error", e.what())});
    return;
  }

  queue_->Publish(subject_, event.SerializeAsString(), [subject = subject_, type = std::string(type), task_id](queue::PublishAck ack) {
    if (!ack.accepted) {
      TASKGATE_LOG_WARN("task event dropped",
                        {StringField("subject", subject), StringField("type", type), StringField("task_id", task_id), StringField("error", ack.reason)});
      return;
    }
    TASKGATE_LOG_DEBUG("task event published", {StringField("subject", subject), StringField("type", type), StringField("task_id", task_id)});
  });
}

void TaskEventLogger::operator()(const queue::QueuedMessage& message) const {
  taskgate::jobs::v1::TaskEvent event;
  if (!event.ParseFromString(message.payload) || event.task_id().size() != 16) {
    throw util::DecodingError("malformed task event on " + message.subject);
  }

  const auto& type = event.type();
  if (type != kTaskCreated && type != kTaskUpdated && type != kTaskDeleted) {
    TASKGATE_LOG_WARN("unknown task event, ignored", {StringField("subject", message.subject), StringField("type", type)});
    return;
  }

  TASKGATE_LOG_INFO("task event", {StringField("subject", message.subject), StringField("type", type),
                                   StringField("task_id", util::ToString(util::FromBytes(event.task_id()))),
                                   StringField("title", event.has_task() ? event.task().title() : std::string()),
                                   StringField("caller_id", event.caller_id())});
}

} // namespace taskgate::router
