#include "internal/router/deferred_jobs.hpp"

#include "client/cpp/tasks_client.h"
#include "internal/errors/error_unifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "taskgate/jobs/v1/jobs.pb.h"

namespace taskgate::router {

namespace pb = taskgate::tasks::v1;

using observability::StringField;

namespace {

template <typename T>
const T& ExpectPayload(const RouterRequest& request, const char* what) {
  if (const auto* value = std::get_if<T>(&request.payload)) {
    return *value;
  }
  throw util::InvalidArgument("deferred " + std::string(OperationName(request.operation)) + " expects a " + what + " payload");
}

void ThrowIfFailed(const arrow::Status& status) {
  if (status.ok()) return;
  const auto error = errors::FromArrowStatus(status);
  throw util::TaskgateError(error.kind, error.message, error.cause);
}

} // namespace

EncodedJob EncodeTaskJob(const RouterRequest& request, const codec::TaskCodec& codec) {
  taskgate::jobs::v1::Job job;

  switch (request.operation) {
    case Operation::kCreate:
      job.set_payload(codec.ToMessage(ExpectPayload<model::NewTask>(request, "new task")).SerializeAsString());
      break;
    case Operation::kUpdate:
      job.set_payload(codec.Encode(ExpectPayload<model::Task>(request, "task")));
      break;
    case Operation::kGet:
    case Operation::kDelete:
      job.set_payload(util::ToBytes(ExpectPayload<model::TaskId>(request, "task id")));
      break;
    case Operation::kList: {
      model::TaskFilter filter;
      if (const auto* f = std::get_if<model::TaskFilter>(&request.payload)) {
        filter = *f;
      } else if (!std::holds_alternative<std::monostate>(request.payload)) {
        throw util::InvalidArgument("deferred list expects a filter payload");
      }
      job.set_payload(codec.ToMessage(filter).SerializeAsString());
      break;
    }
    default:
      throw util::UnroutableRequest(std::string(OperationName(request.operation)) + " cannot be deferred");
  }

  EncodedJob out;
  out.job_id = util::ToBytes(util::GenerateUUID());
  job.set_job_id(out.job_id);
  job.set_operation(std::string(OperationName(request.operation)));
  job.set_target_domain(request.target_domain);
  job.set_caller_id(request.caller.caller_id);
  job.set_enqueued_at(util::ToUnixSeconds(util::Now()));
  out.bytes = job.SerializeAsString();
  return out;
}

TaskJobRunner::TaskJobRunner(std::shared_ptr<client::TasksClient> tasks) : tasks_(std::move(tasks)) {
}

void TaskJobRunner::operator()(const queue::QueuedMessage& message) const {
  taskgate::jobs::v1::Job job;
  if (!job.ParseFromString(message.payload)) {
    throw util::DecodingError("malformed job on " + message.subject);
  }

  const auto& codec = tasks_->Codec();
  const auto& op    = job.operation();

  if (op == OperationName(Operation::kCreate)) {
    pb::CreateRequest request;
    if (!request.ParseFromString(job.payload())) throw util::DecodingError("malformed create job");
    ThrowIfFailed(tasks_->Create(codec.FromMessage(request)).get().status());
  } else if (op == OperationName(Operation::kUpdate)) {
    ThrowIfFailed(tasks_->UpdateById(codec.Decode(job.payload())).get().status());
  } else if (op == OperationName(Operation::kGet)) {
    ThrowIfFailed(tasks_->GetById(util::FromBytes(job.payload())).get().status());
  } else if (op == OperationName(Operation::kDelete)) {
    ThrowIfFailed(tasks_->DeleteById(util::FromBytes(job.payload())).get());
  } else if (op == OperationName(Operation::kList)) {
    pb::ListRequest request;
    if (!request.ParseFromString(job.payload())) throw util::DecodingError("malformed list job");
    ThrowIfFailed(tasks_->List(codec.FromMessage(request)).get().status());
  } else {
    throw util::InvalidArgument("unknown job operation '" + op + "'");
  }

  TASKGATE_LOG_DEBUG("job done", {StringField("subject", message.subject), StringField("operation", op),
                                  StringField("job_id", util::ToString(util::FromBytes(job.job_id())))});
}

} // namespace taskgate::router
