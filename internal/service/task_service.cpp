#include "internal/service/task_service.hpp"

#include <algorithm>

#include "internal/db/api/task_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace taskgate::service {

using observability::StringField;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) return;

  const std::string message = context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::AlreadyExists:
    case db::ErrorCode::ConstraintViolation:
    case db::ErrorCode::InvalidQuery:
      throw util::InvalidArgument(message);
    case db::ErrorCode::Busy:
    case db::ErrorCode::Conflict:
    case db::ErrorCode::SerializationFailure:
    case db::ErrorCode::IOError:
      throw util::Unavailable(message, result.message);
    default:
      throw util::Internal(message, result.message);
  }
}

} // namespace

TaskService::TaskService(std::shared_ptr<db::TaskRepository> repository) : repository_(std::move(repository)) {
}

model::Task TaskService::Create(const model::NewTask& in) {
  observability::SpanScope span("tasks.create");

  model::Task task;
  task.id          = util::GenerateUUID();
  task.title       = in.title;
  task.description = in.description;
  task.completed   = in.completed;
  task.project_id  = in.project_id;
  task.priority    = in.priority == model::Priority::kUnspecified ? model::Priority::kMedium : in.priority;
  task.status      = in.status == model::Status::kUnspecified ? model::Status::kTodo : in.status;
  task.due_date    = in.due_date;
  task.created_at  = util::ToUnixSeconds(util::Now());
  task.updated_at  = task.created_at;

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertTask(*tx, task), "create task");
  tx->Commit();

  TASKGATE_LOG_DEBUG("task created", {StringField("id", util::ToString(task.id))});
  return task;
}

model::Task TaskService::GetById(const model::TaskId& id) {
  auto tx   = repository_->Begin();
  auto task = repository_->GetTask(*tx, id);
  tx->Commit();

  if (!task) {
    throw util::NotFound("task " + util::ToString(id) + " not found");
  }
  return *task;
}

model::Task TaskService::UpdateById(const model::Task& in) {
  observability::SpanScope span("tasks.update");

  auto tx      = repository_->Begin();
  auto current = repository_->GetTask(*tx, in.id);
  if (!current) {
    throw util::NotFound("task " + util::ToString(in.id) + " not found");
  }

  model::Task task = in;
  task.created_at  = current->created_at;
  task.updated_at  = std::max(util::ToUnixSeconds(util::Now()), current->created_at);

  ThrowIfDbError(repository_->UpdateTask(*tx, task), "update task");
  tx->Commit();
  return task;
}

void TaskService::DeleteById(const model::TaskId& id) {
  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->DeleteTask(*tx, id), "delete task " + util::ToString(id));
  tx->Commit();
}

std::vector<model::Task> TaskService::List(model::TaskFilter filter) {
  filter.limit = filter.limit == 0 ? kDefaultListLimit : std::min(filter.limit, kMaxListLimit);

  auto tx    = repository_->Begin();
  auto tasks = repository_->ListTasks(*tx, filter);
  tx->Commit();
  return tasks;
}

} // namespace taskgate::service
