#include "sql_task_repository.hpp"

#include <limits>
#include <stdexcept>
#include <string>

#include "internal/db/sql/sql_queries.hpp"

namespace taskgate::db::sql {

namespace {

Param IdParam(const model::TaskId& id) {
  return Blob{util::ToBytes(id)};
}

Param OptionalId(const std::optional<model::TaskId>& id) {
  if (!id) return nullptr;
  return IdParam(*id);
}

Param OptionalInt(const std::optional<int64_t>& v) {
  if (!v) return nullptr;
  return *v;
}

int64_t AsInt(const Value& v) {
  if (const auto* i = std::get_if<int64_t>(&v)) return *i;
  if (const auto* d = std::get_if<double>(&v)) return static_cast<int64_t>(*d);
  throw std::runtime_error("tasks row: expected integer column");
}

std::string AsText(const Value& v) {
  if (const auto* s = std::get_if<std::string>(&v)) return *s;
  if (std::holds_alternative<std::nullptr_t>(v)) return {};
  throw std::runtime_error("tasks row: expected text column");
}

model::TaskId AsId(const Value& v) {
  if (const auto* b = std::get_if<Blob>(&v)) return util::FromBytes(b->bytes);
  throw std::runtime_error("tasks row: expected blob id column");
}

model::Task FromRow(const std::vector<Value>& row) {
  if (row.size() != 10) throw std::runtime_error("tasks row: unexpected column count");

  model::Task task;
  task.id          = AsId(row[0]);
  task.title       = AsText(row[1]);
  task.description = AsText(row[2]);
  task.completed   = AsInt(row[3]) != 0;
  if (!std::holds_alternative<std::nullptr_t>(row[4])) task.project_id = AsId(row[4]);
  task.priority = static_cast<model::Priority>(AsInt(row[5]));
  task.status   = static_cast<model::Status>(AsInt(row[6]));
  if (!std::holds_alternative<std::nullptr_t>(row[7])) task.due_date = AsInt(row[7]);
  task.created_at = AsInt(row[8]);
  task.updated_at = AsInt(row[9]);
  return task;
}

void ThrowIfError(const Result& r, const char* what) {
  if (!r) throw std::runtime_error(std::string(what) + ": " + r.message);
}

} // namespace

SqlTaskRepository::SqlTaskRepository(std::shared_ptr<Datastore> datastore) : datastore_(std::move(datastore)) {
}

std::unique_ptr<Transaction> SqlTaskRepository::Begin() {
  return datastore_->Begin();
}

Result SqlTaskRepository::InsertTask(Transaction& tx, const model::Task& task) {
  Params params{IdParam(task.id),
                task.title,
                task.description,
                static_cast<int64_t>(task.completed ? 1 : 0),
                OptionalId(task.project_id),
                static_cast<int64_t>(task.priority),
                static_cast<int64_t>(task.status),
                OptionalInt(task.due_date),
                task.created_at,
                task.updated_at};
  ResultSet out;
  return datastore_->Execute(tx, INSERT_TASK, params, out);
}

std::optional<model::Task> SqlTaskRepository::GetTask(Transaction& tx, const model::TaskId& id) {
  ResultSet out;
  ThrowIfError(datastore_->Execute(tx, SELECT_TASK, {IdParam(id)}, out), "select task");
  if (out.rows.empty()) return std::nullopt;
  return FromRow(out.rows.front());
}

std::vector<model::Task> SqlTaskRepository::ListTasks(Transaction& tx, const model::TaskFilter& filter) {
  std::string query = std::string("SELECT ") + TASK_COLUMNS + " FROM tasks WHERE 1=1";
  Params      params;

  if (filter.project_id) {
    query += " AND project_id=?";
    params.push_back(IdParam(*filter.project_id));
  }
  if (filter.status) {
    query += " AND status=?";
    params.push_back(static_cast<int64_t>(*filter.status));
  }
  if (filter.priority) {
    query += " AND priority=?";
    params.push_back(static_cast<int64_t>(*filter.priority));
  }
  if (filter.completed) {
    query += " AND completed=?";
    params.push_back(static_cast<int64_t>(*filter.completed ? 1 : 0));
  }
  query += " ORDER BY created_at, id";
  if (filter.limit > 0 || filter.offset > 0) {
    // sqlite only accepts OFFSET after a LIMIT
    query += " LIMIT ?";
    params.push_back(filter.limit > 0 ? static_cast<int64_t>(filter.limit) : std::numeric_limits<int64_t>::max());
  }
  if (filter.offset > 0) {
    query += " OFFSET ?";
    params.push_back(static_cast<int64_t>(filter.offset));
  }
  query += ";";

  ResultSet out;
  ThrowIfError(datastore_->Execute(tx, query, params, out), "list tasks");

  std::vector<model::Task> tasks;
  tasks.reserve(out.rows.size());
  for (const auto& row : out.rows) tasks.push_back(FromRow(row));
  return tasks;
}

Result SqlTaskRepository::UpdateTask(Transaction& tx, const model::Task& task) {
  Params params{task.title,
                task.description,
                static_cast<int64_t>(task.completed ? 1 : 0),
                OptionalId(task.project_id),
                static_cast<int64_t>(task.priority),
                static_cast<int64_t>(task.status),
                OptionalInt(task.due_date),
                task.updated_at,
                IdParam(task.id)};
  ResultSet out;
  auto      r = datastore_->Execute(tx, UPDATE_TASK, params, out);
  if (!r) return r;
  if (out.affected_rows == 0) return Result::Err(ErrorCode::NotFound, "task not found");
  return Result::Ok();
}

Result SqlTaskRepository::DeleteTask(Transaction& tx, const model::TaskId& id) {
  ResultSet out;
  auto      r = datastore_->Execute(tx, DELETE_TASK, {IdParam(id)}, out);
  if (!r) return r;
  if (out.affected_rows == 0) return Result::Err(ErrorCode::NotFound, "task not found");
  return Result::Ok();
}

} // namespace taskgate::db::sql
