#pragma once

#include <memory>

#include "internal/db/api/datastore.hpp"
#include "internal/db/api/task_repository.hpp"

namespace taskgate::db::sql {

/*
  TaskRepository over any Datastore driver (SQLite or Postgres).

  Expects the tasks table from CREATE_TASKS_SQLITE / CREATE_TASKS_POSTGRES.
  Read failures surface as std::runtime_error; write failures as Result.
*/
class SqlTaskRepository final : public db::TaskRepository {
 public:
  explicit SqlTaskRepository(std::shared_ptr<Datastore> datastore);

  std::unique_ptr<Transaction> Begin() override;

  Result                     InsertTask(Transaction&, const model::Task&) override;
  std::optional<model::Task> GetTask(Transaction&, const model::TaskId&) override;
  std::vector<model::Task>   ListTasks(Transaction&, const model::TaskFilter&) override;
  Result                     UpdateTask(Transaction&, const model::Task&) override;
  Result                     DeleteTask(Transaction&, const model::TaskId&) override;

 private:
  std::shared_ptr<Datastore> datastore_;
};

} // namespace taskgate::db::sql
