#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/model/task.hpp"

namespace taskgate::db {

/*
  Task repository abstraction.

  - All access goes through a Transaction
  - Reads inside a transaction see its writes
  - ListTasks orders by created_at then id and applies the filter's
    limit/offset verbatim (callers resolve defaults)
*/

class TaskRepository {
 public:
  virtual ~TaskRepository() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual Result InsertTask(Transaction&, const model::Task&) = 0;

  virtual std::optional<model::Task> GetTask(Transaction&, const model::TaskId& id) = 0;

  virtual std::vector<model::Task> ListTasks(Transaction&, const model::TaskFilter& filter) = 0;

  // NotFound when no row carries task.id
  virtual Result UpdateTask(Transaction&, const model::Task& task) = 0;

  virtual Result DeleteTask(Transaction&, const model::TaskId& id) = 0;
};

} // namespace taskgate::db
