#pragma once

#include <map>
#include <mutex>

#include "internal/db/api/task_repository.hpp"

namespace taskgate::db::memory {

class MemoryTransaction;

class MemoryTaskRepository final : public db::TaskRepository {
public:
  MemoryTaskRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertTask(Transaction&, const model::Task&) override;
  std::optional<model::Task> GetTask(Transaction&, const model::TaskId&) override;
  std::vector<model::Task> ListTasks(Transaction&, const model::TaskFilter&) override;
  Result UpdateTask(Transaction&, const model::Task&) override;
  Result DeleteTask(Transaction&, const model::TaskId&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<model::TaskId, model::Task> tasks;
  };

  std::mutex mutex_;
  State committed_;
};

}
