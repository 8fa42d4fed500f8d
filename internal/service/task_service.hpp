#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "internal/model/task.hpp"

namespace taskgate::db {
class TaskRepository;
}

namespace taskgate::service {

/*
  Domain logic of the task service.

  Failures are thrown as util::TaskgateError subclasses: NotFound for a
  missing id, InvalidArgument for rejected writes, Unavailable for a busy
  or unreachable store, Internal for the rest.
*/
class TaskService {
 public:
  static constexpr std::uint32_t kDefaultListLimit = 50;
  static constexpr std::uint32_t kMaxListLimit     = 1000;

  explicit TaskService(std::shared_ptr<db::TaskRepository> repository);

  // Fresh v4 id, created_at = updated_at = now. Unspecified status and
  // priority become TODO and MEDIUM.
  model::Task Create(const model::NewTask& task);

  model::Task GetById(const model::TaskId& id);

  // Full snapshot replace. Keeps the stored id and created_at; concurrent
  // updates to one id resolve as last write wins.
  model::Task UpdateById(const model::Task& task);

  void DeleteById(const model::TaskId& id);

  // Ordered by created_at, then id.
  std::vector<model::Task> List(model::TaskFilter filter);

 private:
  std::shared_ptr<db::TaskRepository> repository_;
};

} // namespace taskgate::service
