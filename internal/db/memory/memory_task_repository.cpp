#include "memory_task_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace taskgate::db::memory {

namespace {

bool Matches(const model::Task& task, const model::TaskFilter& filter) {
  if (filter.project_id && task.project_id != filter.project_id) return false;
  if (filter.status && task.status != *filter.status) return false;
  if (filter.priority && task.priority != *filter.priority) return false;
  if (filter.completed && task.completed != *filter.completed) return false;
  return true;
}

} // namespace

MemoryTaskRepository::MemoryTaskRepository() = default;

std::unique_ptr<db::Transaction> MemoryTaskRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryTaskRepository::InsertTask(Transaction& t, const model::Task& task) {
  auto& s = TX(t).Mutable();
  if (s.tasks.contains(task.id)) return Result::Err(ErrorCode::AlreadyExists, "task already exists");
  s.tasks[task.id] = task;
  return Result::Ok();
}

std::optional<model::Task> MemoryTaskRepository::GetTask(Transaction& t, const model::TaskId& id) {
  const auto& s  = TX(t).View();
  auto        it = s.tasks.find(id);
  if (it == s.tasks.end()) return std::nullopt;
  return it->second;
}

std::vector<model::Task> MemoryTaskRepository::ListTasks(Transaction& t, const model::TaskFilter& filter) {
  const auto& s = TX(t).View();

  std::vector<model::Task> matched;
  for (const auto& [_, task] : s.tasks) {
    if (Matches(task, filter)) matched.push_back(task);
  }
  std::sort(matched.begin(), matched.end(), [](const model::Task& a, const model::Task& b) {
    if (a.created_at != b.created_at) return a.created_at < b.created_at;
    return a.id < b.id;
  });

  if (filter.offset >= matched.size()) return {};
  auto first = matched.begin() + filter.offset;
  auto last  = matched.end();
  if (filter.limit > 0 && static_cast<std::size_t>(last - first) > filter.limit) last = first + filter.limit;
  return {first, last};
}

Result MemoryTaskRepository::UpdateTask(Transaction& t, const model::Task& task) {
  auto& s  = TX(t).Mutable();
  auto  it = s.tasks.find(task.id);
  if (it == s.tasks.end()) return Result::Err(ErrorCode::NotFound, "task not found");
  it->second = task;
  return Result::Ok();
}

Result MemoryTaskRepository::DeleteTask(Transaction& t, const model::TaskId& id) {
  auto& s = TX(t).Mutable();
  if (s.tasks.erase(id) == 0) return Result::Err(ErrorCode::NotFound, "task not found");
  return Result::Ok();
}

} // namespace taskgate::db::memory
