#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/util/uuid.hpp"

namespace taskgate::model {

using TaskId = util::UUID;

// Zero is the reserved "unspecified" discriminant in both enums.
enum class Priority : std::uint8_t {
  kUnspecified = 0,
  kLow         = 1,
  kMedium      = 2,
  kHigh        = 3,
  kUrgent      = 4,
};

enum class Status : std::uint8_t {
  kUnspecified = 0,
  kTodo        = 1,
  kInProgress  = 2,
  kDone        = 3,
};

constexpr bool IsKnown(Priority p) {
  return static_cast<std::uint8_t>(p) <= static_cast<std::uint8_t>(Priority::kUrgent);
}

constexpr bool IsKnown(Status s) {
  return static_cast<std::uint8_t>(s) <= static_cast<std::uint8_t>(Status::kDone);
}

// Instants are whole seconds since the epoch.
struct Task {
  TaskId      id{};
  std::string title;
  std::string description;
  bool        completed = false;

  std::optional<TaskId> project_id;

  Priority priority = Priority::kUnspecified;
  Status   status   = Status::kUnspecified;

  std::optional<std::int64_t> due_date;
  std::int64_t                created_at = 0;
  std::int64_t                updated_at = 0;

  bool operator==(const Task&) const = default;
};

struct NewTask {
  std::string title;
  std::string description;
  bool        completed = false;

  std::optional<TaskId> project_id;

  Priority priority = Priority::kUnspecified;
  Status   status   = Status::kUnspecified;

  std::optional<std::int64_t> due_date;

  bool operator==(const NewTask&) const = default;
};

struct TaskFilter {
  std::optional<TaskId>   project_id;
  std::optional<Status>   status;
  std::optional<Priority> priority;
  std::optional<bool>     completed;

  std::uint32_t limit  = 0;
  std::uint32_t offset = 0;
};

} // namespace taskgate::model
