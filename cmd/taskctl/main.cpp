#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "client/cpp/tasks_client.h"
#include "internal/transport/channel_pool.hpp"
#include "internal/util/uuid.hpp"

using namespace taskgate;

static void Usage() {
  std::cout << "Usage:\n"
            << "  taskctl <addr> create <title> [priority=low|medium|high|urgent] [status=todo|in_progress|done]\n"
            << "  taskctl <addr> get <uuid>\n"
            << "  taskctl <addr> list [limit] [offset]\n"
            << "  taskctl <addr> stream [limit]\n"
            << "  taskctl <addr> update <uuid> <title> [status=todo|in_progress|done] [completed=true|false]\n"
            << "  taskctl <addr> delete <uuid>\n";
}

static std::optional<model::Priority> ParsePriority(const std::string& value) {
  if (value == "low") return model::Priority::kLow;
  if (value == "medium") return model::Priority::kMedium;
  if (value == "high") return model::Priority::kHigh;
  if (value == "urgent") return model::Priority::kUrgent;
  return std::nullopt;
}

static std::optional<model::Status> ParseStatus(const std::string& value) {
  if (value == "todo") return model::Status::kTodo;
  if (value == "in_progress") return model::Status::kInProgress;
  if (value == "done") return model::Status::kDone;
  return std::nullopt;
}

static const char* StatusName(model::Status status) {
  switch (status) {
    case model::Status::kTodo:
      return "todo";
    case model::Status::kInProgress:
      return "in_progress";
    case model::Status::kDone:
      return "done";
    default:
      return "unspecified";
  }
}

static const char* PriorityName(model::Priority priority) {
  switch (priority) {
    case model::Priority::kLow:
      return "low";
    case model::Priority::kMedium:
      return "medium";
    case model::Priority::kHigh:
      return "high";
    case model::Priority::kUrgent:
      return "urgent";
    default:
      return "unspecified";
  }
}

static void Print(const model::Task& task) {
  std::cout << "id=" << util::ToString(task.id) << " title=\"" << task.title << "\" status=" << StatusName(task.status)
            << " priority=" << PriorityName(task.priority) << " completed=" << (task.completed ? "true" : "false")
            << " created_at=" << task.created_at << " updated_at=" << task.updated_at << "\n";
}

static int Fail(const arrow::Status& status) {
  std::cerr << status.ToString() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  try {
    transport::ChannelOptions options;
    options.target = addr;

    auto                pool = transport::ChannelPool::Create(options);
    client::TasksClient  tasks(pool);

    // ------------------------------------------------------------

    if (cmd == "create") {
      if (argc < 4) return 1;

      model::NewTask task;
      task.title = argv[3];
      if (argc >= 5) {
        auto parsed = ParsePriority(argv[4]);
        if (!parsed.has_value()) {
          std::cerr << "unsupported priority: " << argv[4] << "\n";
          return 1;
        }
        task.priority = parsed.value();
      }
      if (argc >= 6) {
        auto parsed = ParseStatus(argv[5]);
        if (!parsed.has_value()) {
          std::cerr << "unsupported status: " << argv[5] << "\n";
          return 1;
        }
        task.status = parsed.value();
      }

      auto result = tasks.Create(task).get();
      if (!result.ok()) return Fail(result.status());
      Print(*result);
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "get") {
      if (argc < 4) return 1;

      auto result = tasks.GetById(util::FromString(argv[3])).get();
      if (!result.ok()) return Fail(result.status());
      Print(*result);
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "list") {
      model::TaskFilter filter;
      if (argc >= 4) filter.limit = static_cast<std::uint32_t>(std::stoul(argv[3]));
      if (argc >= 5) filter.offset = static_cast<std::uint32_t>(std::stoul(argv[4]));

      auto result = tasks.List(filter).get();
      if (!result.ok()) return Fail(result.status());
      for (const auto& task : *result) Print(task);
      std::cout << "count=" << result->size() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "stream") {
      model::TaskFilter filter;
      if (argc >= 4) filter.limit = static_cast<std::uint32_t>(std::stoul(argv[3]));

      auto        stream = tasks.ListStream(filter);
      std::size_t count  = 0;
      while (true) {
        auto next = stream->Next();
        if (!next.ok()) return Fail(next.status());
        if (!next->has_value()) break;
        Print(**next);
        ++count;
      }
      std::cout << "count=" << count << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "update") {
      if (argc < 5) return 1;

      // read-modify-write; the service keeps the last write
      auto current = tasks.GetById(util::FromString(argv[3])).get();
      if (!current.ok()) return Fail(current.status());

      model::Task task = *current;
      task.title       = argv[4];
      if (argc >= 6) {
        auto parsed = ParseStatus(argv[5]);
        if (!parsed.has_value()) {
          std::cerr << "unsupported status: " << argv[5] << "\n";
          return 1;
        }
        task.status = parsed.value();
      }
      if (argc >= 7) task.completed = std::string(argv[6]) == "true";

      auto result = tasks.UpdateById(task).get();
      if (!result.ok()) return Fail(result.status());
      Print(*result);
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "delete") {
      if (argc < 4) return 1;

      auto status = tasks.DeleteById(util::FromString(argv[3])).get();
      if (!status.ok()) return Fail(status);
      std::cout << "deleted\n";
      return 0;
    }
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  Usage();
  return 1;
}
