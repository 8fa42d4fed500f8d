#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/task_repository.hpp"
#include "internal/db/memory/memory_task_repository.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/db/sql/sql_task_repository.hpp"
#include "internal/db/sqlite/sqlite_datastore.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/util/uuid.hpp"

#if TASKGATE_DB_POSTGRES
#include "internal/db/postgres/pg_datastore.hpp"
#include "internal/db/postgres/pg_pool.hpp"
#endif

namespace {

using taskgate::db::ErrorCode;
using taskgate::db::TaskRepository;
using taskgate::db::memory::MemoryTaskRepository;
using taskgate::model::Priority;
using taskgate::model::Status;
using taskgate::model::Task;
using taskgate::model::TaskFilter;
using taskgate::model::TaskId;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                           name;
  std::function<std::shared_ptr<TaskRepository>()>      make_repository;
  std::function<bool()>                                 supports_restart;
  std::function<void(std::shared_ptr<TaskRepository>&)> restart;
  std::function<void()>                                 cleanup;
};

TaskId IdFor(int n) {
  TaskId id{};
  id[0]  = 0x7a;
  id[6]  = 0x40;
  id[8]  = 0x80;
  id[15] = static_cast<uint8_t>(n);
  return id;
}

Task MakeTask(int n, int64_t created_at) {
  Task task;
  task.id          = IdFor(n);
  task.title       = "task " + std::to_string(n);
  task.description = n % 2 == 0 ? "" : "details for " + std::to_string(n);
  task.completed   = n % 3 == 0;
  task.priority    = static_cast<Priority>(1 + n % 4);
  task.status      = static_cast<Status>(1 + n % 3);
  if (n % 2 == 1) task.project_id = IdFor(200);
  if (n % 4 == 0) task.due_date = 1'900'000'000 + n;
  task.created_at = created_at;
  task.updated_at = created_at;
  return task;
}

void Seed(TaskRepository& repo) {
  auto tx = repo.Begin();
  // two pairs share a created_at so the id tie-break is exercised
  const int64_t created[] = {100, 100, 101, 105, 103, 103, 110, 102};
  for (int n = 0; n < 8; ++n) {
    assert(repo.InsertTask(*tx, MakeTask(n, created[n])));
  }
  tx->Commit();
}

std::vector<Task> List(TaskRepository& repo, const TaskFilter& filter) {
  auto tx    = repo.Begin();
  auto tasks = repo.ListTasks(*tx, filter);
  tx->Commit();
  return tasks;
}

// Listings every backend must answer identically.
std::vector<std::vector<Task>> ListingScenario(TaskRepository& repo) {
  std::vector<TaskFilter> filters(7);
  filters[1].project_id = IdFor(200);
  filters[2].completed  = true;
  filters[3].status     = Status::kInProgress;
  filters[4].priority   = Priority::kHigh;
  filters[4].completed  = false;
  filters[5].limit      = 3;
  filters[5].offset     = 2;
  filters[6].offset     = 50;

  std::vector<std::vector<Task>> out;
  for (const auto& filter : filters) {
    out.push_back(List(repo, filter));
  }
  return out;
}

void VerifyLifecycle(TaskRepository& repo) {
  auto tx = repo.Begin();

  auto task = MakeTask(42, 500);
  assert(repo.InsertTask(*tx, task));
  assert(repo.InsertTask(*tx, task).code == ErrorCode::AlreadyExists);

  auto read = repo.GetTask(*tx, task.id);
  assert(read.has_value());
  assert(*read == task);

  task.title      = "renamed";
  task.completed  = true;
  task.status     = Status::kDone;
  task.project_id = std::nullopt;
  task.due_date   = 1'950'000'000;
  task.updated_at = 600;
  assert(repo.UpdateTask(*tx, task));
  assert(*repo.GetTask(*tx, task.id) == task);

  assert(repo.DeleteTask(*tx, task.id));
  assert(!repo.GetTask(*tx, task.id).has_value());
  assert(repo.DeleteTask(*tx, task.id).code == ErrorCode::NotFound);
  assert(repo.UpdateTask(*tx, task).code == ErrorCode::NotFound);
  tx->Commit();
}

void VerifyRollbackBehavior(TaskRepository& repo) {
  const auto task = MakeTask(77, 700);
  {
    auto tx = repo.Begin();
    assert(repo.InsertTask(*tx, task));
    tx->Rollback();
  }
  {
    auto tx = repo.Begin();
    assert(repo.InsertTask(*tx, task));
    // dropped without commit
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetTask(*check_tx, task.id).has_value());
  check_tx->Commit();
}

void VerifyOrdering(const std::vector<Task>& tasks) {
  for (std::size_t i = 1; i < tasks.size(); ++i) {
    const auto& a = tasks[i - 1];
    const auto& b = tasks[i];
    assert(a.created_at < b.created_at || (a.created_at == b.created_at && a.id < b.id));
  }
}

void VerifyPersistence(BackendFactory& backend, std::shared_ptr<TaskRepository>& repo) {
  if (!backend.supports_restart()) return;

  const auto before = List(*repo, {});
  backend.restart(repo);
  const auto after = List(*repo, {});
  assert(before == after);
}

std::vector<std::vector<Task>> RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  VerifyLifecycle(*repo);
  VerifyRollbackBehavior(*repo);

  Seed(*repo);
  auto listings = ListingScenario(*repo);
  assert(listings[0].size() == 8);
  for (const auto& listing : listings) {
    VerifyOrdering(listing);
  }
  assert(listings[5].size() == 3);
  assert(listings[6].empty());

  VerifyPersistence(backend, repo);

  backend.cleanup();
  return listings;
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryTaskRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<TaskRepository>&) {},
      .cleanup          = []() {},
  };
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("taskgate_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() -> std::shared_ptr<TaskRepository> {
    auto datastore = std::make_shared<taskgate::db::sqlite::SqliteDatastore>(std::make_shared<taskgate::db::sqlite::SqliteDB>(db_path));
    datastore->ExecScript(taskgate::db::sql::CREATE_TASKS_SQLITE);
    return std::make_shared<taskgate::db::sql::SqlTaskRepository>(datastore);
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<TaskRepository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() { std::filesystem::remove(db_path); },
  };
}

#if TASKGATE_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("TASKGATE_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("TASKGATE_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() -> std::shared_ptr<TaskRepository> {
    auto pool      = std::make_shared<taskgate::db::postgres::PgPool>(conninfo);
    auto datastore = std::make_shared<taskgate::db::postgres::PgDatastore>(pool);
    datastore->ExecScript(taskgate::db::sql::CREATE_TASKS_POSTGRES);
    return std::make_shared<taskgate::db::sql::SqlTaskRepository>(datastore);
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = [make_repo]() {
        auto repo = make_repo();
        // start from an empty table
        auto tx = repo->Begin();
        for (const auto& task : repo->ListTasks(*tx, TaskFilter{})) {
          (void)repo->DeleteTask(*tx, task.id);
        }
        tx->Commit();
        return repo;
      },
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<TaskRepository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

#if TASKGATE_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  const auto reference = RunBackendSuite(backends.front());
  for (std::size_t i = 1; i < backends.size(); ++i) {
    assert(RunBackendSuite(backends[i]) == reference);
  }

  std::cout << "taskgate_integration_repository_parity: pass\n";
  return 0;
}
