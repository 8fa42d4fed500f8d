#include "factory.hpp"

#include <memory>
#include <set>
#include <string>
#include <utility>

#include "client/cpp/tasks_client.h"
#include "internal/agent/grpc_agent_endpoint.hpp"
#include "internal/db/api/datastore.hpp"
#include "internal/db/memory/memory_task_repository.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/db/sql/sql_task_repository.hpp"
#include "internal/db/sqlite/sqlite_datastore.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/grpc/gateway_server.hpp"
#include "internal/grpc/tasks_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/queue/job_worker.hpp"
#include "internal/queue/memory_broker.hpp"
#include "internal/router/deferred_jobs.hpp"
#include "internal/router/request_router.hpp"
#include "internal/router/route_table.hpp"
#include "internal/router/task_events.hpp"
#include "internal/service/task_service.hpp"
#include "internal/transport/channel_options.hpp"
#include "internal/util/errors.hpp"
#if TASKGATE_DB_POSTGRES
#include "internal/db/postgres/pg_datastore.hpp"
#include "internal/db/postgres/pg_pool.hpp"
#endif

namespace taskgate::factory {

namespace cfg = taskgate::runtime::config;

namespace {

// Schema of the task service. Gateway-side datastore tables are owned by
// their operators and never created here.
void BootstrapTasksSchema(db::Datastore& datastore, const cfg::DatabaseConfig& database) {
  if (database.has_postgres()) {
    datastore.ExecScript(db::sql::CREATE_TASKS_POSTGRES);
  } else {
    datastore.ExecScript(db::sql::CREATE_TASKS_SQLITE);
  }
}

std::shared_ptr<transport::ChannelPool> BuildPool(const cfg::ChannelConfig& channel, const cfg::WireConfig& wire,
                                                  transport::ChannelPool::ChannelFactory factory) {
  if (channel.target().empty() && !factory) {
    return nullptr;
  }
  return transport::ChannelPool::Create(transport::ChannelOptionsFromConfig(channel, wire), std::move(factory));
}

std::set<std::string> DeferredSubjects(const cfg::RuntimeConfig& config) {
  std::set<std::string> subjects;
  for (const auto& route : config.routes()) {
    if (!route.deferred_subject().empty()) {
      subjects.insert(route.deferred_subject());
    }
  }
  return subjects;
}

std::set<std::string> EventSubjects(const cfg::RuntimeConfig& config) {
  std::set<std::string> subjects;
  for (const auto& route : config.routes()) {
    if (!route.events_subject().empty()) {
      subjects.insert(route.events_subject());
    }
  }
  return subjects;
}

queue::JobWorker::Handler BuildJobHandler(const cfg::RuntimeConfig& config, std::shared_ptr<client::TasksClient> tasks) {
  return [subjects = DeferredSubjects(config), events = EventSubjects(config), tasks = std::move(tasks)](const queue::QueuedMessage& message) {
    if (events.contains(message.subject)) {
      const router::TaskEventLogger logger;
      logger(message);
      return;
    }
    if (!subjects.contains(message.subject)) {
      // plain publications have no in-process consumer
      TASKGATE_LOG_DEBUG("message consumed",
                         {observability::StringField("subject", message.subject),
                          observability::IntField("bytes", static_cast<std::int64_t>(message.payload.size()))});
      return;
    }
    if (!tasks) {
      throw util::Unavailable("no task service configured for deferred job on " + message.subject);
    }
    const router::TaskJobRunner runner(tasks);
    runner(message);
  };
}

} // namespace

void GatewayApplication::Shutdown() {
  for (auto& worker : workers) {
    worker->Stop();
  }
  workers.clear();
}

codec::TaskCodec BuildCodec(const cfg::RuntimeConfig& config) {
  codec::CodecLimits limits;
  if (config.wire().max_encoding_message_size() > 0) {
    limits.max_encoding_message_size = config.wire().max_encoding_message_size();
  }
  if (config.wire().max_decoding_message_size() > 0) {
    limits.max_decoding_message_size = config.wire().max_decoding_message_size();
  }
  return codec::TaskCodec(limits);
}

std::shared_ptr<db::Datastore> BuildDatastore(const cfg::RuntimeConfig& config) {
  const auto& database = config.database();

  if (database.has_postgres()) {
#if TASKGATE_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    return std::make_shared<db::postgres::PgDatastore>(std::move(pool));
#else
    throw util::InvalidArgument("postgres backend requested but not enabled at build time");
#endif
  }

  // sqlite, memory and absent all land on SQLite; an empty path is in-memory
  const std::string path = database.has_sqlite() ? database.sqlite().path() : std::string();
  auto              sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path);
  return std::make_shared<db::sqlite::SqliteDatastore>(std::move(sqlite_db));
}

TasksApplication BuildTasksService(const cfg::RuntimeConfig& config) {
  TasksApplication app;

  // ------------------------------------------------------------------
  // Repository
  // ------------------------------------------------------------------
  if (config.database().has_memory()) {
    app.repository = std::make_shared<db::memory::MemoryTaskRepository>();
  } else {
    auto datastore = BuildDatastore(config);
    BootstrapTasksSchema(*datastore, config.database());
    app.repository = std::make_shared<db::sql::SqlTaskRepository>(std::move(datastore));
  }

  // ------------------------------------------------------------------
  // Service + gRPC server
  // ------------------------------------------------------------------
  app.service = std::make_shared<service::TaskService>(app.repository);
  app.grpc_services.push_back(std::make_shared<grpc::TasksServer>(app.service, BuildCodec(config)));

  TASKGATE_LOG_INFO("task service built",
                    {observability::StringField("repository", config.database().has_memory() ? "memory" : "sql")});
  return app;
}

GatewayApplication BuildGateway(const cfg::RuntimeConfig& config, GatewayOverrides overrides) {
  GatewayApplication app;
  const auto         codec = BuildCodec(config);

  // ------------------------------------------------------------------
  // Remote collaborators
  // ------------------------------------------------------------------
  app.tasks_pool = BuildPool(config.tasks_channel(), config.wire(), std::move(overrides.tasks_channel_factory));
  if (app.tasks_pool) {
    app.tasks_pool->Warmup();
    app.tasks = std::make_shared<client::TasksClient>(app.tasks_pool, codec);
  }

  app.agent_pool = BuildPool(config.agent_channel(), config.wire(), std::move(overrides.agent_channel_factory));
  if (app.agent_pool) {
    app.agent_pool->Warmup();
    app.agent = std::make_shared<agent::GrpcAgentEndpoint>(app.agent_pool);
  }

  // ------------------------------------------------------------------
  // Local collaborators
  // ------------------------------------------------------------------
  app.datastore = overrides.datastore ? std::move(overrides.datastore) : BuildDatastore(config);
  app.broker    = std::make_shared<queue::MemoryBroker>(config.queue().capacity());

  // ------------------------------------------------------------------
  // Router + gateway
  // ------------------------------------------------------------------
  router::Collaborators collaborators;
  collaborators.datastore = app.datastore;
  collaborators.tasks     = app.tasks;
  collaborators.queue     = app.broker;
  collaborators.agent     = app.agent;

  app.router = std::make_shared<router::RequestRouter>(router::RouteTable::FromConfig(config), std::move(collaborators), codec);
  app.grpc_services.push_back(std::make_shared<grpc::GatewayServer>(app.router, codec));

  // ------------------------------------------------------------------
  // Job workers
  // ------------------------------------------------------------------
  const auto handler = BuildJobHandler(config, app.tasks);
  for (std::uint32_t i = 0; i < config.queue().workers(); ++i) {
    auto worker = std::make_shared<queue::JobWorker>(app.broker, handler, "job-worker-" + std::to_string(i));
    worker->Start();
    app.workers.push_back(std::move(worker));
  }

  TASKGATE_LOG_INFO("gateway built",
                    {observability::IntField("routes", static_cast<std::int64_t>(app.router->Routes().Size())),
                     observability::IntField("workers", static_cast<std::int64_t>(app.workers.size())),
                     observability::BoolField("tasks_channel", app.tasks != nullptr),
                     observability::BoolField("agent_channel", app.agent != nullptr)});
  return app;
}

} // namespace taskgate::factory
