#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/codec/task_codec.hpp"
#include "internal/transport/channel_pool.hpp"

namespace taskgate::db {
class Datastore;
class TaskRepository;
} // namespace taskgate::db

namespace taskgate::service {
class TaskService;
}

namespace taskgate::client {
class TasksClient;
}

namespace taskgate::agent {
class AgentEndpoint;
}

namespace taskgate::queue {
class MemoryBroker;
class JobWorker;
} // namespace taskgate::queue

namespace taskgate::router {
class RequestRouter;
}

namespace taskgate::factory {

/*
  TasksApplication

  Everything taskgate-tasksd keeps alive for the lifetime of the process.
*/
struct TasksApplication {
  std::shared_ptr<db::TaskRepository>            repository;
  std::shared_ptr<service::TaskService>          service;
  std::vector<std::shared_ptr<::grpc::Service>> grpc_services;
};

// Channel factories replace the default insecure channels, e.g. with
// in-process channels in tests.
struct GatewayOverrides {
  transport::ChannelPool::ChannelFactory tasks_channel_factory;
  transport::ChannelPool::ChannelFactory agent_channel_factory;
  std::shared_ptr<db::Datastore>         datastore;
};

/*
  GatewayApplication

  The gateway graph: pools, collaborators, router and the job workers.
  Workers are started by BuildGateway and must be stopped with Shutdown()
  after the server has stopped accepting requests.
*/
struct GatewayApplication {
  std::shared_ptr<transport::ChannelPool>        tasks_pool;
  std::shared_ptr<transport::ChannelPool>        agent_pool;
  std::shared_ptr<client::TasksClient>           tasks;
  std::shared_ptr<agent::AgentEndpoint>          agent;
  std::shared_ptr<db::Datastore>                 datastore;
  std::shared_ptr<queue::MemoryBroker>           broker;
  std::vector<std::shared_ptr<queue::JobWorker>> workers;
  std::shared_ptr<router::RequestRouter>         router;
  std::vector<std::shared_ptr<::grpc::Service>> grpc_services;

  void Shutdown();
};

codec::TaskCodec BuildCodec(const taskgate::runtime::config::RuntimeConfig& config);

/*
  BuildDatastore

  SQLite (file or in-memory) or Postgres when compiled in. Throws
  util::InvalidArgument for a backend that is not available.
*/
std::shared_ptr<db::Datastore> BuildDatastore(const taskgate::runtime::config::RuntimeConfig& config);

/*
  NOTE:
  These are the composition roots of the two daemons.
  They are the ONLY places allowed to know concrete DB, queue and agent types.
*/
TasksApplication   BuildTasksService(const taskgate::runtime::config::RuntimeConfig& config);
GatewayApplication BuildGateway(const taskgate::runtime::config::RuntimeConfig& config, GatewayOverrides overrides = {});

} // namespace taskgate::factory
