#pragma once

#include <functional>
#include <future>
#include <memory>

#include "internal/codec/task_codec.hpp"
#include "internal/router/request.hpp"
#include "internal/router/route_table.hpp"

namespace taskgate::client {
class TasksClient;
}

namespace taskgate::db {
class Datastore;
}

namespace taskgate::queue {
class QueuePublisher;
}

namespace taskgate::agent {
class AgentEndpoint;
}

namespace taskgate::router {

// Backends of the four dispatch patterns. A missing one makes its pattern Unavailable.
struct Collaborators {
  std::shared_ptr<db::Datastore>         datastore;
  std::shared_ptr<client::TasksClient>   tasks;
  std::shared_ptr<queue::QueuePublisher> queue;
  std::shared_ptr<agent::AgentEndpoint>  agent;
};

/*
  RequestRouter

  Per request: Received -> Classified -> Dispatched -> Completed | Failed.

  Exactly one pattern is chosen per request and there is no fallback to
  another one. Every outcome, whatever the backend, is reported through one
  RouterResponse whose error is an errors::Error. `done` runs exactly once,
  possibly on a gRPC or caller thread.

  The router holds no lock across a collaborator call. Datastore calls run
  inline on the dispatching thread.
*/
class RequestRouter {
 public:
  using ResponseCallback = std::function<void(RouterResponse)>;
  using ItemSink         = std::function<bool(StreamItem)>;

  RequestRouter(RouteTable routes, Collaborators collaborators, codec::TaskCodec codec = codec::TaskCodec());

  // Pure. Throws util::UnroutableRequest.
  Route Classify(const RouterRequest& request) const;

  void Dispatch(RouterRequest request, ResponseCallback done) const;
  std::future<RouterResponse> Dispatch(RouterRequest request) const;

  // ListStream and agent Stream deliver items through `on_item` before the
  // final response; any other operation behaves like Dispatch().
  void DispatchStream(RouterRequest request, ItemSink on_item, ResponseCallback done) const;

  const RouteTable& Routes() const {
    return routes_;
  }

 private:
  struct Flight;
  using FlightPtr = std::shared_ptr<Flight>;

  void Run(FlightPtr flight) const;

  void DispatchDatastore(const FlightPtr& flight, const DatastoreRoute& route) const;
  void DispatchRpc(const FlightPtr& flight, const RpcRoute& route) const;
  void DispatchQueue(const FlightPtr& flight, const QueueRoute& route) const;
  void DispatchAgent(const FlightPtr& flight, const AgentRoute& route) const;

  static void Transition(Flight& flight, RequestState state);
  static void Complete(const FlightPtr& flight, Result result);
  static void Fail(const FlightPtr& flight, errors::Error error);

  RouteTable       routes_;
  Collaborators    collaborators_;
  codec::TaskCodec codec_;
};

} // namespace taskgate::router
