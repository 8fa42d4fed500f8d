#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "internal/router/request.hpp"

namespace taskgate::runtime::config {
class RuntimeConfig;
}

namespace taskgate::router {

struct DatastoreRoute {
  std::string table;
  std::string key_column = "id";
};

struct RpcRoute {
  std::string service = "tasks";
  // mutations are announced here when set
  std::optional<std::string> events_subject;
};

struct QueueRoute {
  std::string subject;
  // set when the route carries deferred task commands rather than raw publishes
  bool deferred = false;
};

struct AgentRoute {
  std::string agent;
};

// Closed set of dispatch targets.
using Route = std::variant<DatastoreRoute, RpcRoute, QueueRoute, AgentRoute>;

Pattern PatternOf(const Route& route);

struct RouteEntry {
  std::string                domain;
  Route                      route;
  std::optional<std::string> deferred_subject;
};

// Must match [A-Za-z_][A-Za-z0-9_]*.
bool IsIdentifier(std::string_view name);

/*
  RouteTable

  Domain -> route, fixed after construction. Classify() is a pure function
  of (domain, need): the same pair always yields the same route.
*/
class RouteTable {
 public:
  static constexpr std::string_view kTasksDomain = "tasks";
  // the only RPC backend the gateway has a client for
  static constexpr std::string_view kTasksService = "tasks";

  // Built-in tasks -> RPC route plus the configured routes, which may
  // override it. Throws util::InvalidArgument on malformed routes.
  static RouteTable FromConfig(const taskgate::runtime::config::RuntimeConfig& config);

  // Throws util::InvalidArgument on a malformed or duplicate entry.
  void Add(RouteEntry entry);

  // Throws util::UnroutableRequest.
  Route Classify(std::string_view domain, Need need) const;

  const RouteEntry* Find(std::string_view domain) const;

  std::size_t Size() const {
    return routes_.size();
  }

 private:
  static void Validate(const RouteEntry& entry);

  std::map<std::string, RouteEntry, std::less<>> routes_;
};

} // namespace taskgate::router
