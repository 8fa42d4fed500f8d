#include "internal/router/route_table.hpp"

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace taskgate::router {

namespace cfg = taskgate::runtime::config;

using util::InvalidArgument;
using util::UnroutableRequest;

namespace {

bool IsIdentStart(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_';
}

bool IsIdentChar(char c) {
  return IsIdentStart(c) || (c >= '0' && c <= '9');
}

RouteEntry EntryFromConfig(const cfg::RouteConfig& rc) {
  RouteEntry entry;
  entry.domain = rc.domain();
  if (!rc.deferred_subject().empty()) {
    entry.deferred_subject = rc.deferred_subject();
  }

  if (rc.pattern() != cfg::RPC && (!rc.service().empty() || !rc.events_subject().empty())) {
    throw InvalidArgument("route '" + rc.domain() + "': service and events_subject need an RPC route");
  }

  switch (rc.pattern()) {
    case cfg::DATASTORE: {
      DatastoreRoute route;
      route.table = rc.table().empty() ? rc.domain() : rc.table();
      if (!rc.key_column().empty()) route.key_column = rc.key_column();
      entry.route = std::move(route);
      break;
    }
    case cfg::RPC: {
      RpcRoute route;
      route.service = rc.service().empty() ? rc.domain() : rc.service();
      if (!rc.events_subject().empty()) route.events_subject = rc.events_subject();
      entry.route = std::move(route);
      break;
    }
    case cfg::QUEUE:
      entry.route = QueueRoute{rc.subject(), false};
      break;
    case cfg::AGENT:
      entry.route = AgentRoute{rc.agent()};
      break;
    default:
      throw InvalidArgument("route '" + rc.domain() + "' has no pattern");
  }
  return entry;
}

} // namespace

Pattern PatternOf(const Route& route) {
  struct Visitor {
    Pattern operator()(const DatastoreRoute&) const {
      return Pattern::kDatastore;
    }
    Pattern operator()(const RpcRoute&) const {
      return Pattern::kRpc;
    }
    Pattern operator()(const QueueRoute&) const {
      return Pattern::kQueue;
    }
    Pattern operator()(const AgentRoute&) const {
      return Pattern::kAgent;
    }
  };
  return std::visit(Visitor{}, route);
}

bool IsIdentifier(std::string_view name) {
  if (name.empty() || !IsIdentStart(name.front())) return false;
  for (char c : name) {
    if (!IsIdentChar(c)) return false;
  }
  return true;
}

RouteTable RouteTable::FromConfig(const cfg::RuntimeConfig& config) {
  RouteTable table;
  bool       tasks_configured = false;
  for (const auto& rc : config.routes()) {
    if (rc.domain() == kTasksDomain) tasks_configured = true;
    table.Add(EntryFromConfig(rc));
  }
  if (!tasks_configured) {
    table.Add(RouteEntry{std::string(kTasksDomain), RpcRoute{}, std::nullopt});
  }
  return table;
}

void RouteTable::Validate(const RouteEntry& entry) {
  if (entry.domain.empty()) {
    throw InvalidArgument("route domain must not be empty");
  }
  if (const auto* ds = std::get_if<DatastoreRoute>(&entry.route)) {
    if (!IsIdentifier(ds->table)) {
      throw InvalidArgument("route '" + entry.domain + "': invalid table name '" + ds->table + "'");
    }
    if (!IsIdentifier(ds->key_column)) {
      throw InvalidArgument("route '" + entry.domain + "': invalid key column '" + ds->key_column + "'");
    }
  } else if (const auto* q = std::get_if<QueueRoute>(&entry.route)) {
    if (q->subject.empty()) {
      throw InvalidArgument("route '" + entry.domain + "': queue route needs a subject");
    }
  } else if (const auto* a = std::get_if<AgentRoute>(&entry.route)) {
    if (a->agent.empty()) {
      throw InvalidArgument("route '" + entry.domain + "': agent route needs an agent");
    }
  } else if (const auto* rpc = std::get_if<RpcRoute>(&entry.route)) {
    if (rpc->service != kTasksService) {
      throw InvalidArgument("route '" + entry.domain + "': no RPC client for service '" + rpc->service + "'");
    }
    if (rpc->events_subject && rpc->events_subject->empty()) {
      throw InvalidArgument("route '" + entry.domain + "': empty events subject");
    }
  }
  if (entry.deferred_subject) {
    if (entry.deferred_subject->empty()) {
      throw InvalidArgument("route '" + entry.domain + "': empty deferred subject");
    }
    // deferred jobs are replayed through the task client
    if (!std::holds_alternative<RpcRoute>(entry.route)) {
      throw InvalidArgument("route '" + entry.domain + "': deferred_subject requires an RPC route");
    }
  }
}

void RouteTable::Add(RouteEntry entry) {
  Validate(entry);
  if (routes_.contains(entry.domain)) {
    throw InvalidArgument("duplicate route for domain '" + entry.domain + "'");
  }
  auto domain = entry.domain;
  routes_.emplace(std::move(domain), std::move(entry));
}

Route RouteTable::Classify(std::string_view domain, Need need) const {
  const auto* entry = Find(domain);
  if (!entry) {
    throw UnroutableRequest("no route for domain '" + std::string(domain) + "'");
  }
  if (need == Need::kDeferred) {
    if (!entry->deferred_subject) {
      throw UnroutableRequest("domain '" + std::string(domain) + "' has no deferred route");
    }
    return QueueRoute{*entry->deferred_subject, true};
  }
  return entry->route;
}

const RouteEntry* RouteTable::Find(std::string_view domain) const {
  auto it = routes_.find(domain);
  return it == routes_.end() ? nullptr : &it->second;
}

} // namespace taskgate::router
