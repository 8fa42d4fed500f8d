#include "internal/router/request_router.hpp"

#include <atomic>
#include <chrono>
#include <type_traits>

#include "client/cpp/tasks_client.h"
#include "internal/agent/agent_endpoint.hpp"
#include "internal/db/api/datastore.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/queue/queue_publisher.hpp"
#include "internal/router/datastore_statements.hpp"
#include "internal/router/deferred_jobs.hpp"
#include "internal/router/task_events.hpp"
#include "internal/util/errors.hpp"

namespace taskgate::router {

using observability::StringField;
using util::InvalidArgument;
using util::UnroutableRequest;

struct RequestRouter::Flight {
  RouterRequest    request;
  ResponseCallback done;
  ItemSink         on_item;

  observability::SpanScope              span{"router.dispatch"};
  std::chrono::steady_clock::time_point started = std::chrono::steady_clock::now();

  RequestState           state = RequestState::kReceived;
  std::optional<Pattern> pattern;
  std::atomic<bool>      finished{false};
  std::atomic<uint64_t>  streamed{0};
};

namespace {

template <typename T>
const T& Expect(const RouterRequest& request, const char* what) {
  if (const auto* value = std::get_if<T>(&request.payload)) {
    return *value;
  }
  throw InvalidArgument(std::string(OperationName(request.operation)) + " on '" + request.target_domain + "' expects a " + what +
                        " payload");
}

bool Supports(Pattern pattern, bool deferred, Operation op) {
  switch (pattern) {
    case Pattern::kDatastore:
      return op == Operation::kGet || op == Operation::kList || op == Operation::kCreate || op == Operation::kDelete;
    case Pattern::kRpc:
      return op == Operation::kCreate || op == Operation::kGet || op == Operation::kList || op == Operation::kListStream ||
             op == Operation::kUpdate || op == Operation::kDelete;
    case Pattern::kQueue:
      if (deferred) {
        return op == Operation::kCreate || op == Operation::kGet || op == Operation::kList || op == Operation::kUpdate ||
               op == Operation::kDelete;
      }
      return op == Operation::kPublish;
    case Pattern::kAgent:
      return op == Operation::kInvoke || op == Operation::kStream;
  }
  return false;
}

bool IsStreaming(Operation op) {
  return op == Operation::kListStream || op == Operation::kStream;
}

std::string DescribeFailure(const errors::Error& error) {
  return std::string(util::ErrorKindName(error.kind)) + ": " + error.message;
}

} // namespace

std::string_view OperationName(Operation op) {
  switch (op) {
    case Operation::kCreate:
      return "create";
    case Operation::kGet:
      return "get";
    case Operation::kList:
      return "list";
    case Operation::kListStream:
      return "list_stream";
    case Operation::kUpdate:
      return "update";
    case Operation::kDelete:
      return "delete";
    case Operation::kPublish:
      return "publish";
    case Operation::kInvoke:
      return "invoke";
    case Operation::kStream:
      return "stream";
  }
  return "unknown";
}

std::string_view PatternName(Pattern pattern) {
  switch (pattern) {
    case Pattern::kDatastore:
      return "datastore";
    case Pattern::kRpc:
      return "rpc";
    case Pattern::kQueue:
      return "queue";
    case Pattern::kAgent:
      return "agent";
  }
  return "unknown";
}

std::string_view StateName(RequestState state) {
  switch (state) {
    case RequestState::kReceived:
      return "received";
    case RequestState::kClassified:
      return "classified";
    case RequestState::kDispatched:
      return "dispatched";
    case RequestState::kCompleted:
      return "completed";
    case RequestState::kFailed:
      return "failed";
  }
  return "unknown";
}

RequestRouter::RequestRouter(RouteTable routes, Collaborators collaborators, codec::TaskCodec codec)
    : routes_(std::move(routes)), collaborators_(std::move(collaborators)), codec_(std::move(codec)) {
}

Route RequestRouter::Classify(const RouterRequest& request) const {
  return routes_.Classify(request.target_domain, request.need);
}

void RequestRouter::Dispatch(RouterRequest request, ResponseCallback done) const {
  auto flight     = std::make_shared<Flight>();
  flight->request = std::move(request);
  flight->done    = std::move(done);
  Run(std::move(flight));
}

std::future<RouterResponse> RequestRouter::Dispatch(RouterRequest request) const {
  auto promise = std::make_shared<std::promise<RouterResponse>>();
  auto future  = promise->get_future();
  Dispatch(std::move(request), [promise](RouterResponse response) { promise->set_value(std::move(response)); });
  return future;
}

void RequestRouter::DispatchStream(RouterRequest request, ItemSink on_item, ResponseCallback done) const {
  auto flight     = std::make_shared<Flight>();
  flight->request = std::move(request);
  flight->on_item = std::move(on_item);
  flight->done    = std::move(done);
  Run(std::move(flight));
}

void RequestRouter::Run(FlightPtr flight) const {
  const auto& request = flight->request;
  flight->span.SetAttribute("domain", request.target_domain);
  flight->span.SetAttribute("operation", OperationName(request.operation));
  Transition(*flight, RequestState::kReceived);

  Route route;
  try {
    route = Classify(request);
  } catch (const std::exception& e) {
    TASKGATE_LOG_WARN("unroutable request", {StringField("request_id", request.caller.request_id), StringField("domain", request.target_domain),
                                             StringField("operation", OperationName(request.operation)), StringField("error", e.what())});
    Fail(flight, errors::FromException(e));
    return;
  }

  flight->pattern = PatternOf(route);
  flight->span.SetAttribute("pattern", PatternName(*flight->pattern));
  Transition(*flight, RequestState::kClassified);

  try {
    const bool deferred = request.need == Need::kDeferred;
    if (!Supports(*flight->pattern, deferred, request.operation)) {
      throw UnroutableRequest(std::string(OperationName(request.operation)) + " is not supported by the " +
                              std::string(PatternName(*flight->pattern)) + " route of '" + request.target_domain + "'");
    }
    if (IsStreaming(request.operation) && !flight->on_item) {
      throw InvalidArgument(std::string(OperationName(request.operation)) + " needs a streaming dispatch");
    }

    // clang-format off
    std::visit([&](const auto& r) {
      using R = std::decay_t<decltype(r)>;
      if constexpr (std::is_same_v<R, DatastoreRoute>) DispatchDatastore(flight, r);
      else if constexpr (std::is_same_v<R, RpcRoute>)  DispatchRpc(flight, r);
      else if constexpr (std::is_same_v<R, QueueRoute>) DispatchQueue(flight, r);
      else                                              DispatchAgent(flight, r);
    }, route);
    // clang-format on
  } catch (const std::exception& e) {
    Fail(flight, errors::FromException(e));
  }
}

void RequestRouter::DispatchDatastore(const FlightPtr& flight, const DatastoreRoute& route) const {
  const auto& request = flight->request;
  if (!collaborators_.datastore) {
    throw util::Unavailable("no datastore configured");
  }

  Statement statement;
  switch (request.operation) {
    case Operation::kGet:
      statement = SelectByKey(route, Expect<Key>(request, "key"));
      break;
    case Operation::kDelete:
      statement = DeleteByKey(route, Expect<Key>(request, "key"));
      break;
    case Operation::kCreate:
      statement = Insert(route, Expect<Record>(request, "record"));
      break;
    default: {
      Page page;
      if (const auto* p = std::get_if<Page>(&request.payload)) {
        page = *p;
      } else if (!std::holds_alternative<std::monostate>(request.payload)) {
        throw InvalidArgument("list on '" + request.target_domain + "' expects a page payload");
      }
      statement = SelectPage(route, page);
      break;
    }
  }

  Transition(*flight, RequestState::kDispatched);

  db::ResultSet rows;
  const auto    result = collaborators_.datastore->Execute(statement.sql, statement.params, rows);
  if (!result) {
    Fail(flight, errors::FromDbResult(result));
    return;
  }

  if (request.operation == Operation::kGet && rows.rows.empty()) {
    Fail(flight, errors::FromDbResult(db::Result::Err(db::ErrorCode::NotFound, "no row in " + route.table)));
    return;
  }
  if (request.operation == Operation::kDelete) {
    if (rows.affected_rows == 0) {
      Fail(flight, errors::FromDbResult(db::Result::Err(db::ErrorCode::NotFound, "no row in " + route.table)));
      return;
    }
    Complete(flight, Deleted{});
    return;
  }
  Complete(flight, std::move(rows));
}

void RequestRouter::DispatchRpc(const FlightPtr& flight, const RpcRoute& route) const {
  const auto& request = flight->request;
  if (route.service != RouteTable::kTasksService) {
    throw UnroutableRequest("no RPC client for service '" + route.service + "'");
  }
  const auto& tasks = collaborators_.tasks;
  if (!tasks) {
    throw util::Unavailable("no task service configured");
  }

  client::CallOptions options;
  options.deadline = request.deadline;
  options.cancel   = request.cancel;

  std::shared_ptr<const TaskEventPublisher> events;
  if (route.events_subject) {
    events = std::make_shared<const TaskEventPublisher>(collaborators_.queue, *route.events_subject, codec_);
  }

  // an empty event type announces nothing
  auto on_task = [flight, events](std::string_view event_type) {
    return [flight, events, event_type](arrow::Result<model::Task> result) {
      if (!result.ok()) {
        Fail(flight, errors::FromArrowStatus(result.status()));
        return;
      }
      auto task = std::move(result).ValueUnsafe();
      if (events && !event_type.empty()) {
        events->Publish(event_type, task.id, &task, flight->request.caller.caller_id);
      }
      Complete(flight, std::move(task));
    };
  };

  model::TaskFilter filter;
  if (request.operation == Operation::kList || request.operation == Operation::kListStream) {
    if (const auto* f = std::get_if<model::TaskFilter>(&request.payload)) {
      filter = *f;
    } else if (!std::holds_alternative<std::monostate>(request.payload)) {
      throw InvalidArgument("list on '" + request.target_domain + "' expects a filter payload");
    }
  }

  switch (request.operation) {
    case Operation::kCreate: {
      const auto& task = Expect<model::NewTask>(request, "new task");
      Transition(*flight, RequestState::kDispatched);
      tasks->Create(task, options, on_task(kTaskCreated));
      return;
    }
    case Operation::kGet: {
      const auto& id = Expect<model::TaskId>(request, "task id");
      Transition(*flight, RequestState::kDispatched);
      tasks->GetById(id, options, on_task({}));
      return;
    }
    case Operation::kUpdate: {
      const auto& task = Expect<model::Task>(request, "task");
      Transition(*flight, RequestState::kDispatched);
      tasks->UpdateById(task, options, on_task(kTaskUpdated));
      return;
    }
    case Operation::kDelete: {
      const auto& id = Expect<model::TaskId>(request, "task id");
      Transition(*flight, RequestState::kDispatched);
      tasks->DeleteById(id, options, [flight, events, id](arrow::Status status) {
        if (!status.ok()) {
          Fail(flight, errors::FromArrowStatus(status));
          return;
        }
        if (events) {
          events->Publish(kTaskDeleted, id, nullptr, flight->request.caller.caller_id);
        }
        Complete(flight, Deleted{});
      });
      return;
    }
    case Operation::kList:
      Transition(*flight, RequestState::kDispatched);
      tasks->List(filter, options, [flight](arrow::Result<std::vector<model::Task>> result) {
        if (!result.ok()) {
          Fail(flight, errors::FromArrowStatus(result.status()));
          return;
        }
        Complete(flight, std::move(result).ValueUnsafe());
      });
      return;
    case Operation::kListStream:
      Transition(*flight, RequestState::kDispatched);
      tasks->ListStream(
          filter, options,
          [flight](model::Task task) {
            flight->streamed.fetch_add(1, std::memory_order_relaxed);
            return flight->on_item(StreamItem(std::move(task)));
          },
          [flight](arrow::Status status) {
            if (!status.ok()) {
              Fail(flight, errors::FromArrowStatus(status));
              return;
            }
            Complete(flight, Streamed{flight->streamed.load()});
          });
      return;
    default:
      throw UnroutableRequest(std::string(OperationName(request.operation)) + " has no RPC mapping");
  }
}

void RequestRouter::DispatchQueue(const FlightPtr& flight, const QueueRoute& route) const {
  const auto& request = flight->request;
  if (!collaborators_.queue) {
    throw util::Unavailable("no queue configured");
  }

  std::string job_id;
  std::string payload;
  if (route.deferred) {
    auto job = EncodeTaskJob(request, codec_);
    job_id   = std::move(job.job_id);
    payload  = std::move(job.bytes);
  } else {
    payload = Expect<Bytes>(request, "bytes").data;
  }

  Transition(*flight, RequestState::kDispatched);
  // once handed to the publisher, cancelling the request has no effect on the message
  collaborators_.queue->Publish(route.subject, std::move(payload), [flight, job_id = std::move(job_id)](queue::PublishAck ack) {
    if (!ack.accepted) {
      Fail(flight, errors::FromPublishAck(ack));
      return;
    }
    Complete(flight, Ack{ack.subject, job_id, ack.message_id});
  });
}

void RequestRouter::DispatchAgent(const FlightPtr& flight, const AgentRoute& route) const {
  const auto& request = flight->request;
  if (!collaborators_.agent) {
    throw util::Unavailable("no agent endpoint configured");
  }

  const auto&         prompt = Expect<Prompt>(request, "prompt");
  agent::AgentRequest call{route.agent, prompt.text, prompt.session_id, request.caller.caller_id, prompt.attributes};
  agent::AgentCallOptions options{request.deadline, request.cancel};

  Transition(*flight, RequestState::kDispatched);

  if (request.operation == Operation::kInvoke) {
    collaborators_.agent->Invoke(std::move(call), options, [flight](agent::InvokeOutcome outcome) {
      if (auto* failure = std::get_if<agent::AgentFailure>(&outcome)) {
        Fail(flight, errors::FromAgentFailure(*failure));
        return;
      }
      Complete(flight, std::get<agent::AgentReply>(std::move(outcome)));
    });
    return;
  }

  collaborators_.agent->Stream(
      std::move(call), options,
      [flight](agent::AgentChunk chunk) {
        // the terminal marker carries no text
        if (chunk.done && chunk.content.empty()) {
          return true;
        }
        flight->streamed.fetch_add(1, std::memory_order_relaxed);
        return flight->on_item(StreamItem(std::move(chunk.content)));
      },
      [flight](std::optional<agent::AgentFailure> failure) {
        if (failure) {
          Fail(flight, errors::FromAgentFailure(*failure));
          return;
        }
        Complete(flight, Streamed{flight->streamed.load()});
      });
}

void RequestRouter::Transition(Flight& flight, RequestState state) {
  flight.state = state;
  flight.span.AddEvent(StateName(state));
  TASKGATE_LOG_DEBUG("router state", {StringField("request_id", flight.request.caller.request_id), StringField("state", StateName(state))});
}

void RequestRouter::Complete(const FlightPtr& flight, Result result) {
  if (flight->finished.exchange(true)) return;

  Transition(*flight, RequestState::kCompleted);

  const std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - flight->started;
  const auto pattern = PatternName(*flight->pattern);
  observability::Metrics::Instance().RecordRequest(pattern, true);
  observability::Metrics::Instance().ObserveRequestLatencyMs(pattern, elapsed.count());

  RouterResponse response;
  response.state        = RequestState::kCompleted;
  response.pattern_used = flight->pattern;
  response.result       = std::move(result);
  flight->done(std::move(response));
}

void RequestRouter::Fail(const FlightPtr& flight, errors::Error error) {
  if (flight->finished.exchange(true)) return;

  Transition(*flight, RequestState::kFailed);
  flight->span.RecordException(DescribeFailure(error));

  const std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - flight->started;
  const auto pattern = flight->pattern ? PatternName(*flight->pattern) : std::string_view("unroutable");
  observability::Metrics::Instance().RecordRequest(pattern, false);
  observability::Metrics::Instance().ObserveRequestLatencyMs(pattern, elapsed.count());

  RouterResponse response;
  response.state        = RequestState::kFailed;
  response.pattern_used = flight->pattern;
  response.error        = std::move(error);
  flight->done(std::move(response));
}

} // namespace taskgate::router
