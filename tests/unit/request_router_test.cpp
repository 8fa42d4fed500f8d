#include "internal/router/request_router.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "client/cpp/tasks_client.h"
#include "config/config.pb.h"
#include "internal/agent/grpc_agent_endpoint.hpp"
#include "internal/db/sqlite/sqlite_datastore.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/errors/error_unifier.hpp"
#include "internal/queue/memory_broker.hpp"
#include "internal/router/deferred_jobs.hpp"
#include "internal/router/task_events.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"
#include "taskgate/jobs/v1/jobs.pb.h"
#include "tests/support/stub_services.hpp"

namespace {

namespace cfg = taskgate::runtime::config;

using namespace taskgate::router;
using taskgate::testing::InProcessOptions;
using taskgate::testing::InProcessPeer;
using taskgate::testing::StubAgentService;
using taskgate::testing::StubBehavior;
using taskgate::testing::StubTasksService;
using taskgate::transport::ChannelPool;
using taskgate::util::ErrorKind;

cfg::RuntimeConfig RoutesConfig(const std::string& events_subject) {
  cfg::RuntimeConfig config;

  auto* tasks = config.add_routes();
  tasks->set_domain("tasks");
  tasks->set_pattern(cfg::RPC);
  tasks->set_deferred_subject("tasks.commands");
  tasks->set_events_subject(events_subject);

  auto* projects = config.add_routes();
  projects->set_domain("projects");
  projects->set_pattern(cfg::DATASTORE);

  auto* notifications = config.add_routes();
  notifications->set_domain("notifications");
  notifications->set_pattern(cfg::QUEUE);
  notifications->set_subject("notifications.email");

  auto* assistant = config.add_routes();
  assistant->set_domain("assistant");
  assistant->set_pattern(cfg::AGENT);
  assistant->set_agent("rag-agent");
  return config;
}

struct Harness {
  explicit Harness(std::size_t queue_capacity = 16, const std::string& events_subject = "")
      : tasks_stub(std::make_shared<StubTasksService>()),
        agent_stub(std::make_shared<StubAgentService>()),
        peer({tasks_stub, agent_stub}),
        tasks(std::make_shared<taskgate::client::TasksClient>(ChannelPool::Create(InProcessOptions(), peer.Factory()))),
        agent(std::make_shared<taskgate::agent::GrpcAgentEndpoint>(ChannelPool::Create(InProcessOptions(), peer.Factory()))),
        datastore(std::make_shared<taskgate::db::sqlite::SqliteDatastore>(std::make_shared<taskgate::db::sqlite::SqliteDB>(""))),
        broker(std::make_shared<taskgate::queue::MemoryBroker>(queue_capacity)),
        router(RouteTable::FromConfig(RoutesConfig(events_subject)), Collaborators{datastore, tasks, broker, agent}) {
    datastore->ExecScript("CREATE TABLE projects (id TEXT PRIMARY KEY, name TEXT NOT NULL, budget REAL);");
  }

  std::shared_ptr<StubTasksService>                    tasks_stub;
  std::shared_ptr<StubAgentService>                    agent_stub;
  InProcessPeer                                        peer;
  std::shared_ptr<taskgate::client::TasksClient>       tasks;
  std::shared_ptr<taskgate::agent::GrpcAgentEndpoint>  agent;
  std::shared_ptr<taskgate::db::sqlite::SqliteDatastore> datastore;
  std::shared_ptr<taskgate::queue::MemoryBroker>       broker;
  RequestRouter                                        router;
};

RouterRequest Make(Operation op, std::string domain, Payload payload = {}) {
  RouterRequest request;
  request.operation          = op;
  request.target_domain      = std::move(domain);
  request.caller.caller_id   = "router-test";
  request.caller.request_id  = "req-1";
  request.payload            = std::move(payload);
  return request;
}

taskgate::model::NewTask NewTask(const std::string& title) {
  taskgate::model::NewTask task;
  task.title = title;
  return task;
}

void AssertFailed(const RouterResponse& response, ErrorKind kind) {
  assert(response.state == RequestState::kFailed);
  assert(response.error.has_value());
  assert(response.error->kind == kind);
  assert(!response.error->message.empty());
}

struct StreamResult {
  std::vector<StreamItem> items;
  RouterResponse          response;
};

StreamResult DispatchStream(const RequestRouter& router, RouterRequest request) {
  auto                        items = std::make_shared<std::vector<StreamItem>>();
  auto                        mutex = std::make_shared<std::mutex>();
  std::promise<RouterResponse> done;
  auto                        finished = done.get_future();

  router.DispatchStream(
      std::move(request),
      [items, mutex](StreamItem item) {
        std::lock_guard lock(*mutex);
        items->push_back(std::move(item));
        return true;
      },
      [&done](RouterResponse response) { done.set_value(std::move(response)); });

  StreamResult result;
  result.response = finished.get();
  std::lock_guard lock(*mutex);
  result.items = *items;
  return result;
}

void TestDatastorePattern() {
  Harness h;

  Record record{{"id", std::string("p-1")}, {"name", std::string("apollo")}, {"budget", 12.5}};
  auto   created = h.router.Dispatch(Make(Operation::kCreate, "projects", record)).get();
  assert(created.state == RequestState::kCompleted);
  assert(created.pattern_used == Pattern::kDatastore);
  assert(std::get<taskgate::db::ResultSet>(created.result).affected_rows == 1);

  auto duplicate = h.router.Dispatch(Make(Operation::kCreate, "projects", record)).get();
  AssertFailed(duplicate, ErrorKind::kInvalidArgument);
  assert(!duplicate.error->cause.empty());

  auto got = h.router.Dispatch(Make(Operation::kGet, "projects", Key{std::string("p-1")})).get();
  assert(got.state == RequestState::kCompleted);
  const auto& rows = std::get<taskgate::db::ResultSet>(got.result);
  assert(rows.rows.size() == 1);
  assert(rows.columns.size() == 3);
  assert(std::get<std::string>(rows.rows[0][1]) == "apollo");

  auto listed = h.router.Dispatch(Make(Operation::kList, "projects", Page{10, 0})).get();
  assert(std::get<taskgate::db::ResultSet>(listed.result).rows.size() == 1);

  AssertFailed(h.router.Dispatch(Make(Operation::kGet, "projects", Key{std::string("p-2")})).get(), ErrorKind::kNotFound);

  auto deleted = h.router.Dispatch(Make(Operation::kDelete, "projects", Key{std::string("p-1")})).get();
  assert(deleted.state == RequestState::kCompleted);
  assert(std::holds_alternative<Deleted>(deleted.result));
  AssertFailed(h.router.Dispatch(Make(Operation::kDelete, "projects", Key{std::string("p-1")})).get(), ErrorKind::kNotFound);
}

void TestRpcPattern() {
  Harness h;

  auto created = h.router.Dispatch(Make(Operation::kCreate, "tasks", NewTask("plan sprint"))).get();
  assert(created.state == RequestState::kCompleted);
  assert(created.pattern_used == Pattern::kRpc);
  const auto task = std::get<taskgate::model::Task>(created.result);

  auto got = h.router.Dispatch(Make(Operation::kGet, "tasks", task.id)).get();
  assert(std::get<taskgate::model::Task>(got.result) == task);

  auto changed  = task;
  changed.title = "plan sprint 12";
  auto updated  = h.router.Dispatch(Make(Operation::kUpdate, "tasks", changed)).get();
  assert(std::get<taskgate::model::Task>(updated.result).title == "plan sprint 12");

  assert(h.router.Dispatch(Make(Operation::kCreate, "tasks", NewTask("second"))).get().state == RequestState::kCompleted);
  auto listed = h.router.Dispatch(Make(Operation::kList, "tasks")).get();
  assert(std::get<std::vector<taskgate::model::Task>>(listed.result).size() == 2);

  auto streamed = DispatchStream(h.router, Make(Operation::kListStream, "tasks", taskgate::model::TaskFilter{}));
  assert(streamed.response.state == RequestState::kCompleted);
  assert(std::get<Streamed>(streamed.response.result).count == 2);
  assert(streamed.items.size() == 2);
  assert(std::holds_alternative<taskgate::model::Task>(streamed.items[0]));

  auto deleted = h.router.Dispatch(Make(Operation::kDelete, "tasks", task.id)).get();
  assert(std::holds_alternative<Deleted>(deleted.result));
  AssertFailed(h.router.Dispatch(Make(Operation::kGet, "tasks", task.id)).get(), ErrorKind::kNotFound);
}

void TestRpcDeadlineIsHonored() {
  Harness h;
  h.tasks_stub->SetBehavior(StubBehavior{.silent = true});

  auto request     = Make(Operation::kGet, "tasks", taskgate::util::GenerateUUID());
  request.deadline = std::chrono::milliseconds(100);
  AssertFailed(h.router.Dispatch(std::move(request)).get(), ErrorKind::kDeadlineExceeded);
}

void TestQueuePattern() {
  Harness h;

  auto acked = h.router.Dispatch(Make(Operation::kPublish, "notifications", Bytes{"hello"})).get();
  assert(acked.state == RequestState::kCompleted);
  assert(acked.pattern_used == Pattern::kQueue);
  const auto& ack = std::get<Ack>(acked.result);
  assert(ack.subject == "notifications.email");
  assert(ack.job_id.empty());
  assert(!ack.message_id.empty());

  auto message = h.broker->Dequeue();
  assert(message.has_value());
  assert(message->payload == "hello");
  assert(message->message_id == ack.message_id);

  AssertFailed(h.router.Dispatch(Make(Operation::kPublish, "notifications", Key{int64_t{1}})).get(), ErrorKind::kInvalidArgument);
}

void TestFullQueueIsRetryable() {
  Harness h(1);

  assert(h.router.Dispatch(Make(Operation::kPublish, "notifications", Bytes{"a"})).get().state == RequestState::kCompleted);
  auto rejected = h.router.Dispatch(Make(Operation::kPublish, "notifications", Bytes{"b"})).get();
  AssertFailed(rejected, ErrorKind::kUnavailable);
  assert(taskgate::errors::IsRetryable(rejected.error->kind));
}

void TestDeferredTaskCommandRunsOutOfBand() {
  Harness h;

  auto request = Make(Operation::kCreate, "tasks", NewTask("overnight import"));
  request.need = Need::kDeferred;

  auto acked = h.router.Dispatch(std::move(request)).get();
  assert(acked.state == RequestState::kCompleted);
  assert(acked.pattern_used == Pattern::kQueue);
  const auto& ack = std::get<Ack>(acked.result);
  assert(ack.subject == "tasks.commands");
  assert(ack.job_id.size() == 16);

  // nothing ran yet: the ack never carries the outcome
  assert(h.tasks_stub->Calls() == 0);

  auto message = h.broker->Dequeue();
  assert(message.has_value());
  const TaskJobRunner runner(h.tasks);
  runner(*message);

  auto listed = h.tasks->List({}).get();
  assert(listed.ok());
  assert(listed->size() == 1);
  assert(listed->front().title == "overnight import");

  auto stream_request = Make(Operation::kListStream, "tasks");
  stream_request.need = Need::kDeferred;
  auto streamed       = DispatchStream(h.router, std::move(stream_request));
  AssertFailed(streamed.response, ErrorKind::kUnroutable);
}

void TestStoppedBrokerIsInternal() {
  Harness h;
  h.broker->Shutdown();

  auto rejected = h.router.Dispatch(Make(Operation::kPublish, "notifications", Bytes{"late"})).get();
  AssertFailed(rejected, ErrorKind::kInternal);
  assert(rejected.error->cause == "broker is shut down");
  assert(!taskgate::errors::IsRetryable(rejected.error->kind));
}

taskgate::jobs::v1::TaskEvent NextEvent(taskgate::queue::MemoryBroker& broker) {
  assert(broker.Depth() > 0);
  auto message = broker.Dequeue();
  assert(message.has_value());
  assert(message->subject == "tasks.events");

  const taskgate::router::TaskEventLogger logger;
  logger(*message);

  taskgate::jobs::v1::TaskEvent event;
  assert(event.ParseFromString(message->payload));
  return event;
}

void TestRpcMutationsAnnounceEvents() {
  Harness h(16, "tasks.events");

  auto created = h.router.Dispatch(Make(Operation::kCreate, "tasks", NewTask("announce me"))).get();
  assert(created.state == RequestState::kCompleted);
  const auto task = std::get<taskgate::model::Task>(created.result);

  auto event = NextEvent(*h.broker);
  assert(event.type() == "task.created");
  assert(event.task_id() == taskgate::util::ToBytes(task.id));
  assert(event.task().title() == "announce me");
  assert(event.caller_id() == "router-test");

  // reads and failed mutations stay quiet
  assert(h.router.Dispatch(Make(Operation::kGet, "tasks", task.id)).get().state == RequestState::kCompleted);
  AssertFailed(h.router.Dispatch(Make(Operation::kDelete, "tasks", taskgate::util::GenerateUUID())).get(), ErrorKind::kNotFound);
  assert(h.broker->Depth() == 0);

  auto changed  = task;
  changed.title = "announced";
  assert(h.router.Dispatch(Make(Operation::kUpdate, "tasks", changed)).get().state == RequestState::kCompleted);
  event = NextEvent(*h.broker);
  assert(event.type() == "task.updated");
  assert(event.task().title() == "announced");

  assert(h.router.Dispatch(Make(Operation::kDelete, "tasks", task.id)).get().state == RequestState::kCompleted);
  event = NextEvent(*h.broker);
  assert(event.type() == "task.deleted");
  assert(!event.has_task());
}

void TestDroppedEventLeavesTheResponseAlone() {
  Harness h(1, "tasks.events");
  assert(h.router.Dispatch(Make(Operation::kPublish, "notifications", Bytes{"fill"})).get().state == RequestState::kCompleted);

  // broker full: the event is dropped, the create still succeeds
  auto created = h.router.Dispatch(Make(Operation::kCreate, "tasks", NewTask("quiet"))).get();
  assert(created.state == RequestState::kCompleted);
  assert(h.broker->Depth() == 1);

  h.broker->Shutdown();
  const auto id = std::get<taskgate::model::Task>(created.result).id;
  assert(h.router.Dispatch(Make(Operation::kDelete, "tasks", id)).get().state == RequestState::kCompleted);

  taskgate::queue::QueuedMessage garbage{"tasks.events", "m-1", "not an event"};
  const taskgate::router::TaskEventLogger logger;
  bool                                     rejected = false;
  try {
    logger(garbage);
  } catch (const taskgate::util::DecodingError&) {
    rejected = true;
  }
  assert(rejected);
}

void TestRpcStreamStopsOnCancel() {
  Harness h;
  h.tasks_stub->SetEndlessStream(std::chrono::milliseconds(5));

  taskgate::transport::CancelSource source;
  auto request   = Make(Operation::kListStream, "tasks", taskgate::model::TaskFilter{});
  request.cancel = source.Token();

  auto items    = std::make_shared<std::atomic<int>>(0);
  auto done     = std::make_shared<std::promise<RouterResponse>>();
  auto finished = done->get_future();
  h.router.DispatchStream(
      std::move(request),
      [items](StreamItem) {
        ++*items;
        return true;
      },
      [done](RouterResponse response) { done->set_value(std::move(response)); });

  assert(taskgate::testing::WaitFor([&] { return items->load() >= 3; }));
  source.Cancel();

  assert(finished.wait_for(std::chrono::seconds(2)) == std::future_status::ready);
  const auto response = finished.get();
  AssertFailed(response, ErrorKind::kInternal);

  const int delivered = items->load();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  assert(items->load() == delivered);
  assert(taskgate::testing::WaitFor([&] { return h.tasks->Pool()->GetStats().outstanding == 0; }));
}

void TestRpcStreamStopsWhenTheSinkDeclines() {
  Harness h;
  h.tasks_stub->SetEndlessStream(std::chrono::milliseconds(2));

  auto items    = std::make_shared<std::atomic<int>>(0);
  auto done     = std::make_shared<std::promise<RouterResponse>>();
  auto finished = done->get_future();
  h.router.DispatchStream(
      Make(Operation::kListStream, "tasks", taskgate::model::TaskFilter{}),
      [items](StreamItem) { return ++*items < 3; },
      [done](RouterResponse response) { done->set_value(std::move(response)); });

  assert(finished.wait_for(std::chrono::seconds(2)) == std::future_status::ready);
  const auto response = finished.get();
  assert(response.state == RequestState::kCompleted);
  assert(std::get<Streamed>(response.result).count == 3);
  assert(taskgate::testing::WaitFor([&] { return h.tasks->Pool()->GetStats().outstanding == 0; }));
}

void TestAgentPattern() {
  Harness h;

  auto invoked = h.router.Dispatch(Make(Operation::kInvoke, "assistant", Prompt{"summarize the backlog", "s-1", {}})).get();
  assert(invoked.state == RequestState::kCompleted);
  assert(invoked.pattern_used == Pattern::kAgent);
  const auto& reply = std::get<taskgate::agent::AgentReply>(invoked.result);
  assert(reply.content == "echo:summarize the backlog");
  assert(reply.agent == "rag-agent");

  auto streamed = DispatchStream(h.router, Make(Operation::kStream, "assistant", Prompt{"one two three", "s-1", {}}));
  assert(streamed.response.state == RequestState::kCompleted);
  assert(std::get<Streamed>(streamed.response.result).count == 3);
  assert(streamed.items.size() == 3);
  assert(std::get<std::string>(streamed.items[2]) == "three");
}

void TestAgentTimeoutIsDeadlineExceeded() {
  Harness h;
  h.agent_stub->SetBehavior(StubBehavior{.silent = true});

  auto request     = Make(Operation::kInvoke, "assistant", Prompt{"slow", "", {}});
  request.deadline = std::chrono::milliseconds(100);
  AssertFailed(h.router.Dispatch(std::move(request)).get(), ErrorKind::kDeadlineExceeded);
}

void TestUnroutableRequests() {
  Harness h;

  auto unknown = h.router.Dispatch(Make(Operation::kGet, "billing", Key{int64_t{1}})).get();
  AssertFailed(unknown, ErrorKind::kUnroutable);
  assert(!unknown.pattern_used.has_value());

  // operation outside the pattern's set
  auto update = h.router.Dispatch(Make(Operation::kUpdate, "projects", Key{int64_t{1}})).get();
  AssertFailed(update, ErrorKind::kUnroutable);
  assert(update.pattern_used == Pattern::kDatastore);

  AssertFailed(h.router.Dispatch(Make(Operation::kPublish, "tasks", Bytes{"x"})).get(), ErrorKind::kUnroutable);
  AssertFailed(h.router.Dispatch(Make(Operation::kInvoke, "tasks", Prompt{"x", "", {}})).get(), ErrorKind::kUnroutable);

  auto deferred = Make(Operation::kCreate, "projects", Record{{"id", std::string("x")}});
  deferred.need = Need::kDeferred;
  AssertFailed(h.router.Dispatch(std::move(deferred)).get(), ErrorKind::kUnroutable);
}

void TestMalformedPayloads() {
  Harness h;

  AssertFailed(h.router.Dispatch(Make(Operation::kGet, "tasks", Key{int64_t{1}})).get(), ErrorKind::kInvalidArgument);
  AssertFailed(h.router.Dispatch(Make(Operation::kCreate, "projects", NewTask("x"))).get(), ErrorKind::kInvalidArgument);
  AssertFailed(h.router.Dispatch(Make(Operation::kInvoke, "assistant", Bytes{"x"})).get(), ErrorKind::kInvalidArgument);

  // streaming operations need DispatchStream
  AssertFailed(h.router.Dispatch(Make(Operation::kListStream, "tasks")).get(), ErrorKind::kInvalidArgument);
  assert(h.tasks_stub->Calls() == 0);
}

void TestMissingCollaboratorIsUnavailable() {
  RequestRouter router(RouteTable::FromConfig(RoutesConfig(events_subject)), Collaborators{});

  AssertFailed(router.Dispatch(Make(Operation::kGet, "tasks", taskgate::util::GenerateUUID())).get(), ErrorKind::kUnavailable);
  AssertFailed(router.Dispatch(Make(Operation::kGet, "projects", Key{int64_t{1}})).get(), ErrorKind::kUnavailable);
  AssertFailed(router.Dispatch(Make(Operation::kPublish, "notifications", Bytes{"x"})).get(), ErrorKind::kUnavailable);
  AssertFailed(router.Dispatch(Make(Operation::kInvoke, "assistant", Prompt{"x", "", {}})).get(), ErrorKind::kUnavailable);
}

void TestDoneRunsExactlyOnce() {
  Harness h;

  std::atomic<int>   calls{0};
  std::promise<void> first;
  h.router.Dispatch(Make(Operation::kCreate, "tasks", NewTask("once")), [&](RouterResponse response) {
    assert(response.state == RequestState::kCompleted);
    if (calls.fetch_add(1) == 0) first.set_value();
  });
  first.get_future().wait();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  assert(calls == 1);
}

void TestClassifyIsPure() {
  Harness    h;
  const auto request = Make(Operation::kGet, "projects", Key{int64_t{1}});
  for (int i = 0; i < 10; ++i) {
    assert(PatternOf(h.router.Classify(request)) == Pattern::kDatastore);
  }
}

} // namespace

int main() {
  TestDatastorePattern();
  TestRpcPattern();
  TestRpcDeadlineIsHonored();
  TestQueuePattern();
  TestFullQueueIsRetryable();
  TestDeferredTaskCommandRunsOutOfBand();
  TestStoppedBrokerIsInternal();
  TestRpcMutationsAnnounceEvents();
  TestDroppedEventLeavesTheResponseAlone();
  TestRpcStreamStopsOnCancel();
  TestRpcStreamStopsWhenTheSinkDeclines();
  TestAgentPattern();
  TestAgentTimeoutIsDeadlineExceeded();
  TestUnroutableRequests();
  TestMalformedPayloads();
  TestMissingCollaboratorIsUnavailable();
  TestDoneRunsExactlyOnce();
  TestClassifyIsPure();

  std::cout << "taskgate_unit_request_router: pass\n";
  return 0;
}
