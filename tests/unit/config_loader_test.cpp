#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/codec/task_codec.hpp"

namespace {

namespace cfg = taskgate::runtime::config;
using taskgate::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "taskgate_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullGatewayConfig() {
  const auto yaml_path = WriteYaml("gateway",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
logging:
  level: debug
tasks_channel:
  target: "tasks.internal:50052"
  pool_size: 4
  keep_alive_interval_ms: 15000
  low_latency: false
  default_deadline_ms: 2000
agent_channel:
  target: "agents.internal:50053"
database:
  sqlite:
    path: "/var/lib/taskgate/gateway.db"
queue:
  capacity: 64
  workers: 2
routes:
  - domain: tasks
    pattern: RPC
    deferred_subject: "tasks.commands"
  - domain: projects
    pattern: DATASTORE
    table: project_rows
    key_column: project_id
  - domain: notifications
    pattern: QUEUE
    subject: "notifications.email"
  - domain: assistant
    pattern: AGENT
    agent: rag-agent
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(config.logging().level() == "debug");

  const auto& tasks = config.tasks_channel();
  assert(tasks.target() == "tasks.internal:50052");
  assert(tasks.pool_size() == 4);
  assert(tasks.keep_alive_interval_ms() == 15000);
  assert(tasks.has_low_latency() && !tasks.low_latency());
  assert(tasks.default_deadline_ms() == 2000);

  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/taskgate/gateway.db");
  assert(config.queue().capacity() == 64);
  assert(config.queue().workers() == 2);

  assert(config.routes_size() == 4);
  assert(config.routes(0).pattern() == cfg::RPC);
  assert(config.routes(0).deferred_subject() == "tasks.commands");
  assert(config.routes(1).pattern() == cfg::DATASTORE);
  assert(config.routes(1).table() == "project_rows");
  assert(config.routes(1).key_column() == "project_id");
  assert(config.routes(2).subject() == "notifications.email");
  assert(config.routes(3).agent() == "rag-agent");
}

void TestDefaultsFillUnsetTunables() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(tasks_channel:
  target: "127.0.0.1:50052"
  pool_size: 2
)");

  const auto& tasks = config.tasks_channel();
  assert(tasks.pool_size() == 2);
  assert(tasks.keep_alive_interval_ms() == 30'000);
  assert(tasks.keep_alive_timeout_ms() == 10'000);
  assert(tasks.keep_alive_while_idle());
  assert(tasks.initial_window_bytes() == 1024 * 1024);
  assert(tasks.adaptive_window());
  assert(tasks.low_latency());
  assert(tasks.connect_timeout_ms() == 5'000);
  assert(tasks.default_deadline_ms() == 30'000);
  assert(tasks.fault_threshold() == 3);
  assert(tasks.compress_list_responses());

  // an unset channel still gets defaults but keeps an empty target
  assert(config.agent_channel().target().empty());
  assert(config.agent_channel().pool_size() == 1);

  assert(config.wire().max_encoding_message_size() == taskgate::codec::kDefaultMaxMessageSize);
  assert(config.wire().max_decoding_message_size() == taskgate::codec::kDefaultMaxMessageSize);
  assert(config.queue().capacity() == 1024);
  assert(config.queue().workers() == 1);
  assert(config.database().backend_case() == cfg::DatabaseConfig::BACKEND_NOT_SET);
}

void TestEmptyDocumentIsAllDefaults() {
  const auto config = ConfigLoader::LoadFromYamlString("");
  assert(config.routes_size() == 0);
  assert(config.tasks_channel().pool_size() == 1);
}

void TestMemoryDatabase() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(database:
  memory: {}
)");
  assert(config.database().has_memory());
}

void TestQuotedScalarsStayStrings() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(server:
  bind_address: "8080"
database:
  sqlite:
    path: "C:\\taskgate\\\"quoted\"\\db.sqlite"
)");
  assert(config.server().bind_address() == "8080");
  assert(config.database().sqlite().path() == "C:\\taskgate\\\"quoted\"\\db.sqlite");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
unknown_field: 123
)");

  assert(Throws([&] { (void)ConfigLoader::LoadFromYaml(yaml_path.string()); }) && "ConfigLoader must reject unknown fields.");
  assert(Throws([] { (void)ConfigLoader::LoadFromYamlString("tasks_channel:\n  pool: 3\n"); }));
}

void TestMalformedInputIsRejected() {
  assert(Throws([] { (void)ConfigLoader::LoadFromYamlString("routes:\n  - domain: x\n    pattern: SIDEWAYS\n"); }));
  assert(Throws([] { (void)ConfigLoader::LoadFromYamlString("queue: [1, 2"); }));
  assert(Throws([] { (void)ConfigLoader::LoadFromYaml("/nonexistent/taskgate.yaml"); }));
}

} // namespace

int main() {
  TestFullGatewayConfig();
  TestDefaultsFillUnsetTunables();
  TestEmptyDocumentIsAllDefaults();
  TestMemoryDatabase();
  TestQuotedScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestMalformedInputIsRejected();

  std::cout << "taskgate_unit_config_loader: pass\n";
  return 0;
}
