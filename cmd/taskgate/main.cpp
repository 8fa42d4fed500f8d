#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using taskgate::runtime::Server;
using taskgate::runtime::ServerOptions;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: taskgate <config.yaml> OR taskgate --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = taskgate::config::ConfigLoader::LoadFromYaml(config_path);

    taskgate::observability::InitializeTracing(config, "taskgate");
    taskgate::observability::InitializeMetrics(config, "taskgate");
    taskgate::observability::InitializeLogging(config, "taskgate");

    // ------------------------------------------------------------
    // Build gateway (dependency graph)
    // ------------------------------------------------------------
    auto app = taskgate::factory::BuildGateway(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    ServerOptions options;
    options.bind_address             = config.server().bind_address();
    options.max_receive_message_size = static_cast<int>(config.wire().max_decoding_message_size());
    options.max_send_message_size    = static_cast<int>(config.wire().max_encoding_message_size());

    Server server(options, app.grpc_services);

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    TASKGATE_LOG_INFO("gateway started", {taskgate::observability::StringField("bind_address", options.bind_address)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    TASKGATE_LOG_INFO("shutting down gateway");

    server.Stop();
    app.Shutdown();
    taskgate::observability::ShutdownLogging();
    taskgate::observability::ShutdownMetrics();
    taskgate::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    TASKGATE_LOG_ERROR("fatal error", {taskgate::observability::StringField("error", e.what())});
    taskgate::observability::ShutdownLogging();
    taskgate::observability::ShutdownMetrics();
    taskgate::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
