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

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  if (argc != 2) {
    std::cerr << "Usage: taskgate-tasksd <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = taskgate::config::ConfigLoader::LoadFromYaml(argv[1]);

    taskgate::observability::InitializeTracing(config, "taskgate-tasksd");
    taskgate::observability::InitializeMetrics(config, "taskgate-tasksd");
    taskgate::observability::InitializeLogging(config, "taskgate-tasksd");

    auto app = taskgate::factory::BuildTasksService(config);

    taskgate::runtime::ServerOptions options;
    options.bind_address             = config.server().bind_address();
    options.max_receive_message_size = static_cast<int>(config.wire().max_decoding_message_size());
    options.max_send_message_size    = static_cast<int>(config.wire().max_encoding_message_size());

    taskgate::runtime::Server server(options, app.grpc_services);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    TASKGATE_LOG_INFO("task service started", {taskgate::observability::StringField("bind_address", options.bind_address)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    TASKGATE_LOG_INFO("shutting down task service");

    server.Stop();
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
