#include "server.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace taskgate::runtime {

using observability::IntField;
using observability::StringField;

Server::Server(ServerOptions options, std::vector<std::shared_ptr<::grpc::Service>> services)
    : options_(std::move(options)), services_(std::move(services)) {
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  ::grpc::ServerBuilder builder;

  if (!options_.bind_address.empty()) {
    builder.AddListeningPort(options_.bind_address, ::grpc::InsecureServerCredentials(), &bound_port_);
  }
  builder.SetMaxReceiveMessageSize(options_.max_receive_message_size);
  builder.SetMaxSendMessageSize(options_.max_send_message_size);

  for (const auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();

  if (!grpc_server_) {
    throw util::Unavailable("failed to start gRPC server on " + options_.bind_address);
  }
  if (!options_.bind_address.empty() && bound_port_ == 0) {
    throw util::Unavailable("failed to bind " + options_.bind_address);
  }

  TASKGATE_LOG_INFO("server listening", {StringField("bind_address", options_.bind_address), IntField("port", bound_port_)});
}

void Server::Wait() {
  if (grpc_server_) grpc_server_->Wait();
}

void Server::Stop() {
  if (grpc_server_) {
    grpc_server_->Shutdown();
    grpc_server_.reset();
    TASKGATE_LOG_INFO("server stopped", {StringField("bind_address", options_.bind_address)});
  }
}

std::shared_ptr<::grpc::Channel> Server::InProcessChannel(const ::grpc::ChannelArguments& args) const {
  if (!grpc_server_) {
    throw util::Unavailable("server is not running");
  }
  return grpc_server_->InProcessChannel(args);
}

} // namespace taskgate::runtime
