#pragma once

#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace taskgate::runtime {

struct ServerOptions {
  std::string bind_address;
  int         max_receive_message_size = 8 * 1024 * 1024;
  int         max_send_message_size    = 8 * 1024 * 1024;
};

/*
  Owns the gRPC server and the services registered on it.

  An empty bind address starts an in-process only server, reachable through
  InProcessChannel().
*/
class Server {
 public:
  Server(ServerOptions options, std::vector<std::shared_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();
  void Stop();

  // Port chosen by the OS when bind_address ends in ":0".
  int BoundPort() const {
    return bound_port_;
  }

  std::shared_ptr<::grpc::Channel> InProcessChannel(const ::grpc::ChannelArguments& args = {}) const;

 private:
  ServerOptions                                 options_;
  std::vector<std::shared_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server>               grpc_server_;
  int                                           bound_port_ = 0;
};

} // namespace taskgate::runtime
