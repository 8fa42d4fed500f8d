#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/codec/task_codec.hpp"
#include "internal/service/task_service.hpp"
#include "taskgate/tasks/v1/tasks.grpc.pb.h"

namespace taskgate::grpc {

class TasksServer final : public taskgate::tasks::v1::TasksService::Service {
 public:
  TasksServer(std::shared_ptr<taskgate::service::TaskService> svc, codec::TaskCodec codec = codec::TaskCodec());

  ::grpc::Status Create(::grpc::ServerContext*, const taskgate::tasks::v1::CreateRequest*, taskgate::tasks::v1::Task*) override;

  ::grpc::Status GetById(::grpc::ServerContext*, const taskgate::tasks::v1::GetByIdRequest*, taskgate::tasks::v1::Task*) override;

  ::grpc::Status List(::grpc::ServerContext*, const taskgate::tasks::v1::ListRequest*, taskgate::tasks::v1::ListResponse*) override;

  ::grpc::Status ListStream(::grpc::ServerContext*, const taskgate::tasks::v1::ListRequest*,
                            ::grpc::ServerWriter<taskgate::tasks::v1::Task>*) override;

  ::grpc::Status UpdateById(::grpc::ServerContext*, const taskgate::tasks::v1::UpdateByIdRequest*, taskgate::tasks::v1::Task*) override;

  ::grpc::Status DeleteById(::grpc::ServerContext*, const taskgate::tasks::v1::DeleteByIdRequest*,
                            taskgate::tasks::v1::DeleteByIdResponse*) override;

 private:
  std::shared_ptr<taskgate::service::TaskService> service_;
  codec::TaskCodec                                codec_;
};

} // namespace taskgate::grpc
