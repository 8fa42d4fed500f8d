#include "tasks_server.hpp"

#include "grpc_error.hpp"
#include "internal/transport/channel_options.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace taskgate::grpc {

namespace pb = taskgate::tasks::v1;

namespace {

model::TaskId IdFromRequest(const std::string& bytes) {
  if (bytes.size() != 16) {
    throw util::InvalidArgument("id must be 16 bytes, got " + std::to_string(bytes.size()));
  }
  return util::FromBytes(bytes);
}

// Clients opt in per call through request metadata.
void MaybeCompress(::grpc::ServerContext* ctx) {
  const auto& metadata = ctx->client_metadata();
  if (metadata.find(transport::kResponseCompressionKey) != metadata.end()) {
    ctx->set_compression_algorithm(GRPC_COMPRESS_GZIP);
  }
}

} // namespace

TasksServer::TasksServer(std::shared_ptr<taskgate::service::TaskService> svc, codec::TaskCodec codec)
    : service_(std::move(svc)), codec_(std::move(codec)) {
}

::grpc::Status TasksServer::Create(::grpc::ServerContext*, const pb::CreateRequest* req, pb::Task* resp) {
  try {
    *resp = codec_.ToMessage(service_->Create(codec_.FromMessage(*req)));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TasksServer::GetById(::grpc::ServerContext*, const pb::GetByIdRequest* req, pb::Task* resp) {
  try {
    *resp = codec_.ToMessage(service_->GetById(IdFromRequest(req->id())));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TasksServer::List(::grpc::ServerContext* ctx, const pb::ListRequest* req, pb::ListResponse* resp) {
  try {
    MaybeCompress(ctx);
    for (const auto& task : service_->List(codec_.FromMessage(*req))) {
      *resp->add_tasks() = codec_.ToMessage(task);
    }
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TasksServer::ListStream(::grpc::ServerContext* ctx, const pb::ListRequest* req, ::grpc::ServerWriter<pb::Task>* writer) {
  try {
    MaybeCompress(ctx);
    for (const auto& task : service_->List(codec_.FromMessage(*req))) {
      if (ctx->IsCancelled()) {
        return {::grpc::StatusCode::CANCELLED, "list stream cancelled"};
      }
      if (!writer->Write(codec_.ToMessage(task))) {
        // client went away
        return {::grpc::StatusCode::CANCELLED, "list stream closed by client"};
      }
    }
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TasksServer::UpdateById(::grpc::ServerContext*, const pb::UpdateByIdRequest* req, pb::Task* resp) {
  try {
    if (!req->has_task()) {
      throw util::InvalidArgument("update requires a task");
    }
    *resp = codec_.ToMessage(service_->UpdateById(codec_.FromMessage(req->task())));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TasksServer::DeleteById(::grpc::ServerContext*, const pb::DeleteByIdRequest* req, pb::DeleteByIdResponse*) {
  try {
    service_->DeleteById(IdFromRequest(req->id()));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace taskgate::grpc
