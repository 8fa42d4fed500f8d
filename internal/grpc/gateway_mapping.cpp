#include "internal/grpc/gateway_mapping.hpp"

#include <type_traits>

#include "internal/util/errors.hpp"

namespace taskgate::grpc {

namespace gw = taskgate::gateway::v1;

using router::Operation;

namespace {

Operation OperationFromProto(gw::Operation op) {
  switch (op) {
    case gw::OPERATION_CREATE:
      return Operation::kCreate;
    case gw::OPERATION_GET:
      return Operation::kGet;
    case gw::OPERATION_LIST:
      return Operation::kList;
    case gw::OPERATION_LIST_STREAM:
      return Operation::kListStream;
    case gw::OPERATION_UPDATE:
      return Operation::kUpdate;
    case gw::OPERATION_DELETE:
      return Operation::kDelete;
    case gw::OPERATION_PUBLISH:
      return Operation::kPublish;
    case gw::OPERATION_INVOKE:
      return Operation::kInvoke;
    case gw::OPERATION_STREAM:
      return Operation::kStream;
    default:
      throw util::InvalidArgument("operation must be set");
  }
}

gw::Pattern PatternToProto(router::Pattern pattern) {
  switch (pattern) {
    case router::Pattern::kDatastore:
      return gw::PATTERN_DATASTORE;
    case router::Pattern::kRpc:
      return gw::PATTERN_RPC;
    case router::Pattern::kQueue:
      return gw::PATTERN_QUEUE;
    case router::Pattern::kAgent:
      return gw::PATTERN_AGENT;
  }
  return gw::PATTERN_UNSPECIFIED;
}

router::Payload PayloadFromProto(const gw::DispatchRequest& request, const codec::TaskCodec& codec) {
  switch (request.payload_case()) {
    case gw::DispatchRequest::kNewTask:
      return codec.FromMessage(request.new_task());
    case gw::DispatchRequest::kTask:
      return codec.FromMessage(request.task());
    case gw::DispatchRequest::kTaskId:
      if (request.task_id().size() != 16) {
        throw util::DecodingError("task_id must be 16 bytes, got " + std::to_string(request.task_id().size()));
      }
      return util::FromBytes(request.task_id());
    case gw::DispatchRequest::kFilter:
      return codec.FromMessage(request.filter());
    case gw::DispatchRequest::kRecord: {
      router::Record record;
      record.reserve(static_cast<std::size_t>(request.record().columns_size()));
      for (const auto& column : request.record().columns()) {
        record.emplace_back(column.name(), FromProto(column.value()));
      }
      return record;
    }
    case gw::DispatchRequest::kKey:
      return router::Key{FromProto(request.key())};
    case gw::DispatchRequest::kPage:
      return router::Page{request.page().limit(), request.page().offset()};
    case gw::DispatchRequest::kPrompt: {
      router::Prompt prompt;
      prompt.text       = request.prompt().text();
      prompt.session_id = request.prompt().session_id();
      prompt.attributes.insert(request.prompt().attributes().begin(), request.prompt().attributes().end());
      return prompt;
    }
    case gw::DispatchRequest::kBytes:
      return router::Bytes{request.bytes()};
    case gw::DispatchRequest::PAYLOAD_NOT_SET:
      break;
  }
  return std::monostate{};
}

gw::Record RowToProto(const std::vector<std::string>& columns, const std::vector<db::sql::Value>& row) {
  gw::Record out;
  for (std::size_t i = 0; i < row.size(); ++i) {
    auto* column = out.add_columns();
    if (i < columns.size()) column->set_name(columns[i]);
    *column->mutable_value() = ToProto(row[i]);
  }
  return out;
}

} // namespace

router::RouterRequest FromDispatchRequest(const gw::DispatchRequest& request, const codec::TaskCodec& codec) {
  router::RouterRequest out;
  out.operation         = OperationFromProto(request.operation());
  out.target_domain     = request.target_domain();
  out.need              = request.need() == gw::NEED_DEFERRED ? router::Need::kDeferred : router::Need::kDefault;
  out.caller.caller_id  = request.caller().caller_id();
  out.caller.request_id = request.caller().request_id();
  if (request.deadline_ms() > 0) {
    out.deadline = std::chrono::milliseconds(request.deadline_ms());
  }
  out.payload = PayloadFromProto(request, codec);
  return out;
}

gw::DispatchResponse ToDispatchResponse(const router::RouterResponse& response, const codec::TaskCodec& codec) {
  if (response.state == router::RequestState::kFailed) {
    auto out = FailedResponse(response.error.value_or(errors::Error{util::ErrorKind::kInternal, "request failed", {}}));
    if (response.pattern_used) out.set_pattern_used(PatternToProto(*response.pattern_used));
    return out;
  }

  gw::DispatchResponse out;
  out.set_state(gw::REQUEST_STATE_COMPLETED);
  if (response.pattern_used) out.set_pattern_used(PatternToProto(*response.pattern_used));

  // clang-format off
  std::visit([&](const auto& result) {
    using R = std::decay_t<decltype(result)>;
    if constexpr (std::is_same_v<R, model::Task>) {
      *out.mutable_task() = codec.ToMessage(result);
    } else if constexpr (std::is_same_v<R, std::vector<model::Task>>) {
      auto* tasks = out.mutable_tasks();
      for (const auto& task : result) *tasks->add_tasks() = codec.ToMessage(task);
    } else if constexpr (std::is_same_v<R, db::ResultSet>) {
      auto* rows = out.mutable_rows();
      for (const auto& name : result.columns) rows->add_columns(name);
      for (const auto& row : result.rows) *rows->add_rows() = RowToProto(result.columns, row);
    } else if constexpr (std::is_same_v<R, router::Ack>) {
      auto* ack = out.mutable_ack();
      ack->set_subject(result.subject);
      ack->set_job_id(result.job_id);
      ack->set_message_id(result.message_id);
    } else if constexpr (std::is_same_v<R, agent::AgentReply>) {
      auto* reply = out.mutable_reply();
      reply->set_request_id(result.request_id);
      reply->set_agent(result.agent);
      reply->set_content(result.content);
      reply->set_latency_ms(result.latency_ms);
    } else if constexpr (std::is_same_v<R, router::Deleted>) {
      out.set_deleted(true);
    } else if constexpr (std::is_same_v<R, router::Streamed>) {
      out.set_streamed(result.count);
    }
  }, response.result);
  // clang-format on
  return out;
}

gw::DispatchChunk ToDispatchChunk(const router::StreamItem& item, const codec::TaskCodec& codec) {
  gw::DispatchChunk chunk;
  if (const auto* task = std::get_if<model::Task>(&item)) {
    *chunk.mutable_task() = codec.ToMessage(*task);
  } else {
    chunk.set_text(std::get<std::string>(item));
  }
  return chunk;
}

gw::DispatchResponse FailedResponse(const errors::Error& error) {
  gw::DispatchResponse out;
  out.set_state(gw::REQUEST_STATE_FAILED);
  auto* e = out.mutable_error();
  e->set_kind(ToProto(error.kind));
  e->set_message(error.message);
  e->set_cause(error.cause);
  return out;
}

gw::ErrorKind ToProto(util::ErrorKind kind) {
  switch (kind) {
    case util::ErrorKind::kEncoding:
      return gw::ERROR_KIND_ENCODING;
    case util::ErrorKind::kDecoding:
      return gw::ERROR_KIND_DECODING;
    case util::ErrorKind::kTransport:
      return gw::ERROR_KIND_TRANSPORT;
    case util::ErrorKind::kNotFound:
      return gw::ERROR_KIND_NOT_FOUND;
    case util::ErrorKind::kInvalidArgument:
      return gw::ERROR_KIND_INVALID_ARGUMENT;
    case util::ErrorKind::kUnavailable:
      return gw::ERROR_KIND_UNAVAILABLE;
    case util::ErrorKind::kDeadlineExceeded:
      return gw::ERROR_KIND_DEADLINE_EXCEEDED;
    case util::ErrorKind::kUnroutable:
      return gw::ERROR_KIND_UNROUTABLE;
    case util::ErrorKind::kInternal:
      return gw::ERROR_KIND_INTERNAL;
  }
  return gw::ERROR_KIND_INTERNAL;
}

util::ErrorKind FromProto(gw::ErrorKind kind) {
  switch (kind) {
    case gw::ERROR_KIND_ENCODING:
      return util::ErrorKind::kEncoding;
    case gw::ERROR_KIND_DECODING:
      return util::ErrorKind::kDecoding;
    case gw::ERROR_KIND_TRANSPORT:
      return util::ErrorKind::kTransport;
    case gw::ERROR_KIND_NOT_FOUND:
      return util::ErrorKind::kNotFound;
    case gw::ERROR_KIND_INVALID_ARGUMENT:
      return util::ErrorKind::kInvalidArgument;
    case gw::ERROR_KIND_UNAVAILABLE:
      return util::ErrorKind::kUnavailable;
    case gw::ERROR_KIND_DEADLINE_EXCEEDED:
      return util::ErrorKind::kDeadlineExceeded;
    case gw::ERROR_KIND_UNROUTABLE:
      return util::ErrorKind::kUnroutable;
    default:
      return util::ErrorKind::kInternal;
  }
}

gw::Value ToProto(const db::sql::Value& value) {
  gw::Value out;
  // clang-format off
  std::visit([&](const auto& v) {
    using V = std::decay_t<decltype(v)>;
    if constexpr (std::is_same_v<V, std::nullptr_t>)      out.set_null_value(true);
    else if constexpr (std::is_same_v<V, int64_t>)        out.set_int_value(v);
    else if constexpr (std::is_same_v<V, double>)         out.set_double_value(v);
    else if constexpr (std::is_same_v<V, std::string>)    out.set_text_value(v);
    else                                                  out.set_blob_value(v.bytes);
  }, value);
  // clang-format on
  return out;
}

db::sql::Value FromProto(const gw::Value& value) {
  switch (value.kind_case()) {
    case gw::Value::kIntValue:
      return value.int_value();
    case gw::Value::kDoubleValue:
      return value.double_value();
    case gw::Value::kTextValue:
      return value.text_value();
    case gw::Value::kBlobValue:
      return db::sql::Blob{value.blob_value()};
    default:
      return nullptr;
  }
}

} // namespace taskgate::grpc
