#include "internal/codec/task_codec.hpp"

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/stubs/common.h>

#include "internal/util/errors.hpp"

namespace taskgate::codec {

namespace pb = taskgate::tasks::v1;

using util::DecodingError;
using util::EncodingError;

namespace {

constexpr std::size_t kIdSize = 16;

pb::Priority ToWire(model::Priority p) {
  if (!model::IsKnown(p)) {
    throw EncodingError("priority discriminant out of range: " + std::to_string(static_cast<int>(p)));
  }
  return static_cast<pb::Priority>(p);
}

pb::Status ToWire(model::Status s) {
  if (!model::IsKnown(s)) {
    throw EncodingError("status discriminant out of range: " + std::to_string(static_cast<int>(s)));
  }
  return static_cast<pb::Status>(s);
}

model::Priority PriorityFromWire(int value) {
  if (!pb::Priority_IsValid(value)) {
    throw DecodingError("unrecognized priority discriminant: " + std::to_string(value));
  }
  return static_cast<model::Priority>(value);
}

model::Status StatusFromWire(int value) {
  if (!pb::Status_IsValid(value)) {
    throw DecodingError("unrecognized status discriminant: " + std::to_string(value));
  }
  return static_cast<model::Status>(value);
}

model::TaskId IdFromWire(std::string_view field, const std::string& bytes) {
  if (bytes.size() != kIdSize) {
    throw DecodingError(std::string(field) + " must be 16 bytes, got " + std::to_string(bytes.size()));
  }
  return util::FromBytes(bytes);
}

} // namespace

TaskCodec::TaskCodec(CodecLimits limits) : limits_(limits) {
}

void TaskCodec::CheckText(std::string_view field, const std::string& value) const {
  if (value.size() > limits_.max_encoding_message_size) {
    throw EncodingError(std::string(field) + " exceeds max encoding size (" + std::to_string(value.size()) + " > " +
                        std::to_string(limits_.max_encoding_message_size) + ")");
  }
  // proto3 serialization only logs bad utf-8; the peer's parser rejects it
  if (!google::protobuf::internal::IsStructurallyValidUTF8(value.data(), static_cast<int>(value.size()))) {
    throw EncodingError(std::string(field) + " is not valid utf-8");
  }
}

void TaskCodec::CheckEncodedSize(const google::protobuf::MessageLite& message) const {
  const auto size = message.ByteSizeLong();
  if (size > limits_.max_encoding_message_size) {
    throw EncodingError("encoded message exceeds max encoding size (" + std::to_string(size) + " > " +
                        std::to_string(limits_.max_encoding_message_size) + ")");
  }
}

pb::Task TaskCodec::ToMessage(const model::Task& task) const {
  CheckText("title", task.title);
  CheckText("description", task.description);

  pb::Task out;
  out.set_id(util::ToBytes(task.id));
  out.set_title(task.title);
  out.set_description(task.description);
  out.set_completed(task.completed);
  if (task.project_id) {
    out.set_project_id(util::ToBytes(*task.project_id));
  }
  out.set_priority(ToWire(task.priority));
  out.set_status(ToWire(task.status));
  if (task.due_date) {
    out.set_due_date(*task.due_date);
  }
  out.set_created_at(task.created_at);
  out.set_updated_at(task.updated_at);

  CheckEncodedSize(out);
  return out;
}

model::Task TaskCodec::FromMessage(const pb::Task& message) const {
  if (!message.has_created_at() || !message.has_updated_at()) {
    throw DecodingError("truncated task record: missing timestamps");
  }

  model::Task task;
  task.id          = IdFromWire("id", message.id());
  task.title       = message.title();
  task.description = message.description();
  task.completed   = message.completed();
  if (message.has_project_id()) {
    task.project_id = IdFromWire("project_id", message.project_id());
  }
  task.priority = PriorityFromWire(message.priority());
  task.status   = StatusFromWire(message.status());
  if (message.has_due_date()) {
    task.due_date = message.due_date();
  }
  task.created_at = message.created_at();
  task.updated_at = message.updated_at();
  return task;
}

std::string TaskCodec::Encode(const model::Task& task) const {
  const auto message = ToMessage(task);

  std::string out;
  {
    google::protobuf::io::StringOutputStream stream(&out);
    google::protobuf::io::CodedOutputStream  coded(&stream);
    coded.SetSerializationDeterministic(true);
    if (!message.SerializeToCodedStream(&coded)) {
      throw EncodingError("task serialization failed");
    }
  }
  return out;
}

model::Task TaskCodec::Decode(std::string_view bytes) const {
  if (bytes.size() > limits_.max_decoding_message_size) {
    throw DecodingError("message exceeds max decoding size (" + std::to_string(bytes.size()) + " > " +
                        std::to_string(limits_.max_decoding_message_size) + ")");
  }

  pb::Task message;
  if (!message.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
    throw DecodingError("malformed or truncated task record");
  }
  return FromMessage(message);
}

pb::CreateRequest TaskCodec::ToMessage(const model::NewTask& task) const {
  CheckText("title", task.title);
  CheckText("description", task.description);

  pb::CreateRequest out;
  out.set_title(task.title);
  out.set_description(task.description);
  out.set_completed(task.completed);
  if (task.project_id) {
    out.set_project_id(util::ToBytes(*task.project_id));
  }
  out.set_priority(ToWire(task.priority));
  out.set_status(ToWire(task.status));
  if (task.due_date) {
    out.set_due_date(*task.due_date);
  }

  CheckEncodedSize(out);
  return out;
}

model::NewTask TaskCodec::FromMessage(const pb::CreateRequest& message) const {
  model::NewTask task;
  task.title       = message.title();
  task.description = message.description();
  task.completed   = message.completed();
  if (message.has_project_id()) {
    task.project_id = IdFromWire("project_id", message.project_id());
  }
  task.priority = PriorityFromWire(message.priority());
  task.status   = StatusFromWire(message.status());
  if (message.has_due_date()) {
    task.due_date = message.due_date();
  }
  return task;
}

pb::ListRequest TaskCodec::ToMessage(const model::TaskFilter& filter) const {
  pb::ListRequest out;
  if (filter.project_id) {
    out.set_project_id(util::ToBytes(*filter.project_id));
  }
  if (filter.status) {
    out.set_status(ToWire(*filter.status));
  }
  if (filter.priority) {
    out.set_priority(ToWire(*filter.priority));
  }
  if (filter.completed) {
    out.set_completed(*filter.completed);
  }
  out.set_limit(filter.limit);
  out.set_offset(filter.offset);
  return out;
}

model::TaskFilter TaskCodec::FromMessage(const pb::ListRequest& message) const {
  model::TaskFilter filter;
  if (message.has_project_id()) {
    filter.project_id = IdFromWire("project_id", message.project_id());
  }
  if (message.has_status()) {
    filter.status = StatusFromWire(message.status());
  }
  if (message.has_priority()) {
    filter.priority = PriorityFromWire(message.priority());
  }
  if (message.has_completed()) {
    filter.completed = message.completed();
  }
  filter.limit  = message.limit();
  filter.offset = message.offset();
  return filter;
}

} // namespace taskgate::codec
