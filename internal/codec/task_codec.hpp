#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "internal/model/task.hpp"
#include "taskgate/tasks/v1/tasks.pb.h"

namespace taskgate::codec {

inline constexpr std::size_t kDefaultMaxMessageSize = 8 * 1024 * 1024;

struct CodecLimits {
  std::size_t max_encoding_message_size = kDefaultMaxMessageSize;
  std::size_t max_decoding_message_size = kDefaultMaxMessageSize;
};

/*
  TaskCodec

  Maps model::Task to and from its binary wire form (taskgate.tasks.v1.Task).

  Layout per record:
    id          16 raw bytes
    title       length-prefixed utf-8
    description length-prefixed utf-8
    completed   varint bool
    project_id  optional 16 raw bytes
    priority    1 byte discriminant
    status      1 byte discriminant
    due_date    optional sfixed64 seconds
    created_at  sfixed64 seconds
    updated_at  sfixed64 seconds, always the last field on the wire

  Encode is deterministic. Encode failures throw util::EncodingError,
  decode failures throw util::DecodingError. Discriminant zero is the
  legal "unspecified" state.
*/
class TaskCodec {
 public:
  explicit TaskCodec(CodecLimits limits = {});

  std::string Encode(const model::Task& task) const;
  model::Task Decode(std::string_view bytes) const;

  taskgate::tasks::v1::Task ToMessage(const model::Task& task) const;
  model::Task               FromMessage(const taskgate::tasks::v1::Task& message) const;

  taskgate::tasks::v1::CreateRequest ToMessage(const model::NewTask& task) const;
  model::NewTask                     FromMessage(const taskgate::tasks::v1::CreateRequest& message) const;

  taskgate::tasks::v1::ListRequest ToMessage(const model::TaskFilter& filter) const;
  model::TaskFilter                FromMessage(const taskgate::tasks::v1::ListRequest& message) const;

  const CodecLimits& Limits() const {
    return limits_;
  }

 private:
  void CheckText(std::string_view field, const std::string& value) const;
  void CheckEncodedSize(const google::protobuf::MessageLite& message) const;

  CodecLimits limits_;
};

} // namespace taskgate::codec
