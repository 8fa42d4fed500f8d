#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "internal/agent/agent_endpoint.hpp"
#include "internal/db/api/datastore.hpp"
#include "internal/errors/error_unifier.hpp"
#include "internal/model/task.hpp"
#include "internal/transport/cancellation.hpp"

namespace taskgate::router {

enum class Operation {
  kCreate,
  kGet,
  kList,
  kListStream,
  kUpdate,
  kDelete,
  kPublish,
  kInvoke,
  kStream,
};

enum class Need {
  kDefault,
  kDeferred,
};

enum class Pattern {
  kDatastore,
  kRpc,
  kQueue,
  kAgent,
};

enum class RequestState {
  kReceived,
  kClassified,
  kDispatched,
  kCompleted,
  kFailed,
};

std::string_view OperationName(Operation op);
std::string_view PatternName(Pattern pattern);
std::string_view StateName(RequestState state);

struct CallerContext {
  std::string caller_id;
  std::string request_id;
};

// Column/value pairs for a datastore insert, in statement order.
using Record = std::vector<std::pair<std::string, db::sql::Value>>;

struct Key {
  db::sql::Value value;
};

struct Page {
  std::uint32_t limit  = 0;
  std::uint32_t offset = 0;
};

struct Prompt {
  std::string                        text;
  std::string                        session_id;
  std::map<std::string, std::string> attributes;
};

struct Bytes {
  std::string data;
};

using Payload = std::variant<std::monostate, model::NewTask, model::Task, model::TaskId, model::TaskFilter, Record, Key, Page, Prompt, Bytes>;

struct RouterRequest {
  Operation     operation = Operation::kGet;
  std::string   target_domain;
  Need          need = Need::kDefault;
  CallerContext caller;

  std::optional<std::chrono::milliseconds> deadline;
  transport::CancelToken                   cancel;

  Payload payload;
};

struct Ack {
  std::string subject;
  std::string job_id; // 16 raw bytes, empty for plain publishes
  std::string message_id;
};

struct Deleted {};

// Item count of a completed stream.
struct Streamed {
  std::uint64_t count = 0;
};

using Result = std::variant<std::monostate, model::Task, std::vector<model::Task>, db::ResultSet, Ack, agent::AgentReply, Deleted, Streamed>;

/*
  Normalized response. Exactly one of `result` (Completed) or `error`
  (Failed) is meaningful. `pattern_used` is empty when classification failed.
*/
struct RouterResponse {
  RequestState           state = RequestState::kFailed;
  std::optional<Pattern> pattern_used;
  Result                 result;
  std::optional<errors::Error> error;
};

// Partial output of a streamed dispatch: a task record or an agent text chunk.
using StreamItem = std::variant<model::Task, std::string>;

} // namespace taskgate::router
