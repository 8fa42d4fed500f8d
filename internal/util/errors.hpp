#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace taskgate::util {

/*
  Central error taxonomy.

  Every failure that crosses a component boundary is one of these kinds.
  Exceptions below carry their kind; gRPC adapters and the error unifier
  translate them into status codes or Error values.
*/

enum class ErrorKind {
  kEncoding,
  kDecoding,
  kTransport,
  kNotFound,
  kInvalidArgument,
  kUnavailable,
  kDeadlineExceeded,
  kUnroutable,
  kInternal,
};

class TaskgateError : public std::runtime_error {
 public:
  TaskgateError(ErrorKind kind, const std::string& msg, std::string cause = {})
      : std::runtime_error(msg), kind_(kind), cause_(std::move(cause)) {
  }

  ErrorKind Kind() const {
    return kind_;
  }

  const std::string& Cause() const {
    return cause_;
  }

 private:
  ErrorKind   kind_;
  std::string cause_;
};

class EncodingError : public TaskgateError {
 public:
  explicit EncodingError(const std::string& msg) : TaskgateError(ErrorKind::kEncoding, msg) {
  }
};

class DecodingError : public TaskgateError {
 public:
  explicit DecodingError(const std::string& msg) : TaskgateError(ErrorKind::kDecoding, msg) {
  }
};

class TransportError : public TaskgateError {
 public:
  explicit TransportError(const std::string& msg, std::string cause = {})
      : TaskgateError(ErrorKind::kTransport, msg, std::move(cause)) {
  }
};

class NotFound : public TaskgateError {
 public:
  explicit NotFound(const std::string& msg) : TaskgateError(ErrorKind::kNotFound, msg) {
  }
};

class InvalidArgument : public TaskgateError {
 public:
  explicit InvalidArgument(const std::string& msg) : TaskgateError(ErrorKind::kInvalidArgument, msg) {
  }
};

class Unavailable : public TaskgateError {
 public:
  explicit Unavailable(const std::string& msg, std::string cause = {})
      : TaskgateError(ErrorKind::kUnavailable, msg, std::move(cause)) {
  }
};

class DeadlineExceeded : public TaskgateError {
 public:
  explicit DeadlineExceeded(const std::string& msg) : TaskgateError(ErrorKind::kDeadlineExceeded, msg) {
  }
};

class UnroutableRequest : public TaskgateError {
 public:
  explicit UnroutableRequest(const std::string& msg) : TaskgateError(ErrorKind::kUnroutable, msg) {
  }
};

class Internal : public TaskgateError {
 public:
  explicit Internal(const std::string& msg, std::string cause = {})
      : TaskgateError(ErrorKind::kInternal, msg, std::move(cause)) {
  }
};

inline std::string_view ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kEncoding:
      return "EncodingError";
    case ErrorKind::kDecoding:
      return "DecodingError";
    case ErrorKind::kTransport:
      return "TransportError";
    case ErrorKind::kNotFound:
      return "NotFound";
    case ErrorKind::kInvalidArgument:
      return "InvalidArgument";
    case ErrorKind::kUnavailable:
      return "Unavailable";
    case ErrorKind::kDeadlineExceeded:
      return "DeadlineExceeded";
    case ErrorKind::kUnroutable:
      return "UnroutableRequest";
    case ErrorKind::kInternal:
      return "Internal";
  }
  return "Internal";
}

} // namespace taskgate::util
