#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

#include "internal/queue/queue_publisher.hpp"

namespace taskgate::queue {

struct QueuedMessage {
  std::string subject;
  std::string message_id;
  std::string payload;
};

/*
  In-process bounded broker.

  Publish never blocks: a full broker nacks with retryable=true, a broker
  that was shut down nacks with retryable=false. Workers drain it through
  the blocking Dequeue().
*/
class MemoryBroker : public QueuePublisher {
 public:
  explicit MemoryBroker(std::size_t capacity);

  void Publish(std::string subject, std::string payload, PublishCallback done) override;

  // blocking wait; nullopt once shut down and drained
  std::optional<QueuedMessage> Dequeue();

  void Shutdown();

  std::size_t Depth() const;

  std::size_t Capacity() const {
    return capacity_;
  }

 private:
  const std::size_t capacity_;

  mutable std::mutex        mutex_;
  std::condition_variable   cv_;
  std::deque<QueuedMessage> queue_;
  bool                      shutdown_ = false;
};

} // namespace taskgate::queue
