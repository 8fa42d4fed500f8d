#include "internal/queue/memory_broker.hpp"

#include "internal/util/uuid.hpp"

namespace taskgate::queue {

MemoryBroker::MemoryBroker(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
}

void MemoryBroker::Publish(std::string subject, std::string payload, PublishCallback done) {
  PublishAck ack;
  ack.subject = subject;

  {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
      ack.reason = "broker is shut down";
    } else if (queue_.size() >= capacity_) {
      ack.retryable = true;
      ack.reason    = "broker at capacity (" + std::to_string(capacity_) + ")";
    } else {
      ack.accepted   = true;
      ack.message_id = util::ToString(util::GenerateUUID());
      queue_.push_back(QueuedMessage{std::move(subject), ack.message_id, std::move(payload)});
    }
  }

  if (ack.accepted) {
    cv_.notify_one();
  }
  done(std::move(ack));
}

std::optional<QueuedMessage> MemoryBroker::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  QueuedMessage message = std::move(queue_.front());
  queue_.pop_front();
  return message;
}

void MemoryBroker::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t MemoryBroker::Depth() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace taskgate::queue
