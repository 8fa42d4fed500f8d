#pragma once

#include <functional>
#include <string>

namespace taskgate::queue {

// Broker answer to a single publish.
struct PublishAck {
  bool        accepted  = false;
  bool        retryable = false;
  std::string subject;
  std::string message_id;
  std::string reason;
};

using PublishCallback = std::function<void(PublishAck)>;

/*
  Collaborator contract: publish(subject, bytes) -> ack.

  `done` runs exactly once. Once a message is accepted it belongs to the
  broker; nothing on the publishing side can take it back.
*/
class QueuePublisher {
 public:
  virtual ~QueuePublisher() = default;

  virtual void Publish(std::string subject, std::string payload, PublishCallback done) = 0;
};

} // namespace taskgate::queue
