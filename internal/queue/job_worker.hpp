#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include "internal/queue/memory_broker.hpp"

namespace taskgate::queue {

/*
  Background consumer of a MemoryBroker.

  Each message goes to `handler`. A handler that throws only produces a log
  line; the publisher already holds its acknowledgment.
*/
class JobWorker {
 public:
  using Handler = std::function<void(const QueuedMessage&)>;

  JobWorker(std::shared_ptr<MemoryBroker> broker, Handler handler, std::string name = "job-worker");
  ~JobWorker();

  JobWorker(const JobWorker&)            = delete;
  JobWorker& operator=(const JobWorker&) = delete;

  void Start();

  // Shuts the broker down, then drains what is left before joining.
  void Stop();

  std::uint64_t Processed() const {
    return processed_.load();
  }

  std::uint64_t Failed() const {
    return failed_.load();
  }

 private:
  void Run();

  std::shared_ptr<MemoryBroker> broker_;
  Handler                       handler_;
  std::string                   name_;

  std::thread                thread_;
  std::atomic<std::uint64_t> processed_{0};
  std::atomic<std::uint64_t> failed_{0};
};

} // namespace taskgate::queue
