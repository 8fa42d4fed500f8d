#include "internal/queue/job_worker.hpp"

#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace taskgate::queue {

using observability::StringField;

JobWorker::JobWorker(std::shared_ptr<MemoryBroker> broker, Handler handler, std::string name)
    : broker_(std::move(broker)), handler_(std::move(handler)), name_(std::move(name)) {
}

JobWorker::~JobWorker() {
  Stop();
}

void JobWorker::Start() {
  thread_ = std::thread(&JobWorker::Run, this);
}

void JobWorker::Stop() {
  broker_->Shutdown();
  if (thread_.joinable()) thread_.join();
}

void JobWorker::Run() {
  for (;;) {
    auto message = broker_->Dequeue();
    if (!message) break;

    const auto started = std::chrono::steady_clock::now();
    try {
      handler_(*message);
      ++processed_;
    } catch (const std::exception& e) {
      ++failed_;
      TASKGATE_LOG_ERROR("job failed", {StringField("worker", name_), StringField("subject", message->subject),
                                        StringField("message_id", message->message_id), StringField("error", e.what())});
    }

    const std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - started;
    observability::Metrics::Instance().ObserveJobDurationMs(message->subject, elapsed.count());
  }
}

} // namespace taskgate::queue
