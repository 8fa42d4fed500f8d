#include "internal/transport/channel_pool.hpp"

#include <mutex>

#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace taskgate::transport {

using observability::IntField;
using observability::StringField;

namespace {

std::shared_ptr<::grpc::Channel> DefaultFactory(const ChannelOptions& options, const ::grpc::ChannelArguments& args) {
  return ::grpc::CreateCustomChannel(options.target, ::grpc::InsecureChannelCredentials(), args);
}

} // namespace

std::shared_ptr<ChannelPool> ChannelPool::Create(ChannelOptions options, ChannelFactory factory) {
  return std::shared_ptr<ChannelPool>(new ChannelPool(std::move(options), std::move(factory)));
}

ChannelPool::ChannelPool(ChannelOptions options, ChannelFactory factory)
    : options_(std::move(options)),
      factory_(factory ? std::move(factory) : ChannelFactory(DefaultFactory)),
      slots_(options_.pool_size == 0 ? 1 : options_.pool_size) {
}

ChannelHandle ChannelPool::Acquire() {
  return AcquireSlot(next_.fetch_add(1, std::memory_order_relaxed) % slots_.size());
}

ChannelHandle ChannelPool::AcquireSlot(std::size_t slot) {
  {
    std::shared_lock lock(mutex_);
    const auto&      s = slots_[slot];
    if (s.channel) {
      return Wrap(s.channel, slot, s.generation);
    }
  }

  // Channel creation does not touch the network; connecting happens on first call.
  std::shared_ptr<::grpc::Channel> fresh;
  try {
    fresh = factory_(options_, BuildChannelArguments(options_, slot));
  } catch (const std::exception& e) {
    throw util::TransportError("failed to create channel to " + options_.target, e.what());
  }
  if (!fresh) {
    throw util::TransportError("failed to create channel to " + options_.target, "factory returned no channel");
  }

  std::shared_ptr<::grpc::Channel> channel;
  std::uint64_t                    generation = 0;
  std::size_t                      live       = 0;
  bool                             installed  = false;
  {
    std::unique_lock lock(mutex_);
    auto&            s = slots_[slot];
    if (!s.channel) {
      // another caller may have raced us here; first install wins
      s.channel = std::move(fresh);
      ++s.generation;
      s.consecutive_timeouts.store(0, std::memory_order_relaxed);
      ++live_;
      ++created_;
      installed = true;
    }
    channel    = s.channel;
    generation = s.generation;
    live       = live_;
  }

  if (installed) {
    TASKGATE_LOG_INFO("pool channel created", {StringField("target", options_.target), IntField("slot", static_cast<int64_t>(slot)),
                                               IntField("generation", static_cast<int64_t>(generation))});
    PublishGauge(live);
  }
  return Wrap(std::move(channel), slot, generation);
}

void ChannelPool::Warmup() {
  for (std::size_t i = 0; i < slots_.size(); ++i) {
    AcquireSlot(i)->channel->GetState(/*try_to_connect=*/true);
  }
}

ChannelHandle ChannelPool::Wrap(std::shared_ptr<::grpc::Channel> channel, std::size_t slot, std::uint64_t generation) {
  outstanding_.fetch_add(1, std::memory_order_relaxed);

  std::weak_ptr<ChannelPool> weak_self = shared_from_this();
  return ChannelHandle(new PooledChannel{std::move(channel), slot, generation}, [weak_self](const PooledChannel* released) {
    if (auto self = weak_self.lock()) {
      self->Release();
    }
    delete released;
  });
}

void ChannelPool::Release() {
  outstanding_.fetch_sub(1, std::memory_order_relaxed);
}

void ChannelPool::ReportResult(const PooledChannel& handle, const ::grpc::Status& status) {
  if (handle.slot >= slots_.size()) {
    return;
  }
  auto& slot = slots_[handle.slot];

  switch (status.error_code()) {
    case ::grpc::StatusCode::UNAVAILABLE:
      Retire(handle, "unavailable");
      return;
    case ::grpc::StatusCode::DEADLINE_EXCEEDED: {
      const auto timeouts = slot.consecutive_timeouts.fetch_add(1, std::memory_order_relaxed) + 1;
      if (timeouts >= options_.fault_threshold) {
        Retire(handle, "repeated deadline exceeded");
      }
      return;
    }
    case ::grpc::StatusCode::CANCELLED:
      // caller-initiated, says nothing about the transport
      return;
    default:
      slot.consecutive_timeouts.store(0, std::memory_order_relaxed);
      return;
  }
}

void ChannelPool::Retire(const PooledChannel& handle, const char* reason) {
  std::size_t live = 0;
  {
    std::unique_lock lock(mutex_);
    auto&            s = slots_[handle.slot];
    // a newer channel already replaced the faulted one
    if (!s.channel || s.generation != handle.generation) {
      return;
    }
    s.channel.reset();
    s.consecutive_timeouts.store(0, std::memory_order_relaxed);
    --live_;
    ++retired_;
    live = live_;
  }

  TASKGATE_LOG_WARN("pool channel retired", {StringField("target", options_.target), IntField("slot", static_cast<int64_t>(handle.slot)),
                                             IntField("generation", static_cast<int64_t>(handle.generation)), StringField("reason", reason)});
  PublishGauge(live);
}

ChannelPool::Stats ChannelPool::GetStats() const {
  std::shared_lock lock(mutex_);
  Stats            stats;
  stats.slots       = slots_.size();
  stats.live        = live_;
  stats.outstanding = outstanding_.load(std::memory_order_relaxed);
  stats.created     = created_;
  stats.retired     = retired_;
  return stats;
}

void ChannelPool::PublishGauge(std::size_t live) const {
  observability::Metrics::Instance().SetPoolHandles(options_.target, live);
}

} // namespace taskgate::transport
