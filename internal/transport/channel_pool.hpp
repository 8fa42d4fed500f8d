#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <vector>

#include <grpcpp/channel.h>
#include <grpcpp/support/status.h>

#include "internal/transport/channel_options.hpp"

namespace taskgate::transport {

/*
  A pooled, shareable transport handle.

  Any number of callers may hold and use the same handle concurrently; the
  channel below multiplexes their calls as HTTP/2 streams. Dropping the last
  reference returns it to the pool's accounting.
*/
struct PooledChannel {
  std::shared_ptr<::grpc::Channel> channel;
  std::size_t                      slot       = 0;
  std::uint64_t                    generation = 0;
};

using ChannelHandle = std::shared_ptr<const PooledChannel>;

/*
  ChannelPool

  Fixed number of slots, each lazily holding one grpc::Channel. Acquire()
  picks a slot round-robin and only takes the exclusive lock for the
  in-memory install of a freshly created channel. No lock is ever held while
  a call is in flight.

  Faults reported through ReportResult() retire the slot's channel; the next
  Acquire() on that slot creates a replacement. The pool never retries calls.
*/
class ChannelPool : public std::enable_shared_from_this<ChannelPool> {
 public:
  using ChannelFactory = std::function<std::shared_ptr<::grpc::Channel>(const ChannelOptions&, const ::grpc::ChannelArguments&)>;

  struct Stats {
    std::size_t   slots       = 0;
    std::size_t   live        = 0;
    std::size_t   outstanding = 0;
    std::uint64_t created     = 0;
    std::uint64_t retired     = 0;
  };

  // Default factory: insecure channel to options.target.
  static std::shared_ptr<ChannelPool> Create(ChannelOptions options, ChannelFactory factory = {});

  ChannelPool(const ChannelPool&)            = delete;
  ChannelPool& operator=(const ChannelPool&) = delete;

  // Throws util::TransportError when no channel can be established.
  ChannelHandle Acquire();

  // Creates every slot up front and asks each channel to start connecting.
  // Does not wait for the connections. Throws like Acquire().
  void Warmup();

  // Feed every finished call's status back so faults can retire the channel.
  void ReportResult(const PooledChannel& handle, const ::grpc::Status& status);

  Stats GetStats() const;

  const ChannelOptions& Options() const {
    return options_;
  }

 private:
  struct Slot {
    std::shared_ptr<::grpc::Channel> channel;
    std::uint64_t                    generation = 0;
    std::atomic<std::uint32_t>       consecutive_timeouts{0};
  };

  ChannelPool(ChannelOptions options, ChannelFactory factory);

  ChannelHandle AcquireSlot(std::size_t slot);
  ChannelHandle Wrap(std::shared_ptr<::grpc::Channel> channel, std::size_t slot, std::uint64_t generation);
  void          Release();
  void          Retire(const PooledChannel& handle, const char* reason);
  void          PublishGauge(std::size_t live) const;

  ChannelOptions options_;
  ChannelFactory factory_;

  mutable std::shared_mutex mutex_;
  std::vector<Slot>         slots_;
  std::size_t               live_    = 0;
  std::uint64_t             created_ = 0;
  std::uint64_t             retired_ = 0;

  std::atomic<std::size_t> next_{0};
  std::atomic<std::size_t> outstanding_{0};
};

} // namespace taskgate::transport
