#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include <grpcpp/support/channel_arguments.h>

#include "config/config.pb.h"

namespace taskgate::transport {

/*
  Per-deployment tunables of the multiplexed HTTP/2 transport.

  These are configuration, never code paths: every value lands in the
  grpc::ChannelArguments of each pooled channel.
*/
struct ChannelOptions {
  std::string target;

  std::uint32_t pool_size = 1;

  std::chrono::milliseconds keep_alive_interval{30'000};
  std::chrono::milliseconds keep_alive_timeout{10'000};
  bool                      keep_alive_while_idle = true;

  std::uint32_t initial_window_bytes = 1024 * 1024;
  bool          adaptive_window      = true;
  // no write coalescing delay on the send path
  bool low_latency = true;

  // Floor of each connection attempt's deadline, not a bound on the whole
  // connect. gRPC reads it from GRPC_ARG_MIN_RECONNECT_BACKOFF_MS, so it also
  // acts as the minimum reconnect backoff.
  std::chrono::milliseconds connect_timeout{5'000};
  std::chrono::milliseconds default_deadline{30'000};

  // consecutive DEADLINE_EXCEEDED results that retire a channel
  std::uint32_t fault_threshold = 3;

  bool compress_list_responses = true;

  std::size_t max_send_message_size    = 8 * 1024 * 1024;
  std::size_t max_receive_message_size = 8 * 1024 * 1024;
};

// Request metadata asking the task service to gzip its responses for this call.
inline constexpr char kResponseCompressionKey[] = "taskgate-response-compression";

ChannelOptions ChannelOptionsFromConfig(const taskgate::runtime::config::ChannelConfig& channel,
                                        const taskgate::runtime::config::WireConfig&    wire);

// `slot` keeps arguments distinct per pooled channel so each gets its own connection.
::grpc::ChannelArguments BuildChannelArguments(const ChannelOptions& options, std::size_t slot);

} // namespace taskgate::transport
