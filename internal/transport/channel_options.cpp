#include "internal/transport/channel_options.hpp"

#include <climits>

#include <grpc/grpc.h>

namespace taskgate::transport {

namespace {

int ClampToInt(std::uint64_t value) {
  return value > static_cast<std::uint64_t>(INT_MAX) ? INT_MAX : static_cast<int>(value);
}

} // namespace

ChannelOptions ChannelOptionsFromConfig(const taskgate::runtime::config::ChannelConfig& channel,
                                        const taskgate::runtime::config::WireConfig&    wire) {
  ChannelOptions options;
  options.target = channel.target();

  if (channel.pool_size() > 0) options.pool_size = channel.pool_size();
  if (channel.keep_alive_interval_ms() > 0) options.keep_alive_interval = std::chrono::milliseconds(channel.keep_alive_interval_ms());
  if (channel.keep_alive_timeout_ms() > 0) options.keep_alive_timeout = std::chrono::milliseconds(channel.keep_alive_timeout_ms());
  if (channel.has_keep_alive_while_idle()) options.keep_alive_while_idle = channel.keep_alive_while_idle();
  if (channel.initial_window_bytes() > 0) options.initial_window_bytes = channel.initial_window_bytes();
  if (channel.has_adaptive_window()) options.adaptive_window = channel.adaptive_window();
  if (channel.has_low_latency()) options.low_latency = channel.low_latency();
  if (channel.connect_timeout_ms() > 0) options.connect_timeout = std::chrono::milliseconds(channel.connect_timeout_ms());
  if (channel.default_deadline_ms() > 0) options.default_deadline = std::chrono::milliseconds(channel.default_deadline_ms());
  if (channel.fault_threshold() > 0) options.fault_threshold = channel.fault_threshold();
  if (channel.has_compress_list_responses()) options.compress_list_responses = channel.compress_list_responses();

  if (wire.max_encoding_message_size() > 0) options.max_send_message_size = wire.max_encoding_message_size();
  if (wire.max_decoding_message_size() > 0) options.max_receive_message_size = wire.max_decoding_message_size();
  return options;
}

::grpc::ChannelArguments BuildChannelArguments(const ChannelOptions& options, std::size_t slot) {
  ::grpc::ChannelArguments args;

  args.SetInt(GRPC_ARG_KEEPALIVE_TIME_MS, ClampToInt(options.keep_alive_interval.count()));
  args.SetInt(GRPC_ARG_KEEPALIVE_TIMEOUT_MS, ClampToInt(options.keep_alive_timeout.count()));
  args.SetInt(GRPC_ARG_KEEPALIVE_PERMIT_WITHOUT_CALLS, options.keep_alive_while_idle ? 1 : 0);
  args.SetInt(GRPC_ARG_HTTP2_MAX_PINGS_WITHOUT_DATA, 0);

  args.SetInt(GRPC_ARG_HTTP2_STREAM_LOOKAHEAD_BYTES, ClampToInt(options.initial_window_bytes));
  args.SetInt(GRPC_ARG_HTTP2_BDP_PROBE, options.adaptive_window ? 1 : 0);
  if (options.low_latency) {
    args.SetInt(GRPC_ARG_HTTP2_WRITE_BUFFER_SIZE, 0);
  }

  // the subchannel uses this as its minimum connect timeout
  args.SetInt(GRPC_ARG_MIN_RECONNECT_BACKOFF_MS, ClampToInt(options.connect_timeout.count()));

  args.SetMaxSendMessageSize(ClampToInt(options.max_send_message_size));
  args.SetMaxReceiveMessageSize(ClampToInt(options.max_receive_message_size));

  if (options.pool_size > 1) {
    args.SetInt(GRPC_ARG_USE_LOCAL_SUBCHANNEL_POOL, 1);
    args.SetInt("taskgate.pool_slot", static_cast<int>(slot));
  }
  return args;
}

} // namespace taskgate::transport
