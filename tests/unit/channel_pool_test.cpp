#include "internal/transport/channel_pool.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <cstring>
#include <iostream>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

#include <grpc/grpc.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include "internal/util/errors.hpp"

namespace {

using taskgate::transport::ChannelOptions;
using taskgate::transport::ChannelPool;

// Channels are lazy: nothing dials 127.0.0.1:1 unless a call is made.
ChannelPool::ChannelFactory CountingFactory(std::atomic<int>& created) {
  return [&created](const ChannelOptions&, const ::grpc::ChannelArguments& args) {
    ++created;
    return ::grpc::CreateCustomChannel("dns:///127.0.0.1:1", ::grpc::InsecureChannelCredentials(), args);
  };
}

ChannelOptions Options(std::uint32_t pool_size) {
  ChannelOptions options;
  options.target          = "pool-test";
  options.pool_size       = pool_size;
  options.fault_threshold = 3;
  return options;
}

void TestChannelsAreCreatedLazilyAndShared() {
  std::atomic<int> created{0};
  auto             pool = ChannelPool::Create(Options(1), CountingFactory(created));
  assert(created == 0);
  assert(pool->GetStats().live == 0);

  auto a = pool->Acquire();
  auto b = pool->Acquire();
  assert(created == 1);
  assert(a->channel == b->channel);
  assert(pool->GetStats().outstanding == 2);

  a.reset();
  b.reset();
  assert(pool->GetStats().outstanding == 0);
  assert(pool->GetStats().live == 1);
}

void TestSlotsAreUsedRoundRobin() {
  std::atomic<int> created{0};
  auto             pool = ChannelPool::Create(Options(3), CountingFactory(created));

  std::set<std::size_t> slots;
  for (int i = 0; i < 6; ++i) {
    slots.insert(pool->Acquire()->slot);
  }
  assert(slots.size() == 3);
  assert(created == 3);
  assert(pool->GetStats().created == 3);
}

void TestWarmupFillsEverySlot() {
  std::atomic<int> created{0};
  auto             pool = ChannelPool::Create(Options(4), CountingFactory(created));
  (void)pool->Acquire();

  pool->Warmup();
  assert(created == 4);
  const auto stats = pool->GetStats();
  assert(stats.live == 4);
  assert(stats.created == 4);
  assert(stats.outstanding == 0);

  // a second warmup reuses the installed channels
  pool->Warmup();
  assert(created == 4);

  std::set<std::size_t> slots;
  for (int i = 0; i < 8; ++i) {
    slots.insert(pool->Acquire()->slot);
  }
  assert(slots.size() == 4);
  assert(created == 4);
}

int IntArgument(const ::grpc::ChannelArguments& args, const char* key) {
  const auto raw = args.c_channel_args();
  for (std::size_t i = 0; i < raw.num_args; ++i) {
    if (std::strcmp(raw.args[i].key, key) == 0 && raw.args[i].type == GRPC_ARG_INTEGER) {
      return raw.args[i].value.integer;
    }
  }
  return -1;
}

void TestConnectTimeoutBoundsEachAttempt() {
  auto options            = Options(2);
  options.connect_timeout = std::chrono::milliseconds(750);

  const auto args = taskgate::transport::BuildChannelArguments(options, 1);
  assert(IntArgument(args, GRPC_ARG_MIN_RECONNECT_BACKOFF_MS) == 750);
  assert(IntArgument(args, "taskgate.pool_slot") == 1);
  assert(IntArgument(args, GRPC_ARG_USE_LOCAL_SUBCHANNEL_POOL) == 1);
}

void TestUnavailableRetiresTheChannel() {
  std::atomic<int> created{0};
  auto             pool = ChannelPool::Create(Options(1), CountingFactory(created));

  auto first = pool->Acquire();
  pool->ReportResult(*first, ::grpc::Status(::grpc::StatusCode::UNAVAILABLE, "connection reset"));
  assert(pool->GetStats().retired == 1);
  assert(pool->GetStats().live == 0);

  // the retired handle stays usable by whoever still holds it
  assert(first->channel != nullptr);

  auto second = pool->Acquire();
  assert(second->generation == first->generation + 1);
  assert(created == 2);

  // a stale report against the old generation is ignored
  pool->ReportResult(*first, ::grpc::Status(::grpc::StatusCode::UNAVAILABLE, "late"));
  assert(pool->GetStats().retired == 1);
}

void TestRepeatedDeadlinesRetireAtThreshold() {
  std::atomic<int> created{0};
  auto             pool = ChannelPool::Create(Options(1), CountingFactory(created));
  auto             handle = pool->Acquire();

  const ::grpc::Status deadline(::grpc::StatusCode::DEADLINE_EXCEEDED, "slow");
  pool->ReportResult(*handle, deadline);
  pool->ReportResult(*handle, deadline);
  pool->ReportResult(*handle, ::grpc::Status::OK);
  pool->ReportResult(*handle, deadline);
  pool->ReportResult(*handle, deadline);
  assert(pool->GetStats().retired == 0);

  pool->ReportResult(*handle, deadline);
  assert(pool->GetStats().retired == 1);
}

void TestCancelledSaysNothingAboutTheTransport() {
  std::atomic<int> created{0};
  auto             pool   = ChannelPool::Create(Options(1), CountingFactory(created));
  auto             handle = pool->Acquire();

  for (int i = 0; i < 10; ++i) {
    pool->ReportResult(*handle, ::grpc::Status(::grpc::StatusCode::CANCELLED, "caller gave up"));
  }
  assert(pool->GetStats().retired == 0);
  assert(pool->GetStats().live == 1);
}

void TestFactoryFailureIsATransportError() {
  auto null_pool = ChannelPool::Create(Options(1), [](const ChannelOptions&, const ::grpc::ChannelArguments&) {
    return std::shared_ptr<::grpc::Channel>();
  });

  bool threw = false;
  try {
    (void)null_pool->Acquire();
  } catch (const taskgate::util::TransportError& e) {
    threw = e.Kind() == taskgate::util::ErrorKind::kTransport;
  }
  assert(threw);

  auto throwing_pool = ChannelPool::Create(Options(1), [](const ChannelOptions&, const ::grpc::ChannelArguments&)
                                                           -> std::shared_ptr<::grpc::Channel> { throw std::runtime_error("no route"); });
  threw = false;
  try {
    (void)throwing_pool->Acquire();
  } catch (const taskgate::util::TransportError&) {
    threw = true;
  }
  assert(threw);
  assert(throwing_pool->GetStats().outstanding == 0);
}

void TestConcurrentAcquireAndRetire() {
  std::atomic<int> created{0};
  auto             pool = ChannelPool::Create(Options(4), CountingFactory(created));

  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&pool, t] {
      for (int i = 0; i < 500; ++i) {
        auto handle = pool->Acquire();
        assert(handle->channel != nullptr);
        if ((i + t) % 97 == 0) {
          pool->ReportResult(*handle, ::grpc::Status(::grpc::StatusCode::UNAVAILABLE, "flap"));
        }
      }
    });
  }
  for (auto& thread : threads) thread.join();

  const auto stats = pool->GetStats();
  assert(stats.outstanding == 0);
  assert(stats.live <= stats.slots);
  assert(stats.created == stats.live + stats.retired);
}

void TestHandlesOutliveThePool() {
  std::atomic<int> created{0};
  auto             pool   = ChannelPool::Create(Options(1), CountingFactory(created));
  auto             handle = pool->Acquire();
  pool.reset();
  assert(handle->channel != nullptr);
  handle.reset();
}

} // namespace

int main() {
  TestChannelsAreCreatedLazilyAndShared();
  TestSlotsAreUsedRoundRobin();
  TestWarmupFillsEverySlot();
  TestConnectTimeoutBoundsEachAttempt();
  TestUnavailableRetiresTheChannel();
  TestRepeatedDeadlinesRetireAtThreshold();
  TestCancelledSaysNothingAboutTheTransport();
  TestFactoryFailureIsATransportError();
  TestConcurrentAcquireAndRetire();
  TestHandlesOutliveThePool();

  std::cout << "taskgate_unit_channel_pool: pass\n";
  return 0;
}
