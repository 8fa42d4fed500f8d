#include "time.hpp"

namespace taskgate::util {

TimePoint Now() {
  return Clock::now();
}

int64_t ToUnixSeconds(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixSeconds(int64_t seconds) {
  return TimePoint{} + std::chrono::seconds(seconds);
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace taskgate::util
