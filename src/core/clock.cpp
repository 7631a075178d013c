#include "alog/core/clock.h"

#include <chrono>

namespace alog::core {

UnixSeconds SystemClock::now_unix_seconds() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::seconds>(now).count();
}

UnixSeconds FixedClock::now_unix_seconds() {
  return fixed_time_.load();
}

}  // namespace alog::core
