#pragma once

#include "alog/core/types.h"

#include <atomic>

namespace alog::core {

// Abstract clock interface for timestamp injection.
// Allows production code to use system time while tests pin "now" to a known second.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return current time as whole seconds since the Unix epoch.
  virtual UnixSeconds now_unix_seconds() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: returns actual system time.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  UnixSeconds now_unix_seconds() override;
};

// Fixed clock: returns a settable timestamp for deterministic tests/demos.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(UnixSeconds fixed_time) : fixed_time_(fixed_time) {}
  ~FixedClock() override = default;

  FixedClock(const FixedClock&) = delete;
  FixedClock& operator=(const FixedClock&) = delete;
  FixedClock(FixedClock&&) = delete;
  FixedClock& operator=(FixedClock&&) = delete;

  UnixSeconds now_unix_seconds() override;

  void set(UnixSeconds value) { fixed_time_.store(value); }
  void advance(UnixSeconds seconds) { fixed_time_.fetch_add(seconds); }

 private:
  std::atomic<UnixSeconds> fixed_time_;
};

}  // namespace alog::core
