#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace claims::util {

/*
  Clock sources. Claim logic reads time only through TimeSource.

  Claim timestamps are milliseconds since the Unix epoch.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);
uint64_t NowMs();

class TimeSource {
 public:
  virtual ~TimeSource() = default;

  virtual uint64_t NowMs() const = 0;
};

class SystemTimeSource final : public TimeSource {
 public:
  uint64_t NowMs() const override;
};

// Manually advanced clock for simulations and tests.
class ManualTimeSource final : public TimeSource {
 public:
  explicit ManualTimeSource(uint64_t start_ms = 1'700'000'000'000ULL) : now_ms_(start_ms) {
  }

  uint64_t NowMs() const override {
    return now_ms_.load();
  }

  void Set(uint64_t now_ms) {
    now_ms_.store(now_ms);
  }

  void Advance(std::chrono::milliseconds delta) {
    now_ms_.fetch_add(static_cast<uint64_t>(delta.count()));
  }

 private:
  std::atomic<uint64_t> now_ms_;
};

} // namespace claims::util
