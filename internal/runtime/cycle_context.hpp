#pragma once

#include <atomic>
#include <chrono>
#include <optional>

namespace claims::runtime {

/*
  Deadline and stop flag for one background cycle.

  Cycles poll ShouldStop() between items, never in the middle of a claim
  mutation.
*/
struct CycleContext {
  using SteadyClock = std::chrono::steady_clock;

  std::optional<SteadyClock::time_point> deadline;
  const std::atomic<bool>*               stop_requested = nullptr;

  static CycleContext WithTimeout(std::chrono::milliseconds timeout, const std::atomic<bool>* stop = nullptr) {
    CycleContext ctx;
    if (timeout.count() > 0) ctx.deadline = SteadyClock::now() + timeout;
    ctx.stop_requested = stop;
    return ctx;
  }

  bool DeadlineExceeded() const {
    return deadline.has_value() && SteadyClock::now() >= *deadline;
  }

  bool StopRequested() const {
    return stop_requested != nullptr && stop_requested->load();
  }

  bool ShouldStop() const {
    return StopRequested() || DeadlineExceeded();
  }
};

} // namespace claims::runtime
