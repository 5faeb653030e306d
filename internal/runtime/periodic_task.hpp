#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "cycle_context.hpp"

namespace claims::runtime {

/*
  Runs a cycle body on its own thread every `interval`.

  - Single-flight: RunOnce() refuses to start while a cycle is running,
    whether that cycle came from the loop or from another caller.
  - Every cycle gets a CycleContext bounded by `cycle_deadline` (0 = none)
    and linked to Stop().
  - Stop() wakes the interval wait and joins the thread; the cycle in
    flight finishes its current item first.
*/
class PeriodicTask {
 public:
  using Body = std::function<void(const CycleContext&)>;

  PeriodicTask(std::string name, std::chrono::milliseconds interval, std::chrono::milliseconds cycle_deadline, Body body);
  ~PeriodicTask();

  PeriodicTask(const PeriodicTask&)            = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;

  void Start();
  void Stop();
  bool IsRunning() const;

  // Runs one cycle on the calling thread. False if a cycle was already running.
  bool RunOnce();

  std::uint64_t CompletedCycles() const;

  const std::string& Name() const {
    return name_;
  }

 private:
  void Loop();

  std::string               name_;
  std::chrono::milliseconds interval_;
  std::chrono::milliseconds cycle_deadline_;
  Body                      body_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::atomic<bool>       stop_requested_{false};
  std::atomic<bool>       in_flight_{false};
  std::atomic<uint64_t>   completed_cycles_{0};
};

} // namespace claims::runtime
