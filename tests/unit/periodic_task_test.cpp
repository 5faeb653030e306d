#include <atomic>
#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "internal/runtime/periodic_task.hpp"

namespace {

using namespace std::chrono_literals;
using claims::runtime::CycleContext;
using claims::runtime::PeriodicTask;

void TestRunOnceIsSingleFlight() {
  std::promise<void> entered;
  std::promise<void> release;
  auto               release_future = release.get_future().share();
  std::atomic<int>   runs{0};

  PeriodicTask task("single-flight", 1h, 0ms, [&](const CycleContext&) {
    if (runs.fetch_add(1) == 0) {
      entered.set_value();
      release_future.wait();
    }
  });

  auto first = std::async(std::launch::async, [&] { return task.RunOnce(); });
  entered.get_future().wait();

  assert(!task.RunOnce());
  release.set_value();
  assert(first.get());

  assert(task.RunOnce());
  assert(runs.load() == 2);
  assert(task.CompletedCycles() == 2);
}

void TestFailingCycleDoesNotStopTheLoop() {
  std::atomic<int> runs{0};
  PeriodicTask     task("failing", 5ms, 0ms, [&](const CycleContext&) {
    ++runs;
    throw std::runtime_error("cycle failure");
  });

  task.Start();
  const auto give_up = std::chrono::steady_clock::now() + 5s;
  while (runs.load() < 3 && std::chrono::steady_clock::now() < give_up) std::this_thread::sleep_for(1ms);
  task.Stop();

  assert(runs.load() >= 3);
  assert(!task.IsRunning());
}

void TestStopWakesIntervalWait() {
  std::atomic<int> runs{0};
  PeriodicTask     task("sleepy", 1h, 0ms, [&](const CycleContext&) { ++runs; });

  task.Start();
  assert(task.IsRunning());
  const auto give_up = std::chrono::steady_clock::now() + 5s;
  while (runs.load() < 1 && std::chrono::steady_clock::now() < give_up) std::this_thread::sleep_for(1ms);

  const auto started = std::chrono::steady_clock::now();
  task.Stop();
  assert(std::chrono::steady_clock::now() - started < 5s);
  assert(runs.load() == 1);

  // stopping twice is harmless
  task.Stop();
}

void TestCycleContextDeadline() {
  bool         saw_deadline = false;
  PeriodicTask task("deadline", 1h, 1ms, [&](const CycleContext& ctx) {
    assert(ctx.deadline.has_value());
    const auto give_up = std::chrono::steady_clock::now() + 5s;
    while (!ctx.ShouldStop() && std::chrono::steady_clock::now() < give_up) std::this_thread::sleep_for(1ms);
    saw_deadline = ctx.DeadlineExceeded();
  });

  assert(task.RunOnce());
  assert(saw_deadline);

  auto unbounded = CycleContext::WithTimeout(0ms);
  assert(!unbounded.deadline.has_value());
  assert(!unbounded.ShouldStop());

  std::atomic<bool> stop{true};
  assert(CycleContext::WithTimeout(0ms, &stop).StopRequested());
}

} // namespace

int main() {
  TestRunOnceIsSingleFlight();
  TestFailingCycleDoesNotStopTheLoop();
  TestStopWakesIntervalWait();
  TestCycleContextDeadline();

  std::cout << "claims_unit_periodic_task: pass\n";
  return 0;
}
