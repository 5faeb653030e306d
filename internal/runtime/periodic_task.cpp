#include "periodic_task.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace claims::runtime {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, std::chrono::milliseconds cycle_deadline, Body body)
    : name_(std::move(name)), interval_(interval), cycle_deadline_(cycle_deadline), body_(std::move(body)) {
  if (interval_.count() <= 0) interval_ = std::chrono::milliseconds(1000);
}

PeriodicTask::~PeriodicTask() {
  Stop();
}

void PeriodicTask::Start() {
  if (running_.exchange(true)) return;
  stop_requested_ = false;
  thread_         = std::thread(&PeriodicTask::Loop, this);
  CLAIMS_LOG_INFO("periodic task started",
                  {observability::StringField("task", name_), observability::IntField("interval_ms", interval_.count())});
}

void PeriodicTask::Stop() {
  if (!running_.exchange(false)) return;
  {
    std::lock_guard lock(mutex_);
    stop_requested_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
  CLAIMS_LOG_INFO("periodic task stopped", {observability::StringField("task", name_)});
}

bool PeriodicTask::IsRunning() const {
  return running_.load();
}

std::uint64_t PeriodicTask::CompletedCycles() const {
  return completed_cycles_.load();
}

bool PeriodicTask::RunOnce() {
  if (in_flight_.exchange(true)) {
    CLAIMS_LOG_DEBUG("cycle skipped, previous still running", {observability::StringField("task", name_)});
    return false;
  }

  const auto ctx = CycleContext::WithTimeout(cycle_deadline_, &stop_requested_);
  try {
    body_(ctx);
  } catch (const std::exception& e) {
    CLAIMS_LOG_ERROR("cycle failed", {observability::StringField("task", name_), observability::StringField("error", e.what())});
  }

  ++completed_cycles_;
  in_flight_ = false;
  return true;
}

void PeriodicTask::Loop() {
  while (!stop_requested_) {
    RunOnce();

    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, interval_, [this] {
      return stop_requested_.load();
    });
  }
}

} // namespace claims::runtime
