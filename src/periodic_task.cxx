#include "periodic_task.h"
#include <condition_variable>
#include <mutex>
#include <print>

namespace swarm {

bool sleep_for(std::stop_token stoken, std::chrono::milliseconds duration) {
  if (stoken.stop_requested())
    return false;
  if (duration <= std::chrono::milliseconds::zero())
    return true;

  // Nothing notifies this cv; it only wakes on timeout or stop request
  auto mutex = std::mutex{};
  auto cv = std::condition_variable_any{};
  auto lock = std::unique_lock{mutex};
  cv.wait_for(lock, stoken, duration, [] { return false; });

  return not stoken.stop_requested();
}

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval,
                           Body body, bool run_immediately,
                           ErrorHandler on_error)
    : name_{std::move(name)}, interval_{interval}, body_{std::move(body)},
      run_immediately_{run_immediately}, on_error_{std::move(on_error)},
      thread_{[this](std::stop_token stoken) { loop(stoken); }} {}

PeriodicTask::~PeriodicTask() { stop(); }

void PeriodicTask::stop() {
  if (thread_.joinable()) {
    thread_.request_stop();
    thread_.join();
  }
}

void PeriodicTask::loop(std::stop_token stoken) {
  if (run_immediately_)
    run_once(stoken);

  while (sleep_for(stoken, interval_))
    run_once(stoken);
}

void PeriodicTask::run_once(std::stop_token stoken) {
  if (stoken.stop_requested())
    return;

  try {
    body_(stoken);
  } catch (const std::exception &e) {
    if (on_error_)
      on_error_(name_, e);
    else
      std::println(stderr, "❌ Task {} failed: {}", name_, e.what());
  }
  ++runs_;
}

} // namespace swarm
