#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>

namespace swarm {

// Sleep that wakes early when stop is requested; false if it was
bool sleep_for(std::stop_token, std::chrono::milliseconds);

// Runs a body on its own thread at a fixed interval until stopped. Errors
// thrown by the body are reported and the loop carries on.
class PeriodicTask {
public:
    using Body = std::function<void(std::stop_token)>;
    using ErrorHandler = std::function<void(std::string_view task, const std::exception &)>;

    PeriodicTask(std::string name, std::chrono::milliseconds interval, Body body,
                 bool run_immediately = false, ErrorHandler on_error = {});
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask &) = delete;
    PeriodicTask &operator=(const PeriodicTask &) = delete;

    // Cancel future firings and wait for a running body to finish.
    // Must not be called from the body itself.
    void stop();

    const std::string &name() const { return name_; }
    std::size_t runs() const { return runs_.load(); }

private:
    void loop(std::stop_token);
    void run_once(std::stop_token);

    std::string name_;
    std::chrono::milliseconds interval_;
    Body body_;
    bool run_immediately_;
    ErrorHandler on_error_;
    std::atomic<std::size_t> runs_{0uz};
    std::jthread thread_; // Last: starts after everything above is ready
};

} // namespace swarm
