#pragma once

#include "defs.h"
#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <nlohmann/json.hpp>

namespace swarm {

using millis = std::chrono::duration<double, std::milli>;

struct PerfStats {
    std::optional<double> last_ms;
    std::optional<double> avg_ms;
    std::optional<double> min_ms;
    std::optional<double> max_ms;
    std::size_t samples{};  // Currently in the window
    std::size_t total{};    // Recorded since the last reset
    std::size_t alerts{};   // Samples over the latency threshold

    nlohmann::json to_json() const;
};

// Bounded ring buffer of elapsed-time samples. Thread-safe.
class PerfWindow {
public:
    explicit PerfWindow(std::size_t capacity = perf_window) : capacity_{capacity} {}

    // Returns true when the sample crossed the latency threshold
    bool record(millis elapsed);

    PerfStats stats() const;
    void reset();

private:
    mutable std::mutex mutex_;
    std::deque<double> samples_;
    std::size_t capacity_;
    std::optional<double> last_;
    std::size_t total_{};
    std::size_t alerts_{};
};

// Measures wall-clock time from construction
class Stopwatch {
public:
    Stopwatch() : start_{std::chrono::steady_clock::now()} {}
    millis elapsed() const { return std::chrono::steady_clock::now() - start_; }

private:
    std::chrono::steady_clock::time_point start_;
};

} // namespace swarm
