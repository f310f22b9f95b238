#include "perf.h"
#include <algorithm>
#include <numeric>

namespace swarm {

bool PerfWindow::record(millis elapsed) {
  auto ms = elapsed.count();
  auto over = elapsed > millis{latency_alert_threshold};

  auto lock = std::scoped_lock{mutex_};
  samples_.push_back(ms);
  if (samples_.size() > capacity_)
    samples_.pop_front();
  last_ = ms;
  ++total_;
  if (over)
    ++alerts_;
  return over;
}

PerfStats PerfWindow::stats() const {
  auto lock = std::scoped_lock{mutex_};
  auto s = PerfStats{};
  s.last_ms = last_;
  s.samples = samples_.size();
  s.total = total_;
  s.alerts = alerts_;

  if (samples_.empty())
    return s;

  auto [lo, hi] = std::minmax_element(samples_.begin(), samples_.end());
  s.min_ms = *lo;
  s.max_ms = *hi;
  s.avg_ms = std::accumulate(samples_.begin(), samples_.end(), 0.0) /
             static_cast<double>(samples_.size());
  return s;
}

void PerfWindow::reset() {
  auto lock = std::scoped_lock{mutex_};
  samples_.clear();
  last_.reset();
  total_ = 0uz;
  alerts_ = 0uz;
}

nlohmann::json PerfStats::to_json() const {
  auto opt = [](const std::optional<double> &v) -> nlohmann::json {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
  };
  return {{"last_ms", opt(last_ms)}, {"avg_ms", opt(avg_ms)},
          {"min_ms", opt(min_ms)},   {"max_ms", opt(max_ms)},
          {"samples", samples},      {"total", total},
          {"alerts", alerts}};
}

} // namespace swarm
