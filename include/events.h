#pragma once

#include "config.h"
#include "types.h"
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <print>
#include <string>
#include <tuple>
#include <vector>

namespace swarm {

// Event payloads, one fixed shape per event kind

struct StartedEvent {
    StrategyType strategy{};
    std::vector<std::string> symbols;
};

struct StoppedEvent {
    std::size_t analyses{};
    std::size_t trades{};
    std::size_t ticks{};
};

struct TickEvent {
    std::string symbol;
    double bid{};
    double ask{};
    double spread_pips{};
    time_point time{};
    std::size_t tick_count{};
};

struct AnalysisEvent {
    std::string symbol;
    Signal signal;
    double latency_ms{};
};

struct TradeEvent {
    std::string symbol;
    Signal signal;
    OrderRequest order;
    OrderResult result;
    time_point time{};
};

enum class PerfKind { Tick, Analysis };

struct PerformanceEvent {
    PerfKind kind{};
    std::string symbol;
    double latency_ms{};
    bool within_threshold{true};
    time_point time{};
};

// Typed callback registry; subscribers register per payload type
class EventBus {
public:
    template <typename Event>
    using Handler = std::function<void(const Event &)>;

    template <typename Event>
    void subscribe(Handler<Event> handler) {
        auto lock = std::scoped_lock{mutex_};
        std::get<std::vector<Handler<Event>>>(handlers_).push_back(std::move(handler));
    }

    // Handlers run on the emitting thread, outside the registry lock
    template <typename Event>
    void emit(const Event &event) const {
        auto snapshot = std::vector<Handler<Event>>{};
        {
            auto lock = std::scoped_lock{mutex_};
            snapshot = std::get<std::vector<Handler<Event>>>(handlers_);
        }
        for (const auto &handler : snapshot) {
            try {
                handler(event);
            } catch (const std::exception &e) {
                std::println(stderr, "Event handler failed: {}", e.what());
            }
        }
    }

    template <typename Event>
    std::size_t subscriber_count() const {
        auto lock = std::scoped_lock{mutex_};
        return std::get<std::vector<Handler<Event>>>(handlers_).size();
    }

private:
    mutable std::mutex mutex_;
    std::tuple<std::vector<Handler<StartedEvent>>, std::vector<Handler<StoppedEvent>>,
               std::vector<Handler<TickEvent>>, std::vector<Handler<AnalysisEvent>>,
               std::vector<Handler<TradeEvent>>, std::vector<Handler<PerformanceEvent>>>
        handlers_;
};

} // namespace swarm
