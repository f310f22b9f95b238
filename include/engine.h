#pragma once

#include "candle_cache.h"
#include "config.h"
#include "errors.h"
#include "events.h"
#include "execution.h"
#include "logger.h"
#include "perf.h"
#include "periodic_task.h"
#include "risk_gate.h"
#include "risk_manager.h"
#include "strategies.h"
#include "strategy.h"
#include "trading_adapter.h"
#include "types.h"
#include "warmup.h"
#include <atomic>
#include <cstddef>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace swarm {

struct LastSignal {
    Signal signal;
    time_point time{};
};

// Read-only view of the engine, assembled without any adapter calls
struct EngineStatus {
    bool running{false};
    std::string strategy;
    std::vector<std::string> symbols;
    std::size_t ticks{};
    std::size_t analyses{};
    std::size_t trades{};
    std::optional<Tick> last_tick;
    std::map<std::string, LastSignal> last_signals;
    PerfStats tick_perf;
    PerfStats analysis_perf;
    std::optional<std::string> last_error;
    nlohmann::json config;
    nlohmann::json risk;
    nlohmann::json symbol_state;
    nlohmann::json buffers;
    nlohmann::json warmup;

    nlohmann::json to_json() const;
};

// Orchestrates one (owner, bot) pair: lifecycle, tick handling and the
// analysis, refresh and trailing-stop schedulers
class Engine {
public:
    Engine(std::shared_ptr<TradingAdapter> adapter, EngineConfig config, std::shared_ptr<Logger> logger,
           StrategyFactory strategy_factory = make_strategy, RiskGateFactory risk_factory = make_risk_gate);
    ~Engine();

    Engine(const Engine &) = delete;
    Engine &operator=(const Engine &) = delete;

    // Connect, warm up and launch the schedulers. No-op when running.
    std::expected<void, EngineError> start();

    // Idempotent. Must not be called from an event handler or adapter
    // callback, it waits for the schedulers to finish.
    void stop();

    // Apply a partial config. A running engine restarts; candle buffers
    // survive when the symbol set is unchanged.
    std::expected<void, EngineError> reload(const EngineConfigUpdate &);

    EngineStatus status() const;
    bool is_running() const { return running_.load(); }

    std::shared_ptr<const EngineConfig> config() const;
    EventBus &events() { return events_; }
    const CandleCache &cache() const { return cache_; }

    // Feed a closed position back into the risk ledger
    void on_position_closed(std::string_view symbol, double pnl);

    // Scheduler bodies; public so they can be driven directly
    void handle_tick(const Tick &);
    void run_analysis_cycle(std::stop_token = {});
    void run_refresh_cycle(std::stop_token = {});
    void run_trailing_cycle(std::stop_token = {});

private:
    struct Thresholds {
        std::size_t h1{};
        std::size_t m15{};
        std::size_t m5{};
    };

    std::expected<void, EngineError> start_locked(bool skip_warm);
    void stop_locked(bool keep_buffers);
    void unsubscribe_all();

    bool analyze_symbol(const EngineConfig &, Strategy &, RiskGate &, const std::string &symbol,
                        const Thresholds &);
    Thresholds thresholds_for(const Strategy &) const;

    void record_error(std::string message);
    void on_task_error(std::string_view task, const std::exception &);

    std::shared_ptr<TradingAdapter> adapter_;
    std::shared_ptr<Logger> logger_;
    StrategyFactory strategy_factory_;
    RiskGateFactory risk_factory_;

    mutable std::mutex config_mutex_;
    std::shared_ptr<const EngineConfig> config_;

    CandleCache cache_;
    ExecutionGate gate_;
    EventBus events_;
    TradePipeline pipeline_;
    PerfWindow tick_perf_;
    PerfWindow analysis_perf_;

    // Per-run collaborators, replaced on every start
    mutable std::mutex run_mutex_;
    std::shared_ptr<Strategy> strategy_;
    std::shared_ptr<RiskGate> risk_;
    std::vector<std::string> subscribed_;

    mutable std::mutex state_mutex_;
    std::optional<Tick> last_tick_;
    std::map<std::string, LastSignal> last_signals_;
    std::optional<std::string> last_error_;
    std::optional<time_point> last_heartbeat_;
    WarmupReport warmup_report_;

    std::atomic<std::size_t> tick_count_{0uz};
    std::atomic<std::size_t> analysis_count_{0uz};
    std::atomic<bool> running_{false};

    std::mutex lifecycle_mutex_;
    std::mutex cancel_mutex_;
    std::stop_source cancel_;

    // Last: stopped and joined before the state above is destroyed
    std::unique_ptr<PeriodicTask> analysis_task_;
    std::unique_ptr<PeriodicTask> refresh_task_;
    std::unique_ptr<PeriodicTask> trailing_task_;
};

} // namespace swarm
