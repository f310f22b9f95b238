#pragma once

#include "config.h"
#include "events.h"
#include "logger.h"
#include "risk_gate.h"
#include "strategy.h"
#include "trading_adapter.h"
#include "types.h"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <expected>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace swarm {

// Per-symbol execution state; created on first reference
struct SymbolState {
    bool locked{false};
    std::optional<time_point> last_trade_time;
    std::optional<Tick> last_tick;
};

enum class GateReject { InFlight, Cooldown };

// At most one order in flight per symbol, plus the per-symbol cooldown
class ExecutionGate {
public:
    // Holds the symbol lock; releases it when destroyed
    class Permit {
    public:
        Permit(Permit &&other) noexcept;
        Permit &operator=(Permit &&) = delete;
        Permit(const Permit &) = delete;
        ~Permit();

        const std::string &symbol() const { return symbol_; }

    private:
        friend class ExecutionGate;
        Permit(ExecutionGate *gate, std::string symbol) : gate_{gate}, symbol_{std::move(symbol)} {}

        ExecutionGate *gate_;
        std::string symbol_;
    };

    // Check-then-lock as one step: rejects if the symbol is locked or still
    // cooling down, otherwise locks it
    std::expected<Permit, GateReject> try_acquire(std::string_view symbol, time_point now,
                                                  std::chrono::milliseconds cooldown);

    void record_trade(std::string_view symbol, time_point);
    void record_tick(const Tick &);

    bool is_locked(std::string_view symbol) const;
    std::optional<time_point> last_trade_time(std::string_view symbol) const;
    std::optional<Tick> last_tick(std::string_view symbol) const;
    std::chrono::milliseconds cooldown_remaining(std::string_view symbol, time_point now,
                                                 std::chrono::milliseconds cooldown) const;

    nlohmann::json snapshot() const;

private:
    void release(std::string_view symbol);

    // Caller holds mutex_
    SymbolState &state(std::string_view symbol);

    mutable std::mutex mutex_;
    std::map<std::string, SymbolState, std::less<>> states_;
};

enum class TradeDecision {
    Executed,
    InFlight,
    Cooldown,
    RiskBlocked,
    PositionExists,
    NoQuote,
    SpreadTooWide,
    SizingFailed,
    OrderFailed,
    Error
};

std::string_view to_string(TradeDecision);

struct TradeOutcome {
    TradeDecision decision{TradeDecision::Error};
    std::string detail;
    std::optional<OrderRequest> order;
    std::optional<OrderResult> result;
};

// Collaborators for one engine run
struct TradeContext {
    const EngineConfig &config;
    Strategy &strategy;
    RiskGate &risk;
};

// Gated sequence from a qualifying signal to an order result
class TradePipeline {
public:
    TradePipeline(TradingAdapter &adapter, ExecutionGate &gate, Logger &logger, EventBus &events)
        : adapter_{adapter}, gate_{gate}, logger_{logger}, events_{events} {}

    TradeOutcome execute(const TradeContext &, std::string_view symbol, const Signal &, time_point now);

    std::size_t trades_executed() const { return trades_executed_.load(); }
    void reset_counters() { trades_executed_ = 0uz; }

private:
    TradeOutcome run_locked(const TradeContext &, const std::string &symbol, const Signal &,
                            time_point now);
    ConversionRates conversion_rates(std::string_view symbol, const Quote &);

    TradingAdapter &adapter_;
    ExecutionGate &gate_;
    Logger &logger_;
    EventBus &events_;
    std::atomic<std::size_t> trades_executed_{0uz};
};

} // namespace swarm
