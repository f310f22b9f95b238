#pragma once

#include "config.h"
#include "types.h"
#include <functional>
#include <memory>
#include <span>
#include <string_view>
#include <nlohmann/json.hpp>

namespace swarm {

// Capability: strategy keeps per-symbol state and wants to know which
// symbol the next analysis is for
class SymbolAware {
public:
    virtual ~SymbolAware() = default;
    virtual void set_active_symbol(std::string_view) = 0;
};

// Capability: strategy consumes higher-timeframe candles directly
class TimeframeConsumer {
public:
    virtual ~TimeframeConsumer() = default;
    virtual void ingest_timeframe_data(Timeframe, std::span<const Candle>) = 0;
};

// Pluggable signal generator. Implementations must tolerate calls from the
// analysis and trailing-stop threads.
class Strategy {
public:
    virtual ~Strategy() = default;

    virtual std::string_view name() const = 0;

    virtual Signal analyze_signal(std::span<const Candle> candles, const MultiTimeframeData &) = 0;

    virtual StopTarget compute_stop_target(double price, Direction, double pip_value,
                                           const nlohmann::json &metadata) const = 0;

    virtual TrailingUpdate compute_trailing_stop(double entry, double current, double current_stop,
                                                 Direction, double pip_value) const = 0;

    virtual nlohmann::json get_config() const = 0;

    // Merge-patch the given keys into the current config
    virtual void update_config(const nlohmann::json &partial) = 0;

    // Declared capabilities; null when not supported
    virtual SymbolAware *as_symbol_aware() { return nullptr; }
    virtual TimeframeConsumer *as_timeframe_consumer() { return nullptr; }
};

using StrategyFactory = std::function<std::shared_ptr<Strategy>(const EngineConfig &)>;

} // namespace swarm
