#pragma once

#include "strategy.h"
#include <cstddef>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace swarm {

// Simple moving average of the last `periods` closes; 0 when too short
double moving_average(std::span<const Candle>, std::size_t periods);

// Population standard deviation of the last `periods` closes
double std_deviation(std::span<const Candle>, std::size_t periods);

// Shared configuration, pip-based stop/target and trailing logic
class PipStrategy : public Strategy, public SymbolAware, public TimeframeConsumer {
public:
    StopTarget compute_stop_target(double price, Direction, double pip_value,
                                   const nlohmann::json &metadata) const override;
    TrailingUpdate compute_trailing_stop(double entry, double current, double current_stop,
                                         Direction, double pip_value) const override;

    nlohmann::json get_config() const override;
    void update_config(const nlohmann::json &partial) override;

    void set_active_symbol(std::string_view) override;
    void ingest_timeframe_data(Timeframe, std::span<const Candle>) override;

    SymbolAware *as_symbol_aware() override { return this; }
    TimeframeConsumer *as_timeframe_consumer() override { return this; }

    std::string active_symbol() const;

protected:
    PipStrategy(nlohmann::json defaults, const nlohmann::json &overrides);

    double setting(const char *key) const;

    // Direction of the H1 close relative to its moving average, if known
    std::optional<Direction> higher_timeframe_bias() const;

private:
    mutable std::mutex mutex_;
    nlohmann::json config_;
    std::string active_symbol_;
    std::vector<Candle> h1_;
    std::vector<Candle> m15_;
};

// 5/20 moving average crossover, confirmed by the H1 trend
class MaCrossover : public PipStrategy {
public:
    explicit MaCrossover(const nlohmann::json &overrides = nlohmann::json::object());

    std::string_view name() const override { return "ma_crossover"; }
    Signal analyze_signal(std::span<const Candle>, const MultiTimeframeData &) override;
};

// Fade closes more than two standard deviations from the 20-period mean
class MeanReversion : public PipStrategy {
public:
    explicit MeanReversion(const nlohmann::json &overrides = nlohmann::json::object());

    std::string_view name() const override { return "mean_reversion"; }
    Signal analyze_signal(std::span<const Candle>, const MultiTimeframeData &) override;
};

std::shared_ptr<Strategy> make_strategy(const EngineConfig &);

} // namespace swarm
