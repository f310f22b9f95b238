#include "strategies.h"
#include "pip_utils.h"
#include <algorithm>
#include <cmath>
#include <format>

using json = nlohmann::json;

namespace swarm {

namespace {

json common_defaults() {
  return {{"trailing_enabled", true},      {"verbose_logging", false},
          {"h1_lookback", 40},             {"m15_lookback", 20},
          {"stop_loss_pips", 15.0},        {"reward_ratio", 2.0},
          {"trailing_trigger_pips", 10.0}, {"trailing_step_pips", 5.0}};
}

} // namespace

double moving_average(std::span<const Candle> candles, std::size_t periods) {
  if (periods == 0uz or candles.size() < periods)
    return 0.0;

  auto sum = 0.0;
  for (auto i = candles.size() - periods; i < candles.size(); ++i)
    sum += candles[i].close;

  return sum / periods;
}

double std_deviation(std::span<const Candle> candles, std::size_t periods) {
  if (periods < 2uz or candles.size() < periods)
    return 0.0;

  auto mean = moving_average(candles, periods);
  auto variance = 0.0;
  for (auto i = candles.size() - periods; i < candles.size(); ++i) {
    auto diff = candles[i].close - mean;
    variance += diff * diff;
  }

  return std::sqrt(variance / periods);
}

// ═══════════════════════════════════════════════════════════════
// PipStrategy
// ═══════════════════════════════════════════════════════════════

PipStrategy::PipStrategy(json defaults, const json &overrides)
    : config_{std::move(defaults)} {
  if (overrides.is_object())
    config_.merge_patch(overrides);
}

StopTarget PipStrategy::compute_stop_target(double price, Direction direction,
                                            double pip_value,
                                            const json &metadata) const {
  auto sl_pips = setting("stop_loss_pips");
  auto rr = setting("reward_ratio");

  // A short is closed when the ask reaches the stop, so it needs the spread
  auto spread = metadata.is_object() and metadata.contains("spread_pips") and
                        metadata["spread_pips"].is_number()
                    ? metadata["spread_pips"].get<double>()
                    : 0.0;
  if (direction == Direction::Sell)
    sl_pips += std::max(spread, 0.0);

  auto result = StopTarget{};
  result.stop_loss_pips = sl_pips;
  result.take_profit_pips = sl_pips * rr;

  if (direction == Direction::Buy) {
    result.stop_loss = price - sl_pips * pip_value;
    result.take_profit = price + result.take_profit_pips * pip_value;
  } else {
    result.stop_loss = price + sl_pips * pip_value;
    result.take_profit = price - result.take_profit_pips * pip_value;
  }
  return result;
}

TrailingUpdate PipStrategy::compute_trailing_stop(double entry, double current,
                                                  double current_stop,
                                                  Direction direction,
                                                  double pip_value) const {
  auto no_change = TrailingUpdate{false, current_stop, 0.0};
  if (pip_value <= 0.0 or not get_config().value("trailing_enabled", false))
    return no_change;

  no_change.profit_pips = direction == Direction::Buy
                              ? (current - entry) / pip_value
                              : (entry - current) / pip_value;

  if (no_change.profit_pips < setting("trailing_trigger_pips"))
    return no_change;

  auto distance = setting("trailing_step_pips") * pip_value;

  // Only ever tighten the stop
  if (direction == Direction::Buy) {
    auto new_stop = current - distance;
    if (new_stop <= current_stop)
      return no_change;
    return {true, new_stop, no_change.profit_pips};
  }

  auto new_stop = current + distance;
  if (new_stop >= current_stop)
    return no_change;
  return {true, new_stop, no_change.profit_pips};
}

json PipStrategy::get_config() const {
  auto lock = std::scoped_lock{mutex_};
  return config_;
}

void PipStrategy::update_config(const json &partial) {
  auto lock = std::scoped_lock{mutex_};
  config_.merge_patch(partial);
}

void PipStrategy::set_active_symbol(std::string_view symbol) {
  auto lock = std::scoped_lock{mutex_};
  if (active_symbol_ != symbol) {
    active_symbol_ = std::string{symbol};
    h1_.clear();
    m15_.clear();
  }
}

std::string PipStrategy::active_symbol() const {
  auto lock = std::scoped_lock{mutex_};
  return active_symbol_;
}

void PipStrategy::ingest_timeframe_data(Timeframe tf,
                                        std::span<const Candle> candles) {
  auto lock = std::scoped_lock{mutex_};
  if (tf == Timeframe::H1)
    h1_.assign(candles.begin(), candles.end());
  else if (tf == Timeframe::M15)
    m15_.assign(candles.begin(), candles.end());
}

double PipStrategy::setting(const char *key) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = config_.find(key);
  if (it == config_.end() or not it->is_number())
    return common_defaults().value(key, 0.0);
  return it->get<double>();
}

std::optional<Direction> PipStrategy::higher_timeframe_bias() const {
  auto lookback = static_cast<std::size_t>(std::max(setting("h1_lookback"), 2.0));

  auto lock = std::scoped_lock{mutex_};
  if (h1_.size() < 2uz)
    return std::nullopt;

  auto periods = std::min(lookback, h1_.size());
  auto ma = moving_average(h1_, periods);
  auto close = h1_.back().close;

  if (close > ma)
    return Direction::Buy;
  if (close < ma)
    return Direction::Sell;
  return std::nullopt;
}

// ═══════════════════════════════════════════════════════════════
// MaCrossover
// ═══════════════════════════════════════════════════════════════

MaCrossover::MaCrossover(const json &overrides)
    : PipStrategy{[] {
                    auto j = common_defaults();
                    j["short_period"] = 5;
                    j["long_period"] = 20;
                    return j;
                  }(),
                  overrides} {}

Signal MaCrossover::analyze_signal(std::span<const Candle> candles,
                                   const MultiTimeframeData &data) {
  auto signal = Signal{};
  signal.metadata["strategy"] = std::string{name()};

  auto short_period = static_cast<std::size_t>(setting("short_period"));
  auto long_period = static_cast<std::size_t>(setting("long_period"));

  // Need one extra bar to detect the cross
  if (short_period == 0uz or long_period <= short_period or
      candles.size() < long_period + 1) {
    signal.reason = "Insufficient candles";
    return signal;
  }

  auto ma_short = moving_average(candles, short_period);
  auto ma_long = moving_average(candles, long_period);

  auto previous = candles.first(candles.size() - 1);
  auto prev_ma_short = moving_average(previous, short_period);
  auto prev_ma_long = moving_average(previous, long_period);

  signal.indicators["ma_short"] = ma_short;
  signal.indicators["ma_long"] = ma_long;

  if (prev_ma_short <= prev_ma_long and ma_short > ma_long)
    signal.direction = Direction::Buy;
  else if (prev_ma_short >= prev_ma_long and ma_short < ma_long)
    signal.direction = Direction::Sell;
  else {
    signal.reason = "No crossover";
    return signal;
  }

  auto separation = price_to_pips(std::abs(ma_short - ma_long), data.symbol);
  signal.indicators["separation_pips"] = separation;

  signal.confidence = 60.0 + std::min(separation * 2.0, 20.0);

  auto bias = higher_timeframe_bias();
  if (bias and *bias == signal.direction)
    signal.confidence += 20.0;
  else if (bias)
    signal.confidence -= 30.0; // Against the H1 trend

  signal.confidence = std::clamp(signal.confidence, 0.0, 100.0);
  signal.reason = std::format("MA crossover {}: {:.5f} vs {:.5f}{}",
                              to_string(signal.direction), ma_short, ma_long,
                              bias ? (*bias == signal.direction ? " with H1 trend"
                                                                : " against H1 trend")
                                   : "");
  return signal;
}

// ═══════════════════════════════════════════════════════════════
// MeanReversion
// ═══════════════════════════════════════════════════════════════

MeanReversion::MeanReversion(const json &overrides)
    : PipStrategy{[] {
                    auto j = common_defaults();
                    j["period"] = 20;
                    j["entry_z"] = 2.0;
                    return j;
                  }(),
                  overrides} {}

Signal MeanReversion::analyze_signal(std::span<const Candle> candles,
                                     const MultiTimeframeData &) {
  auto signal = Signal{};
  signal.metadata["strategy"] = std::string{name()};

  auto period = static_cast<std::size_t>(setting("period"));
  auto entry_z = setting("entry_z");

  if (period < 2uz or candles.size() < period) {
    signal.reason = "Insufficient candles";
    return signal;
  }

  auto close = candles.back().close;
  auto ma = moving_average(candles, period);
  auto sd = std_deviation(candles, period);

  // Flat market: mean reversion does not apply
  if (not std::isfinite(sd) or sd < 1e-9) {
    signal.reason = "No volatility";
    return signal;
  }

  auto z = (close - ma) / sd;
  signal.indicators["ma"] = ma;
  signal.indicators["std_dev"] = sd;
  signal.indicators["z_score"] = z;

  if (z < -entry_z)
    signal.direction = Direction::Buy;
  else if (z > entry_z)
    signal.direction = Direction::Sell;
  else {
    signal.reason = std::format("Within band: z={:.2f}", z);
    return signal;
  }

  signal.confidence = std::clamp(60.0 + (std::abs(z) - entry_z) * 20.0, 0.0, 100.0);
  signal.reason = std::format("Mean reversion: {:.2f} std devs from MA", z);
  return signal;
}

std::shared_ptr<Strategy> make_strategy(const EngineConfig &config) {
  switch (config.strategy_type) {
  case StrategyType::MaCrossover:
    return std::make_shared<MaCrossover>(config.strategy_overrides);
  case StrategyType::MeanReversion:
    return std::make_shared<MeanReversion>(config.strategy_overrides);
  }
  return nullptr;
}

} // namespace swarm
