#include "risk_manager.h"
#include "pip_utils.h"
#include <algorithm>
#include <cmath>
#include <format>
#include <numeric>

namespace swarm {

namespace {
constexpr auto volume_epsilon = 1e-9;
} // namespace

std::optional<double> pip_value_per_lot(std::string_view symbol,
                                        const ConversionRates &rates) {
  auto per_lot = contract_size(symbol) * pip_size(symbol); // Quote currency
  auto base = base_currency(symbol);
  auto quote = quote_currency(symbol);

  if (quote == "USD")
    return per_lot;

  auto rate = [&](std::string_view pair) -> std::optional<double> {
    auto it = rates.find(std::string{pair});
    if (it == rates.end() or it->second <= 0.0)
      return std::nullopt;
    return it->second;
  };

  // USDJPY, USDCAD: quote-currency value divided by the pair's own price
  if (base == "USD") {
    if (auto price = rate(symbol))
      return per_lot / *price;
    return std::nullopt;
  }

  if (quote.empty())
    return std::nullopt;

  // Crosses: EURGBP via GBPUSD, EURJPY via USDJPY
  if (auto direct = rate(std::format("{}USD", quote)))
    return per_lot * *direct;
  if (auto inverse = rate(std::format("USD{}", quote)))
    return per_lot / *inverse;
  return std::nullopt;
}

void RiskManager::initialize(double starting_balance) {
  auto lock = std::scoped_lock{mutex_};
  daily_start_equity_ = starting_balance;
  current_equity_ = starting_balance;
  trading_blocked_ = false;
  block_reason_.clear();
  update_daily_pnl();
}

Admission RiskManager::can_open_position() {
  auto lock = std::scoped_lock{mutex_};

  if (trading_blocked_)
    return {false, block_reason_.empty() ? "Trading blocked by circuit breaker"
                                         : block_reason_};

  auto open = std::accumulate(open_trades_.begin(), open_trades_.end(), 0,
                              [](int sum, const auto &kv) { return sum + kv.second; });
  if (open >= settings_.max_open_trades)
    return {false, std::format("Open trade limit of {} reached ({} open)",
                               settings_.max_open_trades, open)};

  if (daily_pnl_percent_ <= -settings_.daily_loss_limit) {
    auto reason = std::format("Daily loss limit of {:.1f}% reached",
                              settings_.daily_loss_limit);
    if (settings_.circuit_breaker) {
      trading_blocked_ = true;
      block_reason_ = reason;
    }
    return {false, reason};
  }

  return {true, "OK"};
}

SizingResult RiskManager::size_position(
    double balance, double stop_loss_pips, std::string_view symbol,
    const ConversionRates &rates, const std::optional<VolumeSpecs> &specs) {
  auto lock = std::scoped_lock{mutex_};
  auto result = SizingResult{};

  if (trading_blocked_) {
    result.reason = block_reason_.empty() ? "Trading blocked" : block_reason_;
    return result;
  }

  if (not std::isfinite(stop_loss_pips) or stop_loss_pips <= 0.0) {
    result.reason = std::format("Invalid stop distance {} pips", stop_loss_pips);
    return result;
  }

  auto pip_value = pip_value_per_lot(symbol, rates);
  if (not pip_value or *pip_value <= 0.0) {
    result.reason = std::format("No conversion rate to value a pip on {}", symbol);
    return result;
  }

  result.pip_value_per_lot = *pip_value;
  result.risk_amount = balance * (settings_.risk_percent / 100.0);

  auto raw_lots = result.risk_amount / (stop_loss_pips * *pip_value);
  auto limits = specs.value_or(VolumeSpecs{});
  auto step = limits.step_volume > 0.0 ? limits.step_volume : 0.01;

  // Floor to the broker step, then tidy floating-point noise
  auto steps = std::floor(raw_lots / step + volume_epsilon);
  auto lots = std::round(steps * step * 1e8) / 1e8;

  if (lots + volume_epsilon < limits.min_volume) {
    result.reason = std::format(
        "Calculated size {:.4f} lots is below broker minimum {:.2f}", raw_lots,
        limits.min_volume);
    return result;
  }

  if (lots > limits.max_volume) {
    lots = limits.max_volume;
    result.volume_adjusted = true;
  }

  result.can_trade = true;
  result.lot_size = lots;
  result.reason = "OK";
  return result;
}

int RiskManager::open_trade_count(std::string_view symbol) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = open_trades_.find(symbol);
  return it == open_trades_.end() ? 0 : it->second;
}

int RiskManager::open_trade_total() const {
  auto lock = std::scoped_lock{mutex_};
  return std::accumulate(open_trades_.begin(), open_trades_.end(), 0,
                         [](int sum, const auto &kv) { return sum + kv.second; });
}

void RiskManager::update_config(const RiskSettings &settings) {
  auto lock = std::scoped_lock{mutex_};
  settings_ = settings;
}

nlohmann::json RiskManager::snapshot_state() const {
  auto lock = std::scoped_lock{mutex_};
  auto open = 0;
  for (const auto &[symbol, count] : open_trades_)
    open += count;
  return {{"daily_start_equity", daily_start_equity_},
          {"current_equity", current_equity_},
          {"daily_pnl", daily_pnl_},
          {"daily_pnl_percent", daily_pnl_percent_},
          {"open_trades", open},
          {"trading_blocked", trading_blocked_},
          {"block_reason", block_reason_},
          {"risk_percent", settings_.risk_percent},
          {"max_open_trades", settings_.max_open_trades},
          {"daily_loss_limit", settings_.daily_loss_limit}};
}

void RiskManager::record_open(std::string_view symbol) {
  auto lock = std::scoped_lock{mutex_};
  auto it = open_trades_.find(symbol);
  if (it == open_trades_.end())
    open_trades_.emplace(std::string{symbol}, 1);
  else
    ++it->second;
}

void RiskManager::record_close(std::string_view symbol, double pnl) {
  auto lock = std::scoped_lock{mutex_};
  auto it = open_trades_.find(symbol);
  if (it != open_trades_.end() and it->second > 0)
    --it->second;

  current_equity_ += pnl;
  update_daily_pnl();
  if (settings_.circuit_breaker)
    check_circuit_breaker();
}

void RiskManager::update_equity(double equity) {
  auto lock = std::scoped_lock{mutex_};
  current_equity_ = equity;
  update_daily_pnl();
  if (settings_.circuit_breaker)
    check_circuit_breaker();
}

void RiskManager::reset_circuit_breaker() {
  auto lock = std::scoped_lock{mutex_};
  trading_blocked_ = false;
  block_reason_.clear();
}

bool RiskManager::trading_blocked() const {
  auto lock = std::scoped_lock{mutex_};
  return trading_blocked_;
}

// Callers hold mutex_
void RiskManager::update_daily_pnl() {
  daily_pnl_ = current_equity_ - daily_start_equity_;
  daily_pnl_percent_ = daily_start_equity_ > 0.0
                           ? (daily_pnl_ / daily_start_equity_) * 100.0
                           : 0.0;
}

void RiskManager::check_circuit_breaker() {
  if (daily_pnl_percent_ <= -settings_.daily_loss_limit) {
    trading_blocked_ = true;
    block_reason_ = std::format("Daily loss limit reached: {:.2f}%",
                                daily_pnl_percent_);
  }
}

RiskSettings risk_settings_for(const EngineConfig &config) {
  auto settings = config.risk;
  settings.max_open_trades = std::min(settings.max_open_trades, config.max_positions);
  return settings;
}

std::shared_ptr<RiskGate> make_risk_gate(const EngineConfig &config) {
  return std::make_shared<RiskManager>(risk_settings_for(config));
}

} // namespace swarm
