#include "replay_adapter.h"
#include "defs.h"
#include "pip_utils.h"
#include <algorithm>
#include <format>
#include <fstream>
#include <ranges>

using json = nlohmann::json;

namespace swarm {

std::optional<Candle> candle_from_json(const json &j) {
  try {
    if (j.is_array() and j.size() >= 5uz) {
      auto c = Candle{};
      c.timestamp = j[0].get<std::int64_t>();
      c.open = j[1].get<double>();
      c.high = j[2].get<double>();
      c.low = j[3].get<double>();
      c.close = j[4].get<double>();
      c.volume = j.size() > 5uz ? j[5].get<double>() : 0.0;
      return c;
    }

    if (j.is_object()) {
      auto c = Candle{};
      c.timestamp = j.contains("timestamp") ? j["timestamp"].get<std::int64_t>()
                                            : j.at("time").get<std::int64_t>();
      c.open = j.at("open").get<double>();
      c.high = j.at("high").get<double>();
      c.low = j.at("low").get<double>();
      c.close = j.at("close").get<double>();
      c.volume = j.value("volume", 0.0);
      return c;
    }
  } catch (const json::exception &) {
    return std::nullopt;
  }
  return std::nullopt;
}

namespace {

// Price at which a bar triggers the position's stop or target, if any
std::optional<double> exit_price(const Position &p, const Candle &bar) {
  if (p.direction == Direction::Buy) {
    if (p.stop_loss and bar.low <= *p.stop_loss)
      return p.stop_loss;
    if (p.take_profit and bar.high >= *p.take_profit)
      return p.take_profit;
    return std::nullopt;
  }

  if (p.stop_loss and bar.high >= *p.stop_loss)
    return p.stop_loss;
  if (p.take_profit and bar.low <= *p.take_profit)
    return p.take_profit;
  return std::nullopt;
}

} // namespace

std::expected<void, ConfigError> ReplayAdapter::load(const json &j) {
  if (not j.is_object())
    return std::unexpected(ConfigError::ParseError);

  for (const auto &[symbol, frames] : j.items()) {
    if (not frames.is_object())
      return std::unexpected(ConfigError::ParseError);

    for (const auto &[name, bars] : frames.items()) {
      auto tf = parse_timeframe(name);
      if (not tf or not bars.is_array())
        return std::unexpected(ConfigError::InvalidValue);

      auto candles = std::vector<Candle>{};
      candles.reserve(bars.size());
      for (const auto &bar : bars) {
        auto candle = candle_from_json(bar);
        if (not candle)
          return std::unexpected(ConfigError::ParseError);
        candles.push_back(*candle);
      }
      add_candles(symbol, *tf, std::move(candles));
    }
  }

  rewind();
  return {};
}

std::expected<void, ConfigError> ReplayAdapter::load_file(std::string_view path) {
  auto file = std::ifstream{std::string{path}};
  if (not file)
    return std::unexpected(ConfigError::FileNotFound);

  auto j = json::parse(file, nullptr, false);
  if (j.is_discarded())
    return std::unexpected(ConfigError::ParseError);

  return load(j);
}

void ReplayAdapter::add_candles(std::string_view symbol, Timeframe tf,
                                std::vector<Candle> candles) {
  std::ranges::sort(candles, {}, &Candle::timestamp);

  auto lock = std::scoped_lock{mutex_};
  auto it = series_.find(symbol);
  if (it == series_.end())
    it = series_.emplace(std::string{symbol}, Series{}).first;
  it->second.candles[index(tf)] = std::move(candles);
}

void ReplayAdapter::rewind() {
  auto lock = std::scoped_lock{mutex_};

  for (auto &[symbol, series] : series_) {
    const auto &m5 = series.candles[index(Timeframe::M5)];
    series.cursor = 0uz;
    if (m5.empty())
      continue;

    auto visible = [&](Timeframe tf, std::int64_t now) {
      const auto &bars = series.candles[index(tf)];
      return static_cast<std::size_t>(std::ranges::count_if(
          bars, [&](const Candle &c) { return c.timestamp <= now; }));
    };

    series.cursor = m5.size() - 1;
    for (auto i = 0uz; i < m5.size(); ++i) {
      auto now = m5[i].timestamp;
      if (i + 1 >= warmup_target_m5 and visible(Timeframe::M15, now) >= warmup_target_m15 and
          visible(Timeframe::H1, now) >= warmup_target_h1) {
        series.cursor = i;
        break;
      }
    }
  }
}

bool ReplayAdapter::step() {
  auto ticks = std::vector<std::pair<PriceCallback, Tick>>{};
  auto closed = std::vector<Closed>{};
  auto on_close = CloseCallback{};
  auto advanced = false;

  {
    auto lock = std::scoped_lock{mutex_};

    for (auto &[symbol, series] : series_) {
      const auto &m5 = series.candles[index(Timeframe::M5)];
      if (series.cursor + 1 >= m5.size())
        continue;

      ++series.cursor;
      advanced = true;
      const auto &bar = m5[series.cursor];

      // Settle stops before targets when a bar spans both
      auto open = std::vector<Position>{};
      for (auto &p : positions_) {
        auto exit = p.symbol == symbol ? exit_price(p, bar) : std::nullopt;

        if (not exit) {
          open.push_back(std::move(p));
          continue;
        }

        auto pnl = pnl_locked(p, *exit);
        realized_pnl_ += pnl;
        closed.push_back({std::move(p), *exit, pnl});
      }
      positions_ = std::move(open);

      if (auto it = subscribers_.find(symbol); it != subscribers_.end()) {
        auto quote = quote_locked(symbol);
        if (quote)
          ticks.push_back({it->second, Tick{quote->symbol, quote->bid, quote->ask, quote->time}});
      }
    }
    on_close = on_close_;
  }

  // Callbacks run unlocked so they may call back into the adapter
  if (on_close)
    for (const auto &c : closed)
      on_close(c.position, c.exit_price, c.pnl);

  for (const auto &[callback, tick] : ticks)
    callback(tick);

  return advanced;
}

void ReplayAdapter::set_connected(bool connected) {
  auto lock = std::scoped_lock{mutex_};
  connected_ = connected;
}

void ReplayAdapter::on_position_closed(CloseCallback callback) {
  auto lock = std::scoped_lock{mutex_};
  on_close_ = std::move(callback);
}

std::vector<std::string> ReplayAdapter::symbols() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = std::vector<std::string>{};
  for (const auto &[symbol, series] : series_)
    result.push_back(symbol);
  return result;
}

std::size_t ReplayAdapter::orders_placed() const {
  auto lock = std::scoped_lock{mutex_};
  return orders_placed_;
}

// ═══════════════════════════════════════════════════════════════
// TradingAdapter
// ═══════════════════════════════════════════════════════════════

bool ReplayAdapter::is_connected() const {
  auto lock = std::scoped_lock{mutex_};
  return connected_;
}

void ReplayAdapter::bind_owner_context(std::string_view owner_id,
                                       std::string_view bot_id) {
  auto lock = std::scoped_lock{mutex_};
  owner_id_ = owner_id;
  bot_id_ = bot_id;
}

std::expected<int, AdapterError> ReplayAdapter::reconcile_positions() {
  auto lock = std::scoped_lock{mutex_};
  if (not connected_)
    return std::unexpected(AdapterError::NetworkError);
  return static_cast<int>(positions_.size());
}

std::optional<Quote> ReplayAdapter::get_quote(std::string_view symbol) {
  auto lock = std::scoped_lock{mutex_};
  return quote_locked(symbol);
}

std::optional<Quote> ReplayAdapter::quote_locked(std::string_view symbol) const {
  auto it = series_.find(symbol);
  if (it == series_.end())
    return std::nullopt;

  const auto &m5 = it->second.candles[index(Timeframe::M5)];
  if (m5.empty())
    return std::nullopt;

  const auto &bar = m5[it->second.cursor];
  auto half = pips_to_price(settings_.spread_pips, symbol) / 2.0;
  return Quote{std::string{symbol}, bar.close - half, bar.close + half,
               from_millis(bar.timestamp)};
}

std::expected<std::vector<Candle>, AdapterError>
ReplayAdapter::get_candle_history(std::string_view symbol, Timeframe tf,
                                  std::size_t count) {
  auto lock = std::scoped_lock{mutex_};
  if (not connected_)
    return std::unexpected(AdapterError::NetworkError);

  auto it = series_.find(symbol);
  if (it == series_.end())
    return std::unexpected(AdapterError::InvalidSymbol);

  const auto &m5 = it->second.candles[index(Timeframe::M5)];
  if (m5.empty())
    return std::vector<Candle>{};

  // Only bars that have opened by the replay clock are visible
  auto now = m5[it->second.cursor].timestamp;
  const auto &bars = it->second.candles[index(tf)];
  auto end = std::ranges::upper_bound(bars, now, {}, &Candle::timestamp);
  auto available = static_cast<std::size_t>(end - bars.begin());
  auto begin = end - static_cast<std::ptrdiff_t>(std::min(count, available));
  return std::vector<Candle>{begin, end};
}

void ReplayAdapter::subscribe_price(std::string_view symbol, PriceCallback callback) {
  auto lock = std::scoped_lock{mutex_};
  subscribers_.insert_or_assign(std::string{symbol}, std::move(callback));
}

void ReplayAdapter::unsubscribe_price(std::string_view symbol) {
  auto lock = std::scoped_lock{mutex_};
  if (auto it = subscribers_.find(symbol); it != subscribers_.end())
    subscribers_.erase(it);
}

std::expected<std::vector<Position>, AdapterError> ReplayAdapter::get_open_positions() {
  auto lock = std::scoped_lock{mutex_};
  if (not connected_)
    return std::unexpected(AdapterError::NetworkError);
  return positions_;
}

std::expected<AccountInfo, AdapterError> ReplayAdapter::get_account_info() {
  auto lock = std::scoped_lock{mutex_};
  if (not connected_)
    return std::unexpected(AdapterError::NetworkError);

  auto balance = settings_.starting_balance + realized_pnl_;
  auto equity = balance;
  for (const auto &p : positions_) {
    auto quote = quote_locked(p.symbol);
    if (quote)
      equity += pnl_locked(p, p.direction == Direction::Buy ? quote->bid : quote->ask);
  }
  return AccountInfo{balance, equity, settings_.currency};
}

std::optional<VolumeSpecs> ReplayAdapter::get_symbol_specs(std::string_view symbol) {
  auto lock = std::scoped_lock{mutex_};
  if (not series_.contains(symbol))
    return std::nullopt;
  return settings_.volume;
}

std::optional<double> ReplayAdapter::get_detected_min_volume(std::string_view symbol) {
  auto lock = std::scoped_lock{mutex_};
  auto it = detected_min_.find(symbol);
  if (it == detected_min_.end())
    return std::nullopt;
  return it->second;
}

OrderResult ReplayAdapter::place_order(const OrderRequest &order, double max_spread_pips) {
  auto lock = std::scoped_lock{mutex_};

  auto reject = [](std::string message) {
    auto result = OrderResult{};
    result.error_message = std::move(message);
    return result;
  };

  if (not connected_)
    return reject("not connected");
  if (order.direction == Direction::None)
    return reject("no direction");

  auto quote = quote_locked(order.symbol);
  if (not quote)
    return reject(std::format("no price for {}", order.symbol));

  auto spread = spread_pips(quote->bid, quote->ask, order.symbol);
  if (spread > max_spread_pips)
    return reject(std::format("spread {:.1f} pips exceeds {:.1f}", spread, max_spread_pips));

  if (order.lot_size < settings_.volume.min_volume) {
    detected_min_[order.symbol] = settings_.volume.min_volume;
    return reject(std::format("volume {:.2f} below minimum {:.2f}", order.lot_size,
                              settings_.volume.min_volume));
  }

  auto position = Position{};
  position.position_id = std::format("replay-{}", next_order_id_++);
  position.symbol = order.symbol;
  position.direction = order.direction;
  position.volume = std::min(order.lot_size, settings_.volume.max_volume);
  position.entry_price = order.direction == Direction::Buy ? quote->ask : quote->bid;
  if (order.stop_loss > 0.0)
    position.stop_loss = order.stop_loss;
  if (order.take_profit > 0.0)
    position.take_profit = order.take_profit;
  positions_.push_back(position);
  ++orders_placed_;

  auto result = OrderResult{};
  result.success = true;
  result.order_id = position.position_id;
  result.execution_price = position.entry_price;
  return result;
}

bool ReplayAdapter::modify_position(const PositionModification &mod) {
  auto lock = std::scoped_lock{mutex_};
  auto it = std::ranges::find(positions_, mod.position_id, &Position::position_id);
  if (it == positions_.end())
    return false;
  it->stop_loss = mod.stop_loss;
  return true;
}

double ReplayAdapter::pnl_locked(const Position &p, double exit_price) const {
  auto sign = p.direction == Direction::Buy ? 1.0 : -1.0;
  auto pnl = (exit_price - p.entry_price) * sign * p.volume * contract_size(p.symbol);

  // Quote-currency P&L; USD-based pairs convert at the exit price
  if (base_currency(p.symbol) == "USD" and exit_price > 0.0)
    pnl /= exit_price;
  return pnl;
}

} // namespace swarm
