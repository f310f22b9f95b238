#include "execution.h"
#include "pip_utils.h"
#include <algorithm>
#include <format>
#include <ranges>
#include <utility>

using json = nlohmann::json;

namespace swarm {

// ═══════════════════════════════════════════════════════════════
// ExecutionGate
// ═══════════════════════════════════════════════════════════════

ExecutionGate::Permit::Permit(Permit &&other) noexcept
    : gate_{std::exchange(other.gate_, nullptr)},
      symbol_{std::move(other.symbol_)} {}

ExecutionGate::Permit::~Permit() {
  if (gate_)
    gate_->release(symbol_);
}

std::expected<ExecutionGate::Permit, GateReject>
ExecutionGate::try_acquire(std::string_view symbol, time_point now,
                           std::chrono::milliseconds cooldown) {
  auto lock = std::scoped_lock{mutex_};
  auto &s = state(symbol);

  if (s.locked)
    return std::unexpected(GateReject::InFlight);

  if (s.last_trade_time and now - *s.last_trade_time < cooldown)
    return std::unexpected(GateReject::Cooldown);

  s.locked = true;
  return Permit{this, std::string{symbol}};
}

void ExecutionGate::release(std::string_view symbol) {
  auto lock = std::scoped_lock{mutex_};
  state(symbol).locked = false;
}

void ExecutionGate::record_trade(std::string_view symbol, time_point when) {
  auto lock = std::scoped_lock{mutex_};
  state(symbol).last_trade_time = when;
}

void ExecutionGate::record_tick(const Tick &tick) {
  auto lock = std::scoped_lock{mutex_};
  state(tick.symbol).last_tick = tick;
}

bool ExecutionGate::is_locked(std::string_view symbol) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = states_.find(symbol);
  return it != states_.end() and it->second.locked;
}

std::optional<time_point>
ExecutionGate::last_trade_time(std::string_view symbol) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = states_.find(symbol);
  if (it == states_.end())
    return std::nullopt;
  return it->second.last_trade_time;
}

std::optional<Tick> ExecutionGate::last_tick(std::string_view symbol) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = states_.find(symbol);
  if (it == states_.end())
    return std::nullopt;
  return it->second.last_tick;
}

std::chrono::milliseconds
ExecutionGate::cooldown_remaining(std::string_view symbol, time_point now,
                                  std::chrono::milliseconds cooldown) const {
  auto last = last_trade_time(symbol);
  if (not last)
    return std::chrono::milliseconds::zero();

  auto elapsed =
      std::chrono::duration_cast<std::chrono::milliseconds>(now - *last);
  return std::max(cooldown - elapsed, std::chrono::milliseconds::zero());
}

json ExecutionGate::snapshot() const {
  auto lock = std::scoped_lock{mutex_};
  auto j = json::object();
  for (const auto &[symbol, s] : states_) {
    auto entry = json{{"locked", s.locked}};
    entry["last_trade_time"] =
        s.last_trade_time ? json(to_millis(*s.last_trade_time)) : json(nullptr);
    if (s.last_tick)
      entry["last_tick"] = {{"bid", s.last_tick->bid},
                            {"ask", s.last_tick->ask},
                            {"time", to_millis(s.last_tick->time)}};
    j[symbol] = entry;
  }
  return j;
}

SymbolState &ExecutionGate::state(std::string_view symbol) {
  auto it = states_.find(symbol);
  if (it == states_.end())
    it = states_.emplace(std::string{symbol}, SymbolState{}).first;
  return it->second;
}

// ═══════════════════════════════════════════════════════════════
// TradePipeline
// ═══════════════════════════════════════════════════════════════

std::string_view to_string(TradeDecision d) {
  switch (d) {
  case TradeDecision::Executed:
    return "EXECUTED";
  case TradeDecision::InFlight:
    return "IN_FLIGHT";
  case TradeDecision::Cooldown:
    return "COOLDOWN";
  case TradeDecision::RiskBlocked:
    return "RISK_BLOCKED";
  case TradeDecision::PositionExists:
    return "POSITION_EXISTS";
  case TradeDecision::NoQuote:
    return "NO_QUOTE";
  case TradeDecision::SpreadTooWide:
    return "SPREAD_TOO_WIDE";
  case TradeDecision::SizingFailed:
    return "SIZING_FAILED";
  case TradeDecision::OrderFailed:
    return "ORDER_FAILED";
  case TradeDecision::Error:
    return "ERROR";
  }
  return "ERROR";
}

TradeOutcome TradePipeline::execute(const TradeContext &ctx,
                                    std::string_view symbol,
                                    const Signal &signal, time_point now) {
  auto permit = gate_.try_acquire(symbol, now, ctx.config.cooldown);

  if (not permit) {
    if (permit.error() == GateReject::InFlight) {
      logger_.log(LogLevel::Info, LogCategory::Trade,
                  "🔒 Signal ignored, order already in flight", symbol);
      return {TradeDecision::InFlight, "order in flight", {}, {}};
    }

    auto remaining = gate_.cooldown_remaining(symbol, now, ctx.config.cooldown);
    auto seconds = std::chrono::duration<double>(remaining).count();
    logger_.filter("COOLDOWN", symbol,
                   std::format("Cooldown active, {:.0f}s remaining", seconds),
                   {{"remaining_ms", remaining.count()}});
    return {TradeDecision::Cooldown, std::format("{:.0f}s remaining", seconds),
            {}, {}};
  }

  logger_.log(LogLevel::Debug, LogCategory::Trade, "🔐 Execution lock acquired",
              symbol);

  // The permit releases the lock on every path out of here
  auto outcome = run_locked(ctx, permit->symbol(), signal, now);

  logger_.log(LogLevel::Debug, LogCategory::Trade,
              std::format("🔓 Execution lock released ({})",
                          to_string(outcome.decision)),
              symbol);
  return outcome;
}

TradeOutcome TradePipeline::run_locked(const TradeContext &ctx,
                                       const std::string &symbol,
                                       const Signal &signal, time_point now) {
  const auto &config = ctx.config;
  auto stage = std::string_view{"risk check"};

  try {
    // Global risk admission
    auto admission = ctx.risk.can_open_position();
    if (not admission.allowed) {
      logger_.filter("RISK_MANAGER", symbol, admission.reason);
      return {TradeDecision::RiskBlocked, admission.reason, {}, {}};
    }

    // Broker view of open positions
    stage = "position check";
    auto positions = adapter_.get_open_positions();
    if (not positions) {
      auto detail = std::format("Open positions unavailable: {}",
                                to_string(positions.error()));
      logger_.log(LogLevel::Error, LogCategory::Trade, detail, symbol);
      return {TradeDecision::Error, detail, {}, {}};
    }

    auto broker_count = std::ranges::count_if(
        *positions, [&](const Position &p) { return p.symbol == symbol; });
    if (broker_count >= config.max_trades_per_symbol) {
      auto detail = std::format("{} open position(s), max {}", broker_count,
                                config.max_trades_per_symbol);
      logger_.filter("POSITION_EXISTS", symbol, detail,
                     {{"source", "broker"}, {"count", broker_count}});
      return {TradeDecision::PositionExists, detail, {}, {}};
    }

    // Local ledger can be ahead of the broker's reported positions
    auto ledger_count = ctx.risk.open_trade_count(symbol);
    if (ledger_count >= config.max_trades_per_symbol) {
      auto detail = std::format("{} open trade(s) in ledger, max {}",
                                ledger_count, config.max_trades_per_symbol);
      logger_.filter("POSITION_EXISTS", symbol, detail,
                     {{"source", "ledger"}, {"count", ledger_count}});
      return {TradeDecision::PositionExists, detail, {}, {}};
    }

    // Fresh quote for entry price and spread
    stage = "quote";
    auto quote = adapter_.get_quote(symbol);
    if (not quote or quote->bid <= 0.0 or quote->ask <= 0.0) {
      logger_.filter("NO_QUOTE", symbol, "No valid quote available");
      return {TradeDecision::NoQuote, "no valid quote", {}, {}};
    }

    auto spread = spread_pips(quote->bid, quote->ask, symbol);
    if (spread > config.max_spread_pips) {
      auto detail = std::format("Spread {:.1f} pips exceeds max {:.1f}", spread,
                                config.max_spread_pips);
      logger_.filter("SPREAD", symbol, detail,
                     {{"spread_pips", spread}, {"max", config.max_spread_pips}});
      return {TradeDecision::SpreadTooWide, detail, {}, {}};
    }

    stage = "account";
    auto account = adapter_.get_account_info();
    if (not account) {
      auto detail = std::format("Account info unavailable: {}",
                                to_string(account.error()));
      logger_.log(LogLevel::Error, LogCategory::Trade, detail, symbol);
      return {TradeDecision::Error, detail, {}, {}};
    }

    // Entry on the side we cross
    stage = "stop target";
    auto price = signal.direction == Direction::Buy ? quote->ask : quote->bid;
    auto metadata = signal.metadata.is_object() ? signal.metadata : json::object();
    metadata["spread_pips"] = spread;
    auto target = ctx.strategy.compute_stop_target(price, signal.direction,
                                                   pip_size(symbol), metadata);

    // Broker limits, raised to any minimum learned from rejections
    stage = "sizing";
    auto specs = adapter_.get_symbol_specs(symbol).value_or(VolumeSpecs{});
    if (auto detected = adapter_.get_detected_min_volume(symbol))
      specs.min_volume = std::max(specs.min_volume, *detected);

    auto rates = conversion_rates(symbol, *quote);
    auto sizing = ctx.risk.size_position(account->balance, target.stop_loss_pips,
                                         symbol, rates, specs);
    if (not sizing.can_trade) {
      logger_.log(LogLevel::Warn, LogCategory::Trade,
                  std::format("❌ Cannot trade: {}", sizing.reason), symbol);
      logger_.filter("SIZING", symbol, sizing.reason,
                     {{"stop_loss_pips", target.stop_loss_pips},
                      {"balance", account->balance}});
      return {TradeDecision::SizingFailed, sizing.reason, {}, {}};
    }

    auto order = OrderRequest{};
    order.symbol = symbol;
    order.direction = signal.direction;
    order.lot_size = sizing.lot_size;
    order.stop_loss = target.stop_loss;
    order.take_profit = target.take_profit;
    order.stop_loss_pips = target.stop_loss_pips;
    order.take_profit_pips = target.take_profit_pips;
    order.comment = std::format("{} {:.0f}%", ctx.strategy.name(),
                                signal.confidence);

    stage = "order";
    auto result = adapter_.place_order(order, config.max_spread_pips);

    if (not result.success) {
      auto detail = result.error_message.value_or("unknown error");
      logger_.log(LogLevel::Error, LogCategory::Trade,
                  std::format("❌ Order failed: {}", detail), symbol,
                  {{"lot_size", order.lot_size},
                   {"direction", std::string{to_string(order.direction)}}});
      return {TradeDecision::OrderFailed, detail, order, result};
    }

    gate_.record_trade(symbol, now);
    ++trades_executed_;
    ctx.risk.record_open(symbol);

    logger_.entry(symbol, order.direction, result.execution_price.value_or(price),
                  order.lot_size, order.stop_loss, order.take_profit,
                  signal.reason);
    events_.emit(TradeEvent{symbol, signal, order, result, now});

    return {TradeDecision::Executed, result.order_id.value_or(""), order, result};

  } catch (const std::exception &e) {
    auto detail = std::format("{} failed: {}", stage, e.what());
    logger_.log(LogLevel::Error, LogCategory::Trade, detail, symbol);
    return {stage == "order" ? TradeDecision::OrderFailed : TradeDecision::Error,
            detail, {}, {}};
  }
}

ConversionRates TradePipeline::conversion_rates(std::string_view symbol,
                                                const Quote &quote) {
  auto rates = ConversionRates{};
  rates[std::string{symbol}] = (quote.bid + quote.ask) / 2.0;

  auto base = base_currency(symbol);
  auto counter = quote_currency(symbol);
  if (counter.empty() or counter == "USD" or base == "USD")
    return rates;

  // Crosses need the quote currency's USD rate in either orientation
  for (auto pair : {std::format("{}USD", counter), std::format("USD{}", counter)}) {
    auto q = adapter_.get_quote(pair);
    if (q and q->bid > 0.0 and q->ask > 0.0)
      rates[pair] = (q->bid + q->ask) / 2.0;
  }
  return rates;
}

} // namespace swarm
