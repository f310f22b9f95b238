#include "engine.h"
#include "pip_utils.h"
#include <algorithm>
#include <format>
#include <limits>

using json = nlohmann::json;

namespace swarm {

json EngineStatus::to_json() const {
  auto signals = json::object();
  for (const auto &[symbol, last] : last_signals)
    signals[symbol] = {{"direction", std::string{swarm::to_string(last.signal.direction)}},
                       {"confidence", last.signal.confidence},
                       {"reason", last.signal.reason},
                       {"time", to_millis(last.time)}};

  auto tick = json(nullptr);
  if (last_tick)
    tick = {{"symbol", last_tick->symbol},
            {"bid", last_tick->bid},
            {"ask", last_tick->ask},
            {"time", to_millis(last_tick->time)}};

  return {{"running", running},
          {"strategy", strategy},
          {"symbols", symbols},
          {"ticks", ticks},
          {"analyses", analyses},
          {"trades", trades},
          {"last_tick", tick},
          {"last_signals", signals},
          {"performance",
           {{"tick", tick_perf.to_json()}, {"analysis", analysis_perf.to_json()}}},
          {"last_error", last_error ? json(*last_error) : json(nullptr)},
          {"config", config},
          {"risk", risk},
          {"symbol_state", symbol_state},
          {"buffers", buffers},
          {"warmup", warmup}};
}

Engine::Engine(std::shared_ptr<TradingAdapter> adapter, EngineConfig config,
               std::shared_ptr<Logger> logger, StrategyFactory strategy_factory,
               RiskGateFactory risk_factory)
    : adapter_{std::move(adapter)}, logger_{std::move(logger)},
      strategy_factory_{std::move(strategy_factory)},
      risk_factory_{std::move(risk_factory)},
      config_{std::make_shared<const EngineConfig>(std::move(config))},
      pipeline_{*adapter_, gate_, *logger_, events_} {}

Engine::~Engine() { stop(); }

std::shared_ptr<const EngineConfig> Engine::config() const {
  auto lock = std::scoped_lock{config_mutex_};
  return config_;
}

// ═══════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════

std::expected<void, EngineError> Engine::start() {
  auto lock = std::scoped_lock{lifecycle_mutex_};
  return start_locked(false);
}

void Engine::stop() {
  // Interrupt a warm-up in progress before queueing for the lifecycle lock
  {
    auto lock = std::scoped_lock{cancel_mutex_};
    cancel_.request_stop();
  }

  auto lock = std::scoped_lock{lifecycle_mutex_};
  stop_locked(false);
}

std::expected<void, EngineError>
Engine::reload(const EngineConfigUpdate &update) {
  auto lock = std::scoped_lock{lifecycle_mutex_};

  auto current = config();
  auto next = std::make_shared<const EngineConfig>(apply_update(*current, update));

  if (auto problem = validate(*next)) {
    logger_->error(LogCategory::System,
                   std::format("❌ Reload rejected: {}", *problem));
    return std::unexpected(EngineError::ConfigurationError);
  }

  auto keep_buffers = same_symbols(*current, *next);
  auto was_running = running_.load();

  logger_->info(LogCategory::System,
                std::format("🔄 Reloading config ({})",
                            keep_buffers ? "symbols unchanged" : "symbols changed"),
                to_json(*next));

  if (was_running)
    stop_locked(keep_buffers);
  else if (not keep_buffers)
    cache_.clear();

  // Readers hold their own snapshot; they never see a partial update
  {
    auto config_lock = std::scoped_lock{config_mutex_};
    config_ = next;
  }

  if (was_running)
    return start_locked(keep_buffers);
  return {};
}

std::expected<void, EngineError> Engine::start_locked(bool skip_warm) {
  if (running_)
    return {};

  auto stoken = std::stop_token{};
  {
    auto lock = std::scoped_lock{cancel_mutex_};
    cancel_ = std::stop_source{};
    stoken = cancel_.get_token();
  }

  auto cfg = config();

  auto fail = [&](EngineError error, std::string message) {
    logger_->error(LogCategory::System,
                   std::format("❌ Start failed ({}): {}", to_string(error), message));
    record_error(std::move(message));
    unsubscribe_all();
    running_ = false;
    return std::unexpected(error);
  };

  try {
    if (not adapter_->is_connected())
      return fail(EngineError::ConnectivityError, "adapter is not connected");

    adapter_->bind_owner_context(cfg->owner_id, cfg->bot_id);

    auto reconciled = adapter_->reconcile_positions();
    if (not reconciled)
      return fail(EngineError::ConnectivityError,
                  std::format("position reconciliation failed: {}",
                              to_string(reconciled.error())));
    logger_->info(LogCategory::System,
                  std::format("🔗 Reconciled {} open position(s)", *reconciled));

    if (auto problem = validate(*cfg))
      return fail(EngineError::ConfigurationError, *problem);

    auto strategy = strategy_factory_(*cfg);
    if (not strategy)
      return fail(EngineError::StrategyError,
                  std::format("no strategy for type {}", to_string(cfg->strategy_type)));

    auto account = adapter_->get_account_info();
    if (not account)
      return fail(EngineError::ConnectivityError,
                  std::format("account info unavailable: {}",
                              to_string(account.error())));

    // One gate per engine: a tripped breaker and the open-trade ledger
    // survive restarts and reloads
    auto risk = std::shared_ptr<RiskGate>{};
    {
      auto lock = std::scoped_lock{run_mutex_};
      risk = risk_;
    }
    if (risk) {
      risk->update_config(risk_settings_for(*cfg));
    } else {
      risk = risk_factory_(*cfg);
      if (not risk)
        return fail(EngineError::RiskError, "risk gate could not be created");
      risk->initialize(account->balance);
    }

    {
      auto lock = std::scoped_lock{run_mutex_};
      strategy_ = strategy;
      risk_ = risk;
    }

    logger_->info(LogCategory::System,
                  std::format("🚀 Starting {} on {} symbol(s), balance {:.2f} {}",
                              strategy->name(), cfg->symbols.size(),
                              account->balance, account->currency));

    auto loader = WarmupLoader{*adapter_, cache_, *logger_};
    auto report = loader.run(cfg->symbols, cfg->timings, stoken, skip_warm);
    {
      auto lock = std::scoped_lock{state_mutex_};
      warmup_report_ = report;
    }

    if (stoken.stop_requested())
      return fail(EngineError::Cancelled, "stopped during warm-up");

    // Counters and log throttles start afresh with each run
    tick_count_ = 0uz;
    analysis_count_ = 0uz;

    // Tick callbacks check this before touching shared state
    running_ = true;

    for (const auto &symbol : cfg->symbols) {
      adapter_->subscribe_price(symbol, [this](const Tick &tick) { handle_tick(tick); });
      auto lock = std::scoped_lock{run_mutex_};
      subscribed_.push_back(symbol);
    }

    auto on_error = [this](std::string_view task, const std::exception &e) {
      on_task_error(task, e);
    };
    analysis_task_ = std::make_unique<PeriodicTask>(
        "analysis", cfg->timings.analysis_interval,
        [this](std::stop_token st) { run_analysis_cycle(st); }, true, on_error);
    refresh_task_ = std::make_unique<PeriodicTask>(
        "refresh", cfg->timings.refresh_interval,
        [this](std::stop_token st) { run_refresh_cycle(st); }, false, on_error);
    trailing_task_ = std::make_unique<PeriodicTask>(
        "trailing", cfg->timings.trailing_interval,
        [this](std::stop_token st) { run_trailing_cycle(st); }, false, on_error);

  } catch (const std::exception &e) {
    analysis_task_.reset();
    refresh_task_.reset();
    trailing_task_.reset();
    return fail(EngineError::ConnectivityError, e.what());
  }

  logger_->info(LogCategory::System, "✅ Engine running",
                {{"symbols", cfg->symbols},
                 {"strategy", std::string{to_string(cfg->strategy_type)}}});
  events_.emit(StartedEvent{cfg->strategy_type, cfg->symbols});
  return {};
}

void Engine::stop_locked(bool keep_buffers) {
  if (not running_)
    return;

  running_ = false;

  // Joins each scheduler; a body already running finishes first
  analysis_task_.reset();
  refresh_task_.reset();
  trailing_task_.reset();

  unsubscribe_all();

  if (not keep_buffers)
    cache_.clear();

  auto stopped = StoppedEvent{analysis_count_.load(), pipeline_.trades_executed(),
                              tick_count_.load()};
  logger_->info(LogCategory::System,
                std::format("🛑 Engine stopped: {} analyses, {} trades, {} ticks",
                            stopped.analyses, stopped.trades, stopped.ticks));
  events_.emit(stopped);
}

void Engine::unsubscribe_all() {
  auto symbols = std::vector<std::string>{};
  {
    auto lock = std::scoped_lock{run_mutex_};
    symbols.swap(subscribed_);
  }

  for (const auto &symbol : symbols) {
    try {
      adapter_->unsubscribe_price(symbol);
    } catch (const std::exception &e) {
      logger_->log(LogLevel::Warn, LogCategory::System,
                   std::format("Unsubscribe failed: {}", e.what()), symbol);
    }
  }
}

void Engine::on_position_closed(std::string_view symbol, double pnl) {
  auto risk = std::shared_ptr<RiskGate>{};
  {
    auto lock = std::scoped_lock{run_mutex_};
    risk = risk_;
  }
  if (risk)
    risk->record_close(symbol, pnl);

  logger_->log(LogLevel::Info, LogCategory::Exit,
               std::format("{} Position closed, P&L {:.2f}", pnl >= 0.0 ? "💰" : "📉", pnl),
               symbol, {{"pnl", pnl}});
}

// ═══════════════════════════════════════════════════════════════
// Ticks
// ═══════════════════════════════════════════════════════════════

void Engine::handle_tick(const Tick &tick) {
  if (not running_)
    return;

  auto timer = Stopwatch{};
  auto count = ++tick_count_;
  gate_.record_tick(tick);

  auto heartbeat = false;
  {
    auto lock = std::scoped_lock{state_mutex_};
    last_tick_ = tick;
    if (not last_heartbeat_ or tick.time - *last_heartbeat_ >= tick_heartbeat_interval) {
      last_heartbeat_ = tick.time;
      heartbeat = true;
    }
  }

  auto spread = spread_pips(tick.bid, tick.ask, tick.symbol);
  events_.emit(TickEvent{tick.symbol, tick.bid, tick.ask, spread, tick.time, count});

  if (heartbeat)
    logger_->log(LogLevel::Info, LogCategory::System,
                 std::format("💓 {:.5f}/{:.5f} spread {:.1f} pips, {} ticks",
                             tick.bid, tick.ask, spread, count),
                 tick.symbol);

  auto elapsed = timer.elapsed();
  if (tick_perf_.record(elapsed)) {
    logger_->log(LogLevel::Warn, LogCategory::Performance,
                 std::format("🐢 Slow tick: {:.1f}ms", elapsed.count()), tick.symbol,
                 {{"latency_ms", elapsed.count()}});
    events_.emit(PerformanceEvent{PerfKind::Tick, tick.symbol, elapsed.count(), false,
                                  std::chrono::system_clock::now()});
  }
}

// ═══════════════════════════════════════════════════════════════
// Schedulers
// ═══════════════════════════════════════════════════════════════

Engine::Thresholds Engine::thresholds_for(const Strategy &strategy) const {
  auto config = strategy.get_config();
  auto lookback = [&](const char *key, std::size_t fallback) {
    auto it = config.find(key);
    if (it == config.end() or not it->is_number() or *it < 0)
      return fallback;
    return it->get<std::size_t>();
  };

  return {lookback("h1_lookback", default_h1_lookback) + lookback_margin,
          lookback("m15_lookback", default_m15_lookback) + lookback_margin,
          min_m5_candles};
}

void Engine::run_analysis_cycle(std::stop_token stoken) {
  if (not running_)
    return;

  auto cfg = config();
  auto strategy = std::shared_ptr<Strategy>{};
  auto risk = std::shared_ptr<RiskGate>{};
  {
    auto lock = std::scoped_lock{run_mutex_};
    strategy = strategy_;
    risk = risk_;
  }
  if (not strategy or not risk)
    return;

  auto cycle = ++analysis_count_;

  auto admission = risk->can_open_position();
  if (not admission.allowed) {
    if (cycle % risk_blocked_log_every == 1uz)
      logger_->info(LogCategory::Analysis,
                    std::format("⛔ Analysis skipped, trading blocked: {}",
                                admission.reason),
                    {{"analysis", cycle}});
    return;
  }

  auto timer = Stopwatch{};
  auto thresholds = thresholds_for(*strategy);
  auto insufficient = std::vector<std::string>{};

  for (const auto &symbol : cfg->symbols) {
    if (stoken.stop_requested() or not running_)
      return;

    // One symbol's failure never holds up the rest
    try {
      if (not analyze_symbol(*cfg, *strategy, *risk, symbol, thresholds))
        insufficient.push_back(symbol);
    } catch (const std::exception &e) {
      auto message = std::format("Analysis failed: {}", e.what());
      logger_->log(LogLevel::Error, LogCategory::Analysis, message, symbol);
      record_error(std::format("{}: {}", symbol, message));
    }
  }

  if (not insufficient.empty() and cycle % insufficient_log_every == 1uz)
    logger_->info(LogCategory::Analysis,
                  std::format("⏳ Waiting for data on {} symbol(s)", insufficient.size()),
                  {{"symbols", insufficient},
                   {"required", {{"H1", thresholds.h1},
                                 {"M15", thresholds.m15},
                                 {"M5", thresholds.m5}}}});

  auto elapsed = timer.elapsed();
  if (analysis_perf_.record(elapsed)) {
    logger_->warn(LogCategory::Performance,
                  std::format("🐢 Slow analysis cycle: {:.1f}ms", elapsed.count()),
                  {{"latency_ms", elapsed.count()}, {"symbols", cfg->symbols.size()}});
    events_.emit(PerformanceEvent{PerfKind::Analysis, "", elapsed.count(), false,
                                  std::chrono::system_clock::now()});
  }
}

bool Engine::analyze_symbol(const EngineConfig &cfg, Strategy &strategy,
                            RiskGate &risk, const std::string &symbol,
                            const Thresholds &thresholds) {
  auto data = cache_.snapshot(symbol);
  if (data.h1.size() < thresholds.h1 or data.m15.size() < thresholds.m15 or
      data.m5.size() < thresholds.m5)
    return false;

  auto timer = Stopwatch{};

  // Fresh quote for this exact symbol, otherwise the last M5 close
  auto quote = adapter_->get_quote(symbol);
  if (quote and quote->bid > 0.0 and quote->ask > 0.0) {
    data.bid = quote->bid;
    data.ask = quote->ask;
    data.spread_pips = spread_pips(quote->bid, quote->ask, symbol);
  } else {
    data.bid = data.ask = data.m5.back().close;
    data.spread_pips = 0.0;
  }

  if (auto aware = strategy.as_symbol_aware())
    aware->set_active_symbol(symbol);
  if (auto consumer = strategy.as_timeframe_consumer()) {
    consumer->ingest_timeframe_data(Timeframe::H1, data.h1);
    consumer->ingest_timeframe_data(Timeframe::M15, data.m15);
  }

  auto signal = strategy.analyze_signal(data.m5, data);
  auto now = std::chrono::system_clock::now();
  {
    auto lock = std::scoped_lock{state_mutex_};
    last_signals_[symbol] = {signal, now};
  }

  events_.emit(AnalysisEvent{symbol, signal, timer.elapsed().count()});

  if (signal.direction == Direction::None or signal.confidence < confidence_threshold) {
    if (strategy.get_config().value("verbose_logging", false))
      logger_->log(LogLevel::Debug, LogCategory::Analysis,
                   std::format("No trade: {} ({:.0f}%)", signal.reason, signal.confidence),
                   symbol);
    return true;
  }

  logger_->signal_detected(symbol, signal);

  // Reload may have replaced the config; a stopped engine places nothing
  if (not running_)
    return true;

  auto outcome = pipeline_.execute({cfg, strategy, risk}, symbol, signal, now);
  if (outcome.decision == TradeDecision::OrderFailed or
      outcome.decision == TradeDecision::Error)
    record_error(std::format("{}: {}", symbol, outcome.detail));
  return true;
}

void Engine::run_refresh_cycle(std::stop_token stoken) {
  auto cfg = config();
  auto remaining = cfg->symbols.size() * all_timeframes.size();

  for (const auto &symbol : cfg->symbols) {
    // Checked per symbol so stop() lands mid-sweep
    if (not running_ or stoken.stop_requested())
      return;

    for (auto tf : all_timeframes) {
      try {
        auto candles = adapter_->get_candle_history(symbol, tf, refresh_candle_count);
        if (candles)
          cache_.merge(symbol, tf, *candles);
        else
          logger_->log(LogLevel::Warn, LogCategory::System,
                       std::format("Refresh {} failed: {}", to_string(tf),
                                   to_string(candles.error())),
                       symbol);
      } catch (const std::exception &e) {
        logger_->log(LogLevel::Warn, LogCategory::System,
                     std::format("Refresh {} failed: {}", to_string(tf), e.what()),
                     symbol);
      }

      if (--remaining > 0uz and not sleep_for(stoken, cfg->timings.refresh_call_delay))
        return;
    }
  }
}

void Engine::run_trailing_cycle(std::stop_token stoken) {
  if (not running_)
    return;

  auto strategy = std::shared_ptr<Strategy>{};
  {
    auto lock = std::scoped_lock{run_mutex_};
    strategy = strategy_;
  }
  if (not strategy)
    return;

  auto settings = strategy->get_config();
  if (not settings.value("trailing_enabled", false))
    return;

  auto verbose = settings.value("verbose_logging", false);
  auto level = verbose ? LogLevel::Warn : LogLevel::Debug;
  auto cfg = config();

  auto positions = adapter_->get_open_positions();
  if (not positions) {
    logger_->log(level, LogCategory::Exit,
                 std::format("Trailing: positions unavailable: {}",
                             to_string(positions.error())));
    return;
  }

  for (const auto &position : *positions) {
    if (stoken.stop_requested() or not running_)
      return;
    if (std::ranges::find(cfg->symbols, position.symbol) == cfg->symbols.end())
      continue;

    // Quote hiccups here are routine and must not disturb the engine
    try {
      auto quote = adapter_->get_quote(position.symbol);
      if (not quote) {
        logger_->log(level, LogCategory::Exit, "Trailing: no quote", position.symbol);
        continue;
      }

      auto is_long = position.direction == Direction::Buy;
      auto current = is_long ? quote->bid : quote->ask;
      auto current_stop = position.stop_loss.value_or(
          is_long ? 0.0 : std::numeric_limits<double>::max());

      auto update = strategy->compute_trailing_stop(position.entry_price, current,
                                                    current_stop, position.direction,
                                                    pip_size(position.symbol));
      if (not update.should_update)
        continue;

      if (adapter_->modify_position({position.position_id, update.new_stop_loss}))
        logger_->log(LogLevel::Info, LogCategory::Exit,
                     std::format("🔒 Trailing stop moved to {:.5f} (+{:.1f} pips)",
                                 update.new_stop_loss, update.profit_pips),
                     position.symbol,
                     {{"position_id", position.position_id},
                      {"stop_loss", update.new_stop_loss},
                      {"profit_pips", update.profit_pips}});
      else
        logger_->log(level, LogCategory::Exit, "Trailing: modify rejected",
                     position.symbol, {{"position_id", position.position_id}});
    } catch (const std::exception &e) {
      logger_->log(level, LogCategory::Exit,
                   std::format("Trailing failed: {}", e.what()), position.symbol);
    }
  }
}

// ═══════════════════════════════════════════════════════════════
// Status and errors
// ═══════════════════════════════════════════════════════════════

EngineStatus Engine::status() const {
  auto cfg = config();

  auto status = EngineStatus{};
  status.running = running_.load();
  status.strategy = std::string{to_string(cfg->strategy_type)};
  status.symbols = cfg->symbols;
  status.ticks = tick_count_.load();
  status.analyses = analysis_count_.load();
  status.trades = pipeline_.trades_executed();
  status.tick_perf = tick_perf_.stats();
  status.analysis_perf = analysis_perf_.stats();
  status.config = to_json(*cfg);
  status.symbol_state = gate_.snapshot();
  status.buffers = cache_.sizes();

  {
    auto lock = std::scoped_lock{state_mutex_};
    status.last_tick = last_tick_;
    status.last_signals = last_signals_;
    status.last_error = last_error_;
    status.warmup = warmup_report_.to_json();
  }

  auto risk = std::shared_ptr<RiskGate>{};
  {
    auto lock = std::scoped_lock{run_mutex_};
    risk = risk_;
  }
  status.risk = risk ? risk->snapshot_state() : json(nullptr);
  return status;
}

void Engine::record_error(std::string message) {
  auto lock = std::scoped_lock{state_mutex_};
  last_error_ = std::move(message);
}

void Engine::on_task_error(std::string_view task, const std::exception &e) {
  auto message = std::format("{} cycle failed: {}", task, e.what());
  logger_->error(LogCategory::System, std::format("❌ {}", message));
  record_error(std::move(message));
}

} // namespace swarm
