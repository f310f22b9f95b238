#pragma once

#include <chrono>
#include <cstddef>

namespace swarm {

using namespace std::chrono_literals;

// Candle cache
constexpr auto max_candles_per_buffer = 300uz; // Oldest evicted beyond this

// Warm-up targets (safety margin above the strict minimum)
constexpr auto warmup_target_h1 = 60uz;
constexpr auto warmup_target_m15 = 50uz;
constexpr auto warmup_target_m5 = 50uz;

// Warm-up strict minimum, below which data is considered unavailable
constexpr auto warmup_min_h1 = 50uz;
constexpr auto warmup_min_m15 = 40uz;
constexpr auto warmup_min_m5 = 40uz;

// Warm-up retry and backpressure
constexpr auto warmup_max_retries = 3;
constexpr auto warmup_request_delay = 1500ms; // Between timeframe requests
constexpr auto warmup_symbol_delay = 2000ms;  // Between symbols
constexpr auto rate_limit_backoff = 5000ms;
constexpr auto error_backoff = warmup_request_delay * 2;

// Scheduler intervals
constexpr auto refresh_interval = std::chrono::milliseconds{5min};
constexpr auto refresh_call_delay = 1000ms;
constexpr auto refresh_candle_count = 50uz;
constexpr auto analysis_interval = 30000ms;
constexpr auto trailing_interval = 5000ms;

// Analysis
constexpr auto confidence_threshold = 50.0;
constexpr auto default_h1_lookback = 40uz; // Threshold = lookback + 10
constexpr auto default_m15_lookback = 20uz;
constexpr auto lookback_margin = 10uz;
constexpr auto min_m5_candles = 20uz;

// Log throttling
constexpr auto tick_heartbeat_interval = 5000ms;
constexpr auto risk_blocked_log_every = 10uz;   // Analyses between risk-blocked logs
constexpr auto insufficient_log_every = 100uz; // Logs when count % N == 1

// Performance instrumentation
constexpr auto perf_window = 100uz;            // Ring buffer capacity
constexpr auto latency_alert_threshold = 200ms;

// Default trading parameters
constexpr auto default_lot_size = 0.01;
constexpr auto default_max_positions = 3;
constexpr auto default_cooldown = 60000ms;
constexpr auto default_max_spread_pips = 2.0;
constexpr auto default_max_trades_per_symbol = 1;

// Default risk parameters
constexpr auto default_risk_percent = 0.75;  // Of balance per trade
constexpr auto default_max_open_trades = 3;
constexpr auto default_daily_loss_limit = 3.0; // Percent

// Cache checks
static_assert(max_candles_per_buffer >= warmup_target_h1,
              "Cache must hold a full H1 warm-up");
static_assert(max_candles_per_buffer >= refresh_candle_count,
              "Cache must hold a full refresh batch");

// Warm-up checks
static_assert(warmup_min_h1 < warmup_target_h1, "H1 minimum must be below target");
static_assert(warmup_min_m15 < warmup_target_m15, "M15 minimum must be below target");
static_assert(warmup_min_m5 < warmup_target_m5, "M5 minimum must be below target");
static_assert(warmup_max_retries >= 1, "Must attempt each fetch at least once");
static_assert(warmup_max_retries <= 10, "Too many retries - stalls warm-up");
static_assert(rate_limit_backoff > error_backoff,
              "Rate-limit backoff should be materially longer than error backoff");

// Scheduler checks
static_assert(trailing_interval < analysis_interval,
              "Trailing stop runs more often than analysis");
static_assert(analysis_interval < refresh_interval,
              "Analysis runs more often than refresh");

// Analysis checks
static_assert(confidence_threshold > 0.0, "Confidence threshold must be positive");
static_assert(confidence_threshold <= 100.0, "Confidence is 0-100");
static_assert(default_h1_lookback + lookback_margin == 50uz, "Default H1 threshold is 50");
static_assert(default_m15_lookback + lookback_margin == 30uz, "Default M15 threshold is 30");
static_assert(min_m5_candles <= warmup_min_m5, "Warm-up must satisfy M5 analysis");

// Performance checks
static_assert(perf_window > 0uz, "Performance window must be non-empty");
static_assert(latency_alert_threshold > 0ms, "Latency threshold must be positive");

// Trading parameter checks
static_assert(default_lot_size > 0.0, "Lot size must be positive");
static_assert(default_lot_size <= 1.0, "Default lot size dangerously high");
static_assert(default_max_positions > 0, "Must allow at least one position");
static_assert(default_max_spread_pips > 0.0, "Max spread must be positive");
static_assert(default_max_trades_per_symbol >= 1, "Must allow one trade per symbol");
static_assert(default_risk_percent > 0.0, "Risk per trade must be positive");
static_assert(default_risk_percent <= 2.0, "Risk per trade dangerously high - max 2%");
static_assert(default_daily_loss_limit > default_risk_percent,
              "Daily loss limit should exceed a single trade's risk");

} // namespace swarm
