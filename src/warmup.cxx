#include "warmup.h"
#include "periodic_task.h"
#include <algorithm>
#include <format>
#include <optional>

using json = nlohmann::json;

namespace swarm {

json WarmupOutcome::to_json() const {
  return {{"symbol", symbol},
          {"status", std::string{to_string(status)}},
          {"attempts", attempts},
          {"H1", h1},
          {"M15", m15},
          {"M5", m5},
          {"reason", reason}};
}

std::size_t WarmupReport::count(WarmupStatus status) const {
  return static_cast<std::size_t>(std::ranges::count_if(
      outcomes, [&](const auto &o) { return o.status == status; }));
}

json WarmupReport::to_json() const {
  auto symbols = json::array();
  for (const auto &o : outcomes)
    symbols.push_back(o.to_json());

  return {{"ready", count(WarmupStatus::Ready)},
          {"partial", count(WarmupStatus::Partial)},
          {"unavailable", count(WarmupStatus::Unavailable)},
          {"failed", count(WarmupStatus::Failed)},
          {"symbols", symbols}};
}

WarmupOutcome WarmupLoader::classify(const std::string &symbol) const {
  auto outcome = WarmupOutcome{};
  outcome.symbol = symbol;
  outcome.h1 = cache_.size(symbol, Timeframe::H1);
  outcome.m15 = cache_.size(symbol, Timeframe::M15);
  outcome.m5 = cache_.size(symbol, Timeframe::M5);

  auto at = [&](auto level) {
    return outcome.h1 >= level(Timeframe::H1) and
           outcome.m15 >= level(Timeframe::M15) and
           outcome.m5 >= level(Timeframe::M5);
  };

  if (at(warmup_target))
    outcome.status = WarmupStatus::Ready;
  else if (at(warmup_minimum))
    outcome.status = WarmupStatus::Partial;
  else
    outcome.status = WarmupStatus::Unavailable;
  return outcome;
}

WarmupOutcome WarmupLoader::load_symbol(const std::string &symbol,
                                        const EngineTimings &timings,
                                        std::stop_token stoken) {
  auto max_attempts = std::max(timings.warmup_max_retries, 1);
  auto last_error = std::optional<std::string>{};

  for (auto attempt = 1; attempt <= max_attempts; ++attempt) {
    if (stoken.stop_requested())
      break;

    // One attempt fetches every timeframe; any error abandons the attempt
    auto error = std::optional<AdapterError>{};
    auto message = std::string{};
    try {
      for (auto i = 0uz; i < all_timeframes.size(); ++i) {
        auto tf = all_timeframes[i];
        auto candles = adapter_.get_candle_history(symbol, tf, warmup_target(tf));
        if (not candles) {
          error = candles.error();
          message = std::format("{} history: {}", to_string(tf),
                                to_string(candles.error()));
          break;
        }
        cache_.merge(symbol, tf, *candles);

        if (i + 1 < all_timeframes.size() and
            not sleep_for(stoken, timings.warmup_request_delay))
          break;
      }
    } catch (const std::exception &e) {
      error = AdapterError::UnknownError;
      message = e.what();
    }

    if (stoken.stop_requested())
      break;

    if (error) {
      last_error = message;
      logger_.log(LogLevel::Warn, LogCategory::System,
                  std::format("⚠️  Warm-up attempt {}/{} failed: {}", attempt,
                              max_attempts, message),
                  symbol, {{"attempt", attempt}});

      // Rate limits always back off, other errors only before a retry
      if (*error == AdapterError::RateLimitError) {
        if (not sleep_for(stoken, timings.rate_limit_backoff))
          break;
      } else if (attempt < max_attempts) {
        if (not sleep_for(stoken, timings.error_backoff))
          break;
      }
      continue;
    }

    last_error.reset();
    auto outcome = classify(symbol);
    outcome.attempts = attempt;

    if (outcome.usable()) {
      logger_.log(LogLevel::Info, LogCategory::System,
                  std::format("📊 Warm-up {}: H1={} M15={} M5={}",
                              to_string(outcome.status), outcome.h1,
                              outcome.m15, outcome.m5),
                  symbol, outcome.to_json());
      return outcome;
    }

    if (attempt < max_attempts) {
      logger_.log(LogLevel::Info, LogCategory::System,
                  std::format("⏳ Warm-up insufficient: H1={} M15={} M5={}, retrying",
                              outcome.h1, outcome.m15, outcome.m5),
                  symbol);
      if (not sleep_for(stoken, timings.warmup_request_delay))
        break;
      continue;
    }

    // Keep whatever arrived; refreshes may top it up later
    outcome.reason = "MAX_RETRIES_REACHED";
    logger_.log(LogLevel::Warn, LogCategory::System,
                std::format("⚠️  Warm-up partial reason=MAX_RETRIES_REACHED "
                            "H1={} M15={} M5={}",
                            outcome.h1, outcome.m15, outcome.m5),
                symbol, outcome.to_json());
    return outcome;
  }

  auto outcome = classify(symbol);
  outcome.status = WarmupStatus::Failed;
  outcome.attempts = max_attempts;
  outcome.reason = stoken.stop_requested() ? "STOPPED"
                                           : last_error.value_or("unknown error");
  logger_.log(LogLevel::Error, LogCategory::System,
              std::format("❌ Warm-up failed: {}", outcome.reason), symbol,
              outcome.to_json());
  return outcome;
}

WarmupReport WarmupLoader::run(const std::vector<std::string> &symbols,
                               const EngineTimings &timings,
                               std::stop_token stoken, bool skip_warm) {
  auto report = WarmupReport{};
  logger_.info(LogCategory::System,
               std::format("🔥 Warming up {} symbol(s)", symbols.size()));

  for (auto i = 0uz; i < symbols.size(); ++i) {
    const auto &symbol = symbols[i];

    if (stoken.stop_requested()) {
      auto outcome = classify(symbol);
      outcome.status = WarmupStatus::Failed;
      outcome.reason = "STOPPED";
      report.outcomes.push_back(std::move(outcome));
      continue;
    }

    if (skip_warm) {
      auto existing = classify(symbol);
      if (existing.usable()) {
        existing.reason = "ALREADY_WARM";
        logger_.log(LogLevel::Debug, LogCategory::System,
                    "Warm-up skipped, buffers already filled", symbol);
        report.outcomes.push_back(std::move(existing));
        continue;
      }
    }

    // Bulkhead: whatever happens to this symbol stays with this symbol
    try {
      report.outcomes.push_back(load_symbol(symbol, timings, stoken));
    } catch (const std::exception &e) {
      auto outcome = classify(symbol);
      outcome.status = WarmupStatus::Failed;
      outcome.reason = e.what();
      logger_.log(LogLevel::Error, LogCategory::System,
                  std::format("❌ Warm-up aborted: {}", e.what()), symbol);
      report.outcomes.push_back(std::move(outcome));
    }

    if (i + 1 < symbols.size())
      sleep_for(stoken, timings.warmup_symbol_delay);
  }

  logger_.info(LogCategory::System,
               std::format("🔥 Warm-up complete: {} ready, {} partial, {} "
                           "unavailable, {} failed",
                           report.count(WarmupStatus::Ready),
                           report.count(WarmupStatus::Partial),
                           report.count(WarmupStatus::Unavailable),
                           report.count(WarmupStatus::Failed)),
               report.to_json());
  return report;
}

} // namespace swarm
