// Unit tests for warm-up retries, backoff and per-symbol isolation
#include "fakes.h"
#include "perf.h"
#include "warmup.h"
#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <stdexcept>

using namespace swarm;
using namespace swarm::testing;
using namespace std::chrono_literals;

namespace {

EngineTimings instant() {
  auto t = EngineTimings{};
  t.warmup_request_delay = 0ms;
  t.warmup_symbol_delay = 0ms;
  t.rate_limit_backoff = 0ms;
  t.error_backoff = 0ms;
  t.warmup_max_retries = 3;
  return t;
}

struct Warmup {
  FakeAdapter adapter;
  CandleCache cache;
  std::shared_ptr<MemorySink> sink = std::make_shared<MemorySink>();
  Logger logger{LogLevel::Debug};
  WarmupLoader loader{adapter, cache, logger};

  Warmup() { logger.add_sink(sink); }

  int calls_for(std::string_view symbol) const {
    auto log = adapter.history_log();
    return static_cast<int>(std::ranges::count_if(
        log, [&](const std::string &entry) { return entry.starts_with(symbol); }));
  }
};

} // namespace

TEST_CASE("Warm-up loads every timeframe to target", "[warmup]") {
  auto w = Warmup{};

  auto report = w.loader.run({"EURUSD", "GBPUSD"}, instant(), {});

  REQUIRE(report.outcomes.size() == 2uz);
  REQUIRE(report.count(WarmupStatus::Ready) == 2uz);
  REQUIRE(w.cache.size("EURUSD", Timeframe::H1) == warmup_target(Timeframe::H1));
  REQUIRE(w.cache.size("EURUSD", Timeframe::M15) == warmup_target(Timeframe::M15));
  REQUIRE(w.cache.size("GBPUSD", Timeframe::M5) == warmup_target(Timeframe::M5));

  // Sequential, H1 first, one symbol at a time
  auto log = w.adapter.history_log();
  REQUIRE(log == std::vector<std::string>{"EURUSD:H1", "EURUSD:M15", "EURUSD:M5",
                                          "GBPUSD:H1", "GBPUSD:M15", "GBPUSD:M5"});
}

TEST_CASE("A symbol that always throws fails alone", "[warmup]") {
  auto w = Warmup{};
  w.adapter.history = [](std::string_view symbol, Timeframe, std::size_t count)
      -> std::expected<std::vector<Candle>, AdapterError> {
    if (symbol == "BAD")
      throw std::runtime_error{"connection reset"};
    return make_candles(count);
  };

  auto report = w.loader.run({"EURUSD", "BAD", "GBPUSD"}, instant(), {});

  REQUIRE(report.outcomes[0].status == WarmupStatus::Ready);
  REQUIRE(report.outcomes[1].status == WarmupStatus::Failed);
  REQUIRE(report.outcomes[1].attempts == 3);
  REQUIRE(report.outcomes[1].reason == "connection reset");
  REQUIRE(report.outcomes[2].status == WarmupStatus::Ready);

  // Each attempt stops at the first failing call
  REQUIRE(w.calls_for("BAD") == 3);
  REQUIRE(w.calls_for("GBPUSD") == 3);
  REQUIRE(w.cache.size("GBPUSD", Timeframe::H1) == warmup_target(Timeframe::H1));
}

TEST_CASE("Warm-up retries transient errors", "[warmup]") {
  auto w = Warmup{};
  auto failures = std::make_shared<std::atomic<int>>(1);
  w.adapter.history = [failures](std::string_view, Timeframe, std::size_t count)
      -> std::expected<std::vector<Candle>, AdapterError> {
    if (failures->fetch_sub(1) > 0)
      return std::unexpected(AdapterError::NetworkError);
    return make_candles(count);
  };

  auto outcome = w.loader.load_symbol("EURUSD", instant(), {});

  REQUIRE(outcome.status == WarmupStatus::Ready);
  REQUIRE(outcome.attempts == 2);
  REQUIRE(w.sink->count(LogCategory::System, "attempt 1/3 failed") == 1uz);
}

TEST_CASE("Rate limits back off even after the last attempt", "[warmup]") {
  auto w = Warmup{};
  w.adapter.history = [](std::string_view, Timeframe, std::size_t)
      -> std::expected<std::vector<Candle>, AdapterError> {
    return std::unexpected(AdapterError::RateLimitError);
  };

  auto timings = instant();
  timings.rate_limit_backoff = 20ms;

  auto timer = Stopwatch{};
  auto outcome = w.loader.load_symbol("EURUSD", timings, {});

  REQUIRE(outcome.status == WarmupStatus::Failed);
  REQUIRE(outcome.attempts == 3);
  REQUIRE(timer.elapsed() >= 60ms);
}

TEST_CASE("Partial history is accepted", "[warmup]") {
  auto w = Warmup{};

  SECTION("At the minimum on the first attempt") {
    w.adapter.history = [](std::string_view, Timeframe tf, std::size_t)
        -> std::expected<std::vector<Candle>, AdapterError> {
      return make_candles(warmup_minimum(tf));
    };

    auto outcome = w.loader.load_symbol("EURUSD", instant(), {});
    REQUIRE(outcome.status == WarmupStatus::Partial);
    REQUIRE(outcome.attempts == 1);
    REQUIRE(outcome.usable());
  }

  SECTION("Below the minimum after every retry") {
    w.adapter.history = [](std::string_view, Timeframe, std::size_t)
        -> std::expected<std::vector<Candle>, AdapterError> {
      return make_candles(10);
    };

    auto outcome = w.loader.load_symbol("EURUSD", instant(), {});
    REQUIRE(outcome.status == WarmupStatus::Unavailable);
    REQUIRE(outcome.attempts == 3);
    REQUIRE(outcome.reason == "MAX_RETRIES_REACHED");
    REQUIRE_FALSE(outcome.usable());

    // Whatever arrived is kept for refreshes to build on
    REQUIRE(w.cache.size("EURUSD", Timeframe::M5) == 10uz);
    REQUIRE(w.sink->count(LogCategory::System, "MAX_RETRIES_REACHED") == 1uz);
  }
}

TEST_CASE("Warm symbols are skipped on request", "[warmup]") {
  auto w = Warmup{};
  for (auto tf : all_timeframes)
    w.cache.merge("EURUSD", tf, make_candles(warmup_target(tf)));

  auto report = w.loader.run({"EURUSD", "GBPUSD"}, instant(), {}, true);

  REQUIRE(report.outcomes[0].status == WarmupStatus::Ready);
  REQUIRE(report.outcomes[0].reason == "ALREADY_WARM");
  REQUIRE(w.calls_for("EURUSD") == 0);
  REQUIRE(w.calls_for("GBPUSD") == 3);
}

TEST_CASE("Warm-up stops when cancelled", "[warmup]") {
  auto w = Warmup{};
  auto source = std::stop_source{};
  source.request_stop();

  auto report = w.loader.run({"EURUSD", "GBPUSD"}, instant(), source.get_token());

  REQUIRE(report.count(WarmupStatus::Failed) == 2uz);
  REQUIRE(report.outcomes[0].reason == "STOPPED");
  REQUIRE(w.adapter.history_calls.load() == 0);
}

TEST_CASE("Warm-up report serialises counts per status", "[warmup]") {
  auto report = WarmupReport{};
  report.outcomes.push_back({"EURUSD", WarmupStatus::Ready, 1, 60, 50, 50, ""});
  report.outcomes.push_back({"BAD", WarmupStatus::Failed, 3, 0, 0, 0, "boom"});

  auto j = report.to_json();
  REQUIRE(j["ready"] == 1);
  REQUIRE(j["failed"] == 1);
  REQUIRE(j["symbols"].size() == 2uz);
  REQUIRE(j["symbols"][1]["reason"] == "boom");
}
