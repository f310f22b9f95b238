// Unit tests for candle buffer merging
#include "candle_cache.h"
#include "fakes.h"
#include <catch2/catch_test_macros.hpp>
#include <algorithm>

using namespace swarm;
using namespace swarm::testing;

namespace {

bool strictly_ascending(const std::vector<Candle> &candles) {
  return std::ranges::adjacent_find(candles, [](const Candle &a, const Candle &b) {
           return a.timestamp >= b.timestamp;
         }) == candles.end();
}

} // namespace

TEST_CASE("Merge sorts and deduplicates", "[cache]") {
  auto buffer = std::vector<Candle>{};
  auto incoming = std::vector<Candle>{
      {300, 1.0, 1.0, 1.0, 1.3, 0.0},
      {100, 1.0, 1.0, 1.0, 1.1, 0.0},
      {200, 1.0, 1.0, 1.0, 1.2, 0.0},
      {100, 1.0, 1.0, 1.0, 1.15, 0.0},
  };

  merge_candles(buffer, incoming);

  REQUIRE(buffer.size() == 3uz);
  REQUIRE(strictly_ascending(buffer));
  REQUIRE(buffer.front().timestamp == 100);
  REQUIRE(buffer.front().close == 1.15);
}

TEST_CASE("Incoming candles replace stored ones", "[cache]") {
  auto buffer = std::vector<Candle>{{100, 1, 1, 1, 1.0, 0}, {200, 1, 1, 1, 2.0, 0}};
  auto update = std::vector<Candle>{{200, 1, 1, 1, 2.5, 0}, {300, 1, 1, 1, 3.0, 0}};

  merge_candles(buffer, update);

  REQUIRE(buffer.size() == 3uz);
  REQUIRE(buffer[1].close == 2.5);
  REQUIRE(buffer[2].timestamp == 300);
}

TEST_CASE("Buffers are capped to the newest candles", "[cache]") {
  auto cache = CandleCache{};

  SECTION("One oversized batch") {
    cache.merge("EURUSD", Timeframe::M5, make_candles(max_candles_per_buffer + 25));
    auto candles = cache.get("EURUSD", Timeframe::M5);

    REQUIRE(candles.size() == max_candles_per_buffer);
    REQUIRE(strictly_ascending(candles));
    REQUIRE(candles.back().timestamp == 1'700'000'000'000);
  }

  SECTION("Refreshes that keep arriving") {
    auto end = std::int64_t{1'700'000'000'000};
    for (auto i = 0; i < 10; ++i)
      cache.merge("EURUSD", Timeframe::M5, make_candles(50, 1.1, end + i * 40 * 300'000));

    auto candles = cache.get("EURUSD", Timeframe::M5);
    REQUIRE(candles.size() == max_candles_per_buffer);
    REQUIRE(strictly_ascending(candles));
    REQUIRE(candles.back().timestamp == end + 9 * 40 * 300'000);
  }
}

TEST_CASE("Timeframes and symbols are kept apart", "[cache]") {
  auto cache = CandleCache{};
  cache.merge("EURUSD", Timeframe::H1, make_candles(60));
  cache.merge("EURUSD", Timeframe::M5, make_candles(40));
  cache.merge("GBPUSD", Timeframe::M15, make_candles(30));

  REQUIRE(cache.size("EURUSD", Timeframe::H1) == 60uz);
  REQUIRE(cache.size("EURUSD", Timeframe::M15) == 0uz);
  REQUIRE(cache.size("GBPUSD", Timeframe::M15) == 30uz);
  REQUIRE(cache.size("USDJPY", Timeframe::H1) == 0uz);

  auto data = cache.snapshot("EURUSD");
  REQUIRE(data.symbol == "EURUSD");
  REQUIRE(data.h1.size() == 60uz);
  REQUIRE(data.m5.size() == 40uz);
  REQUIRE(data.m15.empty());

  auto sizes = cache.sizes();
  REQUIRE(sizes["EURUSD"]["H1"] == 60);
  REQUIRE(sizes["GBPUSD"]["M15"] == 30);
}

TEST_CASE("Replace discards the previous buffer", "[cache]") {
  auto cache = CandleCache{};
  cache.merge("EURUSD", Timeframe::M5, make_candles(100));
  cache.replace("EURUSD", Timeframe::M5, make_candles(5, 1.2, 1'800'000'000'000));

  auto candles = cache.get("EURUSD", Timeframe::M5);
  REQUIRE(candles.size() == 5uz);
  REQUIRE(candles.front().close == 1.2);

  cache.clear();
  REQUIRE(cache.empty());
}
