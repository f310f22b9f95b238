// Unit tests for the candle replay adapter
#include "fakes.h"
#include "replay_adapter.h"
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace swarm;
using namespace swarm::testing;
using Catch::Matchers::WithinAbs;

namespace {

constexpr auto start_ms = std::int64_t{1'700'000'000'000};

// Enough H1 and M15 history before the first M5 bar for a full warm-up;
// the clock starts on M5 bar 49 of 60
void load_flat(ReplayAdapter &adapter, std::string_view symbol = "EURUSD") {
  adapter.add_candles(symbol, Timeframe::H1, make_candles(60, 1.1, start_ms - 3'600'000, 3'600'000, 0.0));
  adapter.add_candles(symbol, Timeframe::M15, make_candles(50, 1.1, start_ms - 900'000, 900'000, 0.0));

  auto m5 = make_candles(60, 1.1, start_ms + 59 * 300'000, 300'000, 0.0);
  m5[50].low = 1.0980;  // Through a 1.0990 stop
  m5[50].high = 1.1040; // and a 1.1030 target
  adapter.add_candles(symbol, Timeframe::M5, std::move(m5));
  adapter.rewind();
}

OrderRequest buy(double lots = 0.1) {
  auto order = OrderRequest{};
  order.symbol = "EURUSD";
  order.direction = Direction::Buy;
  order.lot_size = lots;
  order.stop_loss = 1.0990;
  order.take_profit = 1.1030;
  return order;
}

} // namespace

TEST_CASE("Replay clock starts once warm-up history exists", "[replay]") {
  auto adapter = ReplayAdapter{};
  load_flat(adapter);

  auto quote = adapter.get_quote("EURUSD");
  REQUIRE(quote);
  REQUIRE_THAT(quote->bid, WithinAbs(1.09995, 1e-9));
  REQUIRE_THAT(quote->ask, WithinAbs(1.10005, 1e-9));
  REQUIRE(to_millis(quote->time) == start_ms + 49 * 300'000);

  auto m5 = adapter.get_candle_history("EURUSD", Timeframe::M5, 300);
  REQUIRE(m5);
  REQUIRE(m5->size() == 50uz);
  REQUIRE(m5->back().timestamp == start_ms + 49 * 300'000);

  auto h1 = adapter.get_candle_history("EURUSD", Timeframe::H1, 20);
  REQUIRE(h1->size() == 20uz);

  REQUIRE(adapter.step());
  REQUIRE(adapter.get_candle_history("EURUSD", Timeframe::M5, 300)->size() == 51uz);
}

TEST_CASE("Replay history errors", "[replay]") {
  auto adapter = ReplayAdapter{};
  load_flat(adapter);

  REQUIRE(adapter.get_candle_history("USDJPY", Timeframe::H1, 10).error() ==
          AdapterError::InvalidSymbol);
  REQUIRE_FALSE(adapter.get_quote("USDJPY"));

  adapter.set_connected(false);
  REQUIRE_FALSE(adapter.is_connected());
  REQUIRE(adapter.get_candle_history("EURUSD", Timeframe::H1, 10).error() ==
          AdapterError::NetworkError);
  REQUIRE(adapter.reconcile_positions().error() == AdapterError::NetworkError);
}

TEST_CASE("Replay orders fill and settle", "[replay]") {
  auto adapter = ReplayAdapter{};
  load_flat(adapter);

  auto closed = std::vector<std::pair<std::string, double>>{};
  adapter.on_position_closed([&](const Position &p, double exit, double pnl) {
    closed.emplace_back(p.position_id, pnl);
    REQUIRE_THAT(exit, WithinAbs(1.0990, 1e-9));
  });

  auto ticks = 0;
  adapter.subscribe_price("EURUSD", [&](const Tick &) { ++ticks; });

  auto result = adapter.place_order(buy(), 2.0);
  REQUIRE(result.success);
  REQUIRE(result.order_id == "replay-1");
  REQUIRE_THAT(*result.execution_price, WithinAbs(1.10005, 1e-9));
  REQUIRE(adapter.get_open_positions()->size() == 1uz);
  REQUIRE(adapter.orders_placed() == 1uz);

  // The next bar spans both stop and target; the stop wins
  REQUIRE(adapter.step());
  REQUIRE(ticks == 1);
  REQUIRE(closed.size() == 1uz);
  REQUIRE(closed[0].first == "replay-1");
  REQUIRE_THAT(closed[0].second, WithinAbs(-10.5, 1e-6));
  REQUIRE(adapter.get_open_positions()->empty());

  auto account = adapter.get_account_info();
  REQUIRE_THAT(account->balance, WithinAbs(9989.5, 1e-6));

  adapter.unsubscribe_price("EURUSD");
  adapter.step();
  REQUIRE(ticks == 1);
}

TEST_CASE("Replay order rejections", "[replay]") {
  auto settings = ReplaySettings{};
  settings.volume.min_volume = 0.05;
  auto adapter = ReplayAdapter{settings};
  load_flat(adapter);

  SECTION("Spread over the limit") {
    auto result = adapter.place_order(buy(), 0.5);
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error_message->contains("spread"));
  }

  SECTION("Volume under the broker minimum") {
    REQUIRE_FALSE(adapter.get_detected_min_volume("EURUSD"));

    auto result = adapter.place_order(buy(0.01), 2.0);
    REQUIRE_FALSE(result.success);
    REQUIRE(adapter.get_detected_min_volume("EURUSD") == 0.05);
  }

  SECTION("Unknown symbol") {
    auto order = buy();
    order.symbol = "USDJPY";
    REQUIRE_FALSE(adapter.place_order(order, 2.0).success);
  }

  REQUIRE(adapter.orders_placed() == 0uz);
}

TEST_CASE("Replay stop can be moved", "[replay]") {
  auto adapter = ReplayAdapter{};
  load_flat(adapter);

  auto result = adapter.place_order(buy(), 2.0);
  REQUIRE(adapter.modify_position({*result.order_id, 1.0970}));
  REQUIRE_FALSE(adapter.modify_position({"missing", 1.0}));

  // Bar 50 now only reaches the target
  adapter.step();
  auto account = adapter.get_account_info();
  REQUIRE_THAT(account->balance, WithinAbs(10000.0 + (1.1030 - 1.10005) * 10000.0, 1e-6));
}

TEST_CASE("Replay runs out of bars", "[replay]") {
  auto adapter = ReplayAdapter{};
  load_flat(adapter);

  auto steps = 0;
  while (adapter.step())
    ++steps;

  REQUIRE(steps == 10);
  REQUIRE_FALSE(adapter.step());
}

TEST_CASE("Replay data loads from JSON", "[replay]") {
  auto adapter = ReplayAdapter{};

  SECTION("Arrays and objects") {
    auto j = nlohmann::json{
        {"GBPUSD",
         {{"M5", {{start_ms, 1.25, 1.26, 1.24, 1.255, 10}, {start_ms + 300'000, 1.255, 1.26, 1.25, 1.258, 12}}},
          {"H1", {{{"time", start_ms}, {"open", 1.25}, {"high", 1.26}, {"low", 1.24}, {"close", 1.25}}}}}}};

    REQUIRE(adapter.load(j).has_value());
    REQUIRE(adapter.symbols() == std::vector<std::string>{"GBPUSD"});

    // Never enough for a warm-up, so the clock sits on the last bar
    REQUIRE_THAT(adapter.get_quote("GBPUSD")->bid, WithinAbs(1.258 - 0.00005, 1e-9));
    REQUIRE(adapter.get_candle_history("GBPUSD", Timeframe::H1, 10)->size() == 1uz);
  }

  SECTION("Rejects malformed input") {
    REQUIRE(adapter.load(nlohmann::json::array()).error() == ConfigError::ParseError);
    REQUIRE(adapter.load({{"EURUSD", {{"D1", nlohmann::json::array()}}}}).error() ==
            ConfigError::InvalidValue);
    REQUIRE(adapter.load({{"EURUSD", {{"M5", {{{"open", 1.0}}}}}}}).error() ==
            ConfigError::ParseError);
    REQUIRE(adapter.load_file("/nonexistent/candles.json").error() == ConfigError::FileNotFound);
  }
}
