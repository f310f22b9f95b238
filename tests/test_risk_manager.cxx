// Unit tests for risk admission, sizing and the circuit breaker
#include "risk_manager.h"
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace swarm;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

TEST_CASE("Pip value per lot in USD", "[risk]") {
  auto rates = ConversionRates{{"USDJPY", 150.0}, {"GBPUSD", 1.25}};

  SECTION("USD quoted") {
    REQUIRE_THAT(*pip_value_per_lot("EURUSD", rates), WithinRel(10.0));
    REQUIRE_THAT(*pip_value_per_lot("XAUUSD", rates), WithinRel(10.0));
  }

  SECTION("USD base divides by the pair's price") {
    REQUIRE_THAT(*pip_value_per_lot("USDJPY", rates), WithinRel(1000.0 / 150.0));
    REQUIRE_FALSE(pip_value_per_lot("USDCAD", rates));
  }

  SECTION("Crosses convert through the quote currency") {
    REQUIRE_THAT(*pip_value_per_lot("EURGBP", rates), WithinRel(12.5));
    REQUIRE_THAT(*pip_value_per_lot("EURJPY", rates), WithinRel(1000.0 / 150.0));
    REQUIRE_FALSE(pip_value_per_lot("EURCHF", rates));
  }
}

TEST_CASE("Position sizing risks a fixed share of balance", "[risk]") {
  auto risk = RiskManager{RiskSettings{}};
  risk.initialize(10000.0);

  SECTION("Major pair") {
    auto result = risk.size_position(10000.0, 15.0, "EURUSD", {}, VolumeSpecs{});
    REQUIRE(result.can_trade);
    REQUIRE_THAT(result.lot_size, WithinAbs(0.50, 1e-9));
    REQUIRE_THAT(result.risk_amount, WithinAbs(75.0, 1e-9));
    REQUIRE_THAT(result.pip_value_per_lot, WithinAbs(10.0, 1e-9));
  }

  SECTION("Floored to the broker step") {
    auto result = risk.size_position(10000.0, 20.0, "USDJPY", {{"USDJPY", 150.0}}, VolumeSpecs{});
    REQUIRE(result.can_trade);
    REQUIRE_THAT(result.lot_size, WithinAbs(0.56, 1e-9));
  }

  SECTION("Gold") {
    auto result = risk.size_position(10000.0, 200.0, "XAUUSD", {}, VolumeSpecs{});
    REQUIRE(result.can_trade);
    REQUIRE_THAT(result.lot_size, WithinAbs(0.03, 1e-9));
  }

  SECTION("Clamped to the broker maximum") {
    auto result = risk.size_position(10000.0, 15.0, "EURUSD", {}, VolumeSpecs{0.01, 0.2, 0.01});
    REQUIRE(result.can_trade);
    REQUIRE(result.volume_adjusted);
    REQUIRE_THAT(result.lot_size, WithinAbs(0.2, 1e-9));
  }
}

TEST_CASE("Sizing refuses instead of falling back", "[risk]") {
  auto risk = RiskManager{RiskSettings{}};
  risk.initialize(100.0);

  SECTION("Below the broker minimum") {
    auto result = risk.size_position(100.0, 15.0, "EURUSD", {}, VolumeSpecs{});
    REQUIRE_FALSE(result.can_trade);
    REQUIRE(result.lot_size == 0.0);
    REQUIRE(result.reason.contains("below broker minimum"));
  }

  SECTION("No conversion rate") {
    auto result = risk.size_position(100.0, 15.0, "EURGBP", {}, VolumeSpecs{});
    REQUIRE_FALSE(result.can_trade);
    REQUIRE(result.reason.contains("conversion rate"));
  }

  SECTION("Invalid stop distance") {
    auto result = risk.size_position(100.0, 0.0, "EURUSD", {}, VolumeSpecs{});
    REQUIRE_FALSE(result.can_trade);
  }
}

TEST_CASE("Open trade limit", "[risk]") {
  auto settings = RiskSettings{};
  settings.max_open_trades = 2;
  auto risk = RiskManager{settings};
  risk.initialize(10000.0);

  risk.record_open("EURUSD");
  REQUIRE(risk.can_open_position().allowed);

  risk.record_open("GBPUSD");
  auto admission = risk.can_open_position();
  REQUIRE_FALSE(admission.allowed);
  REQUIRE(admission.reason.contains("limit of 2"));

  REQUIRE(risk.open_trade_count("EURUSD") == 1);
  REQUIRE(risk.open_trade_total() == 2);

  risk.record_close("GBPUSD", 5.0);
  REQUIRE(risk.can_open_position().allowed);
  REQUIRE(risk.open_trade_count("GBPUSD") == 0);

  // Closing more than was opened never goes negative
  risk.record_close("GBPUSD", 0.0);
  REQUIRE(risk.open_trade_count("GBPUSD") == 0);
}

TEST_CASE("Daily loss trips the circuit breaker", "[risk]") {
  auto risk = RiskManager{RiskSettings{}};
  risk.initialize(10000.0);

  risk.record_close("EURUSD", -250.0);
  REQUIRE_FALSE(risk.trading_blocked());

  risk.record_close("EURUSD", -60.0);
  REQUIRE(risk.trading_blocked());
  REQUIRE_FALSE(risk.can_open_position().allowed);

  auto sized = risk.size_position(10000.0, 15.0, "EURUSD", {}, VolumeSpecs{});
  REQUIRE_FALSE(sized.can_trade);

  auto state = risk.snapshot_state();
  REQUIRE(state["trading_blocked"] == true);
  REQUIRE_THAT(state["daily_pnl"].get<double>(), WithinAbs(-310.0, 1e-9));

  risk.reset_circuit_breaker();
  REQUIRE_FALSE(risk.trading_blocked());

  // A fresh day starts from the current balance
  risk.initialize(9690.0);
  REQUIRE(risk.can_open_position().allowed);
}

TEST_CASE("Without the breaker the limit still blocks admission", "[risk]") {
  auto settings = RiskSettings{};
  settings.circuit_breaker = false;
  auto risk = RiskManager{settings};
  risk.initialize(10000.0);

  risk.update_equity(9600.0);
  REQUIRE_FALSE(risk.trading_blocked());
  REQUIRE_FALSE(risk.can_open_position().allowed);

  risk.update_equity(9800.0);
  REQUIRE(risk.can_open_position().allowed);
}

TEST_CASE("Risk gate factory uses the configured settings", "[risk]") {
  auto cfg = EngineConfig{};
  cfg.max_positions = 10;
  cfg.risk.max_open_trades = 7;

  auto gate = make_risk_gate(cfg);
  REQUIRE(gate);
  REQUIRE(gate->snapshot_state()["max_open_trades"] == 7);
}

TEST_CASE("Engine position cap limits concurrent positions", "[risk]") {
  auto cfg = EngineConfig{};
  cfg.max_positions = 1;
  REQUIRE(risk_settings_for(cfg).max_open_trades == 1);

  auto gate = make_risk_gate(cfg);
  gate->initialize(10000.0);
  REQUIRE(gate->can_open_position().allowed);

  gate->record_open("EURUSD");
  auto second = gate->can_open_position();
  REQUIRE_FALSE(second.allowed);
  REQUIRE(second.reason.contains("limit of 1"));

  gate->record_close("EURUSD", 5.0);
  REQUIRE(gate->can_open_position().allowed);
}
