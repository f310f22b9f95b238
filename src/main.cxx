// Swarm - multi-symbol trading engine
//
// Replays recorded candles through the engine:
//   swarm <config.json> [candles.json]
//
// ENVIRONMENT:
// - SWARM_OWNER_ID, SWARM_BOT_ID: override the config file
// - SWARM_STATUS_PORT: status endpoint port (default 8080, 0 disables)
// - SWARM_LOG_FILE: also append JSON-lines logs here
// - SWARM_REPLAY_STEP_MS: wall-clock time per replayed M5 bar (default 1000)

#include "config.h"
#include "engine.h"
#include "logger.h"
#include "replay_adapter.h"
#include "status_server.h"
#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <memory>
#include <print>
#include <thread>

using namespace std::chrono_literals;

namespace {

std::atomic<bool> interrupted{false};

void on_signal(int) { interrupted = true; }

int env_int(std::string_view name, int fallback) {
  auto text = swarm::get_env_or_default(name, "");
  auto value = fallback;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  return ec == std::errc{} and ptr == text.data() + text.size() ? value : fallback;
}

} // namespace

int main(int argc, char *argv[]) {
  std::println("🐝 Swarm - multi-symbol trading engine");

  if (argc < 2) {
    std::println(stderr, "Usage: {} <config.json> [candles.json]", argv[0]);
    return 2;
  }

  auto config = swarm::load_config(argv[1]);
  if (not config) {
    std::println(stderr, "❌ Config {}: {}", argv[1], swarm::to_string(config.error()));
    return 1;
  }

  auto logger = std::make_shared<swarm::Logger>();
  logger->add_sink(std::make_shared<swarm::ConsoleSink>());

  if (auto path = swarm::get_env_or_default("SWARM_LOG_FILE", ""); not path.empty()) {
    try {
      logger->add_sink(std::make_shared<swarm::JsonLinesSink>(path));
    } catch (const std::exception &e) {
      std::println(stderr, "⚠️  JSON log disabled: {}", e.what());
    }
  }

  auto adapter = std::make_shared<swarm::ReplayAdapter>();
  if (argc > 2) {
    if (auto loaded = adapter->load_file(argv[2]); not loaded) {
      std::println(stderr, "❌ Candles {}: {}", argv[2], swarm::to_string(loaded.error()));
      return 1;
    }
  }

  auto engine = swarm::Engine{adapter, *config, logger};

  adapter->on_position_closed([&engine](const swarm::Position &position, double, double pnl) {
    engine.on_position_closed(position.symbol, pnl);
  });

  engine.events().subscribe<swarm::TradeEvent>([](const swarm::TradeEvent &e) {
    std::println("📈 {} {} {:.2f} lots | {}", e.symbol, swarm::to_string(e.order.direction),
                 e.order.lot_size, e.result.order_id.value_or("?"));
  });
  engine.events().subscribe<swarm::PerformanceEvent>([](const swarm::PerformanceEvent &e) {
    std::println("🐢 {} {} took {:.1f}ms", e.kind == swarm::PerfKind::Tick ? "tick" : "analysis",
                 e.symbol, e.latency_ms);
  });

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  if (auto started = engine.start(); not started) {
    std::println(stderr, "❌ Engine failed to start: {}", swarm::to_string(started.error()));
    return 1;
  }

  auto server = swarm::StatusServer{engine, *logger};
  if (auto port = env_int("SWARM_STATUS_PORT", 8080); port > 0)
    server.start("0.0.0.0", port);

  // Advance the replay until it runs out or we are told to stop
  auto step = std::chrono::milliseconds{env_int("SWARM_REPLAY_STEP_MS", 1000)};
  while (not interrupted) {
    if (not adapter->step()) {
      std::println("🏁 Replay finished");
      break;
    }
    std::this_thread::sleep_for(step);
  }

  server.stop();
  engine.stop();

  auto status = engine.status();
  std::println("\n✅ {} analyses, {} trades, {} ticks", status.analyses, status.trades,
               status.ticks);
  return 0;
}
