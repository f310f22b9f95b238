#include "config.h"
#include <algorithm>
#include <cstdlib>
#include <format>
#include <fstream>
#include <print>
#include <set>
#include <stdexcept>

using json = nlohmann::json;

namespace swarm {

namespace {

std::vector<std::string> unique_symbols(const std::vector<std::string> &symbols) {
  auto seen = std::set<std::string>{};
  auto out = std::vector<std::string>{};
  for (const auto &s : symbols)
    if (not s.empty() and seen.insert(s).second)
      out.push_back(s);
  return out;
}

std::optional<std::chrono::milliseconds> read_ms(const json &j,
                                                 const char *key) {
  if (not j.contains(key))
    return std::nullopt;
  auto ms = j.at(key).get<long long>();
  if (ms < 0)
    throw std::invalid_argument{std::format("{} must not be negative", key)};
  return std::chrono::milliseconds{ms};
}

RiskSettings risk_from_json(const json &j) {
  auto risk = RiskSettings{};
  risk.risk_percent = j.value("risk_percent", risk.risk_percent);
  risk.max_open_trades = j.value("max_open_trades", risk.max_open_trades);
  risk.daily_loss_limit = j.value("daily_loss_limit", risk.daily_loss_limit);
  risk.circuit_breaker = j.value("circuit_breaker", risk.circuit_breaker);
  return risk;
}

EngineTimings timings_from_json(const json &j) {
  auto t = EngineTimings{};
  if (auto v = read_ms(j, "warmup_request_delay_ms"))
    t.warmup_request_delay = *v;
  if (auto v = read_ms(j, "warmup_symbol_delay_ms"))
    t.warmup_symbol_delay = *v;
  if (auto v = read_ms(j, "rate_limit_backoff_ms"))
    t.rate_limit_backoff = *v;
  if (auto v = read_ms(j, "error_backoff_ms"))
    t.error_backoff = *v;
  if (auto v = read_ms(j, "refresh_interval_ms"))
    t.refresh_interval = *v;
  if (auto v = read_ms(j, "refresh_call_delay_ms"))
    t.refresh_call_delay = *v;
  if (auto v = read_ms(j, "analysis_interval_ms"))
    t.analysis_interval = *v;
  if (auto v = read_ms(j, "trailing_interval_ms"))
    t.trailing_interval = *v;
  t.warmup_max_retries = j.value("warmup_max_retries", t.warmup_max_retries);
  return t;
}

} // namespace

std::optional<StrategyType> parse_strategy_type(std::string_view name) {
  if (name == "ma_crossover")
    return StrategyType::MaCrossover;
  if (name == "mean_reversion")
    return StrategyType::MeanReversion;
  return std::nullopt;
}

EngineConfig apply_update(const EngineConfig &current,
                          const EngineConfigUpdate &update) {
  auto next = current;
  if (update.owner_id)
    next.owner_id = *update.owner_id;
  if (update.bot_id)
    next.bot_id = *update.bot_id;
  if (update.strategy_type)
    next.strategy_type = *update.strategy_type;
  if (update.symbols)
    next.symbols = unique_symbols(*update.symbols);
  if (update.lot_size)
    next.lot_size = *update.lot_size;
  if (update.max_positions)
    next.max_positions = *update.max_positions;
  if (update.cooldown)
    next.cooldown = *update.cooldown;
  if (update.max_spread_pips)
    next.max_spread_pips = *update.max_spread_pips;
  if (update.max_trades_per_symbol)
    next.max_trades_per_symbol = *update.max_trades_per_symbol;
  if (update.risk)
    next.risk = *update.risk;
  if (update.strategy_overrides)
    next.strategy_overrides = *update.strategy_overrides;
  if (update.timings)
    next.timings = *update.timings;
  return next;
}

std::optional<std::string> validate(const EngineConfig &config) {
  if (config.owner_id.empty())
    return "owner_id is required";
  if (config.bot_id.empty())
    return "bot_id is required";
  if (config.symbols.empty())
    return "symbol set is empty";
  if (config.lot_size <= 0.0)
    return std::format("lot_size must be positive (got {})", config.lot_size);
  if (config.max_positions < 1)
    return "max_positions must be at least 1";
  if (config.cooldown.count() < 0)
    return "cooldown must not be negative";
  if (config.max_spread_pips <= 0.0)
    return "max_spread_pips must be positive";
  if (config.max_trades_per_symbol < 1)
    return "max_trades_per_symbol must be at least 1";
  if (config.risk.risk_percent <= 0.0)
    return "risk_percent must be positive";
  if (config.timings.warmup_max_retries < 1)
    return "warmup_max_retries must be at least 1";
  if (config.timings.refresh_interval.count() <= 0 or
      config.timings.analysis_interval.count() <= 0 or
      config.timings.trailing_interval.count() <= 0)
    return "scheduler intervals must be positive";
  if (not config.strategy_overrides.is_object())
    return "strategy config must be an object";
  return std::nullopt;
}

bool same_symbols(const EngineConfig &a, const EngineConfig &b) {
  auto lhs = std::set<std::string>{a.symbols.begin(), a.symbols.end()};
  auto rhs = std::set<std::string>{b.symbols.begin(), b.symbols.end()};
  return lhs == rhs;
}

std::expected<EngineConfigUpdate, ConfigError>
update_from_json(const json &j) {
  if (not j.is_object())
    return std::unexpected(ConfigError::ParseError);

  try {
    auto update = EngineConfigUpdate{};
    if (j.contains("owner_id"))
      update.owner_id = j.at("owner_id").get<std::string>();
    if (j.contains("bot_id"))
      update.bot_id = j.at("bot_id").get<std::string>();
    if (j.contains("strategy")) {
      auto type = parse_strategy_type(j.at("strategy").get<std::string>());
      if (not type)
        return std::unexpected(ConfigError::InvalidValue);
      update.strategy_type = *type;
    }
    if (j.contains("symbols"))
      update.symbols = j.at("symbols").get<std::vector<std::string>>();
    if (j.contains("lot_size"))
      update.lot_size = j.at("lot_size").get<double>();
    if (j.contains("max_positions"))
      update.max_positions = j.at("max_positions").get<int>();
    update.cooldown = read_ms(j, "cooldown_ms");
    if (j.contains("max_spread_pips"))
      update.max_spread_pips = j.at("max_spread_pips").get<double>();
    if (j.contains("max_trades_per_symbol"))
      update.max_trades_per_symbol = j.at("max_trades_per_symbol").get<int>();
    if (j.contains("risk"))
      update.risk = risk_from_json(j.at("risk"));
    if (j.contains("strategy_config"))
      update.strategy_overrides = j.at("strategy_config");
    if (j.contains("timings"))
      update.timings = timings_from_json(j.at("timings"));
    return update;

  } catch (const json::exception &e) {
    std::println(stderr, "Config parse error: {}", e.what());
    return std::unexpected(ConfigError::ParseError);
  } catch (const std::invalid_argument &e) {
    std::println(stderr, "Config value error: {}", e.what());
    return std::unexpected(ConfigError::InvalidValue);
  }
}

std::expected<EngineConfig, ConfigError> config_from_json(const json &j) {
  return update_from_json(j).transform(
      [](const EngineConfigUpdate &u) { return apply_update(EngineConfig{}, u); });
}

json to_json(const EngineConfig &config) {
  const auto &t = config.timings;
  return json{
      {"owner_id", config.owner_id},
      {"bot_id", config.bot_id},
      {"strategy", std::string{to_string(config.strategy_type)}},
      {"symbols", config.symbols},
      {"lot_size", config.lot_size},
      {"max_positions", config.max_positions},
      {"cooldown_ms", config.cooldown.count()},
      {"max_spread_pips", config.max_spread_pips},
      {"max_trades_per_symbol", config.max_trades_per_symbol},
      {"risk",
       {{"risk_percent", config.risk.risk_percent},
        {"max_open_trades", config.risk.max_open_trades},
        {"daily_loss_limit", config.risk.daily_loss_limit},
        {"circuit_breaker", config.risk.circuit_breaker}}},
      {"strategy_config", config.strategy_overrides},
      {"timings",
       {{"warmup_request_delay_ms", t.warmup_request_delay.count()},
        {"warmup_symbol_delay_ms", t.warmup_symbol_delay.count()},
        {"rate_limit_backoff_ms", t.rate_limit_backoff.count()},
        {"error_backoff_ms", t.error_backoff.count()},
        {"refresh_interval_ms", t.refresh_interval.count()},
        {"refresh_call_delay_ms", t.refresh_call_delay.count()},
        {"analysis_interval_ms", t.analysis_interval.count()},
        {"trailing_interval_ms", t.trailing_interval.count()},
        {"warmup_max_retries", t.warmup_max_retries}}}};
}

std::expected<EngineConfig, ConfigError> load_config(std::string_view path) {
  auto file = std::ifstream{std::string{path}};
  if (not file)
    return std::unexpected(ConfigError::FileNotFound);

  auto j = json::parse(file, nullptr, false);
  if (j.is_discarded())
    return std::unexpected(ConfigError::ParseError);

  auto config = config_from_json(j);
  if (config)
    apply_env_overrides(*config);
  return config;
}

void apply_env_overrides(EngineConfig &config) {
  config.owner_id = get_env_or_default("SWARM_OWNER_ID", config.owner_id);
  config.bot_id = get_env_or_default("SWARM_BOT_ID", config.bot_id);
}

std::string get_env_or_default(std::string_view name,
                               std::string_view default_val) {
  if (const auto *val = std::getenv(std::string{name}.c_str()))
    return val;
  return std::string{default_val};
}

} // namespace swarm
