#pragma once

#include "defs.h"
#include "errors.h"
#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace swarm {

enum class StrategyType { MaCrossover, MeanReversion };

constexpr std::string_view to_string(StrategyType t) {
    switch (t) {
    case StrategyType::MaCrossover:
        return "ma_crossover";
    case StrategyType::MeanReversion:
        return "mean_reversion";
    }
    return "unknown";
}

std::optional<StrategyType> parse_strategy_type(std::string_view);

struct RiskSettings {
    double risk_percent{default_risk_percent};
    int max_open_trades{default_max_open_trades};
    double daily_loss_limit{default_daily_loss_limit};
    bool circuit_breaker{true};
};

// Scheduler and warm-up pacing; tests shorten these
struct EngineTimings {
    std::chrono::milliseconds warmup_request_delay{swarm::warmup_request_delay};
    std::chrono::milliseconds warmup_symbol_delay{swarm::warmup_symbol_delay};
    std::chrono::milliseconds rate_limit_backoff{swarm::rate_limit_backoff};
    std::chrono::milliseconds error_backoff{swarm::error_backoff};
    std::chrono::milliseconds refresh_interval{swarm::refresh_interval};
    std::chrono::milliseconds refresh_call_delay{swarm::refresh_call_delay};
    std::chrono::milliseconds analysis_interval{swarm::analysis_interval};
    std::chrono::milliseconds trailing_interval{swarm::trailing_interval};
    int warmup_max_retries{swarm::warmup_max_retries};
};

// Immutable engine configuration; replaced wholesale on reload
struct EngineConfig {
    std::string owner_id;
    std::string bot_id;
    StrategyType strategy_type{StrategyType::MaCrossover};
    std::vector<std::string> symbols; // No default, must be supplied
    double lot_size{default_lot_size};
    int max_positions{default_max_positions};
    std::chrono::milliseconds cooldown{default_cooldown};
    double max_spread_pips{default_max_spread_pips};
    int max_trades_per_symbol{default_max_trades_per_symbol};
    RiskSettings risk{};
    nlohmann::json strategy_overrides = nlohmann::json::object();
    EngineTimings timings{};
};

// Partial update: only fields that are set replace the current value, so an
// explicit zero or empty list is honoured
struct EngineConfigUpdate {
    std::optional<std::string> owner_id;
    std::optional<std::string> bot_id;
    std::optional<StrategyType> strategy_type;
    std::optional<std::vector<std::string>> symbols;
    std::optional<double> lot_size;
    std::optional<int> max_positions;
    std::optional<std::chrono::milliseconds> cooldown;
    std::optional<double> max_spread_pips;
    std::optional<int> max_trades_per_symbol;
    std::optional<RiskSettings> risk;
    std::optional<nlohmann::json> strategy_overrides;
    std::optional<EngineTimings> timings;
};

// New snapshot with the update's explicitly-set fields applied
EngineConfig apply_update(const EngineConfig &, const EngineConfigUpdate &);

// Empty on success, otherwise the first problem found
std::optional<std::string> validate(const EngineConfig &);

// True when both configs trade exactly the same symbols (order ignored)
bool same_symbols(const EngineConfig &, const EngineConfig &);

std::expected<EngineConfig, ConfigError> config_from_json(const nlohmann::json &);
std::expected<EngineConfigUpdate, ConfigError> update_from_json(const nlohmann::json &);
nlohmann::json to_json(const EngineConfig &);

// Read a JSON config file, then apply environment overrides
std::expected<EngineConfig, ConfigError> load_config(std::string_view);

// SWARM_OWNER_ID and SWARM_BOT_ID override the file
void apply_env_overrides(EngineConfig &);

std::string get_env_or_default(std::string_view, std::string_view);

} // namespace swarm
