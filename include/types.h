#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace swarm {

using time_point = std::chrono::system_clock::time_point;

// OHLCV bar; timestamp is the bar open in milliseconds since epoch
struct Candle {
    std::int64_t timestamp{};
    double open{};
    double high{};
    double low{};
    double close{};
    double volume{};
};

enum class Timeframe { M5, M15, H1 };

inline constexpr auto all_timeframes = std::array{Timeframe::H1, Timeframe::M15, Timeframe::M5};

enum class Direction { Buy, Sell, None };

struct Quote {
    std::string symbol;
    double bid{};
    double ask{};
    time_point time{};
};

// Live price update delivered by a price subscription
struct Tick {
    std::string symbol;
    double bid{};
    double ask{};
    time_point time{};
};

struct Position {
    std::string position_id;
    std::string symbol;
    Direction direction{Direction::None};
    double volume{};
    double entry_price{};
    std::optional<double> stop_loss;
    std::optional<double> take_profit;
};

struct AccountInfo {
    double balance{};
    double equity{};
    std::string currency{"USD"};
};

// Broker volume constraints in lots
struct VolumeSpecs {
    double min_volume{0.01};
    double max_volume{100.0};
    double step_volume{0.01};
};

struct OrderRequest {
    std::string symbol;
    Direction direction{Direction::None};
    double lot_size{};
    double stop_loss{};
    double take_profit{};
    double stop_loss_pips{};
    double take_profit_pips{};
    std::string comment;
};

struct OrderResult {
    bool success{false};
    std::optional<std::string> order_id;
    std::optional<double> execution_price;
    std::optional<std::string> error_message;
};

struct PositionModification {
    std::string position_id;
    double stop_loss{};
};

// Symbol -> mid price for the USD pairs needed to value a pip
using ConversionRates = std::map<std::string, double>;

// Trading signal produced by a strategy for one symbol
struct Signal {
    Direction direction{Direction::None};
    double confidence{};  // 0-100
    std::string reason;
    std::map<std::string, double> indicators;
    nlohmann::json metadata = nlohmann::json::object();
};

struct StopTarget {
    double stop_loss{};
    double take_profit{};
    double stop_loss_pips{};
    double take_profit_pips{};
};

struct TrailingUpdate {
    bool should_update{false};
    double new_stop_loss{};
    double profit_pips{};
};

// Candles for every timeframe of one symbol plus the live price
struct MultiTimeframeData {
    std::string symbol;
    std::vector<Candle> h1;
    std::vector<Candle> m15;
    std::vector<Candle> m5;
    double bid{};
    double ask{};
    double spread_pips{};
};

constexpr std::string_view to_string(Timeframe tf) {
    switch (tf) {
    case Timeframe::M5:
        return "M5";
    case Timeframe::M15:
        return "M15";
    case Timeframe::H1:
        return "H1";
    }
    return "?";
}

constexpr std::string_view to_string(Direction d) {
    switch (d) {
    case Direction::Buy:
        return "BUY";
    case Direction::Sell:
        return "SELL";
    case Direction::None:
        return "NONE";
    }
    return "?";
}

std::optional<Timeframe> parse_timeframe(std::string_view);
std::optional<Direction> parse_direction(std::string_view);

// Bar length of a timeframe
constexpr std::chrono::minutes duration_of(Timeframe tf) {
    switch (tf) {
    case Timeframe::M5:
        return std::chrono::minutes{5};
    case Timeframe::M15:
        return std::chrono::minutes{15};
    case Timeframe::H1:
        return std::chrono::minutes{60};
    }
    return std::chrono::minutes{0};
}

static_assert(to_string(Timeframe::M15) == "M15");
static_assert(to_string(Direction::Sell) == "SELL");
static_assert(duration_of(Timeframe::H1) == std::chrono::hours{1});

inline std::int64_t to_millis(time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline time_point from_millis(std::int64_t ms) {
    return time_point{std::chrono::milliseconds{ms}};
}

} // namespace swarm
