#pragma once

#include "candle_cache.h"
#include "config.h"
#include "defs.h"
#include "logger.h"
#include "trading_adapter.h"
#include "types.h"
#include <array>
#include <cstddef>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace swarm {

constexpr std::size_t warmup_target(Timeframe tf) {
    switch (tf) {
    case Timeframe::H1:
        return warmup_target_h1;
    case Timeframe::M15:
        return warmup_target_m15;
    case Timeframe::M5:
        return warmup_target_m5;
    }
    return 0uz;
}

constexpr std::size_t warmup_minimum(Timeframe tf) {
    switch (tf) {
    case Timeframe::H1:
        return warmup_min_h1;
    case Timeframe::M15:
        return warmup_min_m15;
    case Timeframe::M5:
        return warmup_min_m5;
    }
    return 0uz;
}

static_assert(warmup_minimum(Timeframe::H1) <= warmup_target(Timeframe::H1));
static_assert(warmup_minimum(Timeframe::M5) <= warmup_target(Timeframe::M5));

enum class WarmupStatus {
    Ready,       // Every timeframe at target
    Partial,     // Every timeframe at least at the minimum
    Unavailable, // Retries exhausted with too little data
    Failed       // Retries exhausted on errors, or cancelled
};

constexpr std::string_view to_string(WarmupStatus s) {
    switch (s) {
    case WarmupStatus::Ready:
        return "ready";
    case WarmupStatus::Partial:
        return "partial";
    case WarmupStatus::Unavailable:
        return "unavailable";
    case WarmupStatus::Failed:
        return "failed";
    }
    return "failed";
}

struct WarmupOutcome {
    std::string symbol;
    WarmupStatus status{WarmupStatus::Failed};
    int attempts{};
    std::size_t h1{};
    std::size_t m15{};
    std::size_t m5{};
    std::string reason;

    bool usable() const { return status == WarmupStatus::Ready or status == WarmupStatus::Partial; }
    nlohmann::json to_json() const;
};

struct WarmupReport {
    std::vector<WarmupOutcome> outcomes;

    std::size_t count(WarmupStatus) const;
    nlohmann::json to_json() const;
};

// Loads candle history for each symbol with retries and pacing. A failure
// on one symbol never stops the others.
class WarmupLoader {
public:
    WarmupLoader(TradingAdapter &adapter, CandleCache &cache, Logger &logger)
        : adapter_{adapter}, cache_{cache}, logger_{logger} {}

    // With skip_warm, symbols whose buffers already meet the minimum are
    // reported from the cache without fetching
    WarmupReport run(const std::vector<std::string> &symbols, const EngineTimings &,
                     std::stop_token, bool skip_warm = false);

    WarmupOutcome load_symbol(const std::string &symbol, const EngineTimings &, std::stop_token);

private:
    WarmupOutcome classify(const std::string &symbol) const;

    TradingAdapter &adapter_;
    CandleCache &cache_;
    Logger &logger_;
};

} // namespace swarm
