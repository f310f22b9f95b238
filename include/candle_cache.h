#pragma once

#include "defs.h"
#include "types.h"
#include <array>
#include <cstddef>
#include <map>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace swarm {

// Upsert incoming candles by timestamp (incoming wins), sort ascending and
// keep only the newest `cap` entries
void merge_candles(std::vector<Candle> &, std::span<const Candle>,
                   std::size_t cap = max_candles_per_buffer);

// Candle buffers per symbol per timeframe. Every buffer is strictly
// ascending by timestamp, has no duplicate timestamps and holds at most
// max_candles_per_buffer entries. Thread-safe.
class CandleCache {
public:
    void merge(std::string_view symbol, Timeframe, std::span<const Candle>);

    // Discard the buffer and load fresh candles
    void replace(std::string_view symbol, Timeframe, std::span<const Candle>);

    std::vector<Candle> get(std::string_view symbol, Timeframe) const;
    std::size_t size(std::string_view symbol, Timeframe) const;

    // Copy of all timeframes for one symbol
    MultiTimeframeData snapshot(std::string_view symbol) const;

    void clear();
    bool empty() const;

    nlohmann::json sizes() const;

private:
    static constexpr std::size_t index(Timeframe tf) { return static_cast<std::size_t>(tf); }

    mutable std::mutex mutex_;
    std::map<std::string, std::array<std::vector<Candle>, 3>, std::less<>> buffers_;
};

} // namespace swarm
