#include "candle_cache.h"
#include <algorithm>

namespace swarm {

void merge_candles(std::vector<Candle> &existing,
                   std::span<const Candle> incoming, std::size_t cap) {
  auto by_time = std::map<std::int64_t, Candle>{};
  for (const auto &c : existing)
    by_time.insert_or_assign(c.timestamp, c);

  // Incoming wins: a still-forming bar may have changed since last fetch
  for (const auto &c : incoming)
    by_time.insert_or_assign(c.timestamp, c);

  existing.clear();
  existing.reserve(std::min(by_time.size(), cap));

  auto skip = by_time.size() > cap ? by_time.size() - cap : 0uz;
  for (const auto &[ts, candle] : by_time) {
    if (skip > 0uz) {
      --skip;
      continue;
    }
    existing.push_back(candle);
  }
}

void CandleCache::merge(std::string_view symbol, Timeframe tf,
                        std::span<const Candle> candles) {
  auto lock = std::scoped_lock{mutex_};
  auto it = buffers_.find(symbol);
  if (it == buffers_.end())
    it = buffers_.emplace(std::string{symbol},
                          std::array<std::vector<Candle>, 3>{})
             .first;
  merge_candles(it->second[index(tf)], candles);
}

void CandleCache::replace(std::string_view symbol, Timeframe tf,
                          std::span<const Candle> candles) {
  auto fresh = std::vector<Candle>{};
  merge_candles(fresh, candles);

  auto lock = std::scoped_lock{mutex_};
  auto it = buffers_.find(symbol);
  if (it == buffers_.end())
    it = buffers_.emplace(std::string{symbol},
                          std::array<std::vector<Candle>, 3>{})
             .first;
  it->second[index(tf)] = std::move(fresh);
}

std::vector<Candle> CandleCache::get(std::string_view symbol,
                                     Timeframe tf) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = buffers_.find(symbol);
  if (it == buffers_.end())
    return {};
  return it->second[index(tf)];
}

std::size_t CandleCache::size(std::string_view symbol, Timeframe tf) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = buffers_.find(symbol);
  if (it == buffers_.end())
    return 0uz;
  return it->second[index(tf)].size();
}

MultiTimeframeData CandleCache::snapshot(std::string_view symbol) const {
  auto data = MultiTimeframeData{};
  data.symbol = std::string{symbol};

  auto lock = std::scoped_lock{mutex_};
  auto it = buffers_.find(symbol);
  if (it == buffers_.end())
    return data;

  data.h1 = it->second[index(Timeframe::H1)];
  data.m15 = it->second[index(Timeframe::M15)];
  data.m5 = it->second[index(Timeframe::M5)];
  return data;
}

void CandleCache::clear() {
  auto lock = std::scoped_lock{mutex_};
  buffers_.clear();
}

bool CandleCache::empty() const {
  auto lock = std::scoped_lock{mutex_};
  return buffers_.empty();
}

nlohmann::json CandleCache::sizes() const {
  auto lock = std::scoped_lock{mutex_};
  auto j = nlohmann::json::object();
  for (const auto &[symbol, buffers] : buffers_)
    j[symbol] = {{"H1", buffers[index(Timeframe::H1)].size()},
                 {"M15", buffers[index(Timeframe::M15)].size()},
                 {"M5", buffers[index(Timeframe::M5)].size()}};
  return j;
}

} // namespace swarm
