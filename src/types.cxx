#include "types.h"

namespace swarm {

std::optional<Timeframe> parse_timeframe(std::string_view name) {
  for (auto tf : all_timeframes)
    if (name == to_string(tf))
      return tf;
  return std::nullopt;
}

std::optional<Direction> parse_direction(std::string_view name) {
  if (name == "BUY")
    return Direction::Buy;
  if (name == "SELL")
    return Direction::Sell;
  if (name == "NONE")
    return Direction::None;
  return std::nullopt;
}

} // namespace swarm
