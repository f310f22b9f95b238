#pragma once

#include "errors.h"
#include "types.h"
#include <cstddef>
#include <expected>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>

namespace swarm {

using PriceCallback = std::function<void(const Tick &)>;

// Brokerage or backtest connection consumed by the engine. Implementations
// may block and may throw; the engine treats every call as fallible.
class TradingAdapter {
public:
    virtual ~TradingAdapter() = default;

    virtual bool is_connected() const = 0;

    // Associate subsequent executions with an owner and bot
    virtual void bind_owner_context(std::string_view owner_id, std::string_view bot_id) = 0;

    // Sync broker positions into the local account view; returns the count
    virtual std::expected<int, AdapterError> reconcile_positions() = 0;

    virtual std::optional<Quote> get_quote(std::string_view symbol) = 0;

    virtual std::expected<std::vector<Candle>, AdapterError>
    get_candle_history(std::string_view symbol, Timeframe, std::size_t count) = 0;

    virtual void subscribe_price(std::string_view symbol, PriceCallback) = 0;
    virtual void unsubscribe_price(std::string_view symbol) = 0;

    virtual std::expected<std::vector<Position>, AdapterError> get_open_positions() = 0;
    virtual std::expected<AccountInfo, AdapterError> get_account_info() = 0;

    // Broker volume limits in lots
    virtual std::optional<VolumeSpecs> get_symbol_specs(std::string_view symbol) = 0;

    // Minimum volume observed from broker rejections, if any
    virtual std::optional<double> get_detected_min_volume(std::string_view symbol) = 0;

    virtual OrderResult place_order(const OrderRequest &, double max_spread_pips) = 0;
    virtual bool modify_position(const PositionModification &) = 0;
};

} // namespace swarm
