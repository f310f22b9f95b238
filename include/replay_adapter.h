#pragma once

#include "errors.h"
#include "trading_adapter.h"
#include "types.h"
#include <array>
#include <cstddef>
#include <expected>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace swarm {

struct ReplaySettings {
    double spread_pips{1.0};
    double starting_balance{10000.0};
    std::string currency{"USD"};
    VolumeSpecs volume{};
};

// Parse one candle from {"timestamp"|"time", "open", ...} or [ts, o, h, l, c, v]
std::optional<Candle> candle_from_json(const nlohmann::json &);

// Trading adapter that replays recorded candles. Time advances one M5 bar
// per step(); orders fill at the synthesized quote and close when a later
// bar crosses their stop or target.
class ReplayAdapter : public TradingAdapter {
public:
    using CloseCallback = std::function<void(const Position &, double exit_price, double pnl)>;

    explicit ReplayAdapter(ReplaySettings settings = {}) : settings_{std::move(settings)} {}

    // {"EURUSD": {"M5": [...], "M15": [...], "H1": [...]}, ...}
    std::expected<void, ConfigError> load(const nlohmann::json &);
    std::expected<void, ConfigError> load_file(std::string_view path);

    void add_candles(std::string_view symbol, Timeframe, std::vector<Candle>);

    // Place every symbol's clock at the first bar with enough history for
    // a full warm-up, or its last bar if there is never enough
    void rewind();

    // Advance one M5 bar, settle stops and targets, then publish ticks.
    // False once every symbol has run out of bars.
    bool step();

    void set_connected(bool connected);
    void on_position_closed(CloseCallback);

    std::vector<std::string> symbols() const;
    std::size_t orders_placed() const;

    // TradingAdapter
    bool is_connected() const override;
    void bind_owner_context(std::string_view owner_id, std::string_view bot_id) override;
    std::expected<int, AdapterError> reconcile_positions() override;
    std::optional<Quote> get_quote(std::string_view symbol) override;
    std::expected<std::vector<Candle>, AdapterError>
    get_candle_history(std::string_view symbol, Timeframe, std::size_t count) override;
    void subscribe_price(std::string_view symbol, PriceCallback) override;
    void unsubscribe_price(std::string_view symbol) override;
    std::expected<std::vector<Position>, AdapterError> get_open_positions() override;
    std::expected<AccountInfo, AdapterError> get_account_info() override;
    std::optional<VolumeSpecs> get_symbol_specs(std::string_view symbol) override;
    std::optional<double> get_detected_min_volume(std::string_view symbol) override;
    OrderResult place_order(const OrderRequest &, double max_spread_pips) override;
    bool modify_position(const PositionModification &) override;

private:
    struct Series {
        std::array<std::vector<Candle>, 3> candles; // Indexed by Timeframe
        std::size_t cursor{};
    };

    struct Closed {
        Position position;
        double exit_price{};
        double pnl{};
    };

    static constexpr std::size_t index(Timeframe tf) { return static_cast<std::size_t>(tf); }

    // Caller holds mutex_
    std::optional<Quote> quote_locked(std::string_view symbol) const;
    double pnl_locked(const Position &, double exit_price) const;

    ReplaySettings settings_;
    mutable std::mutex mutex_;
    std::map<std::string, Series, std::less<>> series_;
    std::map<std::string, PriceCallback, std::less<>> subscribers_;
    std::map<std::string, double, std::less<>> detected_min_;
    std::vector<Position> positions_;
    CloseCallback on_close_;
    std::string owner_id_;
    std::string bot_id_;
    double realized_pnl_{};
    std::size_t next_order_id_{1uz};
    std::size_t orders_placed_{};
    bool connected_{true};
};

} // namespace swarm
