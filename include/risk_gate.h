#pragma once

#include "config.h"
#include "types.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace swarm {

struct Admission {
    bool allowed{true};
    std::string reason;
};

struct SizingResult {
    bool can_trade{false};
    double lot_size{};
    std::string reason;
    double risk_amount{};
    double pip_value_per_lot{};  // USD
    bool volume_adjusted{false}; // Clamped to the broker maximum
};

// Admission control and position sizing consumed by the engine
class RiskGate {
public:
    virtual ~RiskGate() = default;

    virtual void initialize(double starting_balance) = 0;

    virtual Admission can_open_position() = 0;

    virtual SizingResult size_position(double balance, double stop_loss_pips, std::string_view symbol,
                                       const ConversionRates &, const std::optional<VolumeSpecs> &) = 0;

    // Positions the gate's own ledger believes are open on the symbol
    virtual int open_trade_count(std::string_view symbol) const = 0;

    virtual void update_config(const RiskSettings &) = 0;
    virtual nlohmann::json snapshot_state() const = 0;

    // Ledger updates
    virtual void record_open(std::string_view symbol) = 0;
    virtual void record_close(std::string_view symbol, double pnl) = 0;
};

using RiskGateFactory = std::function<std::shared_ptr<RiskGate>(const EngineConfig &)>;

} // namespace swarm
