#pragma once

#include "risk_gate.h"
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace swarm {

// USD value of one pip on one standard lot; empty when a needed
// conversion rate is missing
std::optional<double> pip_value_per_lot(std::string_view symbol, const ConversionRates &);

// Percent-of-balance risk sizing with a daily-loss circuit breaker
class RiskManager : public RiskGate {
public:
    explicit RiskManager(RiskSettings settings) : settings_{settings} {}

    void initialize(double starting_balance) override;
    Admission can_open_position() override;
    SizingResult size_position(double balance, double stop_loss_pips, std::string_view symbol,
                               const ConversionRates &, const std::optional<VolumeSpecs> &) override;
    int open_trade_count(std::string_view symbol) const override;
    void update_config(const RiskSettings &) override;
    nlohmann::json snapshot_state() const override;
    void record_open(std::string_view symbol) override;
    void record_close(std::string_view symbol, double pnl) override;

    // Recompute daily P&L and trip the breaker if the loss limit is hit
    void update_equity(double equity);
    void reset_circuit_breaker();

    bool trading_blocked() const;
    int open_trade_total() const;

private:
    void update_daily_pnl();
    void check_circuit_breaker();

    mutable std::mutex mutex_;
    RiskSettings settings_;
    double daily_start_equity_{};
    double current_equity_{};
    double daily_pnl_{};
    double daily_pnl_percent_{};
    bool trading_blocked_{false};
    std::string block_reason_;
    std::map<std::string, int, std::less<>> open_trades_;
};

// Risk settings with the engine-wide position cap applied; the tighter of
// max_positions and max_open_trades wins
RiskSettings risk_settings_for(const EngineConfig &);

std::shared_ptr<RiskGate> make_risk_gate(const EngineConfig &);

} // namespace swarm
