#pragma once

#include <string>

namespace levsim {
namespace engine {

// Backtest run settings
struct EngineConfig {
    std::string market;
    std::string timeframe;
    double initial_capital;
    double leverage;
    double fee_rate;                        // per side, on traded notional
    double maintenance_margin_ratio;

    double position_size;                   // margin fraction when the risk manager is off
    double profit_target;                   // TP distance = profit_target / leverage (0 = off)

    int min_lookback_bars;                  // lookback = max(min_lookback_bars, strategy lookback + padding)
    int indicator_padding_bars;
    int risk_snapshot_interval;             // bars between risk snapshots
    bool use_risk_manager;

    std::string output_dir;

    EngineConfig()
        : market("BTC-PERP")
        , timeframe("15m")
        , initial_capital(10000.0)
        , leverage(5.0)
        , fee_rate(0.001)
        , maintenance_margin_ratio(0.005)
        , position_size(0.1)
        , profit_target(0.0)
        , min_lookback_bars(50)
        , indicator_padding_bars(10)
        , risk_snapshot_interval(50)
        , use_risk_manager(true)
        , output_dir("results")
    {}
};

} // namespace engine
} // namespace levsim
