#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "common/Types.h"
#include "common/Config.h"
#include "backtest/BacktestTypes.h"
#include "engine/EngineConfig.h"
#include "risk/IRiskPolicy.h"
#include "strategy/IStrategy.h"

namespace levsim {
namespace backtest {

// Single-instrument leveraged backtest. One position at a time; exits are
// checked before entries on every bar.
class BacktestEngine {
public:
    // Throws ConfigError on invalid settings
    BacktestEngine(const engine::EngineConfig& config,
                   std::shared_ptr<strategy::IStrategy> strategy,
                   std::unique_ptr<risk::IRiskPolicy> risk_policy);

    // Risk policy chosen from config (RiskManager or FixedSizePolicy)
    BacktestEngine(const Config& config, std::shared_ptr<strategy::IStrategy> strategy);

    static std::unique_ptr<risk::IRiskPolicy> makeRiskPolicy(const engine::EngineConfig& engine_config,
                                                             const risk::RiskConfig& risk_config);

    // Throws DataLoadError
    void loadData(const std::string& file_path);
    void setData(std::vector<Candle> candles);

    // Runs once over the loaded candles. Throws DataLoadError (NO_DATA) without data.
    const BacktestResult& run();

    const BacktestResult& getResult() const { return result_; }
    const risk::IRiskPolicy& getRiskPolicy() const { return *risk_policy_; }
    const engine::EngineConfig& getConfig() const { return config_; }

    // Bars of history required before the strategy is asked for signals
    int lookbackBars() const;

    // Throws ConfigError on settings the simulation cannot run with
    static void validateConfig(const engine::EngineConfig& config);

private:
    // Per-run mutable state, owned by run() and threaded through each bar
    struct SimulationContext {
        double equity = 0.0;
        double peak_equity = 0.0;
        std::optional<Position> position;
        BacktestResult result;
    };

    engine::EngineConfig config_;
    std::shared_ptr<strategy::IStrategy> strategy_;
    std::unique_ptr<risk::IRiskPolicy> risk_policy_;
    std::vector<Candle> history_data_;
    BacktestResult result_;
    bool has_run_ = false;

    void processBar(SimulationContext& ctx, std::size_t index, int lookback);

    // Liquidation, stop, take-profit, then signal; first hit closes the position
    void checkExits(SimulationContext& ctx, std::size_t index, const strategy::StrategySignal& signal);
    void tryEnter(SimulationContext& ctx, std::size_t index, const strategy::StrategySignal& signal);
    void closePosition(SimulationContext& ctx, std::size_t index, Price exit_price, ExitReason reason);

    void appendEquityPoint(SimulationContext& ctx, const Candle& candle);
    std::optional<double> atrAt(std::size_t index) const;
    Price resolveTakeProfit(const strategy::StrategySignal& signal, Direction direction, Price entry_price) const;
};

} // namespace backtest
} // namespace levsim
