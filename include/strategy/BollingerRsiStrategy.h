#pragma once

#include "strategy/IStrategy.h"
#include "strategy/StrategyConfig.h"

namespace levsim {
namespace strategy {

// Bollinger Bands + RSI mean reversion, entries only in a ranging (low ADX) regime
class BollingerRsiStrategy : public IStrategy {
public:
    explicit BollingerRsiStrategy(const BollingerRsiStrategyConfig& config = BollingerRsiStrategyConfig());

    StrategyInfo getInfo() const override;
    int requiredLookback() const override;
    StrategySignal evaluate(const std::vector<Candle>& window,
                            std::optional<Direction> open_side) override;

    const BollingerRsiStrategyConfig& getConfig() const { return config_; }

private:
    BollingerRsiStrategyConfig config_;
};

} // namespace strategy
} // namespace levsim
