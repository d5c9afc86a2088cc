#pragma once

#include "risk/IRiskPolicy.h"

namespace levsim {
namespace risk {

// Plain sizing: margin = equity x position_size, no stop, never throttles.
// Used when the risk manager is switched off.
class FixedSizePolicy : public IRiskPolicy {
public:
    FixedSizePolicy(double initial_capital, double position_size);

    std::string name() const override { return "fixed_size"; }

    void updateEquity(double equity, long long timestamp) override;
    void updateMarketData(const std::vector<Candle>& window) override;

    PositionSizing calculatePositionSize(const TradeCandidate& candidate, double leverage) override;

    std::optional<Price> calculateStopLoss(
        const TradeCandidate& candidate,
        const PositionSizing& sizing,
        std::optional<double> atr
    ) const override;

    void recordTrade(const Trade& trade) override;

    TradeRecommendation getTradeRecommendation() const override;
    RiskStats getRiskStats() const override;

private:
    double initial_capital_;
    double position_size_;
    double current_equity_;
    double high_water_mark_;
    int open_positions_;
};

} // namespace risk
} // namespace levsim
