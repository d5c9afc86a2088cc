#pragma once

#include "common/Types.h"
#include "risk/RiskTypes.h"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace levsim {
namespace risk {

// Sizing / stop / throttle capability injected into the backtest engine
class IRiskPolicy {
public:
    virtual ~IRiskPolicy() = default;

    virtual std::string name() const = 0;

    // Called every bar and after every closed trade
    virtual void updateEquity(double equity, long long timestamp) = 0;

    // Trailing candle window ending at the current bar
    virtual void updateMarketData(const std::vector<Candle>& window) = 0;

    // Minimum window length updateMarketData needs; the engine never feeds less when available
    virtual std::size_t requiredHistoryBars() const { return 0; }

    // Accepted sizings are recorded as open positions by the policy
    virtual PositionSizing calculatePositionSize(const TradeCandidate& candidate, double leverage) = 0;

    // std::nullopt = trade without a stop
    virtual std::optional<Price> calculateStopLoss(
        const TradeCandidate& candidate,
        const PositionSizing& sizing,
        std::optional<double> atr
    ) const = 0;

    virtual void recordTrade(const Trade& trade) = 0;

    virtual TradeRecommendation getTradeRecommendation() const = 0;

    virtual RiskStats getRiskStats() const = 0;
};

} // namespace risk
} // namespace levsim
