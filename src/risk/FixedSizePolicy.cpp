#include "risk/FixedSizePolicy.h"
#include <algorithm>

namespace levsim {
namespace risk {

FixedSizePolicy::FixedSizePolicy(double initial_capital, double position_size)
    : initial_capital_(initial_capital)
    , position_size_(position_size)
    , current_equity_(initial_capital)
    , high_water_mark_(initial_capital)
    , open_positions_(0)
{
}

void FixedSizePolicy::updateEquity(double equity, long long timestamp) {
    (void)timestamp;
    current_equity_ = equity;
    high_water_mark_ = std::max(high_water_mark_, equity);
}

void FixedSizePolicy::updateMarketData(const std::vector<Candle>& window) {
    (void)window;
}

PositionSizing FixedSizePolicy::calculatePositionSize(const TradeCandidate& candidate, double leverage) {
    (void)candidate;
    PositionSizing result;
    result.margin = std::max(0.0, current_equity_) * position_size_;
    result.size = result.margin * leverage;
    result.risk_amount = result.margin;
    result.risk_percentage = position_size_;
    result.pyramid_level = 1;
    if (result.size <= 0.0) {
        result.size = 0.0;
        result.reason = "no available capital";
        return result;
    }
    result.reason = "fixed size";
    open_positions_++;
    return result;
}

std::optional<Price> FixedSizePolicy::calculateStopLoss(
    const TradeCandidate& candidate,
    const PositionSizing& sizing,
    std::optional<double> atr
) const {
    (void)candidate;
    (void)sizing;
    (void)atr;
    return std::nullopt;
}

void FixedSizePolicy::recordTrade(const Trade& trade) {
    (void)trade;
    if (open_positions_ > 0) open_positions_--;
}

TradeRecommendation FixedSizePolicy::getTradeRecommendation() const {
    TradeRecommendation rec;
    rec.reason = "Regular trading conditions";
    return rec;
}

RiskStats FixedSizePolicy::getRiskStats() const {
    RiskStats stats;
    stats.current_equity = current_equity_;
    stats.initial_capital = initial_capital_;
    stats.high_water_mark = high_water_mark_;
    stats.current_drawdown = (high_water_mark_ > 0.0)
        ? std::max(0.0, (high_water_mark_ - current_equity_) / high_water_mark_)
        : 0.0;
    stats.max_risk_per_trade = position_size_;
    stats.open_positions = open_positions_;
    return stats;
}

} // namespace risk
} // namespace levsim
