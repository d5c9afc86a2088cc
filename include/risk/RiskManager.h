#pragma once

#include "common/Types.h"
#include "risk/IRiskPolicy.h"
#include "risk/RiskTypes.h"
#include <deque>
#include <string>
#include <vector>

namespace levsim {
namespace risk {

struct EquityRecord {
    long long timestamp = 0;
    double equity = 0.0;
    double drawdown = 0.0;
};

// Risk Manager - position sizing, stop placement and trade throttling.
//
// Owns the risk state (equity, high-water mark, drawdown, streaks, rolling
// win statistics, price volatility and the open positions it has sized).
// Sizing combines, in order: drawdown / position-count gates, base risk
// fraction, volatility scaling, anti-martingale streak scaling, a Kelly cap,
// the max-position cap and finally pyramiding.
class RiskManager : public IRiskPolicy {
public:
    explicit RiskManager(const RiskConfig& config);

    std::string name() const override { return "risk_manager"; }

    // ===== State updates =====

    void updateEquity(double equity, long long timestamp) override;
    void updateMarketData(const std::vector<Candle>& window) override;
    std::size_t requiredHistoryBars() const override;
    void recordTrade(const Trade& trade) override;

    // ===== Sizing =====

    // The returned sizing is before candidate.size_adjustment; the open-position
    // record holds the adjusted margin and size
    PositionSizing calculatePositionSize(const TradeCandidate& candidate, double leverage) override;

    // 2 x ATR when a positive ATR is given, otherwise 2.5% of entry
    std::optional<Price> calculateStopLoss(
        const TradeCandidate& candidate,
        const PositionSizing& sizing,
        std::optional<double> atr
    ) const override;

    // Kelly fraction f* = (p*b - q) / b, floored at 0, before kelly_fraction scaling
    double kellyPercentage() const;

    // ===== Throttling =====

    TradeRecommendation getTradeRecommendation() const override;

    // ===== Statistics =====

    RiskStats getRiskStats() const override;

    double getCurrentEquity() const { return current_equity_; }
    double getHighWaterMark() const { return high_water_mark_; }
    double getCurrentDrawdown() const { return current_drawdown_; }
    int getConsecutiveWins() const { return consecutive_wins_; }
    int getConsecutiveLosses() const { return consecutive_losses_; }
    double getWinRate() const { return win_rate_; }
    double getWinLossRatio() const { return win_loss_ratio_; }
    double getPriceVolatility() const { return price_volatility_; }
    const std::vector<OpenPositionRecord>& getOpenPositions() const { return open_positions_; }
    const std::deque<Trade>& getRecentTrades() const { return recent_trades_; }
    const std::vector<EquityRecord>& getEquityHistory() const { return equity_history_; }
    const RiskConfig& getConfig() const { return config_; }

private:
    RiskConfig config_;

    double current_equity_;
    double high_water_mark_;
    double current_drawdown_;

    int consecutive_wins_;
    int consecutive_losses_;
    double win_rate_;           // initial estimate for Kelly
    double win_loss_ratio_;     // initial estimate for Kelly
    double price_volatility_;

    std::vector<OpenPositionRecord> open_positions_;
    std::deque<Trade> recent_trades_;      // newest first
    std::vector<EquityRecord> equity_history_;

    double committedMargin() const;
    int countOpenPositions(Direction direction) const;
    void updateWinStatistics();
};

} // namespace risk
} // namespace levsim
