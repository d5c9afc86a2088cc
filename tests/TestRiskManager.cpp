#include "risk/FixedSizePolicy.h"
#include "risk/RiskManager.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using namespace levsim;
using namespace levsim::risk;

namespace {

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

RiskConfig baseConfig() {
    RiskConfig cfg;
    cfg.initial_capital = 1000.0;
    return cfg;
}

TradeCandidate candidate(Direction dir, double price, long long t) {
    TradeCandidate c;
    c.direction = dir;
    c.entry_price = price;
    c.entry_time = t;
    return c;
}

Trade closedTrade(double pnl, long long entry_time = -1, double entry_price = 100.0) {
    Trade t;
    t.entry_time = entry_time;
    t.entry_price = entry_price;
    t.pnl = pnl;
    return t;
}

} // namespace

int main() {
    // standard sizing: 2% of 1000 at 5x
    {
        RiskManager rm(baseConfig());
        auto s = rm.calculatePositionSize(candidate(Direction::LONG, 100.0, 1), 5.0);
        assert(s.accepted());
        assert(near(s.margin, 20.0));
        assert(near(s.size, 100.0));
        assert(near(s.risk_amount, 20.0));
        assert(near(s.risk_percentage, 0.02));
        assert(s.reason == "standard position");
        assert(rm.getOpenPositions().size() == 1);

        auto rejected = rm.calculatePositionSize(candidate(Direction::LONG, 101.0, 2), 5.0);
        assert(!rejected.accepted());
        assert(rejected.size == 0.0);
        assert(rejected.reason == "max open positions reached");

        // closing the matching trade frees the slot
        rm.recordTrade(closedTrade(5.0, 1, 100.0));
        assert(rm.getOpenPositions().empty());
        assert(rm.calculatePositionSize(candidate(Direction::LONG, 101.0, 3), 5.0).accepted());
    }

    // committed margin is not available for a second position
    {
        RiskConfig cfg = baseConfig();
        cfg.max_open_positions = 2;
        RiskManager rm(cfg);
        rm.calculatePositionSize(candidate(Direction::LONG, 100.0, 1), 5.0);
        auto s = rm.calculatePositionSize(candidate(Direction::SHORT, 100.0, 2), 5.0);
        assert(near(s.margin, (1000.0 - 20.0) * 0.02));
    }

    // a throttled entry commits only the adjusted margin
    {
        RiskConfig cfg = baseConfig();
        cfg.max_open_positions = 2;
        RiskManager rm(cfg);
        TradeCandidate reduced = candidate(Direction::LONG, 100.0, 1);
        reduced.size_adjustment = 0.5;
        auto first = rm.calculatePositionSize(reduced, 5.0);
        assert(near(first.margin, 20.0));
        assert(near(rm.getOpenPositions()[0].margin, 10.0));
        assert(near(rm.getOpenPositions()[0].size, 50.0));

        auto second = rm.calculatePositionSize(candidate(Direction::SHORT, 100.0, 2), 5.0);
        assert(near(second.margin, (1000.0 - 10.0) * 0.02));
    }

    // anti-martingale: three losses -> 0.02 x 0.7^3 for the 4th trade
    {
        RiskConfig cfg = baseConfig();
        cfg.use_anti_martingale = true;
        RiskManager rm(cfg);
        for (int i = 0; i < 3; ++i) {
            rm.recordTrade(closedTrade(-5.0));
        }
        assert(rm.getConsecutiveLosses() == 3);
        assert(rm.getConsecutiveWins() == 0);
        auto s = rm.calculatePositionSize(candidate(Direction::LONG, 100.0, 1), 5.0);
        assert(near(s.risk_percentage, 0.02 * std::pow(0.7, 3)));

        // streak exponent is capped at 3
        rm.recordTrade(closedTrade(-5.0, 1, 100.0));
        assert(rm.getConsecutiveLosses() == 4);
        auto capped = rm.calculatePositionSize(candidate(Direction::LONG, 100.0, 2), 5.0);
        assert(near(capped.risk_percentage, 0.02 * std::pow(0.7, 3)));
    }

    {
        RiskConfig cfg = baseConfig();
        cfg.use_anti_martingale = true;
        RiskManager rm(cfg);
        rm.recordTrade(closedTrade(-5.0));
        rm.recordTrade(closedTrade(10.0));
        rm.recordTrade(closedTrade(10.0));
        assert(rm.getConsecutiveWins() == 2);
        assert(rm.getConsecutiveLosses() == 0);
        auto s = rm.calculatePositionSize(candidate(Direction::LONG, 100.0, 1), 5.0);
        assert(near(s.risk_percentage, 0.02 * 1.5 * 1.5));
    }

    // drawdown gate and recovery
    {
        RiskManager rm(baseConfig());
        rm.updateEquity(1000.0, 1);
        rm.updateEquity(750.0, 2);
        assert(near(rm.getCurrentDrawdown(), 0.25));

        auto blocked = rm.calculatePositionSize(candidate(Direction::LONG, 100.0, 3), 5.0);
        assert(blocked.size == 0.0);
        assert(blocked.reason == "max drawdown reached");
        assert(rm.getOpenPositions().empty());
        assert(rm.getTradeRecommendation().action == TradeAction::STOP);
        assert(rm.getTradeRecommendation().severity == Severity::HIGH);

        rm.updateEquity(800.0, 4);
        assert(near(rm.getCurrentDrawdown(), 0.2));
        auto s = rm.calculatePositionSize(candidate(Direction::LONG, 100.0, 5), 5.0);
        assert(s.accepted());
        assert(near(s.margin, 16.0));

        auto rec = rm.getTradeRecommendation();
        assert(rec.action == TradeAction::REDUCE);
        assert(near(rec.adjustment, 0.5));
    }

    // drawdown always in [0, 1)
    {
        RiskManager rm(baseConfig());
        const double equities[] = {1000.0, 1200.0, 600.0, 0.0, -50.0, 1500.0};
        for (double e : equities) {
            rm.updateEquity(e, 0);
            assert(rm.getCurrentDrawdown() >= 0.0);
            assert(rm.getCurrentDrawdown() < 1.0);
            assert(rm.getHighWaterMark() >= rm.getCurrentEquity());
        }
        assert(rm.getHighWaterMark() == 1500.0);
        assert(rm.getCurrentDrawdown() == 0.0);
        assert(rm.getEquityHistory().size() == 7);
    }

    // pyramiding: 4th same-direction position with 3 levels is rejected
    {
        RiskConfig cfg = baseConfig();
        cfg.pyramiding = true;
        cfg.pyramiding_levels = 3;
        RiskManager rm(cfg);

        auto l1 = rm.calculatePositionSize(candidate(Direction::LONG, 100.0, 1), 5.0);
        auto l2 = rm.calculatePositionSize(candidate(Direction::LONG, 101.0, 2), 5.0);
        auto l3 = rm.calculatePositionSize(candidate(Direction::LONG, 102.0, 3), 5.0);
        assert(l1.pyramid_level == 1 && near(l1.margin, 20.0));
        assert(l2.pyramid_level == 2 && near(l2.margin, 10.0));
        assert(l3.pyramid_level == 3 && near(l3.margin, 20.0 / 3.0));
        assert(l2.reason == "pyramiding level 2");

        auto l4 = rm.calculatePositionSize(candidate(Direction::LONG, 103.0, 4), 5.0);
        assert(l4.size == 0.0);
        assert(l4.reason == "max pyramiding levels reached");
        assert(rm.getOpenPositions().size() == 3);

        // the other side counts separately
        auto s1 = rm.calculatePositionSize(candidate(Direction::SHORT, 103.0, 5), 5.0);
        assert(s1.accepted() && s1.pyramid_level == 1);
    }

    // Kelly: never negative, never above max_position_size
    {
        RiskConfig cfg = baseConfig();
        cfg.use_kelly_criterion = true;
        RiskManager rm(cfg);
        for (int i = 0; i < 6; ++i) rm.recordTrade(closedTrade(10.0));
        for (int i = 0; i < 4; ++i) rm.recordTrade(closedTrade(-10.0));
        assert(near(rm.getWinRate(), 0.6));
        assert(near(rm.getWinLossRatio(), 1.0));
        assert(near(rm.kellyPercentage(), 0.2));
        auto s = rm.calculatePositionSize(candidate(Direction::LONG, 100.0, 1), 5.0);
        assert(near(s.risk_percentage, 0.02));
    }

    {
        RiskConfig cfg = baseConfig();
        cfg.use_kelly_criterion = true;
        RiskManager rm(cfg);
        for (int i = 0; i < 2; ++i) rm.recordTrade(closedTrade(5.0));
        for (int i = 0; i < 8; ++i) rm.recordTrade(closedTrade(-10.0));
        assert(rm.kellyPercentage() == 0.0);
        auto s = rm.calculatePositionSize(candidate(Direction::LONG, 100.0, 1), 5.0);
        assert(s.risk_percentage >= 0.0);
        assert(s.size == 0.0);
        assert(!s.reason.empty());
        assert(rm.getOpenPositions().empty());
    }

    {
        RiskConfig cfg = baseConfig();
        cfg.use_kelly_criterion = true;
        cfg.kelly_fraction = 1.0;
        cfg.max_risk_per_trade = 1.0;
        cfg.max_position_size = 0.5;
        RiskManager rm(cfg);
        for (int i = 0; i < 10; ++i) rm.recordTrade(closedTrade(10.0));
        auto s = rm.calculatePositionSize(candidate(Direction::LONG, 100.0, 1), 5.0);
        assert(s.risk_percentage <= 0.5);
        assert(near(s.risk_percentage, 0.5));
    }

    // Kelly needs 10 trades
    {
        RiskConfig cfg = baseConfig();
        cfg.use_kelly_criterion = true;
        RiskManager rm(cfg);
        for (int i = 0; i < 9; ++i) rm.recordTrade(closedTrade(-10.0));
        auto s = rm.calculatePositionSize(candidate(Direction::LONG, 100.0, 1), 5.0);
        assert(near(s.risk_percentage, 0.02));
    }

    // stop-loss placement
    {
        RiskManager rm(baseConfig());
        PositionSizing sizing;
        auto stop_atr = rm.calculateStopLoss(candidate(Direction::LONG, 100.0, 1), sizing, 2.0);
        auto stop_pct = rm.calculateStopLoss(candidate(Direction::LONG, 100.0, 1), sizing, std::nullopt);
        auto stop_zero = rm.calculateStopLoss(candidate(Direction::LONG, 100.0, 1), sizing, 0.0);
        auto stop_short = rm.calculateStopLoss(candidate(Direction::SHORT, 100.0, 1), sizing, std::nullopt);
        assert(stop_atr && near(*stop_atr, 96.0));
        assert(stop_pct && near(*stop_pct, 97.5));
        assert(stop_zero && near(*stop_zero, 97.5));
        assert(stop_short && near(*stop_short, 102.5));
    }

    // win statistics and rolling window
    {
        RiskManager rm(baseConfig());
        rm.recordTrade(closedTrade(10.0));
        rm.recordTrade(closedTrade(-5.0));
        assert(near(rm.getWinRate(), 0.5));
        assert(near(rm.getWinLossRatio(), 2.0));
        assert(rm.getRecentTrades().front().pnl == -5.0);

        for (int i = 0; i < 60; ++i) rm.recordTrade(closedTrade(1.0));
        assert(rm.getRecentTrades().size() == 50);
        assert(near(rm.getWinLossRatio(), 1.0));
    }

    // recommendations in priority order
    {
        RiskManager rm(baseConfig());
        assert(rm.getTradeRecommendation().action == TradeAction::NORMAL);
        assert(rm.getTradeRecommendation().adjustment == 1.0);

        for (int i = 0; i < 3; ++i) rm.recordTrade(closedTrade(-5.0));
        auto rec = rm.getTradeRecommendation();
        assert(rec.action == TradeAction::REDUCE);
        assert(near(rec.adjustment, std::pow(0.8, 3)));

        for (int i = 0; i < 4; ++i) rm.recordTrade(closedTrade(5.0));
        rec = rm.getTradeRecommendation();
        assert(rec.action == TradeAction::INCREASE);
        assert(near(rec.adjustment, 1.4));
        assert(rec.severity == Severity::LOW);

        for (int i = 0; i < 10; ++i) rm.recordTrade(closedTrade(5.0));
        assert(near(rm.getTradeRecommendation().adjustment, 1.5));
    }

    // volatility: scaling and high-volatility throttle
    {
        RiskConfig cfg = baseConfig();
        cfg.use_volatility_adjustment = true;
        RiskManager rm(cfg);

        std::vector<Candle> window;
        for (int i = 0; i < 30; ++i) {
            const double close = (i % 2 == 0) ? 100.0 : 105.0;
            window.emplace_back(close, close, close, close, 1.0, i);
        }
        // not more than volatility_window candles: unchanged
        rm.updateMarketData(std::vector<Candle>(window.begin(), window.begin() + 20));
        assert(rm.getPriceVolatility() == 0.0);

        assert(rm.requiredHistoryBars() == 21);
        rm.updateMarketData(window);
        assert(rm.getPriceVolatility() > 0.04);

        auto rec = rm.getTradeRecommendation();
        assert(rec.action == TradeAction::REDUCE);
        assert(near(rec.adjustment, 0.7));

        auto s = rm.calculatePositionSize(candidate(Direction::LONG, 100.0, 1), 5.0);
        assert(near(s.risk_percentage, 0.01));
    }

    // no market history needed without volatility adjustment
    {
        RiskManager rm(baseConfig());
        assert(rm.requiredHistoryBars() == 0);
    }

    // fixed-size null policy
    {
        FixedSizePolicy policy(1000.0, 0.1);
        assert(policy.requiredHistoryBars() == 0);
        auto s = policy.calculatePositionSize(candidate(Direction::LONG, 100.0, 1), 5.0);
        assert(near(s.margin, 100.0));
        assert(near(s.size, 500.0));
        PositionSizing sizing;
        assert(!policy.calculateStopLoss(candidate(Direction::LONG, 100.0, 1), sizing, 2.0));
        assert(policy.getTradeRecommendation().action == TradeAction::NORMAL);
        assert(policy.getTradeRecommendation().adjustment == 1.0);

        policy.updateEquity(500.0, 2);
        assert(near(policy.calculatePositionSize(candidate(Direction::LONG, 100.0, 3), 5.0).margin, 50.0));
        assert(near(policy.getRiskStats().current_drawdown, 0.5));
    }

    std::cout << "[TEST] RiskManager PASSED\n";
    return 0;
}
