#pragma once

#include "common/Types.h"

namespace levsim {
namespace backtest {

constexpr double DEFAULT_MAINTENANCE_MARGIN_RATIO = 0.005;

struct PnlBreakdown {
    Amount gross = 0.0;
    Amount fees = 0.0;
    Amount net = 0.0;
};

// Side-effect free position math. Leverage enters only through margin x leverage = notional.
class PositionModel {
public:
    // LONG: entry x (1 - 1/leverage + mmr), SHORT: entry x (1 + 1/leverage - mmr)
    static Price liquidationPrice(
        Price entry_price,
        Direction direction,
        double leverage,
        double maintenance_margin_ratio = DEFAULT_MAINTENANCE_MARGIN_RATIO
    );

    static bool isLiquidated(Price current_price, Price liquidation_price, Direction direction);

    // notional_size is quote-currency exposure at entry; quantity = notional / entry price.
    // leverage is accepted but not applied.
    static PnlBreakdown pnl(
        Price entry_price,
        Price exit_price,
        Direction direction,
        Amount notional_size,
        double leverage,
        double fee_rate
    );

    // Realized loss on liquidation: the whole committed margin
    static Amount liquidationLoss(Amount margin) { return -margin; }

    // Intrabar touches, using the bar's adverse / favorable extreme
    static bool stopLossHit(const Candle& candle, Price stop_price, Direction direction);
    static bool takeProfitHit(const Candle& candle, Price target_price, Direction direction);
    static bool liquidationHit(const Candle& candle, Price liquidation_price, Direction direction);

    // Mark-to-market P&L before fees
    static Amount unrealizedPnl(const Position& position, Price mark_price);
};

} // namespace backtest
} // namespace levsim
