#include "backtest/PositionModel.h"

namespace levsim {
namespace backtest {

Price PositionModel::liquidationPrice(
    Price entry_price,
    Direction direction,
    double leverage,
    double maintenance_margin_ratio
) {
    if (leverage <= 0.0) {
        return 0.0;
    }
    if (direction == Direction::LONG) {
        return entry_price * (1.0 - 1.0 / leverage + maintenance_margin_ratio);
    }
    return entry_price * (1.0 + 1.0 / leverage - maintenance_margin_ratio);
}

bool PositionModel::isLiquidated(Price current_price, Price liquidation_price, Direction direction) {
    if (direction == Direction::LONG) {
        return current_price <= liquidation_price;
    }
    return current_price >= liquidation_price;
}

PnlBreakdown PositionModel::pnl(
    Price entry_price,
    Price exit_price,
    Direction direction,
    Amount notional_size,
    double leverage,
    double fee_rate
) {
    (void)leverage;
    PnlBreakdown result;
    if (entry_price <= 0.0) {
        return result;
    }

    const double quantity = notional_size / entry_price;
    const double entry_value = quantity * entry_price;
    const double exit_value = quantity * exit_price;

    result.gross = directionSign(direction) * (exit_value - entry_value);
    result.fees = (entry_value + exit_value) * fee_rate;
    result.net = result.gross - result.fees;
    return result;
}

bool PositionModel::stopLossHit(const Candle& candle, Price stop_price, Direction direction) {
    if (stop_price <= 0.0) return false;
    return direction == Direction::LONG ? candle.low <= stop_price : candle.high >= stop_price;
}

bool PositionModel::takeProfitHit(const Candle& candle, Price target_price, Direction direction) {
    if (target_price <= 0.0) return false;
    return direction == Direction::LONG ? candle.high >= target_price : candle.low <= target_price;
}

bool PositionModel::liquidationHit(const Candle& candle, Price liquidation_price, Direction direction) {
    const double adverse = (direction == Direction::LONG) ? candle.low : candle.high;
    return isLiquidated(adverse, liquidation_price, direction);
}

Amount PositionModel::unrealizedPnl(const Position& position, Price mark_price) {
    return directionSign(position.direction) * position.quantity() * (mark_price - position.entry_price);
}

} // namespace backtest
} // namespace levsim
