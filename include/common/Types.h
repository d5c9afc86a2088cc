#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace levsim {

using Price = double;
using Amount = double;

enum class Direction { LONG, SHORT };
enum class ExitReason { SIGNAL, TAKE_PROFIT, STOP_LOSS, LIQUIDATION };

struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    long long timestamp;    // ms, epoch

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, long long t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

// Open leveraged position. size is notional exposure in quote currency at entry.
struct Position {
    Direction direction = Direction::LONG;
    Price entry_price = 0.0;
    long long entry_time = 0;
    std::size_t entry_index = 0;
    Amount size = 0.0;
    Amount margin = 0.0;
    Price stop_loss_price = 0.0;       // 0 = none
    Price take_profit_price = 0.0;     // 0 = none
    Price liquidation_price = 0.0;
    int pyramid_level = 1;

    double quantity() const { return entry_price > 0.0 ? size / entry_price : 0.0; }
    bool hasStopLoss() const { return stop_loss_price > 0.0; }
    bool hasTakeProfit() const { return take_profit_price > 0.0; }
};

// Closed position. Immutable once appended to the ledger.
struct Trade : Position {
    Price exit_price = 0.0;
    long long exit_time = 0;
    std::size_t bars_held = 0;
    Amount gross_pnl = 0.0;
    Amount fees = 0.0;
    Amount pnl = 0.0;
    ExitReason exit_reason = ExitReason::SIGNAL;
};

inline int directionSign(Direction direction) {
    return direction == Direction::LONG ? 1 : -1;
}

inline const char* directionToString(Direction direction) {
    return direction == Direction::LONG ? "LONG" : "SHORT";
}

inline const char* exitReasonToString(ExitReason reason) {
    switch (reason) {
        case ExitReason::SIGNAL: return "SIGNAL";
        case ExitReason::TAKE_PROFIT: return "TAKE_PROFIT";
        case ExitReason::STOP_LOSS: return "STOP_LOSS";
        case ExitReason::LIQUIDATION: return "LIQUIDATION";
    }
    return "SIGNAL";
}

inline const std::vector<ExitReason>& allExitReasons() {
    static const std::vector<ExitReason> reasons{
        ExitReason::SIGNAL, ExitReason::TAKE_PROFIT,
        ExitReason::STOP_LOSS, ExitReason::LIQUIDATION
    };
    return reasons;
}

} // namespace levsim
