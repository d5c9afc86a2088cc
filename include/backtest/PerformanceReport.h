#pragma once

#include "backtest/BacktestTypes.h"
#include "common/Types.h"
#include <map>
#include <vector>

namespace levsim {
namespace backtest {

struct ExitReasonStats {
    int count = 0;
    double total_pnl = 0.0;
};

// Run metrics, derived only from the trade ledger and the equity curve
struct PerformanceMetrics {
    int total_trades = 0;
    int winning_trades = 0;         // pnl > 0
    int losing_trades = 0;          // everything else
    int long_trades = 0;
    int short_trades = 0;
    int liquidations = 0;
    double win_rate = 0.0;

    double total_pnl = 0.0;
    double avg_pnl = 0.0;
    double total_fees = 0.0;
    double gross_profit = 0.0;
    double gross_loss = 0.0;        // absolute value
    double profit_factor = 0.0;     // winning / losing trade count
    double gross_profit_factor = 0.0;

    double avg_win = 0.0;
    double avg_loss = 0.0;          // negative or 0
    double largest_win = 0.0;
    double largest_loss = 0.0;      // negative or 0
    double avg_bars_held = 0.0;

    double sharpe_ratio = 0.0;
    double max_drawdown = 0.0;

    double initial_capital = 0.0;
    double final_equity = 0.0;
    double total_return = 0.0;      // fraction of initial capital

    std::map<ExitReason, ExitReasonStats> by_exit_reason;
};

class PerformanceReport {
public:
    static PerformanceMetrics build(const std::vector<Trade>& trades,
                                    const std::vector<EquityCurvePoint>& equity_curve,
                                    double initial_capital,
                                    double final_equity);

    static PerformanceMetrics build(const BacktestResult& result) {
        return build(result.trades, result.equity_curve, result.initial_capital, result.final_equity);
    }

    // mean / stdev of pnl/initial_capital, annualized by sqrt(252). 0 when undefined.
    static double sharpeRatio(const std::vector<Trade>& trades, double initial_capital);

    // Running peak starts at initial_capital
    static double maxDrawdown(const std::vector<EquityCurvePoint>& equity_curve, double initial_capital);

    // Summary through the logger
    static void log(const PerformanceMetrics& metrics);
};

} // namespace backtest
} // namespace levsim
