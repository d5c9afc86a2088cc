#include "backtest/PerformanceReport.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>

namespace levsim {
namespace backtest {

namespace {
constexpr double TRADING_DAYS_PER_YEAR = 252.0;
}

PerformanceMetrics PerformanceReport::build(const std::vector<Trade>& trades,
                                            const std::vector<EquityCurvePoint>& equity_curve,
                                            double initial_capital,
                                            double final_equity) {
    PerformanceMetrics m;
    m.initial_capital = initial_capital;
    m.final_equity = final_equity;
    m.total_return = (initial_capital > 0.0) ? (final_equity - initial_capital) / initial_capital : 0.0;

    for (ExitReason reason : allExitReasons()) {
        m.by_exit_reason[reason] = ExitReasonStats();
    }

    double total_bars = 0.0;
    for (const auto& t : trades) {
        m.total_trades++;
        m.total_pnl += t.pnl;
        m.total_fees += t.fees;
        total_bars += static_cast<double>(t.bars_held);

        if (t.direction == Direction::LONG) m.long_trades++;
        else m.short_trades++;
        if (t.exit_reason == ExitReason::LIQUIDATION) m.liquidations++;

        auto& reason = m.by_exit_reason[t.exit_reason];
        reason.count++;
        reason.total_pnl += t.pnl;

        if (t.pnl > 0.0) {
            m.winning_trades++;
            m.gross_profit += t.pnl;
            m.largest_win = std::max(m.largest_win, t.pnl);
        } else {
            m.losing_trades++;
            m.gross_loss += std::abs(t.pnl);
            m.largest_loss = std::min(m.largest_loss, t.pnl);
        }
    }

    if (m.total_trades > 0) {
        m.win_rate = static_cast<double>(m.winning_trades) / m.total_trades;
        m.avg_pnl = m.total_pnl / m.total_trades;
        m.avg_bars_held = total_bars / m.total_trades;
    }
    if (m.winning_trades > 0) m.avg_win = m.gross_profit / m.winning_trades;
    if (m.losing_trades > 0) {
        m.avg_loss = -m.gross_loss / m.losing_trades;
        m.profit_factor = static_cast<double>(m.winning_trades) / m.losing_trades;
    }
    if (m.gross_loss > 1e-12) {
        m.gross_profit_factor = m.gross_profit / m.gross_loss;
    }

    m.sharpe_ratio = sharpeRatio(trades, initial_capital);
    m.max_drawdown = maxDrawdown(equity_curve, initial_capital);
    return m;
}

double PerformanceReport::sharpeRatio(const std::vector<Trade>& trades, double initial_capital) {
    if (trades.empty() || initial_capital <= 0.0) return 0.0;

    std::vector<double> returns;
    returns.reserve(trades.size());
    for (const auto& t : trades) {
        returns.push_back(t.pnl / initial_capital);
    }

    double mean = 0.0;
    for (double r : returns) mean += r;
    mean /= static_cast<double>(returns.size());

    double variance = 0.0;
    for (double r : returns) variance += (r - mean) * (r - mean);
    variance /= static_cast<double>(returns.size());

    const double stdev = std::sqrt(variance);
    if (stdev <= 0.0) return 0.0;
    return mean / stdev * std::sqrt(TRADING_DAYS_PER_YEAR);
}

double PerformanceReport::maxDrawdown(const std::vector<EquityCurvePoint>& equity_curve, double initial_capital) {
    double peak = initial_capital;
    double max_dd = 0.0;
    for (const auto& point : equity_curve) {
        peak = std::max(peak, point.equity);
        if (peak > 0.0) {
            max_dd = std::max(max_dd, (peak - point.equity) / peak);
        }
    }
    return max_dd;
}

void PerformanceReport::log(const PerformanceMetrics& m) {
    LOG_INFO("========== Backtest Summary ==========");
    LOG_INFO("Capital: {:.2f} -> {:.2f} ({:+.2f}%)", m.initial_capital, m.final_equity, m.total_return * 100.0);
    LOG_INFO("Trades: {} (long {}, short {}), win rate {:.2f}%",
             m.total_trades, m.long_trades, m.short_trades, m.win_rate * 100.0);
    LOG_INFO("PnL: total {:.2f}, avg {:.2f}, fees {:.2f}", m.total_pnl, m.avg_pnl, m.total_fees);
    LOG_INFO("Avg win {:.2f} / avg loss {:.2f}, largest win {:.2f} / largest loss {:.2f}",
             m.avg_win, m.avg_loss, m.largest_win, m.largest_loss);
    LOG_INFO("Profit factor {:.2f} (gross {:.2f}), Sharpe {:.3f}, max drawdown {:.2f}%",
             m.profit_factor, m.gross_profit_factor, m.sharpe_ratio, m.max_drawdown * 100.0);
    for (const auto& [reason, stats] : m.by_exit_reason) {
        LOG_INFO("  {:<12} {:>5} trades, pnl {:.2f}", exitReasonToString(reason), stats.count, stats.total_pnl);
    }
    if (m.liquidations > 0) {
        LOG_WARN("Margin calls (liquidations): {}", m.liquidations);
    }
}

} // namespace backtest
} // namespace levsim
