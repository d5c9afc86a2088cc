#include "backtest/ResultWriter.h"
#include "common/Logger.h"
#include <fstream>
#include <system_error>

namespace levsim {
namespace backtest {

namespace {

// 0 means "not set" for stop / target prices
nlohmann::json optionalPrice(Price price) {
    return price > 0.0 ? nlohmann::json(price) : nlohmann::json(nullptr);
}

template<typename T>
nlohmann::json toJsonArray(const std::vector<T>& items) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& item : items) {
        out.push_back(toJson(item));
    }
    return out;
}

} // namespace

nlohmann::json toJson(const Position& position) {
    nlohmann::json j;
    j["direction"] = directionToString(position.direction);
    j["entry_price"] = position.entry_price;
    j["entry_time"] = position.entry_time;
    j["entry_index"] = position.entry_index;
    j["size"] = position.size;
    j["quantity"] = position.quantity();
    j["margin"] = position.margin;
    j["stop_loss_price"] = optionalPrice(position.stop_loss_price);
    j["take_profit_price"] = optionalPrice(position.take_profit_price);
    j["liquidation_price"] = position.liquidation_price;
    j["pyramid_level"] = position.pyramid_level;
    return j;
}

nlohmann::json toJson(const Trade& trade) {
    nlohmann::json j = toJson(static_cast<const Position&>(trade));
    j["exit_price"] = trade.exit_price;
    j["exit_time"] = trade.exit_time;
    j["bars_held"] = trade.bars_held;
    j["gross_pnl"] = trade.gross_pnl;
    j["fees"] = trade.fees;
    j["pnl"] = trade.pnl;
    j["exit_reason"] = exitReasonToString(trade.exit_reason);
    return j;
}

nlohmann::json toJson(const EquityCurvePoint& point) {
    return {
        {"timestamp", point.timestamp},
        {"equity", point.equity},
        {"drawdown", point.drawdown},
        {"has_position", point.has_position},
        {"position_type", point.position_type},
        {"price", point.price},
        {"unrealized_pnl", point.unrealized_pnl}
    };
}

nlohmann::json toJson(const PositionSizeRecord& record) {
    return {
        {"timestamp", record.timestamp},
        {"bar_index", record.bar_index},
        {"direction", directionToString(record.direction)},
        {"price", record.price},
        {"size", record.sizing.size},
        {"margin", record.sizing.margin},
        {"risk_amount", record.sizing.risk_amount},
        {"risk_percentage", record.sizing.risk_percentage},
        {"pyramid_level", record.sizing.pyramid_level},
        {"reason", record.sizing.reason},
        {"adjustment", record.adjustment},
        {"final_size", record.final_size},
        {"final_margin", record.final_margin},
        {"executed", record.executed}
    };
}

nlohmann::json toJson(const AdjustmentRecord& record) {
    return {
        {"timestamp", record.timestamp},
        {"bar_index", record.bar_index},
        {"action", risk::tradeActionToString(record.recommendation.action)},
        {"adjustment", record.recommendation.adjustment},
        {"reason", record.recommendation.reason},
        {"severity", risk::severityToString(record.recommendation.severity)}
    };
}

nlohmann::json toJson(const risk::RiskStats& stats) {
    return {
        {"current_equity", stats.current_equity},
        {"initial_capital", stats.initial_capital},
        {"high_water_mark", stats.high_water_mark},
        {"current_drawdown", stats.current_drawdown},
        {"max_risk_per_trade", stats.max_risk_per_trade},
        {"open_positions", stats.open_positions},
        {"consecutive_wins", stats.consecutive_wins},
        {"consecutive_losses", stats.consecutive_losses},
        {"win_rate", stats.win_rate},
        {"win_loss_ratio", stats.win_loss_ratio},
        {"price_volatility", stats.price_volatility}
    };
}

nlohmann::json toJson(const RiskSnapshot& snapshot) {
    nlohmann::json j = toJson(snapshot.stats);
    j["timestamp"] = snapshot.timestamp;
    j["bar_index"] = snapshot.bar_index;
    return j;
}

nlohmann::json toJson(const PerformanceMetrics& m) {
    nlohmann::json by_reason = nlohmann::json::object();
    for (const auto& [reason, stats] : m.by_exit_reason) {
        by_reason[exitReasonToString(reason)] = {
            {"count", stats.count},
            {"total_pnl", stats.total_pnl}
        };
    }

    return {
        {"total_trades", m.total_trades},
        {"winning_trades", m.winning_trades},
        {"losing_trades", m.losing_trades},
        {"long_trades", m.long_trades},
        {"short_trades", m.short_trades},
        {"margin_calls", m.liquidations},
        {"win_rate", m.win_rate},
        {"total_pnl", m.total_pnl},
        {"avg_pnl", m.avg_pnl},
        {"total_fees", m.total_fees},
        {"gross_profit", m.gross_profit},
        {"gross_loss", m.gross_loss},
        {"profit_factor", m.profit_factor},
        {"gross_profit_factor", m.gross_profit_factor},
        {"avg_win", m.avg_win},
        {"avg_loss", m.avg_loss},
        {"largest_win", m.largest_win},
        {"largest_loss", m.largest_loss},
        {"avg_bars_held", m.avg_bars_held},
        {"sharpe_ratio", m.sharpe_ratio},
        {"max_drawdown", m.max_drawdown},
        {"initial_capital", m.initial_capital},
        {"final_equity", m.final_equity},
        {"total_return", m.total_return},
        {"exit_reasons", by_reason}
    };
}

ResultWriter::ResultWriter(std::filesystem::path output_dir)
    : output_dir_(std::move(output_dir)) {}

bool ResultWriter::writeJsonFile(const std::string& file_name, const nlohmann::json& content) const {
    std::error_code ec;
    std::filesystem::create_directories(output_dir_, ec);
    if (ec) {
        LOG_ERROR("Cannot create output directory {}: {}", output_dir_.string(), ec.message());
        return false;
    }

    const auto file_path = output_dir_ / file_name;
    auto tmp_path = file_path;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            LOG_ERROR("Cannot open {} for writing", tmp_path.string());
            return false;
        }
        out << content.dump(2);
        if (!out.good()) {
            LOG_ERROR("Write failed: {}", tmp_path.string());
            return false;
        }
    }

    std::filesystem::rename(tmp_path, file_path, ec);
    if (ec) {
        LOG_ERROR("Cannot move {} into place: {}", file_path.string(), ec.message());
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        return false;
    }
    return true;
}

bool ResultWriter::writeAll(const BacktestResult& result, const PerformanceMetrics& metrics) const {
    nlohmann::json statistics = toJson(metrics);
    statistics["market"] = result.market;
    statistics["timeframe"] = result.timeframe;
    statistics["strategy"] = result.strategy_name;
    statistics["bars_processed"] = result.bars_processed;
    statistics["open_position"] = result.open_position
        ? toJson(*result.open_position)
        : nlohmann::json(nullptr);

    nlohmann::json risk_statistics;
    risk_statistics["policy"] = result.risk_policy;
    risk_statistics["final"] = result.risk_snapshots.empty()
        ? nlohmann::json(nullptr)
        : toJson(result.risk_snapshots.back().stats);
    risk_statistics["snapshots"] = toJsonArray(result.risk_snapshots);

    bool ok = true;
    ok = writeJsonFile("backtest_trades.json", toJsonArray(result.trades)) && ok;
    ok = writeJsonFile("equity_curve.json", toJsonArray(result.equity_curve)) && ok;
    ok = writeJsonFile("trade_statistics.json", statistics) && ok;
    ok = writeJsonFile("risk_statistics.json", risk_statistics) && ok;
    ok = writeJsonFile("position_sizes.json", toJsonArray(result.position_sizes)) && ok;
    ok = writeJsonFile("risk_adjustments.json", toJsonArray(result.adjustments)) && ok;

    if (ok) {
        LOG_INFO("Results written to {}", output_dir_.string());
    }
    return ok;
}

} // namespace backtest
} // namespace levsim
