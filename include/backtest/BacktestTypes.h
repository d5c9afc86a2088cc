#pragma once

#include "common/Types.h"
#include "risk/RiskTypes.h"
#include <optional>
#include <string>
#include <vector>

namespace levsim {
namespace backtest {

// One per processed bar. equity is realized-only; unrealized_pnl is informational.
struct EquityCurvePoint {
    long long timestamp = 0;
    double equity = 0.0;
    double drawdown = 0.0;
    bool has_position = false;
    std::string position_type = "NONE";
    Price price = 0.0;
    Amount unrealized_pnl = 0.0;
};

// Sizing decision for one entry attempt
struct PositionSizeRecord {
    long long timestamp = 0;
    std::size_t bar_index = 0;
    Direction direction = Direction::LONG;
    Price price = 0.0;
    risk::PositionSizing sizing;
    double adjustment = 1.0;        // recommendation multiplier applied on top
    Amount final_size = 0.0;
    Amount final_margin = 0.0;
    bool executed = false;
};

struct AdjustmentRecord {
    long long timestamp = 0;
    std::size_t bar_index = 0;
    risk::TradeRecommendation recommendation;
};

struct RiskSnapshot {
    long long timestamp = 0;
    std::size_t bar_index = 0;
    risk::RiskStats stats;
};

struct BacktestResult {
    std::string market;
    std::string timeframe;
    std::string strategy_name;
    std::string risk_policy;
    double initial_capital = 0.0;
    double final_equity = 0.0;
    std::size_t bars_processed = 0;

    std::vector<Trade> trades;
    std::vector<EquityCurvePoint> equity_curve;
    std::optional<Position> open_position;      // still open after the last bar

    std::vector<PositionSizeRecord> position_sizes;
    std::vector<AdjustmentRecord> adjustments;
    std::vector<RiskSnapshot> risk_snapshots;
};

} // namespace backtest
} // namespace levsim
