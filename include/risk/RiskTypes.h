#pragma once

#include "common/Types.h"
#include <string>

namespace levsim {
namespace risk {

struct RiskConfig {
    double initial_capital = 10000.0;
    double max_risk_per_trade = 0.02;       // 2% of available capital
    double max_position_size = 0.5;         // cap on the risk percentage
    int max_open_positions = 1;
    double max_drawdown = 0.25;
    double trading_fee = 0.001;

    bool use_volatility_adjustment = false;
    int volatility_window = 20;

    bool pyramiding = false;
    int pyramiding_levels = 3;

    bool use_anti_martingale = false;
    double win_multiplier = 1.5;
    double loss_multiplier = 0.7;

    bool use_kelly_criterion = false;
    double kelly_fraction = 0.5;            // half-Kelly

    int trade_history_window = 50;
};

// Sizing request for a prospective entry
struct TradeCandidate {
    Direction direction = Direction::LONG;
    Price entry_price = 0.0;
    long long entry_time = 0;
    double size_adjustment = 1.0;   // recommendation multiplier the engine will apply
};

// size == 0 means rejected; reason says why
struct PositionSizing {
    Amount size = 0.0;              // notional
    Amount margin = 0.0;
    Amount risk_amount = 0.0;
    double risk_percentage = 0.0;
    int pyramid_level = 0;
    std::string reason;

    bool accepted() const { return size > 0.0; }
};

enum class TradeAction { NORMAL, REDUCE, INCREASE, STOP };
enum class Severity { LOW, MEDIUM, HIGH };

struct TradeRecommendation {
    TradeAction action = TradeAction::NORMAL;
    double adjustment = 1.0;        // size multiplier
    std::string reason;
    Severity severity = Severity::LOW;
};

struct RiskStats {
    double current_equity = 0.0;
    double initial_capital = 0.0;
    double high_water_mark = 0.0;
    double current_drawdown = 0.0;
    double max_risk_per_trade = 0.0;
    int open_positions = 0;
    int consecutive_wins = 0;
    int consecutive_losses = 0;
    double win_rate = 0.0;
    double win_loss_ratio = 0.0;
    double price_volatility = 0.0;
};

// Position as tracked by the policy for capital and pyramiding bookkeeping
struct OpenPositionRecord {
    long long entry_time = 0;
    Price entry_price = 0.0;
    Direction direction = Direction::LONG;
    Amount size = 0.0;
    Amount margin = 0.0;
    int level = 1;
};

inline const char* tradeActionToString(TradeAction action) {
    switch (action) {
        case TradeAction::NORMAL: return "normal";
        case TradeAction::REDUCE: return "reduce";
        case TradeAction::INCREASE: return "increase";
        case TradeAction::STOP: return "stop";
    }
    return "normal";
}

inline const char* severityToString(Severity severity) {
    switch (severity) {
        case Severity::LOW: return "low";
        case Severity::MEDIUM: return "medium";
        case Severity::HIGH: return "high";
    }
    return "low";
}

} // namespace risk
} // namespace levsim
