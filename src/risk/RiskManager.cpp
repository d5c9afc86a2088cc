#include "risk/RiskManager.h"
#include "common/Logger.h"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>

namespace levsim {
namespace risk {

namespace {
constexpr double BASELINE_VOLATILITY = 0.02;        // volatility that leaves risk unchanged
constexpr double MAX_VOLATILITY_DIVISOR = 2.0;
constexpr int MAX_STREAK_EXPONENT = 3;
constexpr size_t MIN_TRADES_FOR_KELLY = 10;
constexpr double ATR_STOP_MULTIPLIER = 2.0;
constexpr double DEFAULT_STOP_PCT = 0.025;
constexpr double HIGH_VOLATILITY = 0.04;
}

RiskManager::RiskManager(const RiskConfig& config)
    : config_(config)
    , current_equity_(config.initial_capital)
    , high_water_mark_(config.initial_capital)
    , current_drawdown_(0.0)
    , consecutive_wins_(0)
    , consecutive_losses_(0)
    , win_rate_(0.5)
    , win_loss_ratio_(1.0)
    , price_volatility_(0.0)
{
    equity_history_.push_back({0, current_equity_, 0.0});
    LOG_INFO("RiskManager initialized - capital {:.2f}, risk/trade {:.2f}%, max drawdown {:.2f}%",
             config_.initial_capital, config_.max_risk_per_trade * 100.0, config_.max_drawdown * 100.0);
}

// ===== State updates =====

void RiskManager::updateEquity(double equity, long long timestamp) {
    current_equity_ = equity;
    if (equity > high_water_mark_) {
        high_water_mark_ = equity;
    }

    double drawdown = 0.0;
    if (high_water_mark_ > 0.0) {
        drawdown = (high_water_mark_ - equity) / high_water_mark_;
    }
    // [0, 1): a wiped-out account sits just below a full drawdown
    current_drawdown_ = std::clamp(drawdown, 0.0, std::nextafter(1.0, 0.0));

    equity_history_.push_back({timestamp, current_equity_, current_drawdown_});
}

void RiskManager::updateMarketData(const std::vector<Candle>& window) {
    if (!config_.use_volatility_adjustment) return;
    const size_t n = static_cast<size_t>(config_.volatility_window);
    if (window.size() <= n) return;

    std::vector<double> returns;
    returns.reserve(n);
    for (size_t i = window.size() - n + 1; i < window.size(); ++i) {
        const double prev = window[i - 1].close;
        if (prev > 0.0) {
            returns.push_back((window[i].close - prev) / prev);
        }
    }
    if (returns.empty()) return;

    double mean = 0.0;
    for (double r : returns) mean += r;
    mean /= static_cast<double>(returns.size());

    double variance = 0.0;
    for (double r : returns) variance += (r - mean) * (r - mean);
    variance /= static_cast<double>(returns.size());

    price_volatility_ = std::sqrt(variance);
}

std::size_t RiskManager::requiredHistoryBars() const {
    if (!config_.use_volatility_adjustment) return 0;
    return static_cast<std::size_t>(config_.volatility_window) + 1;
}

void RiskManager::recordTrade(const Trade& trade) {
    recent_trades_.push_front(trade);
    while (recent_trades_.size() > static_cast<size_t>(config_.trade_history_window)) {
        recent_trades_.pop_back();
    }

    if (trade.pnl > 0.0) {
        consecutive_wins_++;
        consecutive_losses_ = 0;
    } else if (trade.pnl < 0.0) {
        consecutive_losses_++;
        consecutive_wins_ = 0;
    }

    updateWinStatistics();

    open_positions_.erase(
        std::remove_if(open_positions_.begin(), open_positions_.end(),
            [&trade](const OpenPositionRecord& p) {
                return p.entry_time == trade.entry_time && p.entry_price == trade.entry_price;
            }),
        open_positions_.end());

    LOG_DEBUG("Trade recorded: pnl={:.2f}, streak W{}/L{}, winRate={:.3f}, W/L={:.3f}",
              trade.pnl, consecutive_wins_, consecutive_losses_, win_rate_, win_loss_ratio_);
}

void RiskManager::updateWinStatistics() {
    if (recent_trades_.empty()) return;

    int wins = 0;
    int losses = 0;
    double win_sum = 0.0;
    double loss_sum = 0.0;
    for (const auto& t : recent_trades_) {
        if (t.pnl > 0.0) {
            ++wins;
            win_sum += t.pnl;
        } else if (t.pnl < 0.0) {
            ++losses;
            loss_sum += t.pnl;
        }
    }

    win_rate_ = static_cast<double>(wins) / static_cast<double>(recent_trades_.size());
    const double avg_win = (wins > 0) ? win_sum / wins : 0.0;
    const double avg_loss = (losses > 0) ? std::abs(loss_sum / losses) : 0.0;
    win_loss_ratio_ = (avg_loss > 0.0) ? avg_win / avg_loss : 1.0;
}

// ===== Sizing =====

double RiskManager::committedMargin() const {
    double used = 0.0;
    for (const auto& p : open_positions_) {
        used += p.margin;
    }
    return used;
}

int RiskManager::countOpenPositions(Direction direction) const {
    return static_cast<int>(std::count_if(open_positions_.begin(), open_positions_.end(),
        [direction](const OpenPositionRecord& p) { return p.direction == direction; }));
}

double RiskManager::kellyPercentage() const {
    if (win_loss_ratio_ <= 0.0) {
        return 0.0;
    }
    const double kelly = (win_rate_ * win_loss_ratio_ - (1.0 - win_rate_)) / win_loss_ratio_;
    return std::max(0.0, kelly);
}

PositionSizing RiskManager::calculatePositionSize(const TradeCandidate& candidate, double leverage) {
    PositionSizing result;

    // 1) hard stop on drawdown
    if (current_drawdown_ >= config_.max_drawdown) {
        result.reason = "max drawdown reached";
        LOG_INFO("Sizing rejected: {} ({:.2f}% >= {:.2f}%)", result.reason,
                 current_drawdown_ * 100.0, config_.max_drawdown * 100.0);
        return result;
    }

    // 2) position count
    if (static_cast<int>(open_positions_.size()) >= config_.max_open_positions && !config_.pyramiding) {
        result.reason = "max open positions reached";
        LOG_INFO("Sizing rejected: {} ({}/{})", result.reason,
                 open_positions_.size(), config_.max_open_positions);
        return result;
    }

    // 3) capital not already committed
    double available_capital = current_equity_;
    if (!config_.pyramiding) {
        available_capital -= committedMargin();
    }
    available_capital = std::max(0.0, available_capital);

    // 4) base risk, scaled down by volatility (at most 2x)
    double risk_percentage = config_.max_risk_per_trade;
    if (config_.use_volatility_adjustment && price_volatility_ > 0.0) {
        const double normalized = std::min(price_volatility_ / BASELINE_VOLATILITY, MAX_VOLATILITY_DIVISOR);
        risk_percentage /= normalized;
    }

    // 5) anti-martingale
    if (config_.use_anti_martingale) {
        if (consecutive_wins_ > 0) {
            risk_percentage *= std::pow(config_.win_multiplier,
                                        std::min(consecutive_wins_, MAX_STREAK_EXPONENT));
        } else if (consecutive_losses_ > 0) {
            risk_percentage *= std::pow(config_.loss_multiplier,
                                        std::min(consecutive_losses_, MAX_STREAK_EXPONENT));
        }
    }

    // 6) Kelly cap
    if (config_.use_kelly_criterion && recent_trades_.size() >= MIN_TRADES_FOR_KELLY) {
        const double adjusted_kelly = kellyPercentage() * config_.kelly_fraction;
        risk_percentage = std::min(risk_percentage, adjusted_kelly);
    }

    // 7) max position cap
    risk_percentage = std::clamp(risk_percentage, 0.0, config_.max_position_size);

    // 8) margin and notional
    double margin = available_capital * risk_percentage;
    double size = margin * leverage;

    // 9) pyramiding
    int level = 1;
    if (config_.pyramiding) {
        level = countOpenPositions(candidate.direction) + 1;
        if (level > config_.pyramiding_levels) {
            result.reason = "max pyramiding levels reached";
            LOG_INFO("Sizing rejected: {} ({} {})", result.reason,
                     config_.pyramiding_levels, directionToString(candidate.direction));
            return result;
        }
        const double factor = 1.0 / static_cast<double>(level);
        margin *= factor;
        size *= factor;
        risk_percentage *= factor;
    }

    result.size = size;
    result.margin = margin;
    result.risk_amount = margin;
    result.risk_percentage = risk_percentage;
    result.pyramid_level = level;

    if (size <= 0.0) {
        result.size = 0.0;
        result.reason = (available_capital <= 0.0) ? "no available capital" : "zero risk allocation";
        LOG_INFO("Sizing rejected: {}", result.reason);
        return result;
    }

    result.reason = config_.pyramiding ? fmt::format("pyramiding level {}", level) : "standard position";

    // 10) track as open
    OpenPositionRecord record;
    record.entry_time = candidate.entry_time;
    record.entry_price = candidate.entry_price;
    record.direction = candidate.direction;
    record.size = size * candidate.size_adjustment;
    record.margin = margin * candidate.size_adjustment;
    record.level = level;
    open_positions_.push_back(record);

    LOG_DEBUG("Sizing {}: margin={:.2f}, notional={:.2f}, risk={:.4f}%, {}",
              directionToString(candidate.direction), margin, size, risk_percentage * 100.0, result.reason);
    return result;
}

std::optional<Price> RiskManager::calculateStopLoss(
    const TradeCandidate& candidate,
    const PositionSizing& sizing,
    std::optional<double> atr
) const {
    (void)sizing;
    double stop_distance = 0.0;
    if (atr && *atr > 0.0) {
        stop_distance = *atr * ATR_STOP_MULTIPLIER;
    } else {
        stop_distance = candidate.entry_price * DEFAULT_STOP_PCT;
    }

    return candidate.direction == Direction::LONG
        ? candidate.entry_price - stop_distance
        : candidate.entry_price + stop_distance;
}

// ===== Throttling =====

TradeRecommendation RiskManager::getTradeRecommendation() const {
    TradeRecommendation rec;

    if (current_drawdown_ >= config_.max_drawdown) {
        rec.action = TradeAction::STOP;
        rec.adjustment = 0.0;
        rec.reason = fmt::format("Max drawdown reached ({:.2f}%)", current_drawdown_ * 100.0);
        rec.severity = Severity::HIGH;
        return rec;
    }

    if (current_drawdown_ >= config_.max_drawdown * 0.7) {
        rec.action = TradeAction::REDUCE;
        rec.adjustment = 0.5;
        rec.reason = fmt::format("High drawdown ({:.2f}%)", current_drawdown_ * 100.0);
        rec.severity = Severity::MEDIUM;
        return rec;
    }

    if (consecutive_losses_ >= 3) {
        rec.action = TradeAction::REDUCE;
        rec.adjustment = std::pow(0.8, consecutive_losses_);
        rec.reason = fmt::format("{} consecutive losses", consecutive_losses_);
        rec.severity = Severity::MEDIUM;
        return rec;
    }

    if (config_.use_volatility_adjustment && price_volatility_ > HIGH_VOLATILITY) {
        rec.action = TradeAction::REDUCE;
        rec.adjustment = 0.7;
        rec.reason = fmt::format("High volatility ({:.2f}%)", price_volatility_ * 100.0);
        rec.severity = Severity::MEDIUM;
        return rec;
    }

    if (consecutive_wins_ >= 3 && current_drawdown_ < 0.1) {
        rec.action = TradeAction::INCREASE;
        rec.adjustment = std::min(1.5, 1.0 + consecutive_wins_ * 0.1);
        rec.reason = fmt::format("{} consecutive wins with low drawdown", consecutive_wins_);
        rec.severity = Severity::LOW;
        return rec;
    }

    rec.reason = "Regular trading conditions";
    return rec;
}

// ===== Statistics =====

RiskStats RiskManager::getRiskStats() const {
    RiskStats stats;
    stats.current_equity = current_equity_;
    stats.initial_capital = config_.initial_capital;
    stats.high_water_mark = high_water_mark_;
    stats.current_drawdown = current_drawdown_;
    stats.max_risk_per_trade = config_.max_risk_per_trade;
    stats.open_positions = static_cast<int>(open_positions_.size());
    stats.consecutive_wins = consecutive_wins_;
    stats.consecutive_losses = consecutive_losses_;
    stats.win_rate = win_rate_;
    stats.win_loss_ratio = win_loss_ratio_;
    stats.price_volatility = price_volatility_;
    return stats;
}

} // namespace risk
} // namespace levsim
