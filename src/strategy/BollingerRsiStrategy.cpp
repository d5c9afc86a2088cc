#include "strategy/BollingerRsiStrategy.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"
#include <spdlog/fmt/fmt.h>
#include <algorithm>

namespace levsim {
namespace strategy {

using analytics::TechnicalIndicators;

BollingerRsiStrategy::BollingerRsiStrategy(const BollingerRsiStrategyConfig& config)
    : config_(config)
{
    LOG_INFO("[BollingerRsiStrategy] Initialized - RSI({}) {:.1f}/{:.1f}, BB({}, {:.2f}), ADX({}) < {:.1f}, TP {:.2f}%",
             config_.rsi_period, config_.rsi_oversold, config_.rsi_overbought,
             config_.bb_period, config_.bb_std_dev,
             config_.adx_period, config_.adx_threshold, config_.profit_target);
}

StrategyInfo BollingerRsiStrategy::getInfo() const {
    StrategyInfo info;
    info.name = "bollinger_rsi";
    info.description = "Bollinger Band / RSI mean reversion gated by low ADX";
    info.timeframe = "15m";
    return info;
}

int BollingerRsiStrategy::requiredLookback() const {
    return std::max({config_.bb_period, config_.rsi_period + 1, config_.adx_period * 2});
}

StrategySignal BollingerRsiStrategy::evaluate(const std::vector<Candle>& window,
                                              std::optional<Direction> open_side) {
    if (window.size() < static_cast<size_t>(requiredLookback())) {
        return StrategySignal(SignalType::NONE, "insufficient data");
    }

    const auto closes = TechnicalIndicators::extractClosePrices(window);
    const double close = closes.back();

    const double rsi = TechnicalIndicators::calculateRSI(closes, config_.rsi_period);
    const auto bb = TechnicalIndicators::calculateBollingerBands(
        closes, close, config_.bb_period, config_.bb_std_dev);
    const double adx = TechnicalIndicators::calculateADX(window, config_.adx_period);

    const bool ranging = adx < config_.adx_threshold;

    if (ranging && close <= bb.lower && rsi < config_.rsi_oversold) {
        StrategySignal signal(SignalType::LONG,
            fmt::format("close {:.4f} <= lower band {:.4f}, RSI {:.1f}, ADX {:.1f}", close, bb.lower, rsi, adx));
        signal.take_profit = close * (1.0 + config_.profit_target / 100.0);
        return signal;
    }

    if (ranging && close >= bb.upper && rsi > config_.rsi_overbought) {
        StrategySignal signal(SignalType::SHORT,
            fmt::format("close {:.4f} >= upper band {:.4f}, RSI {:.1f}, ADX {:.1f}", close, bb.upper, rsi, adx));
        signal.take_profit = close * (1.0 - config_.profit_target / 100.0);
        return signal;
    }

    // Exits are only emitted for the side that is open
    if (!open_side) {
        return StrategySignal();
    }
    if (*open_side == Direction::LONG && (close >= bb.middle || rsi > config_.rsi_overbought)) {
        return StrategySignal(SignalType::CLOSE_LONG,
            fmt::format("reverted to mean {:.4f}, RSI {:.1f}", bb.middle, rsi));
    }
    if (*open_side == Direction::SHORT && (close <= bb.middle || rsi < config_.rsi_oversold)) {
        return StrategySignal(SignalType::CLOSE_SHORT,
            fmt::format("reverted to mean {:.4f}, RSI {:.1f}", bb.middle, rsi));
    }

    return StrategySignal();
}

} // namespace strategy
} // namespace levsim
