#pragma once

namespace levsim {
namespace strategy {

struct BollingerRsiStrategyConfig {
    // RSI
    int rsi_period = 14;
    double rsi_overbought = 70.0;
    double rsi_oversold = 30.0;

    // Bollinger Bands
    int bb_period = 20;
    double bb_std_dev = 2.0;

    // ADX regime gate (entries only below threshold)
    int adx_period = 14;
    double adx_threshold = 25.0;

    // Take-profit distance in percent of entry
    double profit_target = 1.5;
};

} // namespace strategy
} // namespace levsim
