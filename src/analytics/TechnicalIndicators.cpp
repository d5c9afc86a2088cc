#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <algorithm>
#include <numeric>

namespace levsim {
namespace analytics {

namespace {

double trueRange(const Candle& current, const Candle& prev) {
    return std::max({current.high - current.low,
                     std::abs(current.high - prev.close),
                     std::abs(current.low - prev.close)});
}

// Wilder's running sum: first value is the plain sum of the first p entries
std::vector<double> wilderSum(const std::vector<double>& values, int p) {
    std::vector<double> out;
    if (values.size() < static_cast<size_t>(p)) return out;

    double running = std::accumulate(values.begin(), values.begin() + p, 0.0);
    out.push_back(running);
    for (size_t i = p; i < values.size(); ++i) {
        running = running - (running / p) + values[i];
        out.push_back(running);
    }
    return out;
}

} // namespace

// RSI (Wilder's smoothing)
double TechnicalIndicators::calculateRSI(const std::vector<double>& prices, int period) {
    if (period < 1 || prices.size() < static_cast<size_t>(period + 1)) {
        return 50.0;
    }

    double avg_gain = 0.0;
    double avg_loss = 0.0;

    // seed from the first period changes
    for (int i = 1; i <= period; ++i) {
        const double change = prices[i] - prices[i - 1];
        if (change > 0) avg_gain += change;
        else avg_loss -= change;
    }
    avg_gain /= period;
    avg_loss /= period;

    for (size_t i = period + 1; i < prices.size(); ++i) {
        const double change = prices[i] - prices[i - 1];
        const double gain = change > 0 ? change : 0.0;
        const double loss = change < 0 ? -change : 0.0;
        avg_gain = (avg_gain * (period - 1) + gain) / period;
        avg_loss = (avg_loss * (period - 1) + loss) / period;
    }

    if (avg_loss < 1e-7) return 100.0;

    const double rs = avg_gain / avg_loss;
    return 100.0 - (100.0 / (1.0 + rs));
}

TechnicalIndicators::BollingerBands TechnicalIndicators::calculateBollingerBands(
    const std::vector<double>& prices,
    double current_price,
    int period,
    double std_dev_mult
) {
    BollingerBands result;
    if (period < 1 || prices.size() < static_cast<size_t>(period)) {
        return result;
    }

    std::vector<double> recent(prices.end() - period, prices.end());
    result.middle = calculateMean(recent);

    const double std_dev = calculateStandardDeviation(recent, result.middle);
    result.upper = result.middle + std_dev * std_dev_mult;
    result.lower = result.middle - std_dev * std_dev_mult;
    result.width = result.upper - result.lower;
    result.percent_b = (result.width > 1e-4)
        ? (current_price - result.lower) / result.width
        : 0.5;

    return result;
}

double TechnicalIndicators::calculateATR(const std::vector<Candle>& candles, int period) {
    if (period < 1 || candles.size() < static_cast<size_t>(period + 1)) {
        return 0.0;
    }

    std::vector<double> tr;
    tr.reserve(candles.size() - 1);
    for (size_t i = 1; i < candles.size(); ++i) {
        tr.push_back(trueRange(candles[i], candles[i - 1]));
    }

    // SMA seed, then Wilder's smoothing to the latest bar
    double atr = std::accumulate(tr.begin(), tr.begin() + period, 0.0) / period;
    for (size_t i = period; i < tr.size(); ++i) {
        atr = (atr * (period - 1) + tr[i]) / period;
    }
    return atr;
}

double TechnicalIndicators::calculateADX(const std::vector<Candle>& candles, int period) {
    if (period < 1 || candles.size() < static_cast<size_t>(period * 2)) return 0.0;

    std::vector<double> tr, dm_plus, dm_minus;
    tr.reserve(candles.size());
    dm_plus.reserve(candles.size());
    dm_minus.reserve(candles.size());

    for (size_t i = 1; i < candles.size(); ++i) {
        tr.push_back(trueRange(candles[i], candles[i - 1]));

        const double up_move = candles[i].high - candles[i - 1].high;
        const double down_move = candles[i - 1].low - candles[i].low;
        dm_plus.push_back((up_move > down_move && up_move > 0) ? up_move : 0.0);
        dm_minus.push_back((down_move > up_move && down_move > 0) ? down_move : 0.0);
    }

    const auto tr_smooth = wilderSum(tr, period);
    const auto plus_smooth = wilderSum(dm_plus, period);
    const auto minus_smooth = wilderSum(dm_minus, period);

    const size_t len = std::min({tr_smooth.size(), plus_smooth.size(), minus_smooth.size()});
    std::vector<double> dx;
    dx.reserve(len);
    for (size_t i = 0; i < len; ++i) {
        if (tr_smooth[i] == 0.0) {
            dx.push_back(0.0);
            continue;
        }
        const double di_plus = plus_smooth[i] / tr_smooth[i] * 100.0;
        const double di_minus = minus_smooth[i] / tr_smooth[i] * 100.0;
        const double di_sum = di_plus + di_minus;
        dx.push_back(di_sum == 0.0 ? 0.0 : std::abs(di_plus - di_minus) / di_sum * 100.0);
    }

    // ADX = SMA of the latest period DX values
    if (dx.size() < static_cast<size_t>(period)) return 0.0;
    return calculateSMA(dx, period);
}

double TechnicalIndicators::calculateSMA(const std::vector<double>& prices, int period) {
    if (period < 1 || prices.size() < static_cast<size_t>(period)) return 0.0;

    const double sum = std::accumulate(prices.end() - period, prices.end(), 0.0);
    return sum / period;
}

double TechnicalIndicators::calculateStandardDeviation(const std::vector<double>& values, double mean) {
    if (values.empty()) return 0.0;

    double sum_sq = 0.0;
    for (double v : values) {
        sum_sq += (v - mean) * (v - mean);
    }
    return std::sqrt(sum_sq / values.size());
}

double TechnicalIndicators::calculateMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Candle>& candles) {
    std::vector<double> prices;
    prices.reserve(candles.size());
    for (const auto& c : candles) {
        prices.push_back(c.close);
    }
    return prices;
}

} // namespace analytics
} // namespace levsim
