#pragma once

#include <vector>
#include "common/Types.h"

namespace levsim {
namespace analytics {

// Technical Indicators - latest value over a price / candle series
class TechnicalIndicators {
public:
    // RSI (Wilder's smoothing). 50 when there is not enough data
    static double calculateRSI(const std::vector<double>& prices, int period = 14);

    struct BollingerBands {
        double upper;
        double middle;      // SMA
        double lower;
        double width;
        double percent_b;   // where the current price sits inside the band (0~1)

        BollingerBands() : upper(0), middle(0), lower(0), width(0), percent_b(0) {}
    };
    static BollingerBands calculateBollingerBands(const std::vector<double>& prices,
                                                  double current_price,
                                                  int period = 20,
                                                  double std_dev_mult = 2.0);

    // ATR (Average True Range) - needs period + 1 candles, 0 otherwise
    static double calculateATR(const std::vector<Candle>& candles, int period = 14);

    // ADX - trend strength. Above 25: trending, below 20: ranging
    static double calculateADX(const std::vector<Candle>& candles, int period = 14);

    static double calculateSMA(const std::vector<double>& prices, int period);

    // Population standard deviation around the given mean
    static double calculateStandardDeviation(const std::vector<double>& values, double mean);
    static double calculateMean(const std::vector<double>& values);

    static std::vector<double> extractClosePrices(const std::vector<Candle>& candles);
};

} // namespace analytics
} // namespace levsim
