#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"
#include "strategy/BollingerRsiStrategy.h"
#include "strategy/OptimizedParameterLoader.h"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <vector>

using namespace levsim;
using levsim::analytics::TechnicalIndicators;
using namespace levsim::strategy;

namespace {

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

// 100/101 chop followed by the given closes
std::vector<Candle> chopThen(const std::vector<double>& tail, int chop_bars = 40) {
    std::vector<Candle> candles;
    long long t = 0;
    for (int i = 0; i < chop_bars; ++i) {
        const double c = 100.0 + (i % 2);
        candles.emplace_back(c, c + 0.5, c - 0.5, c, 1.0, t++);
    }
    for (double c : tail) {
        candles.emplace_back(c, c + 0.5, c - 0.5, c, 1.0, t++);
    }
    return candles;
}

void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

} // namespace

int main() {
    // indicators
    {
        std::vector<double> prices = {1, 2, 3, 4, 5};
        assert(near(TechnicalIndicators::calculateSMA(prices, 2), 4.5));
        assert(TechnicalIndicators::calculateSMA(prices, 6) == 0.0);
        assert(near(TechnicalIndicators::calculateMean(prices), 3.0));
        assert(near(TechnicalIndicators::calculateStandardDeviation(prices, 3.0), std::sqrt(2.0)));

        std::vector<double> rising;
        for (int i = 0; i < 30; ++i) rising.push_back(100.0 + i);
        assert(TechnicalIndicators::calculateRSI(rising, 14) == 100.0);
        assert(TechnicalIndicators::calculateRSI({1.0, 2.0}, 14) == 50.0);

        auto bb = TechnicalIndicators::calculateBollingerBands(std::vector<double>(20, 50.0), 50.0, 20, 2.0);
        assert(near(bb.middle, 50.0) && near(bb.upper, 50.0) && near(bb.lower, 50.0));
        assert(near(bb.percent_b, 0.5));

        std::vector<Candle> ranged;
        for (int i = 0; i < 20; ++i) ranged.emplace_back(100, 101, 99, 100, 1, i);
        assert(near(TechnicalIndicators::calculateATR(ranged, 14), 2.0));
        assert(TechnicalIndicators::calculateATR(std::vector<Candle>(ranged.begin(), ranged.begin() + 14), 14) == 0.0);
        assert(TechnicalIndicators::calculateADX(ranged, 14) == 0.0);
    }

    {
        assert(signalFromDirection(0.7) == SignalType::LONG);
        assert(signalFromDirection(-2.0) == SignalType::SHORT);
        assert(signalFromDirection(0.0) == SignalType::NONE);
        assert(entryDirection(SignalType::SHORT) == Direction::SHORT);
        assert(!entryDirection(SignalType::CLOSE_LONG));
    }

    BollingerRsiStrategyConfig ranging;
    ranging.adx_threshold = 100.0;

    {
        BollingerRsiStrategy s(ranging);
        assert(s.requiredLookback() == 28);
        assert(s.evaluate(chopThen({}, 10), std::nullopt).type == SignalType::NONE);
    }

    // oversold break of the lower band
    {
        BollingerRsiStrategy s(ranging);
        auto signal = s.evaluate(chopThen({97.0, 94.0, 90.0}), std::nullopt);
        assert(signal.type == SignalType::LONG);
        assert(signal.take_profit && near(*signal.take_profit, 90.0 * 1.015));
        assert(!signal.reason.empty());
    }

    // overbought break of the upper band
    {
        BollingerRsiStrategy s(ranging);
        auto signal = s.evaluate(chopThen({104.0, 107.0, 111.0}), std::nullopt);
        assert(signal.type == SignalType::SHORT);
        assert(signal.take_profit && near(*signal.take_profit, 111.0 * 0.985));
    }

    // trending regime blocks entries
    {
        BollingerRsiStrategyConfig trending = ranging;
        trending.adx_threshold = 0.0;
        BollingerRsiStrategy s(trending);
        const auto candles = chopThen({97.0, 94.0, 90.0});
        assert(s.evaluate(candles, std::nullopt).type == SignalType::NONE);
        assert(s.evaluate(candles, Direction::SHORT).type == SignalType::CLOSE_SHORT);
        assert(s.evaluate(candles, Direction::LONG).type == SignalType::NONE);
    }

    // back at the mean
    {
        BollingerRsiStrategy s(ranging);
        assert(s.evaluate(chopThen({}, 40), Direction::LONG).type == SignalType::CLOSE_LONG);    // last close 101
        assert(s.evaluate(chopThen({}, 40), Direction::SHORT).type == SignalType::NONE);
        assert(s.evaluate(chopThen({}, 41), Direction::SHORT).type == SignalType::CLOSE_SHORT);  // last close 100
        assert(s.evaluate(chopThen({}, 41), Direction::LONG).type == SignalType::NONE);
        assert(s.evaluate(chopThen({}, 40), std::nullopt).type == SignalType::NONE);
    }

    // both exit conditions true: each open side gets its own close
    {
        // close 101 above the middle 100.5, RSI ~52 below a raised oversold level
        BollingerRsiStrategyConfig cfg = ranging;
        cfg.rsi_oversold = 60.0;
        BollingerRsiStrategy s(cfg);
        assert(s.evaluate(chopThen({}, 40), Direction::SHORT).type == SignalType::CLOSE_SHORT);
        assert(s.evaluate(chopThen({}, 40), Direction::LONG).type == SignalType::CLOSE_LONG);
    }
    {
        // close 100 below the middle 100.5, RSI ~48 above a lowered overbought level
        BollingerRsiStrategyConfig cfg = ranging;
        cfg.rsi_overbought = 40.0;
        BollingerRsiStrategy s(cfg);
        assert(s.evaluate(chopThen({}, 41), Direction::LONG).type == SignalType::CLOSE_LONG);
        assert(s.evaluate(chopThen({}, 41), Direction::SHORT).type == SignalType::CLOSE_SHORT);
    }

    // optimized parameters
    {
        const auto dir = std::filesystem::temp_directory_path() / "levsim_test_models";
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);

        writeFile(dir / "BTC_15m_xgb_optimized_params.json",
                  R"({"rsiPeriod": 21, "bbStdDev": 2.5, "adxThreshold": 30, "profitTarget": 0, "note": "x"})");
        writeFile(dir / "ETH_1h_rf_optimized_params.json", R"({"rsiOversold": 25})");
        writeFile(dir / "bad_optimized_params.json", "{}");
        writeFile(dir / "other.json", "{}");
        writeFile(dir / "broken.json", "{\"rsiPeriod\": ");
        writeFile(dir / "array.json", "[1, 2]");

        auto cfg = OptimizedParameterLoader::load((dir / "BTC_15m_xgb_optimized_params.json").string());
        assert(cfg.rsi_period == 21);
        assert(cfg.bb_std_dev == 2.5);
        assert(cfg.adx_threshold == 30.0);
        assert(cfg.profit_target == 1.5);
        assert(cfg.bb_period == 20);

        BollingerRsiStrategyConfig base;
        base.bb_period = 40;
        auto missing = OptimizedParameterLoader::load((dir / "nope.json").string(), base);
        assert(missing.bb_period == 40);
        assert(missing.rsi_period == 14);

        bool threw = false;
        try {
            OptimizedParameterLoader::load((dir / "broken.json").string());
        } catch (const ConfigError&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            OptimizedParameterLoader::load((dir / "array.json").string());
        } catch (const ConfigError&) {
            threw = true;
        }
        assert(threw);

        // whole-number floats are accepted for periods, fractional ones are rejected
        BollingerRsiStrategyConfig from_json;
        OptimizedParameterLoader::apply(nlohmann::json::parse(R"({"bbPeriod": 30.0, "bbStdDev": 1.75})"), from_json);
        assert(from_json.bb_period == 30);
        assert(from_json.bb_std_dev == 1.75);

        threw = false;
        BollingerRsiStrategyConfig fractional;
        try {
            OptimizedParameterLoader::apply(nlohmann::json::parse(R"({"rsiPeriod": 14.7})"), fractional);
        } catch (const ConfigError&) {
            threw = true;
        }
        assert(threw);
        assert(fractional.rsi_period == 14);

        auto models = OptimizedParameterLoader::listAvailableModels(dir.string());
        assert(models.size() == 2);
        assert(models[0].name == "BTC_15m_xgb");
        assert(models[0].market == "BTC");
        assert(models[0].timeframe == "15m");
        assert(models[0].model_type == "xgb");
        assert(models[1].market == "ETH");

        assert(OptimizedParameterLoader::listAvailableModels((dir / "none").string()).empty());
        std::filesystem::remove_all(dir);
    }

    std::cout << "[TEST] Strategy PASSED\n";
    return 0;
}
