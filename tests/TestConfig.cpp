#include "common/Config.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace levsim;

namespace {

bool throwsConfigError(const nlohmann::json& j) {
    Config::getInstance().resetToDefaults();
    try {
        Config::getInstance().loadFromJson(j);
    } catch (const ConfigError&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    Config& config = Config::getInstance();

    // defaults
    {
        config.resetToDefaults();
        const auto engine = config.getEngineConfig();
        const auto risk = config.getRiskConfig();
        const auto bb = config.getBollingerRsiConfig();
        assert(engine.initial_capital == 10000.0);
        assert(engine.leverage == 5.0);
        assert(engine.fee_rate == 0.001);
        assert(engine.use_risk_manager);
        assert(risk.max_risk_per_trade == 0.02);
        assert(risk.max_drawdown == 0.25);
        assert(risk.pyramiding_levels == 3);
        assert(risk.initial_capital == engine.initial_capital);
        assert(bb.rsi_period == 14);
        assert(bb.profit_target == 1.5);
        assert(config.getLogLevel() == "info");
    }

    // sections override only what they name
    {
        config.resetToDefaults();
        nlohmann::json j = {
            {"backtest", {{"initial_capital", 1000.0}, {"leverage", 10.0}, {"market", "ETH-PERP"}}},
            {"risk", {{"use_kelly_criterion", true}, {"max_open_positions", 2}}},
            {"strategy", {{"bollinger_rsi", {{"bb_period", 30}, {"adx_threshold", 20.0}}}}},
            {"logging", {{"level", "debug"}}}
        };
        config.loadFromJson(j);

        const auto engine = config.getEngineConfig();
        assert(engine.initial_capital == 1000.0);
        assert(engine.leverage == 10.0);
        assert(engine.market == "ETH-PERP");
        assert(engine.timeframe == "15m");
        assert(config.getLeverage() == 10.0);

        const auto risk = config.getRiskConfig();
        assert(risk.use_kelly_criterion);
        assert(risk.max_open_positions == 2);
        assert(risk.initial_capital == 1000.0);
        assert(risk.trading_fee == engine.fee_rate);
        assert(risk.kelly_fraction == 0.5);

        const auto bb = config.getBollingerRsiConfig();
        assert(bb.bb_period == 30);
        assert(bb.adx_threshold == 20.0);
        assert(bb.rsi_period == 14);

        assert(config.getLogLevel() == "debug");
        assert(config.getLogDir() == "logs");

        config.setInitialCapital(2500.0);
        assert(config.getInitialCapital() == 2500.0);
        assert(config.getRiskConfig().initial_capital == 2500.0);
    }

    // out-of-domain values
    {
        assert(throwsConfigError({{"backtest", {{"initial_capital", 0.0}}}}));
        assert(throwsConfigError({{"backtest", {{"leverage", 0.5}}}}));
        assert(throwsConfigError({{"backtest", {{"fee_rate", -0.001}}}}));
        assert(throwsConfigError({{"backtest", {{"leverage", "high"}}}}));
        assert(throwsConfigError({{"risk", {{"max_drawdown", 1.5}}}}));
        assert(throwsConfigError({{"risk", {{"volatility_window", 1}}}}));
        assert(throwsConfigError({{"risk", {{"pyramiding_levels", 0}}}}));
        assert(throwsConfigError({{"strategy", {{"bollinger_rsi", {{"rsi_period", 1}}}}}}));
        assert(!throwsConfigError({{"risk", {{"max_drawdown", 1.0}}}}));
    }

    // files
    {
        const auto dir = std::filesystem::temp_directory_path() / "levsim_test_config";
        std::filesystem::create_directories(dir);

        config.resetToDefaults();
        config.load((dir / "does_not_exist.json").string());
        assert(config.getInitialCapital() == 10000.0);

        const auto good = dir / "good.json";
        {
            std::ofstream out(good);
            out << R"({"backtest": {"initial_capital": 500, "fee_rate": 0.0005}})";
        }
        config.load(good.string());
        assert(config.getInitialCapital() == 500.0);
        assert(config.getFeeRate() == 0.0005);

        const auto bad = dir / "bad.json";
        {
            std::ofstream out(bad);
            out << "{ \"backtest\": { \"initial_capital\": ";
        }
        bool threw = false;
        try {
            config.load(bad.string());
        } catch (const ConfigError&) {
            threw = true;
        }
        assert(threw);

        std::filesystem::remove_all(dir);
    }

    config.resetToDefaults();
    std::cout << "[TEST] Config PASSED\n";
    return 0;
}
