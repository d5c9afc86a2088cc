#include "backtest/BacktestEngine.h"
#include "backtest/PerformanceReport.h"
#include "backtest/ResultWriter.h"
#include "backtest/DataHistory.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/PathUtils.h"
#include "strategy/BollingerRsiStrategy.h"
#include "strategy/OptimizedParameterLoader.h"
#include <iostream>
#include <limits>
#include <memory>
#include <string>

using namespace levsim;

namespace {

struct CliOptions {
    std::string data_path;
    std::string config_path = "config/config.json";
    std::string params_path;
    std::string output_dir;
    std::string models_dir;
    double initial_capital = -1.0;
    long long start_ms = std::numeric_limits<long long>::min();
    long long end_ms = std::numeric_limits<long long>::max();
};

void printUsage() {
    std::cout
        << "Usage: levsim --data <candles.csv|json> [options]\n"
        << "  --config <file>            JSON config (default config/config.json)\n"
        << "  --params <file>            optimized strategy parameters\n"
        << "  --out <dir>                result directory (default from config)\n"
        << "  --initial-capital <value>  override backtest.initial_capital\n"
        << "  --start <ms> --end <ms>    restrict candles to a time window\n"
        << "  --list-models <dir>        list optimized parameter files and exit\n";
}

// Returns false on a malformed command line
bool parseArgs(int argc, char* argv[], CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = (i + 1 < argc);

        if (arg == "--help" || arg == "-h") {
            return false;
        }
        if (!has_value) {
            std::cerr << "Missing value for " << arg << "\n";
            return false;
        }

        const std::string value = argv[++i];
        try {
            if (arg == "--data") opts.data_path = value;
            else if (arg == "--config") opts.config_path = value;
            else if (arg == "--params") opts.params_path = value;
            else if (arg == "--out") opts.output_dir = value;
            else if (arg == "--list-models") opts.models_dir = value;
            else if (arg == "--initial-capital") opts.initial_capital = std::stod(value);
            else if (arg == "--start") opts.start_ms = std::stoll(value);
            else if (arg == "--end") opts.end_ms = std::stoll(value);
            else {
                std::cerr << "Unknown option: " << arg << "\n";
                return false;
            }
        } catch (const std::logic_error&) {
            std::cerr << "Invalid numeric value for " << arg << ": " << value << "\n";
            return false;
        }
    }
    return !opts.data_path.empty() || !opts.models_dir.empty();
}

int listModels(const std::string& dir) {
    const auto models = strategy::OptimizedParameterLoader::listAvailableModels(dir);
    if (models.empty()) {
        std::cout << "No optimized models in " << dir << "\n";
        return 0;
    }
    for (const auto& m : models) {
        std::cout << m.name << "  market=" << m.market << " timeframe=" << m.timeframe
                  << " model=" << m.model_type << "  " << m.path << "\n";
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage();
        return 1;
    }
    if (!opts.models_dir.empty()) {
        return listModels(opts.models_dir);
    }

    try {
        auto& config = Config::getInstance();
        config.load(opts.config_path);
        if (opts.initial_capital > 0.0) {
            config.setInitialCapital(opts.initial_capital);
        }

        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());

        std::cout << "\n";
        std::cout << "=============================================\n";
        std::cout << "   levsim - leveraged backtest simulator\n";
        std::cout << "=============================================\n\n";

        auto engine_config = config.getEngineConfig();
        if (!opts.output_dir.empty()) {
            engine_config.output_dir = opts.output_dir;
        }

        auto strategy_config = config.getBollingerRsiConfig();
        if (!opts.params_path.empty()) {
            strategy_config = strategy::OptimizedParameterLoader::load(opts.params_path, strategy_config);
        }
        auto strategy = std::make_shared<strategy::BollingerRsiStrategy>(strategy_config);

        const auto data_path = utils::PathUtils::resolveInputPath(opts.data_path);
        LOG_INFO("Starting backtest with file: {}", data_path.string());
        auto candles = backtest::DataHistory::load(data_path.string());
        candles = backtest::DataHistory::filterByTime(candles, opts.start_ms, opts.end_ms);

        backtest::BacktestEngine engine(
            engine_config,
            strategy,
            backtest::BacktestEngine::makeRiskPolicy(engine_config, config.getRiskConfig()));
        engine.setData(std::move(candles));

        const auto& result = engine.run();
        const auto metrics = backtest::PerformanceReport::build(result);
        backtest::PerformanceReport::log(metrics);

        backtest::ResultWriter writer(utils::PathUtils::resolveOutputPath(engine_config.output_dir));
        if (!writer.writeAll(result, metrics)) {
            LOG_ERROR("Failed to write results to {}", writer.getOutputDir().string());
            return 1;
        }

        LOG_INFO("Program terminated");
        return 0;
    } catch (const ConfigError& e) {
        LOG_ERROR("Fatal: {}", e.what());
        std::cerr << e.what() << std::endl;
        return 1;
    } catch (const DataLoadError& e) {
        LOG_ERROR("Fatal: {}", e.what());
        std::cerr << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
