#pragma once

#include "strategy/StrategyConfig.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace levsim {
namespace strategy {

// <market>_<timeframe>_<model>_optimized_params.json
struct OptimizedModelInfo {
    std::string name;
    std::string path;
    std::string market;
    std::string timeframe;
    std::string model_type;
};

// Applies offline-optimized Bollinger/RSI parameters on top of a config
class OptimizedParameterLoader {
public:
    // Missing file: config unchanged, warning logged. Malformed file: ConfigError.
    static BollingerRsiStrategyConfig load(const std::string& path,
                                           const BollingerRsiStrategyConfig& base = BollingerRsiStrategyConfig());

    // Overwrites only the non-zero numeric fields present in params
    static void apply(const nlohmann::json& params, BollingerRsiStrategyConfig& config);

    // Sorted by name; empty when the directory does not exist
    static std::vector<OptimizedModelInfo> listAvailableModels(const std::string& dir);
};

} // namespace strategy
} // namespace levsim
