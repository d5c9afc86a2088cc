#include "strategy/OptimizedParameterLoader.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/PathUtils.h"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>

namespace levsim {
namespace strategy {

namespace {

const std::string MODEL_SUFFIX = "_optimized_params.json";

void overwrite(const nlohmann::json& params, const char* key, double& field) {
    auto it = params.find(key);
    if (it == params.end() || !it->is_number()) return;
    const double value = it->get<double>();
    if (value == 0.0) return;
    field = value;
}

// Periods must be whole numbers; 14.0 is accepted, 14.7 is not
void overwrite(const nlohmann::json& params, const char* key, int& field) {
    auto it = params.find(key);
    if (it == params.end() || !it->is_number()) return;
    const double value = it->get<double>();
    if (value == 0.0) return;
    if (std::floor(value) != value || std::abs(value) > std::numeric_limits<int>::max()) {
        throw ConfigError(std::string(key) + " must be an integer: " + it->dump());
    }
    field = static_cast<int>(value);
}

} // namespace

void OptimizedParameterLoader::apply(const nlohmann::json& params, BollingerRsiStrategyConfig& config) {
    if (!params.is_object()) {
        throw ConfigError("optimized parameters must be a JSON object");
    }
    overwrite(params, "rsiPeriod", config.rsi_period);
    overwrite(params, "rsiOverbought", config.rsi_overbought);
    overwrite(params, "rsiOversold", config.rsi_oversold);
    overwrite(params, "bbPeriod", config.bb_period);
    overwrite(params, "bbStdDev", config.bb_std_dev);
    overwrite(params, "adxPeriod", config.adx_period);
    overwrite(params, "adxThreshold", config.adx_threshold);
    overwrite(params, "profitTarget", config.profit_target);
}

BollingerRsiStrategyConfig OptimizedParameterLoader::load(const std::string& path,
                                                          const BollingerRsiStrategyConfig& base) {
    BollingerRsiStrategyConfig config = base;

    const auto resolved = utils::PathUtils::resolveInputPath(path);
    if (!std::filesystem::exists(resolved)) {
        LOG_WARN("No optimized parameters at {}, using defaults", path);
        return config;
    }

    std::ifstream file(resolved);
    if (!file.is_open()) {
        throw ConfigError("cannot open optimized parameters: " + resolved.string());
    }

    nlohmann::json params;
    try {
        file >> params;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("malformed optimized parameters " + resolved.string() + ": " + e.what());
    }

    apply(params, config);

    LOG_INFO("Applied optimized parameters from {} - RSI({}) {:.1f}/{:.1f}, BB({}, {:.2f}), ADX({}) < {:.1f}, TP {:.2f}%",
             resolved.string(),
             config.rsi_period, config.rsi_oversold, config.rsi_overbought,
             config.bb_period, config.bb_std_dev,
             config.adx_period, config.adx_threshold, config.profit_target);
    return config;
}

std::vector<OptimizedModelInfo> OptimizedParameterLoader::listAvailableModels(const std::string& dir) {
    std::vector<OptimizedModelInfo> models;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return models;
    }

    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file()) continue;
        const std::string file = entry.path().filename().string();
        if (file.size() <= MODEL_SUFFIX.size() ||
            file.compare(file.size() - MODEL_SUFFIX.size(), MODEL_SUFFIX.size(), MODEL_SUFFIX) != 0) {
            continue;
        }

        const std::string name = file.substr(0, file.size() - MODEL_SUFFIX.size());
        std::vector<std::string> parts;
        size_t start = 0;
        while (true) {
            const size_t pos = name.find('_', start);
            parts.push_back(name.substr(start, pos - start));
            if (pos == std::string::npos) break;
            start = pos + 1;
        }
        if (parts.size() < 3) continue;

        OptimizedModelInfo info;
        info.name = name;
        info.path = entry.path().string();
        info.market = parts[0];
        info.timeframe = parts[1];
        info.model_type = parts[2];
        models.push_back(info);
    }
    if (ec) {
        LOG_WARN("Error listing optimized models in {}: {}", dir, ec.message());
    }

    std::sort(models.begin(), models.end(), [](const OptimizedModelInfo& a, const OptimizedModelInfo& b) {
        return a.name < b.name;
    });
    return models;
}

} // namespace strategy
} // namespace levsim
