#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"
#include "risk/RiskTypes.h"
#include "strategy/StrategyConfig.h"

namespace levsim {

class Config {
public:
    static Config& getInstance();

    // Missing file keeps defaults; unreadable or invalid content throws ConfigError
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);
    void resetToDefaults();

    double getInitialCapital() const { return engine_config_.initial_capital; }
    void setInitialCapital(double v) { engine_config_.initial_capital = v; risk_config_.initial_capital = v; }
    double getLeverage() const { return engine_config_.leverage; }
    double getFeeRate() const { return engine_config_.fee_rate; }
    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }

    engine::EngineConfig getEngineConfig() const { return engine_config_; }
    risk::RiskConfig getRiskConfig() const { return risk_config_; }
    strategy::BollingerRsiStrategyConfig getBollingerRsiConfig() const { return bollinger_rsi_config_; }

private:
    Config() = default;
    void validate() const;

    std::string log_level_ = "info";
    std::string log_dir_ = "logs";

    engine::EngineConfig engine_config_;
    risk::RiskConfig risk_config_;
    strategy::BollingerRsiStrategyConfig bollinger_rsi_config_;
};

} // namespace levsim
