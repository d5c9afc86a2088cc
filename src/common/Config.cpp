#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/PathUtils.h"

#include <filesystem>
#include <fstream>

namespace levsim {

namespace {
void requireRange(const char* name, double value, double lo, double hi) {
    if (!(value >= lo && value <= hi)) {
        throw ConfigError(std::string(name) + " out of range: " + std::to_string(value));
    }
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::resetToDefaults() {
    log_level_ = "info";
    log_dir_ = "logs";
    engine_config_ = engine::EngineConfig();
    risk_config_ = risk::RiskConfig();
    risk_config_.initial_capital = engine_config_.initial_capital;
    risk_config_.trading_fee = engine_config_.fee_rate;
    bollinger_rsi_config_ = strategy::BollingerRsiStrategyConfig();
}

void Config::load(const std::string& path) {
    const auto config_path = utils::PathUtils::resolveInputPath(path);

    if (!std::filesystem::exists(config_path)) {
        LOG_WARN("Config file not found: {} - using defaults", config_path.string());
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw ConfigError("cannot open " + config_path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("cannot parse " + config_path.string() + ": " + e.what());
    }

    loadFromJson(j);
    LOG_INFO("Config loaded: {} (capital={:.2f}, leverage={:.1f}x, fee={:.4f})",
             config_path.string(), engine_config_.initial_capital,
             engine_config_.leverage, engine_config_.fee_rate);
}

void Config::loadFromJson(const nlohmann::json& j) {
    try {
        if (j.contains("backtest")) {
            auto& b = j["backtest"];
            engine_config_.market = b.value("market", engine_config_.market);
            engine_config_.timeframe = b.value("timeframe", engine_config_.timeframe);
            engine_config_.initial_capital = b.value("initial_capital", engine_config_.initial_capital);
            engine_config_.leverage = b.value("leverage", engine_config_.leverage);
            engine_config_.fee_rate = b.value("fee_rate", engine_config_.fee_rate);
            engine_config_.maintenance_margin_ratio =
                b.value("maintenance_margin_ratio", engine_config_.maintenance_margin_ratio);
            engine_config_.position_size = b.value("position_size", engine_config_.position_size);
            engine_config_.profit_target = b.value("profit_target", engine_config_.profit_target);
            engine_config_.min_lookback_bars = b.value("min_lookback_bars", engine_config_.min_lookback_bars);
            engine_config_.indicator_padding_bars =
                b.value("indicator_padding_bars", engine_config_.indicator_padding_bars);
            engine_config_.risk_snapshot_interval =
                b.value("risk_snapshot_interval", engine_config_.risk_snapshot_interval);
            engine_config_.use_risk_manager = b.value("use_risk_manager", engine_config_.use_risk_manager);
            engine_config_.output_dir = b.value("output_dir", engine_config_.output_dir);
        }

        // Risk manager shares capital and fee with the engine
        risk_config_.initial_capital = engine_config_.initial_capital;
        risk_config_.trading_fee = engine_config_.fee_rate;

        if (j.contains("risk")) {
            auto& r = j["risk"];
            risk_config_.max_risk_per_trade = r.value("max_risk_per_trade", risk_config_.max_risk_per_trade);
            risk_config_.max_position_size = r.value("max_position_size", risk_config_.max_position_size);
            risk_config_.max_open_positions = r.value("max_open_positions", risk_config_.max_open_positions);
            risk_config_.max_drawdown = r.value("max_drawdown", risk_config_.max_drawdown);
            risk_config_.use_volatility_adjustment =
                r.value("use_volatility_adjustment", risk_config_.use_volatility_adjustment);
            risk_config_.volatility_window = r.value("volatility_window", risk_config_.volatility_window);
            risk_config_.pyramiding = r.value("pyramiding", risk_config_.pyramiding);
            risk_config_.pyramiding_levels = r.value("pyramiding_levels", risk_config_.pyramiding_levels);
            risk_config_.use_anti_martingale = r.value("use_anti_martingale", risk_config_.use_anti_martingale);
            risk_config_.win_multiplier = r.value("win_multiplier", risk_config_.win_multiplier);
            risk_config_.loss_multiplier = r.value("loss_multiplier", risk_config_.loss_multiplier);
            risk_config_.use_kelly_criterion = r.value("use_kelly_criterion", risk_config_.use_kelly_criterion);
            risk_config_.kelly_fraction = r.value("kelly_fraction", risk_config_.kelly_fraction);
            risk_config_.trade_history_window =
                r.value("trade_history_window", risk_config_.trade_history_window);
        }

        if (j.contains("strategy") && j["strategy"].contains("bollinger_rsi")) {
            auto& s = j["strategy"]["bollinger_rsi"];
            bollinger_rsi_config_.rsi_period = s.value("rsi_period", bollinger_rsi_config_.rsi_period);
            bollinger_rsi_config_.rsi_overbought = s.value("rsi_overbought", bollinger_rsi_config_.rsi_overbought);
            bollinger_rsi_config_.rsi_oversold = s.value("rsi_oversold", bollinger_rsi_config_.rsi_oversold);
            bollinger_rsi_config_.bb_period = s.value("bb_period", bollinger_rsi_config_.bb_period);
            bollinger_rsi_config_.bb_std_dev = s.value("bb_std_dev", bollinger_rsi_config_.bb_std_dev);
            bollinger_rsi_config_.adx_period = s.value("adx_period", bollinger_rsi_config_.adx_period);
            bollinger_rsi_config_.adx_threshold = s.value("adx_threshold", bollinger_rsi_config_.adx_threshold);
            bollinger_rsi_config_.profit_target = s.value("profit_target", bollinger_rsi_config_.profit_target);
        }

        if (j.contains("logging")) {
            auto& l = j["logging"];
            log_level_ = l.value("level", log_level_);
            log_dir_ = l.value("dir", log_dir_);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid value type: ") + e.what());
    }

    validate();
}

void Config::validate() const {
    if (!(engine_config_.initial_capital > 0.0)) {
        throw ConfigError("initial_capital must be positive");
    }
    if (!(engine_config_.leverage >= 1.0)) {
        throw ConfigError("leverage must be >= 1");
    }
    requireRange("fee_rate", engine_config_.fee_rate, 0.0, 1.0);
    requireRange("maintenance_margin_ratio", engine_config_.maintenance_margin_ratio, 0.0, 1.0);
    requireRange("position_size", engine_config_.position_size, 0.0, 1.0);
    if (engine_config_.profit_target < 0.0) {
        throw ConfigError("profit_target must be >= 0");
    }
    if (engine_config_.min_lookback_bars < 0 || engine_config_.indicator_padding_bars < 0) {
        throw ConfigError("lookback settings must be >= 0");
    }
    if (engine_config_.risk_snapshot_interval < 1) {
        throw ConfigError("risk_snapshot_interval must be >= 1");
    }

    requireRange("max_risk_per_trade", risk_config_.max_risk_per_trade, 0.0, 1.0);
    requireRange("max_position_size", risk_config_.max_position_size, 0.0, 1.0);
    requireRange("max_drawdown", risk_config_.max_drawdown, 0.0, 1.0);
    requireRange("kelly_fraction", risk_config_.kelly_fraction, 0.0, 1.0);
    if (risk_config_.max_open_positions < 1) {
        throw ConfigError("max_open_positions must be >= 1");
    }
    if (risk_config_.volatility_window < 2) {
        throw ConfigError("volatility_window must be >= 2");
    }
    if (risk_config_.pyramiding_levels < 1) {
        throw ConfigError("pyramiding_levels must be >= 1");
    }
    if (risk_config_.trade_history_window < 1) {
        throw ConfigError("trade_history_window must be >= 1");
    }
    if (risk_config_.win_multiplier <= 0.0 || risk_config_.loss_multiplier <= 0.0) {
        throw ConfigError("anti-martingale multipliers must be positive");
    }

    if (bollinger_rsi_config_.rsi_period < 2 || bollinger_rsi_config_.bb_period < 2 ||
        bollinger_rsi_config_.adx_period < 2) {
        throw ConfigError("indicator periods must be >= 2");
    }
}

} // namespace levsim
