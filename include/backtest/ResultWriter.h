#pragma once

#include "backtest/BacktestTypes.h"
#include "backtest/PerformanceReport.h"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace levsim {
namespace backtest {

// JSON encoding of run records
nlohmann::json toJson(const Position& position);
nlohmann::json toJson(const Trade& trade);
nlohmann::json toJson(const EquityCurvePoint& point);
nlohmann::json toJson(const PositionSizeRecord& record);
nlohmann::json toJson(const AdjustmentRecord& record);
nlohmann::json toJson(const RiskSnapshot& snapshot);
nlohmann::json toJson(const risk::RiskStats& stats);
nlohmann::json toJson(const PerformanceMetrics& metrics);

// Persists a finished run as pretty-printed JSON files in one directory
class ResultWriter {
public:
    explicit ResultWriter(std::filesystem::path output_dir);

    // backtest_trades.json, equity_curve.json, trade_statistics.json,
    // risk_statistics.json, position_sizes.json, risk_adjustments.json.
    // false if any file could not be written.
    bool writeAll(const BacktestResult& result, const PerformanceMetrics& metrics) const;

    // Write via temp file + rename
    bool writeJsonFile(const std::string& file_name, const nlohmann::json& content) const;

    const std::filesystem::path& getOutputDir() const { return output_dir_; }

private:
    std::filesystem::path output_dir_;
};

} // namespace backtest
} // namespace levsim
