#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace levsim {
namespace backtest {

// Historical candle loading. Throws DataLoadError; results are sorted by timestamp.
class DataHistory {
public:
    // timestamp,open,high,low,close[,volume]
    static std::vector<Candle> loadCSV(const std::string& file_path);

    // Array of objects with timestamp/open/high/low/close/volume or t/o/h/l/c/v keys
    static std::vector<Candle> loadJSON(const std::string& file_path);

    // Picks the loader by file extension (.json, anything else is CSV)
    static std::vector<Candle> load(const std::string& file_path);

    // Inclusive [start_ms, end_ms]
    static std::vector<Candle> filterByTime(const std::vector<Candle>& candles,
                                            long long start_ms,
                                            long long end_ms);
};

} // namespace backtest
} // namespace levsim
