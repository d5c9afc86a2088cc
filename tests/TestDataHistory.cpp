#include "backtest/DataHistory.h"
#include "common/Errors.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

using namespace levsim;
using levsim::backtest::DataHistory;

namespace {

std::filesystem::path writeFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
    return path;
}

DataErrorKind loadErrorKind(const std::filesystem::path& path) {
    try {
        DataHistory::load(path.string());
    } catch (const DataLoadError& e) {
        return e.kind();
    }
    assert(false && "expected DataLoadError");
    return DataErrorKind::NO_DATA;
}

} // namespace

int main() {
    const auto dir = std::filesystem::temp_directory_path() / "levsim_test_data";
    std::filesystem::create_directories(dir);

    // CSV: BOM header, quoted cells, bad row, missing volume, unsorted
    {
        const auto path = writeFile(dir / "candles.csv",
            "\xEF\xBB\xBFtimestamp,open,high,low,close,volume\n"
            "120000,101,103,100,102,5\n"
            "\"60000\",\"100\",\"102\",\"99\",\"101\",\"7\"\n"
            "180000,abc,1,1,1,1\n"
            "240000,102,104,101,103\n"
            "\n");
        auto candles = DataHistory::loadCSV(path.string());
        assert(candles.size() == 3);
        assert(candles[0].timestamp == 60000);
        assert(candles[0].close == 101.0);
        assert(candles[0].volume == 7.0);
        assert(candles[1].timestamp == 120000);
        assert(candles[2].timestamp == 240000);
        assert(candles[2].volume == 0.0);

        auto same = DataHistory::load(path.string());
        assert(same.size() == 3);
    }

    // JSON: long and short keys, numeric strings
    {
        const auto path = writeFile(dir / "candles.json", R"([
            {"timestamp": 2000, "open": 10, "high": 12, "low": 9, "close": 11, "volume": 3},
            {"t": 1000, "o": "9.5", "h": "10.5", "l": "9", "c": "10"}
        ])");
        auto candles = DataHistory::loadJSON(path.string());
        assert(candles.size() == 2);
        assert(candles[0].timestamp == 1000);
        assert(candles[0].open == 9.5);
        assert(candles[0].close == 10.0);
        assert(candles[0].volume == 0.0);
        assert(candles[1].high == 12.0);
        assert(DataHistory::load(path.string()).size() == 2);
    }

    // classified failures
    {
        assert(loadErrorKind(dir / "missing.csv") == DataErrorKind::FILE_NOT_FOUND);
        assert(loadErrorKind(writeFile(dir / "header_only.csv", "timestamp,open,high,low,close\n"))
               == DataErrorKind::EMPTY_DATASET);
        assert(loadErrorKind(writeFile(dir / "broken.json", "[{\"t\": 1,")) == DataErrorKind::PARSE_FAILED);
        assert(loadErrorKind(writeFile(dir / "object.json", "{\"t\": 1}")) == DataErrorKind::PARSE_FAILED);
        assert(loadErrorKind(writeFile(dir / "no_close.json", "[{\"t\": 1, \"o\": 1, \"h\": 1, \"l\": 1}]"))
               == DataErrorKind::PARSE_FAILED);
        assert(loadErrorKind(writeFile(dir / "text_price.json",
                                       "[{\"t\": 1, \"o\": \"x\", \"h\": 1, \"l\": 1, \"c\": 1}]"))
               == DataErrorKind::PARSE_FAILED);
        assert(loadErrorKind(writeFile(dir / "empty.json", "[]")) == DataErrorKind::EMPTY_DATASET);
    }

    // inclusive time window
    {
        std::vector<Candle> candles;
        for (int i = 0; i < 10; ++i) {
            candles.emplace_back(1, 1, 1, 1, 1, i * 1000LL);
        }
        auto filtered = DataHistory::filterByTime(candles, 2000, 5000);
        assert(filtered.size() == 4);
        assert(filtered.front().timestamp == 2000);
        assert(filtered.back().timestamp == 5000);
        assert(DataHistory::filterByTime(candles, 20000, 30000).empty());
    }

    std::filesystem::remove_all(dir);
    std::cout << "[TEST] DataHistory PASSED\n";
    return 0;
}
