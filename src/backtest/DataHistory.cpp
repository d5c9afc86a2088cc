#include "backtest/DataHistory.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <type_traits>

namespace levsim {
namespace backtest {

namespace {

std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // UTF-8 BOM on the first cell
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

void sortByTime(std::vector<Candle>& candles) {
    std::stable_sort(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.timestamp < b.timestamp;
    });
}

std::ifstream openOrThrow(const std::string& file_path) {
    if (!std::filesystem::exists(file_path)) {
        throw DataLoadError(DataErrorKind::FILE_NOT_FOUND, file_path);
    }
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw DataLoadError(DataErrorKind::FILE_NOT_FOUND, "cannot open " + file_path);
    }
    return file;
}

// Number or numeric string under the long key, else the short key
template<typename T>
bool readField(const nlohmann::json& item, const char* long_key, const char* short_key, T& out) {
    const char* keys[] = {long_key, short_key};
    for (const char* key : keys) {
        auto it = item.find(key);
        if (it == item.end() || it->is_null()) continue;
        if (it->is_number()) {
            out = it->get<T>();
            return true;
        }
        if (it->is_string()) {
            const std::string text = it->get<std::string>();
            if (std::is_integral<T>::value) {
                out = static_cast<T>(std::stoll(text));
            } else {
                out = static_cast<T>(std::stod(text));
            }
            return true;
        }
    }
    return false;
}

} // namespace

std::vector<Candle> DataHistory::loadCSV(const std::string& file_path) {
    std::ifstream file = openOrThrow(file_path);

    std::vector<Candle> candles;
    std::string line;
    size_t skipped = 0;

    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.empty() || row[0].empty()) continue;
        if (!std::isdigit(static_cast<unsigned char>(row[0][0])) && row[0][0] != '-') {
            // header
            continue;
        }
        if (row.size() < 5) {
            LOG_WARN("Skipping short CSV row: {}", line);
            ++skipped;
            continue;
        }

        try {
            Candle candle;
            candle.timestamp = std::stoll(row[0]);
            candle.open = std::stod(row[1]);
            candle.high = std::stod(row[2]);
            candle.low = std::stod(row[3]);
            candle.close = std::stod(row[4]);
            candle.volume = (row.size() > 5 && !row[5].empty()) ? std::stod(row[5]) : 0.0;
            candles.push_back(candle);
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
            ++skipped;
        }
    }

    if (candles.empty()) {
        throw DataLoadError(DataErrorKind::EMPTY_DATASET, "no valid candles in " + file_path);
    }

    sortByTime(candles);
    LOG_INFO("Loaded {} candles from {} ({} rows skipped)", candles.size(), file_path, skipped);
    return candles;
}

std::vector<Candle> DataHistory::loadJSON(const std::string& file_path) {
    std::ifstream file = openOrThrow(file_path);

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw DataLoadError(DataErrorKind::PARSE_FAILED, file_path + ": " + e.what());
    }
    if (!j.is_array()) {
        throw DataLoadError(DataErrorKind::PARSE_FAILED, file_path + ": expected an array of candles");
    }

    std::vector<Candle> candles;
    candles.reserve(j.size());
    try {
        for (const auto& item : j) {
            if (!item.is_object()) {
                throw DataLoadError(DataErrorKind::PARSE_FAILED, file_path + ": candle is not an object");
            }
            Candle candle;
            const bool complete =
                readField(item, "timestamp", "t", candle.timestamp) &&
                readField(item, "open", "o", candle.open) &&
                readField(item, "high", "h", candle.high) &&
                readField(item, "low", "l", candle.low) &&
                readField(item, "close", "c", candle.close);
            if (!complete) {
                throw DataLoadError(DataErrorKind::PARSE_FAILED,
                                    file_path + ": candle missing a price field: " + item.dump());
            }
            readField(item, "volume", "v", candle.volume);
            candles.push_back(candle);
        }
    } catch (const nlohmann::json::exception& e) {
        throw DataLoadError(DataErrorKind::PARSE_FAILED, file_path + ": " + e.what());
    } catch (const std::logic_error& e) {
        // std::stod / std::stoll on a non-numeric string
        throw DataLoadError(DataErrorKind::PARSE_FAILED, file_path + ": " + e.what());
    }

    if (candles.empty()) {
        throw DataLoadError(DataErrorKind::EMPTY_DATASET, "no candles in " + file_path);
    }

    sortByTime(candles);
    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

std::vector<Candle> DataHistory::load(const std::string& file_path) {
    std::string ext = std::filesystem::path(file_path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".json") {
        return loadJSON(file_path);
    }
    return loadCSV(file_path);
}

std::vector<Candle> DataHistory::filterByTime(const std::vector<Candle>& candles,
                                              long long start_ms,
                                              long long end_ms) {
    std::vector<Candle> filtered;
    std::copy_if(candles.begin(), candles.end(), std::back_inserter(filtered),
                 [start_ms, end_ms](const Candle& c) {
                     return c.timestamp >= start_ms && c.timestamp <= end_ms;
                 });
    return filtered;
}

} // namespace backtest
} // namespace levsim
