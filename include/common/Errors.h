#pragma once

#include <stdexcept>
#include <string>

namespace levsim {

// Invalid or unreadable configuration. Fatal for the run.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error("config error: " + message) {}
};

enum class DataErrorKind {
    FILE_NOT_FOUND,
    PARSE_FAILED,
    EMPTY_DATASET,
    NO_DATA
};

inline const char* dataErrorKindToString(DataErrorKind kind) {
    switch (kind) {
        case DataErrorKind::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case DataErrorKind::PARSE_FAILED: return "PARSE_FAILED";
        case DataErrorKind::EMPTY_DATASET: return "EMPTY_DATASET";
        case DataErrorKind::NO_DATA: return "NO_DATA";
    }
    return "NO_DATA";
}

// Market data could not be provided to the engine. Aborts the run, no partial results.
class DataLoadError : public std::runtime_error {
public:
    DataLoadError(DataErrorKind kind, const std::string& message)
        : std::runtime_error(std::string("market data error [") + dataErrorKindToString(kind) + "]: " + message)
        , kind_(kind) {}

    DataErrorKind kind() const { return kind_; }

private:
    DataErrorKind kind_;
};

} // namespace levsim
