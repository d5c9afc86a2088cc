#pragma once

#include "common/Types.h"
#include <optional>
#include <string>
#include <vector>

namespace levsim {
namespace strategy {

enum class SignalType {
    NONE,
    LONG,           // open long
    SHORT,          // open short
    CLOSE_LONG,
    CLOSE_SHORT
};

inline const char* signalTypeToString(SignalType type) {
    switch (type) {
        case SignalType::NONE: return "NONE";
        case SignalType::LONG: return "LONG";
        case SignalType::SHORT: return "SHORT";
        case SignalType::CLOSE_LONG: return "CLOSE_LONG";
        case SignalType::CLOSE_SHORT: return "CLOSE_SHORT";
    }
    return "NONE";
}

struct StrategySignal {
    SignalType type;
    std::optional<Price> take_profit;
    std::string reason;

    StrategySignal() : type(SignalType::NONE) {}
    StrategySignal(SignalType t, std::string why = "")
        : type(t), reason(std::move(why)) {}

    bool isEntry() const { return type == SignalType::LONG || type == SignalType::SHORT; }
};

// > 0 -> LONG, < 0 -> SHORT, otherwise NONE
inline SignalType signalFromDirection(double direction) {
    if (direction > 0.0) return SignalType::LONG;
    if (direction < 0.0) return SignalType::SHORT;
    return SignalType::NONE;
}

inline std::optional<Direction> entryDirection(SignalType type) {
    if (type == SignalType::LONG) return Direction::LONG;
    if (type == SignalType::SHORT) return Direction::SHORT;
    return std::nullopt;
}

struct StrategyInfo {
    std::string name;
    std::string description;
    std::string timeframe;

    StrategyInfo() = default;
};

// Signal source for the backtest engine. evaluate() sees only candles up to
// and including the current bar.
class IStrategy {
public:
    virtual ~IStrategy() = default;

    virtual StrategyInfo getInfo() const = 0;

    // Minimum number of candles evaluate() needs to produce a signal
    virtual int requiredLookback() const = 0;

    // open_side is the direction of the engine's open position, if any
    virtual StrategySignal evaluate(const std::vector<Candle>& window,
                                    std::optional<Direction> open_side) = 0;
};

} // namespace strategy
} // namespace levsim
