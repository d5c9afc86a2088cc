#include "backtest/BacktestEngine.h"
#include "backtest/DataHistory.h"
#include "backtest/PositionModel.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "risk/FixedSizePolicy.h"
#include "risk/RiskManager.h"
#include <algorithm>
#include <stdexcept>

namespace levsim {
namespace backtest {

namespace {
constexpr int ATR_PERIOD = 14;
}

BacktestEngine::BacktestEngine(const engine::EngineConfig& config,
                               std::shared_ptr<strategy::IStrategy> strategy,
                               std::unique_ptr<risk::IRiskPolicy> risk_policy)
    : config_(config)
    , strategy_(std::move(strategy))
    , risk_policy_(std::move(risk_policy))
{
    if (!strategy_) {
        throw std::invalid_argument("BacktestEngine requires a strategy");
    }
    if (!risk_policy_) {
        throw std::invalid_argument("BacktestEngine requires a risk policy");
    }
    validateConfig(config_);
    LOG_INFO("BacktestEngine initialized - {} {}, capital {:.2f}, leverage {:.1f}x, fee {:.4f}, policy {}",
             config_.market, config_.timeframe, config_.initial_capital,
             config_.leverage, config_.fee_rate, risk_policy_->name());
}

BacktestEngine::BacktestEngine(const Config& config, std::shared_ptr<strategy::IStrategy> strategy)
    : BacktestEngine(config.getEngineConfig(),
                     std::move(strategy),
                     makeRiskPolicy(config.getEngineConfig(), config.getRiskConfig()))
{
}

std::unique_ptr<risk::IRiskPolicy> BacktestEngine::makeRiskPolicy(const engine::EngineConfig& engine_config,
                                                                  const risk::RiskConfig& risk_config) {
    if (engine_config.use_risk_manager) {
        risk::RiskConfig cfg = risk_config;
        cfg.initial_capital = engine_config.initial_capital;
        cfg.trading_fee = engine_config.fee_rate;
        return std::make_unique<risk::RiskManager>(cfg);
    }
    return std::make_unique<risk::FixedSizePolicy>(engine_config.initial_capital, engine_config.position_size);
}

void BacktestEngine::validateConfig(const engine::EngineConfig& config) {
    if (!(config.initial_capital > 0.0)) {
        throw ConfigError("initial_capital must be positive");
    }
    if (!(config.leverage >= 1.0)) {
        throw ConfigError("leverage must be >= 1");
    }
    if (!(config.fee_rate >= 0.0 && config.fee_rate < 1.0)) {
        throw ConfigError("fee_rate must be in [0, 1)");
    }
    if (!(config.maintenance_margin_ratio >= 0.0 && config.maintenance_margin_ratio < 1.0)) {
        throw ConfigError("maintenance_margin_ratio must be in [0, 1)");
    }
    if (!(config.position_size >= 0.0 && config.position_size <= 1.0)) {
        throw ConfigError("position_size must be in [0, 1]");
    }
    if (!(config.profit_target >= 0.0)) {
        throw ConfigError("profit_target must be >= 0");
    }
    if (config.min_lookback_bars < 0 || config.indicator_padding_bars < 0) {
        throw ConfigError("lookback settings must be >= 0");
    }
    if (config.risk_snapshot_interval < 1) {
        throw ConfigError("risk_snapshot_interval must be >= 1");
    }
}

void BacktestEngine::loadData(const std::string& file_path) {
    setData(DataHistory::load(file_path));
}

void BacktestEngine::setData(std::vector<Candle> candles) {
    history_data_ = std::move(candles);
}

int BacktestEngine::lookbackBars() const {
    return std::max(config_.min_lookback_bars,
                    strategy_->requiredLookback() + config_.indicator_padding_bars);
}

const BacktestResult& BacktestEngine::run() {
    if (history_data_.empty()) {
        throw DataLoadError(DataErrorKind::NO_DATA, "no candles loaded for " + config_.market);
    }
    if (has_run_) {
        throw std::logic_error("BacktestEngine::run() called twice; the risk policy state is not reusable");
    }
    has_run_ = true;

    const int lookback = lookbackBars();
    LOG_INFO("Starting backtest: {} candles, lookback {} bars, strategy {}",
             history_data_.size(), lookback, strategy_->getInfo().name);

    SimulationContext ctx;
    ctx.equity = config_.initial_capital;
    ctx.peak_equity = config_.initial_capital;
    ctx.result.market = config_.market;
    ctx.result.timeframe = config_.timeframe;
    ctx.result.strategy_name = strategy_->getInfo().name;
    ctx.result.risk_policy = risk_policy_->name();
    ctx.result.initial_capital = config_.initial_capital;
    ctx.result.equity_curve.reserve(history_data_.size());

    for (std::size_t i = 0; i < history_data_.size(); ++i) {
        processBar(ctx, i, lookback);
    }

    ctx.result.final_equity = ctx.equity;
    ctx.result.bars_processed = history_data_.size();
    ctx.result.open_position = ctx.position;
    result_ = std::move(ctx.result);

    LOG_INFO("Backtest finished: {} trades, final equity {:.2f} ({:+.2f}%)",
             result_.trades.size(), result_.final_equity,
             (result_.final_equity / config_.initial_capital - 1.0) * 100.0);
    if (result_.open_position) {
        LOG_INFO("Position left open at the last bar: {} @ {:.4f}",
                 directionToString(result_.open_position->direction), result_.open_position->entry_price);
    }
    return result_;
}

void BacktestEngine::processBar(SimulationContext& ctx, std::size_t index, int lookback) {
    const Candle& candle = history_data_[index];

    // the policy may need a longer history than the strategy
    const std::size_t market_bars = std::max(static_cast<std::size_t>(lookback) + 1,
                                             risk_policy_->requiredHistoryBars());
    const std::size_t market_start = (index + 1 > market_bars) ? index + 1 - market_bars : 0;
    const std::vector<Candle> market_window(history_data_.begin() + market_start,
                                            history_data_.begin() + index + 1);

    // 1) risk state sees this bar's equity and market before any decision
    risk_policy_->updateEquity(ctx.equity, candle.timestamp);
    risk_policy_->updateMarketData(market_window);

    strategy::StrategySignal signal;
    if (index >= static_cast<std::size_t>(lookback)) {
        const std::size_t strategy_bars = static_cast<std::size_t>(lookback) + 1;
        const std::vector<Candle> window(market_window.end() - strategy_bars, market_window.end());
        std::optional<Direction> open_side;
        if (ctx.position) {
            open_side = ctx.position->direction;
        }
        signal = strategy_->evaluate(window, open_side);
    }

    // 2) exits first
    if (ctx.position) {
        checkExits(ctx, index, signal);
    }

    // 3) entries only when flat
    if (!ctx.position && signal.isEntry()) {
        tryEnter(ctx, index, signal);
    }

    // 4) bookkeeping
    appendEquityPoint(ctx, candle);

    const bool last_bar = (index + 1 == history_data_.size());
    if (index % static_cast<std::size_t>(config_.risk_snapshot_interval) == 0 || last_bar) {
        ctx.result.risk_snapshots.push_back({candle.timestamp, index, risk_policy_->getRiskStats()});
    }
}

void BacktestEngine::checkExits(SimulationContext& ctx, std::size_t index, const strategy::StrategySignal& signal) {
    const Candle& candle = history_data_[index];
    const Position& pos = *ctx.position;

    if (PositionModel::liquidationHit(candle, pos.liquidation_price, pos.direction)) {
        closePosition(ctx, index, pos.liquidation_price, ExitReason::LIQUIDATION);
        return;
    }

    if (pos.hasStopLoss() && PositionModel::stopLossHit(candle, pos.stop_loss_price, pos.direction)) {
        closePosition(ctx, index, pos.stop_loss_price, ExitReason::STOP_LOSS);
        return;
    }

    if (pos.hasTakeProfit() && PositionModel::takeProfitHit(candle, pos.take_profit_price, pos.direction)) {
        closePosition(ctx, index, pos.take_profit_price, ExitReason::TAKE_PROFIT);
        return;
    }

    const bool is_long = pos.direction == Direction::LONG;
    const bool close_signal =
        (is_long && (signal.type == strategy::SignalType::CLOSE_LONG || signal.type == strategy::SignalType::SHORT)) ||
        (!is_long && (signal.type == strategy::SignalType::CLOSE_SHORT || signal.type == strategy::SignalType::LONG));
    if (close_signal) {
        closePosition(ctx, index, candle.close, ExitReason::SIGNAL);
    }
}

void BacktestEngine::closePosition(SimulationContext& ctx, std::size_t index, Price exit_price, ExitReason reason) {
    const Candle& candle = history_data_[index];
    const Position& pos = *ctx.position;

    Trade trade;
    static_cast<Position&>(trade) = pos;
    trade.exit_price = exit_price;
    trade.exit_time = candle.timestamp;
    trade.bars_held = index - pos.entry_index;
    trade.exit_reason = reason;

    if (reason == ExitReason::LIQUIDATION) {
        trade.gross_pnl = PositionModel::liquidationLoss(pos.margin);
        trade.fees = 0.0;
        trade.pnl = trade.gross_pnl;
    } else {
        const auto pnl = PositionModel::pnl(pos.entry_price, exit_price, pos.direction,
                                            pos.size, config_.leverage, config_.fee_rate);
        trade.gross_pnl = pnl.gross;
        trade.fees = pnl.fees;
        trade.pnl = pnl.net;
    }

    ctx.equity += trade.pnl;
    ctx.position.reset();

    // 5) the next decision must see this outcome
    risk_policy_->updateEquity(ctx.equity, candle.timestamp);
    risk_policy_->recordTrade(trade);

    if (reason == ExitReason::LIQUIDATION) {
        LOG_WARN("LIQUIDATED {} @ {:.4f} (entry {:.4f}) - margin lost {:.2f}, equity {:.2f}",
                 directionToString(trade.direction), exit_price, trade.entry_price, trade.margin, ctx.equity);
    } else {
        LOG_INFO("Closed {} @ {:.4f} ({}) - pnl {:.2f} (fees {:.2f}), equity {:.2f}",
                 directionToString(trade.direction), exit_price, exitReasonToString(reason),
                 trade.pnl, trade.fees, ctx.equity);
    }
    Logger::getInstance().logTrade(config_.market, trade);

    ctx.result.trades.push_back(trade);
}

void BacktestEngine::tryEnter(SimulationContext& ctx, std::size_t index, const strategy::StrategySignal& signal) {
    const Candle& candle = history_data_[index];
    const auto direction = strategy::entryDirection(signal.type);
    if (!direction) return;

    risk::TradeCandidate candidate;
    candidate.direction = *direction;
    candidate.entry_price = candle.close;
    candidate.entry_time = candle.timestamp;

    PositionSizeRecord record;
    record.timestamp = candle.timestamp;
    record.bar_index = index;
    record.direction = *direction;
    record.price = candle.close;

    const risk::TradeRecommendation recommendation = risk_policy_->getTradeRecommendation();
    ctx.result.adjustments.push_back({candle.timestamp, index, recommendation});

    if (recommendation.action == risk::TradeAction::STOP) {
        record.sizing.reason = recommendation.reason;
        record.adjustment = 0.0;
        ctx.result.position_sizes.push_back(record);
        LOG_INFO("Entry {} skipped: trading stopped ({})", directionToString(*direction), recommendation.reason);
        return;
    }

    candidate.size_adjustment = recommendation.adjustment;
    const risk::PositionSizing sizing = risk_policy_->calculatePositionSize(candidate, config_.leverage);
    record.sizing = sizing;
    record.adjustment = recommendation.adjustment;

    if (!sizing.accepted()) {
        ctx.result.position_sizes.push_back(record);
        LOG_INFO("Entry {} skipped: {}", directionToString(*direction), sizing.reason);
        return;
    }

    Position position;
    position.direction = *direction;
    position.entry_price = candle.close;
    position.entry_time = candle.timestamp;
    position.entry_index = index;
    position.size = sizing.size * recommendation.adjustment;
    position.margin = sizing.margin * recommendation.adjustment;
    position.pyramid_level = sizing.pyramid_level;
    position.liquidation_price = PositionModel::liquidationPrice(
        position.entry_price, position.direction, config_.leverage, config_.maintenance_margin_ratio);

    const auto stop = risk_policy_->calculateStopLoss(candidate, sizing, atrAt(index));
    position.stop_loss_price = (stop && *stop > 0.0) ? *stop : 0.0;
    position.take_profit_price = resolveTakeProfit(signal, position.direction, position.entry_price);

    record.final_size = position.size;
    record.final_margin = position.margin;
    record.executed = true;
    ctx.result.position_sizes.push_back(record);

    LOG_INFO("Opened {} @ {:.4f} - margin {:.2f}, notional {:.2f}, SL {:.4f}, TP {:.4f}, liq {:.4f} ({}, x{:.2f})",
             directionToString(position.direction), position.entry_price, position.margin, position.size,
             position.stop_loss_price, position.take_profit_price, position.liquidation_price,
             sizing.reason, recommendation.adjustment);

    ctx.position = position;
}

Price BacktestEngine::resolveTakeProfit(const strategy::StrategySignal& signal,
                                        Direction direction,
                                        Price entry_price) const {
    if (signal.take_profit) {
        const Price tp = *signal.take_profit;
        const bool profitable_side = (direction == Direction::LONG) ? tp > entry_price : (tp > 0.0 && tp < entry_price);
        if (profitable_side) {
            return tp;
        }
    }
    if (config_.profit_target > 0.0 && config_.leverage > 0.0) {
        const double distance = config_.profit_target / config_.leverage;
        return entry_price * (1.0 + directionSign(direction) * distance);
    }
    return 0.0;
}

std::optional<double> BacktestEngine::atrAt(std::size_t index) const {
    if (index < static_cast<std::size_t>(ATR_PERIOD)) {
        return std::nullopt;
    }
    const std::vector<Candle> window(history_data_.begin() + (index - ATR_PERIOD),
                                     history_data_.begin() + index + 1);
    const double atr = analytics::TechnicalIndicators::calculateATR(window, ATR_PERIOD);
    if (atr <= 0.0) {
        return std::nullopt;
    }
    return atr;
}

void BacktestEngine::appendEquityPoint(SimulationContext& ctx, const Candle& candle) {
    ctx.peak_equity = std::max(ctx.peak_equity, ctx.equity);

    EquityCurvePoint point;
    point.timestamp = candle.timestamp;
    point.equity = ctx.equity;
    point.drawdown = (ctx.peak_equity > 0.0)
        ? std::max(0.0, (ctx.peak_equity - ctx.equity) / ctx.peak_equity)
        : 0.0;
    point.price = candle.close;
    if (ctx.position) {
        point.has_position = true;
        point.position_type = directionToString(ctx.position->direction);
        point.unrealized_pnl = PositionModel::unrealizedPnl(*ctx.position, candle.close);
    }
    ctx.result.equity_curve.push_back(point);
}

} // namespace backtest
} // namespace levsim
