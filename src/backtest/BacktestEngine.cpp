#include "backtest/BacktestEngine.h"
#include "common/DateUtils.h"
#include "common/Logger.h"
#include "portfolio/Portfolio.h"
#include "portfolio/TradeExecutor.h"
#include "strategy/BuyPipeline.h"
#include "strategy/RankingContext.h"
#include "strategy/RebalanceStrategies.h"
#include "strategy/SellConditionSet.h"

#include <algorithm>
#include <exception>
#include <sstream>

namespace finpack {
namespace backtest {

namespace {
// Resets the running flag on every exit path of run()
class RunningGuard {
public:
    explicit RunningGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~RunningGuard() { flag_.store(false); }
    RunningGuard(const RunningGuard&) = delete;
    RunningGuard& operator=(const RunningGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

std::string joinErrors(const std::vector<std::string>& errors) {
    std::ostringstream oss;
    for (size_t i = 0; i < errors.size(); ++i) {
        if (i > 0) {
            oss << "; ";
        }
        oss << errors[i];
    }
    return oss.str();
}

portfolio::ExecutorOptions executorOptionsFrom(const BacktestConfig& config) {
    portfolio::ExecutorOptions opts;
    opts.amount_per_stock = config.amount_per_stock;
    opts.max_positions = config.max_positions;
    opts.allow_partial_fill = config.allow_partial_fill;
    opts.allow_fractional_us = config.allow_fractional_us;
    opts.tw_lot_size = config.tw_lot_size;
    opts.default_exchange_rate = config.default_exchange_rate;
    return opts;
}
}

std::string engineStateToString(EngineState state) {
    switch (state) {
        case EngineState::NOT_STARTED: return "not_started";
        case EngineState::RUNNING: return "running";
        case EngineState::COMPLETED: return "completed";
        case EngineState::FAILED: return "failed";
        default: return "unknown";
    }
}

std::string runErrorToString(RunError error) {
    switch (error) {
        case RunError::NONE: return "none";
        case RunError::ALREADY_RUNNING: return "already_running";
        case RunError::INVALID_INPUT: return "invalid_input";
        case RunError::NO_TRADING_DAYS: return "no_trading_days";
        case RunError::MALFORMED_INPUT: return "malformed_input";
        case RunError::INTERNAL: return "internal";
        default: return "unknown";
    }
}

BacktestEngine::BacktestEngine(BacktestConfig config)
    : config_(std::move(config))
    , running_(false)
    , state_(EngineState::NOT_STARTED)
{
}

BacktestResult BacktestEngine::run(const MarketData& data) {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        LOG_WARN("Backtest run rejected: another run is in progress");
        return BacktestResult::failure(RunError::ALREADY_RUNNING, "a backtest is already running");
    }
    RunningGuard guard(running_);
    state_.store(EngineState::RUNNING);

    BacktestResult result;
    try {
        result = simulate(data);
    } catch (const std::exception& e) {
        LOG_ERROR("Backtest failed: {}", e.what());
        result = BacktestResult::failure(RunError::INTERNAL, std::string("internal error: ") + e.what());
    }

    state_.store(result.success ? EngineState::COMPLETED : EngineState::FAILED);
    return result;
}

std::vector<Date> BacktestEngine::resolveTradingDates(const MarketData& data, DateMetadata& meta) const {
    meta.configured_start = config_.start_date;
    meta.configured_end = config_.end_date;
    meta.available_dates = static_cast<int>(data.dates.size());

    std::vector<Date> dates;
    for (const auto& d : data.dates) {
        if (d < config_.start_date) {
            continue;
        }
        if (!config_.end_date.empty() && d > config_.end_date) {
            break;
        }
        dates.push_back(d);
    }
    if (dates.empty()) {
        return dates;
    }

    meta.actual_start = dates.front();
    meta.actual_end = dates.back();
    meta.start_adjusted = meta.actual_start != config_.start_date;
    meta.end_adjusted = !config_.end_date.empty() && meta.actual_end != config_.end_date;
    meta.trading_days = static_cast<int>(dates.size());

    if (meta.start_adjusted) {
        LOG_WARN("Start date {} is not a trading day, using {}", config_.start_date, meta.actual_start);
    }
    if (meta.end_adjusted) {
        LOG_WARN("End date {} is not a trading day, using {}", config_.end_date, meta.actual_end);
    }
    return dates;
}

bool BacktestEngine::isRebalanceDay(const Date& date, const Date& previous, bool first_day) const {
    if (first_day) {
        return true;
    }
    switch (config_.rebalance_frequency) {
        case RebalanceFrequency::DAILY:
            return true;
        case RebalanceFrequency::WEEKLY:
            return utils::DateUtils::weekKey(date) != utils::DateUtils::weekKey(previous);
        case RebalanceFrequency::MONTHLY:
            return utils::DateUtils::monthKey(date) != utils::DateUtils::monthKey(previous);
        default:
            return false;
    }
}

BacktestResult BacktestEngine::simulate(const MarketData& data) {
    const auto config_errors = config_.validate();
    if (!config_errors.empty()) {
        LOG_ERROR("Invalid backtest configuration: {}", joinErrors(config_errors));
        return BacktestResult::failure(RunError::INVALID_INPUT, joinErrors(config_errors));
    }
    const auto data_errors = data.validate();
    if (!data_errors.empty()) {
        LOG_ERROR("Malformed market data: {}", joinErrors(data_errors));
        return BacktestResult::failure(RunError::MALFORMED_INPUT, joinErrors(data_errors));
    }

    BacktestResult result;
    const auto dates = resolveTradingDates(data, result.date_metadata);
    if (dates.empty()) {
        std::string message = "no trading days between " + config_.start_date + " and " +
                              (config_.end_date.empty() ? std::string("the last available date") : config_.end_date);
        LOG_ERROR("{}", message);
        auto failure = BacktestResult::failure(RunError::NO_TRADING_DAYS, message);
        failure.date_metadata = result.date_metadata;
        return failure;
    }

    const strategy::RankingContext rankings(data, config_.market);
    const auto pipeline = strategy::BuyPipeline::fromConfig(config_.buy_conditions);
    const auto sell_set = strategy::SellConditionSet::fromConfig(config_.sell_conditions);
    const auto rebalance = strategy::createRebalanceStrategy(config_.rebalance);
    if (!rebalance) {
        return BacktestResult::failure(RunError::INVALID_INPUT,
                                       "unknown rebalance strategy: " + config_.rebalance.type);
    }

    portfolio::Portfolio book(config_.initial_capital, config_.fees);
    portfolio::TradeExecutor executor(book, executorOptionsFrom(config_));

    LOG_INFO("Backtest {} ~ {} ({} days) market={} capital={:.0f} rebalance={}/{}",
             dates.front(), dates.back(), dates.size(), config_.market, config_.initial_capital,
             rebalance->getId(), rebalanceFrequencyToString(config_.rebalance_frequency));
    LOG_INFO("Buy conditions: {} | sell conditions: {}", pipeline.size(), sell_set.getConditionIds().size());

    const int total_days = static_cast<int>(dates.size());
    for (int day = 0; day < total_days; ++day) {
        const Date& date = dates[day];
        const double fx = data.exchangeRateOn(date, config_.default_exchange_rate);
        const PriceMap prices = data.pricesOn(date);
        book.updatePeaks(prices);

        const strategy::EvaluationContext ctx{rankings, date, prices, data.stock_info,
                                              result.selection_history, fx};
        portfolio::ExecutionOptions exec_opts;
        exec_opts.exchange_rate = fx;

        // (1) sells: every condition sees every position before any sell executes
        std::vector<std::pair<Ticker, std::string>> to_sell;
        for (const auto& ticker : book.getHoldings()) {
            auto* position = book.findPosition(ticker);
            if (!position) {
                continue;
            }
            auto decision = sell_set.evaluate(ticker, *position, ctx);
            if (decision.should_sell) {
                to_sell.emplace_back(ticker, decision.reason);
            }
        }
        for (const auto& [ticker, reason] : to_sell) {
            auto it = prices.find(ticker);
            if (it == prices.end()) {
                LOG_WARN("Sell of {} on {} skipped: no price", ticker, date);
                continue;
            }
            executor.executeSell(ticker, it->second, date, reason, fx);
        }

        // (2) candidates
        const auto candidates = pipeline.select(ctx);
        result.selection_history[date] = candidates;

        // (3) rebalance gate; the cadence only limits the rebalance itself
        const bool rebalance_day = isRebalanceDay(date, day > 0 ? dates[day - 1] : date, day == 0);
        const auto holdings = book.getHoldings();
        const strategy::RebalanceContext rctx{holdings, candidates, ctx};
        const bool authorized = rebalance->shouldRebalance(rctx);
        if (authorized && rebalance_day) {
            rebalance->execute(executor, candidates, prices, data.stock_info, date, exec_opts);
            result.last_rebalance_date = date;
        }

        // (4) open slots, including those freed by today's sells
        if (authorized && rebalance->fillsOpenSlots()) {
            for (const auto& ticker : candidates) {
                if (book.getPositionCount() >= config_.max_positions) {
                    break;
                }
                if (book.hasPosition(ticker)) {
                    continue;
                }
                auto price_it = prices.find(ticker);
                auto info_it = data.stock_info.find(ticker);
                if (price_it == prices.end() || info_it == data.stock_info.end()) {
                    continue;
                }
                executor.executeBuy(ticker, price_it->second, info_it->second.country, date, exec_opts);
            }
        }

        // (5) snapshot
        const auto& snapshot = book.recordHistory(date, prices, data.stock_info, fx);
        if (progress_callback_) {
            Progress progress;
            progress.day_index = day + 1;
            progress.total_days = total_days;
            progress.date = date;
            progress.equity = snapshot.equity;
            progress_callback_(progress);
        }
    }

    result.equity_curve = book.getEquityCurve();
    result.trades = book.getTradeLog();
    result.metrics = analytics::PerformanceReport::calculate(result.equity_curve, result.trades,
                                                             config_.initial_capital);

    const Date& last_date = dates.back();
    const double last_fx = data.exchangeRateOn(last_date, config_.default_exchange_rate);
    for (const auto& [ticker, pos] : book.getPositions()) {
        FinalPosition fp;
        fp.ticker = ticker;
        fp.country = pos.country;
        auto info_it = data.stock_info.find(ticker);
        if (info_it != data.stock_info.end()) {
            fp.sector = info_it->second.sector;
        }
        fp.shares = pos.shares;
        fp.avg_cost = pos.avg_cost;
        fp.last_price = data.priceOn(ticker, last_date).value_or(pos.avg_cost);
        fp.exchange_rate = book.exchangeRateFor(pos.country, last_fx);
        fp.market_value = fp.shares * fp.last_price * fp.exchange_rate;
        fp.profit_pct = pos.avg_cost > 0.0 ? (fp.last_price - pos.avg_cost) / pos.avg_cost * 100.0 : 0.0;
        fp.entry_date = pos.entry_date;
        result.final_positions.push_back(fp);
    }

    if (data.benchmark) {
        result.benchmark = analytics::calculateBenchmarkCurve(*data.benchmark, dates, data,
                                                              config_.initial_capital,
                                                              config_.default_exchange_rate);
    }

    result.success = true;
    LOG_INFO("Backtest completed: equity {:.0f} ({:+.2f}%), {} trades, {} open positions",
             result.metrics.final_equity, result.metrics.total_return_pct, result.trades.size(),
             result.final_positions.size());
    return result;
}

} // namespace backtest
} // namespace finpack
