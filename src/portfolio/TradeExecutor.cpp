#include "portfolio/TradeExecutor.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <set>

namespace finpack {
namespace portfolio {

namespace {
constexpr double QUANTITY_EPSILON = 1e-9;
constexpr double FRACTIONAL_STEP = 1e-6;   // smallest fractional share unit

void logRejection(const char* side, const Ticker& ticker, const Date& date, TradeRejection reason) {
    LOG_WARN("{} {} rejected on {}: {}", side, ticker, date, tradeRejectionToString(reason));
}
}

TradeExecutor::TradeExecutor(Portfolio& portfolio, ExecutorOptions options)
    : portfolio_(portfolio)
    , options_(options)
{
}

double TradeExecutor::lotSize(const std::string& country) const {
    if (country == COUNTRY_TW) {
        return options_.tw_lot_size > 0.0 ? options_.tw_lot_size : 1.0;
    }
    if (country == COUNTRY_US && options_.allow_fractional_us) {
        return FRACTIONAL_STEP;
    }
    return 1.0;
}

Shares TradeExecutor::quantize(Shares raw, const std::string& country) const {
    if (!(raw > 0.0)) {
        return 0.0;
    }
    const double lot = lotSize(country);
    const double lots = std::floor(raw / lot + QUANTITY_EPSILON);
    return lots * lot;
}

Shares TradeExecutor::calculateShares(double amount, Price price, const std::string& country,
                                      double exchange_rate) const {
    if (amount <= 0.0 || price <= 0.0) {
        return 0.0;
    }
    const double rate = portfolio_.exchangeRateFor(country, exchange_rate);
    return quantize(amount / rate / price, country);
}

Shares TradeExecutor::calculateMaxAffordableShares(double cash, Price price, const std::string& country,
                                                   double exchange_rate) const {
    if (cash <= 0.0 || price <= 0.0) {
        return 0.0;
    }

    // notional + max(notional * fee_rate, min_fee) <= cash
    const backtest::FeeRule fee = portfolio_.feeRuleFor(country);
    const double unit_ledger = price * portfolio_.exchangeRateFor(country, exchange_rate);
    const double notional = std::min(cash / (1.0 + fee.rate), cash - fee.min_fee);
    if (notional <= 0.0) {
        return 0.0;
    }

    Shares shares = quantize(notional / unit_ledger, country);
    const double step = lotSize(country);
    while (shares > 0.0 && estimateBuyCost(shares, price, country, exchange_rate).total > cash) {
        shares = std::max(0.0, shares - step);
    }
    return shares;
}

CostEstimate TradeExecutor::estimateBuyCost(Shares shares, Price price, const std::string& country,
                                            double exchange_rate) const {
    CostEstimate est;
    est.shares = shares;
    est.amount = shares * price;
    est.amount_ledger = est.amount * portfolio_.exchangeRateFor(country, exchange_rate);
    est.fee = portfolio_.calculateFee(est.amount_ledger, country);
    est.total = est.amount_ledger + est.fee;
    return est;
}

CostEstimate TradeExecutor::estimateSellProceeds(const Ticker& ticker, Price price, double exchange_rate,
                                                 Shares shares) const {
    CostEstimate est;
    const Position* pos = portfolio_.getPosition(ticker);
    if (pos == nullptr) {
        return est;
    }
    est.shares = (shares == 0.0) ? pos->shares : std::min(shares, pos->shares);
    est.amount = est.shares * price;
    est.amount_ledger = est.amount * portfolio_.exchangeRateFor(pos->country, exchange_rate);
    est.fee = portfolio_.calculateFee(est.amount_ledger, pos->country);
    est.total = est.amount_ledger - est.fee;
    return est;
}

TradeResult TradeExecutor::executeBuy(const Ticker& ticker, Price price, const std::string& country,
                                      const Date& date, const ExecutionOptions& opts) {
    if (price <= 0.0 || !std::isfinite(price)) {
        logRejection("BUY", ticker, date, TradeRejection::NO_PRICE);
        return TradeResult::rejected(TradeRejection::NO_PRICE);
    }

    // Adding to an existing position is never capped
    if (!portfolio_.hasPosition(ticker) && portfolio_.getPositionCount() >= options_.max_positions) {
        logRejection("BUY", ticker, date, TradeRejection::MAX_POSITIONS_REACHED);
        return TradeResult::rejected(TradeRejection::MAX_POSITIONS_REACHED);
    }

    const double amount = opts.amount.value_or(options_.amount_per_stock);
    Shares shares = calculateShares(amount, price, country, opts.exchange_rate);
    if (shares <= 0.0) {
        logRejection("BUY", ticker, date, TradeRejection::AMOUNT_TOO_SMALL);
        return TradeResult::rejected(TradeRejection::AMOUNT_TOO_SMALL);
    }

    const double cash = portfolio_.getCash();
    if (estimateBuyCost(shares, price, country, opts.exchange_rate).total > cash) {
        if (!options_.allow_partial_fill) {
            logRejection("BUY", ticker, date, TradeRejection::INSUFFICIENT_CASH);
            return TradeResult::rejected(TradeRejection::INSUFFICIENT_CASH);
        }
        shares = calculateMaxAffordableShares(cash, price, country, opts.exchange_rate);
        if (shares <= 0.0) {
            logRejection("BUY", ticker, date, TradeRejection::INSUFFICIENT_CASH);
            return TradeResult::rejected(TradeRejection::INSUFFICIENT_CASH);
        }
        LOG_INFO("Partial fill {} on {}: {} shares affordable", ticker, date, shares);
    }

    TradeResult result = portfolio_.buy(ticker, shares, price, country, date, opts.exchange_rate);
    if (!result.success) {
        logRejection("BUY", ticker, date, result.rejection);
        return result;
    }

    LOG_INFO("BUY {} {} {} @ {:.4f} cost {:.0f} fee {:.0f} | cash {:.0f}",
             date, ticker, result.trade.shares, price, result.trade.total_cost,
             result.trade.fee, portfolio_.getCash());
    Logger::getInstance().logTrade(date, ticker, "buy", price, result.trade.shares, 0.0);
    return result;
}

TradeResult TradeExecutor::executeSell(const Ticker& ticker, Price price, const Date& date,
                                       const std::string& reason, double exchange_rate, Shares shares) {
    TradeResult result = portfolio_.sell(ticker, shares, price, date, reason, exchange_rate);
    if (!result.success) {
        logRejection("SELL", ticker, date, result.rejection);
        return result;
    }

    LOG_INFO("SELL {} {} {} @ {:.4f} pnl {:.0f} ({:+.2f}%) held {}d | reason={} | cash {:.0f}",
             date, ticker, result.trade.shares, result.trade.price, result.trade.profit_ledger,
             result.trade.profit_pct, result.trade.holding_days, reason, portfolio_.getCash());
    Logger::getInstance().logTrade(date, ticker, "sell", price, result.trade.shares,
                                   result.trade.profit_ledger);
    return result;
}

RebalanceOutcome TradeExecutor::executeRebalance(const std::vector<Ticker>& targets, const PriceMap& prices,
                                                 const StockInfoMap& stock_info, const Date& date,
                                                 const ExecutionOptions& opts) {
    RebalanceOutcome outcome;
    const std::set<Ticker> target_set(targets.begin(), targets.end());

    for (const auto& ticker : portfolio_.getHoldings()) {
        if (target_set.count(ticker) > 0) {
            continue;
        }
        auto it = prices.find(ticker);
        if (it == prices.end()) {
            LOG_WARN("Rebalance skipped sell of {} on {}: no price", ticker, date);
            continue;
        }
        outcome.sells.push_back(executeSell(ticker, it->second, date, "rebalance", opts.exchange_rate));
    }

    for (const auto& ticker : targets) {
        if (portfolio_.hasPosition(ticker)) {
            continue;
        }
        auto price_it = prices.find(ticker);
        auto info_it = stock_info.find(ticker);
        if (price_it == prices.end() || info_it == stock_info.end()) {
            continue;
        }
        outcome.buys.push_back(executeBuy(ticker, price_it->second, info_it->second.country, date, opts));
    }
    return outcome;
}

} // namespace portfolio
} // namespace finpack
