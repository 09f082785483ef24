#include "portfolio/Portfolio.h"
#include "common/DateUtils.h"

#include <algorithm>
#include <cmath>

namespace finpack {
namespace portfolio {

namespace {
constexpr double SHARE_EPSILON = 1e-9;
}

Portfolio::Portfolio(double initial_capital, std::map<std::string, backtest::FeeRule> fees,
                     std::string ledger_country)
    : initial_capital_(initial_capital)
    , cash_(initial_capital)
    , total_fees_(0.0)
    , realized_profit_(0.0)
    , ledger_country_(std::move(ledger_country))
    , fees_(std::move(fees))
{
}

void Portfolio::reset() {
    cash_ = initial_capital_;
    total_fees_ = 0.0;
    realized_profit_ = 0.0;
    positions_.clear();
    trades_.clear();
    history_.clear();
}

backtest::FeeRule Portfolio::feeRuleFor(const std::string& country) const {
    auto it = fees_.find(country);
    if (it == fees_.end()) {
        it = fees_.find(COUNTRY_US);
        if (it == fees_.end()) {
            return backtest::FeeRule{};
        }
    }
    return it->second;
}

double Portfolio::calculateFee(double amount_ledger, const std::string& country) const {
    const backtest::FeeRule rule = feeRuleFor(country);
    return std::max(amount_ledger * rule.rate, rule.min_fee);
}

double Portfolio::exchangeRateFor(const std::string& country, double exchange_rate) const {
    return country == ledger_country_ ? 1.0 : exchange_rate;
}

TradeResult Portfolio::buy(const Ticker& ticker, Shares shares, Price price,
                           const std::string& country, const Date& date, double exchange_rate) {
    if (shares <= 0.0 || price <= 0.0 || !std::isfinite(shares) || !std::isfinite(price)) {
        return TradeResult::rejected(TradeRejection::INVALID_ORDER);
    }

    const double rate = exchangeRateFor(country, exchange_rate);
    const double amount = shares * price;
    const double amount_ledger = amount * rate;
    const double fee = calculateFee(amount_ledger, country);
    const double total_cost = amount_ledger + fee;

    if (total_cost > cash_) {
        return TradeResult::rejected(TradeRejection::INSUFFICIENT_CASH);
    }

    cash_ -= total_cost;
    total_fees_ += fee;

    auto it = positions_.find(ticker);
    if (it != positions_.end()) {
        Position& pos = it->second;
        const double total_shares = pos.shares + shares;
        pos.avg_cost = (pos.shares * pos.avg_cost + amount) / total_shares;
        pos.shares = total_shares;
        pos.highest_price = std::max(pos.highest_price, price);
    } else {
        Position pos;
        pos.ticker = ticker;
        pos.shares = shares;
        pos.avg_cost = price;
        pos.country = country;
        pos.entry_date = date;
        pos.highest_price = price;
        positions_[ticker] = pos;
    }

    TradeRecord record;
    record.action = TradeAction::BUY;
    record.ticker = ticker;
    record.date = date;
    record.country = country;
    record.shares = shares;
    record.price = price;
    record.amount = amount;
    record.amount_ledger = amount_ledger;
    record.exchange_rate = rate;
    record.fee = fee;
    record.total_cost = total_cost;
    trades_.push_back(record);

    TradeResult result;
    result.success = true;
    result.trade = record;
    return result;
}

TradeResult Portfolio::sell(const Ticker& ticker, Shares shares, Price price,
                            const Date& date, const std::string& reason, double exchange_rate) {
    auto it = positions_.find(ticker);
    if (it == positions_.end()) {
        return TradeResult::rejected(TradeRejection::NO_POSITION);
    }
    if (shares < 0.0 || price <= 0.0 || !std::isfinite(shares) || !std::isfinite(price)) {
        return TradeResult::rejected(TradeRejection::INVALID_ORDER);
    }

    Position& pos = it->second;
    const double sell_shares = (shares == 0.0) ? pos.shares : shares;
    if (sell_shares > pos.shares + SHARE_EPSILON) {
        return TradeResult::rejected(TradeRejection::INSUFFICIENT_SHARES);
    }

    const double rate = exchangeRateFor(pos.country, exchange_rate);
    const double amount = sell_shares * price;
    const double amount_ledger = amount * rate;
    const double fee = calculateFee(amount_ledger, pos.country);
    const double cost_basis = sell_shares * pos.avg_cost;
    const double profit = amount - cost_basis;

    cash_ += amount_ledger - fee;
    total_fees_ += fee;
    realized_profit_ += profit * rate;

    TradeRecord record;
    record.action = TradeAction::SELL;
    record.ticker = ticker;
    record.date = date;
    record.country = pos.country;
    record.shares = sell_shares;
    record.price = price;
    record.amount = amount;
    record.amount_ledger = amount_ledger;
    record.exchange_rate = rate;
    record.fee = fee;
    record.net_proceeds = amount_ledger - fee;
    record.profit = profit;
    record.profit_ledger = profit * rate;
    record.profit_pct = cost_basis > 0.0 ? profit / cost_basis * 100.0 : 0.0;
    record.entry_date = pos.entry_date;
    record.holding_days = utils::DateUtils::daysBetween(pos.entry_date, date);
    record.reason = reason;

    if (sell_shares >= pos.shares - SHARE_EPSILON) {
        positions_.erase(it);
    } else {
        pos.shares -= sell_shares;
    }

    trades_.push_back(record);

    TradeResult result;
    result.success = true;
    result.trade = record;
    return result;
}

PortfolioValue Portfolio::calculateValue(const PriceMap& prices, double exchange_rate) const {
    PortfolioValue value;
    value.cash = cash_;
    for (const auto& [ticker, pos] : positions_) {
        auto price_it = prices.find(ticker);
        const double price = (price_it != prices.end()) ? price_it->second : pos.avg_cost;
        value.position_value += pos.shares * price * exchangeRateFor(pos.country, exchange_rate);
    }
    value.total_value = value.cash + value.position_value;
    return value;
}

const EquitySnapshot& Portfolio::recordHistory(const Date& date, const PriceMap& prices,
                                               const StockInfoMap& stock_info, double exchange_rate) {
    EquitySnapshot snapshot;
    snapshot.date = date;
    snapshot.cash = cash_;

    for (const auto& [ticker, pos] : positions_) {
        auto price_it = prices.find(ticker);
        const double price = (price_it != prices.end()) ? price_it->second : pos.avg_cost;
        const double rate = exchangeRateFor(pos.country, exchange_rate);

        HoldingSnapshot holding;
        holding.shares = pos.shares;
        holding.avg_cost = pos.avg_cost;
        holding.current_price = price;
        holding.market_value = pos.shares * price * rate;
        holding.profit_pct = pos.avg_cost > 0.0 ? (price - pos.avg_cost) / pos.avg_cost * 100.0 : 0.0;
        holding.entry_date = pos.entry_date;
        holding.country = pos.country;
        holding.exchange_rate = rate;
        auto info_it = stock_info.find(ticker);
        if (info_it != stock_info.end()) {
            holding.sector = info_it->second.sector;
        }

        snapshot.holdings[ticker] = holding;
    }

    const PortfolioValue value = calculateValue(prices, exchange_rate);
    snapshot.holdings_value = value.position_value;
    snapshot.equity = value.total_value;
    snapshot.position_count = static_cast<int>(positions_.size());
    history_.push_back(std::move(snapshot));
    return history_.back();
}

void Portfolio::updatePeaks(const PriceMap& prices) {
    for (auto& [ticker, pos] : positions_) {
        auto it = prices.find(ticker);
        if (it != prices.end() && it->second > pos.highest_price) {
            pos.highest_price = it->second;
        }
    }
}

const Position* Portfolio::getPosition(const Ticker& ticker) const {
    auto it = positions_.find(ticker);
    return it != positions_.end() ? &it->second : nullptr;
}

Position* Portfolio::findPosition(const Ticker& ticker) {
    auto it = positions_.find(ticker);
    return it != positions_.end() ? &it->second : nullptr;
}

std::vector<Ticker> Portfolio::getHoldings() const {
    std::vector<Ticker> out;
    out.reserve(positions_.size());
    for (const auto& [ticker, pos] : positions_) {
        out.push_back(ticker);
    }
    return out;
}

} // namespace portfolio
} // namespace finpack
