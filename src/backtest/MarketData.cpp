#include "backtest/MarketData.h"
#include "common/DateUtils.h"

#include <cmath>

namespace finpack {
namespace backtest {

const RankingTable& MarketData::rankings(Metric metric) const {
    return metric == Metric::SHARPE ? sharpe_rank : growth_rank;
}

const ValueTable& MarketData::values(Metric metric) const {
    return metric == Metric::SHARPE ? sharpe_values : growth_values;
}

std::optional<Price> MarketData::priceOn(const Ticker& ticker, const Date& date) const {
    auto series = prices.find(ticker);
    if (series == prices.end() || series->second.empty()) {
        return std::nullopt;
    }
    auto it = series->second.upper_bound(date);
    if (it == series->second.begin()) {
        return std::nullopt;
    }
    --it;
    return it->second;
}

PriceMap MarketData::pricesOn(const Date& date) const {
    PriceMap out;
    for (const auto& [ticker, series] : prices) {
        auto it = series.upper_bound(date);
        if (it == series.begin()) {
            continue;
        }
        --it;
        out[ticker] = it->second;
    }
    return out;
}

double MarketData::exchangeRateOn(const Date& date, double fallback) const {
    auto it = exchange_rates.upper_bound(date);
    if (it == exchange_rates.begin()) {
        return fallback;
    }
    --it;
    return it->second > 0.0 ? it->second : fallback;
}

std::vector<std::string> MarketData::validate() const {
    std::vector<std::string> errors;
    if (dates.empty()) {
        errors.push_back("bundle has no trading dates");
    }
    for (size_t i = 0; i < dates.size(); ++i) {
        if (!utils::DateUtils::isValid(dates[i])) {
            errors.push_back("invalid trading date: " + dates[i]);
            break;
        }
        if (i > 0 && dates[i] <= dates[i - 1]) {
            errors.push_back("trading dates are not strictly ascending at " + dates[i]);
            break;
        }
    }
    if (stock_info.empty()) {
        errors.push_back("bundle has no stock metadata");
    }
    for (const auto& [ticker, series] : prices) {
        for (const auto& [date, price] : series) {
            if (!std::isfinite(price) || price <= 0.0) {
                errors.push_back("non-positive price for " + ticker + " on " + date);
                break;
            }
        }
    }
    return errors;
}

} // namespace backtest
} // namespace finpack
