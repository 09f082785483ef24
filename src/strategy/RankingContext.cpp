#include "strategy/RankingContext.h"

#include <algorithm>
#include <cctype>
#include <set>

namespace finpack {
namespace strategy {

namespace {
std::string upperCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

template <typename Table>
std::vector<Date> lookback(const Table& table, const Date& date, int n, bool require_date) {
    if (n <= 0) {
        return {};
    }
    auto end = table.upper_bound(date);
    if (require_date && table.find(date) == table.end()) {
        return {};
    }
    std::vector<Date> out;
    for (auto it = end; it != table.begin() && static_cast<int>(out.size()) < n;) {
        --it;
        out.push_back(it->first);
    }
    if (static_cast<int>(out.size()) < n) {
        return {};
    }
    std::reverse(out.begin(), out.end());
    return out;
}
}

RankingContext::RankingContext(const backtest::MarketData& data, const std::string& market)
    : data_(data)
    , market_(market)
{
    if (market_ != "global") {
        country_filter_ = upperCopy(market_);
    }
    for (const auto& [ticker, info] : data_.stock_info) {
        if (isIndexSector(info.sector) || !inScope(info.country)) {
            continue;
        }
        universe_.push_back(ticker);
    }
}

bool RankingContext::isIndexSector(const std::string& sector) {
    return sector == "Market Index" || sector == "Index";
}

bool RankingContext::inScope(const std::string& country) const {
    return country_filter_.empty() || country == country_filter_;
}

std::vector<std::string> RankingContext::scopeCountries(Metric metric, const Date& date) const {
    std::vector<std::string> out;
    const auto& table = data_.rankings(metric);
    auto it = table.find(date);
    if (it == table.end()) {
        return out;
    }
    for (const auto& [country, list] : it->second) {
        if (inScope(country)) {
            out.push_back(country);
        }
    }
    return out;
}

bool RankingContext::hasRanking(Metric metric, const Date& date) const {
    const auto& table = data_.rankings(metric);
    return table.find(date) != table.end();
}

std::vector<Ticker> RankingContext::topN(Metric metric, const Date& date, int n) const {
    std::vector<Ticker> out;
    std::set<Ticker> seen;
    for (const auto& country : scopeCountries(metric, date)) {
        for (const auto& ticker : countryTopN(metric, date, country, n)) {
            if (seen.insert(ticker).second) {
                out.push_back(ticker);
            }
        }
    }
    return out;
}

std::vector<Ticker> RankingContext::countryTopN(Metric metric, const Date& date,
                                                const std::string& country, int n) const {
    const auto& table = data_.rankings(metric);
    auto day = table.find(date);
    if (day == table.end() || n <= 0) {
        return {};
    }
    auto list = day->second.find(country);
    if (list == day->second.end()) {
        return {};
    }
    const size_t count = std::min(list->second.size(), static_cast<size_t>(n));
    return std::vector<Ticker>(list->second.begin(), list->second.begin() + count);
}

int RankingContext::rankingSize(Metric metric, const Date& date, const std::string& country) const {
    const auto& table = data_.rankings(metric);
    auto day = table.find(date);
    if (day == table.end()) {
        return 0;
    }
    auto list = day->second.find(country);
    return list == day->second.end() ? 0 : static_cast<int>(list->second.size());
}

std::optional<int> RankingContext::rankOf(Metric metric, const Date& date, const std::string& country,
                                          const Ticker& ticker) const {
    const auto& table = data_.rankings(metric);
    auto day = table.find(date);
    if (day == table.end()) {
        return std::nullopt;
    }
    auto list = day->second.find(country);
    if (list == day->second.end()) {
        return std::nullopt;
    }
    auto it = std::find(list->second.begin(), list->second.end(), ticker);
    if (it == list->second.end()) {
        return std::nullopt;
    }
    return static_cast<int>(it - list->second.begin());
}

std::optional<double> RankingContext::value(Metric metric, const Date& date, const Ticker& ticker) const {
    const auto& table = data_.values(metric);
    auto day = table.find(date);
    if (day == table.end()) {
        return std::nullopt;
    }
    auto it = day->second.find(ticker);
    if (it == day->second.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Date> RankingContext::rankingLookback(Metric metric, const Date& date, int n) const {
    return lookback(data_.rankings(metric), date, n, true);
}

std::vector<Date> RankingContext::valueLookback(Metric metric, const Date& date, int n) const {
    return lookback(data_.values(metric), date, n, false);
}

} // namespace strategy
} // namespace finpack
