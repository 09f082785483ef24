#pragma once

#include "common/Types.h"
#include "backtest/MarketData.h"
#include <optional>
#include <string>
#include <vector>

namespace finpack {
namespace strategy {

using backtest::Metric;

// Run-scoped, read-only view over the bundle's ranking and value tables
class RankingContext {
public:
    // market: "us", "tw" or "global"
    RankingContext(const backtest::MarketData& data, const std::string& market);

    // Tradable tickers for the market scope (index sectors excluded)
    const std::vector<Ticker>& universe() const { return universe_; }

    // Countries ranked on date within the market scope
    std::vector<std::string> scopeCountries(Metric metric, const Date& date) const;

    bool hasRanking(Metric metric, const Date& date) const;

    // Per-country top n, unioned across the scope
    std::vector<Ticker> topN(Metric metric, const Date& date, int n) const;

    std::vector<Ticker> countryTopN(Metric metric, const Date& date, const std::string& country, int n) const;

    // Size of one country's ranking list on date
    int rankingSize(Metric metric, const Date& date, const std::string& country) const;

    // 0-based position in the country ranking, nullopt when not ranked
    std::optional<int> rankOf(Metric metric, const Date& date, const std::string& country,
                              const Ticker& ticker) const;

    std::optional<double> value(Metric metric, const Date& date, const Ticker& ticker) const;

    // Last n ranking dates ending at date; empty if date is unranked or history is short
    std::vector<Date> rankingLookback(Metric metric, const Date& date, int n) const;

    // Last n value-table dates ending at date; empty if history is short
    std::vector<Date> valueLookback(Metric metric, const Date& date, int n) const;

    const std::string& market() const { return market_; }
    const backtest::MarketData& data() const { return data_; }

    static bool isIndexSector(const std::string& sector);

private:
    bool inScope(const std::string& country) const;

    const backtest::MarketData& data_;
    std::string market_;
    std::string country_filter_;   // empty for global
    std::vector<Ticker> universe_;
};

} // namespace strategy
} // namespace finpack
