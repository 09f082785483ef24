#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "common/Types.h"

namespace finpack {
namespace backtest {

// The two ranked metrics supplied by the upstream ranking service
enum class Metric {
    SHARPE,
    GROWTH
};


// country code -> ordered tickers (best first)
using CountryRanking = std::map<std::string, std::vector<Ticker>>;
using RankingTable = std::map<Date, CountryRanking>;
using ValueTable = std::map<Date, std::map<Ticker, double>>;

struct BenchmarkSeries {
    std::string name;
    std::string country = COUNTRY_US;
    std::map<Date, Price> prices;
};

// Read-only input bundle for one backtest run
struct MarketData {
    std::vector<Date> dates;                              // ascending trading dates
    std::map<Ticker, std::map<Date, Price>> prices;       // native close
    StockInfoMap stock_info;
    RankingTable sharpe_rank;
    RankingTable growth_rank;
    ValueTable sharpe_values;
    ValueTable growth_values;
    std::map<Date, double> exchange_rates;                // USD -> TWD
    std::optional<BenchmarkSeries> benchmark;

    const RankingTable& rankings(Metric metric) const;
    const ValueTable& values(Metric metric) const;

    // Last known price on or before date
    std::optional<Price> priceOn(const Ticker& ticker, const Date& date) const;

    // Carry-forward prices of every ticker that has traded by date
    PriceMap pricesOn(const Date& date) const;

    // Same-day rate, else most recent earlier rate, else fallback
    double exchangeRateOn(const Date& date, double fallback) const;

    // Structural problems that make the bundle unusable
    std::vector<std::string> validate() const;
};

} // namespace backtest
} // namespace finpack
