#pragma once

#include "common/Types.h"
#include "backtest/MarketData.h"
#include <string>
#include <vector>

namespace finpack {
namespace analytics {

struct BenchmarkPoint {
    Date date;
    double equity = 0.0;    // ledger currency
};

struct BenchmarkCurve {
    std::string name;
    std::vector<BenchmarkPoint> points;
    double total_return_pct = 0.0;
};

// Buy-and-hold of the bundle's benchmark series with the initial capital.
// Empty when the series never prices inside the simulated dates.
BenchmarkCurve calculateBenchmarkCurve(const backtest::BenchmarkSeries& series,
                                       const std::vector<Date>& trading_dates,
                                       const backtest::MarketData& data,
                                       double initial_capital,
                                       double default_exchange_rate);

} // namespace analytics
} // namespace finpack
