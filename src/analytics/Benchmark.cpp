#include "analytics/Benchmark.h"
#include "common/Logger.h"

namespace finpack {
namespace analytics {

namespace {
double ledgerRate(const std::string& country, const backtest::MarketData& data,
                  const Date& date, double fallback) {
    return country == COUNTRY_TW ? 1.0 : data.exchangeRateOn(date, fallback);
}
}

BenchmarkCurve calculateBenchmarkCurve(const backtest::BenchmarkSeries& series,
                                       const std::vector<Date>& trading_dates,
                                       const backtest::MarketData& data,
                                       double initial_capital,
                                       double default_exchange_rate) {
    BenchmarkCurve curve;
    curve.name = series.name;

    double units = 0.0;
    bool entered = false;
    for (const auto& date : trading_dates) {
        auto it = series.prices.upper_bound(date);
        if (it == series.prices.begin()) {
            continue;
        }
        --it;
        const double value = it->second * ledgerRate(series.country, data, date, default_exchange_rate);
        if (value <= 0.0) {
            continue;
        }
        if (!entered) {
            units = initial_capital / value;
            entered = true;
        }
        curve.points.push_back(BenchmarkPoint{date, units * value});
    }

    if (curve.points.empty()) {
        LOG_WARN("Benchmark {} has no price inside the backtest period", series.name);
        return curve;
    }
    if (initial_capital > 0.0) {
        curve.total_return_pct = (curve.points.back().equity - initial_capital) / initial_capital * 100.0;
    }
    return curve;
}

} // namespace analytics
} // namespace finpack
