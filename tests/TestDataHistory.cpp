#include "backtest/DataHistory.h"
#include "analytics/Benchmark.h"

#include <cmath>
#include <iostream>

using namespace finpack;

namespace {
bool near(double a, double b, double eps = 1e-6) {
    return std::abs(a - b) <= eps;
}
}

int main() {
    const auto j = nlohmann::json::parse(R"({
        "dates": ["2024-01-02", "2024-01-03", "2024-01-04"],
        "prices": {
            "AAPL": {"2024-01-02": 100.0, "2024-01-04": {"close": 110.0}},
            "2330.TW": {"2024-01-02": 590, "2024-01-03": -1, "2024-01-04": null}
        },
        "stock_info": {
            "AAPL": {"country": "US", "sector": "Technology"},
            "2330.TW": {"country": "TW", "industry": "Semiconductors"}
        },
        "sharpe_rank": {"2024-01-02": {"US": ["AAPL"], "TW": ["2330.TW"]}},
        "sharpe_values": {"2024-01-02": {"AAPL": 1.5, "2330.TW": 0.7}},
        "exchange_rates": {"2024-01-02": 30.0, "2024-01-04": 33.0},
        "benchmark": {"name": "S&P 500", "country": "US",
                      "prices": {"2024-01-02": 100.0, "2024-01-04": 110.0}}
    })");

    auto data = backtest::DataHistory::fromJson(j);
    if (!data) {
        std::cerr << "[TEST] valid bundle rejected\n";
        return 1;
    }
    if (data->dates.size() != 3 || data->stock_info.at("2330.TW").sector != "Semiconductors") {
        std::cerr << "[TEST] dates or industry alias not loaded\n";
        return 1;
    }
    if (!near(data->prices.at("AAPL").at("2024-01-04"), 110.0)) {
        std::cerr << "[TEST] {close: x} price form not loaded\n";
        return 1;
    }
    if (data->prices.at("2330.TW").size() != 1) {
        std::cerr << "[TEST] invalid prices should be dropped\n";
        return 1;
    }
    if (!data->validate().empty()) {
        std::cerr << "[TEST] loaded bundle should validate\n";
        return 1;
    }

    // Carry-forward prices and exchange rates
    const auto mid = data->pricesOn("2024-01-03");
    if (!near(mid.at("AAPL"), 100.0) || !near(mid.at("2330.TW"), 590.0)) {
        std::cerr << "[TEST] prices should carry forward across gaps\n";
        return 1;
    }
    if (data->priceOn("2330.TW", "2024-01-04").value_or(0.0) != 590.0 ||
        data->priceOn("AAPL", "2024-01-01").has_value() || data->priceOn("MSFT", "2024-01-04").has_value()) {
        std::cerr << "[TEST] single-ticker price lookup unexpected\n";
        return 1;
    }
    if (data->pricesOn("2024-01-01").count("AAPL") != 0) {
        std::cerr << "[TEST] no price before the first quote\n";
        return 1;
    }
    if (!near(data->exchangeRateOn("2024-01-03", 32.0), 30.0) ||
        !near(data->exchangeRateOn("2024-01-01", 32.0), 32.0)) {
        std::cerr << "[TEST] exchange rate fallback unexpected\n";
        return 1;
    }

    // Benchmark: buy on day one, marked in the ledger currency
    if (!data->benchmark) {
        std::cerr << "[TEST] benchmark not loaded\n";
        return 1;
    }
    const auto bench = analytics::calculateBenchmarkCurve(*data->benchmark, data->dates, *data, 1000000.0, 32.0);
    if (bench.points.size() != 3 || !near(bench.points[1].equity, 1000000.0) ||
        !near(bench.points[2].equity, 1210000.0, 1e-3) || !near(bench.total_return_pct, 21.0, 1e-6)) {
        std::cerr << "[TEST] benchmark curve unexpected\n";
        return 1;
    }

    // Calendar derived from prices when dates are missing
    auto no_dates = j;
    no_dates.erase("dates");
    auto derived = backtest::DataHistory::fromJson(no_dates);
    if (!derived || derived->dates.size() != 2 || derived->dates.front() != "2024-01-02") {
        std::cerr << "[TEST] dates should be derived from prices\n";
        return 1;
    }

    auto no_prices = j;
    no_prices.erase("prices");
    if (backtest::DataHistory::fromJson(no_prices)) {
        std::cerr << "[TEST] bundle without prices should be rejected\n";
        return 1;
    }

    backtest::MarketData unsorted = *data;
    unsorted.dates = {"2024-01-03", "2024-01-02"};
    if (unsorted.validate().empty()) {
        std::cerr << "[TEST] unsorted dates should fail validation\n";
        return 1;
    }

    if (backtest::DataHistory::loadBundle("does/not/exist.json")) {
        std::cerr << "[TEST] missing file should return nullopt\n";
        return 1;
    }

#ifdef FINPACK_SAMPLE_BUNDLE
    auto sample = backtest::DataHistory::loadBundle(FINPACK_SAMPLE_BUNDLE);
    if (!sample || !sample->validate().empty() || sample->dates.empty()) {
        std::cerr << "[TEST] sample bundle should load and validate\n";
        return 1;
    }
#endif

    std::cout << "[TEST] DataHistory PASSED\n";
    return 0;
}
