#include "portfolio/TradeExecutor.h"

#include <cmath>
#include <iostream>

using namespace finpack;

namespace {
bool near(double a, double b, double eps = 1e-6) {
    return std::abs(a - b) <= eps;
}

portfolio::ExecutionOptions withAmount(double amount, double fx = 32.0) {
    portfolio::ExecutionOptions opts;
    opts.amount = amount;
    opts.exchange_rate = fx;
    return opts;
}
}

int main() {
    const auto fees = backtest::BacktestConfig().fees;

    // TW lot rounding: 145,000 at 100 funds 1,450 shares -> one lot of 1,000
    {
        portfolio::Portfolio p(1000000.0, fees);
        portfolio::TradeExecutor exec(p, portfolio::ExecutorOptions());
        auto r = exec.executeBuy("2330.TW", 100.0, COUNTRY_TW, "2024-01-02", withAmount(145000.0));
        if (!r.success || !near(r.trade.shares, 1000.0)) {
            std::cerr << "[TEST] TW buy should round down to 1000 shares, got " << r.trade.shares << "\n";
            return 1;
        }
        if (!near(p.getCash(), 1000000.0 - 100000.0 - 600.0)) {
            std::cerr << "[TEST] unused TW remainder should stay in cash, cash=" << p.getCash() << "\n";
            return 1;
        }
        auto small = exec.executeBuy("2317.TW", 100.0, COUNTRY_TW, "2024-01-02", withAmount(50000.0));
        if (small.success || small.rejection != TradeRejection::AMOUNT_TOO_SMALL) {
            std::cerr << "[TEST] sub-lot amount should be rejected as amount_too_small\n";
            return 1;
        }
    }

    // US sizing: integer shares unless fractional is enabled
    {
        portfolio::Portfolio p(1000000.0, fees);
        portfolio::TradeExecutor exec(p, portfolio::ExecutorOptions());
        if (!near(exec.calculateShares(100000.0, 150.0, COUNTRY_US, 32.0), 20.0)) {
            std::cerr << "[TEST] US shares should be whole by default\n";
            return 1;
        }

        portfolio::ExecutorOptions frac;
        frac.allow_fractional_us = true;
        portfolio::TradeExecutor frac_exec(p, frac);
        const double shares = frac_exec.calculateShares(100000.0, 150.0, COUNTRY_US, 32.0);
        if (!(shares > 20.8 && shares < 20.84) || near(shares, std::floor(shares))) {
            std::cerr << "[TEST] fractional US shares expected, got " << shares << "\n";
            return 1;
        }
    }

    // Partial fill down to what cash allows
    {
        portfolio::Portfolio p(50000.0, fees);
        portfolio::TradeExecutor exec(p, portfolio::ExecutorOptions());
        auto r = exec.executeBuy("2330.TW", 10.0, COUNTRY_TW, "2024-01-02", withAmount(100000.0));
        if (!r.success || !near(r.trade.shares, 4000.0) || p.getCash() < 0.0) {
            std::cerr << "[TEST] partial fill should buy 4000 shares, got " << r.trade.shares << "\n";
            return 1;
        }

        portfolio::Portfolio q(50000.0, fees);
        portfolio::ExecutorOptions strict;
        strict.allow_partial_fill = false;
        portfolio::TradeExecutor strict_exec(q, strict);
        auto rejected = strict_exec.executeBuy("2330.TW", 10.0, COUNTRY_TW, "2024-01-02", withAmount(100000.0));
        if (rejected.success || rejected.rejection != TradeRejection::INSUFFICIENT_CASH) {
            std::cerr << "[TEST] without partial fill the buy should fail with insufficient_cash\n";
            return 1;
        }
        if (!near(q.getCash(), 50000.0)) {
            std::cerr << "[TEST] rejected buy must not touch cash\n";
            return 1;
        }
    }

    // Max positions gates new tickers only
    {
        portfolio::Portfolio p(1000000.0, fees);
        portfolio::ExecutorOptions opts;
        opts.max_positions = 2;
        portfolio::TradeExecutor exec(p, opts);
        exec.executeBuy("AAPL", 100.0, COUNTRY_US, "2024-01-02", withAmount(50000.0));
        exec.executeBuy("MSFT", 100.0, COUNTRY_US, "2024-01-02", withAmount(50000.0));
        auto third = exec.executeBuy("NVDA", 100.0, COUNTRY_US, "2024-01-02", withAmount(50000.0));
        if (third.success || third.rejection != TradeRejection::MAX_POSITIONS_REACHED) {
            std::cerr << "[TEST] third ticker should hit max_positions_reached\n";
            return 1;
        }
        auto add = exec.executeBuy("AAPL", 100.0, COUNTRY_US, "2024-01-03", withAmount(50000.0));
        if (!add.success) {
            std::cerr << "[TEST] adding to an existing position should not be capped\n";
            return 1;
        }
        auto no_price = exec.executeBuy("MSFT", 0.0, COUNTRY_US, "2024-01-03", withAmount(50000.0));
        if (no_price.rejection != TradeRejection::NO_PRICE) {
            std::cerr << "[TEST] zero price should be rejected as no_price\n";
            return 1;
        }
    }

    // Rebalance: sell outside targets, buy new targets
    {
        portfolio::Portfolio p(1000000.0, fees);
        portfolio::TradeExecutor exec(p, portfolio::ExecutorOptions());
        exec.executeBuy("AAPL", 100.0, COUNTRY_US, "2024-01-02", withAmount(50000.0));
        exec.executeBuy("MSFT", 100.0, COUNTRY_US, "2024-01-02", withAmount(50000.0));

        PriceMap prices{{"AAPL", 110.0}, {"MSFT", 100.0}, {"NVDA", 200.0}};
        StockInfoMap info{{"AAPL", {COUNTRY_US, "Technology"}},
                          {"MSFT", {COUNTRY_US, "Technology"}},
                          {"NVDA", {COUNTRY_US, "Semiconductors"}}};
        auto outcome = exec.executeRebalance({"MSFT", "NVDA"}, prices, info, "2024-01-08", withAmount(50000.0));
        if (outcome.sells.size() != 1 || outcome.sells[0].trade.ticker != "AAPL" ||
            outcome.sells[0].trade.reason != "rebalance") {
            std::cerr << "[TEST] rebalance should sell AAPL only\n";
            return 1;
        }
        if (outcome.buys.size() != 1 || outcome.buys[0].trade.ticker != "NVDA" || !outcome.buys[0].success) {
            std::cerr << "[TEST] rebalance should buy NVDA only\n";
            return 1;
        }
        if (p.hasPosition("AAPL") || !p.hasPosition("MSFT") || !p.hasPosition("NVDA")) {
            std::cerr << "[TEST] holdings after rebalance unexpected\n";
            return 1;
        }

        auto est = exec.estimateSellProceeds("MSFT", 100.0, 32.0);
        if (!near(est.shares, p.getPosition("MSFT")->shares) || !(est.total < est.amount_ledger)) {
            std::cerr << "[TEST] sell estimate should cover the whole position net of fees\n";
            return 1;
        }
    }

    std::cout << "[TEST] TradeExecutor PASSED\n";
    return 0;
}
