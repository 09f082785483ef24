#include "portfolio/Portfolio.h"

#include <cmath>
#include <iostream>

using namespace finpack;

namespace {
bool near(double a, double b, double eps = 1e-6) {
    return std::abs(a - b) <= eps;
}

std::map<std::string, backtest::FeeRule> defaultFees() {
    return backtest::BacktestConfig().fees;
}

// cash + cost basis of open positions in ledger currency
double ledgerBook(const portfolio::Portfolio& p, double fx) {
    double book = p.getCash();
    for (const auto& [ticker, pos] : p.getPositions()) {
        book += pos.shares * pos.avg_cost * p.exchangeRateFor(pos.country, fx);
    }
    return book;
}
}

int main() {
    const double fx = 32.0;
    portfolio::Portfolio p(1000000.0, defaultFees());

    auto r1 = p.buy("2330.TW", 1000, 100.0, COUNTRY_TW, "2024-01-02", fx);
    if (!r1.success || !near(r1.trade.fee, 600.0) || !near(p.getCash(), 899400.0)) {
        std::cerr << "[TEST] first TW buy unexpected, cash=" << p.getCash() << "\n";
        return 1;
    }

    auto r2 = p.buy("2330.TW", 1000, 120.0, COUNTRY_TW, "2024-01-03", fx);
    const auto* pos = p.getPosition("2330.TW");
    if (!r2.success || pos == nullptr || !near(pos->avg_cost, 110.0) || !near(pos->shares, 2000.0)) {
        std::cerr << "[TEST] re-averaged cost basis should be 110\n";
        return 1;
    }
    if (pos->entry_date != "2024-01-02") {
        std::cerr << "[TEST] adding to a position must keep the entry date\n";
        return 1;
    }

    // US fee floor: 10 * 100 * 32 = 32000 ledger, 0.3% = 96 > 15
    auto r3 = p.buy("AAPL", 10, 100.0, COUNTRY_US, "2024-01-03", fx);
    if (!r3.success || !near(r3.trade.amount_ledger, 32000.0) || !near(r3.trade.fee, 96.0)) {
        std::cerr << "[TEST] US buy ledger conversion unexpected\n";
        return 1;
    }
    auto r4 = p.buy("MSFT", 1, 10.0, COUNTRY_US, "2024-01-03", fx);
    if (!r4.success || !near(r4.trade.fee, 15.0)) {
        std::cerr << "[TEST] US minimum fee should apply, got " << r4.trade.fee << "\n";
        return 1;
    }

    auto r5 = p.sell("2330.TW", 500, 130.0, "2024-01-12", "test", fx);
    if (!r5.success || !near(r5.trade.profit, 10000.0) || r5.trade.holding_days != 10) {
        std::cerr << "[TEST] partial sell profit/holding days unexpected: " << r5.trade.profit
                  << " / " << r5.trade.holding_days << "\n";
        return 1;
    }

    const double expected_book = 1000000.0 - p.getTotalFees() + p.getRealizedProfit();
    if (!near(ledgerBook(p, fx), expected_book)) {
        std::cerr << "[TEST] ledger conservation violated: " << ledgerBook(p, fx)
                  << " != " << expected_book << "\n";
        return 1;
    }

    // US sell: profit is native, converted once
    auto r6 = p.sell("AAPL", 0, 110.0, "2024-01-12", "test", fx);
    if (!r6.success || !near(r6.trade.profit, 100.0) || !near(r6.trade.profit_ledger, 3200.0)) {
        std::cerr << "[TEST] US sell profit conversion unexpected\n";
        return 1;
    }
    if (p.hasPosition("AAPL")) {
        std::cerr << "[TEST] shares=0 should sell the whole position\n";
        return 1;
    }
    if (!near(ledgerBook(p, fx), 1000000.0 - p.getTotalFees() + p.getRealizedProfit())) {
        std::cerr << "[TEST] ledger conservation violated after full sell\n";
        return 1;
    }

    // Unpriced positions are valued at cost
    const auto at_cost = p.calculateValue({}, fx);
    if (!near(at_cost.cash, p.getCash()) || !near(at_cost.total_value, ledgerBook(p, fx)) ||
        !near(at_cost.total_value, 1000000.0 - p.getTotalFees() + p.getRealizedProfit())) {
        std::cerr << "[TEST] value at cost should equal cash plus cost basis\n";
        return 1;
    }

    // Snapshot is a value copy
    PriceMap prices{{"2330.TW", 130.0}, {"MSFT", 10.0}};
    StockInfoMap info{{"2330.TW", {COUNTRY_TW, "Semiconductors"}}, {"MSFT", {COUNTRY_US, "Technology"}}};
    const auto marked = p.calculateValue(prices, fx);
    double expected_positions = 0.0;
    for (const auto& [ticker, pos] : p.getPositions()) {
        expected_positions += pos.shares * prices.at(ticker) * p.exchangeRateFor(pos.country, fx);
    }
    if (!near(marked.position_value, expected_positions) ||
        !near(marked.total_value, p.getCash() + expected_positions)) {
        std::cerr << "[TEST] marked value should convert US holdings at the day's rate\n";
        return 1;
    }
    const auto snapshot = p.recordHistory("2024-01-12", prices, info, fx);
    if (!near(snapshot.equity, marked.total_value) || !near(snapshot.holdings_value, marked.position_value)) {
        std::cerr << "[TEST] snapshot equity should match calculateValue\n";
        return 1;
    }
    if (snapshot.holdings.size() != 2 || snapshot.holdings.at("2330.TW").sector != "Semiconductors") {
        std::cerr << "[TEST] snapshot holdings unexpected\n";
        return 1;
    }

    auto r7 = p.sell("2330.TW", 1500, 130.0, "2024-01-15", "test", fx);
    if (!r7.success || p.hasPosition("2330.TW")) {
        std::cerr << "[TEST] selling the full share count should remove the position\n";
        return 1;
    }
    if (p.getEquityCurve().back().holdings.count("2330.TW") == 0) {
        std::cerr << "[TEST] recorded snapshot must not change after a later sell\n";
        return 1;
    }

    if (p.sell("2330.TW", 1, 130.0, "2024-01-15", "test", fx).rejection != TradeRejection::NO_POSITION) {
        std::cerr << "[TEST] selling a closed position should fail with no_position\n";
        return 1;
    }
    if (p.sell("MSFT", 5, 10.0, "2024-01-15", "test", fx).rejection != TradeRejection::INSUFFICIENT_SHARES) {
        std::cerr << "[TEST] overselling should fail with insufficient_shares\n";
        return 1;
    }
    if (p.buy("2454.TW", 1000000, 900.0, COUNTRY_TW, "2024-01-15", fx).rejection != TradeRejection::INSUFFICIENT_CASH) {
        std::cerr << "[TEST] oversized buy should fail with insufficient_cash\n";
        return 1;
    }
    if (tradeRejectionToString(TradeRejection::MAX_POSITIONS_REACHED) != "max_positions_reached") {
        std::cerr << "[TEST] rejection names should be snake_case\n";
        return 1;
    }

    p.reset();
    if (!near(p.getCash(), 1000000.0) || p.getPositionCount() != 0 || !p.getTradeLog().empty()) {
        std::cerr << "[TEST] reset should restore the initial state\n";
        return 1;
    }

    std::cout << "[TEST] Portfolio PASSED\n";
    return 0;
}
