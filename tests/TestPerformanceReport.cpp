#include "analytics/PerformanceReport.h"
#include "backtest/ResultSerializer.h"

#include <cmath>
#include <iostream>

using namespace finpack;

namespace {
std::vector<EquitySnapshot> curve(const std::vector<std::pair<Date, double>>& points) {
    std::vector<EquitySnapshot> out;
    for (const auto& [date, equity] : points) {
        EquitySnapshot s;
        s.date = date;
        s.equity = equity;
        s.cash = equity;
        out.push_back(s);
    }
    return out;
}

TradeRecord sell(double profit_ledger, int holding_days, double fee) {
    TradeRecord t;
    t.action = TradeAction::SELL;
    t.profit_ledger = profit_ledger;
    t.holding_days = holding_days;
    t.fee = fee;
    return t;
}

bool near(double a, double b, double eps = 1e-6) {
    return std::abs(a - b) <= eps;
}
}

int main() {
    using analytics::PerformanceReport;

    // Flat curve: no negative days and no drawdown
    {
        const auto flat = curve({{"2024-01-02", 1000000.0}, {"2024-01-03", 1000000.0}, {"2024-01-04", 1000000.0}});
        const auto m = PerformanceReport::calculate(flat, {}, 1000000.0);
        if (!(std::isinf(m.sortino_ratio) && m.sortino_ratio > 0)) {
            std::cerr << "[TEST] Sortino should be +inf without negative returns\n";
            return 1;
        }
        if (!(std::isinf(m.calmar_ratio) && m.calmar_ratio > 0)) {
            std::cerr << "[TEST] Calmar should be +inf without drawdown\n";
            return 1;
        }
        if (m.sharpe_ratio != 0.0 || m.volatility != 0.0 || m.max_drawdown.value != 0.0) {
            std::cerr << "[TEST] flat curve should have zero Sharpe, volatility and drawdown\n";
            return 1;
        }

        // Infinities survive the JSON export unchanged
        const auto text = backtest::ResultSerializer::toJson(m).dump();
        if (text.find("\"Infinity\"") == std::string::npos) {
            std::cerr << "[TEST] infinite ratios should be exported as \"Infinity\"\n";
            return 1;
        }
        const auto back = backtest::ResultSerializer::metricsFromJson(nlohmann::json::parse(text));
        if (!std::isinf(back.sortino_ratio) || !std::isinf(back.calmar_ratio) ||
            back.period_stats.trading_days != 3) {
            std::cerr << "[TEST] metrics JSON round-trip lost values\n";
            return 1;
        }
    }

    // Rising curve is still +inf Sortino; drawdown curve is finite
    {
        const auto rising = curve({{"2024-01-02", 100.0}, {"2024-01-03", 101.0}, {"2024-01-04", 103.0}});
        if (!std::isinf(PerformanceReport::calculate(rising, {}, 100.0).sortino_ratio)) {
            std::cerr << "[TEST] rising curve Sortino should be +inf\n";
            return 1;
        }

        const auto dd = curve({{"2024-01-02", 100.0}, {"2024-01-03", 120.0},
                               {"2024-01-04", 90.0}, {"2024-01-05", 110.0}});
        const auto m = PerformanceReport::calculate(dd, {}, 100.0);
        if (!near(m.max_drawdown.value, 25.0) || m.max_drawdown.start_date != "2024-01-03" ||
            m.max_drawdown.end_date != "2024-01-04") {
            std::cerr << "[TEST] max drawdown should be 25% from 2024-01-03 to 2024-01-04, got "
                      << m.max_drawdown.value << "\n";
            return 1;
        }
        if (std::isinf(m.sortino_ratio) || std::isinf(m.calmar_ratio)) {
            std::cerr << "[TEST] ratios should be finite with a losing day\n";
            return 1;
        }
        if (!near(m.total_return_pct, 10.0) || m.period_stats.best_day_date != "2024-01-05" ||
            !near(m.period_stats.worst_day, -25.0) || m.period_stats.worst_day_date != "2024-01-04") {
            std::cerr << "[TEST] period statistics unexpected\n";
            return 1;
        }
        if (!(m.annualized_return > 0.0) || !(m.volatility > 0.0)) {
            std::cerr << "[TEST] annualized return and volatility should be positive\n";
            return 1;
        }
    }

    // Trade statistics over sells
    {
        TradeRecord buy;
        buy.action = TradeAction::BUY;
        buy.fee = 10.0;
        const std::vector<TradeRecord> trades = {buy, sell(100.0, 4, 5.0), sell(-50.0, 2, 5.0), sell(30.0, 6, 5.0)};
        const auto s = PerformanceReport::tradeStatistics(trades);
        if (s.sell_count != 3 || s.buy_count != 1 || s.winning_trades != 2 || s.losing_trades != 1) {
            std::cerr << "[TEST] trade counts unexpected\n";
            return 1;
        }
        if (!near(s.win_rate, 200.0 / 3.0) || !near(s.avg_profit, 65.0) || !near(s.avg_loss, 50.0) ||
            !near(s.profit_factor, 2.6) || !near(s.avg_holding_days, 4.0) || !near(s.total_fees, 25.0)) {
            std::cerr << "[TEST] trade statistics unexpected\n";
            return 1;
        }

        const auto winners = PerformanceReport::tradeStatistics({sell(10.0, 1, 1.0)});
        if (!std::isinf(winners.profit_factor)) {
            std::cerr << "[TEST] profit factor without losers should be +inf\n";
            return 1;
        }

        const auto flat = PerformanceReport::tradeStatistics({sell(0.0, 3, 1.0), sell(0.0, 5, 1.0)});
        if (!std::isinf(flat.profit_factor) || flat.losing_trades != 2) {
            std::cerr << "[TEST] break-even sells have no losses, profit factor should be +inf\n";
            return 1;
        }
        if (PerformanceReport::tradeStatistics({}).profit_factor != 0.0) {
            std::cerr << "[TEST] profit factor without sells should be 0\n";
            return 1;
        }
    }

    // Fewer than two points
    {
        const auto m = PerformanceReport::calculate(curve({{"2024-01-02", 100.0}}), {}, 100.0);
        if (m.final_equity != 0.0 || m.sharpe_ratio != 0.0 || m.period_stats.trading_days != 0) {
            std::cerr << "[TEST] single-point curve should give empty metrics\n";
            return 1;
        }
    }

    const auto text = PerformanceReport::generateText(
        PerformanceReport::calculate(curve({{"2024-01-02", 100.0}, {"2024-01-03", 100.0}}), {}, 100.0));
    if (text.find("Sortino:") == std::string::npos || text.find("inf") == std::string::npos) {
        std::cerr << "[TEST] text report should print infinite ratios\n";
        return 1;
    }

    std::cout << "[TEST] PerformanceReport PASSED\n";
    return 0;
}
