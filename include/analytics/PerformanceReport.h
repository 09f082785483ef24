#pragma once

#include "common/Types.h"
#include <string>
#include <vector>

namespace finpack {
namespace analytics {

struct DrawdownInfo {
    double value = 0.0;         // percent, positive
    Date start_date;            // peak
    Date end_date;              // trough
};

struct TradeStatistics {
    int total_trades = 0;
    int buy_count = 0;
    int sell_count = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    double win_rate = 0.0;              // percent
    double avg_profit = 0.0;            // ledger currency, winners
    double avg_loss = 0.0;              // ledger currency, losers (positive)
    double profit_factor = 0.0;         // +inf without losses
    double avg_holding_days = 0.0;
    double total_fees = 0.0;
};

struct PeriodStatistics {
    int trading_days = 0;
    Date start_date;
    Date end_date;
    double best_day = 0.0;              // percent
    Date best_day_date;
    double worst_day = 0.0;             // percent
    Date worst_day_date;
};

struct PerformanceMetrics {
    double initial_capital = 0.0;
    double final_equity = 0.0;
    double total_return = 0.0;          // ledger currency
    double total_return_pct = 0.0;
    double annualized_return = 0.0;     // percent
    double volatility = 0.0;            // percent, annualized
    double sharpe_ratio = 0.0;
    double sortino_ratio = 0.0;         // +inf without negative days
    double calmar_ratio = 0.0;          // +inf without drawdown
    DrawdownInfo max_drawdown;
    TradeStatistics trade_stats;
    PeriodStatistics period_stats;
};

// Pure metrics over an equity curve and trade log
class PerformanceReport {
public:
    static constexpr double RISK_FREE_RATE = 0.02;
    static constexpr double TRADING_DAYS_PER_YEAR = 252.0;
    static constexpr double DAYS_PER_YEAR = 365.25;

    static PerformanceMetrics calculate(const std::vector<EquitySnapshot>& equity,
                                        const std::vector<TradeRecord>& trades,
                                        double initial_capital);

    static std::vector<double> dailyReturns(const std::vector<EquitySnapshot>& equity);
    static DrawdownInfo maxDrawdown(const std::vector<EquitySnapshot>& equity);
    static double volatility(const std::vector<double>& returns);
    static double sharpeRatio(const std::vector<double>& returns);
    static double sortinoRatio(const std::vector<double>& returns);
    static TradeStatistics tradeStatistics(const std::vector<TradeRecord>& trades);

    static std::string generateText(const PerformanceMetrics& metrics);
};

} // namespace analytics
} // namespace finpack
