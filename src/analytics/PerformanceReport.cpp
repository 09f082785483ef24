#include "analytics/PerformanceReport.h"
#include "common/DateUtils.h"

#include <cmath>
#include <iomanip>
#include <limits>
#include <numeric>
#include <sstream>

namespace finpack {
namespace analytics {

namespace {
constexpr double INF = std::numeric_limits<double>::infinity();

double mean(const std::vector<double>& v) {
    if (v.empty()) {
        return 0.0;
    }
    return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

// Sample standard deviation
double stdev(const std::vector<double>& v) {
    if (v.size() < 2) {
        return 0.0;
    }
    const double m = mean(v);
    double sq = 0.0;
    for (double x : v) {
        sq += (x - m) * (x - m);
    }
    return std::sqrt(sq / static_cast<double>(v.size() - 1));
}

std::string ratioText(double v) {
    if (std::isinf(v)) {
        return v > 0 ? "inf" : "-inf";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << v;
    return oss.str();
}
}

std::vector<double> PerformanceReport::dailyReturns(const std::vector<EquitySnapshot>& equity) {
    std::vector<double> returns;
    for (size_t i = 1; i < equity.size(); ++i) {
        const double prev = equity[i - 1].equity;
        returns.push_back(prev > 0.0 ? (equity[i].equity - prev) / prev : 0.0);
    }
    return returns;
}

DrawdownInfo PerformanceReport::maxDrawdown(const std::vector<EquitySnapshot>& equity) {
    DrawdownInfo dd;
    if (equity.empty()) {
        return dd;
    }
    double peak = equity.front().equity;
    Date peak_date = equity.front().date;
    for (const auto& point : equity) {
        if (point.equity > peak) {
            peak = point.equity;
            peak_date = point.date;
        }
        const double drawdown = peak > 0.0 ? (peak - point.equity) / peak * 100.0 : 0.0;
        if (drawdown > dd.value) {
            dd.value = drawdown;
            dd.start_date = peak_date;
            dd.end_date = point.date;
        }
    }
    return dd;
}

double PerformanceReport::volatility(const std::vector<double>& returns) {
    return stdev(returns) * std::sqrt(TRADING_DAYS_PER_YEAR) * 100.0;
}

double PerformanceReport::sharpeRatio(const std::vector<double>& returns) {
    const double sd = stdev(returns);
    if (sd == 0.0) {
        return 0.0;
    }
    return (mean(returns) * TRADING_DAYS_PER_YEAR - RISK_FREE_RATE) / (sd * std::sqrt(TRADING_DAYS_PER_YEAR));
}

double PerformanceReport::sortinoRatio(const std::vector<double>& returns) {
    if (returns.empty()) {
        return 0.0;
    }
    double downside_sq = 0.0;
    int negatives = 0;
    for (double r : returns) {
        if (r < 0.0) {
            downside_sq += r * r;
            negatives++;
        }
    }
    if (negatives == 0) {
        return INF;
    }
    const double downside = std::sqrt(downside_sq / negatives);
    if (downside == 0.0) {
        return INF;
    }
    return (mean(returns) * TRADING_DAYS_PER_YEAR - RISK_FREE_RATE) / (downside * std::sqrt(TRADING_DAYS_PER_YEAR));
}

TradeStatistics PerformanceReport::tradeStatistics(const std::vector<TradeRecord>& trades) {
    TradeStatistics stats;
    double gross_profit = 0.0;
    double gross_loss = 0.0;
    double holding_days = 0.0;

    for (const auto& t : trades) {
        stats.total_trades++;
        stats.total_fees += t.fee;
        if (t.action == TradeAction::BUY) {
            stats.buy_count++;
            continue;
        }
        stats.sell_count++;
        holding_days += t.holding_days;
        if (t.profit_ledger > 0.0) {
            stats.winning_trades++;
            gross_profit += t.profit_ledger;
        } else {
            stats.losing_trades++;
            gross_loss += std::abs(t.profit_ledger);
        }
    }

    if (stats.sell_count > 0) {
        stats.win_rate = static_cast<double>(stats.winning_trades) / stats.sell_count * 100.0;
        stats.avg_holding_days = holding_days / stats.sell_count;
    }
    if (stats.winning_trades > 0) {
        stats.avg_profit = gross_profit / stats.winning_trades;
    }
    if (stats.losing_trades > 0) {
        stats.avg_loss = gross_loss / stats.losing_trades;
    }
    if (gross_loss > 0.0) {
        stats.profit_factor = gross_profit / gross_loss;
    } else if (stats.sell_count > 0) {
        stats.profit_factor = INF;
    }
    return stats;
}

PerformanceMetrics PerformanceReport::calculate(const std::vector<EquitySnapshot>& equity,
                                                const std::vector<TradeRecord>& trades,
                                                double initial_capital) {
    PerformanceMetrics m;
    if (equity.size() < 2) {
        return m;
    }

    m.initial_capital = initial_capital;
    m.final_equity = equity.back().equity;
    m.total_return = m.final_equity - initial_capital;
    m.total_return_pct = initial_capital > 0.0 ? m.total_return / initial_capital * 100.0 : 0.0;

    const double years = utils::DateUtils::daysBetween(equity.front().date, equity.back().date) / DAYS_PER_YEAR;
    if (years > 0.0 && initial_capital > 0.0 && m.final_equity > 0.0) {
        m.annualized_return = (std::pow(m.final_equity / initial_capital, 1.0 / years) - 1.0) * 100.0;
    }

    const auto returns = dailyReturns(equity);
    m.volatility = volatility(returns);
    m.sharpe_ratio = sharpeRatio(returns);
    m.sortino_ratio = sortinoRatio(returns);
    m.max_drawdown = maxDrawdown(equity);
    m.calmar_ratio = m.max_drawdown.value > 0.0 ? m.annualized_return / m.max_drawdown.value : INF;
    m.trade_stats = tradeStatistics(trades);

    auto& period = m.period_stats;
    period.trading_days = static_cast<int>(equity.size());
    period.start_date = equity.front().date;
    period.end_date = equity.back().date;
    for (size_t i = 0; i < returns.size(); ++i) {
        const double pct = returns[i] * 100.0;
        if (i == 0 || pct > period.best_day) {
            period.best_day = pct;
            period.best_day_date = equity[i + 1].date;
        }
        if (i == 0 || pct < period.worst_day) {
            period.worst_day = pct;
            period.worst_day_date = equity[i + 1].date;
        }
    }
    return m;
}

std::string PerformanceReport::generateText(const PerformanceMetrics& m) {
    std::ostringstream oss;
    oss << std::fixed;
    oss << "Backtest Report\n";
    oss << "---------------------------------------------\n";
    oss << "Period:            " << m.period_stats.start_date << " ~ " << m.period_stats.end_date
        << " (" << m.period_stats.trading_days << " days)\n";
    oss << std::setprecision(0);
    oss << "Initial capital:   " << m.initial_capital << " TWD\n";
    oss << "Final equity:      " << m.final_equity << " TWD\n";
    oss << "Total return:      " << m.total_return << " TWD";
    oss << std::setprecision(2) << " (" << m.total_return_pct << "%)\n";
    oss << "Annualized:        " << m.annualized_return << "%\n";
    oss << "Max drawdown:      " << m.max_drawdown.value << "%";
    if (!m.max_drawdown.start_date.empty()) {
        oss << " (" << m.max_drawdown.start_date << " ~ " << m.max_drawdown.end_date << ")";
    }
    oss << "\n";
    oss << "Volatility:        " << m.volatility << "%\n";
    oss << "Sharpe:            " << ratioText(m.sharpe_ratio) << "\n";
    oss << "Sortino:           " << ratioText(m.sortino_ratio) << "\n";
    oss << "Calmar:            " << ratioText(m.calmar_ratio) << "\n";
    oss << "Best day:          " << m.period_stats.best_day << "% (" << m.period_stats.best_day_date << ")\n";
    oss << "Worst day:         " << m.period_stats.worst_day << "% (" << m.period_stats.worst_day_date << ")\n";

    const auto& t = m.trade_stats;
    oss << "Trades:            " << t.total_trades << " (buy " << t.buy_count << " / sell " << t.sell_count << ")\n";
    oss << "Win rate:          " << t.win_rate << "%\n";
    oss << std::setprecision(0);
    oss << "Avg profit:        " << t.avg_profit << " TWD\n";
    oss << "Avg loss:          " << t.avg_loss << " TWD\n";
    oss << "Profit factor:     " << ratioText(t.profit_factor) << "\n";
    oss << std::setprecision(1);
    oss << "Avg holding days:  " << t.avg_holding_days << "\n";
    oss << std::setprecision(0);
    oss << "Total fees:        " << t.total_fees << " TWD\n";
    oss << "---------------------------------------------\n";
    return oss.str();
}

} // namespace analytics
} // namespace finpack
