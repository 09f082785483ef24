#include "backtest/ResultSerializer.h"
#include "common/Logger.h"

#include <cmath>
#include <fstream>
#include <limits>

namespace finpack {
namespace backtest {

nlohmann::json ResultSerializer::number(double v) {
    if (std::isnan(v)) {
        return "NaN";
    }
    if (std::isinf(v)) {
        return v > 0 ? "Infinity" : "-Infinity";
    }
    return v;
}

double ResultSerializer::readNumber(const nlohmann::json& j, const std::string& key, double fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto& v = j[key];
    if (v.is_number()) {
        return v.get<double>();
    }
    if (v.is_string()) {
        const auto s = v.get<std::string>();
        if (s == "Infinity") return std::numeric_limits<double>::infinity();
        if (s == "-Infinity") return -std::numeric_limits<double>::infinity();
        if (s == "NaN") return std::numeric_limits<double>::quiet_NaN();
    }
    return fallback;
}

nlohmann::json ResultSerializer::toJson(const analytics::PerformanceMetrics& m) {
    nlohmann::json j;
    j["initial_capital"] = number(m.initial_capital);
    j["final_equity"] = number(m.final_equity);
    j["total_return"] = number(m.total_return);
    j["total_return_pct"] = number(m.total_return_pct);
    j["annualized_return"] = number(m.annualized_return);
    j["volatility"] = number(m.volatility);
    j["sharpe_ratio"] = number(m.sharpe_ratio);
    j["sortino_ratio"] = number(m.sortino_ratio);
    j["calmar_ratio"] = number(m.calmar_ratio);
    j["max_drawdown"] = {
        {"value", number(m.max_drawdown.value)},
        {"start_date", m.max_drawdown.start_date},
        {"end_date", m.max_drawdown.end_date}
    };

    const auto& t = m.trade_stats;
    j["trade_stats"] = {
        {"total_trades", t.total_trades},
        {"buy_count", t.buy_count},
        {"sell_count", t.sell_count},
        {"winning_trades", t.winning_trades},
        {"losing_trades", t.losing_trades},
        {"win_rate", number(t.win_rate)},
        {"avg_profit", number(t.avg_profit)},
        {"avg_loss", number(t.avg_loss)},
        {"profit_factor", number(t.profit_factor)},
        {"avg_holding_days", number(t.avg_holding_days)},
        {"total_fees", number(t.total_fees)}
    };

    const auto& p = m.period_stats;
    j["period_stats"] = {
        {"trading_days", p.trading_days},
        {"start_date", p.start_date},
        {"end_date", p.end_date},
        {"best_day", number(p.best_day)},
        {"best_day_date", p.best_day_date},
        {"worst_day", number(p.worst_day)},
        {"worst_day_date", p.worst_day_date}
    };
    return j;
}

analytics::PerformanceMetrics ResultSerializer::metricsFromJson(const nlohmann::json& j) {
    analytics::PerformanceMetrics m;
    m.initial_capital = readNumber(j, "initial_capital");
    m.final_equity = readNumber(j, "final_equity");
    m.total_return = readNumber(j, "total_return");
    m.total_return_pct = readNumber(j, "total_return_pct");
    m.annualized_return = readNumber(j, "annualized_return");
    m.volatility = readNumber(j, "volatility");
    m.sharpe_ratio = readNumber(j, "sharpe_ratio");
    m.sortino_ratio = readNumber(j, "sortino_ratio");
    m.calmar_ratio = readNumber(j, "calmar_ratio");

    if (j.contains("max_drawdown")) {
        const auto& dd = j["max_drawdown"];
        m.max_drawdown.value = readNumber(dd, "value");
        m.max_drawdown.start_date = dd.value("start_date", std::string());
        m.max_drawdown.end_date = dd.value("end_date", std::string());
    }
    if (j.contains("trade_stats")) {
        const auto& t = j["trade_stats"];
        m.trade_stats.total_trades = t.value("total_trades", 0);
        m.trade_stats.buy_count = t.value("buy_count", 0);
        m.trade_stats.sell_count = t.value("sell_count", 0);
        m.trade_stats.winning_trades = t.value("winning_trades", 0);
        m.trade_stats.losing_trades = t.value("losing_trades", 0);
        m.trade_stats.win_rate = readNumber(t, "win_rate");
        m.trade_stats.avg_profit = readNumber(t, "avg_profit");
        m.trade_stats.avg_loss = readNumber(t, "avg_loss");
        m.trade_stats.profit_factor = readNumber(t, "profit_factor");
        m.trade_stats.avg_holding_days = readNumber(t, "avg_holding_days");
        m.trade_stats.total_fees = readNumber(t, "total_fees");
    }
    if (j.contains("period_stats")) {
        const auto& p = j["period_stats"];
        m.period_stats.trading_days = p.value("trading_days", 0);
        m.period_stats.start_date = p.value("start_date", std::string());
        m.period_stats.end_date = p.value("end_date", std::string());
        m.period_stats.best_day = readNumber(p, "best_day");
        m.period_stats.best_day_date = p.value("best_day_date", std::string());
        m.period_stats.worst_day = readNumber(p, "worst_day");
        m.period_stats.worst_day_date = p.value("worst_day_date", std::string());
    }
    return m;
}

nlohmann::json ResultSerializer::toJson(const TradeRecord& t) {
    nlohmann::json j;
    j["action"] = tradeActionToString(t.action);
    j["ticker"] = t.ticker;
    j["date"] = t.date;
    j["country"] = t.country;
    j["shares"] = number(t.shares);
    j["price"] = number(t.price);
    j["amount"] = number(t.amount);
    j["amount_ledger"] = number(t.amount_ledger);
    j["exchange_rate"] = number(t.exchange_rate);
    j["fee"] = number(t.fee);
    if (t.action == TradeAction::BUY) {
        j["total_cost"] = number(t.total_cost);
    } else {
        j["net_proceeds"] = number(t.net_proceeds);
        j["profit"] = number(t.profit);
        j["profit_ledger"] = number(t.profit_ledger);
        j["profit_pct"] = number(t.profit_pct);
        j["entry_date"] = t.entry_date;
        j["holding_days"] = t.holding_days;
        j["reason"] = t.reason;
    }
    return j;
}

nlohmann::json ResultSerializer::toJson(const EquitySnapshot& s) {
    nlohmann::json j;
    j["date"] = s.date;
    j["cash"] = number(s.cash);
    j["holdings_value"] = number(s.holdings_value);
    j["equity"] = number(s.equity);
    j["position_count"] = s.position_count;
    j["holdings"] = nlohmann::json::object();
    for (const auto& [ticker, h] : s.holdings) {
        j["holdings"][ticker] = {
            {"shares", number(h.shares)},
            {"avg_cost", number(h.avg_cost)},
            {"current_price", number(h.current_price)},
            {"market_value", number(h.market_value)},
            {"profit_pct", number(h.profit_pct)},
            {"entry_date", h.entry_date},
            {"sector", h.sector},
            {"country", h.country},
            {"exchange_rate", number(h.exchange_rate)}
        };
    }
    return j;
}

nlohmann::json ResultSerializer::toJson(const BacktestResult& result) {
    nlohmann::json j;
    j["success"] = result.success;
    if (!result.success) {
        j["error_kind"] = runErrorToString(result.error_kind);
        j["error"] = result.error;
    }

    const auto& meta = result.date_metadata;
    j["date_metadata"] = {
        {"configured_start", meta.configured_start},
        {"configured_end", meta.configured_end},
        {"actual_start", meta.actual_start},
        {"actual_end", meta.actual_end},
        {"start_adjusted", meta.start_adjusted},
        {"end_adjusted", meta.end_adjusted},
        {"available_dates", meta.available_dates},
        {"trading_days", meta.trading_days}
    };
    if (!result.success) {
        return j;
    }

    j["metrics"] = toJson(result.metrics);
    j["last_rebalance_date"] = result.last_rebalance_date;

    j["equity_curve"] = nlohmann::json::array();
    for (const auto& s : result.equity_curve) {
        j["equity_curve"].push_back(toJson(s));
    }

    j["trades"] = nlohmann::json::array();
    for (const auto& t : result.trades) {
        j["trades"].push_back(toJson(t));
    }

    j["final_positions"] = nlohmann::json::array();
    for (const auto& p : result.final_positions) {
        j["final_positions"].push_back({
            {"ticker", p.ticker},
            {"country", p.country},
            {"sector", p.sector},
            {"shares", number(p.shares)},
            {"avg_cost", number(p.avg_cost)},
            {"last_price", number(p.last_price)},
            {"exchange_rate", number(p.exchange_rate)},
            {"market_value", number(p.market_value)},
            {"profit_pct", number(p.profit_pct)},
            {"entry_date", p.entry_date}
        });
    }

    j["selection_history"] = nlohmann::json::object();
    for (const auto& [date, tickers] : result.selection_history) {
        j["selection_history"][date] = tickers;
    }

    if (result.benchmark) {
        nlohmann::json b;
        b["name"] = result.benchmark->name;
        b["total_return_pct"] = number(result.benchmark->total_return_pct);
        b["curve"] = nlohmann::json::array();
        for (const auto& point : result.benchmark->points) {
            b["curve"].push_back({{"date", point.date}, {"equity", number(point.equity)}});
        }
        j["benchmark"] = b;
    }
    return j;
}

bool ResultSerializer::writeFile(const BacktestResult& result, const std::string& path) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        LOG_ERROR("Failed to open result file: {}", path);
        return false;
    }
    out << toJson(result).dump(2) << "\n";
    LOG_INFO("Result written to {}", path);
    return true;
}

} // namespace backtest
} // namespace finpack
