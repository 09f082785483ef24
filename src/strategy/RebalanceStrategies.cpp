#include "strategy/RebalanceStrategies.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <set>

namespace finpack {
namespace strategy {

namespace {
std::vector<Ticker> notHeld(const std::vector<Ticker>& targets, const std::vector<Ticker>& holdings) {
    const std::set<Ticker> held(holdings.begin(), holdings.end());
    std::vector<Ticker> out;
    for (const auto& t : targets) {
        if (held.count(t) == 0) {
            out.push_back(t);
        }
    }
    return out;
}

double averageValue(const std::vector<Ticker>& tickers, const EvaluationContext& ctx) {
    if (tickers.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    for (const auto& t : tickers) {
        sum += ctx.rankings.value(Metric::SHARPE, ctx.date, t).value_or(0.0);
    }
    return sum / static_cast<double>(tickers.size());
}
}

bool ImmediateRebalance::shouldRebalance(const RebalanceContext& ctx) const {
    if (ctx.holdings.size() != ctx.targets.size()) {
        return true;
    }
    return !notHeld(ctx.targets, ctx.holdings).empty();
}

bool BatchRebalance::shouldRebalance(const RebalanceContext&) const {
    return true;
}

portfolio::RebalanceOutcome BatchRebalance::execute(portfolio::TradeExecutor& executor,
                                                    const std::vector<Ticker>& targets,
                                                    const PriceMap& prices,
                                                    const StockInfoMap& stock_info,
                                                    const Date& date,
                                                    const portfolio::ExecutionOptions& opts) const {
    portfolio::RebalanceOutcome outcome;
    const auto& portfolio = executor.getPortfolio();

    std::vector<Ticker> to_buy;
    for (const auto& t : targets) {
        if (!portfolio.hasPosition(t) && prices.count(t) > 0 && stock_info.count(t) > 0) {
            to_buy.push_back(t);
        }
    }
    if (to_buy.empty()) {
        return outcome;
    }

    portfolio::ExecutionOptions batch_opts = opts;
    batch_opts.amount = portfolio.getCash() * batch_ratio_ / static_cast<double>(to_buy.size());
    LOG_INFO("Batch cycle {}: {} names, {:.0f} each", date, to_buy.size(), *batch_opts.amount);

    for (const auto& t : to_buy) {
        outcome.buys.push_back(executor.executeBuy(t, prices.at(t), stock_info.at(t).country, date, batch_opts));
    }
    return outcome;
}

bool DelayedRebalance::shouldRebalance(const RebalanceContext& ctx) const {
    if (notHeld(ctx.targets, ctx.holdings).empty()) {
        return false;
    }
    const auto top = ctx.eval.rankings.topN(Metric::SHARPE, ctx.eval.date, top_n_);
    const double avg = averageValue(top, ctx.eval);
    if (avg <= sharpe_threshold_) {
        LOG_INFO("Delayed entry on {}: top-{} Sharpe {:.3f} <= {:.3f}", ctx.eval.date, top_n_, avg,
                 sharpe_threshold_);
        return false;
    }
    return true;
}

bool ConcentratedRebalance::shouldRebalance(const RebalanceContext& ctx) const {
    if (notHeld(ctx.targets, ctx.holdings).empty() || top_k_ <= 0) {
        return false;
    }

    // Top K and next K are sliced per country, then pooled
    const size_t k = static_cast<size_t>(top_k_);
    std::vector<Ticker> top;
    std::vector<Ticker> next;
    for (const auto& country : ctx.eval.rankings.scopeCountries(Metric::SHARPE, ctx.eval.date)) {
        const auto head = ctx.eval.rankings.countryTopN(Metric::SHARPE, ctx.eval.date, country, top_k_ * 2);
        for (size_t i = 0; i < head.size(); ++i) {
            (i < k ? top : next).push_back(head[i]);
        }
    }
    if (top.empty()) {
        return false;
    }

    const double top_avg = averageValue(top, ctx.eval);
    const double next_avg = averageValue(next, ctx.eval);

    if (next_avg <= 0.0) {
        return top_avg > 0.0;
    }
    return (top_avg - next_avg) / std::abs(next_avg) >= lead_margin_;
}

std::unique_ptr<IRebalanceStrategy> createRebalanceStrategy(const backtest::RebalanceSpec& spec) {
    if (spec.type == "immediate") {
        return std::make_unique<ImmediateRebalance>();
    }
    if (spec.type == "batch") {
        return std::make_unique<BatchRebalance>(spec.param("batch_ratio", 0.20));
    }
    if (spec.type == "delayed") {
        return std::make_unique<DelayedRebalance>(static_cast<int>(spec.param("top_n", 5)),
                                                  spec.param("sharpe_threshold", 0.0));
    }
    if (spec.type == "concentrated") {
        return std::make_unique<ConcentratedRebalance>(static_cast<int>(spec.param("concentrate_top_k", 3)),
                                                       spec.param("lead_margin", 0.30));
    }
    if (spec.type == "none") {
        return std::make_unique<NoRebalance>();
    }
    return nullptr;
}

bool isKnownRebalanceType(const std::string& type) {
    return type == "immediate" || type == "batch" || type == "delayed" ||
           type == "concentrated" || type == "none";
}

} // namespace strategy
} // namespace finpack
