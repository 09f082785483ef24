#include "strategy/SellConditions.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace finpack {
namespace strategy {

namespace {
bool outsideTopK(const std::optional<int>& rank, int k) {
    return !rank || *rank >= k;
}
}

SellDecision RankFailCondition::check(const Ticker& ticker, portfolio::Position& position,
                                      const EvaluationContext& ctx) const {
    if (!ctx.rankings.hasRanking(Metric::SHARPE, ctx.date)) {
        return {};
    }

    const auto rank = ctx.rankings.rankOf(Metric::SHARPE, ctx.date, position.country, ticker);
    if (outsideTopK(rank, top_n_)) {
        position.rank_fail_streak++;
    } else {
        position.rank_fail_streak = 0;
    }

    if (position.rank_fail_streak >= periods_) {
        std::ostringstream oss;
        oss << "sharpe_fail: outside top " << top_n_ << " for " << position.rank_fail_streak << " periods";
        return {true, oss.str()};
    }
    return {};
}

SellDecision GrowthFailCondition::check(const Ticker& ticker, portfolio::Position& /*position*/,
                                        const EvaluationContext& ctx) const {
    const auto dates = ctx.rankings.valueLookback(Metric::GROWTH, ctx.date, days_);
    if (dates.empty()) {
        return {};
    }

    double sum = 0.0;
    int count = 0;
    for (const auto& d : dates) {
        const auto v = ctx.rankings.value(Metric::GROWTH, d, ticker);
        if (v) {
            sum += *v;
            count++;
        }
    }
    if (count == 0) {
        return {};
    }

    const double avg = sum / count;
    if (avg < threshold_) {
        std::ostringstream oss;
        oss << "growth_fail: " << days_ << "-day average " << std::fixed << std::setprecision(2)
            << avg << " below " << threshold_;
        return {true, oss.str()};
    }
    return {};
}

SellDecision NotSelectedCondition::check(const Ticker& ticker, portfolio::Position& position,
                                         const EvaluationContext& ctx) const {
    // Latest selection strictly before today
    auto it = ctx.selection_history.lower_bound(ctx.date);
    if (it == ctx.selection_history.begin()) {
        return {};
    }
    --it;
    if (it->first < position.entry_date) {
        return {};
    }

    const auto& selected = it->second;
    if (std::find(selected.begin(), selected.end(), ticker) == selected.end()) {
        position.not_selected_streak++;
    } else {
        position.not_selected_streak = 0;
    }

    if (position.not_selected_streak >= periods_) {
        std::ostringstream oss;
        oss << "not_selected: missing from " << position.not_selected_streak << " selections";
        return {true, oss.str()};
    }
    return {};
}

SellDecision DrawdownCondition::check(const Ticker& ticker, portfolio::Position& position,
                                      const EvaluationContext& ctx) const {
    auto price_it = ctx.prices.find(ticker);
    if (price_it == ctx.prices.end()) {
        return {};
    }

    const double reference = from_highest_
        ? std::max(position.avg_cost, position.highest_price)
        : position.avg_cost;
    if (reference <= 0.0) {
        return {};
    }

    const double drop = (reference - price_it->second) / reference;
    if (drop >= threshold_) {
        std::ostringstream oss;
        oss << "drawdown: -" << std::fixed << std::setprecision(1) << drop * 100.0 << "% from "
            << (from_highest_ ? "high" : "cost");
        return {true, oss.str()};
    }
    return {};
}

SellDecision WeaknessCondition::check(const Ticker& ticker, portfolio::Position& position,
                                      const EvaluationContext& ctx) const {
    if (!ctx.rankings.hasRanking(Metric::SHARPE, ctx.date) ||
        !ctx.rankings.hasRanking(Metric::GROWTH, ctx.date)) {
        return {};
    }

    const bool sharpe_weak = outsideTopK(
        ctx.rankings.rankOf(Metric::SHARPE, ctx.date, position.country, ticker), rank_k_);
    const bool growth_weak = outsideTopK(
        ctx.rankings.rankOf(Metric::GROWTH, ctx.date, position.country, ticker), rank_k_);

    if (sharpe_weak && growth_weak) {
        position.weakness_streak++;
    } else {
        position.weakness_streak = 0;
    }

    if (position.weakness_streak >= periods_) {
        std::ostringstream oss;
        oss << "weakness: both ranks outside top " << rank_k_ << " for "
            << position.weakness_streak << " periods";
        return {true, oss.str()};
    }
    return {};
}

} // namespace strategy
} // namespace finpack
