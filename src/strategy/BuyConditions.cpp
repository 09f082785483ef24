#include "strategy/BuyConditions.h"

#include <algorithm>
#include <cmath>
#include <set>
#include <utility>

namespace finpack {
namespace strategy {

namespace {
std::vector<Ticker> keepMembers(const std::vector<Ticker>& tickers, const std::set<Ticker>& allowed) {
    std::vector<Ticker> out;
    for (const auto& t : tickers) {
        if (allowed.count(t) > 0) {
            out.push_back(t);
        }
    }
    return out;
}

// Tickers present in every per-day set
std::vector<Ticker> keepInAll(const std::vector<Ticker>& tickers, const std::vector<std::set<Ticker>>& days) {
    std::vector<Ticker> out;
    for (const auto& t : tickers) {
        bool ok = true;
        for (const auto& day : days) {
            if (day.count(t) == 0) {
                ok = false;
                break;
            }
        }
        if (ok) {
            out.push_back(t);
        }
    }
    return out;
}
}

// ===== RankTopNCondition =====

RankTopNCondition::RankTopNCondition(std::string id, BuyCategory category, Metric metric, int top_n)
    : id_(std::move(id)), category_(category), metric_(metric), top_n_(top_n) {}

std::vector<Ticker> RankTopNCondition::filter(const std::vector<Ticker>& tickers,
                                              const EvaluationContext& ctx) const {
    const auto top = ctx.rankings.topN(metric_, ctx.date, top_n_);
    return keepMembers(tickers, std::set<Ticker>(top.begin(), top.end()));
}

// ===== ThresholdCondition =====

ThresholdCondition::ThresholdCondition(std::string id, Metric metric, double threshold)
    : id_(std::move(id)), metric_(metric), threshold_(threshold) {}

std::vector<Ticker> ThresholdCondition::filter(const std::vector<Ticker>& tickers,
                                               const EvaluationContext& ctx) const {
    std::vector<Ticker> out;
    for (const auto& t : tickers) {
        const auto v = ctx.rankings.value(metric_, ctx.date, t);
        if (v && *v >= threshold_) {
            out.push_back(t);
        }
    }
    return out;
}

// ===== RankStreakCondition =====

RankStreakCondition::RankStreakCondition(std::string id, Metric metric, int days, int top_n)
    : id_(std::move(id)), metric_(metric), days_(days), top_n_(top_n) {}

std::vector<Ticker> RankStreakCondition::filter(const std::vector<Ticker>& tickers,
                                                const EvaluationContext& ctx) const {
    const auto dates = ctx.rankings.rankingLookback(metric_, ctx.date, days_);
    if (dates.empty()) {
        return {};
    }
    std::vector<std::set<Ticker>> per_day;
    for (const auto& d : dates) {
        const auto top = ctx.rankings.topN(metric_, d, top_n_);
        per_day.emplace_back(top.begin(), top.end());
    }
    return keepInAll(tickers, per_day);
}

// ===== PercentileStreakCondition =====

PercentileStreakCondition::PercentileStreakCondition(std::string id, Metric metric, int days, double percentile)
    : id_(std::move(id)), metric_(metric), days_(days), percentile_(percentile) {}

std::vector<Ticker> PercentileStreakCondition::filter(const std::vector<Ticker>& tickers,
                                                      const EvaluationContext& ctx) const {
    const auto dates = ctx.rankings.rankingLookback(metric_, ctx.date, days_);
    if (dates.empty()) {
        return {};
    }
    std::vector<std::set<Ticker>> per_day;
    for (const auto& d : dates) {
        std::set<Ticker> day;
        for (const auto& country : ctx.rankings.scopeCountries(metric_, d)) {
            const int size = ctx.rankings.rankingSize(metric_, d, country);
            const int n = static_cast<int>(std::ceil(size * percentile_ / 100.0));
            for (const auto& t : ctx.rankings.countryTopN(metric_, d, country, n)) {
                day.insert(t);
            }
        }
        per_day.push_back(std::move(day));
    }
    return keepInAll(tickers, per_day);
}

// ===== MetricSortSelector =====

MetricSortSelector::MetricSortSelector(std::string id, Metric metric, int select_n)
    : id_(std::move(id)), metric_(metric), select_n_(select_n) {}

std::vector<Ticker> MetricSortSelector::filter(const std::vector<Ticker>& tickers,
                                               const EvaluationContext& ctx) const {
    std::vector<std::pair<Ticker, double>> scored;
    for (const auto& t : tickers) {
        const auto v = ctx.rankings.value(metric_, ctx.date, t);
        if (v) {
            scored.emplace_back(t, *v);
        }
    }
    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    std::vector<Ticker> out;
    for (const auto& [t, v] : scored) {
        if (static_cast<int>(out.size()) >= select_n_) break;
        out.push_back(t);
    }
    return out;
}

// ===== SectorRoundRobinSelector =====

SectorRoundRobinSelector::SectorRoundRobinSelector(std::string id, Metric metric, int select_n, int per_sector)
    : id_(std::move(id)), metric_(metric), select_n_(select_n), per_sector_(per_sector) {}

std::vector<Ticker> SectorRoundRobinSelector::filter(const std::vector<Ticker>& tickers,
                                                     const EvaluationContext& ctx) const {
    struct SectorGroup {
        std::string sector;
        std::vector<std::pair<Ticker, double>> members;
    };

    // Groups in first-appearance order
    std::vector<SectorGroup> groups;
    for (const auto& t : tickers) {
        std::string sector = UNCLASSIFIED;
        auto info = ctx.stock_info.find(t);
        if (info != ctx.stock_info.end() && !info->second.sector.empty()) {
            sector = info->second.sector;
        }
        auto g = std::find_if(groups.begin(), groups.end(),
                              [&](const SectorGroup& x) { return x.sector == sector; });
        if (g == groups.end()) {
            groups.push_back(SectorGroup{sector, {}});
            g = groups.end() - 1;
        }
        g->members.emplace_back(t, ctx.rankings.value(metric_, ctx.date, t).value_or(0.0));
    }

    for (auto& g : groups) {
        std::stable_sort(g.members.begin(), g.members.end(),
                         [](const auto& a, const auto& b) { return a.second > b.second; });
    }
    std::stable_sort(groups.begin(), groups.end(), [](const SectorGroup& a, const SectorGroup& b) {
        return a.members.front().second > b.members.front().second;
    });

    std::vector<Ticker> out;
    for (int round = 0; round < per_sector_; ++round) {
        for (const auto& g : groups) {
            if (static_cast<int>(out.size()) >= select_n_) {
                return out;
            }
            if (round < static_cast<int>(g.members.size())) {
                out.push_back(g.members[round].first);
            }
        }
    }
    return out;
}

} // namespace strategy
} // namespace finpack
