#include "strategy/BuyPipeline.h"
#include "strategy/BuyConditions.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>

namespace finpack {
namespace strategy {

namespace {
std::string trimLower(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

int intParam(const backtest::RuleSpec& spec, const std::string& name, int fallback) {
    return static_cast<int>(spec.param(name, fallback));
}
}

const std::vector<std::string>& BuyPipeline::registeredIds() {
    static const std::vector<std::string> ids = {
        "sharpe_rank", "sharpe_threshold", "sharpe_streak",
        "growth_rank", "growth_streak",
        "sort_sharpe", "sort_sector"
    };
    return ids;
}

std::optional<BuyCategory> BuyPipeline::categoryOf(const std::string& raw_id) {
    const std::string id = normalizeId(raw_id);
    if (id == "sharpe_rank" || id == "sharpe_threshold" || id == "sharpe_streak") {
        return BuyCategory::UNIVERSE_FILTER;
    }
    if (id == "growth_rank" || id == "growth_streak") {
        return BuyCategory::MOMENTUM_FILTER;
    }
    if (id == "sort_sharpe" || id == "sort_sector") {
        return BuyCategory::SELECTOR;
    }
    return std::nullopt;
}

std::string BuyPipeline::normalizeId(const std::string& id) {
    std::string name = trimLower(id);
    if (name == "sort_industry") {
        return "sort_sector";
    }
    return name;
}

std::unique_ptr<IBuyCondition> BuyPipeline::create(const std::string& raw_id, const backtest::RuleSpec& spec) {
    const std::string id = normalizeId(raw_id);
    if (id == "sharpe_rank") {
        return std::make_unique<RankTopNCondition>(id, BuyCategory::UNIVERSE_FILTER, Metric::SHARPE,
                                                   intParam(spec, "top_n", 15));
    }
    if (id == "sharpe_threshold") {
        return std::make_unique<ThresholdCondition>(id, Metric::SHARPE, spec.param("threshold", 1.0));
    }
    if (id == "sharpe_streak") {
        return std::make_unique<RankStreakCondition>(id, Metric::SHARPE, intParam(spec, "days", 3),
                                                     intParam(spec, "top_n", 10));
    }
    if (id == "growth_rank") {
        return std::make_unique<RankTopNCondition>(id, BuyCategory::MOMENTUM_FILTER, Metric::GROWTH,
                                                   intParam(spec, "top_n", 7));
    }
    if (id == "growth_streak") {
        return std::make_unique<PercentileStreakCondition>(id, Metric::GROWTH, intParam(spec, "days", 2),
                                                           spec.param("percentile", 30.0));
    }
    if (id == "sort_sharpe") {
        return std::make_unique<MetricSortSelector>(id, Metric::SHARPE, intParam(spec, "select_n", 5));
    }
    if (id == "sort_sector") {
        const int per_sector = intParam(spec, "per_sector", intParam(spec, "per_industry", 2));
        return std::make_unique<SectorRoundRobinSelector>(id, Metric::SHARPE, intParam(spec, "select_n", 5),
                                                          per_sector);
    }
    return nullptr;
}

BuyPipeline BuyPipeline::fromConfig(const std::map<std::string, backtest::RuleSpec>& specs) {
    std::map<std::string, const backtest::RuleSpec*> normalized;
    for (const auto& [raw_id, spec] : specs) {
        const std::string id = normalizeId(raw_id);
        if (!categoryOf(id)) {
            LOG_WARN("Unknown buy condition ignored: {}", raw_id);
            continue;
        }
        normalized[id] = &spec;
    }

    BuyPipeline pipeline;
    for (const auto& id : registeredIds()) {
        auto it = normalized.find(id);
        if (it == normalized.end() || !it->second->enabled) {
            continue;
        }
        pipeline.addCondition(create(id, *it->second));
    }
    return pipeline;
}

void BuyPipeline::addCondition(std::unique_ptr<IBuyCondition> condition) {
    if (condition) {
        conditions_.push_back(std::move(condition));
    }
}

std::vector<Ticker> BuyPipeline::select(const EvaluationContext& ctx) const {
    return apply(ctx.rankings.universe(), ctx);
}

std::vector<Ticker> BuyPipeline::apply(const std::vector<Ticker>& universe, const EvaluationContext& ctx) const {
    std::vector<Ticker> candidates = universe;

    for (const auto category : {BuyCategory::UNIVERSE_FILTER, BuyCategory::MOMENTUM_FILTER}) {
        for (const auto& c : conditions_) {
            if (c->getCategory() == category) {
                candidates = c->filter(candidates, ctx);
            }
        }
    }

    // Selectors do not compose; the last one wins
    const IBuyCondition* selector = nullptr;
    for (const auto& c : conditions_) {
        if (c->getCategory() == BuyCategory::SELECTOR) {
            selector = c.get();
        }
    }
    if (selector != nullptr) {
        candidates = selector->filter(candidates, ctx);
    }
    return candidates;
}

std::vector<std::string> BuyPipeline::getConditionIds() const {
    std::vector<std::string> ids;
    for (const auto& c : conditions_) {
        ids.push_back(c->getId());
    }
    return ids;
}

} // namespace strategy
} // namespace finpack
