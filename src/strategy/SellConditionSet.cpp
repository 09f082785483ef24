#include "strategy/SellConditionSet.h"
#include "strategy/SellConditions.h"
#include "strategy/BuyPipeline.h"
#include "common/Logger.h"

#include <algorithm>

namespace finpack {
namespace strategy {

const std::vector<std::string>& SellConditionSet::registeredIds() {
    static const std::vector<std::string> ids = {
        "sharpe_fail", "growth_fail", "not_selected", "drawdown", "weakness"
    };
    return ids;
}

bool SellConditionSet::isKnown(const std::string& id) {
    const auto& ids = registeredIds();
    return std::find(ids.begin(), ids.end(), BuyPipeline::normalizeId(id)) != ids.end();
}

std::unique_ptr<ISellCondition> SellConditionSet::create(const std::string& raw_id,
                                                         const backtest::RuleSpec& spec) {
    const std::string id = BuyPipeline::normalizeId(raw_id);
    if (id == "sharpe_fail") {
        return std::make_unique<RankFailCondition>(static_cast<int>(spec.param("periods", 2)),
                                                   static_cast<int>(spec.param("top_n", 15)));
    }
    if (id == "growth_fail") {
        return std::make_unique<GrowthFailCondition>(static_cast<int>(spec.param("days", 5)),
                                                     spec.param("threshold", 0.0));
    }
    if (id == "not_selected") {
        return std::make_unique<NotSelectedCondition>(static_cast<int>(spec.param("periods", 3)));
    }
    if (id == "drawdown") {
        return std::make_unique<DrawdownCondition>(spec.param("threshold", 0.40),
                                                   spec.param("from_highest", 0.0) != 0.0);
    }
    if (id == "weakness") {
        return std::make_unique<WeaknessCondition>(static_cast<int>(spec.param("rank_k", 20)),
                                                   static_cast<int>(spec.param("periods", 3)));
    }
    return nullptr;
}

SellConditionSet SellConditionSet::fromConfig(const std::map<std::string, backtest::RuleSpec>& specs) {
    SellConditionSet set;
    for (const auto& entry : specs) {
        if (!isKnown(entry.first)) {
            LOG_WARN("Unknown sell condition ignored: {}", entry.first);
        }
    }
    for (const auto& id : registeredIds()) {
        for (const auto& [raw_id, spec] : specs) {
            if (BuyPipeline::normalizeId(raw_id) == id && spec.enabled) {
                set.addCondition(create(id, spec));
                break;
            }
        }
    }
    return set;
}

void SellConditionSet::addCondition(std::unique_ptr<ISellCondition> condition) {
    if (condition) {
        conditions_.push_back(std::move(condition));
    }
}

SellDecision SellConditionSet::evaluate(const Ticker& ticker, portfolio::Position& position,
                                        const EvaluationContext& ctx) const {
    SellDecision combined;
    for (const auto& c : conditions_) {
        const SellDecision d = c->check(ticker, position, ctx);
        if (!d.should_sell) {
            continue;
        }
        combined.should_sell = true;
        if (!combined.reason.empty()) {
            combined.reason += "; ";
        }
        combined.reason += d.reason;
    }
    return combined;
}

std::vector<std::string> SellConditionSet::getConditionIds() const {
    std::vector<std::string> ids;
    for (const auto& c : conditions_) {
        ids.push_back(c->getId());
    }
    return ids;
}

} // namespace strategy
} // namespace finpack
