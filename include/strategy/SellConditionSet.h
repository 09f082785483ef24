#pragma once

#include "strategy/ISellCondition.h"
#include "backtest/BacktestConfig.h"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace finpack {
namespace strategy {

// Independent sell predicates combined with OR. Every condition is evaluated
// each day so that rolling counters stay in step.
class SellConditionSet {
public:
    SellConditionSet() = default;

    static SellConditionSet fromConfig(const std::map<std::string, backtest::RuleSpec>& specs);
    static std::unique_ptr<ISellCondition> create(const std::string& id, const backtest::RuleSpec& spec);
    static const std::vector<std::string>& registeredIds();
    static bool isKnown(const std::string& id);

    void addCondition(std::unique_ptr<ISellCondition> condition);

    // Reasons of all triggered conditions joined with "; "
    SellDecision evaluate(const Ticker& ticker, portfolio::Position& position,
                          const EvaluationContext& ctx) const;

    bool empty() const { return conditions_.empty(); }
    std::vector<std::string> getConditionIds() const;

private:
    std::vector<std::unique_ptr<ISellCondition>> conditions_;
};

} // namespace strategy
} // namespace finpack
