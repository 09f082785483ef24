#pragma once

#include "strategy/IBuyCondition.h"
#include "backtest/BacktestConfig.h"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace finpack {
namespace strategy {

// Ordered buy-condition chain: A filters, then B filters, then the last C selector.
class BuyPipeline {
public:
    BuyPipeline() = default;

    // Enabled conditions in registry order; unknown ids are skipped with a warning
    static BuyPipeline fromConfig(const std::map<std::string, backtest::RuleSpec>& specs);

    static std::unique_ptr<IBuyCondition> create(const std::string& id, const backtest::RuleSpec& spec);

    // Registered identifiers in evaluation order
    static const std::vector<std::string>& registeredIds();
    static std::optional<BuyCategory> categoryOf(const std::string& id);

    // Lower-case, trimmed, legacy aliases mapped
    static std::string normalizeId(const std::string& id);

    void addCondition(std::unique_ptr<IBuyCondition> condition);

    // Today's candidates starting from the context universe
    std::vector<Ticker> select(const EvaluationContext& ctx) const;

    std::vector<Ticker> apply(const std::vector<Ticker>& universe, const EvaluationContext& ctx) const;

    std::vector<std::string> getConditionIds() const;
    size_t size() const { return conditions_.size(); }

private:
    std::vector<std::unique_ptr<IBuyCondition>> conditions_;
};

} // namespace strategy
} // namespace finpack
