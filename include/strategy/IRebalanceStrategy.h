#pragma once

#include "common/Types.h"
#include "portfolio/TradeExecutor.h"
#include "strategy/EvaluationContext.h"
#include <string>
#include <vector>

namespace finpack {
namespace strategy {

struct RebalanceContext {
    const std::vector<Ticker>& holdings;
    const std::vector<Ticker>& targets;
    const EvaluationContext& eval;
};

// Gates when new capital may be deployed and how much
class IRebalanceStrategy {
public:
    virtual ~IRebalanceStrategy() = default;

    virtual std::string getId() const = 0;

    virtual bool shouldRebalance(const RebalanceContext& ctx) const = 0;

    // Default: sell holdings outside targets, buy new targets at the standard amount
    virtual portfolio::RebalanceOutcome execute(portfolio::TradeExecutor& executor,
                                                const std::vector<Ticker>& targets,
                                                const PriceMap& prices,
                                                const StockInfoMap& stock_info,
                                                const Date& date,
                                                const portfolio::ExecutionOptions& opts) const {
        return executor.executeRebalance(targets, prices, stock_info, date, opts);
    }

    // Whether remaining open slots may be filled after an authorized cycle
    virtual bool fillsOpenSlots() const { return true; }
};

} // namespace strategy
} // namespace finpack
