#pragma once

#include "common/Types.h"
#include "strategy/RankingContext.h"

namespace finpack {
namespace strategy {

// Everything a rule may look at for one simulated day. Read-only.
struct EvaluationContext {
    const RankingContext& rankings;
    Date date;
    const PriceMap& prices;                     // native, carried forward
    const StockInfoMap& stock_info;
    const SelectionHistory& selection_history;  // previous days only during sell checks
    double exchange_rate;
};

} // namespace strategy
} // namespace finpack
