#pragma once

#include "common/Types.h"
#include "strategy/EvaluationContext.h"
#include <string>
#include <vector>

namespace finpack {
namespace strategy {

// Pipeline stage a buy condition belongs to
enum class BuyCategory {
    UNIVERSE_FILTER,    // A: intersected in order
    MOMENTUM_FILTER,    // B: intersected after A
    SELECTOR            // C: only the last enabled one runs
};

// Buy condition interface
class IBuyCondition {
public:
    virtual ~IBuyCondition() = default;

    virtual std::string getId() const = 0;
    virtual BuyCategory getCategory() const = 0;

    // Returns a subset of tickers (filters) or an ordered pick from them (selectors)
    virtual std::vector<Ticker> filter(const std::vector<Ticker>& tickers,
                                       const EvaluationContext& ctx) const = 0;
};

} // namespace strategy
} // namespace finpack
