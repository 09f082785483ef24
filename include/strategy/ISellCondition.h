#pragma once

#include "common/Types.h"
#include "portfolio/Portfolio.h"
#include "strategy/EvaluationContext.h"
#include <string>

namespace finpack {
namespace strategy {

struct SellDecision {
    bool should_sell = false;
    std::string reason;
};

// Per-position sell predicate. May advance the position's rolling counters.
class ISellCondition {
public:
    virtual ~ISellCondition() = default;

    virtual std::string getId() const = 0;

    // Called once per held position per day
    virtual SellDecision check(const Ticker& ticker, portfolio::Position& position,
                               const EvaluationContext& ctx) const = 0;
};

} // namespace strategy
} // namespace finpack
