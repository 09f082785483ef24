#include "backtest/BacktestConfig.h"
#include "common/DateUtils.h"
#include "strategy/BuyPipeline.h"
#include "strategy/SellConditionSet.h"
#include "strategy/RebalanceStrategies.h"

#include <cmath>

namespace finpack {
namespace backtest {

std::string rebalanceFrequencyToString(RebalanceFrequency freq) {
    switch (freq) {
        case RebalanceFrequency::DAILY: return "daily";
        case RebalanceFrequency::WEEKLY: return "weekly";
        case RebalanceFrequency::MONTHLY: return "monthly";
        default: return "unknown";
    }
}

std::vector<std::string> BacktestConfig::validate() const {
    std::vector<std::string> errors;

    if (!(initial_capital > 0.0) || !std::isfinite(initial_capital)) {
        errors.push_back("initial_capital must be positive");
    }
    if (!(amount_per_stock > 0.0) || !std::isfinite(amount_per_stock)) {
        errors.push_back("amount_per_stock must be positive");
    }
    if (max_positions < 1 || max_positions > 100) {
        errors.push_back("max_positions must be between 1 and 100");
    }
    if (market != "us" && market != "tw" && market != "global") {
        errors.push_back("unknown market: " + market);
    }
    if (!(tw_lot_size > 0.0)) {
        errors.push_back("tw_lot_size must be positive");
    }
    if (!(default_exchange_rate > 0.0)) {
        errors.push_back("default_exchange_rate must be positive");
    }

    if (start_date.empty()) {
        errors.push_back("start_date is required");
    } else if (!utils::DateUtils::isValid(start_date)) {
        errors.push_back("invalid start_date: " + start_date);
    }
    if (!end_date.empty()) {
        if (!utils::DateUtils::isValid(end_date)) {
            errors.push_back("invalid end_date: " + end_date);
        } else if (utils::DateUtils::isValid(start_date) && start_date > end_date) {
            errors.push_back("start_date " + start_date + " is after end_date " + end_date);
        }
    }

    for (const auto& [country, rule] : fees) {
        if (rule.rate < 0.0 || rule.rate > 1.0) {
            errors.push_back("fee rate for " + country + " must be within [0, 1]");
        }
        if (rule.min_fee < 0.0) {
            errors.push_back("minimum fee for " + country + " must not be negative");
        }
    }

    bool has_universe_filter = false;
    for (const auto& [id, spec] : buy_conditions) {
        auto category = strategy::BuyPipeline::categoryOf(strategy::BuyPipeline::normalizeId(id));
        if (!category) {
            errors.push_back("unknown buy condition: " + id);
            continue;
        }
        if (spec.enabled && *category == strategy::BuyCategory::UNIVERSE_FILTER) {
            has_universe_filter = true;
        }
    }
    if (!has_universe_filter) {
        errors.push_back("at least one sharpe_rank, sharpe_threshold or sharpe_streak buy condition must be enabled");
    }

    for (const auto& [id, spec] : sell_conditions) {
        if (!strategy::SellConditionSet::isKnown(id)) {
            errors.push_back("unknown sell condition: " + id);
        }
    }

    if (!strategy::isKnownRebalanceType(rebalance.type)) {
        errors.push_back("unknown rebalance strategy: " + rebalance.type);
    }

    return errors;
}

} // namespace backtest
} // namespace finpack
