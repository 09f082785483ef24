#pragma once

#include <map>
#include <string>
#include <vector>
#include "common/Types.h"

namespace finpack {
namespace backtest {

// Rebalance cadence
enum class RebalanceFrequency {
    DAILY,
    WEEKLY,
    MONTHLY
};

std::string rebalanceFrequencyToString(RebalanceFrequency freq);

// Fee = max(amount_ledger * rate, min_fee)
struct FeeRule {
    double rate = 0.0;
    double min_fee = 0.0;
};

// One configured rule: enabled flag plus numeric parameters (booleans are 0/1)
struct RuleSpec {
    bool enabled = false;
    std::map<std::string, double> params;

    double param(const std::string& name, double fallback) const {
        auto it = params.find(name);
        return it != params.end() ? it->second : fallback;
    }
};

struct RebalanceSpec {
    std::string type = "delayed";
    std::map<std::string, double> params;

    double param(const std::string& name, double fallback) const {
        auto it = params.find(name);
        return it != params.end() ? it->second : fallback;
    }
};

// Backtest input parameters
struct BacktestConfig {
    double initial_capital;          // ledger currency (TWD)
    double amount_per_stock;         // ledger currency per new position
    int max_positions;
    std::string market;              // "us", "tw", "global"
    Date start_date;
    Date end_date;                   // empty = last available date
    RebalanceFrequency rebalance_frequency;

    // Execution
    double default_exchange_rate;    // USD -> TWD when the bundle has no rate
    bool allow_partial_fill;
    bool allow_fractional_us;
    double tw_lot_size;
    std::map<std::string, FeeRule> fees;   // keyed by country code

    // Rules
    std::map<std::string, RuleSpec> buy_conditions;
    std::map<std::string, RuleSpec> sell_conditions;
    RebalanceSpec rebalance;

    BacktestConfig()
        : initial_capital(1000000.0)
        , amount_per_stock(100000.0)
        , max_positions(10)
        , market("us")
        , start_date("2024-01-01")
        , rebalance_frequency(RebalanceFrequency::WEEKLY)
        , default_exchange_rate(32.0)
        , allow_partial_fill(true)
        , allow_fractional_us(false)
        , tw_lot_size(1000.0)
    {
        fees[COUNTRY_US] = FeeRule{0.003, 15.0};
        fees[COUNTRY_TW] = FeeRule{0.006, 0.0};

        buy_conditions["sharpe_rank"] = RuleSpec{true, {{"top_n", 15}}};
        buy_conditions["sharpe_threshold"] = RuleSpec{true, {{"threshold", 1.0}}};
        buy_conditions["growth_streak"] = RuleSpec{true, {{"days", 2}, {"percentile", 30}}};
        buy_conditions["sort_sharpe"] = RuleSpec{true, {{"select_n", 5}}};

        sell_conditions["sharpe_fail"] = RuleSpec{true, {{"periods", 2}, {"top_n", 15}}};
        sell_conditions["drawdown"] = RuleSpec{true, {{"threshold", 0.40}, {"from_highest", 0}}};

        rebalance.type = "delayed";
        rebalance.params = {{"top_n", 5}, {"sharpe_threshold", 0.0}};
    }

    // Input-validation errors; empty when the config can be run
    std::vector<std::string> validate() const;
};

} // namespace backtest
} // namespace finpack
