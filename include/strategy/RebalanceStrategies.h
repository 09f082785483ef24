#pragma once

#include "strategy/IRebalanceStrategy.h"
#include "backtest/BacktestConfig.h"
#include <memory>
#include <string>

namespace finpack {
namespace strategy {

// Rebalance whenever the target set differs from the held set
class ImmediateRebalance : public IRebalanceStrategy {
public:
    std::string getId() const override { return "immediate"; }
    bool shouldRebalance(const RebalanceContext& ctx) const override;
};

// Spend a fixed fraction of cash per cycle, split across new names
class BatchRebalance : public IRebalanceStrategy {
public:
    explicit BatchRebalance(double batch_ratio) : batch_ratio_(batch_ratio) {}

    std::string getId() const override { return "batch"; }
    bool shouldRebalance(const RebalanceContext& ctx) const override;
    portfolio::RebalanceOutcome execute(portfolio::TradeExecutor& executor,
                                        const std::vector<Ticker>& targets,
                                        const PriceMap& prices,
                                        const StockInfoMap& stock_info,
                                        const Date& date,
                                        const portfolio::ExecutionOptions& opts) const override;
    bool fillsOpenSlots() const override { return false; }

private:
    double batch_ratio_;
};

// Buy only when the top-N average Sharpe shows market strength
class DelayedRebalance : public IRebalanceStrategy {
public:
    DelayedRebalance(int top_n, double sharpe_threshold)
        : top_n_(top_n), sharpe_threshold_(sharpe_threshold) {}

    std::string getId() const override { return "delayed"; }
    bool shouldRebalance(const RebalanceContext& ctx) const override;

private:
    int top_n_;
    double sharpe_threshold_;
};

// Buy only when the top K lead the next K by a margin
class ConcentratedRebalance : public IRebalanceStrategy {
public:
    ConcentratedRebalance(int top_k, double lead_margin)
        : top_k_(top_k), lead_margin_(lead_margin) {}

    std::string getId() const override { return "concentrated"; }
    bool shouldRebalance(const RebalanceContext& ctx) const override;

private:
    int top_k_;
    double lead_margin_;
};

// Buy and hold; exits come from sell conditions only
class NoRebalance : public IRebalanceStrategy {
public:
    std::string getId() const override { return "none"; }
    bool shouldRebalance(const RebalanceContext&) const override { return false; }
    portfolio::RebalanceOutcome execute(portfolio::TradeExecutor&, const std::vector<Ticker>&,
                                        const PriceMap&, const StockInfoMap&, const Date&,
                                        const portfolio::ExecutionOptions&) const override {
        return {};
    }
    bool fillsOpenSlots() const override { return false; }
};

std::unique_ptr<IRebalanceStrategy> createRebalanceStrategy(const backtest::RebalanceSpec& spec);
bool isKnownRebalanceType(const std::string& type);

} // namespace strategy
} // namespace finpack
