#pragma once

#include "strategy/ISellCondition.h"

namespace finpack {
namespace strategy {

// Consecutive days outside the own-country Sharpe top K (rank_fail_streak)
class RankFailCondition : public ISellCondition {
public:
    RankFailCondition(int periods, int top_n) : periods_(periods), top_n_(top_n) {}

    std::string getId() const override { return "sharpe_fail"; }
    SellDecision check(const Ticker& ticker, portfolio::Position& position,
                       const EvaluationContext& ctx) const override;

private:
    int periods_;
    int top_n_;
};

// Rolling average of Growth values over the last N dates below threshold
class GrowthFailCondition : public ISellCondition {
public:
    GrowthFailCondition(int days, double threshold) : days_(days), threshold_(threshold) {}

    std::string getId() const override { return "growth_fail"; }
    SellDecision check(const Ticker& ticker, portfolio::Position& position,
                       const EvaluationContext& ctx) const override;

private:
    int days_;
    double threshold_;
};

// Missing from consecutive selections (not_selected_streak)
class NotSelectedCondition : public ISellCondition {
public:
    explicit NotSelectedCondition(int periods) : periods_(periods) {}

    std::string getId() const override { return "not_selected"; }
    SellDecision check(const Ticker& ticker, portfolio::Position& position,
                       const EvaluationContext& ctx) const override;

private:
    int periods_;
};

// Decline from cost, or from the highest price since entry
class DrawdownCondition : public ISellCondition {
public:
    DrawdownCondition(double threshold, bool from_highest)
        : threshold_(threshold), from_highest_(from_highest) {}

    std::string getId() const override { return "drawdown"; }
    SellDecision check(const Ticker& ticker, portfolio::Position& position,
                       const EvaluationContext& ctx) const override;

private:
    double threshold_;      // fraction, 0.40 = 40%
    bool from_highest_;
};

// Weak on both rankings on the same day for N consecutive days (weakness_streak)
class WeaknessCondition : public ISellCondition {
public:
    WeaknessCondition(int rank_k, int periods) : rank_k_(rank_k), periods_(periods) {}

    std::string getId() const override { return "weakness"; }
    SellDecision check(const Ticker& ticker, portfolio::Position& position,
                       const EvaluationContext& ctx) const override;

private:
    int rank_k_;
    int periods_;
};

} // namespace strategy
} // namespace finpack
