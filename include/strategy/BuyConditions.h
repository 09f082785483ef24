#pragma once

#include "strategy/IBuyCondition.h"
#include <string>

namespace finpack {
namespace strategy {

// Ticker is in the per-country top N of a metric ranking for the date
class RankTopNCondition : public IBuyCondition {
public:
    RankTopNCondition(std::string id, BuyCategory category, Metric metric, int top_n);

    std::string getId() const override { return id_; }
    BuyCategory getCategory() const override { return category_; }
    std::vector<Ticker> filter(const std::vector<Ticker>& tickers,
                               const EvaluationContext& ctx) const override;

private:
    std::string id_;
    BuyCategory category_;
    Metric metric_;
    int top_n_;
};

// Metric value for the date is at least threshold
class ThresholdCondition : public IBuyCondition {
public:
    ThresholdCondition(std::string id, Metric metric, double threshold);

    std::string getId() const override { return id_; }
    BuyCategory getCategory() const override { return BuyCategory::UNIVERSE_FILTER; }
    std::vector<Ticker> filter(const std::vector<Ticker>& tickers,
                               const EvaluationContext& ctx) const override;

private:
    std::string id_;
    Metric metric_;
    double threshold_;
};

// Top N on each of the last `days` ranking dates
class RankStreakCondition : public IBuyCondition {
public:
    RankStreakCondition(std::string id, Metric metric, int days, int top_n);

    std::string getId() const override { return id_; }
    BuyCategory getCategory() const override { return BuyCategory::UNIVERSE_FILTER; }
    std::vector<Ticker> filter(const std::vector<Ticker>& tickers,
                               const EvaluationContext& ctx) const override;

private:
    std::string id_;
    Metric metric_;
    int days_;
    int top_n_;
};

// Within the top `percentile` percent of each country ranking on each of the last `days` dates
class PercentileStreakCondition : public IBuyCondition {
public:
    PercentileStreakCondition(std::string id, Metric metric, int days, double percentile);

    std::string getId() const override { return id_; }
    BuyCategory getCategory() const override { return BuyCategory::MOMENTUM_FILTER; }
    std::vector<Ticker> filter(const std::vector<Ticker>& tickers,
                               const EvaluationContext& ctx) const override;

private:
    std::string id_;
    Metric metric_;
    int days_;
    double percentile_;
};

// Highest metric value first, first select_n kept
class MetricSortSelector : public IBuyCondition {
public:
    MetricSortSelector(std::string id, Metric metric, int select_n);

    std::string getId() const override { return id_; }
    BuyCategory getCategory() const override { return BuyCategory::SELECTOR; }
    std::vector<Ticker> filter(const std::vector<Ticker>& tickers,
                               const EvaluationContext& ctx) const override;

private:
    std::string id_;
    Metric metric_;
    int select_n_;
};

// Round-robin over sectors ordered by their best metric value
class SectorRoundRobinSelector : public IBuyCondition {
public:
    SectorRoundRobinSelector(std::string id, Metric metric, int select_n, int per_sector);

    std::string getId() const override { return id_; }
    BuyCategory getCategory() const override { return BuyCategory::SELECTOR; }
    std::vector<Ticker> filter(const std::vector<Ticker>& tickers,
                               const EvaluationContext& ctx) const override;

    static constexpr const char* UNCLASSIFIED = "Unclassified";

private:
    std::string id_;
    Metric metric_;
    int select_n_;
    int per_sector_;
};

} // namespace strategy
} // namespace finpack
