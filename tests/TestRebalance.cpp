#include "strategy/RebalanceStrategies.h"
#include "strategy/RankingContext.h"

#include <cmath>
#include <iostream>

using namespace finpack;

namespace {
const Date DAY = "2024-01-02";

backtest::MarketData makeData(double a, double b, double c) {
    backtest::MarketData data;
    data.dates = {DAY};
    data.stock_info = {{"A", {COUNTRY_US, "Technology"}}, {"B", {COUNTRY_US, "Technology"}},
                       {"C", {COUNTRY_US, "Energy"}}};
    data.sharpe_rank[DAY]["US"] = {"A", "B", "C"};
    data.sharpe_values[DAY] = {{"A", a}, {"B", b}, {"C", c}};
    return data;
}

backtest::RebalanceSpec spec(const std::string& type, std::map<std::string, double> params = {}) {
    backtest::RebalanceSpec s;
    s.type = type;
    s.params = std::move(params);
    return s;
}
}

int main() {
    const PriceMap prices{{"A", 100.0}, {"B", 50.0}, {"C", 25.0}};
    const SelectionHistory history;

    const auto strong = makeData(3.0, 2.0, 1.0);
    const strategy::RankingContext strong_rank(strong, "us");
    const strategy::EvaluationContext strong_ctx{strong_rank, DAY, prices, strong.stock_info, history, 32.0};

    const std::vector<Ticker> held_a{"A"};
    const std::vector<Ticker> targets_a{"A"};
    const std::vector<Ticker> targets_ab{"A", "B"};

    // Immediate
    {
        auto s = strategy::createRebalanceStrategy(spec("immediate"));
        if (s->shouldRebalance({held_a, targets_a, strong_ctx})) {
            std::cerr << "[TEST] immediate should not rebalance an unchanged set\n";
            return 1;
        }
        if (!s->shouldRebalance({held_a, targets_ab, strong_ctx})) {
            std::cerr << "[TEST] immediate should rebalance a changed set\n";
            return 1;
        }
        if (!s->fillsOpenSlots()) {
            std::cerr << "[TEST] immediate should fill open slots\n";
            return 1;
        }
    }

    // Delayed: market strength gate
    {
        auto s = strategy::createRebalanceStrategy(spec("delayed", {{"top_n", 2}, {"sharpe_threshold", 2.0}}));
        if (!s->shouldRebalance({held_a, targets_ab, strong_ctx})) {
            std::cerr << "[TEST] delayed should buy when top-2 average 2.5 > 2.0\n";
            return 1;
        }
        if (s->shouldRebalance({held_a, targets_a, strong_ctx})) {
            std::cerr << "[TEST] delayed needs a target that is not held\n";
            return 1;
        }

        const auto weak = makeData(2.0, 1.0, 0.5);
        const strategy::RankingContext weak_rank(weak, "us");
        const strategy::EvaluationContext weak_ctx{weak_rank, DAY, prices, weak.stock_info, history, 32.0};
        if (s->shouldRebalance({held_a, targets_ab, weak_ctx})) {
            std::cerr << "[TEST] delayed should wait when top-2 average 1.5 <= 2.0\n";
            return 1;
        }
    }

    // Concentrated: lead of the top K over the next K
    {
        auto s = strategy::createRebalanceStrategy(spec("concentrated", {{"concentrate_top_k", 1}, {"lead_margin", 0.3}}));
        if (!s->shouldRebalance({held_a, targets_ab, strong_ctx})) {
            std::cerr << "[TEST] concentrated: (3-2)/2 = 0.5 >= 0.3 should pass\n";
            return 1;
        }

        const auto close = makeData(3.0, 2.8, 1.0);
        const strategy::RankingContext close_rank(close, "us");
        const strategy::EvaluationContext close_ctx{close_rank, DAY, prices, close.stock_info, history, 32.0};
        if (s->shouldRebalance({held_a, targets_ab, close_ctx})) {
            std::cerr << "[TEST] concentrated: lead 0.07 should not pass\n";
            return 1;
        }

        const auto negative = makeData(0.5, -1.0, -2.0);
        const strategy::RankingContext neg_rank(negative, "us");
        const strategy::EvaluationContext neg_ctx{neg_rank, DAY, prices, negative.stock_info, history, 32.0};
        if (!s->shouldRebalance({held_a, targets_ab, neg_ctx})) {
            std::cerr << "[TEST] concentrated: positive top with non-positive next should pass\n";
            return 1;
        }

        // Global scope: each country contributes its own top K and next K
        backtest::MarketData mixed;
        mixed.dates = {DAY};
        const double us_values[] = {3.0, 3.0, 3.0, 2.9, 2.9, 2.9};
        const double tw_values[] = {1.0, 1.0, 1.0, 0.1, 0.1, 0.1};
        for (int i = 0; i < 6; ++i) {
            const Ticker us = "U" + std::to_string(i + 1);
            const Ticker tw = "T" + std::to_string(i + 1);
            mixed.stock_info[us] = StockInfo{COUNTRY_US, "Technology"};
            mixed.stock_info[tw] = StockInfo{COUNTRY_TW, "Semiconductors"};
            mixed.sharpe_rank[DAY]["US"].push_back(us);
            mixed.sharpe_rank[DAY]["TW"].push_back(tw);
            mixed.sharpe_values[DAY][us] = us_values[i];
            mixed.sharpe_values[DAY][tw] = tw_values[i];
        }
        const strategy::RankingContext mixed_rank(mixed, "global");
        const strategy::EvaluationContext mixed_ctx{mixed_rank, DAY, prices, mixed.stock_info, history, 32.0};
        auto wide = strategy::createRebalanceStrategy(spec("concentrated", {{"concentrate_top_k", 3}, {"lead_margin", 0.3}}));

        const std::vector<Ticker> held_us{"U1", "U2"};
        const std::vector<Ticker> targets_us{"U1", "U2", "U3"};
        if (!wide->shouldRebalance({held_us, targets_us, mixed_ctx})) {
            std::cerr << "[TEST] concentrated global: per-country lead (2.0 - 1.5) / 1.5 should pass\n";
            return 1;
        }

        const std::vector<Ticker> held_three{"U1", "U2", "U6"};
        const std::vector<Ticker> targets_two{"U1", "U2"};
        if (wide->shouldRebalance({held_three, targets_two, mixed_ctx})) {
            std::cerr << "[TEST] concentrated should not rebalance without a new target to buy\n";
            return 1;
        }
    }

    // Batch: fraction of cash split across new names
    {
        auto s = strategy::createRebalanceStrategy(spec("batch", {{"batch_ratio", 0.2}}));
        if (!s->shouldRebalance({held_a, targets_a, strong_ctx}) || s->fillsOpenSlots()) {
            std::cerr << "[TEST] batch always runs and does not fill slots\n";
            return 1;
        }

        portfolio::Portfolio book(1000000.0, backtest::BacktestConfig().fees);
        portfolio::ExecutorOptions opts;
        opts.allow_fractional_us = true;
        portfolio::TradeExecutor exec(book, opts);
        portfolio::ExecutionOptions exec_opts;
        exec_opts.exchange_rate = 32.0;

        const std::vector<Ticker> targets{"B", "C"};
        auto outcome = s->execute(exec, targets, prices, strong.stock_info, DAY, exec_opts);
        if (outcome.buys.size() != 2 || !outcome.sells.empty()) {
            std::cerr << "[TEST] batch should buy the two new targets\n";
            return 1;
        }
        for (const auto& b : outcome.buys) {
            if (!b.success || std::abs(b.trade.amount_ledger - 100000.0) > 1.0) {
                std::cerr << "[TEST] batch should spend 100000 per name, got " << b.trade.amount_ledger << "\n";
                return 1;
            }
        }
    }

    // None
    {
        auto s = strategy::createRebalanceStrategy(spec("none"));
        if (s->shouldRebalance({held_a, targets_ab, strong_ctx}) || s->fillsOpenSlots()) {
            std::cerr << "[TEST] none never deploys capital\n";
            return 1;
        }
    }

    if (strategy::createRebalanceStrategy(spec("bogus")) != nullptr || strategy::isKnownRebalanceType("bogus")) {
        std::cerr << "[TEST] unknown rebalance type should not be created\n";
        return 1;
    }

    std::cout << "[TEST] Rebalance PASSED\n";
    return 0;
}
