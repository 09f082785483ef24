#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "backtest/MarketData.h"

namespace finpack {
namespace backtest {

class DataHistory {
public:
    // Load a market bundle from a JSON file.
    // Keys: dates, prices, stock_info, sharpe_rank, growth_rank,
    // sharpe_values, growth_values, exchange_rates, benchmark
    static std::optional<MarketData> loadBundle(const std::string& file_path);

    // nullopt when prices or stock_info are missing or not objects
    static std::optional<MarketData> fromJson(const nlohmann::json& j);

private:
    static void parseRankings(const nlohmann::json& j, RankingTable& out);
    static void parseValues(const nlohmann::json& j, ValueTable& out);
};

} // namespace backtest
} // namespace finpack
