#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "backtest/BacktestEngine.h"

namespace finpack {
namespace backtest {

// JSON export of run results. Non-finite numbers are written as
// "Infinity", "-Infinity" or "NaN" and parsed back to the same value.
class ResultSerializer {
public:
    static nlohmann::json toJson(const BacktestResult& result);
    static nlohmann::json toJson(const analytics::PerformanceMetrics& metrics);
    static nlohmann::json toJson(const TradeRecord& trade);
    static nlohmann::json toJson(const EquitySnapshot& snapshot);

    static analytics::PerformanceMetrics metricsFromJson(const nlohmann::json& j);

    static nlohmann::json number(double v);
    static double readNumber(const nlohmann::json& j, const std::string& key, double fallback = 0.0);

    // Writes toJson(result) with 2-space indent; false when the file cannot be opened
    static bool writeFile(const BacktestResult& result, const std::string& path);
};

} // namespace backtest
} // namespace finpack
