#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "common/Types.h"
#include "backtest/BacktestConfig.h"
#include "backtest/MarketData.h"
#include "analytics/PerformanceReport.h"
#include "analytics/Benchmark.h"

namespace finpack {
namespace backtest {

enum class EngineState {
    NOT_STARTED,
    RUNNING,
    COMPLETED,
    FAILED
};

enum class RunError {
    NONE,
    ALREADY_RUNNING,
    INVALID_INPUT,
    NO_TRADING_DAYS,
    MALFORMED_INPUT,
    INTERNAL
};

std::string engineStateToString(EngineState state);
std::string runErrorToString(RunError error);

// Configured vs. simulated date range
struct DateMetadata {
    Date configured_start;
    Date configured_end;        // empty when open-ended
    Date actual_start;
    Date actual_end;
    bool start_adjusted = false;
    bool end_adjusted = false;
    int available_dates = 0;    // dates in the bundle
    int trading_days = 0;       // dates simulated
};

struct FinalPosition {
    Ticker ticker;
    std::string country;
    std::string sector;
    Shares shares = 0;
    Price avg_cost = 0;         // native
    Price last_price = 0;       // native
    double exchange_rate = 1.0;
    Amount market_value = 0;    // ledger currency
    double profit_pct = 0;
    Date entry_date;
};

struct BacktestResult {
    bool success = false;
    RunError error_kind = RunError::NONE;
    std::string error;

    analytics::PerformanceMetrics metrics;
    std::vector<EquitySnapshot> equity_curve;
    std::vector<TradeRecord> trades;
    std::vector<FinalPosition> final_positions;
    SelectionHistory selection_history;
    DateMetadata date_metadata;
    Date last_rebalance_date;
    std::optional<analytics::BenchmarkCurve> benchmark;

    static BacktestResult failure(RunError kind, const std::string& message) {
        BacktestResult r;
        r.error_kind = kind;
        r.error = message;
        return r;
    }
};

struct Progress {
    int day_index = 0;          // 1-based
    int total_days = 0;
    Date date;
    double equity = 0.0;
};

// Daily state machine over a read-only market bundle. One run at a time per instance.
class BacktestEngine {
public:
    using ProgressCallback = std::function<void(const Progress&)>;

    explicit BacktestEngine(BacktestConfig config);

    // Invoked after each day's snapshot; must not be relied on for ordering
    void setProgressCallback(ProgressCallback callback) { progress_callback_ = std::move(callback); }

    // Never throws; failures are reported in the result
    BacktestResult run(const MarketData& data);

    EngineState getState() const { return state_.load(); }
    bool isRunning() const { return running_.load(); }
    const BacktestConfig& getConfig() const { return config_; }

private:
    BacktestResult simulate(const MarketData& data);

    // Trading dates inside the configured range; fills metadata
    std::vector<Date> resolveTradingDates(const MarketData& data, DateMetadata& meta) const;

    bool isRebalanceDay(const Date& date, const Date& previous, bool first_day) const;

    BacktestConfig config_;
    ProgressCallback progress_callback_;
    std::atomic<bool> running_;
    std::atomic<EngineState> state_;
};

} // namespace backtest
} // namespace finpack
