#pragma once

#include "common/Types.h"
#include "portfolio/Portfolio.h"
#include <optional>
#include <string>
#include <vector>

namespace finpack {
namespace portfolio {

struct ExecutorOptions {
    double amount_per_stock;
    int max_positions;
    bool allow_partial_fill;
    bool allow_fractional_us;   // US shares may be fractional
    double tw_lot_size;         // TW shares are rounded down to this multiple
    double default_exchange_rate;

    ExecutorOptions()
        : amount_per_stock(100000.0)
        , max_positions(10)
        , allow_partial_fill(true)
        , allow_fractional_us(false)
        , tw_lot_size(1000.0)
        , default_exchange_rate(32.0)
    {}
};

// Per-call overrides
struct ExecutionOptions {
    std::optional<double> amount;      // ledger currency, default amount_per_stock
    double exchange_rate = 32.0;
};

struct RebalanceOutcome {
    std::vector<TradeResult> sells;
    std::vector<TradeResult> buys;
};

struct CostEstimate {
    Shares shares = 0;
    Amount amount = 0;          // native
    Amount amount_ledger = 0;
    Amount fee = 0;
    Amount total = 0;           // buy: amount_ledger + fee, sell: amount_ledger - fee
};

// Sizing, lot rounding and partial fills on top of the Portfolio ledger
class TradeExecutor {
public:
    TradeExecutor(Portfolio& portfolio, ExecutorOptions options);

    TradeResult executeBuy(const Ticker& ticker, Price price, const std::string& country,
                           const Date& date, const ExecutionOptions& opts);

    // shares == 0 sells everything
    TradeResult executeSell(const Ticker& ticker, Price price, const Date& date,
                            const std::string& reason, double exchange_rate, Shares shares = 0);

    // Sell holdings outside targets, then buy targets not yet held
    RebalanceOutcome executeRebalance(const std::vector<Ticker>& targets, const PriceMap& prices,
                                      const StockInfoMap& stock_info, const Date& date,
                                      const ExecutionOptions& opts);

    // Shares an amount (ledger currency) buys, quantized for the market
    Shares calculateShares(double amount, Price price, const std::string& country,
                           double exchange_rate) const;

    // Largest quantity whose cost plus fee fits in cash
    Shares calculateMaxAffordableShares(double cash, Price price, const std::string& country,
                                        double exchange_rate) const;

    CostEstimate estimateBuyCost(Shares shares, Price price, const std::string& country,
                                 double exchange_rate) const;
    CostEstimate estimateSellProceeds(const Ticker& ticker, Price price, double exchange_rate,
                                      Shares shares = 0) const;

    const ExecutorOptions& getOptions() const { return options_; }
    const Portfolio& getPortfolio() const { return portfolio_; }

private:
    Shares quantize(Shares raw, const std::string& country) const;
    double lotSize(const std::string& country) const;

    Portfolio& portfolio_;
    ExecutorOptions options_;
};

} // namespace portfolio
} // namespace finpack
