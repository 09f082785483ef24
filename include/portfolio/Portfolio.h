#pragma once

#include "common/Types.h"
#include "backtest/BacktestConfig.h"
#include <map>
#include <string>
#include <vector>

namespace finpack {
namespace portfolio {

// Open position. Cost basis stays in the instrument's native currency.
struct Position {
    Ticker ticker;
    Shares shares;
    Price avg_cost;
    std::string country;
    Date entry_date;

    // Rolling sell-rule state, persists while the position is open
    Price highest_price;        // highest native price seen since entry
    int rank_fail_streak;       // consecutive days outside the Sharpe top-K
    int not_selected_streak;    // consecutive selections missing this ticker
    int weakness_streak;        // consecutive days weak on both rankings

    Position()
        : shares(0), avg_cost(0), highest_price(0)
        , rank_fail_streak(0), not_selected_streak(0), weakness_streak(0)
    {}
};

struct PortfolioValue {
    Amount cash = 0;
    Amount position_value = 0;
    Amount total_value = 0;
};

// Ledger: cash in the ledger currency (TWD), positions in native currency.
class Portfolio {
public:
    Portfolio(double initial_capital, std::map<std::string, backtest::FeeRule> fees,
              std::string ledger_country = COUNTRY_TW);

    void reset();

    // Unknown countries use the US schedule
    backtest::FeeRule feeRuleFor(const std::string& country) const;

    // fee = max(amount_ledger * rate, min_fee)
    double calculateFee(double amount_ledger, const std::string& country) const;

    // Rate applied to a native amount of this country (1.0 for the ledger country)
    double exchangeRateFor(const std::string& country, double exchange_rate) const;

    TradeResult buy(const Ticker& ticker, Shares shares, Price price,
                    const std::string& country, const Date& date, double exchange_rate);

    // shares == 0 sells the entire position
    TradeResult sell(const Ticker& ticker, Shares shares, Price price,
                     const Date& date, const std::string& reason, double exchange_rate);

    // Positions without a price are valued at cost
    PortfolioValue calculateValue(const PriceMap& prices, double exchange_rate) const;

    // Called once per day after all trades; returns the stored snapshot
    const EquitySnapshot& recordHistory(const Date& date, const PriceMap& prices,
                                        const StockInfoMap& stock_info, double exchange_rate);

    // Raise highest_price of open positions to today's price
    void updatePeaks(const PriceMap& prices);

    bool hasPosition(const Ticker& ticker) const { return positions_.count(ticker) > 0; }
    const Position* getPosition(const Ticker& ticker) const;
    Position* findPosition(const Ticker& ticker);
    std::vector<Ticker> getHoldings() const;

    const std::map<Ticker, Position>& getPositions() const { return positions_; }
    int getPositionCount() const { return static_cast<int>(positions_.size()); }
    double getCash() const { return cash_; }
    double getInitialCapital() const { return initial_capital_; }
    double getTotalFees() const { return total_fees_; }
    double getRealizedProfit() const { return realized_profit_; }
    const std::string& getLedgerCountry() const { return ledger_country_; }

    const std::vector<EquitySnapshot>& getEquityCurve() const { return history_; }
    const std::vector<TradeRecord>& getTradeLog() const { return trades_; }

private:
    double initial_capital_;
    double cash_;
    double total_fees_;
    double realized_profit_;    // ledger currency
    std::string ledger_country_;
    std::map<std::string, backtest::FeeRule> fees_;

    std::map<Ticker, Position> positions_;
    std::vector<TradeRecord> trades_;
    std::vector<EquitySnapshot> history_;
};

} // namespace portfolio
} // namespace finpack
