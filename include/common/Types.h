#pragma once

#include <string>
#include <vector>
#include <map>

namespace finpack {

using Date = std::string;       // ISO "YYYY-MM-DD"
using Ticker = std::string;
using Price = double;
using Amount = double;
using Shares = double;

using PriceMap = std::map<Ticker, Price>;

// Country codes used by the input bundle
constexpr const char* COUNTRY_US = "US";
constexpr const char* COUNTRY_TW = "TW";

enum class TradeAction { BUY, SELL };

// Per-trade rejection reasons. Never a run-level failure.
enum class TradeRejection {
    NONE,
    INSUFFICIENT_CASH,
    NO_POSITION,
    INSUFFICIENT_SHARES,
    MAX_POSITIONS_REACHED,
    AMOUNT_TOO_SMALL,
    INVALID_ORDER,
    NO_PRICE
};

std::string tradeActionToString(TradeAction action);
std::string tradeRejectionToString(TradeRejection reason);

struct StockInfo {
    std::string country;
    std::string sector;
};

using StockInfoMap = std::map<Ticker, StockInfo>;

// Append-only trade log entry
struct TradeRecord {
    TradeAction action;
    Ticker ticker;
    Date date;
    std::string country;
    Shares shares;
    Price price;                // native currency
    Amount amount;              // native currency
    Amount amount_ledger;       // ledger currency
    double exchange_rate;       // 1.0 for ledger-currency instruments
    Amount fee;                 // ledger currency
    Amount total_cost;          // buy: amount_ledger + fee
    Amount net_proceeds;        // sell: amount_ledger - fee

    // sell only
    Amount profit;              // native currency
    Amount profit_ledger;
    double profit_pct;
    Date entry_date;
    int holding_days;
    std::string reason;

    TradeRecord()
        : action(TradeAction::BUY)
        , shares(0), price(0), amount(0), amount_ledger(0)
        , exchange_rate(1.0), fee(0), total_cost(0), net_proceeds(0)
        , profit(0), profit_ledger(0), profit_pct(0), holding_days(0)
    {}
};

struct TradeResult {
    bool success = false;
    TradeRejection rejection = TradeRejection::NONE;
    TradeRecord trade;

    static TradeResult rejected(TradeRejection reason) {
        TradeResult r;
        r.rejection = reason;
        return r;
    }
};

// Per-ticker holding detail captured at end of day
struct HoldingSnapshot {
    Shares shares = 0;
    Price avg_cost = 0;
    Price current_price = 0;
    Amount market_value = 0;    // ledger currency
    double profit_pct = 0;
    Date entry_date;
    std::string sector;
    std::string country;
    double exchange_rate = 1.0;
};

struct EquitySnapshot {
    Date date;
    Amount cash = 0;
    Amount holdings_value = 0;
    Amount equity = 0;
    int position_count = 0;
    std::map<Ticker, HoldingSnapshot> holdings;
};

using SelectionHistory = std::map<Date, std::vector<Ticker>>;

} // namespace finpack
