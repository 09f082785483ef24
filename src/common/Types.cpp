#include "common/Types.h"

namespace finpack {

std::string tradeActionToString(TradeAction action) {
    return action == TradeAction::BUY ? "buy" : "sell";
}

std::string tradeRejectionToString(TradeRejection reason) {
    switch (reason) {
        case TradeRejection::NONE: return "none";
        case TradeRejection::INSUFFICIENT_CASH: return "insufficient_cash";
        case TradeRejection::NO_POSITION: return "no_position";
        case TradeRejection::INSUFFICIENT_SHARES: return "insufficient_shares";
        case TradeRejection::MAX_POSITIONS_REACHED: return "max_positions_reached";
        case TradeRejection::AMOUNT_TOO_SMALL: return "amount_too_small";
        case TradeRejection::INVALID_ORDER: return "invalid_order";
        case TradeRejection::NO_PRICE: return "no_price";
    }
    return "unknown";
}

} // namespace finpack
