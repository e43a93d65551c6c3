#include "strategy/quote_guard.hpp"

#include <algorithm>
#include <stdexcept>

namespace pmm {

QuotePair QuoteGuard::make_quotes(Decimal ref_price, const Spreads& spreads,
                                  const TopOfBook& top) const {
    if (ref_price <= Decimal{}) {
        throw std::invalid_argument("reference price must be positive, got " + ref_price.to_string());
    }

    const Decimal one(1);

    Decimal buy_price = ref_price * (one - spreads.bid_spread);
    Decimal sell_price = ref_price * (one + spreads.ask_spread);

    return QuotePair{
        .buy_price  = std::min(buy_price, top.best_bid),
        .sell_price = std::max(sell_price, top.best_ask),
    };
}

} // namespace pmm
