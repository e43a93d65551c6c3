#pragma once

#include "common/decimal.hpp"
#include "strategy/spread_model.hpp"

namespace pmm {

struct TopOfBook {
    Decimal best_bid;
    Decimal best_ask;

    bool crossed() const { return best_bid > best_ask; }
};

struct QuotePair {
    Decimal buy_price;
    Decimal sell_price;
};

/// Turns fractional spreads into absolute prices around the reference price and
/// clips them so a new quote never trades through the prevailing top of book:
/// buy_price <= best_bid and sell_price >= best_ask.
///
/// The clip is applied literally even when the external book is crossed
/// (best_bid > best_ask); callers can detect that case with TopOfBook::crossed().
class QuoteGuard {
public:
    // Throws std::invalid_argument if ref_price is not positive.
    QuotePair make_quotes(Decimal ref_price, const Spreads& spreads,
                          const TopOfBook& top) const;
};

} // namespace pmm
