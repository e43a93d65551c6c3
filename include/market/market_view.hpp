#pragma once

#include "common/decimal.hpp"
#include "common/types.hpp"

#include <string>
#include <vector>

namespace pmm {

struct BookLevel {
    Decimal price;
    Decimal quantity;
};

struct BookSnapshot {
    Timestamp timestamp = 0;
    std::vector<BookLevel> bids;   // best first
    std::vector<BookLevel> asks;   // best first

    bool has_both_sides() const { return !bids.empty() && !asks.empty(); }

    Decimal best_bid() const { return bids.empty() ? Decimal{} : bids.front().price; }
    Decimal best_ask() const { return asks.empty() ? Decimal{} : asks.front().price; }
    Decimal mid_price() const { return (best_bid() + best_ask()) / Decimal(2); }
};

class IMarketView {
public:
    virtual ~IMarketView() = default;

    // True once the connector can quote and trade the pair
    virtual bool is_ready() const = 0;

    virtual Decimal get_price_by_type(const std::string& trading_pair, PriceType type) const = 0;
};

} // namespace pmm
