#pragma once

#include "common/decimal.hpp"
#include "common/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace pmm {

// Paper-trading harness settings: starting balances and the synthetic book.
struct PaperTradeConfig {
    Decimal initial_base  = dec("1");
    Decimal initial_quote = dec("10000");

    double    start_price      = 3000.0;
    double    volatility       = 0.0005;  // per-tick stddev of log returns
    double    book_spread_bps  = 2.0;     // synthetic top-of-book width
    size_t    book_depth       = 5;
    Timestamp tick_interval_ms = 1000;
    uint64_t  seed             = 42;
    int       price_decimals   = 2;

    std::string data_file;  // CSV: timestamp_ms,bid,bid_qty,ask,ask_qty

    // Throws std::invalid_argument describing the first violated constraint.
    void validate() const;
};

} // namespace pmm
