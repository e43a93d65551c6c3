#pragma once

#include "common/decimal.hpp"
#include "common/types.hpp"
#include "market/indicator_engine.hpp"
#include "strategy/spread_model.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace pmm {

struct CandlesConfig {
    std::string connector   = "binance";
    std::string interval    = "1m";
    size_t      max_records = 1000;
};

// Immutable once built; every component receives the slice it needs at construction.
struct StrategyConfig {
    std::string trading_pair = "ETH-USDT";
    std::string exchange     = "binance_paper_trade";

    Decimal  order_amount         = dec("0.01");
    uint64_t order_refresh_time_s = 15;

    CandlesConfig candles;

    int natr_length = 30;
    int macd_fast   = 12;
    int macd_slow   = 26;
    int macd_signal = 9;

    Decimal bid_natr_scalar = dec("0.012");  // 120 bp per unit NATR
    Decimal ask_natr_scalar = dec("0.006");  // 60 bp per unit NATR
    Decimal macd_weight     = dec("0.5");    // spread shift per unit histogram
    Decimal inventory_phi   = dec("0.01");   // spread shift per unit inv_norm
    Decimal max_inventory   = dec("1");      // base-asset cap for normalization
    Decimal min_spread      = dec("0.00001");

    std::string base_asset() const;
    std::string quote_asset() const;

    Timestamp refresh_interval_ms() const { return order_refresh_time_s * 1000; }
    Timestamp candle_interval_ms() const;

    IndicatorParams indicator_params() const;
    SpreadParams    spread_params() const;

    // Throws std::invalid_argument describing the first violated constraint.
    void validate() const;
};

// "1s", "1m", "5m", "1h", "1d", "1w" -> milliseconds
std::optional<Timestamp> parse_candle_interval(std::string_view interval);

} // namespace pmm
