#pragma once

#include "common/decimal.hpp"
#include "market/indicator_engine.hpp"

namespace pmm {

struct SpreadParams {
    Decimal bid_natr_scalar = dec("0.012");
    Decimal ask_natr_scalar = dec("0.006");
    Decimal macd_weight     = dec("0.5");
    Decimal inventory_phi   = dec("0.01");
    Decimal max_inventory   = dec("1");
    Decimal min_spread      = dec("0.00001");
};

// All spreads are fractions of the reference price.
struct Spreads {
    Decimal bid_spread;      // floored
    Decimal ask_spread;      // floored
    Decimal raw_bid_spread;  // before the floor
    Decimal raw_ask_spread;  // before the floor
    Decimal inv_norm;        // in [-1, 1]
};

/// Volatility base spread, then trend skew, then inventory penalty, then floor.
/// Each stage adjusts the previous stage's result.
class SpreadModel {
public:
    explicit SpreadModel(SpreadParams params);

    Spreads compute(const IndicatorSnapshot& snapshot, Decimal base_balance) const;

    // clamp(balance / max_inventory, -1, 1); zero when max_inventory is not positive
    Decimal normalize_inventory(Decimal base_balance) const;

    const SpreadParams& params() const { return params_; }

private:
    struct SidePair {
        Decimal bid;
        Decimal ask;
    };

    SidePair base_spreads(Decimal natr) const;
    void apply_trend_skew(SidePair& s, Decimal macd_hist) const;
    void apply_inventory_penalty(SidePair& s, Decimal inv_norm) const;
    SidePair apply_floor(const SidePair& s) const;

    SpreadParams params_;
};

} // namespace pmm
