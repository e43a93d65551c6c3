#include "strategy/spread_model.hpp"

#include <algorithm>

namespace pmm {

SpreadModel::SpreadModel(SpreadParams params)
    : params_(std::move(params)) {}

Spreads SpreadModel::compute(const IndicatorSnapshot& snapshot, Decimal base_balance) const {
    SidePair s = base_spreads(snapshot.natr);
    apply_trend_skew(s, snapshot.macd_hist);

    Decimal inv_norm = normalize_inventory(base_balance);
    apply_inventory_penalty(s, inv_norm);

    SidePair floored = apply_floor(s);

    return Spreads{
        .bid_spread     = floored.bid,
        .ask_spread     = floored.ask,
        .raw_bid_spread = s.bid,
        .raw_ask_spread = s.ask,
        .inv_norm       = inv_norm,
    };
}

Decimal SpreadModel::normalize_inventory(Decimal base_balance) const {
    if (params_.max_inventory <= Decimal{}) return Decimal{};

    const Decimal one(1);
    Decimal q = base_balance / params_.max_inventory;
    return std::clamp(q, -one, one);
}

SpreadModel::SidePair SpreadModel::base_spreads(Decimal natr) const {
    return SidePair{
        .bid = natr * params_.bid_natr_scalar,
        .ask = natr * params_.ask_natr_scalar,
    };
}

void SpreadModel::apply_trend_skew(SidePair& s, Decimal macd_hist) const {
    // Bullish histogram: quote the bid closer and lean the ask away
    Decimal shift = params_.macd_weight * macd_hist;
    s.bid -= shift;
    s.ask += shift;
}

void SpreadModel::apply_inventory_penalty(SidePair& s, Decimal inv_norm) const {
    // Long inventory: back off the bid, tighten the ask
    Decimal shift = params_.inventory_phi * inv_norm;
    s.bid += shift;
    s.ask -= shift;
}

SpreadModel::SidePair SpreadModel::apply_floor(const SidePair& s) const {
    return SidePair{
        .bid = std::max(s.bid, params_.min_spread),
        .ask = std::max(s.ask, params_.min_spread),
    };
}

} // namespace pmm
