#include "market/candle_feed.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace pmm {

TickCandleFeed::TickCandleFeed(Timestamp interval_ms, size_t max_records)
    : interval_ms_(interval_ms), window_(max_records) {
    if (interval_ms_ == 0) {
        throw std::invalid_argument("candle interval must be greater than 0");
    }
}

void TickCandleFeed::on_price(Timestamp ts, double price, double volume) {
    if (!running_) return;
    if (!std::isfinite(price) || price <= 0.0) return;

    Timestamp bucket = ts - ts % interval_ms_;

    if (!window_.empty() && bucket == window_.back().timestamp) {
        Candle current = window_.back();
        current.high = std::max(current.high, price);
        current.low = std::min(current.low, price);
        current.close = price;
        current.volume += volume;
        window_.append(current);
        return;
    }

    window_.append(Candle{
        .timestamp = bucket,
        .open      = price,
        .high      = price,
        .low       = price,
        .close     = price,
        .volume    = volume,
    });
}

void TickCandleFeed::on_candle(const Candle& candle) {
    if (!running_) return;
    window_.append(candle);
}

} // namespace pmm
