#pragma once

#include "market/candle.hpp"

namespace pmm {

class ICandleFeed {
public:
    virtual ~ICandleFeed() = default;
    virtual void start() = 0;
    virtual void stop() = 0;
    virtual const CandleWindow& candles() const = 0;
};

/// Builds candles of a fixed interval from price ticks. Ticks are bucketed by
/// floor(ts / interval); the newest candle keeps updating until a tick from a
/// later bucket arrives. Ticks are ignored while the feed is stopped.
class TickCandleFeed : public ICandleFeed {
public:
    // Throws std::invalid_argument when interval_ms is zero.
    TickCandleFeed(Timestamp interval_ms, size_t max_records);

    void start() override { running_ = true; }
    void stop() override { running_ = false; }
    bool running() const { return running_; }

    const CandleWindow& candles() const override { return window_; }

    // Non-positive or non-finite prices and ticks older than the newest bucket are dropped.
    void on_price(Timestamp ts, double price, double volume = 0.0);

    // Appends a completed candle as delivered by an upstream source.
    void on_candle(const Candle& candle);

    Timestamp interval_ms() const { return interval_ms_; }

private:
    Timestamp    interval_ms_;
    CandleWindow window_;
    bool         running_ = false;
};

} // namespace pmm
