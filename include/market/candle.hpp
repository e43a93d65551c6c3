#pragma once

#include "common/types.hpp"

#include <cstddef>
#include <deque>

namespace pmm {

struct Candle {
    Timestamp timestamp = 0;   // bucket open time
    double    open      = 0.0;
    double    high      = 0.0;
    double    low       = 0.0;
    double    close     = 0.0;
    double    volume    = 0.0;
};

/// Time-ordered OHLCV window bounded to max_records. Appending past the bound
/// evicts the oldest candle. A candle carrying the newest timestamp replaces the
/// newest entry (the in-progress candle).
class CandleWindow {
public:
    explicit CandleWindow(size_t max_records);

    // Returns false and leaves the window untouched when the candle is older
    // than the newest entry.
    bool append(const Candle& candle);

    const Candle& operator[](size_t idx) const { return candles_[idx]; }
    const Candle& back() const { return candles_.back(); }

    size_t size() const { return candles_.size(); }
    bool   empty() const { return candles_.empty(); }
    size_t max_records() const { return max_records_; }

    void clear() { candles_.clear(); }

    auto begin() const { return candles_.begin(); }
    auto end() const { return candles_.end(); }

private:
    size_t             max_records_;
    std::deque<Candle> candles_;
};

} // namespace pmm
