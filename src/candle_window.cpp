#include "market/candle.hpp"

namespace pmm {

CandleWindow::CandleWindow(size_t max_records)
    : max_records_(max_records > 0 ? max_records : 1) {}

bool CandleWindow::append(const Candle& candle) {
    if (!candles_.empty()) {
        if (candle.timestamp < candles_.back().timestamp) return false;
        if (candle.timestamp == candles_.back().timestamp) {
            candles_.back() = candle;
            return true;
        }
    }

    candles_.push_back(candle);
    if (candles_.size() > max_records_) {
        candles_.pop_front();
    }
    return true;
}

} // namespace pmm
