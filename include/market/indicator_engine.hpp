#pragma once

#include "common/decimal.hpp"
#include "market/candle.hpp"

#include <algorithm>
#include <cstddef>
#include <variant>
#include <vector>

namespace pmm {

struct IndicatorParams {
    int natr_length = 30;
    int macd_fast   = 12;
    int macd_slow   = 26;
    int macd_signal = 9;

    // Minimum window length before any snapshot is produced
    size_t required_rows() const {
        return static_cast<size_t>(std::max(natr_length, macd_slow + macd_signal));
    }
};

struct IndicatorSnapshot {
    Decimal natr;       // fraction of price
    Decimal macd_hist;  // price units
};

enum class NotReadyReason {
    InsufficientHistory,
    MissingValue,
    NumericConversion,
};

struct NotReady {
    NotReadyReason reason = NotReadyReason::InsufficientHistory;
};

const char* to_string(NotReadyReason reason);

using IndicatorResult = std::variant<IndicatorSnapshot, NotReady>;

// Series helpers. Undefined entries are NaN; outputs have the input's length.
namespace indicators {

// TR_i = max(high_i - low_i, |high_i - close_{i-1}|, |low_i - close_{i-1}|); TR_0 undefined.
std::vector<double> true_range(const CandleWindow& window);

// Wilder-smoothed ATR divided by close, seeded with the mean of the first `length` TRs.
std::vector<double> natr(const CandleWindow& window, int length);

// EMA with alpha = 2 / (period + 1), seeded with the mean of the first `period`
// defined values. Leading NaNs are skipped.
std::vector<double> ema(const std::vector<double>& values, int period);

// (EMA_fast - EMA_slow) - EMA_signal(EMA_fast - EMA_slow)
std::vector<double> macd_histogram(const std::vector<double>& closes,
                                   int fast, int slow, int signal);

} // namespace indicators

class IndicatorEngine {
public:
    explicit IndicatorEngine(IndicatorParams params);

    // Snapshot of the newest row, or the reason no snapshot can be produced.
    IndicatorResult evaluate(const CandleWindow& window) const;

    const IndicatorParams& params() const { return params_; }

private:
    IndicatorParams params_;
};

} // namespace pmm
