#include "market/indicator_engine.hpp"

#include <cmath>
#include <limits>

namespace pmm {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

} // anonymous namespace

const char* to_string(NotReadyReason reason) {
    switch (reason) {
        case NotReadyReason::InsufficientHistory: return "insufficient candle history";
        case NotReadyReason::MissingValue:        return "indicator value missing";
        case NotReadyReason::NumericConversion:   return "indicator value not convertible";
    }
    return "unknown";
}

namespace indicators {

std::vector<double> true_range(const CandleWindow& window) {
    std::vector<double> tr(window.size(), kNaN);
    for (size_t i = 1; i < window.size(); ++i) {
        const auto& c = window[i];
        double prev_close = window[i - 1].close;
        tr[i] = std::max({c.high - c.low,
                          std::abs(c.high - prev_close),
                          std::abs(c.low - prev_close)});
    }
    return tr;
}

std::vector<double> natr(const CandleWindow& window, int length) {
    std::vector<double> out(window.size(), kNaN);
    if (length <= 0) return out;

    auto n = static_cast<size_t>(length);
    if (window.size() < n + 1) return out;

    auto tr = true_range(window);

    // First ATR lands on row n: mean of TR_1..TR_n
    double sum = 0.0;
    for (size_t i = 1; i <= n; ++i) sum += tr[i];
    double atr = sum / static_cast<double>(n);

    for (size_t i = n; i < window.size(); ++i) {
        if (i > n) {
            atr = (atr * static_cast<double>(n - 1) + tr[i]) / static_cast<double>(n);
        }
        double close = window[i].close;
        out[i] = (close > 0.0) ? atr / close : kNaN;
    }
    return out;
}

std::vector<double> ema(const std::vector<double>& values, int period) {
    std::vector<double> out(values.size(), kNaN);
    if (period <= 0) return out;

    size_t start = 0;
    while (start < values.size() && std::isnan(values[start])) ++start;

    auto p = static_cast<size_t>(period);
    if (values.size() - start < p) return out;

    double sum = 0.0;
    for (size_t i = start; i < start + p; ++i) sum += values[i];
    double value = sum / static_cast<double>(p);
    out[start + p - 1] = value;

    double alpha = 2.0 / (static_cast<double>(period) + 1.0);
    for (size_t i = start + p; i < values.size(); ++i) {
        value = alpha * values[i] + (1.0 - alpha) * value;
        out[i] = value;
    }
    return out;
}

std::vector<double> macd_histogram(const std::vector<double>& closes,
                                   int fast, int slow, int signal) {
    auto fast_ema = ema(closes, fast);
    auto slow_ema = ema(closes, slow);

    std::vector<double> macd(closes.size(), kNaN);
    for (size_t i = 0; i < closes.size(); ++i) {
        macd[i] = fast_ema[i] - slow_ema[i]; // NaN if either is undefined
    }

    auto signal_line = ema(macd, signal);

    std::vector<double> hist(closes.size(), kNaN);
    for (size_t i = 0; i < closes.size(); ++i) {
        hist[i] = macd[i] - signal_line[i];
    }
    return hist;
}

} // namespace indicators

IndicatorEngine::IndicatorEngine(IndicatorParams params)
    : params_(params) {}

IndicatorResult IndicatorEngine::evaluate(const CandleWindow& window) const {
    if (window.empty() || window.size() < params_.required_rows()) {
        return NotReady{NotReadyReason::InsufficientHistory};
    }

    std::vector<double> closes;
    closes.reserve(window.size());
    for (const auto& c : window) closes.push_back(c.close);

    double natr = indicators::natr(window, params_.natr_length).back();
    double hist = indicators::macd_histogram(closes, params_.macd_fast,
                                             params_.macd_slow, params_.macd_signal).back();

    if (std::isnan(natr) || std::isnan(hist)) {
        return NotReady{NotReadyReason::MissingValue};
    }

    auto natr_dec = Decimal::from_double(natr);
    auto hist_dec = Decimal::from_double(hist);
    if (!natr_dec || !hist_dec) {
        return NotReady{NotReadyReason::NumericConversion};
    }

    return IndicatorSnapshot{.natr = *natr_dec, .macd_hist = *hist_dec};
}

} // namespace pmm
