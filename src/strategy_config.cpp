#include "config/strategy_config.hpp"

#include <cctype>
#include <stdexcept>

namespace pmm {

namespace {

void require(bool condition, const std::string& message) {
    if (!condition) throw std::invalid_argument("invalid config: " + message);
}

} // anonymous namespace

std::optional<Timestamp> parse_candle_interval(std::string_view interval) {
    if (interval.size() < 2) return std::nullopt;

    Timestamp count = 0;
    size_t pos = 0;
    while (pos < interval.size() && std::isdigit(static_cast<unsigned char>(interval[pos]))) {
        count = count * 10 + static_cast<Timestamp>(interval[pos] - '0');
        ++pos;
    }
    if (pos == 0 || pos + 1 != interval.size() || count == 0) return std::nullopt;

    switch (interval[pos]) {
        case 's': return count * 1000;
        case 'm': return count * 60 * 1000;
        case 'h': return count * 60 * 60 * 1000;
        case 'd': return count * 24 * 60 * 60 * 1000;
        case 'w': return count * 7 * 24 * 60 * 60 * 1000;
        default:  return std::nullopt;
    }
}

std::string StrategyConfig::base_asset() const {
    return trading_pair.substr(0, trading_pair.find('-'));
}

std::string StrategyConfig::quote_asset() const {
    auto dash = trading_pair.find('-');
    return dash == std::string::npos ? std::string{} : trading_pair.substr(dash + 1);
}

Timestamp StrategyConfig::candle_interval_ms() const {
    return parse_candle_interval(candles.interval).value_or(0);
}

IndicatorParams StrategyConfig::indicator_params() const {
    return IndicatorParams{
        .natr_length = natr_length,
        .macd_fast   = macd_fast,
        .macd_slow   = macd_slow,
        .macd_signal = macd_signal,
    };
}

SpreadParams StrategyConfig::spread_params() const {
    return SpreadParams{
        .bid_natr_scalar = bid_natr_scalar,
        .ask_natr_scalar = ask_natr_scalar,
        .macd_weight     = macd_weight,
        .inventory_phi   = inventory_phi,
        .max_inventory   = max_inventory,
        .min_spread      = min_spread,
    };
}

void StrategyConfig::validate() const {
    auto dash = trading_pair.find('-');
    require(dash != std::string::npos && dash > 0 && dash + 1 < trading_pair.size()
                && trading_pair.find('-', dash + 1) == std::string::npos,
            "trading_pair must look like BASE-QUOTE, got '" + trading_pair + "'");
    require(!exchange.empty(), "exchange must not be empty");
    require(order_amount > Decimal{}, "order_amount must be positive");
    require(order_refresh_time_s > 0, "order_refresh_time must be positive");

    require(parse_candle_interval(candles.interval).has_value(),
            "unknown candles.interval '" + candles.interval + "'");
    require(candles.max_records > 0, "candles.max_records must be positive");

    require(natr_length > 0, "natr_length must be positive");
    require(macd_fast > 0 && macd_slow > 0 && macd_signal > 0,
            "MACD periods must be positive");
    require(macd_fast < macd_slow, "macd_fast must be shorter than macd_slow");
    require(candles.max_records >= indicator_params().required_rows(),
            "candles.max_records is smaller than the indicator history");

    require(!bid_natr_scalar.is_negative() && !ask_natr_scalar.is_negative(),
            "NATR scalars must not be negative");
    require(!macd_weight.is_negative(), "macd_weight must not be negative");
    require(!inventory_phi.is_negative(), "inventory_phi must not be negative");
    require(max_inventory > Decimal{}, "max_inventory must be positive");
    require(min_spread > Decimal{}, "min_spread must be positive");
}

} // namespace pmm
