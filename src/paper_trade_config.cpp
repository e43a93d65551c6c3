#include "config/paper_trade_config.hpp"

#include <cmath>
#include <stdexcept>

namespace pmm {

void PaperTradeConfig::validate() const {
    auto require = [](bool condition, const char* message) {
        if (!condition) throw std::invalid_argument(std::string("invalid config: paper.") + message);
    };

    require(!initial_base.is_negative(), "initial_base must not be negative");
    require(!initial_quote.is_negative(), "initial_quote must not be negative");
    require(std::isfinite(start_price) && start_price > 0.0, "start_price must be positive");
    require(std::isfinite(volatility) && volatility > 0.0, "volatility must be positive");
    require(std::isfinite(book_spread_bps) && book_spread_bps > 0.0,
            "book_spread_bps must be positive");
    require(book_depth > 0, "book_depth must be positive");
    require(tick_interval_ms > 0, "tick_interval_ms must be positive");
    require(price_decimals >= 0 && price_decimals <= Decimal::kScaleDigits,
            "price_decimals must be between 0 and 18");
}

} // namespace pmm
