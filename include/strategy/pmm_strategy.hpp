#pragma once

#include "config/strategy_config.hpp"
#include "execution/execution_gateway.hpp"
#include "execution/order_reconciler.hpp"
#include "market/candle_feed.hpp"
#include "market/indicator_engine.hpp"
#include "market/market_view.hpp"
#include "risk/budget_checker.hpp"
#include "risk/portfolio.hpp"
#include "strategy/quote_guard.hpp"
#include "strategy/spread_model.hpp"
#include "strategy/tick_scheduler.hpp"

#include <functional>
#include <optional>
#include <string>

namespace pmm {

// Last computed metrics, for reporting only. Spreads are the pre-floor values.
struct StrategyStatus {
    Decimal bid_spread;
    Decimal ask_spread;
    Decimal inv_norm;
};

using NotifyCallback = std::function<void(const std::string&)>;

/// Pure market-making strategy for one trading pair. Each tick that passes the
/// scheduler runs indicators -> spreads -> guarded quotes -> reconciliation.
class PmmStrategy {
public:
    PmmStrategy(const StrategyConfig& config,
                ICandleFeed& feed,
                IMarketView& market,
                IAccount& account,
                IExecutionGateway& gateway,
                IBudgetChecker& budget,
                NotifyCallback notify = {});

    void start();
    // Stops the candle feed and cancels every open order for the pair.
    void stop();

    // ExecutionError from the gateway propagates; the schedule is not advanced.
    TickOutcome on_tick(Timestamp now);

    void on_order_filled(const FillEvent& fill);

    std::string format_status() const;

    const std::optional<StrategyStatus>& status() const { return status_; }
    const std::optional<QuotePair>&      last_quotes() const { return last_quotes_; }
    const TickScheduler&                 scheduler() const { return scheduler_; }
    const StrategyConfig&                config() const { return config_; }

private:
    TickOutcome run_cycle();
    TickOutcome quote(const IndicatorSnapshot& snapshot);

    StrategyConfig     config_;
    std::string        base_asset_;
    ICandleFeed&       feed_;
    IMarketView&       market_;
    IAccount&          account_;
    IndicatorEngine    indicators_;
    SpreadModel        spread_model_;
    QuoteGuard         guard_;
    OrderReconciler    reconciler_;
    TickScheduler      scheduler_;
    NotifyCallback     notify_;

    std::optional<StrategyStatus> status_;
    std::optional<QuotePair>      last_quotes_;
};

} // namespace pmm
