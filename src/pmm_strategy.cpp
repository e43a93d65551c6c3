#include "strategy/pmm_strategy.hpp"

#include "common/logger.hpp"

namespace pmm {

PmmStrategy::PmmStrategy(const StrategyConfig& config,
                         ICandleFeed& feed,
                         IMarketView& market,
                         IAccount& account,
                         IExecutionGateway& gateway,
                         IBudgetChecker& budget,
                         NotifyCallback notify)
    : config_(config),
      base_asset_(config.base_asset()),
      feed_(feed),
      market_(market),
      account_(account),
      indicators_(config.indicator_params()),
      spread_model_(config.spread_params()),
      reconciler_(gateway, budget, config.trading_pair, config.order_amount),
      scheduler_(config.refresh_interval_ms()),
      notify_(std::move(notify)) {}

void PmmStrategy::start() {
    feed_.start();
    PMM_LOG_INFO("strategy started on " + config_.exchange + " " + config_.trading_pair);
}

void PmmStrategy::stop() {
    feed_.stop();
    auto cancelled = reconciler_.cancel_all();
    PMM_LOG_INFO("strategy stopped, cancelled " + std::to_string(cancelled.size()) + " orders");
}

TickOutcome PmmStrategy::on_tick(Timestamp now) {
    return scheduler_.on_tick(now, market_.is_ready(), [this] { return run_cycle(); });
}

TickOutcome PmmStrategy::run_cycle() {
    // Not-ready indicators skip the cycle silently
    return std::visit(Overloaded{
        [this](const IndicatorSnapshot& snapshot) { return quote(snapshot); },
        [](const NotReady&) { return TickOutcome::DataNotReady; },
    }, indicators_.evaluate(feed_.candles()));
}

TickOutcome PmmStrategy::quote(const IndicatorSnapshot& snapshot) {
    const auto& pair = config_.trading_pair;
    Decimal ref = market_.get_price_by_type(pair, PriceType::Mid);
    if (ref <= Decimal{}) {
        PMM_LOG_WARN("no mid price for " + pair + ", skipping cycle");
        return TickOutcome::DataNotReady;
    }

    Decimal base_balance = account_.get_balance(base_asset_);
    Spreads spreads = spread_model_.compute(snapshot, base_balance);

    status_ = StrategyStatus{.bid_spread = spreads.raw_bid_spread,
                             .ask_spread = spreads.raw_ask_spread,
                             .inv_norm = spreads.inv_norm};

    TopOfBook top{.best_bid = market_.get_price_by_type(pair, PriceType::BestBid),
                  .best_ask = market_.get_price_by_type(pair, PriceType::BestAsk)};

    if (top.crossed()) {
        PMM_LOG_WARN("crossed book on " + pair + ": best bid " + top.best_bid.to_string() +
                     " > best ask " + top.best_ask.to_string());
    }

    QuotePair quotes = guard_.make_quotes(ref, spreads, top);
    last_quotes_ = quotes;

    auto report = reconciler_.reconcile(quotes);

    PMM_LOG_DEBUG("natr=" + snapshot.natr.to_string() +
                  " hist=" + snapshot.macd_hist.to_string() +
                  " inv=" + spreads.inv_norm.to_string() +
                  " buy=" + quotes.buy_price.to_string() +
                  " sell=" + quotes.sell_price.to_string() +
                  " cancelled=" + std::to_string(report.cancelled.size()) +
                  " submitted=" + std::to_string(report.submitted.size()));

    return TickOutcome::Completed;
}

void PmmStrategy::on_order_filled(const FillEvent& fill) {
    std::string msg = std::string(to_string(fill.side)) + " " + fill.amount.to_string(4) + " " +
                      fill.trading_pair + " @ " + fill.price.to_string(2);
    PMM_LOG_INFO(msg);
    if (notify_) notify_(msg);
}

std::string PmmStrategy::format_status() const {
    if (!market_.is_ready()) return "Market connectors are not ready.";

    StrategyStatus s = status_.value_or(StrategyStatus{});
    const Decimal bps(10000);
    return "Bid spread: " + (s.bid_spread * bps).to_string(2) + " bps | " +
           "Ask spread: " + (s.ask_spread * bps).to_string(2) + " bps | " +
           "Inv norm: " + s.inv_norm.to_string(3);
}

} // namespace pmm
