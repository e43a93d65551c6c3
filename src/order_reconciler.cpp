#include "execution/order_reconciler.hpp"

namespace pmm {

OrderReconciler::OrderReconciler(IExecutionGateway& gateway,
                                 IBudgetChecker& budget,
                                 std::string trading_pair,
                                 Decimal order_amount)
    : gw_(gateway),
      budget_(budget),
      trading_pair_(std::move(trading_pair)),
      order_amount_(order_amount) {}

ReconcileReport OrderReconciler::reconcile(const QuotePair& quotes) {
    ReconcileReport report;

    report.cancelled = cancel_all();

    // Legs are funded independently
    auto adjusted = budget_.adjust_candidates(build_intents(quotes), /*all_or_none=*/false);

    for (const auto& intent : adjusted) {
        if (intent.amount <= Decimal{}) continue;

        if (intent.side == OrderSide::Buy) {
            gw_.submit_buy(intent.trading_pair, intent.amount, intent.price);
        } else {
            gw_.submit_sell(intent.trading_pair, intent.amount, intent.price);
        }
        report.submitted.push_back(intent);
    }

    return report;
}

std::vector<std::string> OrderReconciler::cancel_all() {
    std::vector<std::string> cancelled;

    // Snapshot first: cancelling mutates the gateway's order set
    auto open_orders = gw_.list_open_orders(trading_pair_);
    for (const auto& order : open_orders) {
        gw_.cancel_order(trading_pair_, order.id);
        cancelled.push_back(order.id);
    }
    return cancelled;
}

std::vector<OrderIntent> OrderReconciler::build_intents(const QuotePair& quotes) const {
    return {
        OrderIntent{.trading_pair = trading_pair_, .side = OrderSide::Buy,
                    .amount = order_amount_, .price = quotes.buy_price},
        OrderIntent{.trading_pair = trading_pair_, .side = OrderSide::Sell,
                    .amount = order_amount_, .price = quotes.sell_price},
    };
}

} // namespace pmm
