#include "risk/budget_checker.hpp"

#include <algorithm>

namespace pmm {

BalanceBudgetChecker::BalanceBudgetChecker(const IAccount& account,
                                           std::string base_asset,
                                           std::string quote_asset)
    : account_(account),
      base_asset_(std::move(base_asset)),
      quote_asset_(std::move(quote_asset)) {}

std::vector<OrderIntent> BalanceBudgetChecker::adjust_candidates(
    const std::vector<OrderIntent>& candidates, bool all_or_none) {

    Decimal base_available = std::max(Decimal{}, account_.get_available_balance(base_asset_));
    Decimal quote_available = std::max(Decimal{}, account_.get_available_balance(quote_asset_));

    std::vector<OrderIntent> adjusted;
    adjusted.reserve(candidates.size());

    for (const auto& candidate : candidates) {
        if (candidate.amount <= Decimal{} || candidate.price <= Decimal{}) continue;

        OrderIntent intent = candidate;

        if (intent.side == OrderSide::Buy) {
            Decimal cost = intent.amount * intent.price;
            if (cost > quote_available) {
                if (all_or_none) continue;
                intent.amount = affordable_amount(quote_available, intent.price);
                if (intent.amount <= Decimal{}) continue;
                cost = intent.amount * intent.price;
            }
            quote_available -= cost;
        } else {
            if (intent.amount > base_available) {
                if (all_or_none) continue;
                intent.amount = base_available;
                if (intent.amount <= Decimal{}) continue;
            }
            base_available -= intent.amount;
        }

        adjusted.push_back(intent);
    }

    return adjusted;
}

Decimal BalanceBudgetChecker::affordable_amount(Decimal available, Decimal price) {
    Decimal amount = Decimal::div_down(available, price);
    // The product rounds to nearest; step down until it fits
    while (amount > Decimal{} && amount * price > available) {
        amount -= Decimal::from_raw(1);
    }
    return amount;
}

} // namespace pmm
