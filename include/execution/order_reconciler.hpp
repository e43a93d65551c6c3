#pragma once

#include "execution/execution_gateway.hpp"
#include "risk/budget_checker.hpp"
#include "strategy/quote_guard.hpp"

#include <string>
#include <vector>

namespace pmm {

struct ReconcileReport {
    std::vector<std::string> cancelled;   // order ids
    std::vector<OrderIntent> submitted;   // after funding adjustment
};

/// Makes the live order set for one trading pair match the latest QuotePair:
///   1. cancel every open order for the pair (no diffing)
///   2. build one BUY and one SELL intent for the configured amount
///   3. run both through the budget checker with all_or_none = false
///   4. submit whatever survives
/// A leg dropped by the budget checker is simply not submitted. ExecutionError
/// from the gateway propagates; legs already submitted are left in place.
class OrderReconciler {
public:
    OrderReconciler(IExecutionGateway& gateway,
                    IBudgetChecker& budget,
                    std::string trading_pair,
                    Decimal order_amount);

    ReconcileReport reconcile(const QuotePair& quotes);

    // Cancels every open order for the pair; returns the cancelled ids
    std::vector<std::string> cancel_all();

private:
    std::vector<OrderIntent> build_intents(const QuotePair& quotes) const;

    IExecutionGateway& gw_;
    IBudgetChecker&    budget_;
    std::string        trading_pair_;
    Decimal            order_amount_;
};

} // namespace pmm
