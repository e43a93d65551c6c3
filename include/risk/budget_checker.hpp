#pragma once

#include "execution/execution_gateway.hpp"
#include "risk/portfolio.hpp"

#include <string>
#include <vector>

namespace pmm {

class IBudgetChecker {
public:
    virtual ~IBudgetChecker() = default;

    // Returns the fundable subset of the candidates, in order. A candidate may be
    // returned with a reduced amount unless all_or_none is set, in which case it
    // is either kept whole or dropped. Candidates are funded in sequence, so an
    // earlier candidate reserves balance ahead of a later one.
    virtual std::vector<OrderIntent> adjust_candidates(const std::vector<OrderIntent>& candidates,
                                                       bool all_or_none) = 0;
};

/// Funds buys from the available quote balance (amount * price) and sells from
/// the available base balance (amount).
class BalanceBudgetChecker : public IBudgetChecker {
public:
    BalanceBudgetChecker(const IAccount& account, std::string base_asset, std::string quote_asset);

    std::vector<OrderIntent> adjust_candidates(const std::vector<OrderIntent>& candidates,
                                               bool all_or_none) override;

private:
    // Largest amount whose cost at `price` fits in `available`
    static Decimal affordable_amount(Decimal available, Decimal price);

    const IAccount& account_;
    std::string     base_asset_;
    std::string     quote_asset_;
};

} // namespace pmm
