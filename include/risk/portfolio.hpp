#pragma once

#include "common/decimal.hpp"
#include "common/types.hpp"

#include <string>
#include <unordered_map>

namespace pmm {

class IAccount {
public:
    virtual ~IAccount() = default;
    // Total holdings, including funds reserved by open orders
    virtual Decimal get_balance(const std::string& asset) const = 0;
    // Holdings not reserved by open orders
    virtual Decimal get_available_balance(const std::string& asset) const = 0;
};

/// Per-asset balances with a locked portion reserved by resting orders.
class Portfolio : public IAccount {
public:
    Decimal get_balance(const std::string& asset) const override;
    Decimal get_available_balance(const std::string& asset) const override;

    void set_balance(const std::string& asset, Decimal total);

    // Returns false and locks nothing when the available balance is short
    bool lock(const std::string& asset, Decimal amount);
    void unlock(const std::string& asset, Decimal amount);

    // Settles a fill of a resting order whose funds were locked at placement.
    // Buy: releases price * amount of quote, receives amount of base.
    // Sell: releases amount of base, receives price * amount of quote.
    void settle_fill(const std::string& base, const std::string& quote,
                     OrderSide side, Decimal amount, Decimal price);

private:
    struct AssetBalance {
        Decimal total;
        Decimal locked;
    };

    std::unordered_map<std::string, AssetBalance> balances_;
};

} // namespace pmm
