#include "risk/portfolio.hpp"

#include <algorithm>

namespace pmm {

Decimal Portfolio::get_balance(const std::string& asset) const {
    auto it = balances_.find(asset);
    return it != balances_.end() ? it->second.total : Decimal{};
}

Decimal Portfolio::get_available_balance(const std::string& asset) const {
    auto it = balances_.find(asset);
    if (it == balances_.end()) return Decimal{};
    return it->second.total - it->second.locked;
}

void Portfolio::set_balance(const std::string& asset, Decimal total) {
    balances_[asset].total = total;
}

bool Portfolio::lock(const std::string& asset, Decimal amount) {
    if (amount > get_available_balance(asset)) return false;
    balances_[asset].locked += amount;
    return true;
}

void Portfolio::unlock(const std::string& asset, Decimal amount) {
    auto it = balances_.find(asset);
    if (it == balances_.end()) return;
    it->second.locked = std::max(Decimal{}, it->second.locked - amount);
}

void Portfolio::settle_fill(const std::string& base, const std::string& quote,
                            OrderSide side, Decimal amount, Decimal price) {
    Decimal notional = amount * price;

    if (side == OrderSide::Buy) {
        unlock(quote, notional);
        balances_[quote].total -= notional;
        balances_[base].total += amount;
    } else {
        unlock(base, amount);
        balances_[base].total -= amount;
        balances_[quote].total += notional;
    }
}

} // namespace pmm
