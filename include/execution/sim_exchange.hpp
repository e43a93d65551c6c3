#pragma once

#include "execution/execution_gateway.hpp"
#include "market/market_view.hpp"
#include "risk/portfolio.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace pmm {

using FillCallback = std::function<void(const FillEvent&)>;

/// Paper-trading connector for a single pair. Resting limit orders lock funds
/// at placement and fill at their limit price once the opposite side of the
/// book trades through them.
class SimExchange : public IMarketView, public IExecutionGateway {
public:
    explicit SimExchange(std::string trading_pair, FillCallback on_fill = {});

    void set_fill_callback(FillCallback on_fill) { on_fill_ = std::move(on_fill); }
    void set_ready(bool ready) { ready_ = ready; }

    // Replaces the top of book, then matches resting orders against it.
    void on_book_update(const BookSnapshot& snapshot);

    // IMarketView
    bool    is_ready() const override { return ready_ && book_.has_both_sides(); }
    Decimal get_price_by_type(const std::string& trading_pair, PriceType type) const override;

    // IExecutionGateway
    std::vector<OpenOrder> list_open_orders(const std::string& trading_pair) const override;
    void        cancel_order(const std::string& trading_pair, const std::string& order_id) override;
    std::string submit_buy(const std::string& trading_pair, Decimal amount, Decimal price) override;
    std::string submit_sell(const std::string& trading_pair, Decimal amount, Decimal price) override;

    Portfolio&       portfolio() { return portfolio_; }
    const Portfolio& portfolio() const { return portfolio_; }

    const std::string& trading_pair() const { return trading_pair_; }
    const std::string& base_asset() const { return base_asset_; }
    const std::string& quote_asset() const { return quote_asset_; }

    size_t   active_order_count() const { return orders_.size(); }
    uint64_t orders_sent() const { return orders_sent_; }
    uint64_t cancels_sent() const { return cancels_sent_; }
    uint64_t fills() const { return fills_; }

private:
    std::string place(OrderSide side, const std::string& trading_pair,
                      Decimal amount, Decimal price);
    void check_fills();

    std::string  trading_pair_;
    std::string  base_asset_;
    std::string  quote_asset_;
    FillCallback on_fill_;
    Portfolio    portfolio_;
    BookSnapshot book_;
    bool         ready_ = true;

    std::vector<OpenOrder> orders_;   // placement order
    uint64_t next_order_id_ = 1;
    uint64_t orders_sent_   = 0;
    uint64_t cancels_sent_  = 0;
    uint64_t fills_         = 0;
};

/// Records every call without matching anything. Open orders stay open until
/// cancelled. With set_reject(true) every submit and cancel throws ExecutionError.
class NullExecutionGateway : public IExecutionGateway {
public:
    std::vector<OpenOrder> list_open_orders(const std::string& trading_pair) const override;
    void        cancel_order(const std::string& trading_pair, const std::string& order_id) override;
    std::string submit_buy(const std::string& trading_pair, Decimal amount, Decimal price) override;
    std::string submit_sell(const std::string& trading_pair, Decimal amount, Decimal price) override;

    void add_open_order(OpenOrder order) { open_.push_back(std::move(order)); }
    void set_reject(bool reject) { reject_ = reject; }

    const std::vector<OrderIntent>& submitted() const { return submitted_; }
    const std::vector<std::string>& cancelled() const { return cancelled_; }

    uint64_t orders_sent()  const { return submitted_.size(); }
    uint64_t cancels_sent() const { return cancelled_.size(); }
    uint64_t buys_sent() const;
    uint64_t sells_sent() const;

private:
    std::string record(OrderSide side, const std::string& trading_pair,
                       Decimal amount, Decimal price);

    std::vector<OpenOrder>   open_;
    std::vector<OrderIntent> submitted_;
    std::vector<std::string> cancelled_;
    uint64_t next_order_id_ = 1;
    bool     reject_ = false;
};

} // namespace pmm
