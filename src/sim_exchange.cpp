#include "execution/sim_exchange.hpp"

#include <algorithm>

namespace pmm {

namespace {

std::string make_order_id(OrderSide side, uint64_t seq) {
    return std::string(side == OrderSide::Buy ? "PMM-B-" : "PMM-S-") + std::to_string(seq);
}

} // namespace

// --- SimExchange ---

SimExchange::SimExchange(std::string trading_pair, FillCallback on_fill)
    : trading_pair_(std::move(trading_pair)),
      on_fill_(std::move(on_fill)) {
    auto dash = trading_pair_.find('-');
    base_asset_ = trading_pair_.substr(0, dash);
    quote_asset_ = dash == std::string::npos ? std::string{} : trading_pair_.substr(dash + 1);
}

void SimExchange::on_book_update(const BookSnapshot& snapshot) {
    book_ = snapshot;
    check_fills();
}

Decimal SimExchange::get_price_by_type(const std::string& trading_pair, PriceType type) const {
    if (trading_pair != trading_pair_) {
        throw ExecutionError("unknown trading pair: " + trading_pair);
    }
    switch (type) {
        case PriceType::BestBid: return book_.best_bid();
        case PriceType::BestAsk: return book_.best_ask();
        case PriceType::Mid:     return book_.mid_price();
    }
    return Decimal{};
}

std::vector<OpenOrder> SimExchange::list_open_orders(const std::string& trading_pair) const {
    std::vector<OpenOrder> result;
    for (const auto& order : orders_) {
        if (order.trading_pair == trading_pair) result.push_back(order);
    }
    return result;
}

void SimExchange::cancel_order(const std::string& trading_pair, const std::string& order_id) {
    auto it = std::find_if(orders_.begin(), orders_.end(), [&](const OpenOrder& o) {
        return o.id == order_id && o.trading_pair == trading_pair;
    });
    if (it == orders_.end()) {
        throw ExecutionError("unknown order id: " + order_id);
    }

    if (it->side == OrderSide::Buy) {
        portfolio_.unlock(quote_asset_, it->amount * it->price);
    } else {
        portfolio_.unlock(base_asset_, it->amount);
    }
    orders_.erase(it);
    ++cancels_sent_;
}

std::string SimExchange::submit_buy(const std::string& trading_pair, Decimal amount, Decimal price) {
    return place(OrderSide::Buy, trading_pair, amount, price);
}

std::string SimExchange::submit_sell(const std::string& trading_pair, Decimal amount, Decimal price) {
    return place(OrderSide::Sell, trading_pair, amount, price);
}

std::string SimExchange::place(OrderSide side, const std::string& trading_pair,
                               Decimal amount, Decimal price) {
    if (trading_pair != trading_pair_) {
        throw ExecutionError("unknown trading pair: " + trading_pair);
    }
    if (amount <= Decimal{} || price <= Decimal{}) {
        throw ExecutionError("order amount and price must be positive");
    }

    bool locked = side == OrderSide::Buy
        ? portfolio_.lock(quote_asset_, amount * price)
        : portfolio_.lock(base_asset_, amount);
    if (!locked) {
        throw ExecutionError(std::string("insufficient ") +
                             (side == OrderSide::Buy ? quote_asset_ : base_asset_) +
                             " balance for " + to_string(side) + " " + amount.to_string());
    }

    OpenOrder order{.id = make_order_id(side, next_order_id_++),
                    .trading_pair = trading_pair_,
                    .side = side,
                    .amount = amount,
                    .price = price};
    orders_.push_back(order);
    ++orders_sent_;
    return order.id;
}

void SimExchange::check_fills() {
    if (!book_.has_both_sides()) return;

    std::vector<OpenOrder> filled;
    auto crossed = [&](const OpenOrder& order) {
        // Filled at the limit price once the opposite side trades through it
        return order.side == OrderSide::Buy ? book_.best_ask() <= order.price
                                            : book_.best_bid() >= order.price;
    };

    for (const auto& order : orders_) {
        if (crossed(order)) filled.push_back(order);
    }
    if (filled.empty()) return;

    orders_.erase(std::remove_if(orders_.begin(), orders_.end(), crossed), orders_.end());

    for (const auto& order : filled) {
        portfolio_.settle_fill(base_asset_, quote_asset_, order.side, order.amount, order.price);
        ++fills_;
        if (on_fill_) {
            on_fill_(FillEvent{.order_id = order.id,
                               .trading_pair = order.trading_pair,
                               .side = order.side,
                               .amount = order.amount,
                               .price = order.price,
                               .timestamp = book_.timestamp});
        }
    }
}

// --- NullExecutionGateway ---

std::vector<OpenOrder> NullExecutionGateway::list_open_orders(const std::string& trading_pair) const {
    std::vector<OpenOrder> result;
    for (const auto& order : open_) {
        if (order.trading_pair == trading_pair) result.push_back(order);
    }
    return result;
}

void NullExecutionGateway::cancel_order(const std::string& /*trading_pair*/,
                                        const std::string& order_id) {
    if (reject_) throw ExecutionError("cancel rejected: " + order_id);
    open_.erase(std::remove_if(open_.begin(), open_.end(),
                               [&](const OpenOrder& o) { return o.id == order_id; }),
                open_.end());
    cancelled_.push_back(order_id);
}

std::string NullExecutionGateway::submit_buy(const std::string& trading_pair,
                                             Decimal amount, Decimal price) {
    return record(OrderSide::Buy, trading_pair, amount, price);
}

std::string NullExecutionGateway::submit_sell(const std::string& trading_pair,
                                              Decimal amount, Decimal price) {
    return record(OrderSide::Sell, trading_pair, amount, price);
}

uint64_t NullExecutionGateway::buys_sent() const {
    return std::count_if(submitted_.begin(), submitted_.end(),
                         [](const OrderIntent& i) { return i.side == OrderSide::Buy; });
}

uint64_t NullExecutionGateway::sells_sent() const {
    return std::count_if(submitted_.begin(), submitted_.end(),
                         [](const OrderIntent& i) { return i.side == OrderSide::Sell; });
}

std::string NullExecutionGateway::record(OrderSide side, const std::string& trading_pair,
                                         Decimal amount, Decimal price) {
    if (reject_) throw ExecutionError("submit rejected");

    std::string id = make_order_id(side, next_order_id_++);
    submitted_.push_back(OrderIntent{.trading_pair = trading_pair, .side = side,
                                     .amount = amount, .price = price});
    open_.push_back(OpenOrder{.id = id, .trading_pair = trading_pair, .side = side,
                              .amount = amount, .price = price});
    return id;
}

} // namespace pmm
