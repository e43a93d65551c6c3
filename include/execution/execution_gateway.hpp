#pragma once

#include "common/decimal.hpp"
#include "common/types.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace pmm {

struct OrderIntent {
    std::string trading_pair;
    OrderSide   side   = OrderSide::Buy;
    Decimal     amount;
    Decimal     price;
};

struct OpenOrder {
    std::string id;
    std::string trading_pair;
    OrderSide   side = OrderSide::Buy;
    Decimal     amount;
    Decimal     price;
};

struct FillEvent {
    std::string order_id;
    std::string trading_pair;
    OrderSide   side = OrderSide::Buy;
    Decimal     amount;
    Decimal     price;
    Timestamp   timestamp = 0;
};

// Order placement or cancellation rejected by the venue
class ExecutionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class IExecutionGateway {
public:
    virtual ~IExecutionGateway() = default;
    virtual std::vector<OpenOrder> list_open_orders(const std::string& trading_pair) const = 0;
    virtual void        cancel_order(const std::string& trading_pair, const std::string& order_id) = 0;
    virtual std::string submit_buy(const std::string& trading_pair, Decimal amount, Decimal price) = 0;
    virtual std::string submit_sell(const std::string& trading_pair, Decimal amount, Decimal price) = 0;
};

} // namespace pmm
