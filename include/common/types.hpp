#pragma once

#include <cstdint>

namespace pmm {

using Timestamp = uint64_t; // milliseconds since epoch

enum class OrderSide { Buy, Sell };

enum class PriceType { Mid, BestBid, BestAsk };

inline const char* to_string(OrderSide side) {
    return side == OrderSide::Buy ? "BUY" : "SELL";
}

// Visitor helper for std::visit over result variants
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace pmm
