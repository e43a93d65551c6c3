#include <gtest/gtest.h>
#include "strategy/quote_guard.hpp"

#include <stdexcept>

using namespace pmm;

namespace {

Spreads spreads(const char* bid, const char* ask) {
    return Spreads{.bid_spread = dec(bid), .ask_spread = dec(ask)};
}

} // namespace

TEST(QuoteGuardTest, WideSpreadsStayOutsideTheBook) {
    QuoteGuard guard;
    TopOfBook top{.best_bid = dec("2999"), .best_ask = dec("3001")};

    auto q = guard.make_quotes(Decimal(3000), spreads("0.01", "0.02"), top);
    EXPECT_EQ(q.buy_price, Decimal(2970));
    EXPECT_EQ(q.sell_price, Decimal(3060));
}

TEST(QuoteGuardTest, TightSpreadsJoinTheTopOfBook) {
    QuoteGuard guard;
    TopOfBook top{.best_bid = dec("2999.5"), .best_ask = dec("3000.5")};

    // 0.000024 and 0.000012 of 3000 are inside the 1.0 wide book
    auto q = guard.make_quotes(Decimal(3000), spreads("0.000024", "0.000012"), top);
    EXPECT_EQ(q.buy_price, dec("2999.5"));
    EXPECT_EQ(q.sell_price, dec("3000.5"));
}

TEST(QuoteGuardTest, NeverCrossesTheBook) {
    QuoteGuard guard;
    TopOfBook top{.best_bid = dec("99.98"), .best_ask = dec("100.02")};

    for (const char* bid : {"0.00001", "0.0001", "0.001", "0.1"}) {
        for (const char* ask : {"0.00001", "0.0002", "0.003", "0.5"}) {
            for (const char* ref : {"99.9", "100", "100.1"}) {
                auto q = guard.make_quotes(dec(ref), spreads(bid, ask), top);
                EXPECT_LE(q.buy_price, top.best_bid);
                EXPECT_GE(q.sell_price, top.best_ask);
            }
        }
    }
}

TEST(QuoteGuardTest, CrossedBookClipsLiterally) {
    QuoteGuard guard;
    TopOfBook top{.best_bid = dec("101"), .best_ask = dec("99")};
    EXPECT_TRUE(top.crossed());

    auto q = guard.make_quotes(Decimal(100), spreads("0.001", "0.001"), top);
    EXPECT_EQ(q.buy_price, dec("99.9"));     // min(99.9, 101)
    EXPECT_EQ(q.sell_price, dec("100.1"));   // max(100.1, 99)
}

TEST(QuoteGuardTest, NormalBookNotCrossed) {
    TopOfBook top{.best_bid = dec("99"), .best_ask = dec("101")};
    EXPECT_FALSE(top.crossed());
}

TEST(QuoteGuardTest, SubCentReferenceKeepsTheSpread) {
    SpreadModel model{SpreadParams{}};
    Spreads s = model.compute(IndicatorSnapshot{.natr = dec("0.002"), .macd_hist = Decimal{}},
                              Decimal{});
    ASSERT_EQ(s.bid_spread, dec("0.000024"));

    QuoteGuard guard;
    Decimal ref = dec("0.00001234");
    TopOfBook top{.best_bid = dec("0.0000124"), .best_ask = dec("0.0000125")};

    auto q = guard.make_quotes(ref, s, top);
    EXPECT_LT(q.buy_price, ref);
    EXPECT_EQ(q.buy_price, dec("0.00001233970384"));
    EXPECT_EQ(q.sell_price, top.best_ask);
}

TEST(QuoteGuardTest, NonPositiveReferenceThrows) {
    QuoteGuard guard;
    TopOfBook top{.best_bid = dec("99"), .best_ask = dec("101")};
    EXPECT_THROW(guard.make_quotes(Decimal{}, spreads("0.001", "0.001"), top),
                 std::invalid_argument);
    EXPECT_THROW(guard.make_quotes(dec("-1"), spreads("0.001", "0.001"), top),
                 std::invalid_argument);
}
