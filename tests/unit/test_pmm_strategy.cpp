#include <gtest/gtest.h>
#include "common/logger.hpp"
#include "execution/sim_exchange.hpp"
#include "strategy/pmm_strategy.hpp"

#include <memory>

using namespace pmm;

namespace {

class FakeCandleFeed : public ICandleFeed {
public:
    void start() override { running = true; }
    void stop() override { running = false; }
    const CandleWindow& candles() const override { return window; }

    // Flat candles around `close`, one minute apart
    void fill(size_t rows, double close = 100.0, double half_range = 0.5) {
        for (size_t i = 0; i < rows; ++i) {
            window.append(Candle{.timestamp = 60'000 * (i + 1), .open = close,
                                 .high = close + half_range, .low = close - half_range,
                                 .close = close, .volume = 1.0});
        }
    }

    CandleWindow window{1000};
    bool running = false;
};

class FakeMarket : public IMarketView {
public:
    bool is_ready() const override { return ready; }
    Decimal get_price_by_type(const std::string& /*pair*/, PriceType type) const override {
        switch (type) {
            case PriceType::BestBid: return best_bid;
            case PriceType::BestAsk: return best_ask;
            case PriceType::Mid:     return (best_bid + best_ask) / Decimal(2);
        }
        return Decimal{};
    }

    bool    ready = true;
    Decimal best_bid = dec("99.9");
    Decimal best_ask = dec("100.1");
};

class PassThroughBudget : public IBudgetChecker {
public:
    std::vector<OrderIntent> adjust_candidates(const std::vector<OrderIntent>& candidates,
                                               bool /*all_or_none*/) override {
        return candidates;
    }
};

} // namespace

class PmmStrategyTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Error);
        account.set_balance("ETH", dec("0.5"));
        account.set_balance("USDT", dec("1000"));
        strategy = std::make_unique<PmmStrategy>(
            config, feed, market, account, gw, budget,
            [this](const std::string& msg) { notifications.push_back(msg); });
        strategy->start();
    }

    void TearDown() override { Logger::instance().set_level(LogLevel::Info); }

    StrategyConfig           config;
    FakeCandleFeed           feed;
    FakeMarket               market;
    Portfolio                account;
    NullExecutionGateway     gw;
    PassThroughBudget        budget;
    std::vector<std::string> notifications;
    std::unique_ptr<PmmStrategy> strategy;
};

TEST_F(PmmStrategyTest, StartStartsFeed) {
    EXPECT_TRUE(feed.running);
}

TEST_F(PmmStrategyTest, ShortHistoryPlacesNothing) {
    gw.add_open_order(OpenOrder{.id = "old", .trading_pair = "ETH-USDT", .side = OrderSide::Buy,
                                .amount = dec("0.01"), .price = dec("99")});
    feed.fill(20);

    EXPECT_EQ(strategy->on_tick(1'000), TickOutcome::DataNotReady);
    EXPECT_EQ(gw.orders_sent(), 0u);
    EXPECT_EQ(gw.cancels_sent(), 0u);
    EXPECT_FALSE(strategy->status().has_value());
    EXPECT_FALSE(strategy->last_quotes().has_value());
    EXPECT_EQ(strategy->scheduler().next_tick(), 0u);
}

TEST_F(PmmStrategyTest, FullCycleCancelsAndQuotes) {
    gw.add_open_order(OpenOrder{.id = "old-b", .trading_pair = "ETH-USDT", .side = OrderSide::Buy,
                                .amount = dec("0.01"), .price = dec("99")});
    gw.add_open_order(OpenOrder{.id = "old-s", .trading_pair = "ETH-USDT", .side = OrderSide::Sell,
                                .amount = dec("0.01"), .price = dec("101")});
    feed.fill(40);

    EXPECT_EQ(strategy->on_tick(1'000), TickOutcome::Completed);
    EXPECT_EQ(gw.cancels_sent(), 2u);
    ASSERT_EQ(gw.orders_sent(), 2u);
    EXPECT_EQ(gw.buys_sent(), 1u);
    EXPECT_EQ(gw.sells_sent(), 1u);

    // natr 0.01, hist 0, inv_norm 0.5:
    //   bid = 0.00012 + 0.005 = 0.00512, ask = 0.00006 - 0.005 -> floored to 0.00001
    const auto& quotes = *strategy->last_quotes();
    EXPECT_EQ(quotes.buy_price, dec("99.488"));
    EXPECT_EQ(quotes.sell_price, dec("100.1"));   // clipped to best ask
    EXPECT_LE(quotes.buy_price, market.best_bid);
    EXPECT_GE(quotes.sell_price, market.best_ask);

    EXPECT_EQ(gw.submitted()[0].amount, config.order_amount);
    EXPECT_EQ(strategy->scheduler().next_tick(), 16'000u);
}

TEST_F(PmmStrategyTest, StatusReportsPreFloorSpreads) {
    feed.fill(40);
    strategy->on_tick(1'000);

    ASSERT_TRUE(strategy->status().has_value());
    EXPECT_EQ(strategy->status()->bid_spread, dec("0.00512"));
    EXPECT_EQ(strategy->status()->ask_spread, dec("-0.00494"));
    EXPECT_EQ(strategy->status()->inv_norm, dec("0.5"));
    EXPECT_EQ(strategy->format_status(),
              "Bid spread: 51.20 bps | Ask spread: -49.40 bps | Inv norm: 0.500");
}

TEST_F(PmmStrategyTest, StatusBeforeFirstCycle) {
    EXPECT_EQ(strategy->format_status(),
              "Bid spread: 0.00 bps | Ask spread: 0.00 bps | Inv norm: 0.000");

    market.ready = false;
    EXPECT_EQ(strategy->format_status(), "Market connectors are not ready.");
}

TEST_F(PmmStrategyTest, ConnectorNotReadySkipsCycle) {
    feed.fill(40);
    market.ready = false;

    EXPECT_EQ(strategy->on_tick(1'000), TickOutcome::ConnectorNotReady);
    EXPECT_EQ(gw.orders_sent(), 0u);

    market.ready = true;
    EXPECT_EQ(strategy->on_tick(2'000), TickOutcome::Completed);
}

TEST_F(PmmStrategyTest, RefreshIntervalThrottles) {
    feed.fill(40);

    EXPECT_EQ(strategy->on_tick(1'000), TickOutcome::Completed);
    EXPECT_EQ(strategy->on_tick(10'000), TickOutcome::Throttled);
    EXPECT_EQ(gw.orders_sent(), 2u);

    EXPECT_EQ(strategy->on_tick(16'000), TickOutcome::Completed);
    EXPECT_EQ(gw.orders_sent(), 4u);
    // Second cycle cancelled the first cycle's two orders
    EXPECT_EQ(gw.cancels_sent(), 2u);
}

TEST_F(PmmStrategyTest, CrossedBookStillQuotesWithLiteralClip) {
    feed.fill(40);
    market.best_bid = dec("100.2");
    market.best_ask = dec("99.8");

    EXPECT_EQ(strategy->on_tick(1'000), TickOutcome::Completed);
    const auto& quotes = *strategy->last_quotes();
    EXPECT_EQ(quotes.buy_price, dec("99.488"));    // min(99.488, 100.2)
    EXPECT_EQ(quotes.sell_price, dec("100.001"));  // max(100.001, 99.8)
}

TEST_F(PmmStrategyTest, MissingMidPriceSkipsCycle) {
    gw.add_open_order(OpenOrder{.id = "old", .trading_pair = "ETH-USDT", .side = OrderSide::Buy,
                                .amount = dec("0.01"), .price = dec("99")});
    feed.fill(40);
    market.best_bid = Decimal{};
    market.best_ask = Decimal{};

    EXPECT_EQ(strategy->on_tick(1'000), TickOutcome::DataNotReady);
    EXPECT_EQ(gw.orders_sent(), 0u);
    EXPECT_EQ(gw.cancels_sent(), 0u);
    EXPECT_FALSE(strategy->last_quotes().has_value());
    EXPECT_EQ(strategy->scheduler().next_tick(), 0u);
}

TEST_F(PmmStrategyTest, ExecutionErrorPropagatesWithoutAdvancing) {
    feed.fill(40);
    gw.set_reject(true);

    EXPECT_THROW(strategy->on_tick(1'000), ExecutionError);
    EXPECT_EQ(strategy->scheduler().next_tick(), 0u);
    EXPECT_EQ(strategy->scheduler().state(), SchedulerState::Waiting);
}

TEST_F(PmmStrategyTest, FillIsLoggedAndNotified) {
    strategy->on_order_filled(FillEvent{.order_id = "PMM-B-1", .trading_pair = "ETH-USDT",
                                        .side = OrderSide::Buy, .amount = dec("0.01"),
                                        .price = dec("2999.5"), .timestamp = 5});
    strategy->on_order_filled(FillEvent{.order_id = "PMM-S-2", .trading_pair = "ETH-USDT",
                                        .side = OrderSide::Sell, .amount = dec("0.123456"),
                                        .price = dec("3001.005"), .timestamp = 6});

    ASSERT_EQ(notifications.size(), 2u);
    EXPECT_EQ(notifications[0], "BUY 0.0100 ETH-USDT @ 2999.50");
    EXPECT_EQ(notifications[1], "SELL 0.1235 ETH-USDT @ 3001.01");
    EXPECT_EQ(gw.orders_sent(), 0u);
}

TEST_F(PmmStrategyTest, StopCancelsOpenOrders) {
    feed.fill(40);
    strategy->on_tick(1'000);
    ASSERT_EQ(gw.list_open_orders("ETH-USDT").size(), 2u);

    strategy->stop();
    EXPECT_FALSE(feed.running);
    EXPECT_TRUE(gw.list_open_orders("ETH-USDT").empty());
}

TEST(PmmStrategyFundingTest, UnfundedBuyStillCancelsAndSells) {
    Logger::instance().set_level(LogLevel::Error);

    StrategyConfig config;
    FakeCandleFeed feed;
    feed.fill(40);
    FakeMarket market;
    SimExchange exchange("ETH-USDT");
    exchange.portfolio().set_balance("ETH", dec("1"));
    exchange.portfolio().set_balance("USDT", Decimal{});
    exchange.on_book_update(BookSnapshot{.timestamp = 1,
                                         .bids = {{dec("99.9"), dec("1")}},
                                         .asks = {{dec("100.1"), dec("1")}}});
    BalanceBudgetChecker budget(exchange.portfolio(), "ETH", "USDT");

    // Prior sell resting from an earlier cycle
    exchange.submit_sell("ETH-USDT", dec("0.01"), dec("101"));

    PmmStrategy strategy(config, feed, market, exchange.portfolio(), exchange, budget);
    EXPECT_EQ(strategy.on_tick(1'000), TickOutcome::Completed);

    EXPECT_EQ(exchange.cancels_sent(), 1u);
    auto open = exchange.list_open_orders("ETH-USDT");
    ASSERT_EQ(open.size(), 1u);
    EXPECT_EQ(open[0].side, OrderSide::Sell);

    Logger::instance().set_level(LogLevel::Info);
}
