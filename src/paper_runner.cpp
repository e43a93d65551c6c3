#include "sim/paper_runner.hpp"

#include "common/logger.hpp"
#include "execution/sim_exchange.hpp"
#include "market/candle_feed.hpp"
#include "risk/budget_checker.hpp"
#include "strategy/pmm_strategy.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <optional>
#include <random>
#include <sstream>
#include <stdexcept>

namespace pmm {

namespace {

constexpr Timestamp kSyntheticEpochMs = 1'700'000'000'000;

Decimal to_price(double value, int decimals) {
    auto d = Decimal::from_double(value);
    if (!d) {
        throw std::runtime_error("synthetic price " + std::to_string(value) +
                                 " is outside the decimal range");
    }
    return d->rounded(decimals);
}

} // anonymous namespace

std::string PaperReport::summary() const {
    std::ostringstream ss;

    ss << "# Paper Trading Report\n\n";
    ss << "| Metric | Value |\n";
    ss << "|--------|-------|\n";
    ss << "| Snapshots | " << snapshots << " |\n";
    ss << "| Completed Cycles | " << completed_cycles << " |\n";
    ss << "| Data Not Ready | " << data_not_ready << " |\n";
    ss << "| Connector Not Ready | " << connector_not_ready << " |\n";
    ss << "| Throttled | " << throttled << " |\n";
    ss << "| Execution Errors | " << execution_errors << " |\n";
    ss << "| Orders Submitted | " << orders_submitted << " |\n";
    ss << "| Orders Cancelled | " << orders_cancelled << " |\n";
    ss << "| Fills | " << fills << " |\n";
    ss << "| Base Balance | " << initial_base << " -> " << final_base << " |\n";
    ss << "| Quote Balance | " << initial_quote.to_string(2) << " -> " << final_quote.to_string(2) << " |\n";
    ss << "| Mid Price | " << first_mid.to_string(2) << " -> " << last_mid.to_string(2) << " |\n";
    ss << "| Portfolio Value | " << initial_value().to_string(2) << " -> "
       << final_value().to_string(2) << " |\n";
    ss << "\n" << status_line << "\n";

    return ss.str();
}

PaperRunner::PaperRunner(AppConfig config)
    : config_(std::move(config)) {}

PaperReport PaperRunner::run() {
    const auto& file = config_.paper.data_file;
    if (file.empty()) {
        throw std::runtime_error("no paper.data_file configured");
    }

    auto snapshots = load_csv_data(file);
    if (snapshots.empty()) {
        throw std::runtime_error("no book data loaded from " + file);
    }

    return process_snapshots(snapshots);
}

PaperReport PaperRunner::run_synthetic(size_t num_ticks) {
    return process_snapshots(generate_synthetic_data(num_ticks));
}

PaperReport PaperRunner::process_snapshots(const std::vector<BookSnapshot>& snapshots) {
    const auto& cfg = config_.strategy;
    const auto& paper = config_.paper;

    PaperReport report;
    report.initial_base = paper.initial_base;
    report.initial_quote = paper.initial_quote;

    // Set up components
    SimExchange exchange(cfg.trading_pair);
    exchange.portfolio().set_balance(exchange.base_asset(), paper.initial_base);
    exchange.portfolio().set_balance(exchange.quote_asset(), paper.initial_quote);

    TickCandleFeed feed(cfg.candle_interval_ms(), cfg.candles.max_records);
    BalanceBudgetChecker budget(exchange.portfolio(), exchange.base_asset(), exchange.quote_asset());

    PmmStrategy strategy(cfg, feed, exchange, exchange.portfolio(), exchange, budget,
                         [&report](const std::string& msg) { report.fill_messages.push_back(msg); });
    exchange.set_fill_callback([&strategy](const FillEvent& fill) { strategy.on_order_filled(fill); });

    strategy.start();

    for (const auto& snapshot : snapshots) {
        exchange.on_book_update(snapshot);
        if (!snapshot.has_both_sides()) continue;

        Decimal mid = snapshot.mid_price();
        if (report.snapshots == 0) report.first_mid = mid;
        report.last_mid = mid;
        ++report.snapshots;

        double volume = snapshot.bids.front().quantity.to_double() +
                        snapshot.asks.front().quantity.to_double();
        feed.on_price(snapshot.timestamp, mid.to_double(), volume);

        TickOutcome outcome = TickOutcome::Busy;
        try {
            outcome = strategy.on_tick(snapshot.timestamp);
        } catch (const ExecutionError& e) {
            PMM_LOG_ERROR(std::string("quote cycle failed: ") + e.what());
            ++report.execution_errors;
            continue;
        }

        switch (outcome) {
            case TickOutcome::Completed:         ++report.completed_cycles; break;
            case TickOutcome::DataNotReady:      ++report.data_not_ready; break;
            case TickOutcome::ConnectorNotReady: ++report.connector_not_ready; break;
            case TickOutcome::Throttled:         ++report.throttled; break;
            case TickOutcome::Busy:              break;
        }
    }

    report.status_line = strategy.format_status();
    strategy.stop();

    report.orders_submitted = exchange.orders_sent();
    report.orders_cancelled = exchange.cancels_sent();
    report.fills = exchange.fills();
    report.final_base = exchange.portfolio().get_balance(exchange.base_asset());
    report.final_quote = exchange.portfolio().get_balance(exchange.quote_asset());

    PMM_LOG_INFO("paper run finished: " + std::to_string(report.snapshots) + " snapshots, " +
                 std::to_string(report.completed_cycles) + " cycles, " +
                 std::to_string(report.fills) + " fills");
    return report;
}

std::vector<BookSnapshot> PaperRunner::load_csv_data(const std::string& filename) const {
    std::vector<BookSnapshot> result;
    std::ifstream f(filename);
    if (!f.is_open()) {
        throw std::runtime_error("cannot open data file " + filename);
    }

    std::string line;
    std::getline(f, line); // skip header

    size_t line_no = 1;
    while (std::getline(f, line)) {
        ++line_no;
        if (line.empty() || line == "\r") continue;
        if (line.back() == '\r') line.pop_back();

        std::istringstream iss(line);
        std::string token;
        std::vector<std::string> tokens;
        while (std::getline(iss, token, ',')) {
            tokens.push_back(token);
        }

        std::optional<Decimal> bid, bid_qty, ask, ask_qty;
        Timestamp ts = 0;
        bool ok = tokens.size() >= 5;
        if (ok) {
            try {
                ts = std::stoull(tokens[0]);
            } catch (const std::exception&) {
                ok = false;
            }
            bid = Decimal::parse(tokens[1]);
            bid_qty = Decimal::parse(tokens[2]);
            ask = Decimal::parse(tokens[3]);
            ask_qty = Decimal::parse(tokens[4]);
            ok = ok && bid && bid_qty && ask && ask_qty;
        }
        if (!ok) {
            PMM_LOG_WARN("skipping malformed row " + std::to_string(line_no) + " in " + filename);
            continue;
        }

        BookSnapshot snap;
        snap.timestamp = ts;
        snap.bids.push_back(BookLevel{*bid, *bid_qty});
        snap.asks.push_back(BookLevel{*ask, *ask_qty});
        result.push_back(std::move(snap));
    }

    return result;
}

std::vector<BookSnapshot> PaperRunner::generate_synthetic_data(size_t num_ticks) const {
    const auto& paper = config_.paper;

    std::vector<BookSnapshot> result;
    result.reserve(num_ticks);

    std::mt19937_64 rng(paper.seed);
    std::normal_distribution<double> price_move(0.0, paper.volatility);
    std::uniform_real_distribution<double> spread_jitter(0.8, 1.2);

    const double tick_size = std::pow(10.0, -paper.price_decimals);
    double price = paper.start_price;

    for (size_t tick = 0; tick < num_ticks; ++tick) {
        // Random walk
        price *= (1.0 + price_move(rng));
        price = std::max(price, tick_size * 100.0);

        double half_spread = std::max(price * paper.book_spread_bps * 1e-4 * spread_jitter(rng) / 2.0,
                                      tick_size);

        BookSnapshot snap;
        snap.timestamp = kSyntheticEpochMs + tick * paper.tick_interval_ms;

        for (size_t lvl = 0; lvl < paper.book_depth; ++lvl) {
            double offset = half_spread * (1.0 + static_cast<double>(lvl) * 0.5);
            Decimal qty = to_price(1.0 + static_cast<double>(lvl) * 0.5, 4);
            snap.bids.push_back(BookLevel{to_price(price - offset, paper.price_decimals), qty});
            snap.asks.push_back(BookLevel{to_price(price + offset, paper.price_decimals), qty});
        }

        // Rounding must not lock the book
        if (snap.asks.front().price <= snap.bids.front().price) {
            Decimal step = to_price(tick_size, paper.price_decimals);
            for (auto& level : snap.asks) level.price += step;
        }

        result.push_back(std::move(snap));
    }

    return result;
}

} // namespace pmm
