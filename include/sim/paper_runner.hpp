#pragma once

#include "config/config_loader.hpp"
#include "market/market_view.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pmm {

struct PaperReport {
    size_t snapshots          = 0;
    size_t completed_cycles   = 0;
    size_t data_not_ready     = 0;
    size_t connector_not_ready = 0;
    size_t throttled          = 0;
    size_t execution_errors   = 0;

    uint64_t orders_submitted = 0;
    uint64_t orders_cancelled = 0;
    uint64_t fills            = 0;

    Decimal initial_base;
    Decimal initial_quote;
    Decimal final_base;
    Decimal final_quote;
    Decimal first_mid;
    Decimal last_mid;

    std::string status_line;
    std::vector<std::string> fill_messages;

    // Portfolio value in quote units, marked at the given mid
    Decimal initial_value() const { return initial_quote + initial_base * first_mid; }
    Decimal final_value() const { return final_quote + final_base * last_mid; }

    std::string summary() const;
};

/// Runs the strategy against a paper exchange fed with book snapshots, either
/// generated (seeded random walk) or read from the configured CSV file. Each
/// snapshot is applied to the exchange, then to the candle feed, then the
/// strategy ticks at the snapshot timestamp.
class PaperRunner {
public:
    explicit PaperRunner(AppConfig config);

    // Throws std::runtime_error when the data file cannot be read or holds no rows.
    PaperReport run();

    // Throws std::runtime_error when a generated price leaves the decimal range.
    PaperReport run_synthetic(size_t num_ticks);

private:
    // Format: timestamp_ms,bid,bid_qty,ask,ask_qty (header line skipped)
    std::vector<BookSnapshot> load_csv_data(const std::string& filename) const;

    std::vector<BookSnapshot> generate_synthetic_data(size_t num_ticks) const;

    PaperReport process_snapshots(const std::vector<BookSnapshot>& snapshots);

    AppConfig config_;
};

} // namespace pmm
