#pragma once

#include "common/types.hpp"

#include <functional>

namespace pmm {

enum class SchedulerState { Waiting, Active };

enum class TickOutcome {
    Throttled,          // before next_tick
    ConnectorNotReady,  // market view not ready, retried next invocation
    DataNotReady,       // cycle ran but indicators were not ready
    Completed,          // cycle quoted and reconciled
    Busy,               // re-entrant call while a cycle is running
};

const char* to_string(TickOutcome outcome);

/// Gates the quote cycle on a fixed refresh interval. Only a Completed cycle
/// moves next_tick forward; a DataNotReady cycle or a cycle that throws is
/// retried on the next invocation.
class TickScheduler {
public:
    using Cycle = std::function<TickOutcome()>;

    explicit TickScheduler(Timestamp refresh_interval_ms);

    // `cycle` must return Completed or DataNotReady.
    TickOutcome on_tick(Timestamp now, bool trading_ready, const Cycle& cycle);

    Timestamp      next_tick() const { return next_tick_; }
    SchedulerState state() const { return state_; }
    Timestamp      refresh_interval_ms() const { return refresh_interval_ms_; }

private:
    Timestamp      refresh_interval_ms_;
    Timestamp      next_tick_ = 0;
    SchedulerState state_ = SchedulerState::Waiting;
};

} // namespace pmm
