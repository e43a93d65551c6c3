#include "strategy/tick_scheduler.hpp"

namespace pmm {

namespace {

// Puts the scheduler back to Waiting however the cycle exits
class ActiveGuard {
public:
    explicit ActiveGuard(SchedulerState& state) : state_(state) { state_ = SchedulerState::Active; }
    ~ActiveGuard() { state_ = SchedulerState::Waiting; }

    ActiveGuard(const ActiveGuard&) = delete;
    ActiveGuard& operator=(const ActiveGuard&) = delete;

private:
    SchedulerState& state_;
};

} // namespace

const char* to_string(TickOutcome outcome) {
    switch (outcome) {
        case TickOutcome::Throttled:         return "throttled";
        case TickOutcome::ConnectorNotReady: return "connector_not_ready";
        case TickOutcome::DataNotReady:      return "data_not_ready";
        case TickOutcome::Completed:         return "completed";
        case TickOutcome::Busy:              return "busy";
    }
    return "unknown";
}

TickScheduler::TickScheduler(Timestamp refresh_interval_ms)
    : refresh_interval_ms_(refresh_interval_ms) {}

TickOutcome TickScheduler::on_tick(Timestamp now, bool trading_ready, const Cycle& cycle) {
    if (state_ == SchedulerState::Active) return TickOutcome::Busy;
    if (now < next_tick_) return TickOutcome::Throttled;
    if (!trading_ready) return TickOutcome::ConnectorNotReady;

    TickOutcome outcome;
    {
        ActiveGuard guard(state_);
        outcome = cycle();
    }

    if (outcome == TickOutcome::Completed) {
        next_tick_ = now + refresh_interval_ms_;
    }
    return outcome;
}

} // namespace pmm
