#include <loopsim/core/scheduler.hpp>
#include <loopsim/core/error.hpp>

#include <algorithm>
#include <limits>
#include <string>
#include <utility>

namespace loopsim::core {

namespace {

// Puts the scheduler back to Idle however run() exits.
class RunStateGuard {
public:
    explicit RunStateGuard(SchedulerState& state) : state_(state) {
        state_ = SchedulerState::Running;
    }
    ~RunStateGuard() { state_ = SchedulerState::Idle; }

    RunStateGuard(const RunStateGuard&) = delete;
    RunStateGuard& operator=(const RunStateGuard&) = delete;

private:
    SchedulerState& state_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
};

std::optional<TimePoint> earliest(std::optional<TimePoint> a, std::optional<TimePoint> b) {
    if (!a) {
        return b;
    }
    if (!b) {
        return a;
    }
    return std::min(*a, *b);
}

uint64_t ticks(TimePoint t) {
    return static_cast<uint64_t>(time_to_ticks(t));
}

std::string describe(std::exception_ptr error) {
    try {
        std::rethrow_exception(std::move(error));
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

// True when now + offset is representable.
bool fits_on_clock(TimePoint now, Duration offset) {
    return offset.ticks() <= std::numeric_limits<int64_t>::max() - time_to_ticks(now);
}

void validate(const SchedulerOptions& options) {
    if (options.worker_pool_capacity == 0) {
        throw OutOfRangeError("worker_pool_capacity must be at least 1");
    }
    if (options.livelock_guard == 0) {
        throw OutOfRangeError("livelock_guard must be at least 1");
    }
}

} // anonymous namespace

Scheduler::Scheduler(SchedulerOptions options)
    : options_(options)
    , queues_(options.livelock_guard)
    , pool_(clock_, options.worker_pool_capacity) {
    pool_.set_listener([this](Job& job, JobEvent event) { on_job_event(job, event); });
}

Scheduler::~Scheduler() = default;

void Scheduler::configure(const SchedulerOptions& options) {
    if (state_ != SchedulerState::Idle) {
        throw AlreadyRunningError("configure() called while the scheduler is running");
    }
    validate(options);
    pool_.set_capacity(options.worker_pool_capacity);
    queues_.set_livelock_guard(options.livelock_guard);
    options_ = options;
}

// ============================================================================
// Submission
// ============================================================================

CallbackHandle Scheduler::enqueue(QueueKind kind, Action action) {
    Callback callback;
    callback.id = next_callback_id_++;
    callback.action = std::move(action);
    CallbackId id = callback.id;

    queues_.enqueue(kind, std::move(callback));

    trace([&](TraceWriter& w) {
        w.type("callback_submitted");
        w.field("callback_id", id);
        w.field("queue", to_string(kind));
    });
    return CallbackHandle(id);
}

CallbackHandle Scheduler::submit_immediate(Action action) {
    return enqueue(QueueKind::Immediate, std::move(action));
}

CallbackHandle Scheduler::submit_microtask(Action action) {
    return enqueue(QueueKind::Microtask, std::move(action));
}

CallbackHandle Scheduler::submit_io(Action action) {
    return enqueue(QueueKind::IOPhase, std::move(action));
}

CallbackHandle Scheduler::submit_check(Action action) {
    return enqueue(QueueKind::CheckPhase, std::move(action));
}

CallbackHandle Scheduler::submit_timer(Action action, Duration delay) {
    if (delay < Duration::zero()) {
        throw InvalidDurationError("Timer delay must not be negative, got " +
                                   std::to_string(delay.ticks()));
    }
    if (!fits_on_clock(clock_.now(), delay)) {
        throw InvalidDurationError("Timer delay of " + std::to_string(delay.ticks()) +
                                   " ticks overflows the clock");
    }

    Callback callback;
    callback.id = next_callback_id_++;
    callback.action = std::move(action);
    callback.fire_time = clock_.now() + delay;
    CallbackId id = callback.id;
    TimePoint fire_time = callback.fire_time;

    queues_.add_timer(std::move(callback));

    trace([&](TraceWriter& w) {
        w.type("callback_submitted");
        w.field("callback_id", id);
        w.field("queue", to_string(QueueKind::TimerPhase));
        w.field("fire_time", ticks(fire_time));
    });
    return CallbackHandle(id);
}

CallbackHandle Scheduler::submit_interval(Action action, Duration period) {
    if (period <= Duration::zero()) {
        throw InvalidDurationError("Interval period must be a positive tick count, got " +
                                   std::to_string(period.ticks()));
    }
    if (!fits_on_clock(clock_.now(), period)) {
        throw InvalidDurationError("Interval period of " + std::to_string(period.ticks()) +
                                   " ticks overflows the clock");
    }

    // The series takes the id of its first firing.
    CallbackId series_id = next_callback_id_;
    auto it = intervals_.emplace(series_id, IntervalSeries{std::move(action), period}).first;
    arm_interval(series_id, it->second);
    return CallbackHandle(series_id);
}

void Scheduler::arm_interval(CallbackId series_id, IntervalSeries& series) {
    Callback callback;
    callback.id = next_callback_id_++;
    callback.action = series.action;
    callback.fire_time = clock_.now() + series.period;
    callback.series = series_id;
    series.current = callback.id;
    CallbackId id = callback.id;
    TimePoint fire_time = callback.fire_time;

    queues_.add_timer(std::move(callback));

    trace([&](TraceWriter& w) {
        w.type("callback_submitted");
        w.field("callback_id", id);
        w.field("queue", to_string(QueueKind::TimerPhase));
        w.field("fire_time", ticks(fire_time));
        w.field("series", series_id);
    });
}

JobHandle Scheduler::submit_worker_job(Duration duration, Action on_complete) {
    return pool_.submit(duration, std::move(on_complete));
}

// ============================================================================
// Cancellation
// ============================================================================

void Scheduler::cancel(CallbackHandle handle) {
    if (!handle.valid()) {
        throw NotFoundError("Cannot cancel an invalid callback handle");
    }

    CallbackId id = handle.id();
    QueueKind kind = QueueKind::TimerPhase;
    if (auto series = intervals_.find(id); series != intervals_.end()) {
        // The current firing may be executing right now, in which case it
        // is no longer queued and simply will not be re-armed.
        if (queues_.contains(series->second.current)) {
            queues_.cancel(series->second.current);
        }
        intervals_.erase(series);
    } else {
        kind = queues_.cancel(id);
    }

    trace([&](TraceWriter& w) {
        w.type("callback_cancelled");
        w.field("callback_id", id);
        w.field("queue", to_string(kind));
    });
}

void Scheduler::cancel(JobHandle handle) {
    if (!handle.valid()) {
        throw NotFoundError("Cannot cancel an invalid job handle");
    }

    JobState previous = pool_.cancel(handle);

    trace([&](TraceWriter& w) {
        w.type("job_cancelled");
        w.field("job_id", handle.id());
        w.field("state", previous == JobState::Queued ? "queued" : "running");
    });
}

// ============================================================================
// Run loop
// ============================================================================

ExecutionTrace Scheduler::run() {
    return run_loop(std::nullopt);
}

ExecutionTrace Scheduler::run(TimePoint until) {
    return run_loop(until);
}

ExecutionTrace Scheduler::run_loop(std::optional<TimePoint> until) {
    if (state_ != SchedulerState::Idle) {
        throw AlreadyRunningError("run() called while the scheduler is running");
    }

    RunStateGuard guard(state_);
    stop_requested_ = false;
    next_phase_ = 0;
    run_trace_.clear();

    try {
        while (step(until)) {
        }
    } catch (const LivelockError& e) {
        trace([&](TraceWriter& w) {
            w.type("livelock");
            w.field("queue", to_string(e.queue()));
            w.field("limit", static_cast<uint64_t>(e.limit()));
        });
        throw LivelockError(e.queue(), e.limit(), std::exchange(run_trace_, {}));
    }

    trace([&](TraceWriter& w) {
        w.type("sim_finished");
        w.field("executed", static_cast<uint64_t>(run_trace_.size()));
    });
    return std::exchange(run_trace_, {});
}

bool Scheduler::step(std::optional<TimePoint> until) {
    if (stop_requested_) {
        return false;
    }

    drain_priority_queues();
    if (stop_requested_) {
        return false;
    }

    if (queues_.macrotasks_empty()) {
        auto next = earliest(queues_.next_timer_time(), pool_.next_completion_time());
        if (!next) {
            if (!pool_.idle()) {
                throw DeadlockError("Worker jobs are queued but no worker is running");
            }
            if (until && clock_.now() < *until) {
                advance_clock(*until);
            }
            return false;
        }
        if (until && *next > *until) {
            if (clock_.now() < *until) {
                advance_clock(*until);
            }
            return false;
        }
        advance_clock(*next);
    }

    pool_.tick(clock_.now());
    queues_.promote_due_timers(clock_.now());
    run_one_macrotask();
    return true;
}

void Scheduler::drain_priority_queues() {
    state_ = SchedulerState::Draining;

    const QueueSet::Executor executor = [this](Callback& callback) { execute(callback); };
    std::size_t executed = 0;

    // A microtask may queue immediates (and vice versa); both must be
    // empty before any macrotask runs.
    while (queues_.size(QueueKind::Immediate) != 0 || queues_.size(QueueKind::Microtask) != 0) {
        executed += queues_.drain_all(QueueKind::Immediate, executor);
        executed += queues_.drain_all(QueueKind::Microtask, executor);
        if (executed >= queues_.livelock_guard() && queues_.size(QueueKind::Immediate) != 0) {
            throw LivelockError(QueueKind::Immediate, queues_.livelock_guard());
        }
    }

    state_ = SchedulerState::Running;
}

void Scheduler::run_one_macrotask() {
    for (std::size_t i = 0; i < MACROTASK_PHASES.size(); ++i) {
        std::size_t index = (next_phase_ + i) % MACROTASK_PHASES.size();
        auto callback = queues_.pop_one(MACROTASK_PHASES[index]);
        if (!callback) {
            continue;
        }
        next_phase_ = (index + 1) % MACROTASK_PHASES.size();

        CallbackId series_id = callback->series;
        execute(*callback);

        if (series_id != 0) {
            if (auto series = intervals_.find(series_id); series != intervals_.end()) {
                if (fits_on_clock(clock_.now(), series->second.period)) {
                    arm_interval(series_id, series->second);
                } else {
                    intervals_.erase(series);
                }
            }
        }
        return;
    }
}

void Scheduler::execute(Callback& callback) {
    run_trace_.push_back(TraceEntry{clock_.now(), callback.queue, callback.id, callback.job_id});
    ++executed_count_;

    trace([&](TraceWriter& w) {
        w.type("callback_executed");
        w.field("callback_id", callback.id);
        w.field("queue", to_string(callback.queue));
        if (callback.job_id != 0) {
            w.field("job_id", callback.job_id);
        }
    });

    if (!callback.action) {
        return;
    }
    try {
        callback.action();
    } catch (...) {
        report_uncaught(std::current_exception(), callback.id);
    }
}

void Scheduler::report_uncaught(std::exception_ptr error, CallbackId id) {
    ++uncaught_count_;

    trace([&](TraceWriter& w) {
        w.type("uncaught_exception");
        w.field("callback_id", id);
        w.field("message", describe(error));
    });

    if (!uncaught_handler_) {
        return;
    }
    // Handler failures are counted and traced, never propagated.
    try {
        uncaught_handler_(std::move(error), id);
    } catch (...) {
        ++handler_failure_count_;
        std::string message = describe(std::current_exception());
        trace([&](TraceWriter& w) {
            w.type("uncaught_handler_failed");
            w.field("callback_id", id);
            w.field("message", message);
        });
    }
}

void Scheduler::advance_clock(TimePoint to) {
    TimePoint from = clock_.now();
    clock_.advance_to(to);
    if (to != from) {
        // Every new tick serves TimerPhase first.
        next_phase_ = 0;
        trace([&](TraceWriter& w) {
            w.type("clock_advanced");
            w.field("from", ticks(from));
            w.field("to", ticks(to));
        });
    }
}

void Scheduler::on_job_event(Job& job, JobEvent event) {
    switch (event) {
        case JobEvent::Submitted:
            trace([&](TraceWriter& w) {
                w.type("job_submitted");
                w.field("job_id", job.id);
                w.field("duration", static_cast<uint64_t>(job.duration.ticks()));
            });
            break;
        case JobEvent::Started:
            trace([&](TraceWriter& w) {
                w.type("job_started");
                w.field("job_id", job.id);
                w.field("completion_time", ticks(job.completion_time));
            });
            break;
        case JobEvent::Completed: {
            trace([&](TraceWriter& w) {
                w.type("job_completed");
                w.field("job_id", job.id);
            });
            Callback callback;
            callback.id = next_callback_id_++;
            callback.action = std::move(job.payload);
            callback.job_id = job.id;
            CallbackId id = callback.id;
            queues_.enqueue(QueueKind::IOPhase, std::move(callback));
            trace([&](TraceWriter& w) {
                w.type("callback_submitted");
                w.field("callback_id", id);
                w.field("queue", to_string(QueueKind::IOPhase));
                w.field("job_id", job.id);
            });
            break;
        }
        case JobEvent::Released:
            trace([&](TraceWriter& w) {
                w.type("worker_released");
                w.field("job_id", job.id);
            });
            break;
    }
}

// ============================================================================
// Observation
// ============================================================================

bool Scheduler::pending() const noexcept {
    return !queues_.empty() || !pool_.idle() || !intervals_.empty();
}

void Scheduler::set_uncaught_handler(UncaughtHandler handler) {
    uncaught_handler_ = std::move(handler);
}

} // namespace loopsim::core
