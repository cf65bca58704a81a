#pragma once

#include <loopsim/core/callback.hpp>
#include <loopsim/core/clock.hpp>
#include <loopsim/core/execution_trace.hpp>
#include <loopsim/core/handle.hpp>
#include <loopsim/core/queue_set.hpp>
#include <loopsim/core/trace_writer.hpp>
#include <loopsim/core/types.hpp>
#include <loopsim/core/worker_pool.hpp>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <unordered_map>

namespace loopsim::core {

/// @brief Run-loop state reported by Scheduler::state().
/// @ingroup core_engine
enum class SchedulerState {
    Idle,      ///< Not inside run(); submissions accumulate.
    Running,   ///< Inside run(), serving a macrotask or moving the clock.
    Draining,  ///< Inside run(), draining the Immediate/Microtask queues.
};

/// @brief Tunables applied through the constructor or Scheduler::configure().
/// @ingroup core_engine
struct SchedulerOptions {
    /// Number of parallel workers in the WorkerPool.
    std::size_t worker_pool_capacity{WorkerPool::DEFAULT_CAPACITY};
    /// Maximum callbacks one drain of the Immediate/Microtask queues may run.
    std::size_t livelock_guard{QueueSet::DEFAULT_LIVELOCK_GUARD};
};

/// @brief Cooperative, single-threaded driver of the simulated event loop.
///
/// The Scheduler exclusively owns a Clock, a QueueSet and a WorkerPool.
/// Client code submits callbacks and worker jobs, then calls run(). Each
/// scheduler step:
///
///   1. drains the Immediate queue, then the Microtask queue, repeating
///      until both are empty;
///   2. if every macrotask phase is empty, advances the clock to the
///      earliest pending timer or job completion (or stops when there is
///      none);
///   3. lets the WorkerPool complete due jobs, which posts their
///      callbacks onto the IOPhase queue;
///   4. moves due timers into the TimerPhase queue;
///   5. runs one callback from the macrotask phases, rotating
///      TimerPhase -> IOPhase -> CheckPhase. The rotation restarts at
///      TimerPhase whenever the clock moves and at the start of run().
///
/// Exactly one callback runs at a time and always runs to completion.
/// An exception thrown by a callback is caught, reported to the uncaught
/// handler, and does not stop the loop.
///
/// The Scheduler is non-copyable and non-movable. A typical usage pattern is:
///
/// @code
/// core::Scheduler sched({.worker_pool_capacity = 2});
/// sched.submit_microtask([] { ... });
/// sched.submit_worker_job(duration_from_ticks(5), [] { ... });
/// auto trace = sched.run();
/// @endcode
///
/// @see QueueSet, WorkerPool, TraceWriter
/// @ingroup core_engine
class Scheduler {
public:
    /// @brief Client code run by a callback.
    using Action = std::function<void()>;

    /// @brief Receives exceptions escaping a callback, with the callback id.
    using UncaughtHandler = std::function<void(std::exception_ptr, CallbackId)>;

    /// @throws OutOfRangeError if an option is 0.
    explicit Scheduler(SchedulerOptions options = {});
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;
    Scheduler(Scheduler&&) = delete;
    Scheduler& operator=(Scheduler&&) = delete;

    /// @brief Returns the current logical time.
    [[nodiscard]] TimePoint time() const noexcept { return clock_.now(); }

    [[nodiscard]] SchedulerState state() const noexcept { return state_; }

    [[nodiscard]] const SchedulerOptions& options() const noexcept { return options_; }

    /// @brief Replace the scheduler options.
    ///
    /// Growing the worker pool admits queued jobs immediately.
    ///
    /// @throws AlreadyRunningError if called while run() is in progress.
    /// @throws OutOfRangeError if an option is 0.
    /// @throws InvalidStateError if the capacity is below the number of running jobs.
    void configure(const SchedulerOptions& options);

    // -- Submission ---------------------------------------------------------

    /// @brief Queue @p action on the highest-priority Immediate queue.
    CallbackHandle submit_immediate(Action action);

    /// @brief Queue @p action on the Microtask queue.
    CallbackHandle submit_microtask(Action action);

    /// @brief Run @p action in the TimerPhase once @p delay ticks have passed.
    ///
    /// A delay of zero makes the timer due at the current tick; it still
    /// waits for the Immediate and Microtask queues to drain.
    ///
    /// @throws InvalidDurationError if @p delay is negative.
    CallbackHandle submit_timer(Action action, Duration delay);

    /// @brief Run @p action in the TimerPhase every @p period ticks.
    ///
    /// The first firing is due at time() + period. Every firing is a new
    /// callback with its own id; the returned handle names the series and
    /// cancelling it stops all future firings.
    ///
    /// @throws InvalidDurationError if @p period is not positive.
    CallbackHandle submit_interval(Action action, Duration period);

    /// @brief Queue @p action directly on the IOPhase queue.
    CallbackHandle submit_io(Action action);

    /// @brief Queue @p action on the CheckPhase queue.
    CallbackHandle submit_check(Action action);

    /// @brief Submit a worker job of @p duration ticks.
    ///
    /// When the job completes, @p on_complete is posted onto the IOPhase
    /// queue as a new callback.
    ///
    /// @throws InvalidDurationError if @p duration is not positive.
    JobHandle submit_worker_job(Duration duration, Action on_complete);

    // -- Cancellation -------------------------------------------------------

    /// @brief Remove a callback (or an interval series) before it runs.
    /// @throws NotFoundError if it already ran, was cancelled, or is unknown.
    void cancel(CallbackHandle handle);

    /// @brief Cancel a worker job.
    ///
    /// A queued job never runs. A running job keeps its worker until its
    /// completion tick, but its callback is never posted.
    ///
    /// @throws NotFoundError if the job completed, was cancelled, or is unknown.
    void cancel(JobHandle handle);

    // -- Running ------------------------------------------------------------

    /// @brief Run until no work is left.
    ///
    /// @return The callbacks executed by this call, in execution order.
    /// @throws LivelockError (carrying the partial trace) if the Immediate or
    ///         Microtask queue fails to drain within the livelock guard.
    /// @throws AlreadyRunningError if called from inside a callback.
    ExecutionTrace run();

    /// @brief Run, but never advance the clock past @p until.
    ///
    /// When the next timer or job completion lies beyond @p until, or when
    /// no work is left, the clock is moved to @p until (if it is earlier)
    /// and the call returns. Remaining work stays pending.
    ///
    /// @return The callbacks executed by this call, in execution order.
    ExecutionTrace run(TimePoint until);

    /// @brief Ask the current run() to return after the current step.
    ///
    /// The executing callback and the queue drain it belongs to complete
    /// first. Auto-resets at the start of each run() call.
    void request_stop() noexcept { stop_requested_ = true; }

    [[nodiscard]] bool stop_requested() const noexcept { return stop_requested_; }

    /// @brief Returns true while any callback, timer or job is outstanding.
    [[nodiscard]] bool pending() const noexcept;

    // -- Observation --------------------------------------------------------

    /// @brief Install the handler for exceptions escaping callbacks.
    ///
    /// Without a handler, such exceptions are only counted and traced.
    /// An exception thrown by the handler itself is counted in
    /// handler_failure_count() and traced; it never leaves run().
    void set_uncaught_handler(UncaughtHandler handler);

    /// @brief Set the trace writer for scheduler event logging.
    ///
    /// The Scheduler does not own the writer. Pass nullptr to disable tracing.
    void set_trace_writer(TraceWriter* writer) noexcept { trace_writer_ = writer; }

    /// @brief Invoke a tracing callback only if a trace writer is set.
    ///
    /// @tparam F Callable with signature void(TraceWriter&).
    template<typename F>
    void trace(F&& func);

    /// @brief Callbacks executed since construction.
    [[nodiscard]] uint64_t executed_count() const noexcept { return executed_count_; }

    /// @brief Callback exceptions caught since construction.
    [[nodiscard]] uint64_t uncaught_count() const noexcept { return uncaught_count_; }

    /// @brief Uncaught handler invocations that threw, since construction.
    [[nodiscard]] uint64_t handler_failure_count() const noexcept { return handler_failure_count_; }

    [[nodiscard]] const Clock& clock() const noexcept { return clock_; }
    [[nodiscard]] const QueueSet& queues() const noexcept { return queues_; }
    [[nodiscard]] const WorkerPool& worker_pool() const noexcept { return pool_; }

private:
    struct IntervalSeries {
        Action action;
        Duration period;
        CallbackId current{0};
    };

    CallbackHandle enqueue(QueueKind kind, Action action);
    void arm_interval(CallbackId series_id, IntervalSeries& series);
    ExecutionTrace run_loop(std::optional<TimePoint> until);
    bool step(std::optional<TimePoint> until);
    void drain_priority_queues();
    void run_one_macrotask();
    void execute(Callback& callback);
    void report_uncaught(std::exception_ptr error, CallbackId id);
    void advance_clock(TimePoint to);
    void on_job_event(Job& job, JobEvent event);

    SchedulerOptions options_;
    Clock clock_;
    QueueSet queues_;
    WorkerPool pool_;

    SchedulerState state_{SchedulerState::Idle};
    bool stop_requested_{false};
    CallbackId next_callback_id_{1};
    std::size_t next_phase_{0};

    std::unordered_map<CallbackId, IntervalSeries> intervals_;
    ExecutionTrace run_trace_;
    uint64_t executed_count_{0};
    uint64_t uncaught_count_{0};
    uint64_t handler_failure_count_{0};

    UncaughtHandler uncaught_handler_;
    TraceWriter* trace_writer_{nullptr};
};

// Template implementation
template<typename F>
void Scheduler::trace(F&& func) {
    if (trace_writer_) {
        trace_writer_->begin(clock_.now());
        func(*trace_writer_);
        trace_writer_->end();
    }
}

} // namespace loopsim::core
