#pragma once

#include <loopsim/core/execution_trace.hpp>
#include <loopsim/core/queue_kind.hpp>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace loopsim::core {

/// @brief Base exception for all simulation errors.
///
/// All exceptions thrown by the core library derive from this class,
/// allowing callers to catch simulation-specific errors separately
/// from other `std::runtime_error` exceptions.
///
/// @ingroup core
class SimulationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Thrown when a job duration or interval period is not a positive
/// tick count, or a timer delay is negative.
///
/// @see Scheduler::submit_worker_job, Scheduler::submit_timer, WorkerPool::submit
/// @ingroup core
class InvalidDurationError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Thrown when the clock is asked to move backwards.
///
/// @see Clock::advance_to
/// @ingroup core
class InvalidTimeError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Thrown for an unknown queue name or an out-of-range QueueKind.
///
/// @see queue_kind_from_string, QueueSet::enqueue
/// @ingroup core
class InvalidQueueError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Thrown when cancelling a handle that is unknown, already executed,
/// already completed, or previously cancelled.
///
/// @see Scheduler::cancel, WorkerPool::cancel
/// @ingroup core
class NotFoundError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Thrown when an operation is invalid for the current object state.
///
/// For example, shrinking the worker pool below the number of jobs that
/// are currently running.
///
/// @ingroup core
class InvalidStateError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Thrown when a configuration value is outside its valid range.
///
/// @see SchedulerOptions
/// @ingroup core
class OutOfRangeError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Thrown by configure() or run() while a run is in progress.
///
/// @see Scheduler::configure, Scheduler::run
/// @ingroup core
class AlreadyRunningError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Thrown when work remains queued but nothing can make progress.
///
/// Cannot occur through the public API; it guards the scheduler's own
/// termination invariant.
///
/// @ingroup core
class DeadlockError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Thrown when the Immediate or Microtask queue fails to drain
/// within the configured guard.
///
/// Indicates a client bug (unbounded self-resubmission). When raised by
/// Scheduler::run() the exception also carries the execution trace
/// recorded before the run was aborted.
///
/// @see QueueSet::drain_all, SchedulerOptions::livelock_guard
/// @ingroup core
class LivelockError : public SimulationError {
public:
    /// @param queue The queue that did not drain.
    /// @param limit The guard that was exceeded.
    /// @param partial_trace Callbacks executed before the abort.
    LivelockError(QueueKind queue, std::size_t limit, ExecutionTrace partial_trace = {})
        : SimulationError("Queue '" + std::string(to_string(queue)) +
                          "' did not drain within " + std::to_string(limit) +
                          " iterations")
        , queue_(queue)
        , limit_(limit)
        , partial_trace_(std::move(partial_trace)) {}

    /// @brief The queue that did not drain.
    [[nodiscard]] QueueKind queue() const noexcept { return queue_; }

    /// @brief The guard value that was exceeded.
    [[nodiscard]] std::size_t limit() const noexcept { return limit_; }

    /// @brief Callbacks executed by the aborted run, in execution order.
    [[nodiscard]] const ExecutionTrace& partial_trace() const noexcept { return partial_trace_; }

private:
    QueueKind queue_;
    std::size_t limit_;
    ExecutionTrace partial_trace_;
};

} // namespace loopsim::core
